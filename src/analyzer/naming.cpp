#include "analyzer/naming.hpp"
#include <fmt/format.h>
#include <boost/algorithm/string.hpp>
#include <regex>
#include <set>

namespace grader {
using namespace std;
using namespace nlohmann;

const char *get_identifier_kind_name(identifier_kind kind) {
    switch (kind) {
        case identifier_kind::FUNCTION: return "function";
        case identifier_kind::VARIABLE: return "variable";
        case identifier_kind::PARAMETER: return "parameter";
        case identifier_kind::CLASS: return "class";
        case identifier_kind::CONSTANT: return "constant";
        default: return "unknown";
    }
}

dimension naming_analyzer::type() const {
    return dimension::NAMING;
}

namespace {

struct identifier_collector {
    vector<identifier> identifiers;
    set<string> seen;
    const code_structure &structure;

    explicit identifier_collector(const code_structure &structure) : structure(structure) {}

    void add(string name, identifier_kind kind, size_t index) {
        boost::algorithm::trim(name);
        if (name.empty() || name == "_" || is_keyword(name, structure.lang)) return;
        if (!seen.insert(name).second) return;
        identifiers.push_back({name, kind, index + 1});
    }

    void add_all(const regex &pattern, identifier_kind kind, bool split_commas = false) {
        for (size_t i = 0; i < structure.lines.size(); ++i) {
            const string &code = structure.lines[i].code;
            for (sregex_iterator it(code.begin(), code.end(), pattern), end; it != end; ++it) {
                string names = (*it)[1];
                if (!split_commas) {
                    add(names, kind, i);
                    continue;
                }
                vector<string> parts;
                boost::algorithm::split(parts, names, boost::is_any_of(","));
                for (auto &part : parts) {
                    // 解构赋值中的重命名 { a: b } 与默认值 [a = 1]
                    string name = part.substr(0, part.find('='));
                    if (name.find(':') != string::npos) name = name.substr(name.find(':') + 1);
                    boost::algorithm::trim_left_if(name, boost::is_any_of(". \t("));
                    boost::algorithm::trim_right_if(name, boost::is_any_of(" \t)"));
                    add(name, kind, i);
                }
            }
        }
    }
};

}  // namespace

vector<identifier> collect_identifiers(const code_structure &structure) {
    identifier_collector collector(structure);
    set<string> class_names;
    for (auto &[name, line] : structure.classes) {
        collector.add(name, identifier_kind::CLASS, line);
        class_names.insert(name);
    }
    for (auto &function : structure.functions) {
        // 构造函数与析构函数的名称由类名决定
        if (class_names.count(function.name) || boost::algorithm::starts_with(function.name, "~")) continue;
        collector.add(function.name, identifier_kind::FUNCTION, function.line);
    }
    for (auto &function : structure.functions)
        for (auto &param : function.parameters)
            collector.add(param, identifier_kind::PARAMETER, function.line);

    switch (structure.lang) {
        case language::PYTHON: {
            static const regex assignment_regex(R"(^\s*([A-Za-z_]\w*(?:\s*,\s*[A-Za-z_]\w*)*)\s*(?:[-+*/%&|^]|//)?=(?!=))");
            static const regex for_regex(R"(\bfor\s+\(?([A-Za-z_][\w\s,]*?)\)?\s+in\b)");
            static const regex as_regex(R"(\bas\s+([A-Za-z_]\w*))");
            collector.add_all(assignment_regex, identifier_kind::VARIABLE, true);
            collector.add_all(for_regex, identifier_kind::VARIABLE, true);
            collector.add_all(as_regex, identifier_kind::VARIABLE);
            break;
        }
        case language::JAVASCRIPT: {
            static const regex const_regex(R"(\bconst\s+([A-Za-z_$][\w$]*))");
            static const regex variable_regex(R"(\b(?:let|var)\s+([A-Za-z_$][\w$]*))");
            static const regex destructuring_regex(R"(\b(?:const|let|var)\s*[\[{]([^\]}]*)[\]}])");
            collector.add_all(const_regex, identifier_kind::CONSTANT);
            collector.add_all(variable_regex, identifier_kind::VARIABLE);
            collector.add_all(destructuring_regex, identifier_kind::VARIABLE, true);
            break;
        }
        case language::JAVA: {
            static const regex declaration_regex(
                R"(\b(?:int|long|short|byte|double|float|boolean|char|String|var|[A-Z]\w*(?:<[^;=()]*>)?)(?:\s*\[\s*\])*\s+([A-Za-z_]\w*)\s*(?=[=;:,)]))");
            collector.add_all(declaration_regex, identifier_kind::VARIABLE);
            break;
        }
        case language::CPP: {
            static const regex declaration_regex(
                R"(\b(?:int|long|short|unsigned|double|float|bool|char|auto|size_t|string|std::string|[\w:]+<[^;=()]*>)(?:\s*[&*]+\s*|\s+)([A-Za-z_]\w*)\s*(?=[=;:,)\[{(]))");
            collector.add_all(declaration_regex, identifier_kind::VARIABLE);
            break;
        }
    }
    return collector.identifiers;
}

static const regex snake_case(R"(^[a-z][a-z0-9_]*$)");
static const regex camel_case(R"(^[a-z][a-zA-Z0-9]*$)");
static const regex pascal_case(R"(^[A-Z][a-zA-Z0-9]*$)");
static const regex upper_case(R"(^[A-Z][A-Z0-9_]*$)");

static const set<string> short_names = {"i", "j", "k", "n", "m", "x", "y", "z"};

bool follows_convention(const identifier &id, language lang, string &expected) {
    // 私有成员常用的前后缀下划线与 $ 不影响命名风格
    string name = boost::algorithm::trim_copy_if(id.name, boost::is_any_of("_$"));
    if (name.empty()) return true;
    if (name.size() == 1 && id.kind != identifier_kind::CLASS) {
        expected = "a descriptive name";
        return short_names.count(name) > 0;
    }

    auto matches = [&](initializer_list<pair<const regex *, const char *>> styles) {
        string names;
        for (auto &[style, style_name] : styles) {
            if (regex_match(name, *style)) return true;
            if (!names.empty()) names += " or ";
            names += style_name;
        }
        expected = names;
        return false;
    };

    if (id.kind == identifier_kind::CLASS) {
        if (lang == language::CPP) return matches({{&pascal_case, "PascalCase"}, {&snake_case, "snake_case"}});
        return matches({{&pascal_case, "PascalCase"}});
    }

    switch (lang) {
        case language::PYTHON:
            if (id.kind == identifier_kind::VARIABLE)
                return matches({{&snake_case, "snake_case"}, {&upper_case, "UPPER_CASE"}});
            return matches({{&snake_case, "snake_case"}});
        case language::JAVASCRIPT:
        case language::JAVA:
            if (id.kind == identifier_kind::FUNCTION || id.kind == identifier_kind::PARAMETER)
                return matches({{&camel_case, "camelCase"}});
            return matches({{&camel_case, "camelCase"}, {&upper_case, "UPPER_CASE"}});
        case language::CPP:
            if (id.kind == identifier_kind::FUNCTION || id.kind == identifier_kind::PARAMETER)
                return matches({{&snake_case, "snake_case"}, {&camel_case, "camelCase"}});
            return matches({{&snake_case, "snake_case"}, {&camel_case, "camelCase"}, {&upper_case, "UPPER_CASE"}});
    }
    return true;
}

analyzer_result naming_analyzer::analyze(const analysis_context &context) const {
    analyzer_result result;
    result.type = dimension::NAMING;

    language lang = context.harness.type();
    code_structure structure = analyze_structure(context.answer.code, lang);
    auto identifiers = collect_identifiers(structure);

    size_t conforming = 0;
    json violations = json::array();
    for (auto &id : identifiers) {
        string expected;
        if (follows_convention(id, lang, expected)) {
            ++conforming;
        } else {
            violations.push_back({{"name", id.name},
                                  {"kind", get_identifier_kind_name(id.kind)},
                                  {"line_number", id.line_number},
                                  {"expected", expected}});
        }
    }

    result.score = identifiers.empty() ? 1.0 : (double)conforming / identifiers.size();
    result.details = {{"total", identifiers.size()}, {"conforming", conforming}, {"violations", violations}};
    if (!violations.empty())
        result.reason = fmt::format("{} of {} identifiers do not follow naming conventions", violations.size(),
                                    identifiers.size());
    return result;
}

}  // namespace grader
