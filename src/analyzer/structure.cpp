#include "analyzer/structure.hpp"
#include <boost/algorithm/string.hpp>
#include <algorithm>
#include <regex>
#include <set>
#include "language/signature.hpp"

namespace grader {
using namespace std;

static const set<string> common_keywords = {
    "if", "else", "for", "while", "do", "switch", "case", "default", "return", "break", "continue",
    "try", "catch", "finally", "throw", "new", "delete", "class", "struct", "enum", "true", "false",
    "this", "super", "import", "static", "const", "void", "sizeof", "typeof", "instanceof", "in",
    "yield", "await", "async", "public", "private", "protected", "interface", "extends", "implements",
    "function", "let", "var", "of", "null", "nullptr", "throws", "synchronized", "operator", "template",
    "typename", "namespace", "using", "record", "assert"};

static const set<string> python_keywords = {
    "def", "class", "if", "elif", "else", "for", "while", "return", "break", "continue", "pass",
    "try", "except", "finally", "raise", "with", "as", "import", "from", "lambda", "yield", "await",
    "async", "global", "nonlocal", "del", "in", "is", "not", "and", "or", "None", "True", "False",
    "assert", "print", "self", "cls"};

bool is_keyword(const string &word, language lang) {
    if (lang == language::PYTHON) return python_keywords.count(word) > 0;
    return common_keywords.count(word) > 0;
}

size_t code_structure::block_end(size_t index) const {
    if (index >= lines.size()) return lines.size();
    int base = levels[index];

    if (lang == language::PYTHON) {
        if (base < 0) return index + 1;
        size_t last = index + 1;
        for (size_t j = index + 1; j < lines.size(); ++j) {
            if (levels[j] < 0) continue;
            if (levels[j] <= base) break;
            last = j + 1;
        }
        return last;
    }

    // 找到语句头之后第一个不在括号内的 '{' 或 ';'
    // '{' 表示代码块，直到花括号深度回到语句头所在层级为止；';' 表示没有花括号的单条语句
    int parens = 0;
    for (size_t k = index; k < lines.size() && k < index + 12; ++k) {
        for (char c : lines[k].code) {
            if (c == '(' || c == '[') {
                ++parens;
            } else if (c == ')' || c == ']') {
                --parens;
            } else if (parens <= 0 && c == ';') {
                return k + 1;
            } else if (parens <= 0 && c == '{') {
                size_t j = k + 1;
                while (j < lines.size() && levels[j] > base) ++j;
                return j;
            }
        }
    }
    return index + 1;
}

string code_structure::code_between(size_t begin, size_t end) const {
    string code;
    for (size_t i = begin; i < end && i < lines.size(); ++i) {
        if (i > begin) code += '\n';
        code += lines[i].code;
    }
    return code;
}

size_t code_structure::code_line_count() const {
    return count_if(lines.begin(), lines.end(), [](auto &line) { return !line.is_blank() && !line.is_comment(); });
}

size_t code_structure::comment_line_count() const {
    return count_if(lines.begin(), lines.end(), [](auto &line) { return line.has_comment || line.is_comment(); });
}

size_t code_structure::non_blank_line_count() const {
    return count_if(lines.begin(), lines.end(), [](auto &line) { return !line.is_blank(); });
}

const function_span *code_structure::function_at(size_t index) const {
    const function_span *found = nullptr;
    for (auto &function : functions)
        if (function.line <= index && index < function.end && (!found || function.line > found->line))
            found = &function;
    return found;
}

static vector<string> split_parameters(const string &code, size_t open) {
    size_t close = find_matching(code, open);
    if (close == string::npos) return {};
    vector<string> result;
    for (auto &raw : split_top_level(code.substr(open + 1, close - open - 1))) {
        string param = boost::algorithm::trim_copy(raw);
        if (!param.empty()) result.push_back(param);
    }
    return result;
}

static void find_python_functions(code_structure &structure) {
    static const regex def_regex(R"(^\s*(?:async\s+)?def\s+([A-Za-z_]\w*)\s*\()");
    for (size_t i = 0; i < structure.lines.size(); ++i) {
        smatch match;
        const string &code = structure.lines[i].code;
        if (!regex_search(code, match, def_regex)) continue;

        function_span function;
        function.name = match[1];
        function.line = i;
        function.end = structure.block_end(i);
        string header = structure.code_between(i, min(function.end, i + 10));
        for (auto &param : split_parameters(header, match.position(0) + match.length(0) - 1)) {
            string name = boost::algorithm::trim_copy(param.substr(0, param.find_first_of(":=")));
            boost::algorithm::trim_left_if(name, boost::is_any_of("*"));
            if (name.empty() || name == "/" || name == "self" || name == "cls") continue;
            function.parameters.push_back(name);
        }
        structure.functions.push_back(function);
    }
}

static string js_parameter_name(string param) {
    param = param.substr(0, param.find('='));
    boost::algorithm::trim(param);
    if (boost::algorithm::starts_with(param, "...")) param = param.substr(3);
    return param;
}

static void find_javascript_functions(code_structure &structure) {
    static const regex declaration_regex(R"(\bfunction\s*\*?\s*([A-Za-z_$][\w$]*)\s*\()");
    static const regex assigned_regex(R"(\b(?:const|let|var)\s+([A-Za-z_$][\w$]*)\s*=\s*(?:async\s+)?(function\b[^(]*)?\()");
    static const regex single_arrow_regex(R"(\b(?:const|let|var)\s+([A-Za-z_$][\w$]*)\s*=\s*(?:async\s+)?([A-Za-z_$][\w$]*)\s*=>)");
    static const regex method_regex(R"(^\s*(?:(?:static|async|get|set)\s+)*([A-Za-z_$][\w$]*)\s*\()");

    for (size_t i = 0; i < structure.lines.size(); ++i) {
        const string &code = structure.lines[i].code;
        string header = structure.code_between(i, i + 10);
        smatch match;
        function_span function;
        function.line = i;
        size_t open = string::npos;

        if (regex_search(code, match, declaration_regex)) {
            function.name = match[1];
            open = match.position(0) + match.length(0) - 1;
        } else if (regex_search(code, match, assigned_regex)) {
            open = match.position(0) + match.length(0) - 1;
            if (!match[2].matched) {
                // 箭头函数：参数列表之后必须是 =>
                size_t close = find_matching(header, open);
                if (close == string::npos) continue;
                string rest = boost::algorithm::trim_left_copy(header.substr(close + 1));
                if (!boost::algorithm::starts_with(rest, "=>")) continue;
            }
            function.name = match[1];
        } else if (regex_search(code, match, single_arrow_regex)) {
            function.name = match[1];
            function.parameters.push_back(match[2]);
        } else if (structure.levels[i] >= 1 && regex_search(code, match, method_regex) &&
                   !is_keyword(match[1], structure.lang)) {
            open = match.position(0) + match.length(0) - 1;
            size_t close = find_matching(header, open);
            if (close == string::npos || !has_body_after(header, close)) continue;
            function.name = match[1];
        } else {
            continue;
        }

        if (open != string::npos)
            for (auto &param : split_parameters(header, open)) {
                string name = js_parameter_name(param);
                if (!name.empty()) function.parameters.push_back(name);
            }
        function.end = structure.block_end(i);
        structure.functions.push_back(function);
    }
}

static void find_typed_functions(code_structure &structure) {
    static const regex call_regex(R"(([A-Za-z_~]\w*(?:::~?[A-Za-z_]\w*)*)\s*\()");
    for (size_t i = 0; i < structure.lines.size(); ++i) {
        const string &code = structure.lines[i].code;
        smatch match;
        if (!regex_search(code, match, call_regex)) continue;

        string name = match[1];
        size_t scope = name.rfind("::");
        if (scope != string::npos) name = name.substr(scope + 2);
        if (is_keyword(name, structure.lang)) continue;

        // 函数定义的函数名之前必须是返回类型或修饰符
        string prefix = boost::algorithm::trim_copy(code.substr(0, match.position(0)));
        if (prefix.empty()) continue;
        char last = prefix.back();
        if (!isalnum((unsigned char)last) && last != '_' && last != '>' && last != '*' && last != '&' && last != ']')
            continue;
        if (prefix.find_first_of("=(,.") != string::npos) continue;
        static const regex statement_regex(R"(\b(return|new|else|throw|case)\b)");
        if (regex_search(prefix, statement_regex)) continue;

        string header = structure.code_between(i, i + 10);
        size_t open = match.position(0) + match.length(0) - 1;
        size_t close = find_matching(header, open);
        if (close == string::npos || !has_body_after(header, close)) continue;

        function_span function;
        function.name = name;
        function.line = i;
        function.end = structure.block_end(i);
        for (auto &param : split_parameters(header, open)) {
            auto parsed = parse_typed_parameter(boost::algorithm::replace_all_copy(param, "...", "[]"));
            if (!parsed.name.empty() && parsed.type != "void") function.parameters.push_back(parsed.name);
        }
        structure.functions.push_back(function);
    }
}

code_structure analyze_structure(const string &source, language lang) {
    code_structure structure;
    structure.lang = lang;
    structure.lines = scan_source(source, get_harness(lang).comments());

    if (lang == language::PYTHON) {
        for (auto &line : structure.lines)
            structure.levels.push_back(line.is_blank() || line.is_comment() ? -1 : (int)line.indent());
    } else {
        int depth = 0;
        for (auto &line : structure.lines) {
            structure.levels.push_back(depth);
            for (char c : line.code) {
                if (c == '{') ++depth;
                if (c == '}') depth = max(0, depth - 1);
            }
        }
    }

    static const regex python_class_regex(R"(^\s*class\s+([A-Za-z_]\w*))");
    static const regex c_class_regex(R"(\b(?:class|struct|interface|enum|record)\s+([A-Za-z_]\w*))");
    const regex &class_regex = lang == language::PYTHON ? python_class_regex : c_class_regex;
    for (size_t i = 0; i < structure.lines.size(); ++i) {
        auto &code = structure.lines[i].code;
        for (sregex_iterator it(code.begin(), code.end(), class_regex), end; it != end; ++it) {
            string name = (*it)[1];
            if (!is_keyword(name, lang)) structure.classes.emplace_back(name, i);
        }
    }

    switch (lang) {
        case language::PYTHON: find_python_functions(structure); break;
        case language::JAVASCRIPT: find_javascript_functions(structure); break;
        case language::JAVA:
        case language::CPP: find_typed_functions(structure); break;
    }
    return structure;
}

}  // namespace grader
