#include "language/java.hpp"
#include <fmt/format.h>
#include <boost/algorithm/string.hpp>
#include <regex>
#include <set>
#include "common/exceptions.hpp"
#include "language/signature.hpp"

namespace grader {
using namespace std;
using json = nlohmann::json;

static const regex method_regex(
    R"(^\s*((?:(?:public|private|protected|static|final|synchronized|abstract)\s+)*)(?:<[^>]*>\s*)?([\w<>\[\],.?]+(?:\s*<[^()]*>)?(?:\s*\[\])*)\s+(\w+)\s*\()");
static const regex public_class_regex(R"(\bpublic\s+(?:(?:abstract|final)\s+)*class\s+(\w+))");

static const set<string> keywords = {"if", "for", "while", "switch", "catch", "return", "new", "else", "throw", "synchronized"};

language java_harness::type() const {
    return language::JAVA;
}

comment_style java_harness::comments() const {
    return comment_style::C_STYLE;
}

entry_point java_harness::prepare(const string &source, const optional<string> &function_hint) const {
    declaration_scan scan = scan_declarations(source);
    vector<entry_point> candidates, helpers;
    for (size_t i = 0; i < scan.line_offsets.size(); ++i) {
        size_t offset = scan.line_offsets[i];
        if (scan.depths[offset] != 1) continue;
        string line = scan.line(i);
        smatch match;
        if (!regex_search(line, match, method_regex) || keywords.count(match[3]) || keywords.count(match[2]))
            continue;
        const class_region *region = scan.class_at(offset);
        if (!region || match[3] == region->name) continue;  // 构造函数

        size_t open = offset + match.position(0) + match.length(0) - 1;
        size_t close = find_matching(scan.code, open);
        if (close == string::npos || !has_body_after(scan.code, close)) continue;

        entry_point entry;
        entry.name = match[3];
        entry.return_type = simplify_type(match[2]);
        entry.class_name = region->name;
        string modifiers = match[1];
        entry.is_static = modifiers.find("static") != string::npos;
        for (auto &raw : split_top_level(scan.code.substr(open + 1, close - open - 1))) {
            parameter param = parse_typed_parameter(raw);
            if (boost::algorithm::ends_with(param.type, "...")) {
                param.type = param.type.substr(0, param.type.size() - 3) + "[]";
                entry.variadic = true;
            }
            entry.parameters.push_back(param);
        }

        bool is_helper = entry.name == "main" || modifiers.find("private") != string::npos;
        (is_helper ? helpers : candidates).push_back(entry);
    }
    if (candidates.empty()) candidates = helpers;
    return select_entry_point(candidates, function_hint);
}

static string strip_generics(const string &type) {
    size_t pos = type.find('<');
    return pos == string::npos ? type : type.substr(0, pos);
}

static string generic_argument(const string &type) {
    size_t open = type.find('<');
    size_t close = type.rfind('>');
    if (open == string::npos || close == string::npos || close < open) return "Object";
    return type.substr(open + 1, close - open - 1);
}

static string render_decimal(const json &value) {
    string text = value.dump();
    if (text.find_first_of(".eE") == string::npos) text += ".0";
    return text;
}

static string render_untyped(const json &value) {
    if (value.is_number_integer()) return value.dump();
    if (value.is_number_float()) return render_decimal(value);
    if (value.is_boolean()) return value.get<bool>() ? "true" : "false";
    if (value.is_string()) return value.dump();
    if (value.is_null()) return "null";
    if (value.is_array()) {
        vector<string> elements;
        for (auto &element : value) elements.push_back(render_untyped(element));
        return fmt::format("new java.util.ArrayList<>(java.util.Arrays.asList({}))", boost::algorithm::join(elements, ", "));
    }
    throw invalid_argument_error("Unable to render value " + value.dump() + " as Java literal");
}

string java_harness::render_literal(const json &value, const string &raw_type) {
    string type = simplify_type(raw_type);
    auto mismatch = [&]() {
        return invalid_argument_error(fmt::format("Value {} does not match Java type {}", value.dump(), type));
    };

    if (value.is_null()) {
        if (type == "int" || type == "long" || type == "double" || type == "boolean" || type == "char") throw mismatch();
        return "null";
    }

    if (boost::algorithm::ends_with(type, "[]")) {
        if (!value.is_array()) throw mismatch();
        string element_type = type.substr(0, type.size() - 2);
        vector<string> elements;
        for (auto &element : value) elements.push_back(render_literal(element, element_type));
        return fmt::format("new {}[]{{{}}}", element_type, boost::algorithm::join(elements, ", "));
    }

    string base = strip_generics(type);
    if (base == "List" || base == "ArrayList" || base == "Collection" || base == "Iterable" || base == "LinkedList") {
        if (!value.is_array()) throw mismatch();
        string element_type = generic_argument(type);
        vector<string> elements;
        for (auto &element : value) elements.push_back(render_literal(element, element_type));
        string container = base == "LinkedList" ? "java.util.LinkedList" : "java.util.ArrayList";
        if (elements.empty()) return fmt::format("new {}<{}>()", container, element_type);
        return fmt::format("new {}<{}>(java.util.Arrays.asList({}))", container, element_type,
                           boost::algorithm::join(elements, ", "));
    }

    if (type == "int" || type == "Integer" || type == "short" || type == "Short" || type == "byte" || type == "Byte") {
        if (!value.is_number_integer()) throw mismatch();
        return type == "short" || type == "Short" || type == "byte" || type == "Byte"
                   ? fmt::format("({}) {}", type == "Short" ? "short" : type == "Byte" ? "byte" : type, value.dump())
                   : value.dump();
    }
    if (type == "long" || type == "Long") {
        if (!value.is_number_integer()) throw mismatch();
        return value.dump() + "L";
    }
    if (type == "double" || type == "Double") {
        if (!value.is_number()) throw mismatch();
        return render_decimal(value);
    }
    if (type == "float" || type == "Float") {
        if (!value.is_number()) throw mismatch();
        return render_decimal(value) + "f";
    }
    if (type == "boolean" || type == "Boolean") {
        if (!value.is_boolean()) throw mismatch();
        return value.get<bool>() ? "true" : "false";
    }
    if (type == "char" || type == "Character") {
        if (!value.is_string() || value.get<string>().size() != 1) throw mismatch();
        string c = value.get<string>();
        return c == "'" ? "'\\''" : c == "\\" ? "'\\\\'" : "'" + c + "'";
    }
    if (type == "String" || type == "CharSequence") {
        if (value.is_string()) return value.dump();
        return json(value.dump()).dump();
    }
    return render_untyped(value);
}

executable_unit java_harness::build_invocation(const string &source, const entry_point &entry,
                                               const json &arguments, const execution_limits &limits) const {
    vector<string> literals;
    for (size_t i = 0; i < arguments.size(); ++i) {
        string type = i < entry.parameters.size() ? entry.parameters[i].type : "Object";
        if (entry.variadic && i + 1 >= entry.parameters.size() && !entry.parameters.empty()) {
            // 可变参数：剩余实参逐个按元素类型渲染
            string element_type = entry.parameters.back().type;
            element_type = element_type.substr(0, element_type.size() - 2);
            for (size_t j = i; j < arguments.size(); ++j)
                literals.push_back(render_literal(arguments[j], element_type));
            break;
        }
        literals.push_back(render_literal(arguments[i], type));
    }

    string target = entry.is_static ? entry.class_name : fmt::format("new {}()", entry.class_name);
    string call = fmt::format("{}.{}({})", target, entry.name, boost::algorithm::join(literals, ", "));
    string invoke = entry.return_type == "void"
                        ? fmt::format("{};\n        System.out.println(\"{} null\");", call, RESULT_MARKER)
                        : fmt::format("Object result = {};\n        System.out.println(\"{} \" + encode(result));", call, RESULT_MARKER);

    smatch match;
    string file_name = regex_search(source, match, public_class_regex) ? string(match[1]) + ".java" : "Solution.java";

    executable_unit unit;
    unit.lang = language::JAVA;
    unit.files[file_name] = source;
    unit.files["GraderMain.java"] = fmt::format(R"(import java.util.*;

public class GraderMain {{
    public static void main(String[] args) throws Throwable {{
        {0}
    }}

    static String quote(String s) {{
        StringBuilder sb = new StringBuilder("\"");
        for (char c : s.toCharArray()) {{
            switch (c) {{
                case '"': sb.append("\\\""); break;
                case '\\': sb.append("\\\\"); break;
                case '\n': sb.append("\\n"); break;
                case '\r': sb.append("\\r"); break;
                case '\t': sb.append("\\t"); break;
                default:
                    if (c < 0x20) sb.append(String.format("\\u%04x", (int) c));
                    else sb.append(c);
            }}
        }}
        return sb.append('"').toString();
    }}

    static String encode(Object value) {{
        if (value == null) return "null";
        if (value instanceof String || value instanceof Character) return quote(value.toString());
        if (value instanceof Number || value instanceof Boolean) return value.toString();
        StringBuilder sb = new StringBuilder();
        if (value.getClass().isArray()) {{
            sb.append('[');
            int n = java.lang.reflect.Array.getLength(value);
            for (int i = 0; i < n; i++) {{
                if (i > 0) sb.append(',');
                sb.append(encode(java.lang.reflect.Array.get(value, i)));
            }}
            return sb.append(']').toString();
        }}
        if (value instanceof Map) {{
            sb.append('{{');
            boolean first = true;
            for (Map.Entry<?, ?> e : ((Map<?, ?>) value).entrySet()) {{
                if (!first) sb.append(',');
                first = false;
                sb.append(quote(String.valueOf(e.getKey()))).append(':').append(encode(e.getValue()));
            }}
            return sb.append('}}').toString();
        }}
        if (value instanceof Iterable) {{
            sb.append('[');
            boolean first = true;
            for (Object o : (Iterable<?>) value) {{
                if (!first) sb.append(',');
                first = false;
                sb.append(encode(o));
            }}
            return sb.append(']').toString();
        }}
        return quote(value.toString());
    }}
}}
)",
                                                invoke);
    // JVM 需要预留大量虚拟地址空间，改用 -Xmx 限制堆大小
    int64_t heap_mb = max<int64_t>(32, limits.memory_limit / 1024);
    unit.command = {"sh", "-c",
                    fmt::format("javac -encoding UTF-8 -d . *.java || exit {}; exec java -Xss64m -Xmx{}m -cp . GraderMain",
                                COMPILE_FAILURE_EXIT_CODE, heap_mb)};
    unit.limit_address_space = false;
    return unit;
}

}  // namespace grader
