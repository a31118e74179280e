#include "language/cpp.hpp"
#include <fmt/format.h>
#include <boost/algorithm/string.hpp>
#include <regex>
#include <set>
#include "common/exceptions.hpp"
#include "common/stl_utils.hpp"
#include "language/signature.hpp"

namespace grader {
using namespace std;
using json = nlohmann::json;

static const regex function_regex(
    R"(^\s*(?:(?:static|inline|constexpr|virtual|friend|public:|private:)\s+)*([\w:]+(?:\s*<.*>)?(?:\s*[\*&]+)?)\s*[\s\*&]\s*(\w+)\s*\()");

static const set<string> keywords = {"if", "for", "while", "switch", "catch", "return", "else", "sizeof", "new", "delete", "operator", "throw", "case", "do"};

static const set<string> integer_types = {
    "int", "long", "long long", "short", "unsigned", "unsigned int", "unsigned long", "unsigned long long",
    "size_t", "int8_t", "int16_t", "int32_t", "int64_t", "uint8_t", "uint16_t", "uint32_t", "uint64_t", "long int", "long long int"};

language cpp_harness::type() const {
    return language::CPP;
}

comment_style cpp_harness::comments() const {
    return comment_style::C_STYLE;
}

entry_point cpp_harness::prepare(const string &source, const optional<string> &function_hint) const {
    declaration_scan scan = scan_declarations(source);
    vector<entry_point> free_functions, methods, helpers;
    for (size_t i = 0; i < scan.line_offsets.size(); ++i) {
        size_t offset = scan.line_offsets[i];
        int depth = scan.depths[offset];
        if (depth > 1) continue;
        string line = scan.line(i);
        if (boost::algorithm::starts_with(boost::algorithm::trim_left_copy(line), "#")) continue;
        smatch match;
        if (!regex_search(line, match, function_regex) || keywords.count(match[2]) || keywords.count(match[1]))
            continue;

        const class_region *region = depth == 1 ? scan.class_at(offset) : nullptr;
        if (depth == 1 && !region) continue;  // 位于命名空间或其他块中
        if (region && match[2] == region->name) continue;

        size_t open = offset + match.position(0) + match.length(0) - 1;
        size_t close = find_matching(scan.code, open);
        if (close == string::npos || !has_body_after(scan.code, close)) continue;

        entry_point entry;
        entry.name = match[2];
        entry.return_type = simplify_type(match[1]);
        boost::algorithm::erase_all(entry.return_type, "std::");
        boost::algorithm::replace_all(entry.return_type, "static ", "");
        if (region) {
            entry.class_name = region->name;
            entry.is_static = boost::algorithm::contains(line.substr(0, match.position(1) + match.length(1)), "static");
        }
        for (auto &raw : split_top_level(scan.code.substr(open + 1, close - open - 1))) {
            if (raw == "void") continue;
            entry.parameters.push_back(parse_typed_parameter(raw));
        }

        if (entry.name == "main" || boost::algorithm::starts_with(entry.name, "_"))
            helpers.push_back(entry);
        else
            (region ? methods : free_functions).push_back(entry);
    }
    append(free_functions, methods);
    if (free_functions.empty()) free_functions = helpers;
    return select_entry_point(free_functions, function_hint);
}

/**
 * @brief 规范化类型名，去掉 std:: 前缀
 */
static string canonical_type(const string &raw_type) {
    string type = simplify_type(raw_type);
    boost::algorithm::erase_all(type, "std::");
    return type;
}

static string inner_type(const string &type) {
    size_t open = type.find('<');
    size_t close = type.rfind('>');
    return type.substr(open + 1, close - open - 1);
}

/**
 * @brief 将规范化的类型名渲染为可以在运行器中使用的完整类型名
 */
static string qualified_type(const string &type) {
    if (boost::algorithm::starts_with(type, "vector<")) return "std::vector<" + qualified_type(inner_type(type)) + ">";
    if (type == "string") return "std::string";
    return type;
}

static string infer_type(const json &value) {
    if (value.is_number_integer()) return "long long";
    if (value.is_number_float()) return "double";
    if (value.is_boolean()) return "bool";
    if (value.is_string()) return "string";
    if (value.is_array()) return "vector<" + (value.empty() ? string("int") : infer_type(value.front())) + ">";
    throw invalid_argument_error("Unable to infer C++ type of " + value.dump());
}

static string render_decimal(const json &value) {
    string text = value.dump();
    if (text.find_first_of(".eE") == string::npos) text += ".0";
    return text;
}

string cpp_harness::render_literal(const json &value, const string &raw_type) {
    string type = canonical_type(raw_type);
    auto mismatch = [&]() {
        return invalid_argument_error(fmt::format("Value {} does not match C++ type {}", value.dump(), type));
    };

    if (type.empty() || type == "auto" || type.size() == 1 /* 模板参数 T */)
        type = infer_type(value);

    if (boost::algorithm::starts_with(type, "vector<")) {
        if (!value.is_array()) throw mismatch();
        string element_type = inner_type(type);
        vector<string> elements;
        for (auto &element : value) elements.push_back(render_literal(element, element_type));
        return fmt::format("{}{{{}}}", qualified_type(type), boost::algorithm::join(elements, ", "));
    }
    if (integer_types.count(type)) {
        if (!value.is_number_integer()) throw mismatch();
        return fmt::format("({}){}{}", type, value.dump(), value.is_number_unsigned() ? "ULL" : "LL");
    }
    if (type == "double" || type == "float" || type == "long double") {
        if (!value.is_number()) throw mismatch();
        return fmt::format("({}){}", type, render_decimal(value));
    }
    if (type == "bool") {
        if (!value.is_boolean()) throw mismatch();
        return value.get<bool>() ? "true" : "false";
    }
    if (type == "char") {
        if (!value.is_string() || value.get<string>().size() != 1) throw mismatch();
        string c = value.get<string>();
        return c == "'" ? "'\\''" : c == "\\" ? "'\\\\'" : "'" + c + "'";
    }
    if (type == "string" || type == "string_view") {
        if (!value.is_string()) throw mismatch();
        return fmt::format("std::string({})", value.dump());
    }
    if (type == "char*" || type == "char *") {
        if (!value.is_string()) throw mismatch();
        return value.dump();
    }
    throw mismatch();
}

executable_unit cpp_harness::build_invocation(const string &source, const entry_point &entry,
                                              const json &arguments, const execution_limits &limits) const {
    vector<string> literals;
    for (size_t i = 0; i < arguments.size(); ++i) {
        string type = i < entry.parameters.size() ? entry.parameters[i].type : "";
        literals.push_back(render_literal(arguments[i], type));
    }

    string target;
    if (entry.class_name.empty())
        target = entry.name;
    else if (entry.is_static)
        target = entry.class_name + "::" + entry.name;
    else
        target = fmt::format("{}().{}", entry.class_name, entry.name);
    string call = fmt::format("{}({})", target, boost::algorithm::join(literals, ", "));
    string invoke = entry.return_type == "void"
                        ? fmt::format("{};\n    std::cout << \"{} null\" << std::endl;", call, RESULT_MARKER)
                        : fmt::format("auto result = {};\n    std::cout << \"{} \" << grader_runner::encode(result) << std::endl;", call, RESULT_MARKER);

    executable_unit unit;
    unit.lang = language::CPP;
    unit.files["solution.cpp"] = source;
    unit.files["main.cpp"] = fmt::format(R"(#include <bits/stdc++.h>
#define main grader_candidate_main
#include "solution.cpp"
#undef main

namespace grader_runner {{

inline std::string quote(const std::string &s) {{
    std::ostringstream os;
    os << '"';
    for (unsigned char c : s) {{
        switch (c) {{
            case '"': os << "\\\""; break;
            case '\\': os << "\\\\"; break;
            case '\n': os << "\\n"; break;
            case '\r': os << "\\r"; break;
            case '\t': os << "\\t"; break;
            default:
                if (c < 0x20) os << "\\u" << std::hex << std::setw(4) << std::setfill('0') << (int)c << std::dec;
                else os << c;
        }}
    }}
    os << '"';
    return os.str();
}}

inline std::string encode(const std::string &v) {{ return quote(v); }}
inline std::string encode(const char *v) {{ return quote(v); }}
inline std::string encode(char v) {{ return quote(std::string(1, v)); }}
inline std::string encode(bool v) {{ return v ? "true" : "false"; }}

template <typename T>
std::enable_if_t<std::is_integral_v<T>, std::string> encode(T v) {{ return std::to_string(v); }}

template <typename T>
std::enable_if_t<std::is_floating_point_v<T>, std::string> encode(T v) {{
    std::ostringstream os;
    os << std::setprecision(17) << v;
    return os.str();
}}

template <typename A, typename B>
std::string encode(const std::pair<A, B> &p);
template <typename T>
std::string encode(const std::vector<T> &v);
template <typename T>
std::string encode(const std::set<T> &v);
template <typename K, typename V>
std::string encode(const std::map<K, V> &m);

template <typename Range>
std::string encode_range(const Range &range) {{
    std::string out = "[";
    bool first = true;
    for (auto &&element : range) {{
        if (!first) out += ",";
        first = false;
        out += encode(element);
    }}
    return out + "]";
}}

template <typename A, typename B>
std::string encode(const std::pair<A, B> &p) {{ return "[" + encode(p.first) + "," + encode(p.second) + "]"; }}
template <typename T>
std::string encode(const std::vector<T> &v) {{ return encode_range(v); }}
template <typename T>
std::string encode(const std::set<T> &v) {{ return encode_range(v); }}
template <typename K, typename V>
std::string encode(const std::map<K, V> &m) {{
    std::string out = "{{";
    bool first = true;
    for (auto &[key, value] : m) {{
        if (!first) out += ",";
        first = false;
        std::string k = encode(key);
        out += (k.front() == '"' ? k : quote(k)) + ":" + encode(value);
    }}
    return out + "}}";
}}

}}  // namespace grader_runner

int main() {{
    {0}
    return 0;
}}
)",
                                         invoke);
    // 编译器不受内存限制，编译完成后再通过 ulimit 限制选手程序的地址空间
    unit.command = {"sh", "-c",
                    fmt::format("g++ -std=c++17 -O2 -o main main.cpp || exit {}; ulimit -v {}; exec ./main",
                                COMPILE_FAILURE_EXIT_CODE, limits.memory_limit)};
    unit.limit_address_space = false;
    return unit;
}

}  // namespace grader
