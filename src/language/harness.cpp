#include "language/harness.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include <cmath>
#include <cstring>
#include "common/exceptions.hpp"
#include "language/cpp.hpp"
#include "language/java.hpp"
#include "language/javascript.hpp"
#include "language/python.hpp"

namespace grader {
using namespace std;
using json = nlohmann::json;

const char *const RESULT_MARKER = "__GRADER_RESULT__";
const char *const ENTRY_NOT_FOUND_MARKER = "__GRADER_ENTRY_NOT_FOUND__";

language parse_language(const string &name) {
    string key = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(name));
    if (key == "python" || key == "python3" || key == "py") return language::PYTHON;
    if (key == "javascript" || key == "js" || key == "node" || key == "nodejs") return language::JAVASCRIPT;
    if (key == "java") return language::JAVA;
    if (key == "cpp" || key == "c++" || key == "cxx" || key == "cc") return language::CPP;
    throw invalid_argument_error("Unsupported language " + name);
}

const char *get_language_name(language lang) {
    switch (lang) {
        case language::PYTHON: return "python";
        case language::JAVASCRIPT: return "javascript";
        case language::JAVA: return "java";
        case language::CPP: return "cpp";
    }
    return "unknown";
}

const language_harness &get_harness(language lang) {
    static const python_harness python;
    static const javascript_harness javascript;
    static const java_harness java;
    static const cpp_harness cpp;
    switch (lang) {
        case language::PYTHON: return python;
        case language::JAVASCRIPT: return javascript;
        case language::JAVA: return java;
        case language::CPP: return cpp;
    }
    throw invalid_argument_error("Unsupported language");
}

static optional<json> try_parse(const string &text) {
    json value = json::parse(text, nullptr, false);
    if (value.is_discarded()) return nullopt;
    return value;
}

/**
 * @brief 将 Python 的 repr 输出改写为 json
 * True/False/None、单引号字符串、元组
 */
static string pythonize(const string &text) {
    string result;
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '\'' || c == '"') {
            result += '"';
            for (++i; i < text.size() && text[i] != c; ++i) {
                if (text[i] == '\\' && i + 1 < text.size()) {
                    result += text[i];
                    result += text[++i];
                } else if (text[i] == '"') {
                    result += "\\\"";
                } else {
                    result += text[i];
                }
            }
            result += '"';
        } else if (c == '(') {
            result += '[';
        } else if (c == ')') {
            result += ']';
        } else if (isalpha((unsigned char)c) && (i == 0 || !isalnum((unsigned char)text[i - 1]))) {
            size_t end = i;
            while (end < text.size() && (isalnum((unsigned char)text[end]) || text[end] == '_')) ++end;
            string word = text.substr(i, end - i);
            if (word == "True")
                result += "true";
            else if (word == "False")
                result += "false";
            else if (word == "None")
                result += "null";
            else
                result += word;
            i = end - 1;
        } else {
            result += c;
        }
    }
    // 单元素元组 (1,) 会留下 [1,]
    boost::algorithm::replace_all(result, ",]", "]");
    boost::algorithm::replace_all(result, ", ]", "]");
    return result;
}

static optional<json> parse_literal(const string &text) {
    if (auto value = try_parse(text)) return value;
    return try_parse(pythonize(text));
}

json normalize_value(const string &text) {
    string trimmed = boost::algorithm::trim_copy(text);
    if (trimmed.empty()) return "";
    optional<json> value = parse_literal(trimmed);
    if (!value) return trimmed;
    if (value->is_string()) {
        // "55" 与 55 视为相同
        string inner = boost::algorithm::trim_copy(value->get<string>());
        if (auto unwrapped = parse_literal(inner); unwrapped && !unwrapped->is_string())
            return *unwrapped;
        return inner;
    }
    return *value;
}

bool values_equal(const json &actual, const json &expected) {
    if (actual.is_number() && expected.is_number()) {
        if (actual.is_number_float() || expected.is_number_float()) {
            double a = actual.get<double>(), b = expected.get<double>();
            return fabs(a - b) <= 1e-9 * max({1.0, fabs(a), fabs(b)});
        }
        return actual == expected;
    }
    if (actual.is_array() && expected.is_array()) {
        if (actual.size() != expected.size()) return false;
        for (size_t i = 0; i < actual.size(); ++i)
            if (!values_equal(actual[i], expected[i])) return false;
        return true;
    }
    if (actual.is_object() && expected.is_object()) {
        if (actual.size() != expected.size()) return false;
        for (auto &[key, value] : actual.items())
            if (!expected.contains(key) || !values_equal(value, expected.at(key))) return false;
        return true;
    }
    if (actual.is_string() && expected.is_string())
        return boost::algorithm::trim_copy(actual.get<string>()) == boost::algorithm::trim_copy(expected.get<string>());
    return actual == expected;
}

optional<json> language_harness::parse_output(const string &raw_output) const {
    vector<string> lines;
    boost::algorithm::split(lines, raw_output, boost::is_any_of("\n"));
    for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
        string line = boost::algorithm::trim_right_copy(*it);
        if (boost::algorithm::starts_with(line, RESULT_MARKER))
            return normalize_value(line.substr(strlen(RESULT_MARKER)));
    }
    return nullopt;
}

json language_harness::bind_arguments(const string &input, const entry_point &entry) const {
    string trimmed = boost::algorithm::trim_copy(input);
    if (trimmed.empty()) return json::array();

    optional<json> value = parse_literal(trimmed);
    if (!value && trimmed.find(',') != string::npos)
        value = parse_literal("[" + trimmed + "]");
    if (!value) return json::array({trimmed});

    if (value->is_array() && (entry.variadic || entry.parameters.size() != 1))
        return *value;
    return json::array({*value});
}

entry_point select_entry_point(vector<entry_point> candidates, const optional<string> &function_hint) {
    if (candidates.empty())
        throw entry_point_not_found("No callable function found in source");
    if (function_hint && !function_hint->empty()) {
        for (auto &candidate : candidates)
            if (candidate.name == *function_hint) return candidate;
        LOG(WARNING) << "Function " << *function_hint << " not found, selecting entry point automatically";
    }
    return candidates.front();
}

}  // namespace grader
