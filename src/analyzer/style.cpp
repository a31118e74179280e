#include "analyzer/style.hpp"
#include <fmt/format.h>
#include <boost/algorithm/string.hpp>
#include <algorithm>
#include <regex>

namespace grader {
using namespace std;
using namespace nlohmann;

dimension style_analyzer::type() const {
    return dimension::STYLE;
}

void to_json(json &j, const code_issue &issue) {
    j = {{"issue_type", issue.issue_type},
         {"line_number", issue.line_number},
         {"message", issue.message},
         {"severity", issue.severity}};
}

/**
 * @brief 每行行首是否处于未闭合的圆括号或方括号中，即该行是上一行表达式的延续
 */
static vector<bool> continuation_lines(const code_structure &structure, bool count_braces) {
    vector<bool> result;
    int depth = 0;
    for (auto &line : structure.lines) {
        result.push_back(depth > 0);
        for (char c : line.code) {
            if (c == '(' || c == '[' || (count_braces && c == '{')) ++depth;
            if (c == ')' || c == ']' || (count_braces && c == '}')) depth = max(0, depth - 1);
        }
    }
    return result;
}

static void check_common(const code_structure &structure, vector<code_issue> &issues) {
    for (auto &line : structure.lines) {
        if (line.text.size() > MAX_LINE_LENGTH)
            issues.push_back({"line-too-long", line.number,
                              fmt::format("Line too long ({} > {} characters)", line.text.size(), MAX_LINE_LENGTH), "low"});
        if (!line.text.empty() && (line.text.back() == ' ' || line.text.back() == '\t'))
            issues.push_back({"trailing-whitespace", line.number, "Trailing whitespace", "low"});
        size_t indent_end = line.text.find_first_not_of(" \t");
        string indent = line.text.substr(0, indent_end == string::npos ? line.text.size() : indent_end);
        if (indent.find(' ') != string::npos && indent.find('\t') != string::npos)
            issues.push_back({"mixed-indentation", line.number, "Indentation mixes tabs and spaces", "medium"});
    }
}

static void check_python(const code_structure &structure, vector<code_issue> &issues) {
    static const regex comma_regex(R"(,(?=[^\s)\]}]))");
    static const regex assignment_regex(R"(^\s*[A-Za-z_][\w.]*(?:\[[^\]]*\])?(\s*)(?:[-+*/%&|^]|//)?=(?!=)(\s*))");

    auto continuation = continuation_lines(structure, true);
    const source_line *previous = nullptr;
    for (size_t i = 0; i < structure.lines.size(); ++i) {
        auto &line = structure.lines[i];
        if (structure.levels[i] < 0) continue;

        if (!continuation[i]) {
            size_t indent = line.indent();
            if (indent % 4 != 0)
                issues.push_back({"bad-indentation", line.number,
                                  fmt::format("Indentation is not a multiple of four ({} spaces)", indent), "medium"});
            if (previous && indent > previous->indent()) {
                string prev_code = boost::algorithm::trim_right_copy(previous->code);
                if (!prev_code.empty() && prev_code.back() != ':' && prev_code.back() != '\\')
                    issues.push_back({"unexpected-indentation", line.number, "Unexpected indentation", "high"});
            }

            smatch match;
            if (regex_search(line.code, match, assignment_regex) && (match[1].length() == 0 || match[2].length() == 0))
                issues.push_back({"missing-whitespace", line.number, "Missing whitespace around assignment operator", "low"});
            previous = &line;
        }

        if (regex_search(line.code, comma_regex))
            issues.push_back({"missing-whitespace", line.number, "Missing whitespace after ','", "low"});
    }
}

static string next_code_line(const code_structure &structure, size_t index) {
    for (size_t j = index + 1; j < structure.lines.size(); ++j) {
        auto &line = structure.lines[j];
        if (line.is_blank() || line.is_comment()) continue;
        return boost::algorithm::trim_copy(line.code);
    }
    return "";
}

static void check_javascript(const code_structure &structure, vector<code_issue> &issues) {
    static const regex control_regex(R"(^(?:\}\s*)?(if|for|while|else|function|class|switch|try|catch|finally|do|import|export|case|default)\b)");
    static const regex property_regex(R"(^[\w$"']+\s*:)");

    auto continuation = continuation_lines(structure, false);
    for (size_t i = 0; i < structure.lines.size(); ++i) {
        auto &line = structure.lines[i];
        string code = boost::algorithm::trim_copy(line.code);
        if (code.empty() || line.is_comment()) continue;
        if (i + 1 < continuation.size() && continuation[i + 1]) continue;
        if (regex_search(code, control_regex)) continue;

        char last = code.back();
        if (!isalnum((unsigned char)last) && string("_$)]\"'`").find(last) == string::npos) continue;

        string next = next_code_line(structure, i);
        if (!next.empty() && string(".?:+-*/&|)]=").find(next[0]) != string::npos) continue;
        // 对象字面量的最后一个属性
        if (boost::algorithm::starts_with(next, "}") && regex_search(code, property_regex)) continue;

        issues.push_back({"missing-semicolon", line.number, "Missing semicolon", "low"});
    }
}

static void check_braces(const code_structure &structure, vector<code_issue> &issues) {
    static const regex control_regex(R"(^(?:\}\s*)?(?:else\s+)?(if|for|while)\s*\()");
    static const regex else_regex(R"(^(?:\}\s*)?else\b(?!\s+if\b))");

    for (size_t i = 0; i < structure.lines.size(); ++i) {
        auto &line = structure.lines[i];
        size_t start = line.code.find_first_not_of(" \t");
        if (start == string::npos) continue;
        string code = line.code.substr(start);
        string header = structure.code_between(i, i + 5).substr(start);

        size_t body = string::npos;
        string keyword;
        smatch match;
        if (regex_search(code, match, control_regex)) {
            size_t close = find_matching(header, match.position(0) + match.length(0) - 1);
            if (close == string::npos) continue;
            body = close + 1;
            keyword = match[1];
        } else if (regex_search(code, match, else_regex)) {
            body = match.position(0) + match.length(0);
            keyword = "else";
        } else {
            continue;
        }

        size_t next = header.find_first_not_of(" \t\n", body);
        // do-while 的结尾和空循环体以分号结束
        if (next == string::npos || header[next] == '{' || header[next] == ';') continue;
        issues.push_back({"missing-braces", line.number,
                          fmt::format("'{}' body without braces", keyword), "medium"});
    }
}

vector<code_issue> check_style(const code_structure &structure) {
    vector<code_issue> issues;
    check_common(structure, issues);
    switch (structure.lang) {
        case language::PYTHON: check_python(structure, issues); break;
        case language::JAVASCRIPT: check_javascript(structure, issues); break;
        case language::JAVA:
        case language::CPP: check_braces(structure, issues); break;
    }
    stable_sort(issues.begin(), issues.end(), [](auto &a, auto &b) { return a.line_number < b.line_number; });
    return issues;
}

analyzer_result style_analyzer::analyze(const analysis_context &context) const {
    analyzer_result result;
    result.type = dimension::STYLE;

    code_structure structure = analyze_structure(context.answer.code, context.harness.type());
    size_t lines = structure.non_blank_line_count();
    if (lines == 0) {
        result.reason = "Source code is empty";
        return result;
    }

    auto issues = check_style(structure);
    result.score = max(0.0, 1 - min(2.0 * issues.size() / lines, 1.0));

    json counts = json::object();
    for (auto &issue : issues) counts[issue.issue_type] = counts.value(issue.issue_type, 0) + 1;
    result.details = {{"issue_count", issues.size()}, {"line_count", lines}, {"issue_types", counts}, {"issues", issues}};
    if (!issues.empty())
        result.reason = fmt::format("{} style issues in {} lines", issues.size(), lines);
    return result;
}

}  // namespace grader
