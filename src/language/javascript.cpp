#include "language/javascript.hpp"
#include <fmt/format.h>
#include <boost/algorithm/string.hpp>
#include <algorithm>
#include <regex>
#include <set>
#include "common/exceptions.hpp"

namespace grader {
using namespace std;
using json = nlohmann::json;

static const regex function_regex(R"(\bfunction\s*\*?\s+(\w+)\s*\()");
static const regex expression_regex(R"(\b(?:const|let|var)\s+(\w+)\s*=\s*(?:async\s+)?function\b[^(]*\()");
static const regex arrow_regex(R"(\b(?:const|let|var)\s+(\w+)\s*=\s*(?:async\s+)?\()");
static const regex single_arrow_regex(R"(\b(?:const|let|var)\s+(\w+)\s*=\s*(?:async\s+)?(\w+)\s*=>)");
static const regex class_regex(R"(\bclass\s+(\w+)[^{]*\{)");
static const regex method_regex(R"(^\s*(static\s+)?(?:async\s+)?(\w+)\s*\()");
static const regex export_regex(R"((^|\n)(\s*)export\s+(default\s+)?)");

static const set<string> keywords = {"if", "for", "while", "switch", "catch", "function", "return", "constructor"};

language javascript_harness::type() const {
    return language::JAVASCRIPT;
}

comment_style javascript_harness::comments() const {
    return comment_style::C_STYLE;
}

static void parse_parameters(const string &list, entry_point &entry) {
    for (auto &raw : split_top_level(list)) {
        string name = raw.substr(0, raw.find('='));
        boost::algorithm::trim(name);
        if (name.empty()) continue;
        if (boost::algorithm::starts_with(name, "...")) {
            entry.variadic = true;
            continue;
        }
        entry.parameters.push_back({name, ""});
    }
}

/**
 * @brief 计算每个位置的花括号深度
 */
static vector<int> brace_depths(const string &code) {
    vector<int> depths(code.size() + 1, 0);
    int depth = 0;
    for (size_t i = 0; i < code.size(); ++i) {
        depths[i] = depth;
        if (code[i] == '{') depth++;
        if (code[i] == '}') depth--;
    }
    depths[code.size()] = depth;
    return depths;
}

entry_point javascript_harness::prepare(const string &source, const optional<string> &function_hint) const {
    string code = strip_comments(source, comment_style::C_STYLE);
    vector<int> depths = brace_depths(code);
    vector<pair<size_t, entry_point>> found;

    auto collect = [&](const regex &pattern, bool arrow) {
        for (sregex_iterator it(code.begin(), code.end(), pattern), end; it != end; ++it) {
            auto &match = *it;
            size_t position = match.position(0);
            if (depths[position] != 0) continue;
            entry_point entry;
            entry.name = match[1];
            size_t open = position + match.length(0) - 1;
            size_t close = find_matching(code, open);
            if (close == string::npos) continue;
            if (arrow && code.substr(close + 1).find_first_not_of(" \t\r\n") != code.substr(close + 1).find("=>"))
                continue;
            parse_parameters(code.substr(open + 1, close - open - 1), entry);
            found.emplace_back(position, entry);
        }
    };
    collect(function_regex, false);
    collect(expression_regex, false);
    collect(arrow_regex, true);
    for (sregex_iterator it(code.begin(), code.end(), single_arrow_regex), end; it != end; ++it) {
        if (depths[it->position(0)] != 0) continue;
        entry_point entry;
        entry.name = (*it)[1];
        entry.parameters.push_back({(*it)[2], ""});
        found.emplace_back(it->position(0), entry);
    }

    // 类方法排在顶层函数之后
    size_t class_base = code.size();
    for (sregex_iterator it(code.begin(), code.end(), class_regex), end; it != end; ++it) {
        size_t open = it->position(0) + it->length(0) - 1;
        size_t close = find_matching(code, open);
        if (close == string::npos || depths[it->position(0)] != 0) continue;
        string body = code.substr(open + 1, close - open - 1);
        vector<string> body_lines;
        boost::algorithm::split(body_lines, body, boost::is_any_of("\n"));
        size_t offset = open + 1;
        for (auto &line : body_lines) {
            smatch match;
            if (depths[offset] == 1 && regex_search(line, match, method_regex) && !keywords.count(match[2])) {
                entry_point entry;
                entry.name = match[2];
                entry.class_name = (*it)[1];
                entry.is_static = match[1].matched;
                size_t method_open = offset + match.position(0) + match.length(0) - 1;
                size_t method_close = find_matching(code, method_open);
                if (method_close != string::npos) {
                    parse_parameters(code.substr(method_open + 1, method_close - method_open - 1), entry);
                    found.emplace_back(class_base + method_open, entry);
                }
            }
            offset += line.size() + 1;
        }
    }

    sort(found.begin(), found.end(), [](auto &a, auto &b) { return a.first < b.first; });
    vector<entry_point> candidates, helpers;
    for (auto &[position, entry] : found)
        (entry.name == "main" || boost::algorithm::starts_with(entry.name, "_") ? helpers : candidates).push_back(entry);
    if (candidates.empty()) candidates = helpers;
    return select_entry_point(candidates, function_hint);
}

executable_unit javascript_harness::build_invocation(const string &source, const entry_point &entry,
                                                     const json &arguments, const execution_limits &limits) const {
    string target;
    if (entry.class_name.empty())
        target = fmt::format("(typeof {0} === 'function') ? {0} : undefined", entry.name);
    else if (entry.is_static)
        target = fmt::format("(typeof {0} !== 'undefined') ? {0}.{1}.bind({0}) : undefined", entry.class_name, entry.name);
    else
        target = fmt::format("(typeof {0} !== 'undefined') ? ((o) => o.{1}.bind(o))(new {0}()) : undefined",
                             entry.class_name, entry.name);

    executable_unit unit;
    unit.lang = language::JAVASCRIPT;
    // 运行器以 CommonJS 方式加载选手代码，去掉 ES module 的 export 关键字
    unit.files["solution.js"] = regex_replace(source, export_regex, "$1$2") +
                                "\n;module.exports.__graderEntry = " + target + ";\n";
    unit.files["args.json"] = arguments.dump();
    unit.files["runner.js"] = string() +
                              "const fs = require('fs');\n"
                              "const args = JSON.parse(fs.readFileSync('args.json', 'utf8'));\n"
                              "const entry = require('./solution.js').__graderEntry;\n"
                              "if (typeof entry !== 'function') {\n"
                              "  process.stderr.write('" + ENTRY_NOT_FOUND_MARKER + " " + entry.name + "\\n');\n"
                              "  process.exit(3);\n"
                              "}\n"
                              "const encode = (key, value) =>\n"
                              "  value instanceof Set ? Array.from(value) : value instanceof Map ? Object.fromEntries(value) : value;\n"
                              "Promise.resolve(entry(...args)).then((result) => {\n"
                              "  const encoded = JSON.stringify(result === undefined ? null : result, encode);\n"
                              "  process.stdout.write('" + RESULT_MARKER + " ' + encoded + '\\n');\n"
                              "}).catch((error) => {\n"
                              "  process.stderr.write(String((error && error.stack) || error) + '\\n');\n"
                              "  process.exit(1);\n"
                              "});\n";
    // V8 预留的虚拟地址空间远大于堆，通过 --max-old-space-size 限制堆大小
    unit.command = {"node", fmt::format("--max-old-space-size={}", max<int64_t>(16, limits.memory_limit / 1024)), "runner.js"};
    unit.limit_address_space = false;
    return unit;
}

}  // namespace grader
