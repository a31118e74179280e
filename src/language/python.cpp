#include "language/python.hpp"
#include <fmt/format.h>
#include <boost/algorithm/string.hpp>
#include <regex>
#include "common/exceptions.hpp"
#include "common/stl_utils.hpp"

namespace grader {
using namespace std;
using json = nlohmann::json;

static const regex def_regex(R"(^\s*(?:async\s+)?def\s+(\w+)\s*\()");
static const regex class_regex(R"(^class\s+(\w+))");

language python_harness::type() const {
    return language::PYTHON;
}

comment_style python_harness::comments() const {
    return comment_style::HASH;
}

static bool is_helper(const string &name) {
    return name == "main" || boost::algorithm::starts_with(name, "_") || boost::algorithm::starts_with(name, "test");
}

static void parse_parameters(const string &list, entry_point &entry) {
    for (auto &raw : split_top_level(list)) {
        // 带默认值的参数可以省略，不计入入口函数的参数个数
        if (raw.find('=') != string::npos) continue;
        string name = raw.substr(0, raw.find_first_of(":="));
        boost::algorithm::trim(name);
        if (name.empty() || name == "self" || name == "cls" || name == "*" || name == "/")
            continue;
        if (boost::algorithm::starts_with(name, "**"))
            continue;
        if (name[0] == '*') {
            entry.variadic = true;
            continue;
        }
        entry.parameters.push_back({name, ""});
    }
}

entry_point python_harness::prepare(const string &source, const optional<string> &function_hint) const {
    auto lines = scan_source(source, comment_style::HASH);
    string code;
    vector<size_t> line_offsets;
    for (auto &line : lines) {
        line_offsets.push_back(code.size());
        code += line.code + "\n";
    }

    vector<entry_point> functions, methods, helpers;
    string current_class;
    size_t class_body_indent = 0;
    for (size_t i = 0; i < lines.size(); ++i) {
        auto &line = lines[i];
        if (line.is_blank() || line.is_comment()) continue;
        size_t indent = line.indent();
        smatch match;
        if (indent == 0) {
            current_class.clear();
            class_body_indent = 0;
            if (regex_search(line.code, match, class_regex)) {
                current_class = match[1];
                continue;
            }
        }
        if (!regex_search(line.code, match, def_regex)) continue;

        entry_point entry;
        entry.name = match[1];
        size_t open = line_offsets[i] + match.position(0) + match.length(0) - 1;
        size_t close = find_matching(code, open);
        if (close == string::npos) continue;
        parse_parameters(code.substr(open + 1, close - open - 1), entry);

        if (indent == 0) {
            (is_helper(entry.name) ? helpers : functions).push_back(entry);
        } else if (!current_class.empty()) {
            // 只接受类体第一层的方法，忽略嵌套函数
            if (class_body_indent == 0) class_body_indent = indent;
            if (indent != class_body_indent || is_helper(entry.name)) continue;
            entry.class_name = current_class;
            string decorator = i > 0 ? boost::algorithm::trim_copy(lines[i - 1].code) : "";
            entry.is_static = decorator == "@staticmethod" || decorator == "@classmethod";
            methods.push_back(entry);
        }
    }

    append(functions, methods);
    if (functions.empty()) functions = helpers;
    return select_entry_point(functions, function_hint);
}

executable_unit python_harness::build_invocation(const string &source, const entry_point &entry,
                                                 const json &arguments, const execution_limits &) const {
    string target = entry.class_name.empty()
                        ? fmt::format("getattr(_solution, \"{}\", None)", entry.name)
                        : fmt::format("getattr(getattr(_solution, \"{0}\")(), \"{1}\", None) if hasattr(_solution, \"{0}\") else None",
                                      entry.class_name, entry.name);

    executable_unit unit;
    unit.lang = language::PYTHON;
    unit.files["solution.py"] = source;
    unit.files["args.json"] = arguments.dump();
    unit.files["runner.py"] = fmt::format(R"(import json
import sys

sys.setrecursionlimit(100000)


def _grader_encode(value):
    if isinstance(value, (set, frozenset)):
        return sorted(value, key=repr)
    if hasattr(value, "__dict__"):
        return value.__dict__
    return str(value)


with open("args.json") as _f:
    _args = json.load(_f)

import solution as _solution

_target = {0}
if _target is None:
    sys.stderr.write("{1} {2}\n")
    sys.exit(3)
_result = _target(*_args)
print("{3} " + json.dumps(_result, default=_grader_encode), flush=True)
)",
                                          target, ENTRY_NOT_FOUND_MARKER, entry.name, RESULT_MARKER);
    unit.command = {"python3", "-B", "runner.py"};
    return unit;
}

}  // namespace grader
