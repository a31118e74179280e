#include "analyzer/performance.hpp"
#include <fmt/format.h>
#include <boost/algorithm/string.hpp>
#include <boost/assign.hpp>
#include <algorithm>
#include <map>
#include <regex>

namespace grader {
using namespace std;
using namespace nlohmann;

static const map<complexity_class, const char *> complexity_names = boost::assign::map_list_of
    (complexity_class::CONSTANT, "O(1)")
    (complexity_class::LOGARITHMIC, "O(log n)")
    (complexity_class::LINEAR, "O(n)")
    (complexity_class::LINEARITHMIC, "O(n log n)")
    (complexity_class::QUADRATIC, "O(n^2)")
    (complexity_class::CUBIC, "O(n^3)")
    (complexity_class::EXPONENTIAL, "O(2^n)")
    (complexity_class::FACTORIAL, "O(n!)");

const char *get_complexity_name(complexity_class value) {
    return complexity_names.at(value);
}

complexity_class parse_complexity(const string &text) {
    string s = boost::algorithm::to_lower_copy(text);
    boost::algorithm::erase_all(s, " ");
    boost::algorithm::erase_all(s, "\t");
    boost::algorithm::replace_all(s, "**", "^");
    boost::algorithm::replace_all(s, "*", "");
    boost::algorithm::replace_all(s, "log(n)", "logn");
    boost::algorithm::replace_all(s, "lgn", "logn");

    static const map<string, complexity_class> aliases = boost::assign::map_list_of
        ("o(1)", complexity_class::CONSTANT)
        ("o(logn)", complexity_class::LOGARITHMIC)
        ("o(n)", complexity_class::LINEAR)
        ("o(nlogn)", complexity_class::LINEARITHMIC)
        ("o(n^2)", complexity_class::QUADRATIC)
        ("o(n2)", complexity_class::QUADRATIC)
        ("o(nn)", complexity_class::QUADRATIC)
        ("o(n^3)", complexity_class::CUBIC)
        ("o(n3)", complexity_class::CUBIC)
        ("o(2^n)", complexity_class::EXPONENTIAL)
        ("o(n!)", complexity_class::FACTORIAL);
    auto it = aliases.find(s);
    return it == aliases.end() ? complexity_class::LINEAR : it->second;
}

double complexity_score(complexity_class estimated, complexity_class expected) {
    int gap = (int)estimated - (int)expected;
    if (gap <= 0) return 1;
    return max(0.0, 1 - 0.25 * gap);
}

namespace {

/**
 * @brief 运行次数的量级 n^linear * (log n)^logarithmic
 */
struct cost {
    int linear = 0;
    int logarithmic = 0;

    cost operator+(const cost &other) const {
        return {linear + other.linear, logarithmic + other.logarithmic};
    }

    bool operator<(const cost &other) const {
        return tie(linear, logarithmic) < tie(other.linear, other.logarithmic);
    }

    complexity_class to_class() const {
        if (linear == 0) return logarithmic == 0 ? complexity_class::CONSTANT : complexity_class::LOGARITHMIC;
        if (linear == 1) return logarithmic == 0 ? complexity_class::LINEAR : complexity_class::LINEARITHMIC;
        if (linear == 2) return complexity_class::QUADRATIC;
        return complexity_class::CUBIC;
    }
};

struct loop_block {
    size_t begin = 0;
    size_t end = 0;
    bool halving = false;
};

}  // namespace

static const regex halving_regex(
    R"(//=\s*2\b|/=\s*2\b|\*=\s*2\b|>>=\s*1\b|<<=\s*1\b|\bmid\b|\bmiddle\b|=\s*\w+\s*(?://|/|\*)\s*2\b|=\s*\w+\s*(?:>>|<<)\s*1\b)");

static regex call_regex_for(const string &name) {
    return regex("\\b" + boost::algorithm::replace_all_copy(name, "$", "\\$") + "\\s*\\(");
}

static vector<loop_block> find_loops(const code_structure &structure) {
    static const regex python_loop_regex(R"(^\s*(?:async\s+)?(for|while)\b)");
    static const regex c_loop_regex(R"(\b(?:for|while)\s*\(|\bdo\s*\{|\.(?:forEach|map|filter|reduce|some|every|flatMap)\s*\()");
    static const regex do_while_tail_regex(R"(^\s*\}\s*while\s*\(.*\)\s*;\s*$)");

    vector<loop_block> loops;
    for (size_t i = 0; i < structure.lines.size(); ++i) {
        const string &code = structure.lines[i].code;
        bool is_loop = structure.lang == language::PYTHON
                           ? regex_search(code, python_loop_regex)
                           : regex_search(code, c_loop_regex) && !regex_search(code, do_while_tail_regex);
        if (is_loop) loops.push_back({i, structure.block_end(i), false});
    }

    // 只看直接属于该循环的行，内层循环的二分不影响外层循环
    for (size_t l = 0; l < loops.size(); ++l) {
        auto &loop = loops[l];
        for (size_t j = loop.begin; j < loop.end && !loop.halving; ++j) {
            size_t innermost = l;
            for (size_t k = 0; k < loops.size(); ++k)
                if (loops[k].begin <= j && j < loops[k].end && loops[k].begin > loops[innermost].begin) innermost = k;
            if (innermost == l && regex_search(structure.lines[j].code, halving_regex)) loop.halving = true;
        }
    }
    return loops;
}

static size_t count_self_calls(const code_structure &structure, const function_span &function) {
    regex call_regex = call_regex_for(function.name);
    size_t calls = 0;
    for (size_t j = function.line; j < function.end; ++j) {
        string code = structure.lines[j].code;
        if (j == function.line) {
            // 函数头本身不算调用，只统计同一行函数体中的调用
            size_t body = structure.lang == language::PYTHON ? code.rfind(':') : code.find('{');
            code = body == string::npos ? "" : code.substr(body + 1);
        }
        calls += distance(sregex_iterator(code.begin(), code.end(), call_regex), sregex_iterator());
    }
    return calls;
}

complexity_estimate estimate_complexity(const code_structure &structure) {
    static const regex sort_regex(R"(\.sort\s*\(|\bsorted\s*\(|\bsort\s*\(|\.sorted\s*\()");
    static const regex linear_call_regex(R"(\.(?:index|count|includes|indexOf|lastIndexOf)\s*\()");
    static const regex comprehension_for_regex(R"(\bfor\b)");
    static const regex permutation_regex(R"(\bpermutations\s*\(|\bnext_permutation\s*\()");
    static const regex memo_regex(R"(@(?:functools\.)?(?:lru_cache|cache)\b|\bmemo\w*|\bcache\w*|\bdp\b)");
    static const regex grid_regex(R"(\[\s*\[|vector\s*<\s*vector|new\s+\w+\s*\[[^\]]*\]\s*\[|\w\s*\[[^\]]+\]\s*\[[^\]]+\]\s*;|new\s+Array\([^)]*\)[^;]*new\s+Array)");
    static const regex growth_regex(R"(\.(?:append|push|push_back|emplace_back|add|put|insert|extend|unshift)\s*\(|\+=\s*\[)");
    static const regex allocation_regex(
        R"(\[[^\]]*\]\s*\*\s*\w+|\bnew\s+\w+\s*\[\s*\w|\bnew\s+Array\s*\(\s*\w|vector\s*<[^;]*>\s*\w*\s*\(\s*\w|\b(?:list|dict|set)\s*\(|\[\s*:\s*\]|\.slice\s*\(|\.copy\s*\(|\bsorted\s*\(|\.split\s*\(|\.toCharArray\s*\(|Arrays\.copyOf|\[[^\]]*\bfor\b)");

    complexity_estimate estimate;
    auto loops = find_loops(structure);
    string source = structure.code_between(0, structure.lines.size());
    estimate.memoized = regex_search(source, memo_regex);

    cost worst;
    bool grows_in_loop = false;
    for (size_t j = 0; j < structure.lines.size(); ++j) {
        const string &code = structure.lines[j].code;
        cost here;
        size_t depth = 0;
        for (auto &loop : loops) {
            if (loop.begin <= j && j < loop.end) {
                here = here + (loop.halving ? cost{0, 1} : cost{1, 0});
                ++depth;
            }
        }

        if (structure.lang == language::PYTHON) {
            // 列表推导式中的每个 for 都是一层循环，for 语句本身已经计入
            size_t fors = distance(sregex_iterator(code.begin(), code.end(), comprehension_for_regex), sregex_iterator());
            bool statement = boost::algorithm::starts_with(boost::algorithm::trim_left_copy(code), "for");
            size_t extra = fors - (statement && fors > 0 ? 1 : 0);
            here = here + cost{(int)extra, 0};
            depth += extra;
        }

        cost line_cost = here;
        if (regex_search(code, sort_regex)) {
            line_cost = max(line_cost, here + cost{1, 1});
            if (depth > 0) estimate.sorts_in_loop = true;
        }
        if (depth > 0 && regex_search(code, linear_call_regex)) line_cost = max(line_cost, here + cost{1, 0});
        if (depth > 0 && regex_search(code, growth_regex)) grows_in_loop = true;

        worst = max(worst, line_cost);
        estimate.loop_depth = max(estimate.loop_depth, depth);
    }
    estimate.time = worst.to_class();

    complexity_class recursion_space = complexity_class::CONSTANT;
    for (auto &function : structure.functions) {
        size_t calls = count_self_calls(structure, function);
        if (calls == 0) continue;
        string body = structure.code_between(function.line, function.end);
        static const regex half_argument_regex(R"((?://|/)\s*2\b|>>\s*1\b)");
        bool halving = regex_search(body, halving_regex) || regex_search(body, half_argument_regex);
        regex call_regex = call_regex_for(function.name);
        bool call_in_loop = false;
        for (auto &loop : loops)
            if (function.line < loop.begin && loop.end <= function.end &&
                regex_search(structure.code_between(loop.begin, loop.end), call_regex))
                call_in_loop = true;

        complexity_class time;
        if ((calls >= 2 || call_in_loop) && !estimate.memoized) {
            time = halving && !call_in_loop ? complexity_class::LINEARITHMIC : complexity_class::EXPONENTIAL;
            if (time == complexity_class::EXPONENTIAL) estimate.exponential_recursion = true;
        } else {
            time = halving ? complexity_class::LOGARITHMIC : complexity_class::LINEAR;
        }
        estimate.time = max(estimate.time, time);
        recursion_space = max(recursion_space, halving ? complexity_class::LOGARITHMIC : complexity_class::LINEAR);
    }
    if (regex_search(source, permutation_regex)) estimate.time = complexity_class::FACTORIAL;

    if (regex_search(source, grid_regex))
        estimate.space = complexity_class::QUADRATIC;
    else if (grows_in_loop || regex_search(source, allocation_regex))
        estimate.space = complexity_class::LINEAR;
    estimate.space = max(estimate.space, recursion_space);
    return estimate;
}

dimension performance_analyzer::type() const {
    return dimension::PERFORMANCE;
}

analyzer_result performance_analyzer::analyze(const analysis_context &context) const {
    analyzer_result result;
    result.type = dimension::PERFORMANCE;

    code_structure structure = analyze_structure(context.answer.code, context.harness.type());
    if (structure.code_line_count() == 0) {
        result.reason = "Source code is empty";
        return result;
    }

    auto estimate = estimate_complexity(structure);
    auto expected_time = parse_complexity(context.question.time_complexity);
    auto expected_space = parse_complexity(context.question.space_complexity);
    double time_score = complexity_score(estimate.time, expected_time);
    double space_score = complexity_score(estimate.space, expected_space);

    vector<string> suggestions;
    if (estimate.loop_depth >= 2)
        suggestions.push_back(fmt::format("Loops nested {} levels deep; consider a hash map or a single pass", estimate.loop_depth));
    if (estimate.sorts_in_loop)
        suggestions.push_back("Sorting inside a loop; sort once before the loop");
    if (estimate.exponential_recursion)
        suggestions.push_back("Recursive calls branch without caching; use memoization or dynamic programming");
    if (estimate.time > expected_time)
        suggestions.push_back(fmt::format("Estimated time complexity {} exceeds the expected {}",
                                          get_complexity_name(estimate.time), get_complexity_name(expected_time)));
    if (estimate.space > expected_space)
        suggestions.push_back(fmt::format("Estimated space complexity {} exceeds the expected {}",
                                          get_complexity_name(estimate.space), get_complexity_name(expected_space)));
    size_t timeouts = count_if(context.executions.begin(), context.executions.end(),
                               [](auto &e) { return e.result == status::TIME_LIMIT_EXCEEDED; });
    if (timeouts > 0)
        suggestions.push_back(fmt::format("{} test cases exceeded the time limit", timeouts));

    result.score = (time_score + space_score) / 2;
    result.details = {{"time_complexity", get_complexity_name(estimate.time)},
                      {"space_complexity", get_complexity_name(estimate.space)},
                      {"expected_time_complexity", get_complexity_name(expected_time)},
                      {"expected_space_complexity", get_complexity_name(expected_space)},
                      {"time_score", time_score},
                      {"space_score", space_score},
                      {"loop_depth", estimate.loop_depth},
                      {"suggestions", suggestions}};
    if (time_score < 1 || space_score < 1)
        result.reason = fmt::format("Estimated {} time and {} space", get_complexity_name(estimate.time),
                                    get_complexity_name(estimate.space));
    return result;
}

}  // namespace grader
