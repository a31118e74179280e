#include "analyzer/quality.hpp"
#include <algorithm>
#include <cmath>
#include <regex>
#include <set>

namespace grader {
using namespace std;

dimension code_quality_analyzer::type() const {
    return dimension::QUALITY;
}

/**
 * @brief 统计分支点数量
 * else if 中的 if 已经计数，因此只匹配关键字本身
 */
static size_t count_branches(const string &code, language lang) {
    static const regex python_regex(R"(\b(if|elif|for|while|except|and|or)\b)");
    static const regex c_regex(R"(\b(if|for|while|case|catch)\b|&&|\|\|)");
    // 三目运算符，排除 JavaScript 的 ?. 与 ?? 以及 Java 泛型通配符 <?>
    static const regex question_regex(R"(\?\?|\?\.|<\?|\?)");
    const regex &branch_regex = lang == language::PYTHON ? python_regex : c_regex;

    size_t count = distance(sregex_iterator(code.begin(), code.end(), branch_regex), sregex_iterator());
    if (lang != language::PYTHON)
        for (sregex_iterator it(code.begin(), code.end(), question_regex), end; it != end; ++it)
            if (it->length() == 1) ++count;
    return count;
}

/**
 * @brief Halstead 体积 V = N log2(n)，N 为记号总数，n 为不同记号的个数
 */
static double halstead_volume(const string &code) {
    static const regex token_regex(R"([A-Za-z_$]\w*|\d+(?:\.\d+)?|"[^"]*"|'[^']*'|[^\s\w])");
    size_t total = 0;
    set<string> distinct;
    for (sregex_iterator it(code.begin(), code.end(), token_regex), end; it != end; ++it) {
        ++total;
        distinct.insert(it->str());
    }
    if (total == 0) return 0;
    return total * log2(max<double>(2, distinct.size()));
}

quality_metrics measure_quality(const code_structure &structure) {
    quality_metrics metrics;
    string code;
    for (auto &line : structure.lines) {
        if (line.is_blank() || line.is_comment()) continue;
        code += line.code;
        code += '\n';
    }

    metrics.line_count = structure.lines.size();
    metrics.code_line_count = structure.code_line_count();
    metrics.function_count = structure.functions.size();
    size_t non_blank = structure.non_blank_line_count();
    metrics.comment_ratio = non_blank ? (double)structure.comment_line_count() / non_blank : 0;
    metrics.halstead_volume = halstead_volume(code);

    size_t branches = count_branches(code, structure.lang);
    size_t functions = max<size_t>(1, metrics.function_count);
    metrics.cyclomatic_complexity = 1 + (double)branches / functions;

    // 可维护性指数，注释项中的注释比例以百分比换算为弧度
    double volume = max(1.0, metrics.halstead_volume);
    double loc = max<double>(1, metrics.code_line_count);
    double comments = metrics.comment_ratio * 100 * M_PI / 180;
    double mi = 171 - 5.2 * log(volume) - 0.23 * metrics.cyclomatic_complexity - 16.2 * log(loc) +
                50 * sin(sqrt(2.4 * comments));
    metrics.maintainability_index = clamp(mi * 100 / 171, 0.0, 100.0);
    return metrics;
}

analyzer_result code_quality_analyzer::analyze(const analysis_context &context) const {
    analyzer_result result;
    result.type = dimension::QUALITY;

    code_structure structure = analyze_structure(context.answer.code, context.harness.type());
    if (structure.code_line_count() == 0) {
        result.reason = "Source code is empty";
        return result;
    }

    quality_metrics metrics = measure_quality(structure);
    result.score = metrics.maintainability_index / 100;
    result.details = {{"cyclomatic_complexity", metrics.cyclomatic_complexity},
                      {"maintainability_index", metrics.maintainability_index},
                      {"comment_ratio", metrics.comment_ratio},
                      {"halstead_volume", metrics.halstead_volume},
                      {"function_count", metrics.function_count},
                      {"line_count", metrics.line_count},
                      {"code_line_count", metrics.code_line_count}};
    return result;
}

}  // namespace grader
