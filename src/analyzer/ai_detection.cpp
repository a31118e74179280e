#include "analyzer/ai_detection.hpp"
#include <boost/algorithm/string.hpp>
#include <algorithm>
#include <regex>

namespace grader {
using namespace std;
using namespace nlohmann;

const char *const AI_DETECTION_METHOD = "heuristic-pattern";

dimension ai_detection_analyzer::type() const {
    return dimension::AI_DETECTION;
}

namespace {

enum class match_target { TEXT, CODE, COMMENTS };

struct text_signature {
    const char *name;
    match_target target;
    regex pattern;
    double weight;
};

}  // namespace

static const vector<text_signature> &text_signatures() {
    static const vector<text_signature> signatures = {
        {"docstring-sections", match_target::TEXT,
         regex(R"(\b(?:Args|Arguments|Parameters|Returns|Raises|Yields):|@param\b|@returns?\b|@throws\b)"), 0.20},
        {"example-usage-comment", match_target::COMMENTS, regex(R"(\bexamples?(?:\s+usage)?\b)", regex::icase), 0.15},
        {"main-guard", match_target::TEXT, regex(R"(if\s+__name__\s*==\s*['"]__main__['"])"), 0.10},
        {"step-comments", match_target::COMMENTS, regex(R"(\bstep\s*\d)", regex::icase), 0.15},
        {"edge-case-comments", match_target::COMMENTS, regex(R"(\bedge\s+cases?\b|\bbase\s+cases?\b)", regex::icase), 0.10},
        {"complexity-comments", match_target::COMMENTS, regex(R"(\b(?:time|space)\s+complexity\b)", regex::icase), 0.20},
        {"assistant-phrasing", match_target::COMMENTS,
         regex(R"(\b(?:here is|here's|this function|this solution|this implementation|certainly|as an ai)\b)", regex::icase), 0.25},
        {"exhaustive-validation", match_target::CODE,
         regex(R"(\braise\s+(?:ValueError|TypeError)\b|\bthrow\s+new\s+(?:IllegalArgumentException|Error|TypeError|RangeError)\b|\bthrow\s+std::invalid_argument\b|\bisinstance\s*\()"),
         0.10}};
    return signatures;
}

/**
 * @brief 每个函数都有文档注释：Python 为函数头后的文档字符串，其他语言为函数头前的注释
 */
static bool every_function_documented(const code_structure &structure) {
    if (structure.functions.size() < 2) return false;
    for (auto &function : structure.functions) {
        bool documented = false;
        if (structure.lang == language::PYTHON) {
            // 函数头可能跨多行，以冒号结尾的那一行之后才是函数体
            size_t body = function.line;
            while (body < function.end && !boost::algorithm::ends_with(boost::algorithm::trim_right_copy(structure.lines[body].code), ":"))
                ++body;
            for (size_t j = body + 1; j < function.end; ++j) {
                auto &line = structure.lines[j];
                if (line.is_blank()) continue;
                documented = line.is_comment() && !line.has_comment;
                break;
            }
        } else {
            for (size_t j = function.line; j-- > 0;) {
                auto &line = structure.lines[j];
                if (line.is_blank()) continue;
                documented = line.is_comment();
                break;
            }
        }
        if (!documented) return false;
    }
    return true;
}

/**
 * @brief Python 代码的每个函数都写了返回值类型和参数类型
 */
static bool uniform_type_hints(const code_structure &structure) {
    if (structure.lang != language::PYTHON || structure.functions.empty()) return false;
    for (auto &function : structure.functions) {
        string header = structure.code_between(function.line, min(function.end, function.line + 10));
        size_t colon = header.find("):");
        size_t arrow = header.find("->");
        if (arrow == string::npos || (colon != string::npos && colon < arrow)) return false;
        size_t open = header.find('(');
        size_t close = open == string::npos ? string::npos : find_matching(header, open);
        if (close == string::npos) return false;
        for (auto &param : split_top_level(header.substr(open + 1, close - open - 1))) {
            string name = boost::algorithm::trim_copy(param);
            if (name.empty() || name == "self" || name == "cls" || name == "/" || name == "*") continue;
            if (name.find(':') == string::npos) return false;
        }
    }
    return true;
}

vector<ai_signature> match_ai_signatures(const code_structure &structure) {
    string text, code, comments;
    for (auto &line : structure.lines) {
        text += line.text + "\n";
        code += line.code + "\n";
        if (line.has_comment)
            comments += line.comment + "\n";
        else if (line.is_comment())
            comments += line.text + "\n";
    }

    vector<ai_signature> matched;
    for (auto &signature : text_signatures()) {
        const string &target = signature.target == match_target::TEXT ? text
                               : signature.target == match_target::CODE ? code
                                                                        : comments;
        if (regex_search(target, signature.pattern)) matched.push_back({signature.name, signature.weight});
    }

    if (uniform_type_hints(structure)) matched.push_back({"uniform-type-hints", 0.10});
    if (every_function_documented(structure)) matched.push_back({"documented-every-function", 0.15});

    size_t non_blank = structure.non_blank_line_count();
    if (non_blank >= 8 && (double)structure.comment_line_count() / non_blank > 0.3)
        matched.push_back({"high-comment-density", 0.10});
    return matched;
}

analyzer_result ai_detection_analyzer::analyze(const analysis_context &context) const {
    analyzer_result result;
    result.type = dimension::AI_DETECTION;

    code_structure structure = analyze_structure(context.answer.code, context.harness.type());
    auto matched = match_ai_signatures(structure);

    double probability = 0;
    json patterns = json::array();
    for (auto &signature : matched) {
        probability += signature.weight;
        patterns.push_back(signature.name);
    }
    probability = min(1.0, probability);

    result.score = probability;
    result.details = {{"probability", probability},
                      {"detection_method", AI_DETECTION_METHOD},
                      {"flagged_patterns", patterns}};
    return result;
}

}  // namespace grader
