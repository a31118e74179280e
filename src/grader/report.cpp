#include "grader/report.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <set>
#include "common/utils.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;

static void add_distribution(score_distribution &distribution, double score) {
    if (score >= 0.8)
        ++distribution.excellent;
    else if (score >= 0.6)
        ++distribution.good;
    else if (score >= 0.4)
        ++distribution.average;
    else
        ++distribution.poor;
}

test_report build_test_report(const assessment &test, const vector<analysis_record> &records) {
    test_report report;
    report.test_id = test.test_id;
    report.title = test.title;
    report.solution_count = records.size();
    report.generated_at = current_timestamp();

    set<string> candidates;
    double total = 0;
    map<dimension, pair<double, size_t>> dimension_totals;
    double ai_total = 0;
    size_t ai_count = 0;
    for (auto &record : records) {
        candidates.insert(record.candidate_id);
        total += record.composite;
        add_distribution(report.distribution, record.composite);
        for (auto &[dim, score] : record.scores) {
            auto &[sum, count] = dimension_totals[dim];
            if (score) {
                sum += *score;
                ++count;
            }
        }
        if (record.ai_probability) {
            ai_total += *record.ai_probability;
            ++ai_count;
        }
    }

    report.candidate_count = candidates.size();
    report.average_score = records.empty() ? 0 : total / records.size();
    for (dimension dim : COMPOSITE_DIMENSIONS) {
        auto &[sum, count] = dimension_totals[dim];
        report.dimension_averages[dim] = count ? optional<double>(sum / count) : nullopt;
    }
    if (ai_count) report.average_ai_probability = ai_total / ai_count;
    report.rankings = rank_records(records);
    return report;
}

static const char *strength_message(dimension dim) {
    switch (dim) {
        case dimension::CORRECTNESS: return "Strong problem-solving skills with high correctness";
        case dimension::QUALITY: return "Excellent code quality and maintainability";
        case dimension::STYLE: return "Good coding style and adherence to conventions";
        case dimension::PERFORMANCE: return "Efficient code with good performance characteristics";
        case dimension::NAMING: return "Clear and consistent identifier naming";
        default: return "";
    }
}

static const char *improvement_message(dimension dim) {
    switch (dim) {
        case dimension::CORRECTNESS: return "Needs improvement in solution correctness";
        case dimension::QUALITY: return "Code quality and maintainability could be improved";
        case dimension::STYLE: return "Should focus on improving coding style and conventions";
        case dimension::PERFORMANCE: return "Code efficiency and performance need attention";
        case dimension::NAMING: return "Identifier names should follow the language conventions";
        default: return "";
    }
}

static question_report build_question_report(const question_analysis &question) {
    question_report report;
    report.question_id = question.question_id;
    report.language = question.language;
    report.scores = question.scores;
    report.reasons = question.reasons;

    auto detail = [&](dimension dim, const char *key) {
        auto it = question.details.find(dim);
        if (it == question.details.end() || !it->second.is_object() || !it->second.count(key))
            return json::array();
        return it->second.at(key);
    };
    report.style_issues = detail(dimension::STYLE, "issues");
    report.suggestions = detail(dimension::PERFORMANCE, "suggestions");
    report.flagged_patterns = detail(dimension::AI_DETECTION, "flagged_patterns");
    return report;
}

solution_report build_solution_report(const analysis_record &record, const vector<ranking_entry> &rankings) {
    solution_report report;
    report.solution_id = record.solution_id;
    report.test_id = record.test_id;
    report.candidate_id = record.candidate_id;
    report.composite = record.composite;
    report.coding_score = record.coding_score;
    report.mcq_score = record.mcq_score;
    report.scores = record.scores;
    report.ai_probability = record.ai_probability;
    report.generated_at = current_timestamp();

    for (auto &question : record.questions)
        report.questions.push_back(build_question_report(question));

    for (dimension dim : COMPOSITE_DIMENSIONS) {
        auto it = record.scores.find(dim);
        if (it == record.scores.end() || !it->second) continue;
        if (*it->second >= STRENGTH_THRESHOLD) report.strengths.push_back(strength_message(dim));
        if (*it->second < IMPROVEMENT_THRESHOLD) report.areas_for_improvement.push_back(improvement_message(dim));
    }
    if (record.mcq_score) {
        if (*record.mcq_score >= STRENGTH_THRESHOLD)
            report.strengths.push_back("Strong knowledge base demonstrated in multiple-choice questions");
        if (*record.mcq_score < IMPROVEMENT_THRESHOLD)
            report.areas_for_improvement.push_back("Knowledge gaps identified in multiple-choice questions");
    }

    // 去重并保持出现顺序
    set<string> seen;
    auto recommend = [&](const string &message) {
        if (seen.insert(message).second) report.recommendations.push_back(message);
    };
    for (auto &question : report.questions)
        for (auto &suggestion : question.suggestions)
            if (suggestion.is_string()) recommend(suggestion.get<string>());
    for (auto &question : record.questions) {
        auto it = question.scores.find(dimension::CORRECTNESS);
        if (it != question.scores.end() && it->second && *it->second < 1)
            recommend(fmt::format("Review failed test cases for question {}", question.question_id));
    }
    if (record.ai_probability && *record.ai_probability > 0.7)
        recommend("Candidate should demonstrate more original work in coding solutions");

    report.ranked_count = rankings.size();
    for (auto &entry : rankings)
        if (entry.solution_id == record.solution_id) report.rank = entry.rank;
    return report;
}

static json optional_json(const optional<double> &value) {
    return value ? json(*value) : json();
}

void to_json(json &j, const score_distribution &value) {
    j = {{"excellent", value.excellent}, {"good", value.good}, {"average", value.average}, {"poor", value.poor}};
}

void to_json(json &j, const test_report &value) {
    j = {{"test_id", value.test_id},
         {"title", value.title},
         {"candidate_count", value.candidate_count},
         {"solution_count", value.solution_count},
         {"average_score", value.average_score},
         {"score_distribution", value.distribution},
         {"dimension_averages", value.dimension_averages},
         {"average_ai_probability", optional_json(value.average_ai_probability)},
         {"rankings", value.rankings},
         {"generated_at", value.generated_at}};
}

void to_json(json &j, const question_report &value) {
    json reasons = json::object();
    for (auto &[dim, reason] : value.reasons) reasons[get_dimension_name(dim)] = reason;
    j = {{"question_id", value.question_id},
         {"language", value.language},
         {"scores", value.scores},
         {"reasons", reasons},
         {"style_issues", value.style_issues},
         {"suggestions", value.suggestions},
         {"flagged_patterns", value.flagged_patterns}};
}

void to_json(json &j, const solution_report &value) {
    j = {{"solution_id", value.solution_id},
         {"test_id", value.test_id},
         {"candidate_id", value.candidate_id},
         {"composite", value.composite},
         {"coding_score", optional_json(value.coding_score)},
         {"mcq_score", optional_json(value.mcq_score)},
         {"scores", value.scores},
         {"ai_probability", optional_json(value.ai_probability)},
         {"questions", value.questions},
         {"strengths", value.strengths},
         {"areas_for_improvement", value.areas_for_improvement},
         {"recommendations", value.recommendations},
         {"rank", value.rank ? json(*value.rank) : json()},
         {"ranked_count", value.ranked_count},
         {"generated_at", value.generated_at}};
}

}  // namespace grader
