#include "grader/analysis.hpp"
#include <boost/assign.hpp>
#include <algorithm>
#include <cmath>
#include "common/exceptions.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;

const vector<dimension> COMPOSITE_DIMENSIONS = {
    dimension::CORRECTNESS, dimension::QUALITY, dimension::STYLE, dimension::PERFORMANCE, dimension::NAMING};

static const map<dimension, const char *> dimension_names = boost::assign::map_list_of
    (dimension::CORRECTNESS, "correctness")
    (dimension::QUALITY, "quality")
    (dimension::STYLE, "style")
    (dimension::PERFORMANCE, "performance")
    (dimension::NAMING, "naming")
    (dimension::AI_DETECTION, "ai_detection");

const char *get_dimension_name(dimension dim) {
    return dimension_names.at(dim);
}

dimension parse_dimension(const string &name) {
    for (auto &[dim, dim_name] : dimension_names)
        if (name == dim_name) return dim;
    throw invalid_argument_error("Unknown dimension " + name);
}

double get_weight(const composite_weights &weights, dimension dim) {
    switch (dim) {
        case dimension::CORRECTNESS: return weights.correctness;
        case dimension::QUALITY: return weights.quality;
        case dimension::STYLE: return weights.style;
        case dimension::PERFORMANCE: return weights.performance;
        case dimension::NAMING: return weights.naming;
        default: return 0;
    }
}

optional<double> compute_composite(const dimension_scores &scores, const composite_weights &weights) {
    double total = 0, weight_sum = 0;
    for (dimension dim : COMPOSITE_DIMENSIONS) {
        auto it = scores.find(dim);
        if (it == scores.end() || !it->second || !isfinite(*it->second)) continue;
        double weight = get_weight(weights, dim);
        if (weight <= 0) continue;
        total += weight * clamp(*it->second, 0.0, 1.0);
        weight_sum += weight;
    }
    if (weight_sum <= 0) return nullopt;
    return clamp(total / weight_sum, 0.0, 1.0);
}

static json optional_json(const optional<double> &value) {
    return value ? json(*value) : json();
}

static optional<double> optional_from_json(const json &j, const char *key) {
    if (!j.count(key) || j.at(key).is_null()) return nullopt;
    return j.at(key).get<double>();
}

void to_json(json &j, const dimension_scores &scores) {
    j = json::object();
    for (auto &[dim, score] : scores)
        j[get_dimension_name(dim)] = optional_json(score);
}

void from_json(const json &j, dimension_scores &scores) {
    scores.clear();
    for (auto &[key, value] : j.items())
        scores[parse_dimension(key)] = value.is_null() ? optional<double>() : optional<double>(value.get<double>());
}

void to_json(json &j, const question_analysis &value) {
    json reasons = json::object(), details = json::object();
    for (auto &[dim, reason] : value.reasons) reasons[get_dimension_name(dim)] = reason;
    for (auto &[dim, detail] : value.details) details[get_dimension_name(dim)] = detail;
    j = {{"question_id", value.question_id},
         {"language", value.language},
         {"scores", value.scores},
         {"reasons", reasons},
         {"details", details},
         {"ai_probability", optional_json(value.ai_probability)},
         {"composite", optional_json(value.composite)}};
}

void from_json(const json &j, question_analysis &value) {
    j.at("question_id").get_to(value.question_id);
    j.at("language").get_to(value.language);
    j.at("scores").get_to(value.scores);
    value.reasons.clear();
    value.details.clear();
    if (j.count("reasons"))
        for (auto &[key, reason] : j.at("reasons").items())
            value.reasons[parse_dimension(key)] = reason.get<string>();
    if (j.count("details"))
        for (auto &[key, detail] : j.at("details").items())
            value.details[parse_dimension(key)] = detail;
    value.ai_probability = optional_from_json(j, "ai_probability");
    value.composite = optional_from_json(j, "composite");
}

void to_json(json &j, const analysis_record &value) {
    j = {{"schema_version", value.schema_version},
         {"solution_id", value.solution_id},
         {"test_id", value.test_id},
         {"candidate_id", value.candidate_id},
         {"submitted_at", value.submitted_at},
         {"scores", value.scores},
         {"ai_probability", optional_json(value.ai_probability)},
         {"coding_score", optional_json(value.coding_score)},
         {"mcq_score", optional_json(value.mcq_score)},
         {"composite", value.composite},
         {"questions", value.questions},
         {"analyzed_at", value.analyzed_at}};
}

void from_json(const json &j, analysis_record &value) {
    j.at("schema_version").get_to(value.schema_version);
    j.at("solution_id").get_to(value.solution_id);
    j.at("test_id").get_to(value.test_id);
    j.at("candidate_id").get_to(value.candidate_id);
    if (j.count("submitted_at")) j.at("submitted_at").get_to(value.submitted_at);
    j.at("scores").get_to(value.scores);
    value.ai_probability = optional_from_json(j, "ai_probability");
    value.coding_score = optional_from_json(j, "coding_score");
    value.mcq_score = optional_from_json(j, "mcq_score");
    j.at("composite").get_to(value.composite);
    if (j.count("questions")) j.at("questions").get_to(value.questions);
    if (j.count("analyzed_at")) j.at("analyzed_at").get_to(value.analyzed_at);
}

}  // namespace grader
