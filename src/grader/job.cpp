#include "grader/job.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;

const char *get_scope_name(job_scope scope) {
    switch (scope) {
        case job_scope::SOLUTION: return "solution";
        case job_scope::TEST: return "test";
        case job_scope::ALL: return "all";
        default: return "unknown";
    }
}

job_scope parse_scope(const string &name) {
    if (name == "solution") return job_scope::SOLUTION;
    if (name == "test") return job_scope::TEST;
    if (name == "all") return job_scope::ALL;
    throw invalid_argument_error("Unknown job scope " + name);
}

job_summary job::summary() const {
    job_summary summary;
    summary.total = items.size();
    for (auto &item : items) {
        switch (item.state) {
            case item_status::SUCCEEDED: ++summary.succeeded; break;
            case item_status::FAILED: ++summary.failed; break;
            default: ++summary.pending; break;
        }
    }
    return summary;
}

static json error_json(const optional<error_kind> &error) {
    return error ? json(get_kind_name(*error)) : json();
}

static optional<error_kind> error_from_json(const json &j) {
    if (!j.count("error_kind") || j.at("error_kind").is_null()) return nullopt;
    return parse_error_kind(j.at("error_kind").get<string>());
}

void to_json(json &j, const job_log_entry &value) {
    j = {{"timestamp", value.timestamp}, {"message", value.message}};
}

void from_json(const json &j, job_log_entry &value) {
    j.at("timestamp").get_to(value.timestamp);
    j.at("message").get_to(value.message);
}

void to_json(json &j, const job_item &value) {
    j = {{"solution_id", value.solution_id},
         {"status", get_status_name(value.state)},
         {"error_kind", error_json(value.error)},
         {"error_message", value.error_message}};
}

void from_json(const json &j, job_item &value) {
    j.at("solution_id").get_to(value.solution_id);
    value.state = parse_item_status(j.at("status").get<string>());
    value.error = error_from_json(j);
    if (j.count("error_message")) j.at("error_message").get_to(value.error_message);
}

void to_json(json &j, const job_summary &value) {
    j = {{"total", value.total}, {"succeeded", value.succeeded}, {"failed", value.failed}, {"pending", value.pending}};
}

void to_json(json &j, const job &value) {
    j = {{"job_id", value.job_id},
         {"scope", get_scope_name(value.scope)},
         {"target_id", value.target_id},
         {"status", get_status_name(value.state)},
         {"created_at", value.created_at},
         {"started_at", value.started_at},
         {"finished_at", value.finished_at},
         {"logs", value.logs},
         {"items", value.items},
         {"summary", value.summary()},
         {"error_kind", error_json(value.error)},
         {"error_message", value.error_message}};
}

void from_json(const json &j, job &value) {
    j.at("job_id").get_to(value.job_id);
    value.scope = parse_scope(j.at("scope").get<string>());
    if (j.count("target_id")) j.at("target_id").get_to(value.target_id);
    value.state = parse_job_status(j.at("status").get<string>());
    if (j.count("created_at")) j.at("created_at").get_to(value.created_at);
    if (j.count("started_at")) j.at("started_at").get_to(value.started_at);
    if (j.count("finished_at")) j.at("finished_at").get_to(value.finished_at);
    if (j.count("logs")) j.at("logs").get_to(value.logs);
    if (j.count("items")) j.at("items").get_to(value.items);
    value.error = error_from_json(j);
    if (j.count("error_message")) j.at("error_message").get_to(value.error_message);
}

}  // namespace grader
