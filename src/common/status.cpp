#include "common/status.hpp"
#include <boost/assign.hpp>
#include <map>
#include <stdexcept>

namespace grader {
using namespace std;

// clang-format off
static const map<status, const char *> status_display = boost::assign::map_list_of
    (status::ACCEPTED, "Accepted")
    (status::WRONG_ANSWER, "Wrong Answer")
    (status::RUNTIME_ERROR, "Runtime Error")
    (status::COMPILATION_ERROR, "Compilation Error")
    (status::TIME_LIMIT_EXCEEDED, "Time Limit Exceeded")
    (status::MEMORY_LIMIT_EXCEEDED, "Memory Limit Exceeded")
    (status::OUTPUT_LIMIT_EXCEEDED, "Output Limit Exceeded")
    (status::SYSTEM_ERROR, "System Error");

static const map<status, const char *> status_names = boost::assign::map_list_of
    (status::ACCEPTED, "ACCEPTED")
    (status::WRONG_ANSWER, "WRONG_ANSWER")
    (status::RUNTIME_ERROR, "RUNTIME_ERROR")
    (status::COMPILATION_ERROR, "COMPILATION_ERROR")
    (status::TIME_LIMIT_EXCEEDED, "TIME_LIMIT_EXCEEDED")
    (status::MEMORY_LIMIT_EXCEEDED, "MEMORY_LIMIT_EXCEEDED")
    (status::OUTPUT_LIMIT_EXCEEDED, "OUTPUT_LIMIT_EXCEEDED")
    (status::SYSTEM_ERROR, "SYSTEM_ERROR");

static const map<job_status, const char *> job_status_names = boost::assign::map_list_of
    (job_status::QUEUED, "QUEUED")
    (job_status::RUNNING, "RUNNING")
    (job_status::SUCCEEDED, "SUCCEEDED")
    (job_status::PARTIAL, "PARTIAL")
    (job_status::FAILED, "FAILED");

static const map<item_status, const char *> item_status_names = boost::assign::map_list_of
    (item_status::PENDING, "PENDING")
    (item_status::SUCCEEDED, "SUCCEEDED")
    (item_status::FAILED, "FAILED");
// clang-format on

template <typename EnumT>
static EnumT parse_by_name(const map<EnumT, const char *> &names, const string &name) {
    for (auto &[value, value_name] : names)
        if (name == value_name) return value;
    throw invalid_argument("Unrecognized status " + name);
}

const char *get_display_message(status stat) {
    return status_display.at(stat);
}

const char *get_status_name(status stat) {
    return status_names.at(stat);
}

const char *get_status_name(job_status stat) {
    return job_status_names.at(stat);
}

const char *get_status_name(item_status stat) {
    return item_status_names.at(stat);
}

status parse_status(const string &name) {
    return parse_by_name(status_names, name);
}

job_status parse_job_status(const string &name) {
    return parse_by_name(job_status_names, name);
}

item_status parse_item_status(const string &name) {
    return parse_by_name(item_status_names, name);
}

bool is_terminal(job_status stat) {
    return stat == job_status::SUCCEEDED || stat == job_status::PARTIAL || stat == job_status::FAILED;
}

}  // namespace grader
