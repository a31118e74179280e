#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>
#include <map>

namespace grader {
using namespace std;

static const map<error_kind, const char *> kind_names = {
    {error_kind::SANDBOX_UNAVAILABLE, "SandboxUnavailable"},
    {error_kind::EXECUTION_TIMEOUT, "ExecutionTimeout"},
    {error_kind::ENTRY_POINT_NOT_FOUND, "EntryPointNotFound"},
    {error_kind::ANALYZER_FAILURE, "AnalyzerFailure"},
    {error_kind::JOB_PARTIAL_FAILURE, "JobPartialFailure"},
    {error_kind::CLEANUP_ERROR, "CleanupError"},
    {error_kind::NOT_FOUND, "NotFound"},
    {error_kind::INVALID_ARGUMENT, "InvalidArgument"},
    {error_kind::INTERNAL_ERROR, "InternalError"}};

const char *get_kind_name(error_kind kind) {
    return kind_names.at(kind);
}

error_kind parse_error_kind(const string &name) {
    for (auto &[kind, kind_name] : kind_names)
        if (name == kind_name) return kind;
    return error_kind::INTERNAL_ERROR;
}

grader_exception::grader_exception()
    : grader_exception("") {}

grader_exception::grader_exception(const string &message)
    : grader_exception(error_kind::INTERNAL_ERROR, message) {}

grader_exception::grader_exception(error_kind kind, const string &message)
    : error_code(kind), message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

error_kind grader_exception::kind() const noexcept {
    return error_code;
}

const char *grader_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const grader_exception &ex) {
    os << get_kind_name(ex.kind()) << ": " << boost::diagnostic_information(ex) << endl
       << *ex.stacktrace;
    return os;
}

internal_error::internal_error()
    : grader_exception() {}

internal_error::internal_error(const string &message)
    : grader_exception(error_kind::INTERNAL_ERROR, message) {}

sandbox_unavailable::sandbox_unavailable(const string &message)
    : grader_exception(error_kind::SANDBOX_UNAVAILABLE, message) {}

execution_timeout::execution_timeout(const string &message)
    : grader_exception(error_kind::EXECUTION_TIMEOUT, message) {}

entry_point_not_found::entry_point_not_found(const string &message)
    : grader_exception(error_kind::ENTRY_POINT_NOT_FOUND, message) {}

analyzer_failure::analyzer_failure(const string &message)
    : grader_exception(error_kind::ANALYZER_FAILURE, message) {}

cleanup_error::cleanup_error(const string &message)
    : grader_exception(error_kind::CLEANUP_ERROR, message) {}

not_found_error::not_found_error(const string &message)
    : grader_exception(error_kind::NOT_FOUND, message) {}

invalid_argument_error::invalid_argument_error(const string &message)
    : grader_exception(error_kind::INVALID_ARGUMENT, message) {}

}  // namespace grader
