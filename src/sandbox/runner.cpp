#include "sandbox/runner.hpp"
#include <glog/logging.h>
#include <signal.h>
#include <boost/algorithm/string.hpp>
#include "common/defer.hpp"
#include "common/io_utils.hpp"
#include "common/stl_utils.hpp"
#include "common/utils.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

slot_pool::slot_pool(size_t capacity)
    : total(max<size_t>(1, capacity)), free_slots(total), semaphore((unsigned int)total) {}

void slot_pool::acquire() {
    semaphore.wait();
    --free_slots;
}

void slot_pool::release() {
    ++free_slots;
    semaphore.post();
}

size_t slot_pool::available() const {
    return free_slots;
}

size_t slot_pool::capacity() const {
    return total;
}

slot_guard::slot_guard(slot_pool &pool) : pool(pool) {
    pool.acquire();
}

slot_guard::~slot_guard() {
    pool.release();
}

sandbox_runner::sandbox_runner(shared_ptr<sandbox_strategy> strategy, const sandbox_options &options)
    : strategy_(move(strategy)), defaults(options.limits), pool(options.slots) {
    if (!strategy_) throw invalid_argument_error("sandbox strategy must not be null");
}

const sandbox_strategy &sandbox_runner::strategy() const {
    return *strategy_;
}

const execution_limits &sandbox_runner::default_limits() const {
    return defaults;
}

slot_pool &sandbox_runner::slots() {
    return pool;
}

static string last_line(const string &text) {
    vector<string> lines;
    boost::algorithm::split(lines, text, boost::is_any_of("\n"));
    for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
        string line = boost::algorithm::trim_copy(*it);
        if (!line.empty()) return truncate_string(line, 500);
    }
    return "";
}

static bool out_of_memory(const process_result &process, bool isolated) {
    const string &err = process.stderr_text;
    if (err.find("MemoryError") != string::npos || err.find("OutOfMemoryError") != string::npos ||
        err.find("std::bad_alloc") != string::npos || err.find("heap out of memory") != string::npos)
        return true;
    // 容器内存超限时会被 OOM killer 终止，容器客户端返回 137
    return isolated && process.signal == 0 && process.exit_code == 137;
}

void classify_result(execution_result &result, const process_result &process,
                     const optional<nlohmann::json> &actual, bool isolated) {
    result.exit_code = process.exit_code;
    result.signal = process.signal;
    result.execution_time = process.wall_time;
    result.memory_usage = process.peak_memory;
    result.stdout_text = process.stdout_text;
    result.stderr_text = process.stderr_text;
    result.passed = false;

    if (process.timed_out || process.signal == SIGXCPU) {
        result.result = status::TIME_LIMIT_EXCEEDED;
        result.error = error_kind::EXECUTION_TIMEOUT;
        result.error_message = fmt::format("Execution timed out after {}ms", process.wall_time);
    } else if (process.output_limit_exceeded) {
        result.result = status::OUTPUT_LIMIT_EXCEEDED;
        result.error_message = "Output limit exceeded";
    } else if (process.exit_code == COMPILE_FAILURE_EXIT_CODE) {
        result.result = status::COMPILATION_ERROR;
        result.error_message = truncate_string(boost::algorithm::trim_copy(process.stderr_text), 2000);
    } else if (out_of_memory(process, isolated)) {
        result.result = status::MEMORY_LIMIT_EXCEEDED;
        result.error_message = "Memory limit exceeded";
    } else if ((isolated && process.exit_code == 125) ||
               (process.exit_code == 127 && process.stderr_text.find("unable to execute") != string::npos)) {
        result.result = status::SYSTEM_ERROR;
        result.error = error_kind::SANDBOX_UNAVAILABLE;
        result.error_message = last_line(process.stderr_text);
    } else if (process.stderr_text.find(ENTRY_NOT_FOUND_MARKER) != string::npos) {
        result.result = status::RUNTIME_ERROR;
        result.error = error_kind::ENTRY_POINT_NOT_FOUND;
        result.error_message = "Entry point not found at runtime";
    } else if (process.exit_code != 0) {
        result.result = status::RUNTIME_ERROR;
        result.error_message = last_line(process.stderr_text);
        if (result.error_message.empty())
            result.error_message = fmt::format("Process exited with code {}", process.exit_code);
    } else if (!actual) {
        result.result = status::RUNTIME_ERROR;
        result.error_message = "Program finished without producing a return value";
    } else {
        result.actual_output = *actual;
        result.passed = values_equal(*actual, result.expected_output);
        result.result = result.passed ? status::ACCEPTED : status::WRONG_ANSWER;
    }
}

static void cleanup_workspace(const fs::path &workspace) {
    if (DEBUG) {
        LOG(INFO) << "Keeping workspace " << workspace << " for inspection";
        return;
    }
    try {
        string error = remove_directory(workspace);
        if (!error.empty())
            LOG(WARNING) << get_kind_name(error_kind::CLEANUP_ERROR) << ": unable to remove workspace " << workspace << ": " << error;
    } catch (std::exception &ex) {
        LOG(WARNING) << get_kind_name(error_kind::CLEANUP_ERROR) << ": unable to remove workspace " << workspace << ": " << ex.what();
    }
}

execution_result sandbox_runner::execute(const language_harness &harness, const string &source, const entry_point &entry,
                                         const test_case &testcase) {
    return execute(harness, source, entry, testcase, defaults);
}

execution_result sandbox_runner::execute(const language_harness &harness, const string &source, const entry_point &entry,
                                         const test_case &testcase, const execution_limits &limits) {
    execution_result result;
    result.test_case_id = testcase.id;
    result.weight = testcase.weight;
    result.expected_output = normalize_value(testcase.expected_output);

    executable_unit unit;
    try {
        nlohmann::json arguments = harness.bind_arguments(testcase.input, entry);
        unit = harness.build_invocation(source, entry, arguments, limits);
    } catch (grader_exception &ex) {
        result.result = status::RUNTIME_ERROR;
        result.error = ex.kind();
        result.error_message = ex.what();
        return result;
    }

    slot_guard slot(pool);
    fs::path workspace = WORK_DIR / generate_uuid();
    defer { cleanup_workspace(workspace); };

    process_result process;
    try {
        fs::create_directories(workspace);
        for (auto &[file_name, content] : unit.files)
            write_file_content(workspace / assert_safe_path(file_name), content);
        process = strategy_->execute(unit, workspace, limits);
    } catch (std::exception &ex) {
        LOG(ERROR) << "Sandbox (" << strategy_->name() << ") failed to execute test case " << testcase.id << ": " << ex.what();
        result.result = status::SYSTEM_ERROR;
        result.error = error_kind::SANDBOX_UNAVAILABLE;
        result.error_message = ex.what();
        return result;
    }

    classify_result(result, process, harness.parse_output(process.stdout_text), strategy_->isolated());
    return result;
}

}  // namespace grader
