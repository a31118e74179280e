#include "sandbox/strategy.hpp"
#include <glog/logging.h>
#include <unistd.h>
#include <cmath>
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

static chrono::milliseconds wall_time(const execution_limits &limits) {
    return chrono::milliseconds((int64_t)llround(limits.time_limit * 1000));
}

container_strategy::container_strategy(sandbox_options options)
    : options(move(options)) {}

string container_strategy::name() const {
    return "container";
}

bool container_strategy::isolated() const {
    return true;
}

vector<string> container_strategy::build_command(const executable_unit &unit, const fs::path &workspace,
                                                 const execution_limits &limits, const string &container_name) const {
    string lang = get_language_name(unit.lang);
    if (!options.images.count(lang))
        throw sandbox_unavailable("No container image configured for language " + lang);

    vector<string> command;
    to_string_list(command, options.container_binary, "run", "--rm", "--name", container_name);
    if (options.disable_network) to_string_list(command, "--network", "none");
    to_string_list(command, "--memory", fmt::format("{}k", limits.memory_limit),
                   "--memory-swap", fmt::format("{}k", limits.memory_limit));
    // 以当前用户运行，避免容器在工作目录中留下 root 所有的文件
    to_string_list(command, "--user", fmt::format("{}:{}", getuid(), getgid()));
    if (options.container_pids_limit > 0)
        to_string_list(command, "--pids-limit", options.container_pids_limit);
    to_string_list(command, "-v", fmt::format("{}:/app", fs::absolute(workspace).string()), "-w", "/app",
                   options.images.at(lang), unit.command);
    return command;
}

process_result container_strategy::execute(const executable_unit &unit, const fs::path &workspace,
                                           const execution_limits &limits) {
    string container_name = "grader-" + generate_uuid();
    process_options opts;
    opts.argv = build_command(unit, workspace, limits, container_name);
    opts.env = minimal_environment();
    // 容器启动需要额外时间，容器客户端本身不受内存限制
    opts.wall_time_limit = wall_time(limits);
    opts.output_limit = limits.output_limit;

    process_result result = run_process(opts);
    if (result.timed_out) {
        // 终止容器客户端并不会终止容器本身
        process_options kill_opts;
        kill_opts.env = minimal_environment();
        kill_opts.wall_time_limit = chrono::seconds(10);
        to_string_list(kill_opts.argv, options.container_binary, "kill", container_name);
        try {
            process_result killed = run_process(kill_opts);
            if (killed.exit_code != 0)
                LOG(WARNING) << "Unable to kill container " << container_name << ": " << killed.stderr_text;
        } catch (std::exception &ex) {
            LOG(WARNING) << "Unable to kill container " << container_name << ": " << ex.what();
        }
    }
    // 容器的峰值内存无法通过 wait4 得到，ru_maxrss 只反映容器客户端
    result.peak_memory = 0;
    return result;
}

string local_process_strategy::name() const {
    return "local";
}

bool local_process_strategy::isolated() const {
    return false;
}

process_options local_process_strategy::build_options(const executable_unit &unit, const fs::path &workspace,
                                                      const execution_limits &limits) const {
    process_options opts;
    opts.argv = unit.command;
    opts.working_directory = workspace;
    opts.env = minimal_environment();
    opts.env["HOME"] = workspace.string();
    opts.wall_time_limit = wall_time(limits);
    opts.memory_limit = unit.limit_address_space ? limits.memory_limit : 0;
    opts.cpu_time_limit = (int)ceil(limits.time_limit);
    opts.file_limit = limits.file_limit;
    opts.process_limit = limits.process_limit;
    opts.output_limit = limits.output_limit;
    return opts;
}

process_result local_process_strategy::execute(const executable_unit &unit, const fs::path &workspace,
                                               const execution_limits &limits) {
    return run_process(build_options(unit, workspace, limits));
}

bool probe_container_runtime(const sandbox_options &options) {
    process_options opts;
    to_string_list(opts.argv, options.container_binary, "version");
    opts.env = minimal_environment();
    opts.wall_time_limit = chrono::seconds(10);
    try {
        process_result result = run_process(opts);
        if (result.exit_code == 0) return true;
        LOG(INFO) << options.container_binary << " version exited with " << result.exit_code << ": " << result.stderr_text;
    } catch (std::exception &ex) {
        LOG(INFO) << "Unable to probe " << options.container_binary << ": " << ex.what();
    }
    return false;
}

shared_ptr<sandbox_strategy> resolve_strategy(const sandbox_options &options) {
    if (!options.force_local && probe_container_runtime(options)) {
        LOG(INFO) << "Using container sandbox via " << options.container_binary;
        return make_shared<container_strategy>(options);
    }
    LOG(WARNING) << get_kind_name(error_kind::SANDBOX_UNAVAILABLE) << ": container runtime "
                 << options.container_binary << " is not available, "
                 << "falling back to local processes with reduced isolation";
    return make_shared<local_process_strategy>();
}

}  // namespace grader
