#include "sandbox/process.hpp"
#include <fcntl.h>
#include <glog/logging.h>
#include <poll.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <system_error>
#include <thread>
#include "common/defer.hpp"
#include "common/utils.hpp"

namespace grader {
using namespace std;

// SIGTERM 与 SIGKILL 之间的间隔
static const auto kill_delay = chrono::milliseconds(100);

map<string, string> minimal_environment() {
    return {{"PATH", get_env("PATH", "/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin")},
            {"HOME", "/tmp"},
            {"LANG", "C.UTF-8"}};
}

/**
 * fork 与 exec 之间只能调用异步信号安全的函数，
 * 因此子进程中的错误通过管道把 errno 传回父进程，而不是抛出异常
 */
[[noreturn]] static void child_fail(int report_fd, int err) {
    ssize_t ignored = write(report_fd, &err, sizeof(err));
    (void)ignored;
    _exit(127);
}

static bool child_rlimit(int resource, rlim_t cur, rlim_t max) {
    struct rlimit lim;
    lim.rlim_cur = cur;
    lim.rlim_max = max;
    return setrlimit(resource, &lim) == 0;
}

static void terminate_group(pid_t pid) {
    // 先尝试让进程正常退出，再强制终止
    if (kill(-pid, SIGTERM) != 0 && errno != ESRCH)
        PLOG(WARNING) << "Unable to send SIGTERM to process group " << pid;
    this_thread::sleep_for(kill_delay);
    if (kill(-pid, SIGKILL) != 0 && errno != ESRCH)
        PLOG(WARNING) << "Unable to send SIGKILL to process group " << pid;
}

static void make_pipe(int fds[2]) {
    if (pipe2(fds, O_CLOEXEC) != 0)
        throw system_error(errno, generic_category(), "unable to create pipe");
}

process_result run_process(const process_options &options) {
    if (options.argv.empty())
        throw invalid_argument("Empty command");

    // 在 fork 之前准备好 argv 与 envp，子进程中不再分配内存
    vector<string> env_strings;
    for (auto &[key, value] : options.env)
        env_strings.push_back(key + "=" + value);
    vector<char *> argv, envp;
    for (auto &arg : options.argv) argv.push_back(const_cast<char *>(arg.c_str()));
    argv.push_back(nullptr);
    for (auto &env : env_strings) envp.push_back(const_cast<char *>(env.c_str()));
    envp.push_back(nullptr);
    string cwd = options.working_directory.string();

    int out_pipe[2], err_pipe[2], report_pipe[2];
    make_pipe(out_pipe);
    defer {
        close(out_pipe[0]);
        if (out_pipe[1] >= 0) close(out_pipe[1]);
    };
    make_pipe(err_pipe);
    defer {
        close(err_pipe[0]);
        if (err_pipe[1] >= 0) close(err_pipe[1]);
    };
    make_pipe(report_pipe);
    defer {
        close(report_pipe[0]);
        if (report_pipe[1] >= 0) close(report_pipe[1]);
    };

    elapsed_time timer;
    pid_t pid = fork();
    if (pid == -1)
        throw system_error(errno, generic_category(), "unable to fork");

    if (pid == 0) {
        // 在独立的进程组中运行，这样可以用一个信号终止命令及其所有子进程
        if (setsid() == -1) child_fail(report_pipe[1], errno);

        int devnull = open("/dev/null", O_RDONLY);
        if (devnull < 0 || dup2(devnull, STDIN_FILENO) < 0) child_fail(report_pipe[1], errno);
        if (dup2(out_pipe[1], STDOUT_FILENO) < 0) child_fail(report_pipe[1], errno);
        if (dup2(err_pipe[1], STDERR_FILENO) < 0) child_fail(report_pipe[1], errno);

        if (!cwd.empty() && chdir(cwd.c_str()) != 0) child_fail(report_pipe[1], errno);

        if (options.memory_limit > 0) {
            rlim_t bytes = (rlim_t)options.memory_limit * 1024;
            if (!child_rlimit(RLIMIT_AS, bytes, bytes)) child_fail(report_pipe[1], errno);
        }
        if (options.cpu_time_limit > 0) {
            // 软限制触发 SIGXCPU，硬限制多 1 秒触发 SIGKILL
            rlim_t seconds = options.cpu_time_limit;
            if (!child_rlimit(RLIMIT_CPU, seconds, seconds + 1)) child_fail(report_pipe[1], errno);
        }
        if (options.file_limit > 0 && !child_rlimit(RLIMIT_FSIZE, options.file_limit, options.file_limit))
            child_fail(report_pipe[1], errno);
        if (options.process_limit > 0 && !child_rlimit(RLIMIT_NPROC, options.process_limit, options.process_limit))
            child_fail(report_pipe[1], errno);
        child_rlimit(RLIMIT_CORE, 0, 0);

        signal(SIGPIPE, SIG_DFL);
        execvpe(argv[0], argv.data(), envp.data());
        child_fail(report_pipe[1], errno);
    }

    close(out_pipe[1]);
    out_pipe[1] = -1;
    close(err_pipe[1]);
    err_pipe[1] = -1;
    close(report_pipe[1]);
    report_pipe[1] = -1;

    process_result result;
    auto deadline = chrono::steady_clock::now() + options.wall_time_limit;
    struct pollfd fds[2] = {{out_pipe[0], POLLIN, 0}, {err_pipe[0], POLLIN, 0}};
    string *buffers[2] = {&result.stdout_text, &result.stderr_text};
    bool exited = false, strays_killed = false;
    int status = 0;
    struct rusage usage;
    memset(&usage, 0, sizeof(usage));
    char buffer[4096];

    while (true) {
        if (!exited && wait4(pid, &status, WNOHANG, &usage) == pid) exited = true;
        // 命令可能先关闭 stdout 和 stderr 再继续运行，因此只在进程退出后才根据管道状态结束循环
        if (exited && fds[0].fd < 0 && fds[1].fd < 0) break;
        if (exited && !strays_killed) {
            // 命令已经退出，但它留下的后台进程可能还持有管道
            kill(-pid, SIGKILL);
            strays_killed = true;
        }

        auto now = chrono::steady_clock::now();
        if (now >= deadline) {
            if (!exited) {
                result.timed_out = true;
                LOG(INFO) << "Process " << pid << " exceeded wall time limit of " << options.wall_time_limit.count() << "ms";
                terminate_group(pid);
            }
            break;
        }

        auto wait_ms = chrono::duration_cast<chrono::milliseconds>(deadline - now).count();
        int r = poll(fds, 2, (int)min<int64_t>(50, max<int64_t>(1, wait_ms)));
        if (r < 0) {
            if (errno == EINTR) continue;
            PLOG(ERROR) << "poll failed while reading output of process " << pid;
            terminate_group(pid);
            break;
        }

        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || !(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            ssize_t n = read(fds[i].fd, buffer, sizeof(buffer));
            if (n > 0) {
                size_t room = options.output_limit > buffers[i]->size() ? options.output_limit - buffers[i]->size() : 0;
                buffers[i]->append(buffer, min<size_t>(room, n));
                if ((size_t)n > room) result.output_limit_exceeded = true;
            } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                fds[i].fd = -1;
            }
        }

        if (result.output_limit_exceeded) {
            terminate_group(pid);
            break;
        }
    }

    if (!exited) {
        while (wait4(pid, &status, 0, &usage) == -1 && errno == EINTR) {}
    }
    result.wall_time = timer.duration<chrono::milliseconds>().count();
    result.peak_memory = usage.ru_maxrss;

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signal = WTERMSIG(status);
        result.exit_code = 128 + result.signal;
    }

    int exec_errno = 0;
    if (read(report_pipe[0], &exec_errno, sizeof(exec_errno)) == (ssize_t)sizeof(exec_errno)) {
        result.exit_code = 127;
        result.stderr_text += fmt::format("unable to execute {}: {}\n", options.argv[0], strerror(exec_errno));
    }
    return result;
}

}  // namespace grader
