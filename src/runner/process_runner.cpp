#include "runner/process_runner.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <poll.h>
#include <signal.h>
#include <string.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <map>
#include <mutex>
#include <stdexcept>
#include <system_error>
#include <thread>
#include "common/bounded_buffer.hpp"
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace runbox {
using namespace std;
namespace fs = std::filesystem;

// 管道的读端和写端
#define PIPE_OUT 0
#define PIPE_IN 1

static const size_t BUF_SIZE = 65536;

// poll 的最长等待时间，决定了检查取消标志的频率
static const chrono::milliseconds POLL_SLICE(20);

bool process_result::succeeded() const {
    return kind == outcome::EXITED && exit_code == 0;
}

string process_result::describe() const {
    switch (kind) {
        case outcome::EXITED:
            return fmt::format("exit code {}", exit_code);
        case outcome::SIGNALED:
            return fmt::format("killed by signal {} ({})", signal, strsignal(signal));
        case outcome::TIMED_OUT:
            return fmt::format("time limit exceeded after {} ms", duration_ms);
        case outcome::CANCELLED:
            return "cancelled";
        case outcome::SPAWN_FAILED:
        default:
            return error;
    }
}

static void close_fd(int &fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

static void make_pipe(int fds[2]) {
    if (pipe2(fds, O_CLOEXEC) != 0)
        throw spawn_error(fmt::format("unable to create pipe: {}", strerror(errno)));
}

static void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL);
    if (flags == -1 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1)
        throw system_error(errno, system_category(), "fcntl, setting O_NONBLOCK");
}

/**
 * 以下函数只在 fork 出的子进程中调用，只能使用 async-signal-safe 的系统调用，
 * 不能分配内存或抛出异常。任何失败都通过错误管道把 errno 报告给父进程。
 */
[[noreturn]] static void child_fail(int error_fd, int err) {
    ssize_t r = write(error_fd, &err, sizeof(err));
    (void) r;
    _exit(127);
}

static bool child_set_rlimit(int resource, rlim_t value) {
    struct rlimit lim;
    lim.rlim_cur = value;
    lim.rlim_max = value;
    return setrlimit(resource, &lim) == 0;
}

static bool child_redirect(int fd, int target) {
    if (fd == target)  // dup2 不会清除 close-on-exec 标志
        return fcntl(target, F_SETFD, 0) == 0;
    return dup2(fd, target) >= 0;
}

static map<string, string> build_environment(const process_options &options) {
    map<string, string> env;
    env["PATH"] = get_env("PATH", "/usr/local/bin:/usr/bin:/bin");
    env["HOME"] = get_env("HOME", options.work_dir.string());
    env["LANG"] = get_env("LANG", "C.UTF-8");
    for (auto &entry : options.env) {
        auto idx = entry.find('=');
        if (idx == string::npos) continue;
        env[entry.substr(0, idx)] = entry.substr(idx + 1);
    }
    return env;
}

process_runner::process_runner() {
    // 向已经退出的子进程写入标准输入时不能让引擎收到 SIGPIPE
    static once_flag flag;
    call_once(flag, [] { signal(SIGPIPE, SIG_IGN); });
}

string process_runner::resolve_executable(const process_options &options) const {
    const string &cmd = options.command[0];
    if (cmd.find('/') != string::npos) {
        fs::path path(cmd);
        if (path.is_relative()) path = options.work_dir / path;
        return which(path.string());
    }
    return which(cmd);
}

process_result process_runner::run(const process_options &options, const atomic<bool> *cancelled) const {
    if (options.command.empty())
        throw invalid_argument("process command is empty");

    process_result result;
    elapsed_time timer;

    string executable = resolve_executable(options);
    if (executable.empty()) {
        result.kind = process_result::outcome::SPAWN_FAILED;
        result.error = fmt::format("unable to start {}: command not found", options.command[0]);
        LOG(WARNING) << result.error;
        return result;
    }

    // 子进程中不能分配内存，argv 和 envp 必须在 fork 之前准备好
    vector<string> args = options.command;
    vector<char *> argv;
    for (auto &arg : args) argv.push_back(arg.data());
    argv.push_back(nullptr);

    vector<string> env_strings;
    for (auto &[key, value] : build_environment(options))
        env_strings.push_back(key + "=" + value);
    vector<char *> envp;
    for (auto &entry : env_strings) envp.push_back(entry.data());
    envp.push_back(nullptr);

    string work_dir = options.work_dir.string();

    int stdin_pipe[2] = {-1, -1}, stdout_pipe[2] = {-1, -1}, stderr_pipe[2] = {-1, -1}, error_pipe[2] = {-1, -1};
    defer {
        for (int *p : {stdin_pipe, stdout_pipe, stderr_pipe, error_pipe}) {
            close_fd(p[PIPE_OUT]);
            close_fd(p[PIPE_IN]);
        }
    };
    make_pipe(stdin_pipe);
    make_pipe(stdout_pipe);
    make_pipe(stderr_pipe);
    make_pipe(error_pipe);

    pid_t child_pid = fork();
    if (child_pid < 0)
        throw spawn_error(fmt::format("unable to fork: {}", strerror(errno)));

    if (child_pid == 0) {  // child process, run the command
        int error_fd = error_pipe[PIPE_IN];

        sigset_t emptymask;
        sigemptyset(&emptymask);
        sigprocmask(SIG_SETMASK, &emptymask, nullptr);
        signal(SIGPIPE, SIG_DFL);

        // 在独立的进程组中运行，这样一个信号就能杀死整个进程树
        if (setsid() == -1) child_fail(error_fd, errno);
        if (chdir(work_dir.c_str()) != 0) child_fail(error_fd, errno);

        if (!child_set_rlimit(RLIMIT_CORE, 0)) child_fail(error_fd, errno);
        if (options.memory_limit > 0 && !child_set_rlimit(RLIMIT_AS, options.memory_limit))
            child_fail(error_fd, errno);
        if (options.file_size_limit > 0 && !child_set_rlimit(RLIMIT_FSIZE, options.file_size_limit))
            child_fail(error_fd, errno);

        if (!child_redirect(stdin_pipe[PIPE_OUT], STDIN_FILENO) ||
            !child_redirect(stdout_pipe[PIPE_IN], STDOUT_FILENO) ||
            !child_redirect(stderr_pipe[PIPE_IN], STDERR_FILENO))
            child_fail(error_fd, errno);

        execve(executable.c_str(), argv.data(), envp.data());
        child_fail(error_fd, errno);
    }

    // watchdog
    close_fd(stdin_pipe[PIPE_OUT]);
    close_fd(stdout_pipe[PIPE_IN]);
    close_fd(stderr_pipe[PIPE_IN]);
    close_fd(error_pipe[PIPE_IN]);

    int wstatus = 0;
    bool exited = false;
    defer {
        // 异常退出时也不能遗留子进程
        if (!exited) {
            kill(-child_pid, SIGKILL);
            waitpid(child_pid, nullptr, 0);
        }
    };

    auto reap = [&](int flags) {
        pid_t pid;
        do {
            pid = waitpid(child_pid, &wstatus, flags);
        } while (pid < 0 && errno == EINTR);
        if (pid < 0) throw system_error(errno, system_category(), "waiting on child");
        if (pid == child_pid) exited = true;
    };

    {
        // 若 execve 成功，错误管道因为 close-on-exec 被关闭，read 返回 0
        int err = 0;
        ssize_t n;
        do {
            n = read(error_pipe[PIPE_OUT], &err, sizeof(err));
        } while (n < 0 && errno == EINTR);
        if (n == sizeof(err)) {
            reap(0);
            result.kind = process_result::outcome::SPAWN_FAILED;
            result.error = fmt::format("unable to start {}: {}", options.command[0], strerror(err));
            result.duration_ms = timer.milliseconds();
            LOG(WARNING) << result.error;
            return result;
        }
    }

    int &input_fd = stdin_pipe[PIPE_IN];
    int &stdout_fd = stdout_pipe[PIPE_OUT];
    int &stderr_fd = stderr_pipe[PIPE_OUT];
    set_nonblocking(input_fd);
    set_nonblocking(stdout_fd);
    set_nonblocking(stderr_fd);

    size_t input_written = 0;
    if (options.input.empty()) close_fd(input_fd);

    bounded_buffer stdout_buffer(options.max_output_bytes), stderr_buffer(options.max_output_bytes);
    char buf[BUF_SIZE];

    auto pump = [&](int &fd, bounded_buffer &buffer) {
        ssize_t n = read(fd, buf, BUF_SIZE);
        if (n > 0) {
            // 超过上限的数据仍然读出并丢弃，子进程不会因为管道写满而阻塞
            buffer.append(buf, n);
        } else if (n == 0 || (errno != EAGAIN && errno != EINTR)) {
            close_fd(fd);
        }
    };

    auto feed = [&]() {
        size_t remaining = options.input.size() - input_written;
        ssize_t n = write(input_fd, options.input.data() + input_written, min(remaining, BUF_SIZE));
        if (n > 0) {
            input_written += n;
            if (input_written == options.input.size()) close_fd(input_fd);
        } else if (n < 0 && errno != EAGAIN && errno != EINTR) {
            // EPIPE: 子进程没有读取标准输入就关闭了它
            close_fd(input_fd);
        }
    };

    bool timed_out = false, was_cancelled = false, group_killed = false;
    auto deadline = chrono::steady_clock::now() + options.timeout;
    chrono::steady_clock::time_point drain_deadline;

    auto terminate = [&]() {
        // 先尝试 SIGTERM，再强制 SIGKILL，已经退出的进程不视为错误
        LOG(INFO) << "sending SIGTERM to process group " << child_pid;
        if (kill(-child_pid, SIGTERM) != 0 && errno != ESRCH)
            LOG(WARNING) << "unable to send SIGTERM to process group " << child_pid << ": " << strerror(errno);

        this_thread::sleep_for(options.kill_delay);

        LOG(INFO) << "sending SIGKILL to process group " << child_pid;
        if (kill(-child_pid, SIGKILL) != 0 && errno != ESRCH)
            LOG(WARNING) << "unable to send SIGKILL to process group " << child_pid << ": " << strerror(errno);

        reap(0);
    };

    while (true) {
        if (!exited) reap(WNOHANG);

        auto now = chrono::steady_clock::now();
        if (exited && !group_killed) {
            // 主进程已经退出，杀死仍在进程组中的后代进程
            if (kill(-child_pid, SIGKILL) != 0 && errno != ESRCH)
                LOG(WARNING) << "unable to kill process group " << child_pid << ": " << strerror(errno);
            group_killed = true;
            drain_deadline = now + options.kill_delay;
        }

        if (exited) {
            if (stdout_fd < 0 && stderr_fd < 0) break;
            if (now >= drain_deadline) {
                // 脱离了进程组的后代进程仍然持有管道
                LOG(WARNING) << "output pipes of process " << child_pid << " still open after exit, giving up";
                break;
            }
        } else if (cancelled && cancelled->load()) {
            was_cancelled = true;
            terminate();
            continue;
        } else if (now >= deadline) {
            LOG(WARNING) << "timelimit exceeded (hard wall time): aborting command " << options.command[0];
            timed_out = true;
            terminate();
            continue;
        }

        vector<struct pollfd> fds;
        if (input_fd >= 0) fds.push_back({input_fd, POLLOUT, 0});
        if (stdout_fd >= 0) fds.push_back({stdout_fd, POLLIN, 0});
        if (stderr_fd >= 0) fds.push_back({stderr_fd, POLLIN, 0});

        auto wait = POLL_SLICE;
        if (!exited)
            wait = min(wait, chrono::duration_cast<chrono::milliseconds>(deadline - now) + chrono::milliseconds(1));

        int r = poll(fds.data(), fds.size(), (int)wait.count());
        if (r < 0) {
            if (errno == EINTR) continue;
            throw system_error(errno, system_category(), "waiting for child data");
        }

        for (auto &pfd : fds) {
            if (!pfd.revents) continue;
            if (pfd.fd == input_fd) {
                if (pfd.revents & POLLOUT)
                    feed();
                else
                    close_fd(input_fd);
            } else if (pfd.fd == stdout_fd) {
                pump(stdout_fd, stdout_buffer);
            } else if (pfd.fd == stderr_fd) {
                pump(stderr_fd, stderr_buffer);
            }
        }
    }

    result.duration_ms = timer.milliseconds();
    result.stdout_truncated = stdout_buffer.truncated();
    result.stderr_truncated = stderr_buffer.truncated();
    result.stdout_data = stdout_buffer.release();
    result.stderr_data = stderr_buffer.release();

    if (WIFEXITED(wstatus)) {
        result.exit_code = WEXITSTATUS(wstatus);
    } else if (WIFSIGNALED(wstatus)) {
        // In linux, exitcode is no larger than 127.
        result.signal = WTERMSIG(wstatus);
        result.exit_code = result.signal + 128;
    }

    if (timed_out)
        result.kind = process_result::outcome::TIMED_OUT;
    else if (was_cancelled)
        result.kind = process_result::outcome::CANCELLED;
    else if (WIFSIGNALED(wstatus))
        result.kind = process_result::outcome::SIGNALED;
    else
        result.kind = process_result::outcome::EXITED;

    LOG(INFO) << fmt::format("process {} ({}) finished in {} ms: {}", child_pid, options.command[0], result.duration_ms, result.describe());
    return result;
}

}  // namespace runbox
