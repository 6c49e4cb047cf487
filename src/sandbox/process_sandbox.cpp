#include "sandbox/process_sandbox.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <poll.h>
#include <pthread.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <vector>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "sandbox/bootstrap.hpp"
#include "sandbox/cgroup.hpp"
#include "sandbox/limits.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

static const char *EMPTY_CODE_MESSAGE = "SyntaxError: no code was submitted\n";
static const int POLL_SLICE_MS = 10;
static const size_t BUF_SIZE = 4096;

enum PIPE_DIRECTION { PIPE_OUT = 0,
                      PIPE_IN = 1 };

[[noreturn]] static void error(int err, const string &message) {
    throw system_error(err, system_category(), message);
}

static void close_fd(int &fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

/**
 * @brief 子进程在 exec 之前需要的所有数据
 * 全部在 fork 之前准备好，子进程中尽量不分配内存
 */
struct child_context {
    string scratch;
    string stdin_file;
    vector<string> args;
    vector<string> env;
    child_restrictions restrictions;
    int stdout_fd = -1;
    int stderr_fd = -1;
    int error_fd = -1;
    int release_fd = -1;
};

/**
 * @brief 读出的某个输出流
 */
struct captured_stream {
    int fd = -1;
    string data;
    bool overflowed = false;
};

static void write_error(int fd, const char *message) {
    size_t length = strlen(message);
    while (length > 0) {
        ssize_t written = write(fd, message, length);
        if (written < 0 && errno == EINTR) continue;
        if (written <= 0) return;  // 父进程已经关闭了管道，没有别的办法报告错误
        message += written;
        length -= written;
    }
}

/**
 * @brief 在子进程中设置隔离环境并执行解释器，永不返回
 * 失败原因写入 error_fd 后以 127 退出，父进程将其视为沙箱内部错误。
 * 子进程中不写日志。
 */
[[noreturn]] static void run_child(const child_context &ctx, const vector<char *> &argv, const vector<char *> &envp) {
    try {
        sigset_t emptymask;
        if (sigemptyset(&emptymask) != 0) error(errno, "creating empty signal mask");
        if (sigprocmask(SIG_SETMASK, &emptymask, nullptr) != 0) error(errno, "unmasking signals");

        // run the command in a separate process group,
        // so the command and all its child processes can be killed
        // off with one signal
        if (setsid() == -1) error(errno, "unable to setsid");

        int input = open(ctx.stdin_file.c_str(), O_RDONLY);
        if (input < 0) error(errno, "unable to open stdin file");
        if (dup2(input, STDIN_FILENO) < 0) error(errno, "redirecting stdin");
        if (dup2(ctx.stdout_fd, STDOUT_FILENO) < 0) error(errno, "redirecting stdout");
        if (dup2(ctx.stderr_fd, STDERR_FILENO) < 0) error(errno, "redirecting stderr");

        // 其他线程打开的文件描述符不一定带有 O_CLOEXEC
        long max_fd = min(sysconf(_SC_OPEN_MAX), 65536L);
        for (int fd = STDERR_FILENO + 1; fd < max_fd; ++fd)
            if (fd != ctx.error_fd && fd != ctx.release_fd) close(fd);

        // 等待父进程把本进程移入 cgroup，父进程放弃时管道被关闭
        char go;
        ssize_t nread;
        while ((nread = read(ctx.release_fd, &go, 1)) < 0 && errno == EINTR) {}
        if (nread != 1) _exit(127);
        close(ctx.release_fd);

        if (chdir(ctx.scratch.c_str()) != 0) error(errno, "unable to chdir to scratch directory");

        set_restrictions(ctx.restrictions);
        set_seccomp();

        execve(argv[0], argv.data(), envp.data());
        error(errno, fmt::format("unable to execute {}", ctx.args[0]));
    } catch (exception &ex) {
        write_error(ctx.error_fd, ex.what());
    }
    _exit(127);
}

/**
 * @brief 读出管道中当前所有可读的数据
 * 超过 limit 的数据被丢弃并标记 overflowed，之后不再读取这个管道
 */
static void pump_pipe(captured_stream &stream, size_t limit) {
    char buf[BUF_SIZE];
    while (stream.fd >= 0) {
        ssize_t nread = read(stream.fd, buf, BUF_SIZE);
        if (nread > 0) {
            size_t room = limit - min(limit, stream.data.size());
            stream.data.append(buf, min((size_t)nread, room));
            if ((size_t)nread > room) {
                stream.overflowed = true;
                close_fd(stream.fd);
            }
        } else if (nread == 0) {
            /* EOF detected: close fd and indicate this with -1 */
            close_fd(stream.fd);
        } else if (errno == EINTR) {
            continue;
        } else if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return;
        } else {
            error(errno, fmt::format("reading pipe {}", stream.fd));
        }
    }
}

static string read_child_error(int fd) {
    string message;
    char buf[BUF_SIZE];
    while (true) {
        ssize_t nread = read(fd, buf, BUF_SIZE);
        if (nread > 0)
            message.append(buf, nread);
        else if (nread < 0 && errno == EINTR)
            continue;
        else
            break;
    }
    return message;
}

/**
 * @brief 放行在 run_child 中等待的子进程
 * 子进程已经退出时写入得到 EPIPE，不能让 SIGPIPE 结束评测进程
 */
static void release_child(int fd) {
    sigset_t sigpipe, old;
    sigemptyset(&sigpipe);
    sigaddset(&sigpipe, SIGPIPE);
    int ret = pthread_sigmask(SIG_BLOCK, &sigpipe, &old);
    if (ret != 0) error(ret, "blocking SIGPIPE");

    char go = 1;
    ssize_t written;
    while ((written = write(fd, &go, 1)) < 0 && errno == EINTR) {}
    int err = errno;
    if (written < 0 && err == EPIPE) {
        struct timespec no_wait = {0, 0};
        sigtimedwait(&sigpipe, nullptr, &no_wait);
    }
    pthread_sigmask(SIG_SETMASK, &old, nullptr);
    // 子进程的退出状态和错误管道会说明原因
    if (written < 0 && err != EPIPE) error(err, "releasing child");
}

static void remove_scratch(const fs::path &scratch) {
    error_code ec;
    fs::remove_all(scratch, ec);
    if (ec) LOG(ERROR) << "unable to remove scratch directory " << scratch << ": " << ec.message();
}

static int64_t to_milliseconds(const struct timeval &tv) {
    return (int64_t)tv.tv_sec * 1000 + tv.tv_usec / 1000;
}

enum class kill_reason {
    NONE,
    OUTPUT_OVERFLOW,
    CANCELLED,
    TIMEOUT
};

/**
 * @brief 根据进程的结束方式判断运行结果
 * 优先级：输出超限 > 取消 > 超时 > 内存超限 > 返回值
 */
static exit_status classify(kill_reason reason, int status, const struct rusage &usage,
                            const limit_policy &policy, const sandbox_run &run, bool oom_killed) {
    switch (reason) {
        case kill_reason::OUTPUT_OVERFLOW: return exit_status::KILLED_OUTPUT_OVERFLOW;
        case kill_reason::CANCELLED: return exit_status::CANCELLED;
        case kill_reason::TIMEOUT: return exit_status::KILLED_TIMEOUT;
        case kill_reason::NONE: break;
    }

    int64_t cpu_ms = to_milliseconds(usage.ru_utime) + to_milliseconds(usage.ru_stime);
    if (WIFSIGNALED(status) && WTERMSIG(status) == SIGXCPU)
        return exit_status::KILLED_TIMEOUT;
    if (cpu_ms > policy.cpu_time_ms)
        return exit_status::KILLED_TIMEOUT;

    if (oom_killed)
        return exit_status::KILLED_MEMORY;

    if (WIFEXITED(status) && WEXITSTATUS(status) == 0)
        return exit_status::NORMAL;

    if (boost::algorithm::starts_with(last_line(run.stderr_data), "MemoryError") ||
        run.peak_memory_bytes >= policy.memory_bytes)
        return exit_status::KILLED_MEMORY;
    return exit_status::RUNTIME_ERROR;
}

static sandbox_run supervise(const string &code, const string &input, const limit_policy &policy,
                             const cancellation_token &cancellation) {
    sandbox_run run;
    string id = random_id();

    fs::create_directories(SCRATCH_DIR);
    fs::path scratch = fs::absolute(SCRATCH_DIR) / ("run-" + id);
    if (!fs::create_directory(scratch))
        throw sandbox_error(fmt::format("scratch directory {} already exists", scratch.string()));
    defer { remove_scratch(scratch); };

    write_file_content(scratch / "main.py", code);
    write_file_content(scratch / "stdin.txt", input);
    write_file_content(scratch / "bootstrap.py", make_bootstrap(scratch, policy.allowed_modules));

    if (RUN_USER_ID >= 0) {
        if (chown(scratch.c_str(), RUN_USER_ID, RUN_GROUP_ID) != 0)
            error(errno, fmt::format("unable to chown {}", scratch.string()));
    }

    string cgroup_name;
    if (USE_CGROUP) {
        cgroup_name = fmt::format("{}/run-{}", CGROUP_ROOT, id);
        cgroup_create(cgroup_name, policy.memory_bytes);
    }
    defer {
        if (cgroup_name.empty()) return;
        try {
            cgroup_kill(cgroup_name);
            cgroup_delete(cgroup_name);
        } catch (exception &ex) {
            LOG(ERROR) << "unable to delete cgroup " << cgroup_name << ": " << ex.what();
        }
    };

    int stdout_pipe[2] = {-1, -1}, stderr_pipe[2] = {-1, -1}, error_pipe[2] = {-1, -1}, release_pipe[2] = {-1, -1};
    defer {
        for (int *fds : {stdout_pipe, stderr_pipe, error_pipe, release_pipe}) {
            close_fd(fds[PIPE_OUT]);
            close_fd(fds[PIPE_IN]);
        }
    };
    for (int *fds : {stdout_pipe, stderr_pipe, error_pipe, release_pipe})
        if (pipe2(fds, O_CLOEXEC) != 0) error(errno, "creating pipe");

    child_context ctx;
    ctx.scratch = scratch.string();
    ctx.stdin_file = (scratch / "stdin.txt").string();
    ctx.args = {PYTHON_EXECUTABLE.string(), "-I", "-B", "bootstrap.py"};
    ctx.env = {"PATH=/usr/local/bin:/usr/bin:/bin",
               "HOME=" + scratch.string(),
               "TMPDIR=" + scratch.string(),
               "LANG=C.UTF-8"};
    ctx.restrictions.cpu_time_ms = policy.cpu_time_ms;
    ctx.restrictions.memory_bytes = policy.memory_bytes;
    ctx.restrictions.max_file_bytes = policy.max_file_bytes;
    ctx.restrictions.max_processes = policy.max_processes;
    ctx.restrictions.memory_in_cgroup = !cgroup_name.empty();
    ctx.restrictions.user_id = RUN_USER_ID;
    ctx.restrictions.group_id = RUN_GROUP_ID;
    ctx.restrictions.isolate_network = ISOLATE_NETWORK;
    ctx.stdout_fd = stdout_pipe[PIPE_IN];
    ctx.stderr_fd = stderr_pipe[PIPE_IN];
    ctx.error_fd = error_pipe[PIPE_IN];
    ctx.release_fd = release_pipe[PIPE_OUT];

    vector<char *> argv, envp;
    for (auto &arg : ctx.args) argv.push_back(const_cast<char *>(arg.c_str()));
    argv.push_back(nullptr);
    for (auto &var : ctx.env) envp.push_back(const_cast<char *>(var.c_str()));
    envp.push_back(nullptr);

    auto started = chrono::steady_clock::now();
    auto deadline = started + chrono::milliseconds(policy.wall_clock_ms);
    auto hard_deadline = deadline + chrono::milliseconds(GRACE_MARGIN_MS);

    pid_t child_pid = fork();
    if (child_pid < 0) error(errno, "unable to fork");
    if (child_pid == 0) run_child(ctx, argv, envp);

    bool reaped = false;
    // 任何异常路径上都要杀死并回收整个进程组
    defer {
        if (reaped) return;
        if (kill(-child_pid, SIGKILL) != 0 && errno != ESRCH)
            LOG(ERROR) << "unable to kill process group " << child_pid << ": " << strerror(errno);
        while (waitpid(child_pid, nullptr, 0) < 0 && errno == EINTR) {}
    };

    for (int *fds : {stdout_pipe, stderr_pipe, error_pipe})
        close_fd(fds[PIPE_IN]);
    close_fd(release_pipe[PIPE_OUT]);

    // 其他工作线程可能正持有 libcgroup 的内部锁，fork 出的子进程中不能调用它
    if (!cgroup_name.empty())
        cgroup_attach(cgroup_name, child_pid);
    release_child(release_pipe[PIPE_IN]);
    close_fd(release_pipe[PIPE_IN]);

    captured_stream out, err;
    swap(out.fd, stdout_pipe[PIPE_OUT]);
    swap(err.fd, stderr_pipe[PIPE_OUT]);
    defer {
        close_fd(out.fd);
        close_fd(err.fd);
    };
    for (int fd : {out.fd, err.fd})
        if (fcntl(fd, F_SETFL, fcntl(fd, F_GETFL) | O_NONBLOCK) != 0) error(errno, "setting pipe non-blocking");

    kill_reason reason = kill_reason::NONE;
    auto terminate = [&](kill_reason why) {
        if (reason != kill_reason::NONE) return;
        reason = why;
        if (kill(-child_pid, SIGKILL) != 0 && errno != ESRCH)
            error(errno, "sending SIGKILL to process group");
    };

    size_t limit = (size_t)policy.max_output_bytes;
    bool exited = false;
    while (!exited || out.fd >= 0 || err.fd >= 0) {
        auto now = chrono::steady_clock::now();
        if (cancellation.is_cancelled()) terminate(kill_reason::CANCELLED);
        if (now >= deadline) terminate(kill_reason::TIMEOUT);
        // 进程已经结束，但被杀死的后代进程还持有管道
        if (exited && now >= hard_deadline) break;

        struct pollfd fds[2];
        nfds_t nfds = 0;
        for (int fd : {out.fd, err.fd})
            if (fd >= 0) fds[nfds++] = {fd, POLLIN, 0};
        int timeout = POLL_SLICE_MS;
        if (reason == kill_reason::NONE) {
            auto remaining = chrono::duration_cast<chrono::milliseconds>(deadline - now).count();
            timeout = (int)max<int64_t>(0, min<int64_t>(timeout, remaining));
        }
        if (poll(nfds > 0 ? fds : nullptr, nfds, timeout) < 0 && errno != EINTR)
            error(errno, "polling child output");

        pump_pipe(out, limit);
        pump_pipe(err, limit);
        if (out.overflowed || err.overflowed) terminate(kill_reason::OUTPUT_OVERFLOW);

        if (!exited) {
            siginfo_t info;
            memset(&info, 0, sizeof(info));
            // WNOWAIT 保留僵尸进程，使进程组 id 在杀死后代之前不会被复用
            if (waitid(P_PID, child_pid, &info, WEXITED | WNOHANG | WNOWAIT) != 0) {
                if (errno != EINTR) error(errno, "waiting for child");
            } else if (info.si_pid == child_pid) {
                exited = true;
                // 杀死仍然存活的后代进程
                if (kill(-child_pid, SIGKILL) != 0 && errno != ESRCH)
                    error(errno, "sending SIGKILL to process group");
            }
        }
    }

    int status = 0;
    struct rusage usage;
    memset(&usage, 0, sizeof(usage));
    while (wait4(child_pid, &status, 0, &usage) < 0) {
        if (errno != EINTR) error(errno, "reaping child");
    }
    reaped = true;
    run.duration_ms = chrono::duration_cast<chrono::milliseconds>(chrono::steady_clock::now() - started).count();

    string child_error = read_child_error(error_pipe[PIPE_OUT]);
    if (!child_error.empty())
        throw sandbox_error("sandbox setup failed: " + child_error);

    run.stdout_data = move(out.data);
    run.stderr_data = move(err.data);
    run.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    run.signal = WIFSIGNALED(status) ? WTERMSIG(status) : 0;
    run.peak_memory_bytes = (int64_t)usage.ru_maxrss * 1024;

    bool oom_killed = false;
    if (!cgroup_name.empty()) {
        cgroup_kill(cgroup_name);
        cgroup_usage cg_usage = cgroup_summarize(cgroup_name);
        run.peak_memory_bytes = cg_usage.max_usage_bytes;
        oom_killed = cg_usage.oom_killed;
    }

    run.status = classify(reason, status, usage, policy, run, oom_killed);

    LOG(INFO) << fmt::format("sandbox run {}: {} in {}ms, exit code {}, signal {}, peak memory {} bytes",
                             id, get_status_name(run.status), run.duration_ms, run.exit_code, run.signal,
                             run.peak_memory_bytes);
    return run;
}

sandbox_run process_sandbox::execute(const string &code, const string &input, const limit_policy &policy,
                                     const cancellation_token &cancellation) {
    sandbox_run run;
    if (boost::algorithm::trim_copy(code).empty()) {
        run.status = exit_status::RUNTIME_ERROR;
        run.exit_code = 1;
        run.stderr_data = EMPTY_CODE_MESSAGE;
        return run;
    }

    if (cancellation.is_cancelled()) {
        run.status = exit_status::CANCELLED;
        return run;
    }

    try {
        return supervise(code, input, policy, cancellation);
    } catch (exception &ex) {
        LOG(ERROR) << "sandbox failure: " << ex.what();
        run.status = exit_status::INTERNAL_ERROR;
        return run;
    }
}

}  // namespace grader
