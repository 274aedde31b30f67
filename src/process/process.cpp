#include "process/process.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <poll.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <boost/algorithm/string/join.hpp>
#include <cerrno>
#include <cstring>
#include <functional>
#include <mutex>
#include <system_error>
#include <thread>
#include "common/defer.hpp"
#include "common/utils.hpp"
#include "config.hpp"

extern char **environ;

namespace sandbox {
using namespace std;

const int PIPE_IN = 1;
const int PIPE_OUT = 0;

const size_t BUF_SIZE = 4096;

/**
 * @brief 每个输出流最多在内存中保留的字节数
 * 超出部分仍然会被读出（避免子进程阻塞在写管道上），但直接丢弃。
 */
const size_t STREAM_RETAIN_LIMIT = 1 << 20;

const char *const TIMEOUT_MESSAGE = "Execution timed out.";

static void error(int err, const string &message) {
    throw system_error(err, system_category(), message);
}

static void close_fd(int &fd) {
    if (fd != -1) {
        close(fd);
        fd = -1;
    }
}

static void set_nonblock(int fd) {
    int flags = fcntl(fd, F_GETFL);
    if (flags == -1 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1)
        error(errno, "setting pipe to non-blocking mode");
}

/**
 * @brief 构造子进程的环境变量，extra 中的变量覆盖当前进程的同名变量
 * 必须在 fork 之前构造，子进程中不能再分配内存
 */
static vector<string> build_environment(const map<string, string> &extra) {
    vector<string> env;
    for (char **entry = environ; entry && *entry; ++entry) {
        string value(*entry);
        string key = value.substr(0, value.find('='));
        if (!extra.count(key)) env.push_back(move(value));
    }
    for (auto &[key, value] : extra)
        env.push_back(key + "=" + value);
    return env;
}

static vector<char *> to_argv(vector<string> &list) {
    vector<char *> argv;
    for (auto &item : list)
        argv.push_back(item.data());
    argv.push_back(nullptr);
    return argv;
}

/**
 * @brief 从管道读取一次数据，追加到 buffer 中
 * @return false 若读到 EOF
 */
static bool pump(int fd, string &buffer) {
    char buf[BUF_SIZE];
    ssize_t nread = read(fd, buf, BUF_SIZE);
    if (nread == -1) {
        if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) return true;
        error(errno, "reading from child pipe");
    }
    if (nread == 0) return false;
    if (buffer.size() < STREAM_RETAIN_LIMIT)
        buffer.append(buf, min<size_t>(nread, STREAM_RETAIN_LIMIT - buffer.size()));
    return true;
}

bool process_outcome::launch_failed() const {
    return !exit_code && !timed_out;
}

/**
 * @brief 创建管道并 fork，子进程在重定向标准输入输出后调用 child_body，父进程转发输入输出直到子进程结束或超时
 * @param name 子进程的名字，用于日志和错误信息
 * @param child_body 在子进程中调用，不能返回。参数为报告启动失败的管道写端，
 *                   启动失败时向其中写入 errno，启动成功时关闭它（exec 的 O_CLOEXEC 会自动关闭）
 */
static process_outcome spawn(const string &name, const process_options &options,
                             const function<void(int)> &child_body, const fork_hooks &hooks) {
    // 子进程可能在读完标准输入之前退出，写管道时不能因为 SIGPIPE 结束沙箱进程
    static once_flag ignore_sigpipe;
    call_once(ignore_sigpipe, [] { signal(SIGPIPE, SIG_IGN); });

    string work_dir = options.work_dir.string();

    int stdin_pipe[2], stdout_pipe[2], stderr_pipe[2], exec_pipe[2];
    if (pipe2(stdin_pipe, O_CLOEXEC) != 0) error(errno, "creating stdin pipe");
    defer {
        close_fd(stdin_pipe[0]);
        close_fd(stdin_pipe[1]);
    };
    if (pipe2(stdout_pipe, O_CLOEXEC) != 0) error(errno, "creating stdout pipe");
    defer {
        close_fd(stdout_pipe[0]);
        close_fd(stdout_pipe[1]);
    };
    if (pipe2(stderr_pipe, O_CLOEXEC) != 0) error(errno, "creating stderr pipe");
    defer {
        close_fd(stderr_pipe[0]);
        close_fd(stderr_pipe[1]);
    };
    // exec 成功时 O_CLOEXEC 会关闭写端，父进程读到 EOF；失败时子进程写入 errno
    if (pipe2(exec_pipe, O_CLOEXEC) != 0) error(errno, "creating exec pipe");
    defer {
        close_fd(exec_pipe[0]);
        close_fd(exec_pipe[1]);
    };

    if (hooks.prepare) hooks.prepare();
    pid_t pid = fork();
    int fork_errno = errno;
    if (pid != 0 && hooks.parent) hooks.parent();
    if (pid == -1) error(fork_errno, "fork failed");

    if (pid == 0) {  // 子进程
        if (hooks.child) hooks.child();
        // 独立的进程组，超时的时候可以把子进程创建的进程一起结束
        setpgid(0, 0);
        signal(SIGPIPE, SIG_DFL);
        if (dup2(stdin_pipe[PIPE_OUT], STDIN_FILENO) < 0 ||
            dup2(stdout_pipe[PIPE_IN], STDOUT_FILENO) < 0 ||
            dup2(stderr_pipe[PIPE_IN], STDERR_FILENO) < 0 ||
            (!work_dir.empty() && chdir(work_dir.c_str()) != 0)) {
            int err = errno;
            (void)!write(exec_pipe[PIPE_IN], &err, sizeof(err));
            _exit(127);
        }
        child_body(exec_pipe[PIPE_IN]);
        _exit(127);
    }

    // 父进程
    close_fd(stdin_pipe[PIPE_OUT]);
    close_fd(stdout_pipe[PIPE_IN]);
    close_fd(stderr_pipe[PIPE_IN]);
    close_fd(exec_pipe[PIPE_IN]);

    process_outcome outcome;

    int launch_errno = 0;
    ssize_t nread;
    do {
        nread = read(exec_pipe[PIPE_OUT], &launch_errno, sizeof(launch_errno));
    } while (nread == -1 && errno == EINTR);
    if (nread == sizeof(launch_errno)) {
        int status;
        waitpid(pid, &status, 0);
        outcome.stderr_text = launch_errno == ENOENT
                                  ? fmt::format("{} is not installed or not available in PATH on this server.", name)
                                  : fmt::format("Unable to launch {}: {}", name, strerror(launch_errno));
        LOG(WARNING) << "Unable to launch " << name << ": " << strerror(launch_errno);
        return outcome;
    }

    auto deadline = chrono::steady_clock::now() + options.timeout;
    auto remaining = [&deadline]() {
        return chrono::duration_cast<chrono::milliseconds>(deadline - chrono::steady_clock::now());
    };

    set_nonblock(stdin_pipe[PIPE_IN]);
    set_nonblock(stdout_pipe[PIPE_OUT]);
    set_nonblock(stderr_pipe[PIPE_OUT]);

    const string &input = options.stdin_text;
    size_t written = 0;
    if (input.empty()) close_fd(stdin_pipe[PIPE_IN]);

    while (stdout_pipe[PIPE_OUT] != -1 || stderr_pipe[PIPE_OUT] != -1) {
        auto left = remaining();
        if (left.count() <= 0) {
            outcome.timed_out = true;
            break;
        }

        struct pollfd fds[3];
        nfds_t nfds = 0;
        int stdin_idx = -1, stdout_idx = -1, stderr_idx = -1;
        if (stdin_pipe[PIPE_IN] != -1) {
            stdin_idx = nfds;
            fds[nfds++] = {stdin_pipe[PIPE_IN], POLLOUT, 0};
        }
        if (stdout_pipe[PIPE_OUT] != -1) {
            stdout_idx = nfds;
            fds[nfds++] = {stdout_pipe[PIPE_OUT], POLLIN, 0};
        }
        if (stderr_pipe[PIPE_OUT] != -1) {
            stderr_idx = nfds;
            fds[nfds++] = {stderr_pipe[PIPE_OUT], POLLIN, 0};
        }

        int ret = poll(fds, nfds, static_cast<int>(left.count()));
        if (ret == -1) {
            if (errno == EINTR) continue;
            error(errno, "polling child pipes");
        }
        if (ret == 0) continue;

        if (stdin_idx >= 0 && fds[stdin_idx].revents) {
            if (fds[stdin_idx].revents & (POLLERR | POLLHUP)) {
                close_fd(stdin_pipe[PIPE_IN]);
            } else {
                ssize_t nwritten = write(stdin_pipe[PIPE_IN], input.data() + written, min(BUF_SIZE, input.size() - written));
                if (nwritten > 0) {
                    written += nwritten;
                    if (written == input.size()) close_fd(stdin_pipe[PIPE_IN]);
                } else if (nwritten == -1 && errno != EINTR && errno != EAGAIN && errno != EWOULDBLOCK) {
                    // EPIPE: 子进程不再读取标准输入
                    close_fd(stdin_pipe[PIPE_IN]);
                }
            }
        }
        if (stdout_idx >= 0 && fds[stdout_idx].revents) {
            if (!pump(stdout_pipe[PIPE_OUT], outcome.stdout_text)) close_fd(stdout_pipe[PIPE_OUT]);
        }
        if (stderr_idx >= 0 && fds[stderr_idx].revents) {
            if (!pump(stderr_pipe[PIPE_OUT], outcome.stderr_text)) close_fd(stderr_pipe[PIPE_OUT]);
        }
    }
    close_fd(stdin_pipe[PIPE_IN]);

    int status = 0;
    bool exited = false;
    while (!outcome.timed_out) {
        pid_t ret = waitpid(pid, &status, WNOHANG);
        if (ret == pid) {
            exited = true;
            break;
        }
        if (ret == -1 && errno != EINTR) error(errno, "waiting for child process");
        if (remaining().count() <= 0)
            outcome.timed_out = true;
        else
            this_thread::sleep_for(chrono::milliseconds(5));
    }

    // 无论是否超时，都结束整个进程组，不留下后台进程
    if (kill(-pid, SIGKILL) != 0 && errno != ESRCH)
        LOG(ERROR) << "Unable to kill process group " << pid << ": " << strerror(errno);

    if (!exited) {
        while (waitpid(pid, &status, 0) == -1 && errno == EINTR) {
        }
    }

    if (outcome.timed_out) {
        LOG(INFO) << name << " timed out after " << options.timeout.count() << "ms";
        if (!outcome.stderr_text.empty()) outcome.stderr_text += '\n';
        outcome.stderr_text += TIMEOUT_MESSAGE;
    } else if (WIFEXITED(status)) {
        outcome.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        outcome.exit_code = 128 + WTERMSIG(status);
    }

    outcome.stdout_text = clip_output(outcome.stdout_text);
    outcome.stderr_text = clip_output(outcome.stderr_text);
    return outcome;
}

process_outcome run_process(const string &command, const vector<string> &args, const process_options &options) {
    vector<string> arglist{command};
    arglist.insert(arglist.end(), args.begin(), args.end());
    vector<string> envlist = build_environment(options.env);
    vector<char *> argv = to_argv(arglist);
    vector<char *> envp = to_argv(envlist);

    if (DEBUG) LOG(INFO) << "Running " << boost::algorithm::join(arglist, " ");

    return spawn(command, options, [&](int report_fd) {
        execvpe(argv[0], argv.data(), envp.data());
        int err = errno;
        (void)!write(report_fd, &err, sizeof(err));
    }, {});
}

/**
 * @brief 设置资源限制，失败时忽略
 */
static void limit_resource(int resource, rlim_t value) {
    struct rlimit rl;
    rl.rlim_cur = rl.rlim_max = value;
    setrlimit(resource, &rl);
}

process_outcome run_forked(const string &name, const function<int()> &child_main, const process_options &options, const fork_hooks &hooks) {
    if (DEBUG) LOG(INFO) << "Forking " << name;

    // CPU 时间限制至少比时钟时间限制多一秒，正常情况下子进程总是先被 SIGKILL
    rlim_t cpu_seconds = chrono::duration_cast<chrono::seconds>(options.timeout).count() + 2;

    return spawn(name, options, [&](int report_fd) {
        close(report_fd);
        limit_resource(RLIMIT_CPU, cpu_seconds);
        limit_resource(RLIMIT_FSIZE, 0);
        limit_resource(RLIMIT_CORE, 0);
        int code = 1;
        try {
            code = child_main();
        } catch (exception &ex) {
            string message = ex.what();
            (void)!write(STDERR_FILENO, message.data(), message.size());
        }
        _exit(code);
    }, hooks);
}

}  // namespace sandbox
