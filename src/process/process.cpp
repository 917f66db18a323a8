#include "process/process.hpp"
#include <fcntl.h>
#include <glog/logging.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cstring>
#include <system_error>
#include <thread>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/utils.hpp"

extern char **environ;

namespace grader {
using namespace std;

enum { PIPE_OUT = 0,
       PIPE_IN = 1 };

static constexpr size_t BUF_SIZE = 65536;

// 超时杀死进程组后，最多继续读取输出的时间，逃离进程组的后代进程可能一直持有管道
static constexpr chrono::seconds DRAIN_TIMEOUT{1};

static once_flag sigpipe_flag;

static int exit_code_of(int status) {
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    else if (WIFSIGNALED(status))
        return -WTERMSIG(status);
    else
        return -1;
}

static void make_pipe(int fds[2]) {
    if (pipe2(fds, O_CLOEXEC) != 0)
        throw system_error(errno, system_category(), "unable to create pipe");
}

static void close_fd(int &fd) noexcept {
    if (fd != -1) {
        close(fd);
        fd = -1;
    }
}

/**
 * @brief 子进程在 exec 失败时通过这个管道把 errno 告诉父进程
 * 只能使用 async-signal-safe 的函数
 */
[[noreturn]] static void child_fail(int err_fd) noexcept {
    int err = errno;
    ssize_t ignored = write(err_fd, &err, sizeof(err));
    (void)ignored;
    _exit(127);
}

subprocess::subprocess(const process_options &options)
    : new_session(options.new_session),
      max_output_length(options.max_output_length),
      stdin_content(options.stdin_content.value_or("")) {
    if (options.argv.empty())
        throw invalid_argument("argv must not be empty");

    // 写入已经退出的程序的 stdin 时不能让整个评分进程被 SIGPIPE 杀死
    call_once(sigpipe_flag, [] { signal(SIGPIPE, SIG_IGN); });

    // fork 之后子进程只能调用 async-signal-safe 的函数，因此参数和环境变量都要提前准备好
    vector<char *> argv;
    for (auto &arg : options.argv) argv.push_back(const_cast<char *>(arg.c_str()));
    argv.push_back(nullptr);

    vector<string> env_storage;
    for (char **e = environ; *e; ++e) {
        string entry(*e);
        string key = entry.substr(0, entry.find('='));
        if (!options.env.count(key)) env_storage.push_back(entry);
    }
    for (auto &[key, value] : options.env) env_storage.push_back(key + "=" + value);
    vector<char *> envp;
    for (auto &entry : env_storage) envp.push_back(const_cast<char *>(entry.c_str()));
    envp.push_back(nullptr);

    string working_directory = options.working_directory.string();
    resource_limits limits = options.limits;
    bool limit_processes = options.limit_processes;

    int in_pipe[2] = {-1, -1}, out_pipe[2] = {-1, -1}, err_pipe[2] = {-1, -1}, exec_pipe[2] = {-1, -1};
    int output_fd = -1;
    defer {
        for (int *fds : {in_pipe, out_pipe, err_pipe, exec_pipe}) {
            close_fd(fds[PIPE_OUT]);
            close_fd(fds[PIPE_IN]);
        }
        close_fd(output_fd);
    };

    if (options.stdin_content) make_pipe(in_pipe);
    if (options.output_file) {
        output_fd = open(options.output_file->c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
        if (output_fd < 0)
            throw system_error(errno, system_category(), "unable to open output file " + options.output_file->string());
    } else {
        make_pipe(out_pipe);
        make_pipe(err_pipe);
    }
    make_pipe(exec_pipe);

    DLOG(INFO) << "Executing " << join_args(options.argv);

    pid_t pid = fork();
    if (pid < 0)
        throw system_error(errno, system_category(), "unable to fork");

    if (pid == 0) {  // 子进程
        int err_fd = exec_pipe[PIPE_IN];

        if (new_session && setsid() < 0) child_fail(err_fd);

        int stdin_src = in_pipe[PIPE_OUT];
        if (stdin_src == -1) stdin_src = open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (stdin_src < 0 || dup2(stdin_src, STDIN_FILENO) < 0) child_fail(err_fd);

        int stdout_dst = output_fd != -1 ? output_fd : out_pipe[PIPE_IN];
        int stderr_dst = output_fd != -1 ? output_fd : err_pipe[PIPE_IN];
        if (dup2(stdout_dst, STDOUT_FILENO) < 0) child_fail(err_fd);
        if (dup2(stderr_dst, STDERR_FILENO) < 0) child_fail(err_fd);

        if (!working_directory.empty() && chdir(working_directory.c_str()) != 0) child_fail(err_fd);

        if (!apply_rlimits(limits, limit_processes)) child_fail(err_fd);

        // 被忽略的信号会在 exec 后保持忽略，必须恢复默认处理
        signal(SIGPIPE, SIG_DFL);
        sigset_t empty_mask;
        sigemptyset(&empty_mask);
        sigprocmask(SIG_SETMASK, &empty_mask, nullptr);

        execvpe(argv[0], argv.data(), envp.data());
        child_fail(err_fd);
    }

    // 父进程
    child_pid = pid;
    close_fd(exec_pipe[PIPE_IN]);

    int child_errno = 0;
    ssize_t nread;
    do {
        nread = read(exec_pipe[PIPE_OUT], &child_errno, sizeof(child_errno));
    } while (nread < 0 && errno == EINTR);
    if (nread > 0) {
        // exec 失败，回收子进程
        wait();
        throw system_error(child_errno, system_category(), "unable to execute " + options.argv[0]);
    }

    swap(stdin_fd, in_pipe[PIPE_IN]);
    swap(stdout_fd, out_pipe[PIPE_OUT]);
    swap(stderr_fd, err_pipe[PIPE_OUT]);

    if (stdin_fd != -1) {
        if (stdin_content.empty())
            close_fd(stdin_fd);
        else
            fcntl(stdin_fd, F_SETFL, fcntl(stdin_fd, F_GETFL) | O_NONBLOCK);
    }
}

subprocess::~subprocess() {
    bool running;
    {
        scoped_lock guard(mut);
        running = !reaped;
    }
    if (running) {
        signal_group(SIGKILL);
        wait();
    }
    close_pipes();
}

pid_t subprocess::pid() const noexcept {
    return child_pid;
}

void subprocess::signal_group(int sig) {
    scoped_lock guard(mut);
    // 已经回收的进程号可能被其他进程复用
    if (reaped) return;
    pid_t target = new_session ? -child_pid : child_pid;
    if (::kill(target, sig) != 0 && errno != ESRCH)
        LOG(WARNING) << "Unable to send signal " << sig << " to process " << child_pid << ": " << strerror(errno);
}

void subprocess::terminate() {
    signal_group(SIGTERM);
}

void subprocess::kill() {
    signal_group(SIGKILL);
}

bool subprocess::poll_exit_locked() {
    if (reaped) return true;
    int status;
    pid_t r = waitpid(child_pid, &status, WNOHANG);
    if (r == child_pid) {
        reaped = true;
        exit_status = status;
    } else if (r < 0 && errno == ECHILD) {
        // 不应该发生：子进程已经被别处回收
        LOG(ERROR) << "Process " << child_pid << " has been reaped elsewhere";
        reaped = true;
        exit_status = 0;
    }
    return reaped;
}

optional<int> subprocess::wait_for(chrono::milliseconds timeout) {
    auto deadline = chrono::steady_clock::now() + timeout;
    while (true) {
        {
            scoped_lock guard(mut);
            if (poll_exit_locked()) return exit_code_of(exit_status);
        }
        auto now = chrono::steady_clock::now();
        if (now >= deadline) return {};
        this_thread::sleep_for(min<chrono::steady_clock::duration>(chrono::milliseconds(10), deadline - now));
    }
}

int subprocess::wait() {
    while (true) {
        if (auto code = wait_for(chrono::hours(1)))
            return *code;
    }
}

/**
 * @brief 去掉截断处不完整的 UTF-8 字符
 */
static void trim_partial_utf8(string &content) {
    size_t i = content.size(), continuation = 0;
    while (i > 0 && continuation < 3 && ((unsigned char)content[i - 1] & 0xC0) == 0x80) {
        --i;
        ++continuation;
    }
    if (i == 0) return;
    unsigned char lead = content[i - 1];
    size_t length = 1;
    if ((lead & 0xE0) == 0xC0) length = 2;
    else if ((lead & 0xF0) == 0xE0) length = 3;
    else if ((lead & 0xF8) == 0xF0) length = 4;
    if (continuation + 1 < length) content.resize(i - 1);
}

/**
 * @brief 读取一次管道，超出 max_length 的部分被丢弃并标记截断
 * 截断发生在字符中间时，不完整的 UTF-8 字符也被丢弃。
 * 读到 EOF 时关闭管道并将 fd 置为 -1
 */
static void pump_pipe(int &fd, string &content, bool &truncated, size_t max_length) {
    char buf[BUF_SIZE];
    ssize_t nread = read(fd, buf, BUF_SIZE);
    if (nread > 0) {
        if (truncated) return;
        size_t keep = min((size_t)nread, max_length - content.size());
        content.append(buf, keep);
        if (keep < (size_t)nread) {
            truncated = true;
            trim_partial_utf8(content);
        }
    } else if (nread == 0) {
        close_fd(fd);
    } else if (errno != EINTR && errno != EAGAIN && errno != EWOULDBLOCK) {
        LOG(WARNING) << "Error reading output of child process: " << strerror(errno);
        close_fd(fd);
    }
}

bool subprocess::pump_pipes(process_result &result, optional<chrono::steady_clock::time_point> deadline) {
    while (stdin_fd != -1 || stdout_fd != -1 || stderr_fd != -1) {
        int wait_ms = -1;
        if (deadline) {
            auto remaining = chrono::duration_cast<chrono::milliseconds>(*deadline - chrono::steady_clock::now());
            if (remaining.count() <= 0) return false;
            wait_ms = (int)remaining.count() + 1;
        }

        struct pollfd fds[3];
        int nfds = 0, stdin_idx = -1, stdout_idx = -1, stderr_idx = -1;
        if (stdin_fd != -1) {
            stdin_idx = nfds++;
            fds[stdin_idx] = {stdin_fd, POLLOUT, 0};
        }
        if (stdout_fd != -1) {
            stdout_idx = nfds++;
            fds[stdout_idx] = {stdout_fd, POLLIN, 0};
        }
        if (stderr_fd != -1) {
            stderr_idx = nfds++;
            fds[stderr_idx] = {stderr_fd, POLLIN, 0};
        }

        int r = ::poll(fds, nfds, wait_ms);
        if (r < 0) {
            if (errno == EINTR) continue;
            throw system_error(errno, system_category(), "poll");
        }

        if (stdin_idx != -1 && fds[stdin_idx].revents) {
            if (fds[stdin_idx].revents & POLLOUT) {
                ssize_t nwritten = write(stdin_fd, stdin_content.data() + stdin_written, stdin_content.size() - stdin_written);
                if (nwritten > 0) stdin_written += nwritten;
                if (stdin_written == stdin_content.size() ||
                    (nwritten < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR))
                    close_fd(stdin_fd);
            } else {
                // 程序关闭了 stdin
                close_fd(stdin_fd);
            }
        }
        if (stdout_idx != -1 && fds[stdout_idx].revents)
            pump_pipe(stdout_fd, result.stdout_content, result.stdout_truncated, max_output_length);
        if (stderr_idx != -1 && fds[stderr_idx].revents)
            pump_pipe(stderr_fd, result.stderr_content, result.stderr_truncated, max_output_length);
    }
    return true;
}

process_result subprocess::communicate(optional<chrono::milliseconds> timeout) {
    process_result result;
    optional<chrono::steady_clock::time_point> deadline;
    if (timeout) deadline = chrono::steady_clock::now() + *timeout;

    bool finished = pump_pipes(result, deadline);
    if (finished) {
        optional<int> code;
        if (deadline) {
            auto remaining = chrono::duration_cast<chrono::milliseconds>(*deadline - chrono::steady_clock::now());
            code = wait_for(max(remaining, chrono::milliseconds(0)));
        } else {
            code = wait();
        }
        if (code)
            result.exit_code = code;
        else
            finished = false;
    }

    if (!finished) {
        LOG(INFO) << "Process " << child_pid << " timed out, killing process group";
        result.timed_out = true;
        kill();
        close_fd(stdin_fd);
        pump_pipes(result, chrono::steady_clock::now() + DRAIN_TIMEOUT);
        wait();
        result.exit_code.reset();
    }

    close_pipes();
    return result;
}

void subprocess::close_pipes() noexcept {
    close_fd(stdin_fd);
    close_fd(stdout_fd);
    close_fd(stderr_fd);
}

process_result run_process(const process_options &options, optional<chrono::milliseconds> timeout) {
    subprocess process(options);
    return process.communicate(timeout);
}

string check_output(const vector<string> &argv) {
    process_options options;
    options.argv = argv;
    process_result result = run_process(options, {});
    if (result.exit_code != 0)
        throw command_error(argv, result.exit_code.value_or(-1), result.stdout_content + result.stderr_content);
    return result.stdout_content;
}

}  // namespace grader
