#include "common/process.hpp"
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>
#include <boost/algorithm/string.hpp>
#include <cerrno>
#include <system_error>
#include "common/defer.hpp"
#include "common/io_utils.hpp"

namespace solbuild {
using namespace std;
namespace fs = std::filesystem;

enum { PIPE_OUT = 0, PIPE_IN = 1 };

static vector<char *> make_argv(const vector<string> &argv) {
    vector<char *> args;
    for (auto &arg : argv)
        args.push_back(const_cast<char *>(arg.c_str()));
    args.push_back(nullptr);
    return args;
}

static int wait_child(pid_t pid) {
    int status;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR)
            throw system_error(errno, system_category(), "waiting for child process");
    }
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    else
        return -1;
}

/**
 * @brief 子进程中执行命令，execvp 失败时以 127 退出，与 shell 找不到命令时一致
 */
[[noreturn]] static void exec_child(const vector<string> &argv) {
    auto args = make_argv(argv);
    execvp(args[0], args.data());
    string message = "unable to start command " + argv[0] + "\n";
    if (write(STDERR_FILENO, message.data(), message.size()) < 0) {
        // 已经无法报告错误
    }
    _exit(127);
}

static void write_all(int fd, const char *buf, size_t len) {
    while (len > 0) {
        ssize_t nwritten = write(fd, buf, len);
        if (nwritten < 0) {
            if (errno == EINTR) continue;
            throw system_error(errno, system_category(), "forwarding process output");
        }
        buf += nwritten;
        len -= nwritten;
    }
}

int system_process_runner::run(const vector<string> &argv, const map<string, string> &env, const fs::path &log) {
    if (argv.empty())
        throw invalid_argument("empty command line");

    int logfd = -1;
    if (!log.empty()) {
        logfd = open(log.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
        if (logfd < 0)
            throw system_error(errno, system_category(), "opening " + log.string());
    }

    int pipefd[2];
    if (pipe(pipefd) != 0) {
        if (logfd >= 0) close(logfd);
        throw system_error(errno, system_category(), "creating pipe");
    }

    pid_t pid;
    switch (pid = fork()) {
        case -1: {
            int err = errno;
            close(pipefd[PIPE_OUT]);
            close(pipefd[PIPE_IN]);
            if (logfd >= 0) close(logfd);
            throw system_error(err, system_category(), "unable to fork");
        }
        case 0:  // 子进程
            for (auto &[key, value] : env)
                setenv(key.c_str(), value.c_str(), 1);
            // stdout 和 stderr 都连接到管道
            if (dup2(pipefd[PIPE_IN], STDOUT_FILENO) < 0 || dup2(pipefd[PIPE_IN], STDERR_FILENO) < 0)
                _exit(127);
            close(pipefd[PIPE_OUT]);
            close(pipefd[PIPE_IN]);
            if (logfd >= 0) close(logfd);
            exec_child(argv);
        default:  // 父进程
            break;
    }

    close(pipefd[PIPE_IN]);
    bool reaped = false;
    defer {
        // 转发失败时先关闭管道，子进程写入时收到 SIGPIPE 退出，再回收子进程
        close(pipefd[PIPE_OUT]);
        if (logfd >= 0) close(logfd);
        if (!reaped) {
            int status;
            while (waitpid(pid, &status, 0) < 0 && errno == EINTR)
                ;
        }
    };

    char buf[4096];
    while (true) {
        ssize_t nread = read(pipefd[PIPE_OUT], buf, sizeof(buf));
        if (nread < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (nread == 0) break;  // EOF
        write_all(STDERR_FILENO, buf, nread);
        if (logfd >= 0) write_all(logfd, buf, nread);
    }
    int ret = wait_child(pid);
    reaped = true;
    return ret;
}

int system_process_runner::capture(const vector<string> &argv, string &output) {
    if (argv.empty())
        throw invalid_argument("empty command line");

    int pipefd[2];
    if (pipe(pipefd) != 0)
        throw system_error(errno, system_category(), "creating pipe");

    pid_t pid;
    switch (pid = fork()) {
        case -1: {
            int err = errno;
            close(pipefd[PIPE_OUT]);
            close(pipefd[PIPE_IN]);
            throw system_error(err, system_category(), "unable to fork");
        }
        case 0: {
            // 只收集 stdout，stderr 丢弃
            int nullfd = open("/dev/null", O_WRONLY);
            if (nullfd < 0 || dup2(nullfd, STDERR_FILENO) < 0 || dup2(pipefd[PIPE_IN], STDOUT_FILENO) < 0)
                _exit(127);
            close(nullfd);
            close(pipefd[PIPE_OUT]);
            close(pipefd[PIPE_IN]);
            exec_child(argv);
        }
        default:
            break;
    }

    close(pipefd[PIPE_IN]);
    output.clear();
    char buf[4096];
    while (true) {
        ssize_t nread = read(pipefd[PIPE_OUT], buf, sizeof(buf));
        if (nread < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (nread == 0) break;
        output.append(buf, nread);
    }
    close(pipefd[PIPE_OUT]);
    return wait_child(pid);
}

bool system_process_runner::command_exists(const string &command) {
    if (command.empty()) return false;
    if (command.find('/') != string::npos)
        return is_executable_file(command);

    const char *path_env = getenv("PATH");
    if (!path_env) return false;
    vector<string> dirs;
    boost::split(dirs, path_env, boost::is_any_of(":"));
    for (auto &dir : dirs) {
        fs::path candidate = fs::path(dir.empty() ? "." : dir) / command;
        if (is_executable_file(candidate)) return true;
    }
    return false;
}

}  // namespace solbuild
