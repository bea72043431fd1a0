#include "LocalShellSandbox.hpp"
#include "LogUtils.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <string>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

namespace {

constexpr int POLL_INTERVAL_MS = 50;

// Accumulates raw bytes of one stream and emits complete lines
class LineSplitter {
public:
    LineSplitter(OutputStream stream, const LineHandler& handler) : stream_(stream), handler_(handler) {}

    void feed(const char* data, size_t size) {
        buffer_.append(data, size);
        size_t start = 0;
        size_t nl;
        while ((nl = buffer_.find('\n', start)) != std::string::npos) {
            size_t len = nl - start;
            if (len > 0 && buffer_[start + len - 1] == '\r') --len;
            emit(buffer_.substr(start, len));
            start = nl + 1;
        }
        buffer_.erase(0, start);
    }

    void flush() {
        if (!buffer_.empty()) {
            emit(buffer_);
            buffer_.clear();
        }
    }

private:
    void emit(const std::string& line) {
        if (handler_) handler_(stream_, line);
    }

    OutputStream stream_;
    const LineHandler& handler_;
    std::string buffer_;
};

// Reads whatever is available; returns false once the descriptor reached EOF
bool drain(int fd, LineSplitter& splitter) {
    char buf[4096];
    while (true) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n > 0) {
            splitter.feed(buf, static_cast<size_t>(n));
            continue;
        }
        if (n == 0) return false;
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
        return false;
    }
}

std::string resolve_program(const std::string& program, const std::map<std::string, std::string>& env) {
    if (program.find('/') != std::string::npos) return program;

    std::string path;
    auto it = env.find("PATH");
    if (it != env.end()) {
        path = it->second;
    } else if (const char* p = std::getenv("PATH")) {
        path = p;
    } else {
        path = "/usr/bin:/bin";
    }

    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find(':', start);
        if (end == std::string::npos) end = path.size();
        std::string dir = path.substr(start, end - start);
        if (dir.empty()) dir = ".";
        std::string candidate = dir + "/" + program;
        if (::access(candidate.c_str(), X_OK) == 0) return candidate;
        start = end + 1;
    }
    return "";
}

int decode_wait_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

} // namespace

LocalShellSandbox::LocalShellSandbox(std::chrono::milliseconds kill_grace) : kill_grace_(kill_grace) {}

SandboxResult LocalShellSandbox::execute(const SandboxRequest& request,
                                         const CancellationToken& token,
                                         const LineHandler& on_line) {
    SandboxResult result;

    if (token.is_cancelled()) {
        result.cancelled = true;
        return result;
    }

    const std::string program = resolve_program(request.shell, request.env);
    if (program.empty()) {
        result.error = "Shell not found: " + request.shell;
        return result;
    }

    // Everything the child needs is prepared before fork
    std::vector<std::string> args_s = {request.shell, "-e", "-c", request.command};
    std::vector<char*> argv;
    for (auto& a : args_s) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    std::vector<std::string> env_s;
    for (const auto& [key, value] : request.env) env_s.push_back(key + "=" + value);
    std::vector<char*> envp;
    for (auto& e : env_s) envp.push_back(const_cast<char*>(e.c_str()));
    envp.push_back(nullptr);

    const std::string cwd = request.working_directory.empty() ? "." : request.working_directory;

    int out_pipe[2];
    int err_pipe[2];
    if (::pipe2(out_pipe, O_CLOEXEC) != 0) {
        result.error = std::string("pipe failed: ") + std::strerror(errno);
        return result;
    }
    if (::pipe2(err_pipe, O_CLOEXEC) != 0) {
        result.error = std::string("pipe failed: ") + std::strerror(errno);
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        return result;
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        result.error = std::string("fork failed: ") + std::strerror(errno);
        for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]}) ::close(fd);
        return result;
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);

        if (::chdir(cwd.c_str()) != 0) {
            const char msg[] = "flowexec: cannot change to working directory\n";
            ssize_t ignored = ::write(STDERR_FILENO, msg, sizeof(msg) - 1);
            (void)ignored;
            ::_exit(127);
        }
        ::execve(program.c_str(), argv.data(), envp.data());
        const char msg[] = "flowexec: exec failed\n";
        ssize_t ignored = ::write(STDERR_FILENO, msg, sizeof(msg) - 1);
        (void)ignored;
        ::_exit(127);
    }

    ::setpgid(pid, pid);
    ::close(out_pipe[1]);
    ::close(err_pipe[1]);
    ::fcntl(out_pipe[0], F_SETFL, ::fcntl(out_pipe[0], F_GETFL) | O_NONBLOCK);
    ::fcntl(err_pipe[0], F_SETFL, ::fcntl(err_pipe[0], F_GETFL) | O_NONBLOCK);

    LogUtils::debug("Started [{}] pid {}", request.label, static_cast<int>(pid));

    LineSplitter out_splitter(OutputStream::Stdout, on_line);
    LineSplitter err_splitter(OutputStream::Stderr, on_line);
    bool out_open = true;
    bool err_open = true;

    const auto started = std::chrono::steady_clock::now();
    std::chrono::steady_clock::time_point terminate_sent;
    bool terminating = false;
    bool killed = false;
    bool exited = false;
    int status = 0;

    auto terminate_group = [&]() {
        if (terminating) return;
        terminating = true;
        terminate_sent = std::chrono::steady_clock::now();
        termination_count_.fetch_add(1);
        ::kill(-pid, SIGTERM);
    };

    while (true) {
        if (!exited) {
            pid_t w = ::waitpid(pid, &status, WNOHANG);
            if (w == pid) exited = true;
        }
        if (exited && !out_open && !err_open) break;

        if (!terminating) {
            if (token.is_cancelled()) {
                result.cancelled = true;
                terminate_group();
            } else if (request.timeout &&
                       std::chrono::steady_clock::now() - started >= *request.timeout) {
                result.timed_out = true;
                LogUtils::warn("[{}] timed out after {} ms", request.label, request.timeout->count());
                terminate_group();
            }
        } else if (!killed && std::chrono::steady_clock::now() - terminate_sent >= kill_grace_) {
            killed = true;
            ::kill(-pid, SIGKILL);
        }

        if (exited) {
            // The shell is gone; collect what is left without waiting on
            // descendants that may still hold the pipes
            if (out_open) drain(out_pipe[0], out_splitter);
            if (err_open) drain(err_pipe[0], err_splitter);
            break;
        }

        std::vector<pollfd> fds;
        if (out_open) fds.push_back({out_pipe[0], POLLIN, 0});
        if (err_open) fds.push_back({err_pipe[0], POLLIN, 0});
        if (fds.empty()) {
            // Both streams closed; wait for the process itself
            ::usleep(POLL_INTERVAL_MS * 1000);
            continue;
        }

        int rc = ::poll(fds.data(), fds.size(), POLL_INTERVAL_MS);
        if (rc < 0 && errno != EINTR) {
            result.error = std::string("poll failed: ") + std::strerror(errno);
            LogUtils::error("[{}] {}", request.label, result.error);
            terminate_group();
            ::kill(-pid, SIGKILL);
            break;
        }
        if (rc > 0) {
            for (const auto& p : fds) {
                if (p.revents == 0) continue;
                if (p.fd == out_pipe[0]) {
                    out_open = drain(out_pipe[0], out_splitter);
                } else {
                    err_open = drain(err_pipe[0], err_splitter);
                }
            }
        }
    }

    if (!exited) {
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
    }
    out_splitter.flush();
    err_splitter.flush();
    ::close(out_pipe[0]);
    ::close(err_pipe[0]);

    result.exit_code = decode_wait_status(status);
    LogUtils::debug("Finished [{}] exit code {}", request.label, result.exit_code);
    return result;
}
