#include "child_process.hpp"

#include "errors.hpp"
#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace mcp {

namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

void close_pipe(int fds[2]) {
    close_fd(fds[0]);
    close_fd(fds[1]);
}

// A child that exits while we write would otherwise kill the agent with SIGPIPE.
void ignore_sigpipe() {
    static std::once_flag once;
    std::call_once(once, []() { std::signal(SIGPIPE, SIG_IGN); });
}

std::string errno_text(int err) {
    return std::strerror(err);
}

} // namespace

ChildProcess::~ChildProcess() {
    stop();
}

void ChildProcess::start(const std::string& command, const std::vector<std::string>& args) {
    if (pid_ > 0) {
        throw SpawnFailure("Child process already started: " + command_);
    }
    if (command.empty()) {
        throw SpawnFailure("No server command specified");
    }

    ignore_sigpipe();

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};

    if (::pipe2(stdin_pipe, O_CLOEXEC) == -1 || ::pipe2(stdout_pipe, O_CLOEXEC) == -1 ||
        ::pipe2(stderr_pipe, O_CLOEXEC) == -1 || ::pipe2(status_pipe, O_CLOEXEC) == -1) {
        int err = errno;
        close_pipe(stdin_pipe);
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        close_pipe(status_pipe);
        throw SpawnFailure("Failed to create pipes: " + errno_text(err));
    }

    // argv is built before fork: only async-signal-safe calls are allowed in the child.
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(command.c_str()));
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid == -1) {
        int err = errno;
        close_pipe(stdin_pipe);
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        close_pipe(status_pipe);
        throw SpawnFailure("fork failed: " + errno_text(err));
    }

    if (pid == 0) {
        ::setpgid(0, 0);

        struct sigaction default_action {};
        default_action.sa_handler = SIG_DFL;
        ::sigaction(SIGPIPE, &default_action, nullptr);

        ::dup2(stdin_pipe[0], STDIN_FILENO);
        ::dup2(stdout_pipe[1], STDOUT_FILENO);
        ::dup2(stderr_pipe[1], STDERR_FILENO);

        ::execvp(command.c_str(), argv.data());

        int err = errno;
        ssize_t ignored = ::write(status_pipe[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    close_fd(stdin_pipe[0]);
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);
    close_fd(status_pipe[1]);

    // The status pipe closes on a successful exec and carries errno otherwise.
    int exec_errno = 0;
    ssize_t n = 0;
    do {
        n = ::read(status_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n == -1 && errno == EINTR);
    close_fd(status_pipe[0]);

    if (n > 0) {
        int status = 0;
        ::waitpid(pid, &status, 0);
        close_fd(stdin_pipe[1]);
        close_fd(stdout_pipe[0]);
        close_fd(stderr_pipe[0]);
        throw SpawnFailure("Failed to launch " + command + ": " + errno_text(exec_errno));
    }

    command_ = command;
    pid_ = pid;
    stdin_fd_ = stdin_pipe[1];
    stdout_fd_ = stdout_pipe[0];
    stderr_fd_ = stderr_pipe[0];
    read_buffer_.clear();
    stdout_eof_ = false;
    exit_code_.reset();

    draining_ = true;
    stderr_thread_ = std::thread(&ChildProcess::drain_stderr, this);

    LOG4CPLUS_DEBUG(client_logger(), "Spawned " << command_ << " pid=" << pid_);
}

void ChildProcess::write_line(const std::string& line) {
    if (stdin_fd_ < 0) {
        throw BrokenPipe("Child process is not running");
    }

    std::string data = line;
    if (data.empty() || data.back() != '\n') {
        data.push_back('\n');
    }

    size_t offset = 0;
    while (offset < data.size()) {
        ssize_t written = ::write(stdin_fd_, data.data() + offset, data.size() - offset);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw BrokenPipe("Failed to write to " + command_ + ": " + errno_text(errno));
        }
        offset += static_cast<size_t>(written);
    }
}

bool ChildProcess::take_buffered_line(std::string& line) {
    auto newline = read_buffer_.find('\n');
    if (newline == std::string::npos) {
        return false;
    }

    line.assign(read_buffer_, 0, newline);
    read_buffer_.erase(0, newline + 1);
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return true;
}

ChildProcess::ReadStatus ChildProcess::read_line(std::string& line, int timeout_ms) {
    line.clear();

    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + std::chrono::milliseconds(timeout_ms < 0 ? 0 : timeout_ms);

    while (true) {
        if (take_buffered_line(line)) {
            return ReadStatus::Line;
        }

        if (stdout_eof_ || stdout_fd_ < 0) {
            if (!read_buffer_.empty()) {
                line.swap(read_buffer_);
                read_buffer_.clear();
                return ReadStatus::Line;
            }
            return ReadStatus::EndOfStream;
        }

        int wait_ms = -1;
        if (timeout_ms >= 0) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now()).count();
            if (remaining <= 0) {
                return ReadStatus::Timeout;
            }
            wait_ms = static_cast<int>(remaining);
        }

        pollfd pfd{};
        pfd.fd = stdout_fd_;
        pfd.events = POLLIN;
        int ready = ::poll(&pfd, 1, wait_ms);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG4CPLUS_ERROR(client_logger(), "poll on child stdout failed: " << errno_text(errno));
            stdout_eof_ = true;
            continue;
        }
        if (ready == 0) {
            return ReadStatus::Timeout;
        }

        char buffer[4096];
        ssize_t n = ::read(stdout_fd_, buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            LOG4CPLUS_ERROR(client_logger(), "read from child stdout failed: " << errno_text(errno));
            stdout_eof_ = true;
            continue;
        }
        if (n == 0) {
            stdout_eof_ = true;
            continue;
        }
        read_buffer_.append(buffer, static_cast<size_t>(n));
    }
}

void ChildProcess::stop(int grace_ms) {
    close_fd(stdin_fd_);

    if (pid_ > 0) {
        if (!wait_for_exit(grace_ms)) {
            LOG4CPLUS_WARN(client_logger(), command_ << " did not exit after closing stdin, sending SIGTERM");
            signal_child(SIGTERM);
            if (!wait_for_exit(500)) {
                LOG4CPLUS_WARN(client_logger(), command_ << " ignored SIGTERM, sending SIGKILL");
                signal_child(SIGKILL);
                int status = 0;
                if (::waitpid(pid_, &status, 0) == pid_) {
                    record_exit(status);
                }
                pid_ = -1;
            }
        }
    }

    close_fd(stdout_fd_);

    draining_ = false;
    if (stderr_thread_.joinable()) {
        stderr_thread_.join();
    }
    close_fd(stderr_fd_);
}

bool ChildProcess::is_running() {
    if (pid_ <= 0) {
        return false;
    }

    int status = 0;
    pid_t result = ::waitpid(pid_, &status, WNOHANG);
    if (result == pid_) {
        record_exit(status);
        pid_ = -1;
        return false;
    }
    return result == 0;
}

bool ChildProcess::wait_for_exit(int timeout_ms) {
    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + std::chrono::milliseconds(timeout_ms);

    while (true) {
        if (!is_running()) {
            return true;
        }
        if (clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

void ChildProcess::record_exit(int status) {
    if (WIFEXITED(status)) {
        exit_code_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit_code_ = 128 + WTERMSIG(status);
    }
    LOG4CPLUS_DEBUG(client_logger(), command_ << " exited with code " << exit_code_.value_or(-1));
}

// The child leads its own process group so helpers it forked go down with it.
void ChildProcess::signal_child(int sig) {
    if (pid_ <= 0) {
        return;
    }
    if (::kill(-pid_, sig) == -1) {
        ::kill(pid_, sig);
    }
}

void ChildProcess::drain_stderr() {
    std::string pending;
    char buffer[1024];

    // After stop() clears draining_, whatever is already buffered is still collected.
    while (true) {
        const bool draining = draining_;
        pollfd pfd{};
        pfd.fd = stderr_fd_;
        pfd.events = POLLIN;
        int ready = ::poll(&pfd, 1, draining ? 100 : 0);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        if (ready == 0) {
            if (!draining) {
                break;
            }
            continue;
        }

        ssize_t n = ::read(stderr_fd_, buffer, sizeof(buffer));
        if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
            continue;
        }
        if (n <= 0) {
            break;
        }

        pending.append(buffer, static_cast<size_t>(n));
        size_t newline;
        while ((newline = pending.find('\n')) != std::string::npos) {
            push_diagnostic(pending.substr(0, newline));
            pending.erase(0, newline + 1);
        }
    }

    if (!pending.empty()) {
        push_diagnostic(std::move(pending));
    }
}

void ChildProcess::push_diagnostic(std::string line) {
    LOG4CPLUS_DEBUG(client_logger(), "[" << command_ << "] " << line);

    std::lock_guard<std::mutex> lock(diagnostics_mutex_);
    diagnostics_.push_back(std::move(line));
    while (diagnostics_.size() > kDiagnosticLines) {
        diagnostics_.pop_front();
    }
}

std::vector<std::string> ChildProcess::recent_diagnostics() const {
    std::lock_guard<std::mutex> lock(diagnostics_mutex_);
    return std::vector<std::string>(diagnostics_.begin(), diagnostics_.end());
}

} // namespace mcp
