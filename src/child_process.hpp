#pragma once

#include <atomic>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <sys/types.h>

namespace mcp {

/**
 * One spawned child process and its three standard streams.
 *
 * stdin and stdout are the protocol channel. stderr is drained by a
 * background thread into the client logger and a small ring of recent lines;
 * it is never parsed.
 */
class ChildProcess {
public:
    enum class ReadStatus {
        Line,
        EndOfStream,
        Timeout,
    };

    static constexpr size_t kDiagnosticLines = 50;
    static constexpr int kDefaultGraceMs = 2000;

    ChildProcess() = default;
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    /// Spawn command (PATH lookup) with args. Throws SpawnFailure.
    void start(const std::string& command, const std::vector<std::string>& args);

    /// Write one line to the child's stdin, appending '\n' if missing. Throws BrokenPipe.
    void write_line(const std::string& line);

    /**
     * Read one line from the child's stdout without its terminator.
     *
     * @param timeout_ms Upper bound on the wait; negative waits forever
     * @return EndOfStream once the child closed its stdout and no buffered text is left
     */
    ReadStatus read_line(std::string& line, int timeout_ms);

    /// Close stdin, wait grace_ms, then SIGTERM and SIGKILL. Safe to call repeatedly.
    void stop(int grace_ms = kDefaultGraceMs);

    /// Reaps the child if it has exited.
    bool is_running();

    std::optional<int> exit_code() const { return exit_code_; }
    pid_t pid() const { return pid_; }
    const std::string& command() const { return command_; }

    std::vector<std::string> recent_diagnostics() const;

private:
    std::string command_;
    pid_t pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;

    std::string read_buffer_;
    bool stdout_eof_ = false;
    std::optional<int> exit_code_;

    std::thread stderr_thread_;
    std::atomic<bool> draining_{false};
    mutable std::mutex diagnostics_mutex_;
    std::deque<std::string> diagnostics_;

    void drain_stderr();
    void push_diagnostic(std::string line);
    bool wait_for_exit(int timeout_ms);
    void record_exit(int status);
    void signal_child(int sig);
    bool take_buffered_line(std::string& line);
};

} // namespace mcp
