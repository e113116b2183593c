#pragma once

#include <wharf/result.hpp>

#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace wharf {

// Result of running an external command
struct CommandResult {
    int exit_code;
    std::string stdout_str;
    std::string stderr_str;
};

// Run an external command, capturing stdout and stderr.
// Returns error on fork/exec failure or timeout.
Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const std::string& working_dir = "",
                                  int timeout_seconds = 60);

// A child process whose stdout is consumed incrementally.
// stderr is discarded. kill() may be called from any thread.
class ChildProcess {
public:
    using ChunkFn = std::function<void(const char* data, size_t size)>;

    ChildProcess() = default;
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    Status start(const std::vector<std::string>& args,
                 const std::string& working_dir = "");

    // Deliver stdout chunks until the child exits. Returns the exit code,
    // or Canceled if kill() was called.
    Result<int> pump(const ChunkFn& on_stdout);

    // Terminate the child (SIGTERM). Safe before start and after exit.
    void kill();

    bool killed() const { return killed_.load(); }
    bool running() const;

private:
    mutable std::mutex mutex_;
    int pid_ = -1;
    int stdout_fd_ = -1;
    std::atomic<bool> killed_{false};

    int poll_exit(int& status);
};

} // namespace wharf
