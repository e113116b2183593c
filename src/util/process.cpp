#include <wharf/process.hpp>

#include <cerrno>
#include <chrono>
#include <cstring>

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace wharf {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

// Pipes are close-on-exec so that children forked concurrently from other
// threads never inherit a write end and keep a reader from seeing EOF.
static bool make_pipe(int fds[2]) {
    return pipe2(fds, O_CLOEXEC) == 0;
}

static void drain(int fd, std::string& out) {
    char buf[4096];
    ssize_t n;
    while ((n = read(fd, buf, sizeof(buf))) > 0) {
        out.append(buf, static_cast<size_t>(n));
    }
}

static std::vector<const char*> make_argv(const std::vector<std::string>& args) {
    std::vector<const char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);
    return argv;
}

// ---------------------------------------------------------------------------
// run_command
// ---------------------------------------------------------------------------

Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const std::string& working_dir,
                                  int timeout_seconds) {
    if (args.empty()) {
        return WharfError{WharfError::InvalidArg, "run_command: empty args"};
    }

    auto argv = make_argv(args);

    int stdout_pipe[2];
    int stderr_pipe[2];

    if (!make_pipe(stdout_pipe)) {
        return WharfError{WharfError::IO,
            std::string("pipe() failed: ") + strerror(errno)};
    }
    if (!make_pipe(stderr_pipe)) {
        close(stdout_pipe[0]); close(stdout_pipe[1]);
        return WharfError{WharfError::IO,
            std::string("pipe() failed: ") + strerror(errno)};
    }

    pid_t pid = fork();
    if (pid < 0) {
        close(stdout_pipe[0]); close(stdout_pipe[1]);
        close(stderr_pipe[0]); close(stderr_pipe[1]);
        return WharfError{WharfError::IO,
            std::string("fork() failed: ") + strerror(errno)};
    }

    if (pid == 0) {
        // Child process
        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);

        if (!working_dir.empty()) {
            if (chdir(working_dir.c_str()) != 0) {
                _exit(127);
            }
        }

        execvp(argv[0], const_cast<char* const*>(argv.data()));
        _exit(127);  // execvp failed
    }

    // Parent process
    close(stdout_pipe[1]);
    close(stderr_pipe[1]);

    fcntl(stdout_pipe[0], F_SETFL, O_NONBLOCK);
    fcntl(stderr_pipe[0], F_SETFL, O_NONBLOCK);

    std::string out_buf, err_buf;
    auto start = std::chrono::steady_clock::now();

    while (true) {
        auto elapsed = std::chrono::steady_clock::now() - start;
        if (std::chrono::duration_cast<std::chrono::seconds>(elapsed).count()
                >= timeout_seconds) {
            kill(pid, SIGKILL);
            waitpid(pid, nullptr, 0);
            close(stdout_pipe[0]);
            close(stderr_pipe[0]);
            return WharfError{WharfError::Timeout,
                "'" + args[0] + "' timed out after " +
                std::to_string(timeout_seconds) + "s"};
        }

        drain(stdout_pipe[0], out_buf);
        drain(stderr_pipe[0], err_buf);

        int status = 0;
        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            drain(stdout_pipe[0], out_buf);
            drain(stderr_pipe[0], err_buf);
            close(stdout_pipe[0]);
            close(stderr_pipe[0]);

            int exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
            return Result<CommandResult>::ok(
                CommandResult{exit_code, std::move(out_buf), std::move(err_buf)});
        } else if (w < 0) {
            close(stdout_pipe[0]);
            close(stderr_pipe[0]);
            return WharfError{WharfError::IO,
                std::string("waitpid failed: ") + strerror(errno)};
        }

        usleep(1000);  // 1ms
    }
}

// ---------------------------------------------------------------------------
// ChildProcess
// ---------------------------------------------------------------------------

ChildProcess::~ChildProcess() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pid_ > 0) {
        ::kill(pid_, SIGKILL);
        waitpid(pid_, nullptr, 0);
        pid_ = -1;
    }
    if (stdout_fd_ >= 0) {
        close(stdout_fd_);
        stdout_fd_ = -1;
    }
}

Status ChildProcess::start(const std::vector<std::string>& args,
                           const std::string& working_dir) {
    if (args.empty()) {
        return WharfError{WharfError::InvalidArg, "ChildProcess: empty args"};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (pid_ > 0) {
        return WharfError{WharfError::InvalidArg, "ChildProcess already started"};
    }

    auto argv = make_argv(args);

    int out_pipe[2];
    if (!make_pipe(out_pipe)) {
        return WharfError{WharfError::IO,
            std::string("pipe() failed: ") + strerror(errno)};
    }

    pid_t pid = fork();
    if (pid < 0) {
        close(out_pipe[0]); close(out_pipe[1]);
        return WharfError{WharfError::IO,
            std::string("fork() failed: ") + strerror(errno)};
    }

    if (pid == 0) {
        dup2(out_pipe[1], STDOUT_FILENO);
        int devnull = open("/dev/null", O_WRONLY);
        if (devnull >= 0) dup2(devnull, STDERR_FILENO);

        if (!working_dir.empty() && chdir(working_dir.c_str()) != 0) {
            _exit(127);
        }

        execvp(argv[0], const_cast<char* const*>(argv.data()));
        _exit(127);
    }

    close(out_pipe[1]);
    fcntl(out_pipe[0], F_SETFL, O_NONBLOCK);

    pid_ = pid;
    stdout_fd_ = out_pipe[0];

    // kill() may have raced ahead of start()
    if (killed_.load()) {
        ::kill(pid_, SIGTERM);
    }

    return ok_status();
}

int ChildProcess::poll_exit(int& status) {
    // Reap under the lock so kill() never signals a recycled pid
    std::lock_guard<std::mutex> lock(mutex_);
    pid_t w = waitpid(pid_, &status, WNOHANG);
    if (w != 0) pid_ = -1;
    return w;
}

Result<int> ChildProcess::pump(const ChunkFn& on_stdout) {
    int fd;
    int pid;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        fd = stdout_fd_;
        pid = pid_;
    }
    if (pid <= 0 || fd < 0) {
        return WharfError{WharfError::InvalidArg, "ChildProcess not started"};
    }

    char buf[4096];
    int status = 0;
    bool exited = false;

    while (!exited) {
        ssize_t n;
        while ((n = read(fd, buf, sizeof(buf))) > 0) {
            if (!killed_.load()) {
                on_stdout(buf, static_cast<size_t>(n));
            }
        }

        int w = poll_exit(status);
        if (w == pid) {
            exited = true;
            while ((n = read(fd, buf, sizeof(buf))) > 0) {
                if (!killed_.load()) {
                    on_stdout(buf, static_cast<size_t>(n));
                }
            }
        } else if (w < 0) {
            int err = errno;
            return WharfError{WharfError::IO,
                std::string("waitpid failed: ") + strerror(err)};
        } else {
            usleep(1000);  // 1ms
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        close(stdout_fd_);
        stdout_fd_ = -1;
    }

    if (killed_.load()) {
        return WharfError{WharfError::Canceled, "process was killed"};
    }

    int exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    return Result<int>::ok(exit_code);
}

void ChildProcess::kill() {
    killed_.store(true);
    std::lock_guard<std::mutex> lock(mutex_);
    if (pid_ > 0) {
        ::kill(pid_, SIGTERM);
    }
}

bool ChildProcess::running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pid_ > 0;
}

} // namespace wharf
