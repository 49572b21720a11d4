#include "exec/ProcessRunner.hpp"

#include "easylogging++.h"

#include <fcntl.h>
#include <signal.h>
#include <sys/select.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>

namespace exec {

namespace {

using Clock = std::chrono::steady_clock;

constexpr int MAX_READS_PER_WAKEUP = 16;
constexpr auto POLL_INTERVAL = std::chrono::milliseconds(50);

enum ChildStage {
    STAGE_STDIO = 1,
    STAGE_CHDIR = 2,
    STAGE_EXEC = 3,
};

struct ChildFailure {
    int stage;
    int error;
};

class FileDescriptor {
public:
    FileDescriptor() = default;
    explicit FileDescriptor(int fd)
        : fd_{fd} {}

    ~FileDescriptor() { Reset(); }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    int Get() const { return fd_; }
    bool IsOpen() const { return fd_ >= 0; }

    void Reset(int fd = -1) {
        if (fd_ >= 0) {
            close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_ = -1;
};

bool MakePipe(FileDescriptor& readEnd, FileDescriptor& writeEnd) {
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) == -1) {
        return false;
    }

    readEnd.Reset(fds[0]);
    writeEnd.Reset(fds[1]);
    return true;
}

std::string DescribeErrno(const std::string& what, int error) {
    return what + ": " + std::strerror(error);
}

std::string DescribeChildFailure(const ChildFailure& failure) {
    switch (failure.stage) {
    case STAGE_STDIO:
        return DescribeErrno("failed to set up standard streams", failure.error);
    case STAGE_CHDIR:
        return DescribeErrno("failed to enter working directory", failure.error);
    case STAGE_EXEC:
        return DescribeErrno("failed to execute /bin/sh", failure.error);
    }

    return DescribeErrno("child setup failed", failure.error);
}

// Runs in the forked child: only async-signal-safe calls from here on.
void FailChild(int statusFd, int stage) {
    const ChildFailure failure{stage, errno};
    const char* bytes = reinterpret_cast<const char*>(&failure);
    size_t written = 0;
    while (written < sizeof(failure)) {
        const ssize_t result = write(statusFd, bytes + written, sizeof(failure) - written);
        if (result <= 0 && errno != EINTR) {
            break;
        }
        if (result > 0) {
            written += static_cast<size_t>(result);
        }
    }
    _exit(127);
}

bool SetNonBlocking(int fd) {
    const int flags = fcntl(fd, F_GETFL);
    return flags != -1 && fcntl(fd, F_SETFL, flags | O_NONBLOCK) != -1;
}

void ReapChild(pid_t pid) {
    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            LOG(WARNING) << DescribeErrno("failed to reap child " + std::to_string(pid), errno);
            return;
        }
    }
}

int DecodeExitStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

void KillProcessGroup(pid_t pid) {
    if (kill(-pid, SIGKILL) == -1 && errno != ESRCH) {
        LOG(WARNING) << DescribeErrno("failed to kill process group " + std::to_string(pid), errno);
        if (kill(pid, SIGKILL) == -1 && errno != ESRCH) {
            LOG(ERROR) << DescribeErrno("failed to kill process " + std::to_string(pid), errno);
        }
    }
}

void ReadAvailable(FileDescriptor& fd, std::string& buffer, bool& truncated, size_t limit) {
    std::array<char, 4096> chunk;

    for (int reads = 0; reads < MAX_READS_PER_WAKEUP; ++reads) {
        const ssize_t bytes = read(fd.Get(), chunk.data(), chunk.size());
        if (bytes > 0) {
            const size_t room = limit > buffer.size() ? limit - buffer.size() : 0;
            const size_t kept = std::min(room, static_cast<size_t>(bytes));
            buffer.append(chunk.data(), kept);
            if (kept < static_cast<size_t>(bytes)) {
                truncated = true;
            }
            continue;
        }

        if (bytes == -1 && errno == EINTR) {
            continue;
        }
        if (bytes == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }

        // EOF, or a read error that ends this stream.
        fd.Reset();
        return;
    }
}

} // namespace

ProcessRunOutcome RunShellCommand(const ProcessRunRequest& request) {
    ProcessRunOutcome outcome;
    const auto deadline = Clock::now() + request.timeout;

    FileDescriptor outRead, outWrite, errRead, errWrite, statusRead, statusWrite;
    if (!MakePipe(outRead, outWrite) || !MakePipe(errRead, errWrite) || !MakePipe(statusRead, statusWrite)) {
        outcome.error = DescribeErrno("failed to create pipes", errno);
        return outcome;
    }

    const char* command = request.command.c_str();
    const char* workingDirectory = request.workingDirectory.empty() ? nullptr : request.workingDirectory.c_str();

    const pid_t pid = fork();
    if (pid == -1) {
        outcome.error = DescribeErrno("failed to fork", errno);
        return outcome;
    }

    if (pid == 0) {
        // The parent repeats this call, so a failure here is covered there.
        setpgid(0, 0);

        const int devNull = open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (devNull == -1 || dup2(devNull, STDIN_FILENO) == -1
            || dup2(outWrite.Get(), STDOUT_FILENO) == -1
            || dup2(errWrite.Get(), STDERR_FILENO) == -1) {
            FailChild(statusWrite.Get(), STAGE_STDIO);
        }

        if (workingDirectory != nullptr && chdir(workingDirectory) == -1) {
            FailChild(statusWrite.Get(), STAGE_CHDIR);
        }

        execl("/bin/sh", "sh", "-c", command, static_cast<char*>(nullptr));
        FailChild(statusWrite.Get(), STAGE_EXEC);
    }

    if (setpgid(pid, pid) == -1 && errno != EACCES && errno != ESRCH) {
        LOG(WARNING) << DescribeErrno("failed to move child " + std::to_string(pid) + " into its own process group", errno);
    }

    outWrite.Reset();
    errWrite.Reset();
    statusWrite.Reset();

    // The status pipe is close-on-exec: EOF with no payload means exec succeeded.
    ChildFailure failure{};
    ssize_t statusBytes;
    do {
        statusBytes = read(statusRead.Get(), &failure, sizeof(failure));
    } while (statusBytes == -1 && errno == EINTR);
    statusRead.Reset();

    if (statusBytes == static_cast<ssize_t>(sizeof(failure))) {
        ReapChild(pid);
        outcome.error = DescribeChildFailure(failure);
        return outcome;
    }

    if (!SetNonBlocking(outRead.Get()) || !SetNonBlocking(errRead.Get())) {
        const int error = errno;
        KillProcessGroup(pid);
        ReapChild(pid);
        outcome.error = DescribeErrno("failed to configure output pipes", error);
        return outcome;
    }

    bool exited = false;
    int status = 0;

    while (true) {
        if (!exited) {
            const pid_t waited = waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                exited = true;
            } else if (waited == -1 && errno != EINTR) {
                outcome.error = DescribeErrno("failed to wait for child", errno);
                KillProcessGroup(pid);
                return outcome;
            }
        }

        if (exited && !outRead.IsOpen() && !errRead.IsOpen()) {
            break;
        }

        const auto now = Clock::now();
        if (now >= deadline) {
            KillProcessGroup(pid);
            if (!exited) {
                ReapChild(pid);
            }
            outcome.state = ProcessRunState::TimedOut;
            return outcome;
        }

        const auto wait = std::min<Clock::duration>(deadline - now, POLL_INTERVAL);
        const auto waitUs = std::chrono::duration_cast<std::chrono::microseconds>(wait).count();
        timeval tv;
        tv.tv_sec = static_cast<time_t>(waitUs / 1000000);
        tv.tv_usec = static_cast<suseconds_t>(waitUs % 1000000);

        fd_set readFds;
        FD_ZERO(&readFds);
        int maxFd = -1;
        if (outRead.IsOpen()) {
            FD_SET(outRead.Get(), &readFds);
            maxFd = std::max(maxFd, outRead.Get());
        }
        if (errRead.IsOpen()) {
            FD_SET(errRead.Get(), &readFds);
            maxFd = std::max(maxFd, errRead.Get());
        }

        const int ready = select(maxFd + 1, &readFds, nullptr, nullptr, &tv);
        if (ready == -1) {
            if (errno == EINTR) {
                continue;
            }
            outcome.error = DescribeErrno("failed to wait for output", errno);
            KillProcessGroup(pid);
            if (!exited) {
                ReapChild(pid);
            }
            return outcome;
        }

        if (ready > 0) {
            if (outRead.IsOpen() && FD_ISSET(outRead.Get(), &readFds)) {
                ReadAvailable(outRead, outcome.stdOut, outcome.stdOutTruncated, request.captureLimit);
            }
            if (errRead.IsOpen() && FD_ISSET(errRead.Get(), &readFds)) {
                ReadAvailable(errRead, outcome.stdErr, outcome.stdErrTruncated, request.captureLimit);
            }
        }
    }

    outcome.state = ProcessRunState::Completed;
    outcome.exitCode = DecodeExitStatus(status);
    return outcome;
}

} // namespace exec
