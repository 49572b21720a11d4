#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace exec {

struct ProcessRunRequest {
    std::string command;
    std::string workingDirectory;
    std::chrono::milliseconds timeout{30000};
    std::size_t captureLimit = 1024 * 1024;
};

enum class ProcessRunState {
    Completed,
    TimedOut,
    SpawnFailed,
};

struct ProcessRunOutcome {
    ProcessRunState state = ProcessRunState::SpawnFailed;
    int exitCode = -1;
    std::string stdOut;
    std::string stdErr;
    bool stdOutTruncated = false;
    bool stdErrTruncated = false;
    std::string error;
};

/**
 * Runs command through /bin/sh -c in its own process group with stdin bound
 * to /dev/null. Each stream keeps at most captureLimit bytes; the rest is
 * drained and dropped. When the deadline passes the whole group is killed
 * and no output is returned.
 */
ProcessRunOutcome RunShellCommand(const ProcessRunRequest& request);

} // namespace exec
