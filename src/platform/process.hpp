#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

namespace platform {

// Opaque handle to a spawned child process.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process handle is valid (was successfully spawned).
    bool valid() const;

    // Block until the process exits. Returns exit code.
    int wait();

private:
    int pid_ = -1;
    bool reaped_ = false;

    friend ProcessHandle spawn(const std::string& program,
                               const std::vector<std::string>& args,
                               bool interactive);
};

// Spawn a child process. Non-interactive children get stdin closed;
// interactive children share the terminal with the parent.
ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    bool interactive = false);

// Run "/bin/sh -c <command>", capturing stdout and stderr.
// exit_code is -1 if the command could not be started or exceeded timeout_secs
// (in which case it is killed).
CommandResult run_shell(const std::string& command, int timeout_secs);

} // namespace platform
