#pragma once

#include <string>
#include <vector>
#include <filesystem>

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  include <windows.h>
#endif

namespace platform {

struct SpawnOptions {
    std::filesystem::path working_dir;   // empty = inherit
    bool discard_output = false;         // send child stdout/stderr to the null device
};

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

    // Wait for the process to exit. Returns exit code, or -1 on timeout or
    // abnormal exit. timeout_ms = -1 means indefinite wait.
    int wait(int timeout_ms = -1);

    // Terminate the process (SIGTERM then SIGKILL on Unix, TerminateProcess on Windows).
    void terminate();

private:
#ifdef _WIN32
    HANDLE handle_ = INVALID_HANDLE_VALUE;
    HANDLE thread_ = INVALID_HANDLE_VALUE;
#else
    int pid_ = -1;
#endif
    friend ProcessHandle spawn(const std::string& program,
                               const std::vector<std::string>& args,
                               const SpawnOptions& options);
};

// Spawn a child process with stdin closed.
// The returned handle is invalid if the process could not be created.
ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    const SpawnOptions& options = {});

// Exit code 127 from a spawned child means exec failed (program not found).
constexpr int EXEC_FAILED_EXIT = 127;

// Exit code 126: the child could not enter SpawnOptions::working_dir.
constexpr int CHDIR_FAILED_EXIT = 126;

} // namespace platform
