#include "process.hpp"
#include "platform.hpp"

#ifdef _WIN32
#  include <windows.h>
#  include <sstream>
#else
#  include <unistd.h>
#  include <sys/wait.h>
#  include <signal.h>
#  include <fcntl.h>
#endif

namespace platform {

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() {
#ifdef _WIN32
    if (handle_ != INVALID_HANDLE_VALUE) CloseHandle(handle_);
    if (thread_ != INVALID_HANDLE_VALUE) CloseHandle(thread_);
#endif
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept {
#ifdef _WIN32
    handle_ = other.handle_;
    thread_ = other.thread_;
    other.handle_ = INVALID_HANDLE_VALUE;
    other.thread_ = INVALID_HANDLE_VALUE;
#else
    pid_ = other.pid_;
    other.pid_ = -1;
#endif
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
#ifdef _WIN32
        if (handle_ != INVALID_HANDLE_VALUE) CloseHandle(handle_);
        if (thread_ != INVALID_HANDLE_VALUE) CloseHandle(thread_);
        handle_ = other.handle_;
        thread_ = other.thread_;
        other.handle_ = INVALID_HANDLE_VALUE;
        other.thread_ = INVALID_HANDLE_VALUE;
#else
        pid_ = other.pid_;
        other.pid_ = -1;
#endif
    }
    return *this;
}

bool ProcessHandle::valid() const {
#ifdef _WIN32
    return handle_ != INVALID_HANDLE_VALUE;
#else
    return pid_ > 0;
#endif
}

int ProcessHandle::wait(int timeout_ms) {
#ifdef _WIN32
    if (handle_ == INVALID_HANDLE_VALUE) return -1;
    DWORD ms = (timeout_ms < 0) ? INFINITE : static_cast<DWORD>(timeout_ms);
    if (WaitForSingleObject(handle_, ms) != WAIT_OBJECT_0) return -1;
    DWORD code = 1;
    GetExitCodeProcess(handle_, &code);
    return static_cast<int>(code);
#else
    if (pid_ <= 0) return -1;
    int status = 0;
    if (timeout_ms < 0) {
        if (waitpid(pid_, &status, 0) != pid_) return -1;
        pid_ = -1;
        return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    }
    // Poll with timeout
    int elapsed = 0;
    while (elapsed < timeout_ms) {
        pid_t ret = waitpid(pid_, &status, WNOHANG);
        if (ret == pid_) {
            pid_ = -1;
            return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
        }
        if (ret < 0) return -1;
        sleep_ms(50);
        elapsed += 50;
    }
    return -1;  // timed out
#endif
}

void ProcessHandle::terminate() {
#ifdef _WIN32
    if (handle_ != INVALID_HANDLE_VALUE) {
        TerminateProcess(handle_, 1);
        WaitForSingleObject(handle_, 2000);
    }
#else
    if (pid_ <= 0) return;
    kill(pid_, SIGTERM);
    // Wait up to 2s for graceful exit
    for (int i = 0; i < 20; i++) {
        int status;
        if (waitpid(pid_, &status, WNOHANG) == pid_) { pid_ = -1; return; }
        sleep_ms(100);
    }
    kill(pid_, SIGKILL);
    waitpid(pid_, nullptr, 0);
    pid_ = -1;
#endif
}

// ── spawn ────────────────────────────────────────────────────

#ifdef _WIN32

ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    const SpawnOptions& options) {
    ProcessHandle handle;

    // Build command line
    std::ostringstream cmdline;
    cmdline << "\"" << program << "\"";
    for (const auto& arg : args) {
        cmdline << " \"" << arg << "\"";
    }
    std::string cmd_str = cmdline.str();

    STARTUPINFOA si = {};
    si.cb = sizeof(si);
    PROCESS_INFORMATION pi = {};

    HANDLE hNull = INVALID_HANDLE_VALUE;
    if (options.discard_output) {
        SECURITY_ATTRIBUTES sa = {};
        sa.nLength = sizeof(sa);
        sa.bInheritHandle = TRUE;
        hNull = CreateFileA("NUL", GENERIC_READ | GENERIC_WRITE,
                            FILE_SHARE_READ | FILE_SHARE_WRITE, &sa,
                            OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr);
        if (hNull != INVALID_HANDLE_VALUE) {
            si.dwFlags |= STARTF_USESTDHANDLES;
            si.hStdInput = hNull;
            si.hStdOutput = hNull;
            si.hStdError = hNull;
        }
    }

    std::string cwd = options.working_dir.string();
    if (CreateProcessA(nullptr, cmd_str.data(), nullptr, nullptr, TRUE,
                       0, nullptr, cwd.empty() ? nullptr : cwd.c_str(), &si, &pi)) {
        handle.handle_ = pi.hProcess;
        handle.thread_ = pi.hThread;
    }

    if (hNull != INVALID_HANDLE_VALUE) CloseHandle(hNull);
    return handle;
}

#else // Unix

ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    const SpawnOptions& options) {
    ProcessHandle handle;

    // Prepare everything the child needs before fork
    std::vector<const char*> argv;
    argv.push_back(program.c_str());
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);
    std::string cwd = options.working_dir.string();

    pid_t pid = fork();
    if (pid < 0) return handle;  // fork failed

    if (pid == 0) {
        // Child process
        close(STDIN_FILENO);

        if (options.discard_output) {
            int fd = open("/dev/null", O_WRONLY);
            if (fd >= 0) {
                dup2(fd, STDOUT_FILENO);
                dup2(fd, STDERR_FILENO);
                close(fd);
            }
        }

        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            _exit(CHDIR_FAILED_EXIT);
        }

        execvp(program.c_str(), const_cast<char* const*>(argv.data()));
        _exit(EXEC_FAILED_EXIT);  // exec failed
    }

    // Parent
    handle.pid_ = pid;
    return handle;
}

#endif

} // namespace platform
