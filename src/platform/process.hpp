#pragma once

#include <string>
#include <vector>
#include <cstddef>
#include <core/types.hpp>

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  include <windows.h>
#endif

namespace platform {

// Handle to a spawned child process whose stdout is readable by the parent.
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

    // True if the process is still running.
    bool running() const;

    // Read up to len bytes of the child's stdout. Returns 0 at EOF, -1 on error.
    long read_stdout(char* buf, std::size_t len);

    // Block until the process exits. Returns its exit code (-1 if unknown).
    int wait();

    // Terminate the process (SIGTERM then SIGKILL on Unix, TerminateProcess on Windows).
    void terminate();

private:
    void close_stdout();

#ifdef _WIN32
    HANDLE handle_ = INVALID_HANDLE_VALUE;
    HANDLE thread_ = INVALID_HANDLE_VALUE;
    HANDLE stdout_ = INVALID_HANDLE_VALUE;
#else
    int pid_ = -1;
    int stdout_fd_ = -1;
    mutable int exit_code_ = -1;
    mutable bool reaped_ = false;
#endif
    friend ProcessHandle spawn_reader(const std::string& program,
                                      const std::vector<std::string>& args);
};

// Spawn a child with stdout connected to a pipe the caller reads incrementally.
// stderr is discarded. Returns an invalid handle if the spawn itself failed.
ProcessHandle spawn_reader(const std::string& program,
                           const std::vector<std::string>& args);

// Run a child to completion, feeding stdin_data and capturing stdout and stderr.
// exit_code is EXEC_FAILED_EXIT_CODE when the program could not be executed.
ProcessOutput run_process(const std::string& program,
                          const std::vector<std::string>& args,
                          const std::string& stdin_data = "");

} // namespace platform
