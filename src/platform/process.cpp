#include "process.hpp"
#include "platform.hpp"
#include <core/constants.hpp>

#ifdef _WIN32
#  include <windows.h>
#  include <thread>
#else
#  include <unistd.h>
#  include <sys/wait.h>
#  include <signal.h>
#  include <fcntl.h>
#  include <poll.h>
#  include <cerrno>
#  include <cstring>
#endif

#include <sstream>

namespace platform {

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() {
    close_stdout();
#ifdef _WIN32
    if (handle_ != INVALID_HANDLE_VALUE) {
        if (running()) terminate();
        CloseHandle(handle_);
    }
    if (thread_ != INVALID_HANDLE_VALUE) CloseHandle(thread_);
#else
    // Never leave a zombie behind if the caller stopped reading early
    if (pid_ > 0 && !reaped_) terminate();
#endif
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept {
#ifdef _WIN32
    handle_ = other.handle_;
    thread_ = other.thread_;
    stdout_ = other.stdout_;
    other.handle_ = INVALID_HANDLE_VALUE;
    other.thread_ = INVALID_HANDLE_VALUE;
    other.stdout_ = INVALID_HANDLE_VALUE;
#else
    pid_ = other.pid_;
    stdout_fd_ = other.stdout_fd_;
    exit_code_ = other.exit_code_;
    reaped_ = other.reaped_;
    other.pid_ = -1;
    other.stdout_fd_ = -1;
    other.reaped_ = false;
#endif
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        close_stdout();
#ifdef _WIN32
        if (handle_ != INVALID_HANDLE_VALUE) CloseHandle(handle_);
        if (thread_ != INVALID_HANDLE_VALUE) CloseHandle(thread_);
        handle_ = other.handle_;
        thread_ = other.thread_;
        stdout_ = other.stdout_;
        other.handle_ = INVALID_HANDLE_VALUE;
        other.thread_ = INVALID_HANDLE_VALUE;
        other.stdout_ = INVALID_HANDLE_VALUE;
#else
        if (pid_ > 0 && !reaped_) terminate();
        pid_ = other.pid_;
        stdout_fd_ = other.stdout_fd_;
        exit_code_ = other.exit_code_;
        reaped_ = other.reaped_;
        other.pid_ = -1;
        other.stdout_fd_ = -1;
        other.reaped_ = false;
#endif
    }
    return *this;
}

void ProcessHandle::close_stdout() {
#ifdef _WIN32
    if (stdout_ != INVALID_HANDLE_VALUE) {
        CloseHandle(stdout_);
        stdout_ = INVALID_HANDLE_VALUE;
    }
#else
    if (stdout_fd_ >= 0) {
        close(stdout_fd_);
        stdout_fd_ = -1;
    }
#endif
}

bool ProcessHandle::valid() const {
#ifdef _WIN32
    return handle_ != INVALID_HANDLE_VALUE;
#else
    return pid_ > 0;
#endif
}

bool ProcessHandle::running() const {
#ifdef _WIN32
    if (handle_ == INVALID_HANDLE_VALUE) return false;
    DWORD code;
    if (GetExitCodeProcess(handle_, &code))
        return code == STILL_ACTIVE;
    return false;
#else
    if (pid_ <= 0 || reaped_) return false;
    int status;
    pid_t ret = waitpid(pid_, &status, WNOHANG);
    if (ret == pid_) {
        reaped_ = true;
        exit_code_ = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
        return false;
    }
    return ret == 0;  // 0 means still running
#endif
}

long ProcessHandle::read_stdout(char* buf, std::size_t len) {
#ifdef _WIN32
    if (stdout_ == INVALID_HANDLE_VALUE) return -1;
    DWORD n = 0;
    if (!ReadFile(stdout_, buf, static_cast<DWORD>(len), &n, nullptr)) {
        return GetLastError() == ERROR_BROKEN_PIPE ? 0 : -1;
    }
    return static_cast<long>(n);
#else
    if (stdout_fd_ < 0) return -1;
    for (;;) {
        ssize_t n = read(stdout_fd_, buf, len);
        if (n < 0 && errno == EINTR) continue;
        return static_cast<long>(n);
    }
#endif
}

int ProcessHandle::wait() {
    close_stdout();
#ifdef _WIN32
    if (handle_ == INVALID_HANDLE_VALUE) return -1;
    WaitForSingleObject(handle_, INFINITE);
    DWORD code = 1;
    GetExitCodeProcess(handle_, &code);
    return static_cast<int>(code);
#else
    if (pid_ <= 0) return -1;
    if (reaped_) return exit_code_;
    int status;
    while (waitpid(pid_, &status, 0) != pid_) {
        if (errno != EINTR) return -1;
    }
    reaped_ = true;
    exit_code_ = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    return exit_code_;
#endif
}

void ProcessHandle::terminate() {
    close_stdout();
#ifdef _WIN32
    if (handle_ != INVALID_HANDLE_VALUE) {
        TerminateProcess(handle_, 1);
        WaitForSingleObject(handle_, 2000);
    }
#else
    if (pid_ <= 0 || reaped_) return;
    kill(pid_, SIGTERM);
    // Wait up to 2s for graceful exit
    for (int i = 0; i < 20; i++) {
        int status;
        if (waitpid(pid_, &status, WNOHANG) == pid_) {
            reaped_ = true;
            return;
        }
        sleep_ms(100);
    }
    kill(pid_, SIGKILL);
    waitpid(pid_, nullptr, 0);
    reaped_ = true;
#endif
}

// ── spawn / run ──────────────────────────────────────────────

#ifdef _WIN32

static std::string build_command_line(const std::string& program,
                                      const std::vector<std::string>& args) {
    std::ostringstream cmdline;
    cmdline << "\"" << program << "\"";
    for (const auto& arg : args) {
        cmdline << " \"" << arg << "\"";
    }
    return cmdline.str();
}

static std::string drain_handle(HANDLE h) {
    std::string out;
    char buf[PROCESS_READ_BUF_SIZE];
    DWORD n = 0;
    while (ReadFile(h, buf, sizeof(buf), &n, nullptr) && n > 0) {
        out.append(buf, n);
    }
    return out;
}

ProcessHandle spawn_reader(const std::string& program,
                           const std::vector<std::string>& args) {
    ProcessHandle handle;

    SECURITY_ATTRIBUTES sa = {};
    sa.nLength = sizeof(sa);
    sa.bInheritHandle = TRUE;

    HANDLE out_read = INVALID_HANDLE_VALUE, out_write = INVALID_HANDLE_VALUE;
    if (!CreatePipe(&out_read, &out_write, &sa, 0)) return handle;
    SetHandleInformation(out_read, HANDLE_FLAG_INHERIT, 0);

    STARTUPINFOA si = {};
    si.cb = sizeof(si);
    si.dwFlags |= STARTF_USESTDHANDLES;
    si.hStdOutput = out_write;
    si.hStdError = INVALID_HANDLE_VALUE;
    si.hStdInput = INVALID_HANDLE_VALUE;
    PROCESS_INFORMATION pi = {};

    std::string cmd_str = build_command_line(program, args);
    if (CreateProcessA(nullptr, cmd_str.data(), nullptr, nullptr, TRUE,
                       CREATE_NO_WINDOW, nullptr, nullptr, &si, &pi)) {
        handle.handle_ = pi.hProcess;
        handle.thread_ = pi.hThread;
        handle.stdout_ = out_read;
    } else {
        CloseHandle(out_read);
    }
    CloseHandle(out_write);
    return handle;
}

ProcessOutput run_process(const std::string& program,
                          const std::vector<std::string>& args,
                          const std::string& stdin_data) {
    ProcessOutput result;

    SECURITY_ATTRIBUTES sa = {};
    sa.nLength = sizeof(sa);
    sa.bInheritHandle = TRUE;

    HANDLE in_read, in_write, out_read, out_write, err_read, err_write;
    if (!CreatePipe(&in_read, &in_write, &sa, 0)) return result;
    if (!CreatePipe(&out_read, &out_write, &sa, 0)) {
        CloseHandle(in_read); CloseHandle(in_write);
        return result;
    }
    if (!CreatePipe(&err_read, &err_write, &sa, 0)) {
        CloseHandle(in_read); CloseHandle(in_write);
        CloseHandle(out_read); CloseHandle(out_write);
        return result;
    }
    SetHandleInformation(in_write, HANDLE_FLAG_INHERIT, 0);
    SetHandleInformation(out_read, HANDLE_FLAG_INHERIT, 0);
    SetHandleInformation(err_read, HANDLE_FLAG_INHERIT, 0);

    STARTUPINFOA si = {};
    si.cb = sizeof(si);
    si.dwFlags |= STARTF_USESTDHANDLES;
    si.hStdInput = in_read;
    si.hStdOutput = out_write;
    si.hStdError = err_write;
    PROCESS_INFORMATION pi = {};

    std::string cmd_str = build_command_line(program, args);
    BOOL ok = CreateProcessA(nullptr, cmd_str.data(), nullptr, nullptr, TRUE,
                             CREATE_NO_WINDOW, nullptr, nullptr, &si, &pi);
    CloseHandle(in_read);
    CloseHandle(out_write);
    CloseHandle(err_write);

    if (!ok) {
        CloseHandle(in_write);
        CloseHandle(out_read);
        CloseHandle(err_read);
        result.exit_code = EXEC_FAILED_EXIT_CODE;
        result.stderr_data = "failed to execute " + program;
        return result;
    }

    std::thread writer([&]() {
        DWORD written = 0;
        if (!stdin_data.empty()) {
            WriteFile(in_write, stdin_data.data(), static_cast<DWORD>(stdin_data.size()),
                      &written, nullptr);
        }
        CloseHandle(in_write);
    });
    std::thread err_reader([&]() { result.stderr_data = drain_handle(err_read); });
    result.stdout_data = drain_handle(out_read);
    writer.join();
    err_reader.join();

    WaitForSingleObject(pi.hProcess, INFINITE);
    DWORD code = 1;
    GetExitCodeProcess(pi.hProcess, &code);
    result.exit_code = static_cast<int>(code);

    CloseHandle(out_read);
    CloseHandle(err_read);
    CloseHandle(pi.hProcess);
    CloseHandle(pi.hThread);
    return result;
}

#else // Unix

static void exec_child(const std::string& program, const std::vector<std::string>& args) {
    std::vector<const char*> argv;
    argv.push_back(program.c_str());
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    execvp(program.c_str(), const_cast<char* const*>(argv.data()));
    _exit(EXEC_FAILED_EXIT_CODE);  // exec failed
}

static void set_cloexec(int fd) {
    fcntl(fd, F_SETFD, fcntl(fd, F_GETFD) | FD_CLOEXEC);
}

ProcessHandle spawn_reader(const std::string& program,
                           const std::vector<std::string>& args) {
    ProcessHandle handle;

    int out_pipe[2];
    if (pipe(out_pipe) != 0) return handle;
    set_cloexec(out_pipe[0]);

    pid_t pid = fork();
    if (pid < 0) {
        close(out_pipe[0]);
        close(out_pipe[1]);
        return handle;
    }

    if (pid == 0) {
        int devnull = open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            dup2(devnull, STDERR_FILENO);
            close(devnull);
        }
        dup2(out_pipe[1], STDOUT_FILENO);
        close(out_pipe[0]);
        close(out_pipe[1]);
        exec_child(program, args);
    }

    close(out_pipe[1]);
    handle.pid_ = pid;
    handle.stdout_fd_ = out_pipe[0];
    return handle;
}

ProcessOutput run_process(const std::string& program,
                          const std::vector<std::string>& args,
                          const std::string& stdin_data) {
    ProcessOutput result;

    // A child that exits before consuming stdin must not kill us with SIGPIPE
    static const bool sigpipe_ignored = [] { signal(SIGPIPE, SIG_IGN); return true; }();
    (void)sigpipe_ignored;

    int in_pipe[2], out_pipe[2], err_pipe[2];
    if (pipe(in_pipe) != 0) return result;
    if (pipe(out_pipe) != 0) {
        close(in_pipe[0]); close(in_pipe[1]);
        return result;
    }
    if (pipe(err_pipe) != 0) {
        close(in_pipe[0]); close(in_pipe[1]);
        close(out_pipe[0]); close(out_pipe[1]);
        return result;
    }
    set_cloexec(in_pipe[1]);
    set_cloexec(out_pipe[0]);
    set_cloexec(err_pipe[0]);

    pid_t pid = fork();
    if (pid < 0) {
        for (int fd : {in_pipe[0], in_pipe[1], out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]})
            close(fd);
        result.stderr_data = std::string("fork failed: ") + std::strerror(errno);
        return result;
    }

    if (pid == 0) {
        dup2(in_pipe[0], STDIN_FILENO);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        for (int fd : {in_pipe[0], in_pipe[1], out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]})
            close(fd);
        exec_child(program, args);
    }

    close(in_pipe[0]);
    close(out_pipe[1]);
    close(err_pipe[1]);

    int in_fd = in_pipe[1];
    int out_fd = out_pipe[0];
    int err_fd = err_pipe[0];
    fcntl(in_fd, F_SETFL, fcntl(in_fd, F_GETFL) | O_NONBLOCK);

    std::size_t written = 0;
    if (stdin_data.empty()) {
        close(in_fd);
        in_fd = -1;
    }

    char buf[PROCESS_READ_BUF_SIZE];
    while (out_fd >= 0 || err_fd >= 0) {
        struct pollfd fds[3];
        int nfds = 0;
        int out_idx = -1, err_idx = -1, in_idx = -1;
        if (out_fd >= 0) { fds[nfds] = {out_fd, POLLIN, 0}; out_idx = nfds++; }
        if (err_fd >= 0) { fds[nfds] = {err_fd, POLLIN, 0}; err_idx = nfds++; }
        if (in_fd >= 0)  { fds[nfds] = {in_fd, POLLOUT, 0}; in_idx = nfds++; }

        if (poll(fds, static_cast<nfds_t>(nfds), -1) < 0) {
            if (errno == EINTR) continue;
            break;
        }

        if (in_idx >= 0 && (fds[in_idx].revents & (POLLOUT | POLLERR | POLLHUP))) {
            ssize_t n = write(in_fd, stdin_data.data() + written, stdin_data.size() - written);
            if (n > 0) written += static_cast<std::size_t>(n);
            if (n < 0 && errno != EAGAIN && errno != EINTR) written = stdin_data.size();
            if (written >= stdin_data.size()) {
                close(in_fd);
                in_fd = -1;
            }
        }
        if (out_idx >= 0 && (fds[out_idx].revents & (POLLIN | POLLHUP | POLLERR))) {
            ssize_t n = read(out_fd, buf, sizeof(buf));
            if (n > 0) result.stdout_data.append(buf, static_cast<std::size_t>(n));
            else if (n == 0 || errno != EINTR) { close(out_fd); out_fd = -1; }
        }
        if (err_idx >= 0 && (fds[err_idx].revents & (POLLIN | POLLHUP | POLLERR))) {
            ssize_t n = read(err_fd, buf, sizeof(buf));
            if (n > 0) result.stderr_data.append(buf, static_cast<std::size_t>(n));
            else if (n == 0 || errno != EINTR) { close(err_fd); err_fd = -1; }
        }
    }
    if (in_fd >= 0) close(in_fd);
    if (out_fd >= 0) close(out_fd);
    if (err_fd >= 0) close(err_fd);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
    result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    return result;
}

#endif

} // namespace platform
