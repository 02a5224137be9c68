/**
 * @file ProcessRunner.cpp
 * @brief POSIX (fork/execvp/poll) and Win32 (CreateProcess) implementations of ProcessRunner.
 */
#include "infrastructure/ProcessRunner.hpp"

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstring>
#include <iostream>

#if defined(_WIN32)
#include <thread>
#include <windows.h>
#else
#include <array>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace docxpdf::infrastructure {

namespace {

using Clock = std::chrono::steady_clock;

// Longer timeouts are treated as this; keeps deadline arithmetic and wait arguments in range.
constexpr std::chrono::milliseconds kMaxTimeout = std::chrono::hours(24 * 365);

std::chrono::milliseconds Since(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

#if !defined(_WIN32)

void CloseFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Both ends are close-on-exec so concurrent spawns never inherit each other's pipes.
bool MakePipe(int fds[2]) {
#if defined(__linux__)
    return ::pipe2(fds, O_CLOEXEC) == 0;
#else
    if (::pipe(fds) != 0) {
        return false;
    }
    ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    return true;
#endif
}

int DecodeWaitStatus(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

void KillGroup(pid_t pid) {
    ::kill(-pid, SIGKILL);
    ::kill(pid, SIGKILL);
}

// Waits for the child until the deadline. Returns false if it is still running.
bool WaitUntil(pid_t pid, Clock::time_point deadline, int& status) {
    while (true) {
        pid_t rc = ::waitpid(pid, &status, WNOHANG);
        if (rc == pid) return true;
        if (rc < 0 && errno != EINTR) {
            status = 0;
            return true;
        }
        if (Clock::now() >= deadline) return false;
        ::usleep(10 * 1000);
    }
}

#else

std::string QuoteArgument(const std::string& arg) {
    if (!arg.empty() && arg.find_first_of(" \t\"") == std::string::npos) {
        return arg;
    }
    std::string quoted = "\"";
    size_t backslashes = 0;
    for (char c : arg) {
        if (c == '\\') {
            ++backslashes;
            continue;
        }
        if (c == '"') {
            quoted.append(backslashes * 2 + 1, '\\');
        } else {
            quoted.append(backslashes, '\\');
        }
        backslashes = 0;
        quoted.push_back(c);
    }
    quoted.append(backslashes * 2, '\\');
    quoted.push_back('"');
    return quoted;
}

std::string LastErrorMessage() {
    DWORD code = ::GetLastError();
    char* buffer = nullptr;
    ::FormatMessageA(FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS,
                     nullptr, code, 0, reinterpret_cast<LPSTR>(&buffer), 0, nullptr);
    std::string message = buffer ? buffer : ("error " + std::to_string(code));
    if (buffer) ::LocalFree(buffer);
    return message;
}

void DrainPipe(HANDLE pipe, std::string& sink) {
    char buffer[4096];
    DWORD read = 0;
    while (::ReadFile(pipe, buffer, sizeof(buffer), &read, nullptr) && read > 0) {
        sink.append(buffer, read);
    }
}

#endif

} // namespace

#if !defined(_WIN32)

ProcessResult ProcessRunner::Run(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) {
    ProcessResult result;
    auto start = Clock::now();
    timeout = std::min(timeout, kMaxTimeout);
    auto deadline = start + timeout;

    if (argv.empty()) {
        result.stdErr = "No program given";
        return result;
    }

    // Prepared before fork: the child must not allocate.
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    int execPipe[2] = {-1, -1}; // Carries errno if execvp fails; closed by exec otherwise.

    if (!MakePipe(outPipe) || !MakePipe(errPipe) || !MakePipe(execPipe)) {
        result.stdErr = std::string("pipe() failed: ") + std::strerror(errno);
        for (int* p : {outPipe, errPipe, execPipe}) {
            CloseFd(p[0]);
            CloseFd(p[1]);
        }
        return result;
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        result.stdErr = std::string("fork() failed: ") + std::strerror(errno);
        for (int* p : {outPipe, errPipe, execPipe}) {
            CloseFd(p[0]);
            CloseFd(p[1]);
        }
        return result;
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        int devNull = ::open("/dev/null", O_RDONLY);
        if (devNull >= 0) ::dup2(devNull, STDIN_FILENO);
        ::dup2(outPipe[1], STDOUT_FILENO);
        ::dup2(errPipe[1], STDERR_FILENO);
        ::execvp(args[0], args.data());

        int err = errno;
        ssize_t ignored = ::write(execPipe[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    ::setpgid(pid, pid);
    CloseFd(outPipe[1]);
    CloseFd(errPipe[1]);
    CloseFd(execPipe[1]);

    int execErrno = 0;
    ssize_t n;
    do {
        n = ::read(execPipe[0], &execErrno, sizeof(execErrno));
    } while (n < 0 && errno == EINTR);
    CloseFd(execPipe[0]);

    if (n == static_cast<ssize_t>(sizeof(execErrno))) {
        int status = 0;
        ::waitpid(pid, &status, 0);
        CloseFd(outPipe[0]);
        CloseFd(errPipe[0]);
        result.stdErr = "Failed to start '" + argv[0] + "': " + std::strerror(execErrno);
        result.elapsed = Since(start);
        return result;
    }
    result.launched = true;

    std::array<pollfd, 2> fds = {{{outPipe[0], POLLIN, 0}, {errPipe[0], POLLIN, 0}}};
    std::string* sinks[2] = {&result.stdOut, &result.stdErr};
    int openStreams = 2;
    char buffer[4096];

    while (openStreams > 0) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        if (remaining.count() <= 0) {
            result.timedOut = true;
            break;
        }

        auto waitMs = std::min<std::chrono::milliseconds::rep>(remaining.count(), INT_MAX);
        int rc = ::poll(fds.data(), fds.size(), static_cast<int>(waitMs));
        if (rc < 0) {
            if (errno == EINTR) continue;
            std::cerr << "[ProcessRunner] poll() failed: " << std::strerror(errno) << std::endl;
            break;
        }

        for (size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;
            ssize_t got = ::read(fds[i].fd, buffer, sizeof(buffer));
            if (got > 0) {
                sinks[i]->append(buffer, static_cast<size_t>(got));
            } else if (got == 0 || (errno != EINTR && errno != EAGAIN)) {
                ::close(fds[i].fd);
                fds[i].fd = -1;
                --openStreams;
            }
        }
    }

    int status = 0;
    if (!result.timedOut && !WaitUntil(pid, deadline, status)) {
        result.timedOut = true;
    }

    if (result.timedOut) {
        KillGroup(pid);
        ::waitpid(pid, &status, 0);
    } else {
        result.exitCode = DecodeWaitStatus(status);
    }

    for (auto& f : fds) {
        if (f.fd >= 0) ::close(f.fd);
    }

    result.elapsed = Since(start);
    return result;
}

#else

ProcessResult ProcessRunner::Run(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) {
    ProcessResult result;
    auto start = Clock::now();

    if (argv.empty()) {
        result.stdErr = "No program given";
        return result;
    }

    std::string commandLine;
    for (const auto& a : argv) {
        if (!commandLine.empty()) commandLine.push_back(' ');
        commandLine += QuoteArgument(a);
    }

    SECURITY_ATTRIBUTES sa{sizeof(SECURITY_ATTRIBUTES), nullptr, TRUE};
    HANDLE outRead = nullptr, outWrite = nullptr, errRead = nullptr, errWrite = nullptr;
    if (!::CreatePipe(&outRead, &outWrite, &sa, 0) || !::CreatePipe(&errRead, &errWrite, &sa, 0)) {
        result.stdErr = "CreatePipe failed: " + LastErrorMessage();
        for (HANDLE h : {outRead, outWrite, errRead, errWrite}) if (h) ::CloseHandle(h);
        return result;
    }
    ::SetHandleInformation(outRead, HANDLE_FLAG_INHERIT, 0);
    ::SetHandleInformation(errRead, HANDLE_FLAG_INHERIT, 0);

    STARTUPINFOA si{};
    si.cb = sizeof(si);
    si.dwFlags = STARTF_USESTDHANDLES;
    si.hStdInput = nullptr;
    si.hStdOutput = outWrite;
    si.hStdError = errWrite;

    PROCESS_INFORMATION pi{};
    BOOL created = ::CreateProcessA(nullptr, commandLine.data(), nullptr, nullptr, TRUE,
                                    CREATE_NO_WINDOW, nullptr, nullptr, &si, &pi);
    ::CloseHandle(outWrite);
    ::CloseHandle(errWrite);

    if (!created) {
        result.stdErr = "Failed to start '" + argv[0] + "': " + LastErrorMessage();
        ::CloseHandle(outRead);
        ::CloseHandle(errRead);
        result.elapsed = Since(start);
        return result;
    }
    result.launched = true;

    std::thread outReader(DrainPipe, outRead, std::ref(result.stdOut));
    std::thread errReader(DrainPipe, errRead, std::ref(result.stdErr));

    DWORD wait = ::WaitForSingleObject(
        pi.hProcess, static_cast<DWORD>(std::min<std::chrono::milliseconds::rep>(timeout.count(), INFINITE - 1)));
    if (wait == WAIT_TIMEOUT) {
        result.timedOut = true;
        ::TerminateProcess(pi.hProcess, 1);
        ::WaitForSingleObject(pi.hProcess, INFINITE);
    } else {
        DWORD code = 0;
        ::GetExitCodeProcess(pi.hProcess, &code);
        result.exitCode = static_cast<int>(code);
    }

    outReader.join();
    errReader.join();
    ::CloseHandle(outRead);
    ::CloseHandle(errRead);
    ::CloseHandle(pi.hThread);
    ::CloseHandle(pi.hProcess);

    result.elapsed = Since(start);
    return result;
}

#endif

} // namespace docxpdf::infrastructure
