// =============================================================================
// Tapshot - Child Process Helpers Implementation
// =============================================================================
#include "process_runner.hpp"
#include "tapshot_log.hpp"

#include <unistd.h>
#include <sys/wait.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <cerrno>
#include <cstring>
#include <chrono>
#include <thread>

static constexpr const char* TAG = "process";

namespace tapshot {

namespace {

using Clock = std::chrono::steady_clock;

int elapsedMs(Clock::time_point since) {
    return (int)std::chrono::duration_cast<std::chrono::milliseconds>(
        Clock::now() - since).count();
}

std::vector<char*> toArgv(const std::vector<std::string>& argv) {
    std::vector<char*> out;
    out.reserve(argv.size() + 1);
    for (const auto& a : argv) out.push_back(const_cast<char*>(a.c_str()));
    out.push_back(nullptr);
    return out;
}

std::string joinArgs(const std::vector<std::string>& argv) {
    std::string s;
    for (const auto& a : argv) {
        if (!s.empty()) s += ' ';
        s += a;
    }
    return s;
}

int decodeStatus(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

// Child side of fork(): wire stdio and exec. Never returns.
[[noreturn]] void execChild(const std::vector<char*>& args, int out_fd, int err_fd) {
    dup2(out_fd, STDOUT_FILENO);
    dup2(err_fd, STDERR_FILENO);
    int null_fd = open("/dev/null", O_RDONLY);
    if (null_fd >= 0) {
        dup2(null_fd, STDIN_FILENO);
        close(null_fd);
    }
    execvp(args[0], args.data());
    _exit(127);
}

} // namespace

void UniqueFd::reset(int fd) {
    if (fd_ >= 0) close(fd_);
    fd_ = fd;
}

std::string shellQuote(const std::string& arg) {
    std::string out = "'";
    for (char c : arg) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += "'";
    return out;
}

// =============================================================================
// runProcess
// =============================================================================

Result<ProcessOutput, IoError> runProcess(const std::vector<std::string>& argv,
                                          int timeout_ms) {
    if (argv.empty()) return IoError("empty command line");

    int out_pipe[2];
    int err_pipe[2];
    if (pipe2(out_pipe, O_CLOEXEC) < 0) {
        return IoError(std::string("pipe failed: ") + strerror(errno));
    }
    UniqueFd out_r(out_pipe[0]), out_w(out_pipe[1]);
    if (pipe2(err_pipe, O_CLOEXEC) < 0) {
        return IoError(std::string("pipe failed: ") + strerror(errno));
    }
    UniqueFd err_r(err_pipe[0]), err_w(err_pipe[1]);

    auto args = toArgv(argv);
    pid_t pid = fork();
    if (pid < 0) {
        return IoError(std::string("fork failed: ") + strerror(errno));
    }
    if (pid == 0) {
        execChild(args, out_w.get(), err_w.get());
    }
    out_w.reset();
    err_w.reset();

    ProcessOutput result;
    auto start = Clock::now();
    char buffer[8192];
    bool out_open = true, err_open = true;

    while (out_open || err_open) {
        int remaining = timeout_ms - elapsedMs(start);
        if (remaining <= 0) {
            kill(pid, SIGKILL);
            waitpid(pid, nullptr, 0);
            TLOG_WARN(TAG, "Timed out after %dms: %s", timeout_ms, joinArgs(argv).c_str());
            return IoError("command timed out: " + joinArgs(argv), IoError::Kind::Timeout);
        }

        struct pollfd pfds[2];
        int n = 0;
        int out_idx = -1, err_idx = -1;
        if (out_open) { pfds[n] = {out_r.get(), POLLIN, 0}; out_idx = n++; }
        if (err_open) { pfds[n] = {err_r.get(), POLLIN, 0}; err_idx = n++; }

        int ret = poll(pfds, n, remaining < 100 ? remaining : 100);
        if (ret < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (ret == 0) continue;

        if (out_idx >= 0 && (pfds[out_idx].revents & (POLLIN | POLLHUP | POLLERR))) {
            ssize_t r = read(out_r.get(), buffer, sizeof(buffer));
            if (r > 0) result.out.append(buffer, static_cast<size_t>(r));
            else if (r == 0 || errno != EINTR) out_open = false;
        }
        if (err_idx >= 0 && (pfds[err_idx].revents & (POLLIN | POLLHUP | POLLERR))) {
            ssize_t r = read(err_r.get(), buffer, sizeof(buffer));
            if (r > 0) result.err.append(buffer, static_cast<size_t>(r));
            else if (r == 0 || errno != EINTR) err_open = false;
        }
    }

    int status = 0;
    if (waitpid(pid, &status, 0) < 0) {
        return IoError(std::string("waitpid failed: ") + strerror(errno));
    }
    result.exit_code = decodeStatus(status);
    if (result.exit_code == 127) {
        return IoError("command not found: " + argv[0], IoError::Kind::NotFound);
    }

    TLOG_TRACE(TAG, "exit=%d (%dms, %zu bytes): %s", result.exit_code, elapsedMs(start),
               result.out.size(), joinArgs(argv).c_str());
    return result;
}

// =============================================================================
// LineProcess
// =============================================================================

LineProcess::~LineProcess() {
    stop(0);
}

Result<void, IoError> LineProcess::start(const std::vector<std::string>& argv) {
    if (pid_ > 0) return IoError("process already running");
    if (argv.empty()) return IoError("empty command line");

    int out_pipe[2];
    if (pipe2(out_pipe, O_CLOEXEC) < 0) {
        return IoError(std::string("pipe failed: ") + strerror(errno));
    }
    UniqueFd out_r(out_pipe[0]), out_w(out_pipe[1]);

    auto args = toArgv(argv);
    pid_t pid = fork();
    if (pid < 0) {
        return IoError(std::string("fork failed: ") + strerror(errno));
    }
    if (pid == 0) {
        int null_fd = open("/dev/null", O_WRONLY);
        execChild(args, out_w.get(), null_fd >= 0 ? null_fd : out_w.get());
    }
    out_w.reset();

    pid_ = pid;
    exit_code_ = -1;
    out_ = std::move(out_r);
    pending_.clear();
    eof_ = false;
    TLOG_INFO(TAG, "Started pid=%d: %s", (int)pid_, joinArgs(argv).c_str());
    return Result<void, IoError>();
}

LineProcess::ReadStatus LineProcess::readLine(std::string& line, int timeout_ms) {
    auto start = Clock::now();
    char buffer[4096];

    while (true) {
        size_t nl = pending_.find('\n');
        if (nl != std::string::npos) {
            line = pending_.substr(0, nl);
            pending_.erase(0, nl + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return ReadStatus::Line;
        }
        if (eof_ || !out_.valid()) {
            if (!pending_.empty()) {
                line.swap(pending_);
                pending_.clear();
                return ReadStatus::Line;
            }
            return ReadStatus::Eof;
        }

        int remaining = timeout_ms - elapsedMs(start);
        if (remaining <= 0) return ReadStatus::Timeout;

        struct pollfd pfd = {out_.get(), POLLIN, 0};
        int ret = poll(&pfd, 1, remaining);
        if (ret < 0) {
            if (errno == EINTR) continue;
            eof_ = true;
            continue;
        }
        if (ret == 0) return ReadStatus::Timeout;

        ssize_t r = read(out_.get(), buffer, sizeof(buffer));
        if (r > 0) {
            pending_.append(buffer, static_cast<size_t>(r));
        } else if (r == 0 || errno != EINTR) {
            eof_ = true;
        }
    }
}

bool LineProcess::running() {
    if (pid_ <= 0) return false;
    int status = 0;
    pid_t w = waitpid(pid_, &status, WNOHANG);
    if (w == pid_) {
        exit_code_ = decodeStatus(status);
        pid_ = -1;
        return false;
    }
    return true;
}

bool LineProcess::waitExit(int timeout_ms) {
    auto start = Clock::now();
    while (running()) {
        if (elapsedMs(start) >= timeout_ms) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return true;
}

void LineProcess::stop(int grace_ms) {
    if (pid_ > 0) {
        pid_t pid = pid_;
        kill(pid, SIGTERM);
        if (!waitExit(grace_ms)) {
            TLOG_WARN(TAG, "pid=%d ignored SIGTERM for %dms, killing", (int)pid, grace_ms);
            kill(pid, SIGKILL);
            int status = 0;
            if (waitpid(pid, &status, 0) == pid) exit_code_ = decodeStatus(status);
            pid_ = -1;
        }
        TLOG_INFO(TAG, "Stopped pid=%d (exit=%d)", (int)pid, exit_code_);
    }
    out_.reset();
    eof_ = true;
}

} // namespace tapshot
