#pragma once
// =============================================================================
// Tapshot - Child Process Helpers
// =============================================================================
// runProcess():  spawn argv, collect stdout/stderr, bounded by a timeout.
// LineProcess:   long-lived child whose stdout is consumed line by line
//                (used for `adb shell getevent`). stop() is cooperative:
//                SIGTERM -> grace period -> SIGKILL.
// =============================================================================

#include <string>
#include <vector>
#include <sys/types.h>

#include "result.hpp"

namespace tapshot {

struct ProcessOutput {
    int exit_code = -1;
    std::string out;     // raw stdout bytes (may be binary)
    std::string err;     // stderr text
};

// RAII file descriptor
class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;
    UniqueFd(UniqueFd&& o) noexcept : fd_(o.release()) {}
    UniqueFd& operator=(UniqueFd&& o) noexcept {
        if (this != &o) reset(o.release());
        return *this;
    }

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }
    int release() { int f = fd_; fd_ = -1; return f; }
    void reset(int fd = -1);

private:
    int fd_ = -1;
};

// Runs argv[0] (PATH lookup) and waits for it to exit.
// Exit status 127 from the child is reported as IoError::Kind::NotFound.
Result<ProcessOutput, IoError> runProcess(const std::vector<std::string>& argv,
                                          int timeout_ms);

// Quote one argument for a POSIX shell (used for `adb shell` payloads).
std::string shellQuote(const std::string& arg);

class LineProcess {
public:
    enum class ReadStatus { Line, Timeout, Eof };

    LineProcess() = default;
    ~LineProcess();

    LineProcess(const LineProcess&) = delete;
    LineProcess& operator=(const LineProcess&) = delete;

    Result<void, IoError> start(const std::vector<std::string>& argv);

    // Blocks up to timeout_ms for one complete line (without the trailing
    // newline). A trailing partial line is delivered once the pipe closes.
    ReadStatus readLine(std::string& line, int timeout_ms);

    // Non-blocking liveness check; reaps the child if it already exited.
    bool running();

    void stop(int grace_ms);

    pid_t pid() const { return pid_; }
    int exitCode() const { return exit_code_; }

private:
    bool waitExit(int timeout_ms);

    pid_t pid_ = -1;
    int exit_code_ = -1;
    UniqueFd out_;
    std::string pending_;
    bool eof_ = false;
};

} // namespace tapshot
