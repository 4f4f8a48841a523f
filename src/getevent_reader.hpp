#pragma once
// =============================================================================
// Tapshot - getevent Stream Reader
// =============================================================================
// Owns the `adb shell getevent -lt [device]` producer and a reader thread
// that moves its output lines into a bounded queue for one consumer.
//
// When the queue is full the reader waits for the consumer (the adb pipe
// buffers meanwhile). stop() is cooperative: SIGTERM, grace period, SIGKILL.
// If the producer exits on its own the reader thread ends and pop() reports
// the stream as finished once the queue is drained.
// =============================================================================

#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "process_runner.hpp"
#include "result.hpp"

namespace tapshot {

class AdbBridge;

struct GeteventReaderOptions {
    std::vector<std::string> command;   // full argv of the producer
    size_t capacity = 1000;
    int stop_grace_ms = 2000;
};

class GeteventReader {
public:
    explicit GeteventReader(GeteventReaderOptions opts);
    ~GeteventReader();

    GeteventReader(const GeteventReader&) = delete;
    GeteventReader& operator=(const GeteventReader&) = delete;

    Result<void> start();
    void stop();

    // Waits up to timeout_ms for the next line.
    std::optional<std::string> pop(int timeout_ms);

    // Producer gone and queue drained
    bool finished() const;
    size_t queued() const;

private:
    void readerLoop();

    GeteventReaderOptions opts_;
    LineProcess process_;
    std::thread reader_;
    std::atomic<bool> stop_requested_{false};
    std::atomic<bool> producer_done_{false};

    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<std::string> queue_;
};

// argv for `adb [-s serial] shell getevent -lt [device]`
std::vector<std::string> geteventCommand(const std::string& adb_path, const std::string& serial,
                                         const std::string& device);

// Picks the most touch-like /dev/input/eventN from `getevent -pl` output:
// +2 BTN_TOUCH, +2 X and Y position axes, +1 name mentions touch/ts/finger.
// Highest positive score wins (first one on ties); empty when none scores.
std::string selectTouchDevice(const std::string& getevent_pl_output);

// Runs `getevent -pl` through the bridge and applies selectTouchDevice().
std::string detectTouchDevice(const AdbBridge& adb);

} // namespace tapshot
