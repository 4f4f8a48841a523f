// =============================================================================
// Tapshot - getevent Stream Reader Implementation
// =============================================================================
#include "getevent_reader.hpp"
#include "adb_bridge.hpp"
#include "tapshot_log.hpp"

#include <chrono>
#include <regex>

static constexpr const char* TAG = "getevent";

namespace tapshot {

GeteventReader::GeteventReader(GeteventReaderOptions opts) : opts_(std::move(opts)) {
    if (opts_.capacity == 0) opts_.capacity = 1;
}

GeteventReader::~GeteventReader() {
    stop();
}

Result<void> GeteventReader::start() {
    if (reader_.joinable()) return Ok();

    auto started = process_.start(opts_.command);
    if (started.is_err()) {
        return wrapError(ErrorKind::Connection, "getevent", started.error());
    }
    stop_requested_ = false;
    producer_done_ = false;
    reader_ = std::thread(&GeteventReader::readerLoop, this);
    return Ok();
}

void GeteventReader::readerLoop() {
    std::string line;
    while (!stop_requested_.load()) {
        auto status = process_.readLine(line, 200);
        if (status == LineProcess::ReadStatus::Timeout) continue;
        if (status == LineProcess::ReadStatus::Eof) {
            TLOG_WARN(TAG, "Producer closed its output");
            break;
        }

        std::unique_lock<std::mutex> lk(mutex_);
        not_full_.wait(lk, [this] {
            return queue_.size() < opts_.capacity || stop_requested_.load();
        });
        if (stop_requested_.load()) break;
        queue_.push_back(std::move(line));
        lk.unlock();
        not_empty_.notify_one();
    }

    {
        std::lock_guard<std::mutex> lk(mutex_);
        producer_done_ = true;
    }
    not_empty_.notify_all();
}

void GeteventReader::stop() {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        stop_requested_ = true;
    }
    not_full_.notify_all();
    not_empty_.notify_all();

    // The reader polls in 200ms slices, so it notices the flag promptly.
    // The process is only touched again once the reader is gone.
    if (reader_.joinable()) reader_.join();
    process_.stop(opts_.stop_grace_ms);
}

std::optional<std::string> GeteventReader::pop(int timeout_ms) {
    std::unique_lock<std::mutex> lk(mutex_);
    bool ready = not_empty_.wait_for(lk, std::chrono::milliseconds(timeout_ms), [this] {
        return !queue_.empty() || producer_done_.load();
    });
    if (!ready || queue_.empty()) return std::nullopt;

    std::string line = std::move(queue_.front());
    queue_.pop_front();
    lk.unlock();
    not_full_.notify_one();
    return line;
}

bool GeteventReader::finished() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return producer_done_.load() && queue_.empty();
}

size_t GeteventReader::queued() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return queue_.size();
}

// =============================================================================
// Command line / touch device detection
// =============================================================================

std::vector<std::string> geteventCommand(const std::string& adb_path, const std::string& serial,
                                         const std::string& device) {
    std::vector<std::string> argv{adb_path};
    if (!serial.empty()) {
        argv.push_back("-s");
        argv.push_back(serial);
    }
    argv.push_back("shell");
    argv.push_back("getevent");
    argv.push_back("-lt");
    if (!device.empty()) argv.push_back(device);
    return argv;
}

std::string selectTouchDevice(const std::string& output) {
    static const std::regex dev_regex(R"(add device \d+:\s+(/dev/input/event\d+))");
    static const std::regex name_regex(R"re(name:\s+"(.+?)")re");
    static const std::regex btn_regex("BTN_TOUCH", std::regex::icase);
    static const std::regex x_regex("ABS_MT_POSITION_X|ABS_X", std::regex::icase);
    static const std::regex y_regex("ABS_MT_POSITION_Y|ABS_Y", std::regex::icase);
    static const std::regex hint_regex("touch|ts|finger", std::regex::icase);

    // Split into "add device N: ..." blocks
    std::vector<std::string> blocks;
    size_t pos = output.find("add device ");
    while (pos != std::string::npos) {
        size_t next = output.find("\nadd device ", pos + 1);
        blocks.push_back(output.substr(pos, next == std::string::npos ? std::string::npos : next - pos));
        pos = next == std::string::npos ? next : next + 1;
    }

    std::string best;
    int best_score = 0;
    for (const auto& blk : blocks) {
        std::smatch m;
        if (!std::regex_search(blk, m, dev_regex)) continue;
        std::string dev = m[1].str();

        std::string name;
        std::smatch nm;
        if (std::regex_search(blk, nm, name_regex)) name = nm[1].str();

        int score = 0;
        if (std::regex_search(blk, btn_regex)) score += 2;
        if (std::regex_search(blk, x_regex) && std::regex_search(blk, y_regex)) score += 2;
        if (std::regex_search(name, hint_regex)) score += 1;

        TLOG_DEBUG(TAG, "Candidate %s \"%s\" score=%d", dev.c_str(), name.c_str(), score);
        if (score > best_score) {
            best = dev;
            best_score = score;
        }
    }
    return best;
}

std::string detectTouchDevice(const AdbBridge& adb) {
    auto r = adb.run({"shell", "getevent", "-pl"}, 10000);
    if (r.is_err() || r.value().exit_code != 0) {
        TLOG_WARN(TAG, "getevent -pl failed, listening to all devices");
        return "";
    }
    std::string dev = selectTouchDevice(r.value().out);
    if (dev.empty()) {
        TLOG_WARN(TAG, "No touch device recognised, listening to all devices");
    } else {
        TLOG_INFO(TAG, "Touch device: %s", dev.c_str());
    }
    return dev;
}

} // namespace tapshot
