// =============================================================================
// Tapshot - Capture Ledger Implementation
// =============================================================================
#include "ledger.hpp"
#include "tapshot_log.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>

static constexpr const char* TAG = "ledger";

namespace fs = std::filesystem;

namespace tapshot {

Ledger::Ledger(std::string path) : path_(std::move(path)) {}

Result<nlohmann::json> Ledger::load() const {
    std::error_code ec;
    if (!fs::exists(path_, ec)) return nlohmann::json::array();

    std::ifstream f(path_, std::ios::binary);
    if (!f.is_open()) {
        return Err<nlohmann::json>(ErrorKind::Ledger, "cannot open " + path_);
    }

    std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    if (content.find_first_not_of(" \t\r\n") == std::string::npos) {
        return nlohmann::json::array();
    }

    try {
        nlohmann::json j = nlohmann::json::parse(content);
        if (!j.is_array()) {
            return Err<nlohmann::json>(ErrorKind::Ledger, path_ + " is not a JSON array");
        }
        return j;
    } catch (const nlohmann::json::exception& e) {
        TLOG_ERROR(TAG, "Corrupt ledger %s: %s", path_.c_str(), e.what());
        return Err<nlohmann::json>(ErrorKind::Ledger,
                                   "corrupt ledger " + path_ + ": " + e.what());
    }
}

Result<void> Ledger::store(const nlohmann::json& array) const {
    fs::path target(path_);
    std::error_code ec;
    if (target.has_parent_path()) fs::create_directories(target.parent_path(), ec);

    const std::string tmp = path_ + ".tmp";
    {
        std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
        if (!f.is_open()) {
            return Err<void>(ErrorKind::Ledger, "cannot write " + tmp);
        }
        f << array.dump(2);
        f.flush();
        if (!f) {
            return Err<void>(ErrorKind::Ledger, "write failed: " + tmp);
        }
    }

    if (std::rename(tmp.c_str(), path_.c_str()) != 0) {
        std::remove(tmp.c_str());
        return Err<void>(ErrorKind::Ledger, "rename failed: " + tmp + " -> " + path_);
    }
    return Ok();
}

Result<size_t> Ledger::size() const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto j = TAPSHOT_TRY(load());
    return j.size();
}

Result<nlohmann::json> Ledger::records() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return load();
}

Result<size_t> Ledger::append(nlohmann::json record) {
    if (!record.is_object()) {
        return Err<size_t>(ErrorKind::Ledger, "record must be a JSON object");
    }

    std::lock_guard<std::mutex> lk(mutex_);
    auto array = TAPSHOT_TRY(load());
    const size_t id = array.size();

    auto it = record.find("sequence_id");
    if (it != record.end() && !(it->is_number_unsigned() || it->is_number_integer())) {
        return Err<size_t>(ErrorKind::Ledger, "sequence_id must be an integer");
    }
    if (it != record.end() && it->get<long long>() != static_cast<long long>(id)) {
        return Err<size_t>(ErrorKind::Ledger,
                           "sequence_id " + it->dump() + " does not match next id " +
                           std::to_string(id));
    }
    record["sequence_id"] = id;

    array.push_back(std::move(record));
    auto stored = store(array);
    if (stored.is_err()) return stored.error();

    TLOG_DEBUG(TAG, "Appended record %zu", id);
    return id;
}

Result<void> Ledger::reset() {
    std::lock_guard<std::mutex> lk(mutex_);
    TLOG_INFO(TAG, "Resetting %s", path_.c_str());
    return store(nlohmann::json::array());
}

} // namespace tapshot
