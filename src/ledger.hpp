#pragma once
// =============================================================================
// Tapshot - Capture Ledger
// =============================================================================
// Append-only JSON array of capture records on disk. The i-th record carries
// "sequence_id" == i, so the next id is always the current array length.
//
// Every mutation is a whole-file read-modify-rewrite through "<path>.tmp" and
// rename(), leaving a valid array between operations. A file that exists but
// is not a JSON array is reported as a Ledger error and never overwritten.
// =============================================================================

#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

#include "result.hpp"

namespace tapshot {

class Ledger {
public:
    explicit Ledger(std::string path);

    const std::string& path() const { return path_; }

    // Current record count; a missing file counts as empty.
    Result<size_t> size() const;

    Result<nlohmann::json> records() const;

    // Appends one record. A "sequence_id" already present must equal the
    // current length; otherwise it is assigned. Returns the id.
    Result<size_t> append(nlohmann::json record);

    // Rewrites the file as [].
    Result<void> reset();

private:
    Result<nlohmann::json> load() const;
    Result<void> store(const nlohmann::json& array) const;

    std::string path_;
    mutable std::mutex mutex_;
};

} // namespace tapshot
