#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>

namespace furnace {

// OutcomeLog: append-only, hash-chained JSONL log of terminal verdicts.
//
// Each append runs under an in-process mutex plus an exclusive flock() on
// the file, reads the current tail to continue the chain, assigns the next
// "seq", and emits the line with a single write(2) on an O_APPEND
// descriptor. Entries are never rewritten.
class OutcomeLog {
public:
    explicit OutcomeLog(std::filesystem::path path);
    ~OutcomeLog();

    OutcomeLog(const OutcomeLog&) = delete;
    OutcomeLog& operator=(const OutcomeLog&) = delete;

    void set_fsync(bool enable);

    // Opens (creating parent dirs and the file). Returns empty string on success.
    std::string open();

    // Appends one record (a JSON object without seq/chain fields).
    // Returns empty string on success; *seq_out / *head_out receive the
    // assigned sequence number and chain head.
    std::string append(const std::string& record_json, int64_t* seq_out = nullptr, std::string* head_out = nullptr);

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    int fd_ = -1;
    bool fsync_ = false;
    std::mutex mu_;
};

struct LogVerifyResult {
    bool ok{false};
    int64_t entries{0};
    int64_t bad_line{0}; // 1-based, 0 when ok
    std::string error;
    std::string head;    // chain head after the last good entry
};

// Re-verify every link and seq of an outcome log. A missing file is an
// empty, valid log.
LogVerifyResult verify_outcome_log(const std::filesystem::path& path);

} // namespace furnace
