#pragma once
#include "furnace/types.h"

#include <json-c/json.h>

#include <fstream>
#include <mutex>
#include <string>

namespace furnace {

// Hash-chain helpers shared by the run log and the outcome log.
// chain_hash = SHA256(chain_prev || canonical(record)); the emitted line is
// the canonical record plus "chain_prev" and "chain_hash".
std::string chain_line(json_object* rec, const std::string& chain_prev, std::string* chain_hash);

// Verify one emitted line against the expected previous head.
// Returns error string; on success *chain_hash receives the line's head.
std::string verify_chain_line(const std::string& line, const std::string& chain_prev, std::string* chain_hash);

std::string iso_now();

// Internal run log: one canonical JSONL record per event, hash-chained.
// Carries diagnostics (exit codes, output excerpts, halt reasons) that must
// never reach the public verdict.
class JsonlLogger {
public:
    JsonlLogger(const RunHeader& hdr, const std::string& path);

    void set_artifact_id(const std::string& id);
    void event(const std::string& name, const std::string& payload_json);

    const std::string& path() const { return path_; }
    bool ok() const { return out_.good(); }

private:
    std::mutex mu_;
    RunHeader hdr_;
    std::string path_;
    std::ofstream out_;
    std::string chain_prev_;
    int step_{0};
};

// nullptr-tolerant convenience
inline void log_event(JsonlLogger* log, const std::string& name, const std::string& payload_json) {
    if (log) log->event(name, payload_json);
}

} // namespace furnace
