#include "furnace/log.h"
#include "furnace/hash.h"
#include "furnace/json_mini.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace furnace {

std::string iso_now() {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t t = system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::string chain_line(json_object* rec, const std::string& chain_prev, std::string* chain_hash) {
    std::string record = json_mini::canonical(rec);
    std::string head = hash::sha256_hex(chain_prev + record);
    if (chain_hash) *chain_hash = head;

    // final line: chain fields + canonical record fields
    json_object_object_add(rec, "chain_prev", json_mini::new_string(chain_prev));
    json_object_object_add(rec, "chain_hash", json_mini::new_string(head));
    std::string line = json_mini::canonical(rec);
    json_object_object_del(rec, "chain_prev");
    json_object_object_del(rec, "chain_hash");
    return line;
}

std::string verify_chain_line(const std::string& line, const std::string& chain_prev, std::string* chain_hash) {
    json_mini::Doc d = json_mini::parse(line);
    if (!d || !json_object_is_type(d.root, json_type_object)) return "not a JSON object";
    auto prev = json_mini::get_string(d.root, "chain_prev");
    auto head = json_mini::get_string(d.root, "chain_hash");
    if (!prev || !head) return "missing chain fields";
    if (*prev != chain_prev) return "chain_prev does not link to previous entry";

    json_object_object_del(d.root, "chain_prev");
    json_object_object_del(d.root, "chain_hash");
    std::string want = hash::sha256_hex(chain_prev + json_mini::canonical(d.root));
    if (want != *head) return "chain_hash mismatch";
    if (chain_hash) *chain_hash = *head;
    return "";
}

JsonlLogger::JsonlLogger(const RunHeader& hdr, const std::string& path)
    : hdr_(hdr), path_(path), out_(path, std::ios::out | std::ios::trunc), chain_prev_(hash::zero_chain()) {}

void JsonlLogger::set_artifact_id(const std::string& id) {
    std::lock_guard<std::mutex> lk(mu_);
    hdr_.artifact_id = id;
}

void JsonlLogger::event(const std::string& name, const std::string& payload_json) {
    std::lock_guard<std::mutex> lk(mu_);
    if (!out_.good()) return;

    json_object* rec = json_object_new_object();
    json_object_object_add(rec, "event", json_mini::new_string(name));

    json_mini::Doc payload = json_mini::parse(payload_json);
    json_object_object_add(rec, "payload", payload ? payload.release() : json_mini::new_string(payload_json));

    if (!hdr_.artifact_id.empty())
        json_object_object_add(rec, "artifact_id", json_mini::new_string(hdr_.artifact_id));
    json_object_object_add(rec, "harness_version", json_mini::new_string(hdr_.harness_version));
    json_object_object_add(rec, "run_id", json_mini::new_string(hdr_.run_id));
    json_object_object_add(rec, "step", json_object_new_int(++step_));
    json_object_object_add(rec, "ts", json_mini::new_string(iso_now()));

    std::string head;
    std::string line = chain_line(rec, chain_prev_, &head);
    json_object_put(rec);

    out_ << line << "\n";
    out_.flush();
    chain_prev_ = head;
}

} // namespace furnace
