#include "furnace/outcome_log.h"
#include "furnace/hash.h"
#include "furnace/json_mini.h"
#include "furnace/log.h"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

namespace furnace {

namespace {

// RAII exclusive flock.
class FileLock {
public:
    explicit FileLock(int fd) : fd_(fd) {
        while (::flock(fd_, LOCK_EX) != 0) {
            if (errno != EINTR) {
                err_ = std::string("flock: ") + std::strerror(errno);
                return;
            }
        }
        held_ = true;
    }
    ~FileLock() {
        if (held_) (void)::flock(fd_, LOCK_UN);
    }
    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    const std::string& error() const { return err_; }

private:
    int fd_;
    bool held_{false};
    std::string err_;
};

// Last complete line of the file (without '\n'). Empty file -> empty line.
// A tail without a terminating newline is reported as torn.
std::string read_last_line(int fd, std::string* line) {
    line->clear();
    struct stat st{};
    if (::fstat(fd, &st) != 0) return std::string("fstat: ") + std::strerror(errno);
    off_t size = st.st_size;
    if (size == 0) return "";

    char last = 0;
    if (::pread(fd, &last, 1, size - 1) != 1) return std::string("pread: ") + std::strerror(errno);
    if (last != '\n') return "outcome log tail is torn";

    std::string tail;
    off_t end = size - 1; // exclude final newline
    const off_t chunk = 4096;
    while (end > 0) {
        off_t start = end > chunk ? end - chunk : 0;
        std::vector<char> buf((size_t)(end - start));
        ssize_t n = ::pread(fd, buf.data(), buf.size(), start);
        if (n != (ssize_t)buf.size()) return std::string("pread: ") + std::strerror(errno);
        tail.insert(0, buf.data(), buf.size());
        size_t nl = tail.rfind('\n');
        if (nl != std::string::npos) {
            *line = tail.substr(nl + 1);
            return "";
        }
        end = start;
    }
    *line = tail;
    return "";
}

} // namespace

OutcomeLog::OutcomeLog(std::filesystem::path path) : path_(std::move(path)) {}

OutcomeLog::~OutcomeLog() {
    std::lock_guard<std::mutex> lk(mu_);
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

void OutcomeLog::set_fsync(bool enable) {
    std::lock_guard<std::mutex> lk(mu_);
    fsync_ = enable;
}

std::string OutcomeLog::open() {
    std::lock_guard<std::mutex> lk(mu_);
    if (fd_ >= 0) return "";

    std::error_code ec;
    auto parent = path_.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) return std::string("create_directories: ") + ec.message();
    }

    // O_RDWR: the tail is read back under the lock to extend the chain
    fd_ = ::open(path_.c_str(), O_CREAT | O_RDWR | O_APPEND | O_CLOEXEC, 0644);
    if (fd_ < 0) return std::string("open: ") + std::strerror(errno);
    return "";
}

std::string OutcomeLog::append(const std::string& record_json, int64_t* seq_out, std::string* head_out) {
    json_mini::Doc rec = json_mini::parse(record_json);
    if (!rec || !json_object_is_type(rec.root, json_type_object)) return "record is not a JSON object";

    std::lock_guard<std::mutex> lk(mu_);
    if (fd_ < 0) return "outcome log not open";

    FileLock flk(fd_);
    if (!flk.error().empty()) return flk.error();

    std::string last;
    std::string err = read_last_line(fd_, &last);
    if (!err.empty()) return err;

    std::string prev = hash::zero_chain();
    int64_t seq = 1;
    if (!last.empty()) {
        json_mini::Doc tail = json_mini::parse(last);
        auto head = json_mini::get_string(tail.root, "chain_hash");
        auto last_seq = json_mini::get_int(tail.root, "seq");
        if (!tail || !head || !last_seq) return "outcome log tail is not a chained entry";
        prev = *head;
        seq = *last_seq + 1;
    }

    json_object_object_del(rec.root, "seq");
    json_object_object_del(rec.root, "chain_prev");
    json_object_object_del(rec.root, "chain_hash");
    json_object_object_add(rec.root, "seq", json_object_new_int64(seq));

    std::string head;
    std::string line = chain_line(rec.root, prev, &head);
    line.push_back('\n');

    // single write(2): O_APPEND keeps concurrent writers from interleaving
    ssize_t w;
    do {
        w = ::write(fd_, line.data(), line.size());
    } while (w < 0 && errno == EINTR);
    if (w < 0) return std::string("write: ") + std::strerror(errno);
    if ((size_t)w != line.size()) return "short write to outcome log";

    if (fsync_ && ::fsync(fd_) != 0) return std::string("fsync: ") + std::strerror(errno);

    if (seq_out) *seq_out = seq;
    if (head_out) *head_out = head;
    return "";
}

LogVerifyResult verify_outcome_log(const std::filesystem::path& path) {
    LogVerifyResult r;
    r.head = hash::zero_chain();

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        r.ok = true;
        return r;
    }
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        r.error = "cannot open outcome log";
        return r;
    }

    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (!content.empty() && content.back() != '\n') {
        // count complete lines so bad_line points at the torn one
        int64_t n = 1;
        for (char c : content) if (c == '\n') n++;
        r.bad_line = n;
        r.error = "torn final entry";
        return r;
    }

    size_t pos = 0;
    int64_t lineno = 0;
    while (pos < content.size()) {
        size_t nl = content.find('\n', pos);
        std::string line = content.substr(pos, nl - pos);
        pos = nl + 1;
        lineno++;

        std::string head;
        std::string err = verify_chain_line(line, r.head, &head);
        if (err.empty()) {
            json_mini::Doc d = json_mini::parse(line);
            auto seq = json_mini::get_int(d.root, "seq");
            if (!seq || *seq != lineno) err = "seq out of order";
        }
        if (!err.empty()) {
            r.bad_line = lineno;
            r.error = err;
            return r;
        }
        r.head = head;
        r.entries = lineno;
    }
    r.ok = true;
    return r;
}

} // namespace furnace
