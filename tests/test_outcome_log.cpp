#include "test_common.h"

#include "furnace/json_mini.h"
#include "furnace/outcome_log.h"

#include <filesystem>
#include <set>
#include <thread>
#include <vector>

using furnace::OutcomeLog;
using furnace::verify_outcome_log;

int main() {
    namespace fs = std::filesystem;
    fs::path dir = fresh_dir("furnace_test_outcome_log");
    fs::path p = dir / "sub" / "outcome.jsonl";

    // missing log verifies as empty
    auto v0 = verify_outcome_log(p);
    expect_true(v0.ok && v0.entries == 0, "missing log is empty and valid");

    {
        OutcomeLog log(p);
        std::string err = log.open();
        expect_true(err.empty(), "open should succeed: " + err);

        err = log.append("[1,2]");
        expect_true(!err.empty(), "non-object record rejected");

        int64_t seq = 0;
        std::string head;
        err = log.append("{\"verdict\":\"KILLED_T2\",\"seq\":99}", &seq, &head);
        expect_true(err.empty(), "append 1: " + err);
        expect_eq_ll(seq, 1, "first seq");
        std::string head1 = head;

        err = log.append("{\"verdict\":\"SURVIVOR_PHASE_0\"}", &seq, &head);
        expect_true(err.empty(), "append 2: " + err);
        expect_eq_ll(seq, 2, "second seq");
        expect_true(head != head1, "head advances");

        auto v = verify_outcome_log(p);
        expect_true(v.ok, "log verifies: " + v.error);
        expect_eq_ll(v.entries, 2, "two entries");
        expect_eq_str(v.head, head, "verified head equals append head");
    }

    // a second writer continues the chain from the file tail
    {
        OutcomeLog log(p);
        expect_true(log.open().empty(), "reopen");
        int64_t seq = 0;
        std::string err = log.append("{\"verdict\":\"KILLED_INTAKE\"}", &seq);
        expect_true(err.empty(), "append after reopen: " + err);
        expect_eq_ll(seq, 3, "seq continues across instances");
    }
    std::string good = read_text(p);
    expect_true(verify_outcome_log(p).ok, "three entries verify");

    // tampering with a committed entry breaks the chain at that line
    {
        std::string bad = good;
        size_t at = bad.find("KILLED_T2");
        expect_true(at != std::string::npos, "first entry present");
        bad.replace(at, 9, "KILLED_T3");
        write_text(p, bad);
        auto v = verify_outcome_log(p);
        expect_true(!v.ok, "tampered log must fail verification");
        expect_eq_ll(v.bad_line, 1, "tampered line located");
    }

    // dropping an entry breaks seq/chain at the gap
    {
        size_t nl = good.find('\n');
        write_text(p, good.substr(nl + 1));
        auto v = verify_outcome_log(p);
        expect_true(!v.ok && v.bad_line == 1, "deleted entry detected");
    }

    // torn tail: refused by verify and by append
    {
        write_text(p, good + "{\"verdict\":");
        auto v = verify_outcome_log(p);
        expect_true(!v.ok && v.bad_line == 4, "torn tail located");
        OutcomeLog log(p);
        expect_true(log.open().empty(), "open torn log");
        expect_true(!log.append("{\"x\":1}").empty(), "append on torn tail refused");
    }

    // concurrent appends from threads with separate handles stay linear
    {
        fs::path cp = dir / "concurrent.jsonl";
        const int kThreads = 6;
        const int kPerThread = 20;
        std::vector<std::thread> threads;
        std::vector<std::string> errors(kThreads);
        for (int t = 0; t < kThreads; t++) {
            threads.emplace_back([&, t] {
                OutcomeLog log(cp);
                std::string err = log.open();
                for (int i = 0; err.empty() && i < kPerThread; i++) {
                    err = log.append("{\"thread\":" + std::to_string(t) + ",\"i\":" + std::to_string(i) + "}");
                }
                errors[t] = err;
            });
        }
        for (auto& th : threads) th.join();
        for (const auto& e : errors) expect_true(e.empty(), "concurrent append: " + e);

        auto v = verify_outcome_log(cp);
        expect_true(v.ok, "concurrent log verifies: " + v.error);
        expect_eq_ll(v.entries, kThreads * kPerThread, "no lost entries");

        std::set<std::string> seen;
        std::string body = read_text(cp);
        size_t pos = 0;
        while (pos < body.size()) {
            size_t nl = body.find('\n', pos);
            furnace::json_mini::Doc d = furnace::json_mini::parse(body.substr(pos, nl - pos));
            auto th = furnace::json_mini::get_int(d.root, "thread");
            auto i = furnace::json_mini::get_int(d.root, "i");
            expect_true(th && i, "payload preserved");
            seen.insert(std::to_string(*th) + ":" + std::to_string(*i));
            pos = nl + 1;
        }
        expect_eq_ll((long long)seen.size(), kThreads * kPerThread, "every record exactly once");
    }

    std::error_code ec;
    fs::remove_all(dir, ec);
    std::cerr << "test_outcome_log: ALL PASSED" << std::endl;
    return 0;
}
