#include "test_common.h"
#include "furnace/proc.h"

#include <chrono>
#include <filesystem>
#include <thread>

using namespace furnace;

int main() {
    ProcLimits lim;
    lim.timeout_ms = 5000;

    // Test 1: output capture and exit code
    {
        ProcResult r;
        bool ok = proc_run_capture_sandboxed({"/bin/sh", "-c", "echo hello; echo oops 1>&2; exit 3"}, "", lim, &r);
        expect_true(ok && r.started, "sh should start: " + r.error);
        expect_eq_ll(r.exit_code, 3, "exit code");
        expect_true(r.output.find("hello") != std::string::npos, "stdout captured");
        expect_true(r.output.find("oops") != std::string::npos, "stderr merged");
        expect_true(!r.timed_out && !r.cancelled, "no timeout, no cancel");
    }

    // Test 2: hard timeout kills the process group
    {
        ProcLimits tl = lim;
        tl.timeout_ms = 300;
        ProcResult r;
        auto t0 = std::chrono::steady_clock::now();
        (void)proc_run_capture_sandboxed({"/bin/sh", "-c", "sleep 30 & sleep 30"}, "", tl, &r);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0).count();
        expect_true(r.timed_out, "should time out");
        expect_true(ms < 5000, "timeout should not wait for the grandchild");
    }

    // Test 3: child setup failure comes back through the status pipe
    {
        ProcResult r;
        bool ok = proc_run_capture_sandboxed({"/bin/true"}, "/nonexistent/furnace_cwd", lim, &r);
        expect_true(!ok && !r.started, "bad cwd must not exec");
        expect_true(r.error.find("chdir") != std::string::npos, "stage named in error: " + r.error);

        ok = proc_run_capture_sandboxed({"/nonexistent/furnace_bin"}, "", lim, &r);
        expect_true(!ok && r.error.find("exec") != std::string::npos, "exec failure reported: " + r.error);
    }

    // Test 4: cancellation while waiting
    {
        CancelToken tok;
        ProcSpec spec;
        spec.argv = {"/bin/sh", "-c", "sleep 30"};
        spec.cancel = &tok;
        std::thread t([&]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            tok.cancel();
        });
        ProcResult r;
        (void)proc_run(spec, lim, &r);
        t.join();
        expect_true(r.cancelled, "run should observe cancellation");
        expect_true(!r.timed_out, "cancellation is not a timeout");
    }

    // Test 5: scrubbed environment
    {
        ProcSpec spec;
        spec.argv = {"/bin/sh", "-c", "echo \"[$FURNACE_SECRET][$ONLY]\""};
        spec.clear_env = true;
        spec.env = {"ONLY=yes", "PATH=/usr/bin:/bin"};
        setenv("FURNACE_SECRET", "leak", 1);
        ProcResult r;
        (void)proc_run(spec, lim, &r);
        unsetenv("FURNACE_SECRET");
        expect_true(r.output.find("[][yes]") != std::string::npos, "child sees only spec.env: " + r.output);
    }

    // Test 6: output cap
    {
        ProcLimits cl = lim;
        cl.output_max_bytes = 1024;
        ProcResult r;
        (void)proc_run_capture_sandboxed({"/bin/sh", "-c", "i=0; while [ $i -lt 500 ]; do echo 0123456789; i=$((i+1)); done"},
                                         "", cl, &r);
        expect_true(r.output_truncated, "output should be truncated");
        expect_true(r.output.size() <= 1024, "output capped");
    }

    // Test 7: argv splitting and PATH lookup
    {
        auto v = split_argv_quoted("bwrap --ro-bind '/a b' \"/c \\\"d\\\"\"");
        expect_eq_ll((long long)v.size(), 4, "quoted split");
        expect_true(v[2] == "/a b", "single quotes keep spaces");
        expect_true(v[3] == "/c \"d\"", "double quote escapes");
        expect_true(split_argv_quoted("'unterminated").empty(), "unterminated quote is an error");

        std::string sh = resolve_executable("sh");
        expect_true(!sh.empty(), "sh resolves via PATH");
        expect_true(resolve_executable("furnace-no-such-binary").empty(), "missing binary resolves empty");
    }

    std::cerr << "test_proc: ALL PASSED" << std::endl;
    return 0;
}
