#include "furnace/sandboxed_artifact.h"
#include "furnace/fsutil.h"
#include "furnace/json_mini.h"
#include "furnace/shim.h"
#include "furnace/workspace.h"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace furnace {

namespace {

CallStatus status_from_shim(const std::string& s) {
    if (s == "ok") return CallStatus::OK;
    if (s == "raised") return CallStatus::RAISED;
    if (s == "malformed") return CallStatus::MALFORMED;
    if (s == "unserializable") return CallStatus::UNSERIALIZABLE;
    if (s == "lineage_mutated") return CallStatus::LINEAGE_MUTATED;
    if (s == "resource") return CallStatus::RESOURCE;
    return CallStatus::HARNESS_ERROR;
}

// Status for a sandbox run that did not produce (or did not need) a shim result.
CallStatus status_from_sandbox(const SandboxOutcome& o) {
    switch (o.status) {
        case SandboxStatus::TIMEOUT: return CallStatus::TIMEOUT;
        case SandboxStatus::RESOURCE: return CallStatus::RESOURCE;
        case SandboxStatus::SIGNALED: return CallStatus::CRASHED;
        case SandboxStatus::CANCELLED: return CallStatus::CANCELLED;
        case SandboxStatus::SETUP_ERROR: return CallStatus::HARNESS_ERROR;
        case SandboxStatus::EXITED: break;
    }
    return o.exit_code == 0 ? CallStatus::OK : CallStatus::CRASHED;
}

std::string excerpt(const std::string& s, size_t n = 600) {
    if (s.size() <= n) return s;
    return s.substr(s.size() - n); // tail: tracebacks end with the exception
}

std::string sanitize_label(const std::string& s) {
    std::string out;
    for (char c : s) out.push_back((std::isalnum((unsigned char)c) || c == '_') ? c : '_');
    return out;
}

void log_call(JsonlLogger* log, const std::string& op, const std::string& label,
              const CallResult& r, const SandboxOutcome& o) {
    if (!log) return;
    std::ostringstream p;
    p << "{\"op\":\"" << json_mini::json_escape(op) << "\""
      << ",\"label\":\"" << json_mini::json_escape(label) << "\""
      << ",\"status\":\"" << callstatus_to_str(r.status) << "\""
      << ",\"sandbox\":\"" << sandbox_status_str(o.status) << "\""
      << ",\"exit_code\":" << o.exit_code
      << ",\"signal\":" << o.term_signal
      << ",\"elapsed_ms\":" << o.elapsed_ms
      << ",\"workspace_bytes\":" << o.workspace_bytes
      << ",\"detail\":\"" << json_mini::json_escape(r.detail) << "\""
      << ",\"error\":\"" << json_mini::json_escape(o.error) << "\""
      << ",\"output\":\"" << json_mini::json_escape(excerpt(o.output)) << "\"}";
    log->event("sandbox_call", p.str());
}

} // namespace

bool runtime_matches_pin(const std::string& actual, const std::string& pin) {
    if (pin.empty()) return true;
    if (actual == pin) return true;
    // "3.11" pins every 3.11.x
    return actual.size() > pin.size() && actual.compare(0, pin.size(), pin) == 0 && actual[pin.size()] == '.';
}

SandboxedArtifact::SandboxedArtifact(const ArtifactPackage& pkg, SandboxRunner& runner, JsonlLogger* log)
    : pkg_(pkg), runner_(runner), log_(log) {}

std::string SandboxedArtifact::bindings_json() const {
    const InterfaceContract& c = pkg_.contract;
    return "{\"audit\":\"" + json_mini::json_escape(c.audit.function) +
           "\",\"compact\":\"" + json_mini::json_escape(c.compact.function) +
           "\",\"ingest\":\"" + json_mini::json_escape(c.ingest.function) + "\"}";
}

CallResult SandboxedArtifact::invoke(const std::string& op,
                                     const std::string& label,
                                     const fs::path& workspace,
                                     const std::string& request_json,
                                     std::string* result_json) {
    CallResult r;
    if (runner_.runtime_path().empty()) {
        r.status = CallStatus::HARNESS_ERROR;
        r.detail = "runtime not found";
        return r;
    }

    std::string err;
    auto inst = runner_.create(sanitize_label(label) + "_" + std::to_string(++calls_), &err);
    if (!inst) {
        r.status = CallStatus::HARNESS_ERROR;
        r.detail = err;
        return r;
    }

    fs::path shim = inst->root() / "shim.py";
    fs::path req = inst->tmp_dir() / "request.json";
    fs::path res = inst->tmp_dir() / "result.json";
    err = write_shim(shim);
    if (err.empty()) err = write_atomic(req, request_json);
    if (!err.empty()) {
        r.status = CallStatus::HARNESS_ERROR;
        r.detail = err;
        return r;
    }

    fs::path ws = workspace.empty() ? inst->tmp_dir() : workspace;
    std::vector<std::string> argv = {
        runner_.runtime_path(), "-s", "-B", shim.string(), op,
        inst->app_dir().string(), ws.string(), req.string(), res.string(),
    };
    SandboxOutcome o = inst->run(argv, ws, workspace);
    r.exit_code = o.exit_code;
    r.elapsed_ms = o.elapsed_ms;

    r.status = status_from_sandbox(o);
    if (o.status == SandboxStatus::EXITED) {
        std::string body;
        std::error_code ec;
        if (!fs::exists(res, ec) || !read_file(res, &body).empty()) {
            r.status = CallStatus::CRASHED;
            r.detail = "no result from shim";
        } else {
            json_mini::Doc d = json_mini::parse(body);
            auto st = json_mini::get_string(d.root, "status");
            if (!d || !st) {
                r.status = CallStatus::HARNESS_ERROR;
                r.detail = "unreadable shim result";
            } else {
                r.status = status_from_shim(*st);
                r.detail = json_mini::get_string(d.root, "detail").value_or("");
                if (r.status == CallStatus::OK && result_json) *result_json = body;
            }
        }
    } else if (r.detail.empty()) {
        r.detail = o.error.empty() ? sandbox_status_str(o.status) : o.error;
    }

    log_call(log_, op, label, r, o);
    return r; // inst destroyed here: sandbox torn down
}

static void read_audit(json_object* root, CallResult* r) {
    json_object* a = json_mini::get(root, "audit");
    if (!a) return;
    auto v = json_mini::get_string(a, "verdict");
    if (v && *v == "OK") {
        r->verdict = AuditVerdict::OK;
    } else if (v && *v == "HALT") {
        r->verdict = AuditVerdict::HALT;
        r->halt_reason = json_mini::get_string(a, "reason").value_or("");
    } else {
        r->status = CallStatus::MALFORMED;
        r->detail = "audit verdict missing";
    }
}

CallResult SandboxedArtifact::ingest(Workspace& ws, const std::vector<std::string>& events, const IngestOptions& opt) {
    std::ostringstream req;
    req << "{\"bindings\":" << bindings_json() << ",\"events\":[";
    for (size_t i = 0; i < events.size(); i++) {
        if (i) req << ",";
        req << events[i];
    }
    req << "],\"checkpoints\":[";
    for (size_t i = 0; i < opt.checkpoints.size(); i++) {
        if (i) req << ",";
        req << opt.checkpoints[i];
    }
    req << "],\"audit_after\":" << (opt.audit_after ? "true" : "false") << "}";

    std::string body;
    CallResult r = invoke("ingest", "ingest", ws.dir(), req.str(), &body);
    if (!r.ok()) return r;

    json_mini::Doc d = json_mini::parse(body);
    json_object* cps = json_mini::get(d.root, "checkpoints");
    if (cps && json_object_is_type(cps, json_type_array)) {
        const size_t n = json_object_array_length(cps);
        for (size_t i = 0; i < n; i++) {
            json_object* el = json_object_array_get_idx(cps, i);
            auto canon = el && json_object_is_type(el, json_type_string)
                             ? json_mini::canonicalize(json_object_get_string(el))
                             : std::nullopt;
            if (!canon) {
                r.status = CallStatus::UNSERIALIZABLE;
                r.detail = "checkpoint state is not JSON";
                return r;
            }
            r.checkpoint_states.push_back(*canon);
        }
    }
    if (r.checkpoint_states.size() != opt.checkpoints.size()) {
        r.status = CallStatus::HARNESS_ERROR;
        r.detail = "checkpoint count mismatch";
        return r;
    }
    if (opt.audit_after) {
        read_audit(d.root, &r);
    }
    return r;
}

CallResult SandboxedArtifact::compact(Workspace& ws, int64_t target_bytes) {
    std::string req = "{\"bindings\":" + bindings_json() + ",\"target_bytes\":" + std::to_string(target_bytes) + "}";
    return invoke("compact", "compact_" + std::to_string(target_bytes), ws.dir(), req, nullptr);
}

CallResult SandboxedArtifact::audit(const Workspace& ws) {
    std::string req = "{\"bindings\":" + bindings_json() + "}";
    std::string body;
    CallResult r = invoke("audit", "audit", ws.dir(), req, &body);
    if (!r.ok()) return r;
    json_mini::Doc d = json_mini::parse(body);
    read_audit(d.root, &r);
    if (r.ok() && r.verdict == AuditVerdict::NONE) {
        r.status = CallStatus::MALFORMED;
        r.detail = "audit verdict missing";
    }
    return r;
}

CallResult SandboxedArtifact::selftest() {
    CallResult r;
    if (runner_.runtime_path().empty()) {
        r.status = CallStatus::HARNESS_ERROR;
        r.detail = "runtime not found";
        return r;
    }
    std::string err;
    auto inst = runner_.create("selftest_" + std::to_string(++calls_), &err);
    if (!inst) {
        r.status = CallStatus::HARNESS_ERROR;
        r.detail = err;
        return r;
    }
    // the script dir (app/) lands on sys.path, so `import mutation` works
    std::vector<std::string> argv = {
        runner_.runtime_path(), "-s", "-B", (inst->app_dir() / "SELFTEST.py").string(),
    };
    SandboxOutcome o = inst->run(argv, inst->home_dir(), inst->home_dir());
    r.exit_code = o.exit_code;
    r.elapsed_ms = o.elapsed_ms;
    r.status = status_from_sandbox(o);
    if (o.status == SandboxStatus::EXITED && o.exit_code != 0) {
        r.status = CallStatus::RAISED;
        r.detail = "selftest exit " + std::to_string(o.exit_code);
    } else if (r.status != CallStatus::OK) {
        r.detail = o.error.empty() ? sandbox_status_str(o.status) : o.error;
    }
    log_call(log_, "selftest", "selftest", r, o);
    return r;
}

CallResult SandboxedArtifact::syntax_check() {
    CallResult r;
    if (runner_.runtime_path().empty()) {
        r.status = CallStatus::HARNESS_ERROR;
        r.detail = "runtime not found";
        return r;
    }
    ProcLimits lim;
    lim.timeout_ms = std::min<int64_t>(runner_.limits().timeout_ms, 60000);
    lim.rlimit_cpu_sec = 30;
    lim.rlimit_as_mb = runner_.limits().mem_mb;
    lim.rlimit_fsize_mb = 1;
    ProcSpec spec;
    spec.argv = {
        runner_.runtime_path(), "-B", "-c",
        "import sys; compile(open(sys.argv[1], 'rb').read(), 'mutation.py', 'exec')",
        (pkg_.root / "mutation.py").string(),
    };
    spec.cancel = runner_.cancel_token();
    ProcResult pr;
    bool started = proc_run(spec, lim, &pr);
    r.exit_code = pr.exit_code;
    r.elapsed_ms = pr.elapsed_ms;
    if (!started) {
        r.status = CallStatus::HARNESS_ERROR;
        r.detail = pr.error;
    } else if (pr.cancelled) {
        r.status = CallStatus::CANCELLED;
    } else if (pr.timed_out) {
        r.status = CallStatus::TIMEOUT;
    } else if (pr.exit_code != 0) {
        r.status = CallStatus::RAISED;
        r.detail = excerpt(pr.output, 400);
    } else {
        r.status = CallStatus::OK;
    }
    if (log_) {
        log_->event("syntax_check", "{\"status\":\"" + std::string(callstatus_to_str(r.status)) +
                                        "\",\"exit_code\":" + std::to_string(pr.exit_code) +
                                        ",\"output\":\"" + json_mini::json_escape(excerpt(pr.output)) + "\"}");
    }
    return r;
}

CallResult SandboxedArtifact::import_check() {
    std::string req = "{\"bindings\":" + bindings_json() + "}";
    return invoke("import", "import", fs::path(), req, nullptr);
}

CallResult SandboxedArtifact::runtime_version(std::string* version) {
    std::string body;
    CallResult r = invoke("version", "version", fs::path(), "{}", &body);
    if (!r.ok()) return r;
    json_mini::Doc d = json_mini::parse(body);
    auto v = json_mini::get_string(d.root, "version");
    if (!v) {
        r.status = CallStatus::HARNESS_ERROR;
        r.detail = "version missing";
        return r;
    }
    if (version) *version = *v;
    return r;
}

} // namespace furnace
