#include "furnace/shim.h"
#include "furnace/fsutil.h"

#include <system_error>

namespace furnace {

static const char* kShimSource = R"PYSHIM(
import errno
import importlib
import json
import os
import sys

CONTRACT_OPS = ("ingest", "compact", "audit")


class Fail(Exception):
    def __init__(self, status, detail):
        Exception.__init__(self, detail)
        self.status = status
        self.detail = detail


def canon(obj):
    return json.dumps(obj, sort_keys=True, separators=(",", ":"),
                      allow_nan=False, ensure_ascii=False)


INT64_MIN = -(1 << 63)
INT64_MAX = (1 << 63) - 1


def wide_int(obj):
    stack = [obj]
    while stack:
        o = stack.pop()
        if isinstance(o, bool):
            continue
        if isinstance(o, int):
            if o < INT64_MIN or o > INT64_MAX:
                return True
        elif isinstance(o, dict):
            stack.extend(o.values())
        elif isinstance(o, (list, tuple)):
            stack.extend(o)
    return False


# Text is returned only if it encodes as UTF-8 and every integer fits int64.
def serialize(obj, what):
    try:
        text = canon(obj)
        text.encode("utf-8")
    except (TypeError, ValueError, RecursionError) as e:
        raise Fail("unserializable", what + ": " + type(e).__name__)
    if wide_int(obj):
        raise Fail("unserializable", what + ": integer out of int64 range")
    return text


def write_atomic(path, text):
    tmp = path + ".tmp"
    try:
        with open(tmp, "w", encoding="utf-8") as f:
            f.write(text)
        os.replace(tmp, path)
    except OSError as e:
        try:
            os.unlink(tmp)
        except OSError:
            pass
        if e.errno in (errno.EFBIG, errno.ENOSPC, errno.EDQUOT):
            raise Fail("resource", "write: " + errno.errorcode.get(e.errno, "?"))
        raise Fail("harness", "write: " + type(e).__name__)


def append_lines(path, lines):
    if not lines:
        return
    try:
        with open(path, "a", encoding="utf-8") as f:
            f.write("".join(line + "\n" for line in lines))
    except OSError as e:
        if e.errno in (errno.EFBIG, errno.ENOSPC, errno.EDQUOT):
            raise Fail("resource", "append: " + errno.errorcode.get(e.errno, "?"))
        raise Fail("harness", "append: " + type(e).__name__)


def load_state(ws):
    path = os.path.join(ws, "state.json")
    if not os.path.exists(path):
        return {}
    try:
        with open(path, "r", encoding="utf-8") as f:
            return json.load(f)
    except (OSError, ValueError) as e:
        raise Fail("harness", "state: " + type(e).__name__)


def load_lineage(ws):
    path = os.path.join(ws, "lineage.jsonl")
    out = []
    if not os.path.exists(path):
        return out
    try:
        with open(path, "r", encoding="utf-8") as f:
            for line in f:
                line = line.strip()
                if line:
                    out.append(json.loads(line))
    except (OSError, ValueError) as e:
        raise Fail("harness", "lineage: " + type(e).__name__)
    return out


def call(fn, *args):
    try:
        return fn(*args)
    except Fail:
        raise
    except MemoryError:
        raise Fail("resource", "MemoryError")
    except BaseException as e:
        raise Fail("raised", type(e).__name__ + ": " + str(e)[:300])


def lineage_snapshot(lineage):
    try:
        return canon(lineage)
    except (TypeError, ValueError, RecursionError):
        return None


def check_lineage(lineage, before, op):
    if lineage_snapshot(lineage) != before:
        raise Fail("lineage_mutated", op + " changed the lineage")


def audit_verdict(r):
    if isinstance(r, str) and r == "OK":
        return {"verdict": "OK"}
    if isinstance(r, (tuple, list)) and len(r) == 2 and r[0] == "HALT" and isinstance(r[1], str):
        return {"verdict": "HALT", "reason": r[1][:200].encode("utf-8", "replace").decode("utf-8")}
    raise Fail("malformed", "audit returned " + type(r).__name__)


def run_audit(fns, state, lineage):
    before = lineage_snapshot(lineage)
    r = call(fns["audit"], state, lineage)
    check_lineage(lineage, before, "audit")
    return audit_verdict(r)


def resolve(mod, bindings):
    fns = {}
    for op in CONTRACT_OPS:
        name = bindings.get(op)
        fn = getattr(mod, name, None) if isinstance(name, str) else None
        if fn is None or not callable(fn):
            raise Fail("malformed", "unresolved " + op)
        fns[op] = fn
    return fns


def op_ingest(fns, ws, req):
    state = load_state(ws)
    wanted = set(int(x) for x in req.get("checkpoints", []))
    snaps = []
    items = []
    state_text = serialize(state, "state")
    for i, event in enumerate(req.get("events", []), 1):
        out = call(fns["ingest"], event, state)
        if not isinstance(out, (tuple, list)) or len(out) != 2:
            raise Fail("malformed", "ingest returned " + type(out).__name__)
        state, item = out[0], out[1]
        state_text = serialize(state, "state")
        items.append(serialize(item, "lineage item"))
        if i in wanted:
            snaps.append(state_text)
    write_atomic(os.path.join(ws, "state.json"), state_text)
    append_lines(os.path.join(ws, "lineage.jsonl"), items)
    res = {"status": "ok", "checkpoints": snaps, "count": len(items)}
    if req.get("audit_after"):
        res["audit"] = run_audit(fns, json.loads(state_text), load_lineage(ws))
    return res


def op_compact(fns, ws, req):
    state = load_state(ws)
    lineage = load_lineage(ws)
    before = lineage_snapshot(lineage)
    new_state = call(fns["compact"], state, lineage, int(req["target_bytes"]))
    check_lineage(lineage, before, "compact")
    write_atomic(os.path.join(ws, "state.json"), serialize(new_state, "state"))
    return {"status": "ok"}


def op_audit(fns, ws, req):
    return {"status": "ok", "audit": run_audit(fns, load_state(ws), load_lineage(ws))}


def dispatch(op, app_dir, ws, req):
    if op == "version":
        return {"status": "ok", "version": "%d.%d.%d" % tuple(sys.version_info[:3])}
    sys.path.insert(0, app_dir)
    try:
        mod = importlib.import_module("mutation")
    except MemoryError:
        raise Fail("resource", "MemoryError")
    except BaseException as e:
        raise Fail("raised", "import: " + type(e).__name__ + ": " + str(e)[:300])
    fns = resolve(mod, req.get("bindings", {}))
    if op == "import":
        return {"status": "ok"}
    if op == "ingest":
        return op_ingest(fns, ws, req)
    if op == "compact":
        return op_compact(fns, ws, req)
    if op == "audit":
        return op_audit(fns, ws, req)
    raise Fail("harness", "unknown op " + op)


def main(argv):
    if len(argv) != 6:
        sys.stderr.write("usage: shim.py <op> <app_dir> <workspace> <request> <result>\n")
        return 2
    op, app_dir, ws, req_path, res_path = argv[1:6]
    try:
        try:
            with open(req_path, "r", encoding="utf-8") as f:
                req = json.load(f)
        except (OSError, ValueError) as e:
            raise Fail("harness", "request: " + type(e).__name__)
        res = dispatch(op, app_dir, ws, req)
    except Fail as e:
        res = {"status": e.status, "detail": e.detail}
    with open(res_path + ".tmp", "w", encoding="utf-8") as f:
        f.write(json.dumps(res, sort_keys=True))
    os.replace(res_path + ".tmp", res_path)
    return 0


if __name__ == "__main__":
    sys.exit(main(sys.argv))
)PYSHIM";

const std::string& shim_source() {
    static const std::string src(kShimSource);
    return src;
}

std::string write_shim(const std::filesystem::path& dst) {
    std::string err = write_atomic(dst, shim_source());
    if (!err.empty()) return err;
    std::error_code ec;
    std::filesystem::permissions(dst, std::filesystem::perms::owner_read,
                                 std::filesystem::perm_options::replace, ec);
    if (ec) return "shim permissions: " + ec.message();
    return "";
}

} // namespace furnace
