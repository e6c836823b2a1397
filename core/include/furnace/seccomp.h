#pragma once

// Furnace syscall filter: seccomp-BPF allowlist for sandboxed children.
//
// Design: allowlist-only. Any syscall NOT on the list kills the process
// (SIGSYS). Socket-family syscalls are answered with EACCES instead, so an
// artifact probing the network sees "no network" rather than dying.
// Opt-in via SandboxLimits.enable_seccomp or FURNACE_SECCOMP_ENABLE=1.
//
// Architecture-aware: supports x86_64 and aarch64.

#include <string>

namespace furnace {

// Install the filter in the calling process. Must be called AFTER
// prctl(PR_SET_NO_NEW_PRIVS, 1). The list covers what a CPython interpreter
// needs to import pure-Python modules and do file I/O in its workspace:
// read/write/openat/stat family, mmap/mprotect(non-exec)/brk, getdents64,
// futex, signals, clocks, getrandom, exit. Notable blocked: ptrace, mount,
// setns, unshare, kexec_load, init_module, bpf, personality, and every
// socket syscall (EACCES).
//
// Returns empty string on success, error message on failure.
// On non-Linux platforms, returns success (no-op).
std::string install_seccomp_filter();

// Check if seccomp is available on this system.
bool seccomp_available();

} // namespace furnace
