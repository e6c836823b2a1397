#include "furnace/seccomp.h"

#if defined(__linux__)

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <vector>

#include <linux/audit.h>
#include <linux/filter.h>
#include <linux/seccomp.h>
#include <sys/prctl.h>

#if defined(__x86_64__)
  #define FURNACE_AUDIT_ARCH AUDIT_ARCH_X86_64
#elif defined(__aarch64__)
  #define FURNACE_AUDIT_ARCH AUDIT_ARCH_AARCH64
#else
  #define FURNACE_AUDIT_ARCH 0
#endif

namespace furnace {

namespace {

sock_filter stmt(unsigned short code, unsigned int k) {
    sock_filter f{};
    f.code = code;
    f.k = k;
    return f;
}

sock_filter jump(unsigned short code, unsigned int k, unsigned char jt, unsigned char jf) {
    sock_filter f{};
    f.code = code;
    f.jt = jt;
    f.jf = jf;
    f.k = k;
    return f;
}

#if defined(__x86_64__)
const unsigned int kAllowed[] = {
    0, 1, 3, 4, 5, 6, 7, 8,          // read write close stat fstat lstat poll lseek
    9, 10, 11, 12,                   // mmap mprotect munmap brk
    13, 14, 15, 16, 17, 18, 19, 20,  // rt_sig* ioctl pread64 pwrite64 readv writev
    21, 22, 23, 24, 25, 28,          // access pipe select sched_yield mremap madvise
    32, 33, 35, 39,                  // dup dup2 nanosleep getpid
    56, 58, 59, 60, 61, 62, 63,      // clone vfork execve exit wait4 kill uname
    72, 73, 74, 75, 76, 77,          // fcntl flock fsync fdatasync truncate ftruncate
    79, 80, 81, 82, 83, 84, 87, 89,  // getcwd chdir fchdir rename mkdir rmdir unlink readlink
    90, 91, 95, 96, 97, 99, 100,     // chmod fchmod umask gettimeofday getrlimit sysinfo times
    102, 104, 107, 108, 110, 111,    // getuid getgid geteuid getegid getppid getpgrp
    131, 137, 138, 157, 158,         // sigaltstack statfs fstatfs prctl arch_prctl
    186, 202, 204, 217, 218,         // gettid futex sched_getaffinity getdents64 set_tid_address
    228, 229, 230, 231, 234,         // clock_* exit_group tgkill
    257, 258, 262, 263, 264, 267,    // openat mkdirat newfstatat unlinkat renameat readlinkat
    269, 270, 271, 273,              // faccessat pselect6 ppoll set_robust_list
    290, 291, 292, 293, 302,         // eventfd2 epoll_create1 dup3 pipe2 prlimit64
    316, 318, 332, 334, 435, 439,    // renameat2 getrandom statx rseq clone3 faccessat2
};
const unsigned int kSocketFamily[] = {
    41, 42, 43, 44, 45, 46, 47, 48, 49, 50, 51, 52, 53, 54, 55, 288, 299, 307,
};
const unsigned int kMprotectNr = 10;
#elif defined(__aarch64__)
const unsigned int kAllowed[] = {
    17, 19, 20, 21, 22, 23, 24, 25,  // getcwd eventfd2 epoll_ctl epoll_pwait pipe2 dup dup3 fcntl
    29, 32, 34, 35, 38, 39,          // ioctl flock mkdirat unlinkat renameat umask
    43, 44, 46, 48, 49, 50, 52, 53,  // statfs fstatfs fchmod faccessat2 chdir fchdir faccessat fchmodat
    56, 57, 61, 62, 63, 64, 65, 66,  // openat close getdents64 lseek read write readv writev
    67, 68, 72, 73, 74, 76, 78, 79, 80, // pread64 pwrite64 pselect6 ppoll ftruncate truncate readlinkat fstatat fstat
    82, 83, 93, 94, 96, 98, 99,      // fsync fdatasync exit exit_group set_tid_address futex set_robust_list
    101, 113, 114, 115, 123, 124,    // nanosleep clock_* sched_getaffinity sched_yield
    129, 131, 132, 134, 135, 139,    // kill tgkill sigaltstack rt_sig*
    153, 160, 163, 167, 169,         // times uname getrlimit prctl gettimeofday
    172, 173, 174, 175, 176, 177, 178, 179, // getpid getppid getuid geteuid getgid getegid gettid sysinfo
    214, 215, 220, 221, 222, 225, 226, 233, // brk munmap clone execve mmap mremap mprotect madvise
    260, 261, 278, 281, 291, 435,    // wait4 prlimit64 getrandom rseq statx clone3
};
const unsigned int kSocketFamily[] = {
    198, 199, 200, 201, 202, 203, 204, 205, 206, 207, 208, 209, 210, 211, 212, 242, 243, 269,
};
const unsigned int kMprotectNr = 226;
#endif

} // namespace

std::string install_seccomp_filter() {
#if FURNACE_AUDIT_ARCH == 0
    return "seccomp: unsupported architecture";
#else
    const size_t n_allowed = sizeof(kAllowed) / sizeof(kAllowed[0]);
    const size_t n_socket = sizeof(kSocketFamily) / sizeof(kSocketFamily[0]);

    // Layout:
    //   [0]  load arch          [1] arch ok -> skip kill     [2] KILL
    //   [3]  load nr
    //   [4 .. 4+S)           socket family  -> DENY_NET
    //   [4+S .. 4+S+A)       allowlist      -> ALLOW (mprotect -> MPROT)
    //   KILL                 (default)
    //   MPROT: load arg2, JSET PROT_EXEC -> KILL, else ALLOW
    //   DENY_NET: ERRNO(EACCES)
    //   ALLOW
    std::vector<sock_filter> prog;
    prog.reserve(4 + n_socket + n_allowed + 7);

    prog.push_back(stmt(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, arch)));
    prog.push_back(jump(BPF_JMP | BPF_JEQ | BPF_K, FURNACE_AUDIT_ARCH, 1, 0));
    prog.push_back(stmt(BPF_RET | BPF_K, SECCOMP_RET_KILL_PROCESS));
    prog.push_back(stmt(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, nr)));

    const size_t base = prog.size();
    const size_t kill_at = base + n_socket + n_allowed;
    const size_t mprot_at = kill_at + 1;
    const size_t deny_net_at = mprot_at + 4;
    const size_t allow_at = deny_net_at + 1;

    auto rel = [&](size_t target) -> unsigned char {
        // jump offsets are relative to the next instruction
        return (unsigned char)(target - prog.size() - 1);
    };

    for (size_t s = 0; s < n_socket; s++) {
        prog.push_back(jump(BPF_JMP | BPF_JEQ | BPF_K, kSocketFamily[s], rel(deny_net_at), 0));
    }
    for (size_t s = 0; s < n_allowed; s++) {
        size_t target = kAllowed[s] == kMprotectNr ? mprot_at : allow_at;
        prog.push_back(jump(BPF_JMP | BPF_JEQ | BPF_K, kAllowed[s], rel(target), 0));
    }

    prog.push_back(stmt(BPF_RET | BPF_K, SECCOMP_RET_KILL_PROCESS));

    prog.push_back(stmt(BPF_LD | BPF_W | BPF_ABS,
                        offsetof(struct seccomp_data, args) + 2 * sizeof(uint64_t)));
    prog.push_back(jump(BPF_JMP | BPF_JSET | BPF_K, 0x4 /* PROT_EXEC */, 0, 1));
    prog.push_back(stmt(BPF_RET | BPF_K, SECCOMP_RET_KILL_PROCESS));
    prog.push_back(stmt(BPF_RET | BPF_K, SECCOMP_RET_ALLOW));

    prog.push_back(stmt(BPF_RET | BPF_K, SECCOMP_RET_ERRNO | (EACCES & SECCOMP_RET_DATA)));
    prog.push_back(stmt(BPF_RET | BPF_K, SECCOMP_RET_ALLOW));

    if (prog.size() != allow_at + 1) {
        return "seccomp: filter layout mismatch";
    }
    if (allow_at - base > 255) {
        return "seccomp: allowlist exceeds BPF jump range";
    }

    struct sock_fprog fprog = {};
    fprog.len = (unsigned short)prog.size();
    fprog.filter = prog.data();

    if (prctl(PR_SET_SECCOMP, SECCOMP_MODE_FILTER, &fprog, 0, 0) != 0) {
        return std::string("seccomp install failed: ") + std::strerror(errno);
    }
    return "";
#endif
}

bool seccomp_available() {
    // ret == 0: available, not active; ret == 2: filter active; -1/EINVAL: unsupported
    int ret = prctl(PR_GET_SECCOMP, 0, 0, 0, 0);
    return (ret >= 0);
}

} // namespace furnace

#else // !__linux__

namespace furnace {

std::string install_seccomp_filter() {
    return "";
}

bool seccomp_available() {
    return false;
}

} // namespace furnace

#endif
