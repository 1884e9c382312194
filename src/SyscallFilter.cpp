#include "SyscallFilter.h"

#include <cerrno>
#include <cstddef>
#include <cstring>

#ifdef __linux__
#include <linux/audit.h>
#include <linux/filter.h>
#include <linux/seccomp.h>
#include <sys/prctl.h>
#include <sys/syscall.h>
#endif

namespace Tabula {
namespace SyscallFilter {

namespace {

#if defined(__linux__) && defined(__x86_64__)
constexpr unsigned kAuditArch = AUDIT_ARCH_X86_64;
constexpr bool kKnownArch = true;
#elif defined(__linux__) && defined(__aarch64__)
constexpr unsigned kAuditArch = AUDIT_ARCH_AARCH64;
constexpr bool kKnownArch = true;
#else
constexpr unsigned kAuditArch = 0;
constexpr bool kKnownArch = false;
#endif

// x32 calls share the x86_64 audit arch but set this bit in the number.
constexpr unsigned kX32SyscallBit = 0x40000000U;

} // namespace

bool supported() noexcept {
    return kKnownArch;
}

std::vector<int> allowedSyscalls() {
    std::vector<int> out;
#ifdef __linux__
    // Memory
    out.push_back(__NR_brk);
    out.push_back(__NR_mmap);
    out.push_back(__NR_munmap);
    out.push_back(__NR_mremap);
    out.push_back(__NR_mprotect);
    out.push_back(__NR_madvise);
    // Existing descriptors
    out.push_back(__NR_read);
    out.push_back(__NR_write);
    out.push_back(__NR_writev);
    out.push_back(__NR_close);
    out.push_back(__NR_lseek);
    out.push_back(__NR_fstat);
#ifdef __NR_newfstatat
    out.push_back(__NR_newfstatat);
#endif
    // Threads and time
    out.push_back(__NR_futex);
    out.push_back(__NR_sched_yield);
    out.push_back(__NR_clock_gettime);
    out.push_back(__NR_clock_nanosleep);
    out.push_back(__NR_nanosleep);
    out.push_back(__NR_gettimeofday);
    out.push_back(__NR_getpid);
    out.push_back(__NR_gettid);
    out.push_back(__NR_getrandom);
    // Signals and exit
    out.push_back(__NR_rt_sigaction);
    out.push_back(__NR_rt_sigprocmask);
    out.push_back(__NR_rt_sigreturn);
    out.push_back(__NR_sigaltstack);
    out.push_back(__NR_tgkill);
    out.push_back(__NR_exit);
    out.push_back(__NR_exit_group);
#endif
    return out;
}

std::string install() {
#ifdef __linux__
    if (!kKnownArch) return "seccomp filter not available for this architecture";

    std::vector<sock_filter> program;
    program.push_back(BPF_STMT(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, arch)));
    program.push_back(BPF_JUMP(BPF_JMP | BPF_JEQ | BPF_K, kAuditArch, 1, 0));
    program.push_back(BPF_STMT(BPF_RET | BPF_K, SECCOMP_RET_KILL_PROCESS));
    program.push_back(BPF_STMT(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, nr)));
    program.push_back(BPF_JUMP(BPF_JMP | BPF_JGE | BPF_K, kX32SyscallBit, 0, 1));
    program.push_back(BPF_STMT(BPF_RET | BPF_K, SECCOMP_RET_KILL_PROCESS));
    for (int nr : allowedSyscalls()) {
        program.push_back(BPF_JUMP(BPF_JMP | BPF_JEQ | BPF_K, static_cast<unsigned>(nr), 0, 1));
        program.push_back(BPF_STMT(BPF_RET | BPF_K, SECCOMP_RET_ALLOW));
    }
    program.push_back(BPF_STMT(BPF_RET | BPF_K, SECCOMP_RET_ERRNO | (EPERM & SECCOMP_RET_DATA)));

    sock_fprog prog{};
    prog.len = static_cast<unsigned short>(program.size());
    prog.filter = program.data();
    if (prctl(PR_SET_SECCOMP, SECCOMP_MODE_FILTER, &prog, 0, 0) != 0) {
        return std::string("seccomp filter not applied: ") + std::strerror(errno);
    }
    return {};
#else
    return "seccomp filter requires Linux";
#endif
}

} // namespace SyscallFilter
} // namespace Tabula
