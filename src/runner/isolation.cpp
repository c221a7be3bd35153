#include "runner/isolation.hpp"

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <initializer_list>
#include <vector>

#include <linux/audit.h>
#include <linux/filter.h>
#include <linux/seccomp.h>
#include <sched.h>
#include <sys/prctl.h>
#include <sys/syscall.h>

#include <spdlog/spdlog.h>

namespace {

#if defined(__x86_64__)
constexpr std::uint32_t kNativeAuditArch = AUDIT_ARCH_X86_64;
#elif defined(__aarch64__)
constexpr std::uint32_t kNativeAuditArch = AUDIT_ARCH_AARCH64;
#else
#error "gradegate-runner: unsupported architecture for the seccomp filter"
#endif

[[nodiscard]] sock_filter stmt(std::uint16_t code, std::uint32_t k) {
    return sock_filter{code, 0, 0, k};
}

[[nodiscard]] sock_filter jump(std::uint16_t code, std::uint32_t k,
                               std::uint8_t jt, std::uint8_t jf) {
    return sock_filter{code, jt, jf, k};
}

[[nodiscard]] sock_filter load_nr() {
    return stmt(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, nr));
}

[[nodiscard]] std::vector<int> denied_syscalls() {
    std::vector<int> nrs{
        __NR_socket, __NR_socketpair, __NR_connect, __NR_bind, __NR_listen,
        __NR_accept, __NR_accept4,
        __NR_execve, __NR_execveat,
        __NR_ptrace, __NR_process_vm_readv, __NR_process_vm_writev,
        __NR_kill,
        __NR_mount, __NR_umount2, __NR_pivot_root, __NR_chroot,
        __NR_unshare, __NR_setns,
        __NR_reboot, __NR_kexec_load,
        __NR_init_module, __NR_finit_module, __NR_delete_module,
        __NR_keyctl, __NR_bpf, __NR_perf_event_open,
        // 파일시스템 변경
        __NR_unlinkat, __NR_mkdirat, __NR_fchmodat,
        __NR_linkat, __NR_symlinkat, __NR_truncate,
    };
#ifdef __NR_renameat
    nrs.push_back(__NR_renameat);
#endif
#ifdef __NR_renameat2
    nrs.push_back(__NR_renameat2);
#endif
    // aarch64 에는 *at 이전 계열이 없다
#ifdef __NR_unlink
    nrs.insert(nrs.end(), {__NR_unlink, __NR_rename, __NR_rmdir, __NR_mkdir,
                           __NR_chmod, __NR_link, __NR_symlink});
#endif
#ifdef __NR_fork
    nrs.push_back(__NR_fork);
#endif
#ifdef __NR_vfork
    nrs.push_back(__NR_vfork);
#endif
    return nrs;
}

// build_filter
//   [arch 검사] → [clone: CLONE_THREAD 없으면 EPERM] → [clone3: ENOSYS]
//   → [denylist: EPERM] → ALLOW
[[nodiscard]] std::vector<sock_filter> build_filter() {
    const auto     denied = denied_syscalls();
    const auto     eperm  = static_cast<std::uint32_t>(SECCOMP_RET_ERRNO | (EPERM & SECCOMP_RET_DATA));
    std::vector<sock_filter> prog;

    prog.push_back(stmt(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, arch)));
    prog.push_back(jump(BPF_JMP | BPF_JEQ | BPF_K, kNativeAuditArch, 1, 0));
    prog.push_back(stmt(BPF_RET | BPF_K, SECCOMP_RET_KILL_PROCESS));

    // clone(flags, ...) : 스레드 생성만 허용
    prog.push_back(load_nr());
    prog.push_back(jump(BPF_JMP | BPF_JEQ | BPF_K, __NR_clone, 0, 4));
    prog.push_back(stmt(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, args)));
    prog.push_back(jump(BPF_JMP | BPF_JSET | BPF_K, CLONE_THREAD, 1, 0));
    prog.push_back(stmt(BPF_RET | BPF_K, eperm));
    prog.push_back(stmt(BPF_RET | BPF_K, SECCOMP_RET_ALLOW));

#ifdef __NR_clone3
    prog.push_back(jump(BPF_JMP | BPF_JEQ | BPF_K, __NR_clone3, 0, 1));
    prog.push_back(stmt(BPF_RET | BPF_K,
                        static_cast<std::uint32_t>(SECCOMP_RET_ERRNO | (ENOSYS & SECCOMP_RET_DATA))));
#endif

    // 일치하면 뒤쪽 EPERM 반환 명령으로 점프
    for (std::size_t i = 0; i < denied.size(); ++i) {
        const auto remaining = static_cast<std::uint8_t>(denied.size() - i);
        prog.push_back(jump(BPF_JMP | BPF_JEQ | BPF_K,
                            static_cast<std::uint32_t>(denied[i]), remaining, 0));
    }
    prog.push_back(stmt(BPF_RET | BPF_K, SECCOMP_RET_ALLOW));
    prog.push_back(stmt(BPF_RET | BPF_K, eperm));
    return prog;
}

} // namespace

bool isolate_network() {
    if (::unshare(CLONE_NEWUSER | CLONE_NEWNET) != 0) {
        spdlog::warn("[isolation] network namespace unavailable ({}), relying on seccomp",
                     std::strerror(errno));
        return false;
    }
    spdlog::debug("[isolation] network namespace isolated");
    return true;
}

std::expected<void, std::string> install_seccomp() {
    std::vector<sock_filter> prog = build_filter();

    if (::prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) {
        return std::unexpected(std::string{"PR_SET_NO_NEW_PRIVS failed: "} + std::strerror(errno));
    }

    sock_fprog fprog{};
    fprog.len    = static_cast<unsigned short>(prog.size());
    fprog.filter = prog.data();
    if (::prctl(PR_SET_SECCOMP, SECCOMP_MODE_FILTER, &fprog) != 0) {
        return std::unexpected(std::string{"seccomp filter install failed: "} + std::strerror(errno));
    }
    spdlog::debug("[isolation] seccomp filter installed ({} instructions)", prog.size());
    return {};
}
