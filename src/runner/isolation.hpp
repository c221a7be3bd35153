#pragma once

// ---------------------------------------------------------------------------
// isolation.hpp
//
// gradegate-runner 프로세스 자체에 적용하는 OS 레벨 격리.
// (rlimit, 프로세스 그룹, PDEATHSIG, NO_NEW_PRIVS 는 호스트가 fork 직후
//  execve 전에 이미 적용한다. 여기서는 실행 중인 러너가 스스로 거는 것만.)
//
// [적용 순서]
//   1. isolate_network()  : 파이썬 초기화 전 (단일 스레드 조건 필요)
//   2. install_seccomp()  : 파이썬 초기화 후, 학습자 코드 실행 전
//
// [seccomp 정책]
// denylist + EPERM. 파이썬 인터프리터와 numpy 가 쓰는 일반 시스템 호출은
// 허용하고, 샌드박스 탈출/외부 통신/다른 프로세스 조작 벡터만 막는다.
//   - socket/socketpair/connect/bind/listen/accept/accept4
//   - execve/execveat, fork/vfork, clone (CLONE_THREAD 없는 호출)
//   - clone3 (인자를 검사할 수 없으므로 ENOSYS, glibc 가 clone 으로 폴백)
//   - ptrace, process_vm_readv/writev, kill
//   - mount/umount2/pivot_root/chroot, unshare/setns
//   - reboot, kexec_load, init/finit/delete_module, keyctl, bpf, perf_event_open
//   - unlink(at), rename(at/at2), rmdir, mkdir(at), chmod/fchmodat, truncate,
//     link(at), symlink(at)  (파일시스템 변경)
// 아키텍처가 빌드 대상과 다르면 프로세스를 종료한다 (x32/32비트 우회 차단).
//
// [알려진 한계]
// - network 격리는 비특권 user namespace 가 허용된 커널에서만 된다.
//   실패 시 경고만 남기고 seccomp 의 socket 차단에 의존한다.
// - 파일 읽기는 막지 않는다 (파이썬 표준 라이브러리 로딩에 필요).
//   파일 쓰기는 RLIMIT_FSIZE 로, 파일 열기 경로 자체는 제출물 네임스페이스에
//   open 이 없는 것과 감사 훅(import_gate.hpp)으로 제한한다.
// ---------------------------------------------------------------------------

#include <expected>
#include <string>

// isolate_network
//   CLONE_NEWUSER | CLONE_NEWNET. 실패해도 치명적이지 않다 (false 반환 + 경고).
[[nodiscard]] bool isolate_network();

// install_seccomp
//   실패 시 오류 문자열. 호출자는 실패를 kInternalError 로 처리한다 (fail-close).
[[nodiscard]] std::expected<void, std::string> install_seccomp();
