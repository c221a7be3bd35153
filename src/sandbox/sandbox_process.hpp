#pragma once

// ---------------------------------------------------------------------------
// sandbox_process.hpp
//
// 채점 호출 하나를 위해 gradegate-runner 자식 프로세스를 띄우고,
// 요청을 보내고, 이벤트를 모으고, 단계별 마감을 강제한다.
//
// [자식 프로세스 준비 (fork 후 execve 전, async-signal-safe 호출만)]
//   - setpgid(0, 0)            : 새 프로세스 그룹 (마감 시 그룹 전체 SIGKILL)
//   - PR_SET_PDEATHSIG=SIGKILL : 호스트가 죽으면 함께 종료
//   - rlimit: AS(memory_limit_mb), CPU(전체 마감 합 + 1초), FSIZE=0, CORE=0,
//             NPROC(max_processes > 0 일 때)
//   - PR_SET_NO_NEW_PRIVS
//   - fd 0/1/2/3 재배치 후 fd 4 이상 모두 닫기
//   - chdir(work_dir), 최소 환경 변수로 execve
//   argv/envp 문자열은 fork 전에 모두 만들어 둔다.
//
// [단계별 마감 (호스트 측 wall-clock)]
//   kSubmission : 시작 → submission_done 까지  submission_timeout_ms
//   kGrader     : submission_done → result/failure 까지  grader_timeout_ms
//   kProbe      : result → 스트림 종료까지  probe_timeout_ms
//   이벤트 수신 시 타이머를 다음 단계 예산으로 다시 건다.
//   만료 시 kill(-pgid, SIGKILL).
//
// [비동기 모델]
//   호출마다 지역 io_context 를 만들고 호출 스레드에서 run() 한다.
//   코루틴 4개: 요청 writer / 이벤트 reader / 로그 drain / watchdog.
//   모든 코루틴이 끝나면 반환한다. 호출 스레드는 그 동안 블록된다
//   (UDS 서버는 이를 워커 스레드 풀에서 호출한다).
//
// [수명 보장]
//   run() 은 어떤 경로로 반환하든 프로세스 그룹에 SIGKILL 을 보내고
//   waitpid 로 자식을 회수한 뒤 반환한다 (고아/좀비 없음).
// ---------------------------------------------------------------------------

#include "common/types.hpp"
#include "policy/rule.hpp"
#include "protocol/runner_message.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

enum class SandboxPhase : std::uint8_t {
    kSubmission = 0,
    kGrader     = 1,
    kProbe      = 2,
};

[[nodiscard]] std::string_view to_string(SandboxPhase phase) noexcept;

// ---------------------------------------------------------------------------
// SandboxTranscript
//   러너 프로세스 한 번의 실행 기록 (해석 전 원자료).
//   events 는 수신 순서 그대로이며 순서 규칙을 통과한 것만 담긴다.
// ---------------------------------------------------------------------------
struct SandboxTranscript {
    pid_t                       pid{-1};
    std::vector<RunnerEvent>    events{};
    std::optional<SandboxPhase> expired_phase{};   // 마감 만료로 종료시킨 단계
    std::string                 protocol_error{};  // 프레임/역직렬화/순서 오류
    int                         exit_code{-1};     // WIFEXITED 일 때
    int                         term_signal{0};    // WIFSIGNALED 일 때
    std::string                 log_tail{};        // 러너 stderr 마지막 부분
    std::chrono::milliseconds   elapsed{0};
};

class SandboxProcess {
public:
    explicit SandboxProcess(const SandboxLimits& limits) noexcept
        : limits_(limits) {}

    // run
    //   프로세스 생성 자체가 실패하면 GradeFailure{kInternalError}.
    //   시간 초과/충돌/프로토콜 오류는 transcript 로 보고한다.
    [[nodiscard]] std::expected<SandboxTranscript, GradeFailure>
    run(const RunnerRequest& request) const;

private:
    [[nodiscard]] std::chrono::milliseconds budget(SandboxPhase phase) const noexcept;

    const SandboxLimits& limits_;
};
