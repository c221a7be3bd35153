// ---------------------------------------------------------------------------
// gradegate-runner
//
// 호스트(gradegate)가 채점 호출마다 fork+execve 하는 샌드박스 자식 프로세스.
// 사용자가 직접 실행하는 프로그램이 아니다.
//
//   fd 0 : 요청 프레임 1개 (RunnerRequest, YAML)
//   fd 1 : 파이썬 레벨 stdout (학습자 출력은 캡처되므로 평소에는 비어 있음)
//   fd 2 : 러너 진단 로그 (spdlog). 호스트가 읽어 자신의 로그로 옮긴다.
//   fd 3 : 이벤트 프레임 (RunnerEvent, YAML)
//
// 종료 코드: 0 = 판정 전송, 2 = 요청 수신/이벤트 전송/격리 실패
// ---------------------------------------------------------------------------

#include "parser/python_runtime.hpp"
#include "protocol/frame.hpp"
#include "protocol/runner_message.hpp"
#include "runner/isolation.hpp"
#include "runner/runner_job.hpp"

#include <cstdlib>
#include <string>

#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

namespace {

constexpr int kRequestFd = 0;
constexpr int kEventFd   = 3;
constexpr int kExitProtocol = 2;

bool send_event(const RunnerEvent& event) {
    const auto written = write_frame(kEventFd, encode_event(event));
    if (!written) {
        spdlog::error("[runner] event write failed: {}", to_string(written.error()));
        return false;
    }
    return true;
}

int send_internal_failure(const std::string& detail) {
    GradeFailure f{};
    f.kind   = FailureKind::kInternalError;
    f.detail = detail;
    RunnerEvent event{};
    event.type    = RunnerEventType::kFailure;
    event.failure = std::move(f);
    (void)send_event(event);
    return kExitProtocol;
}

} // namespace

int main(int /*argc*/, char* /*argv*/[]) {
    spdlog::set_default_logger(spdlog::stderr_logger_mt("gradegate-runner"));
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [runner] [%l] %v");

    // ── 요청 수신 ───────────────────────────────────────────────────────
    auto frame = read_frame(kRequestFd, kMaxRunnerFrameSize);
    if (!frame) {
        spdlog::error("[runner] request read failed: {}", to_string(frame.error()));
        return send_internal_failure("runner: request frame " + std::string{to_string(frame.error())});
    }
    auto request = decode_request(*frame);
    if (!request) {
        spdlog::error("[runner] {}", request.error());
        return send_internal_failure("runner: " + request.error());
    }
    spdlog::set_level(spdlog::level::from_str(request->policy.global.log_level));

    const SandboxLimits& limits = request->policy.sandbox;

    // ── 격리 (인터프리터 초기화 전: 단일 스레드) ─────────────────────────
    if (limits.network_isolation) {
        (void)isolate_network();
    }

    // ── 인터프리터 ──────────────────────────────────────────────────────
    if (auto init = PythonRuntime::initialize(InterpreterMode::kRunner); !init) {
        spdlog::error("[runner] {}", init.error());
        return send_internal_failure("runner: " + init.error());
    }

    // ── seccomp (학습자 코드 실행 전) ───────────────────────────────────
    if (limits.seccomp) {
        if (auto installed = install_seccomp(); !installed) {
            spdlog::error("[runner] {}", installed.error());
            return send_internal_failure("runner: " + installed.error());
        }
    }

    RunnerJob job{*request, &send_event};
    const int rc = job.run();
    spdlog::debug("[runner] exiting with {}", rc);
    return rc == 0 ? EXIT_SUCCESS : kExitProtocol;
}
