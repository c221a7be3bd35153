#pragma once

// ---------------------------------------------------------------------------
// uds_server.hpp
//
// Unix Domain Socket 채점 서버. 외부 계층(학습 플랫폼 백엔드)이 채점/검증/
// 지표/통계를 요청하는 유일한 네트워크 표면이다.
//
// [프로토콜: 길이 프리픽스 + JSON]
//   요청 프레임: [4byte LE 길이][JSON 본문]
//     {"command":"grade","submission":"...","grader":"...","request_id":"..."}
//     {"command":"validate","source":"..."}
//     {"command":"metrics","source":"...","test_source":"...",
//      "previous":{...MetricsSummary...},"passed":true}
//     {"command":"stats"}
//   응답 프레임: [4byte LE 길이][JSON 본문]  (스키마는 json_writer.hpp)
//   연결 하나에 요청 하나. 응답 후 서버가 소켓을 닫는다.
//
// [스레드/비동기 모델]
//   accept/read/write 는 io_context 코루틴. 커맨드 처리(파싱, 채점)는
//   외부에서 주입한 thread_pool 에서 수행되므로 accept 루프가 채점 시간
//   동안 막히지 않는다. 채점 호출 하나는 워커 하나를 러너 종료까지 점유한다.
//
// [fail-close]
//   본문 길이 0 또는 kMaxRequestSize 초과 → 응답 없이 연결 종료.
//   JSON 파싱 실패/필드 누락 → status 400 응답.
// ---------------------------------------------------------------------------

#include "grading/grading_protocol.hpp"
#include "logger/structured_logger.hpp"
#include "metrics/code_metrics.hpp"
#include "stats/grade_stats.hpp"

#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace asio = boost::asio;

class UdsServer {
public:
    // 생성자
    //   protocol : 채점 상태 기계 (const, 워커 간 공유)
    //   stats    : 공유 통계 수집기
    //   events   : 구조화 이벤트 로거 (nullptr 이면 기록하지 않음)
    //   ioc      : accept/IO 용 io_context
    //   workers  : 커맨드 처리용 스레드 풀
    UdsServer(const std::filesystem::path&      socket_path,
              const GradingProtocol&            protocol,
              std::shared_ptr<GradeStats>       stats,
              std::shared_ptr<StructuredLogger> events,
              asio::io_context&                 ioc,
              asio::thread_pool&                workers);

    ~UdsServer();

    UdsServer(const UdsServer&)            = delete;
    UdsServer& operator=(const UdsServer&) = delete;
    UdsServer(UdsServer&&)                 = delete;
    UdsServer& operator=(UdsServer&&)      = delete;

    // run
    //   소켓 바인드/리슨 후 accept 루프. stop() 또는 accept 오류까지 유지.
    asio::awaitable<void> run();

    // stop
    //   acceptor 를 닫아 run() 의 accept 루프를 종료한다.
    void stop();

    // dispatch
    //   요청 본문 하나 → 응답 본문 하나. 예외를 던지지 않는다.
    //   워커 스레드에서 호출된다 (CLI 에서 직접 호출 가능).
    [[nodiscard]] std::string dispatch(std::string_view request_json) const;

private:
    asio::awaitable<void> handle_client(asio::local::stream_protocol::socket socket);
    asio::awaitable<std::string> dispatch_on_worker(std::string body) const;

    std::filesystem::path                  socket_path_;
    const GradingProtocol&                 protocol_;
    CodeMetrics                            metrics_;
    std::shared_ptr<GradeStats>            stats_;
    std::shared_ptr<StructuredLogger>      events_;
    asio::io_context&                      ioc_;
    asio::thread_pool&                     workers_;
    asio::local::stream_protocol::acceptor acceptor_;
    std::atomic<bool>                      stop_requested_{false};
};
