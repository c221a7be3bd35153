// ---------------------------------------------------------------------------
// uds_server.cpp
//
// UdsServer 구현. 요청 파싱은 yaml-cpp (JSON 은 YAML flow 문법의 부분집합),
// 응답 직렬화는 json_writer.
//
// [지원 커맨드]
//   "grade"    : GradingProtocol::grade → 결과 또는 실패 응답
//   "validate" : PolicyValidator::validate (러너를 띄우지 않음)
//   "metrics"  : CodeMetrics::summarize (+ previous 가 있으면 refactor 판정)
//   "stats"    : GradeStatsSnapshot
//   기타/누락   : status 400
// ---------------------------------------------------------------------------

#include "server/uds_server.hpp"

#include "protocol/frame.hpp"
#include "server/json_writer.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace {

std::optional<std::string> string_field(const YAML::Node& root, const char* key) {
    const YAML::Node node = root[key];
    if (!node || !node.IsScalar()) {
        return std::nullopt;
    }
    return node.as<std::string>();
}

std::string handle_grade(const YAML::Node& root, const GradingProtocol& protocol,
                         GradeStats& stats, StructuredLogger* events) {
    const auto submission = string_field(root, "submission");
    const auto grader     = string_field(root, "grader");
    if (!submission || !grader) {
        return make_bad_request_response("grade requires string fields 'submission' and 'grader'");
    }
    const std::string request_id = string_field(root, "request_id").value_or("");

    stats.on_request();
    const auto started = std::chrono::steady_clock::now();
    GradeTrace trace{};
    auto result = protocol.grade(*submission, *grader, &trace);
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    if (trace.sandbox_launched) {
        stats.on_sandbox_launch();
    }

    if (!result) {
        stats.on_failed(result.error().kind);
        if (events != nullptr) {
            events->log_failure(FailureLog{
                .request_id     = request_id,
                .kind           = result.error().kind,
                .stage          = result.error().stage,
                .detail         = result.error().detail,
                .exception_type = result.error().exception_type,
                .duration       = elapsed,
                .timestamp      = std::chrono::system_clock::now(),
            });
        }
        return make_error_response(result.error());
    }

    stats.on_graded(*result);
    if (events != nullptr) {
        events->log_grade(GradeLog{
            .request_id      = request_id,
            .score           = result->score,
            .max_score       = result->max_score,
            .probes_complete = !result->diagnostics || result->diagnostics->probes_complete,
            .duration        = elapsed,
            .timestamp       = std::chrono::system_clock::now(),
        });
    }
    return make_ok_response(to_json(*result));
}

std::string handle_validate(const YAML::Node& root, const PolicyValidator& validator) {
    const auto source = string_field(root, "source");
    if (!source) {
        return make_bad_request_response("validate requires string field 'source'");
    }
    auto parsed = validator.validate(*source);
    if (!parsed) {
        return make_error_response(parsed.error());
    }
    return make_ok_response(make_validation_payload(parsed->nodes().size()));
}

std::optional<MetricsSummary> previous_summary(const YAML::Node& root) {
    const YAML::Node p = root["previous"];
    if (!p || !p.IsMap()) {
        return std::nullopt;
    }
    MetricsSummary s{};
    s.complexity     = p["complexity"].as<int>(0);
    s.coverage       = p["coverage"].as<double>(0.0);
    s.duplication    = p["duplication"].as<double>(0.0);
    s.has_type_hints = p["has_type_hints"].as<bool>(false);
    s.has_docstring  = p["has_docstring"].as<bool>(false);
    s.lines_of_code  = p["lines_of_code"].as<std::uint32_t>(0);
    return s;
}

std::string handle_metrics(const YAML::Node& root, const CodeMetrics& metrics) {
    const auto source = string_field(root, "source");
    if (!source) {
        return make_bad_request_response("metrics requires string field 'source'");
    }
    const std::string test_source = string_field(root, "test_source").value_or("");
    const MetricsSummary summary = metrics.summarize(*source, test_source);
    const RefactorAssessment refactor = CodeMetrics::assess_refactor(
        previous_summary(root), summary, root["passed"].as<bool>(false));

    return make_ok_response(fmt::format(R"({{"summary":{},"refactor":{}}})",
                                        to_json(summary), to_json(refactor)));
}

} // namespace

// ---------------------------------------------------------------------------
// UdsServer 생성자/소멸자
// ---------------------------------------------------------------------------
UdsServer::UdsServer(const std::filesystem::path&      socket_path,
                     const GradingProtocol&            protocol,
                     std::shared_ptr<GradeStats>       stats,
                     std::shared_ptr<StructuredLogger> events,
                     asio::io_context&                 ioc,
                     asio::thread_pool&                workers)
    : socket_path_{socket_path}
    , protocol_{protocol}
    , stats_{std::move(stats)}
    , events_{std::move(events)}
    , ioc_{ioc}
    , workers_{workers}
    , acceptor_{ioc}
{}

UdsServer::~UdsServer() {
    stop();
}

// ---------------------------------------------------------------------------
// stop
//   acceptor 소유 스레드(io_context)에서 정리한다.
// ---------------------------------------------------------------------------
void UdsServer::stop() {
    if (stop_requested_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    auto close_acceptor = [this]() {
        boost::system::error_code cancel_ec;
        acceptor_.cancel(cancel_ec);
        if (cancel_ec && cancel_ec != asio::error::bad_descriptor) {
            spdlog::warn("[uds_server] stop: acceptor cancel error: {}", cancel_ec.message());
        }

        boost::system::error_code close_ec;
        acceptor_.close(close_ec);
        if (close_ec && close_ec != asio::error::bad_descriptor) {
            spdlog::warn("[uds_server] stop: acceptor close error: {}", close_ec.message());
        }
    };

    if (ioc_.stopped()) {
        close_acceptor();
        return;
    }
    asio::post(ioc_, std::move(close_acceptor));
}

// ---------------------------------------------------------------------------
// run
//   기존 소켓 파일 제거 → bind/listen → accept 루프.
// ---------------------------------------------------------------------------
asio::awaitable<void> UdsServer::run() {
    using stream_protocol = asio::local::stream_protocol;

    if (stop_requested_.load(std::memory_order_acquire)) {
        co_return;
    }

    std::error_code fs_ec;
    std::filesystem::remove(socket_path_, fs_ec);
    if (fs_ec && fs_ec != std::make_error_code(std::errc::no_such_file_or_directory)) {
        spdlog::error("[uds_server] failed to remove old socket {}: {}",
                      socket_path_.string(), fs_ec.message());
        co_return;
    }

    boost::system::error_code ec;
    acceptor_.open(stream_protocol(), ec);
    if (ec) {
        spdlog::error("[uds_server] open error: {}", ec.message());
        co_return;
    }

    acceptor_.bind(stream_protocol::endpoint{socket_path_.string()}, ec);
    if (ec) {
        spdlog::error("[uds_server] bind error on {}: {}", socket_path_.string(), ec.message());
        co_return;
    }

    acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    if (ec) {
        spdlog::error("[uds_server] listen error: {}", ec.message());
        co_return;
    }

    spdlog::info("[uds_server] listening on {}", socket_path_.string());

    for (;;) {
        if (stop_requested_.load(std::memory_order_acquire)) {
            co_return;
        }

        stream_protocol::socket client_socket{ioc_};
        boost::system::error_code accept_ec;
        co_await acceptor_.async_accept(
            client_socket, asio::redirect_error(asio::use_awaitable, accept_ec));

        if (accept_ec) {
            if (accept_ec == asio::error::operation_aborted ||
                accept_ec == boost::system::errc::bad_file_descriptor) {
                spdlog::info("[uds_server] accept loop stopped");
            } else {
                spdlog::error("[uds_server] accept error: {}", accept_ec.message());
            }
            co_return;
        }

        // 클라이언트 처리 코루틴을 독립적으로 spawn (실패가 서버에 영향 없음)
        asio::co_spawn(ioc_, handle_client(std::move(client_socket)), asio::detached);
    }
}

asio::awaitable<std::string> UdsServer::dispatch_on_worker(std::string body) const {
    co_return dispatch(body);
}

// ---------------------------------------------------------------------------
// handle_client
//   1. 4바이트 LE 헤더로 요청 크기 읽기
//   2. JSON 바디 읽기
//   3. 워커 풀에서 커맨드 처리
//   4. 4바이트 LE 헤더 + JSON 바디 응답 송신
// ---------------------------------------------------------------------------
asio::awaitable<void> UdsServer::handle_client(asio::local::stream_protocol::socket socket) {
    std::array<std::uint8_t, 4> req_hdr{};
    boost::system::error_code   ec;
    co_await asio::async_read(socket, asio::buffer(req_hdr),
                              asio::redirect_error(asio::use_awaitable, ec));
    if (ec) {
        if (ec != asio::error::eof) {
            spdlog::warn("[uds_server] handle_client: read header error: {}", ec.message());
        }
        co_return;
    }

    const std::uint32_t body_len = decode_le4(req_hdr);
    if (body_len == 0 || body_len > kMaxRequestSize) {
        spdlog::warn("[uds_server] handle_client: invalid body length {}", body_len);
        co_return;
    }

    std::string body(body_len, '\0');
    const std::size_t body_n = co_await asio::async_read(
        socket, asio::buffer(body), asio::redirect_error(asio::use_awaitable, ec));
    if (ec || body_n != body_len) {
        spdlog::warn("[uds_server] handle_client: short body ({}/{} bytes): {}",
                     body_n, body_len, ec.message());
        co_return;
    }

    const std::string response_body = co_await asio::co_spawn(
        workers_.get_executor(), dispatch_on_worker(std::move(body)), asio::use_awaitable);

    const auto resp_hdr = encode_le4(static_cast<std::uint32_t>(response_body.size()));
    std::array<asio::const_buffer, 2> bufs{
        asio::buffer(resp_hdr),
        asio::buffer(response_body),
    };
    const std::size_t write_n = co_await asio::async_write(
        socket, bufs, asio::redirect_error(asio::use_awaitable, ec));
    if (ec) {
        spdlog::warn("[uds_server] handle_client: write error: {}", ec.message());
        co_return;
    }

    spdlog::debug("[uds_server] handled request response_bytes={}", write_n);
}

// ---------------------------------------------------------------------------
// dispatch
//   yaml-cpp 예외는 여기서 400 응답으로 변환된다.
// ---------------------------------------------------------------------------
std::string UdsServer::dispatch(std::string_view request_json) const {
    YAML::Node root;
    try {
        root = YAML::Load(std::string{request_json});
    } catch (const YAML::Exception& ex) {
        spdlog::warn("[uds_server] malformed request body: {}", ex.what());
        return make_bad_request_response("malformed JSON body");
    }
    if (!root.IsMap()) {
        return make_bad_request_response("request body must be a JSON object");
    }

    const auto cmd = string_field(root, "command");
    if (!cmd || cmd->empty()) {
        spdlog::warn("[uds_server] missing or malformed 'command' field");
        return make_bad_request_response("missing or malformed 'command' field");
    }

    try {
        if (*cmd == "grade") {
            return handle_grade(root, protocol_, *stats_, events_.get());
        }
        if (*cmd == "validate") {
            return handle_validate(root, protocol_.validator());
        }
        if (*cmd == "metrics") {
            return handle_metrics(root, metrics_);
        }
        if (*cmd == "stats") {
            return make_ok_response(to_json(stats_->snapshot()));
        }
    } catch (const YAML::Exception& ex) {
        spdlog::warn("[uds_server] command '{}': bad field: {}", *cmd, ex.what());
        return make_bad_request_response(fmt::format("command '{}': {}", *cmd, ex.what()));
    }

    spdlog::warn("[uds_server] unknown command '{}'", *cmd);
    return make_bad_request_response(fmt::format("unknown command '{}'", *cmd));
}
