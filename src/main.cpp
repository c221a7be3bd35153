#include "grading/grading_protocol.hpp"
#include "logger/structured_logger.hpp"
#include "metrics/code_metrics.hpp"
#include "parser/python_runtime.hpp"
#include "policy/policy_loader.hpp"
#include "server/json_writer.hpp"
#include "server/uds_server.hpp"
#include "stats/grade_stats.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/thread_pool.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>

// ---------------------------------------------------------------------------
// Helper: 환경변수 읽기 (없으면 기본값 반환)
// ---------------------------------------------------------------------------
namespace {

std::string env_str(const char* name, std::string default_val) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val != nullptr && val[0] != '\0') {
        return val;
    }
    return default_val;
}

std::uint32_t env_u32(const char* name, std::uint32_t default_val) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val == nullptr || val[0] == '\0') {
        return default_val;
    }
    try {
        const long parsed = std::stol(val);
        if (parsed < 0) {
            spdlog::warn("env {}: negative value {}, using default {}", name, parsed, default_val);
            return default_val;
        }
        return static_cast<std::uint32_t>(parsed);
    } catch (const std::exception&) {
        spdlog::warn("env {}: invalid value '{}', using default {}", name, val, default_val);
        return default_val;
    }
}

std::optional<std::string> read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        spdlog::error("cannot open {}", path.string());
        return std::nullopt;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

// 이름만 주어진 러너는 gradegate 실행 파일과 같은 디렉터리에서 찾는다.
std::string resolve_runner_path(const std::string& configured) {
    if (configured.find('/') != std::string::npos) {
        return configured;
    }
    std::error_code ec;
    const auto self = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) {
        spdlog::warn("cannot resolve /proc/self/exe: {}", ec.message());
        return configured;
    }
    return (self.parent_path() / configured).string();
}

void print_usage() {
    std::fprintf(stderr,
                 "usage: gradegate [serve]\n"
                 "       gradegate grade <submission.py> <grader.py>\n"
                 "       gradegate validate <file.py>\n"
                 "       gradegate metrics <file.py> [tests.py]\n");
}

// ---------------------------------------------------------------------------
// serve
//   UDS 서버 실행. SIGINT/SIGTERM 으로 종료.
// ---------------------------------------------------------------------------
int serve(const GradingProtocol& protocol, const Policy& policy) {
    const std::string socket_path = env_str("GRADEGATE_SOCKET_PATH", "/tmp/gradegate.sock");
    const std::string log_path    = env_str("GRADEGATE_LOG_PATH",    "/tmp/gradegate.log");
    const std::uint32_t hw        = std::max(1u, std::thread::hardware_concurrency());
    const std::uint32_t workers_n = std::max<std::uint32_t>(1, env_u32("GRADEGATE_WORKERS", hw));

    const LogLevel level = log_level_from_string(policy.global.log_level).value_or(LogLevel::kInfo);
    const LogFormat format = policy.global.log_format == "text" ? LogFormat::kText
                                                                : LogFormat::kJson;
    std::shared_ptr<StructuredLogger> events;
    try {
        events = std::make_shared<StructuredLogger>(level, log_path, format);
    } catch (const std::runtime_error& ex) {
        spdlog::error("{}", ex.what());
        return EXIT_FAILURE;
    }

    spdlog::info("Starting gradegate");
    spdlog::info("UDS socket: {}", socket_path);
    spdlog::info("Event log: {}", log_path);
    spdlog::info("Workers: {}", workers_n);
    spdlog::info("Runner: {}", policy.sandbox.runner_path);

    boost::asio::io_context   ioc;
    boost::asio::thread_pool  workers{workers_n};
    auto                      stats = std::make_shared<GradeStats>();
    UdsServer server{socket_path, protocol, stats, events, ioc, workers};

    boost::asio::signal_set signals{ioc, SIGINT, SIGTERM};
    signals.async_wait([&server](const boost::system::error_code& ec, int signo) {
        if (!ec) {
            spdlog::info("signal {} received, stopping", signo);
            server.stop();
        }
    });

    boost::asio::co_spawn(ioc, server.run(), boost::asio::detached);
    ioc.run();
    workers.join();

    spdlog::info("gradegate stopped");
    events->flush();
    return EXIT_SUCCESS;
}

int grade_once(const GradingProtocol& protocol, const char* submission_path,
               const char* grader_path) {
    const auto submission = read_file(submission_path);
    const auto grader     = read_file(grader_path);
    if (!submission || !grader) {
        return EXIT_FAILURE;
    }
    auto result = protocol.grade(*submission, *grader);
    if (!result) {
        std::cout << make_error_response(result.error()) << '\n';
        return EXIT_FAILURE;
    }
    std::cout << make_ok_response(to_json(*result)) << '\n';
    return EXIT_SUCCESS;
}

int validate_once(const GradingProtocol& protocol, const char* path) {
    const auto source = read_file(path);
    if (!source) {
        return EXIT_FAILURE;
    }
    auto parsed = protocol.validator().validate(*source);
    if (!parsed) {
        std::cout << make_error_response(parsed.error()) << '\n';
        return EXIT_FAILURE;
    }
    std::cout << make_ok_response(make_validation_payload(parsed->nodes().size())) << '\n';
    return EXIT_SUCCESS;
}

int metrics_once(const char* path, const char* test_path) {
    const auto source = read_file(path);
    if (!source) {
        return EXIT_FAILURE;
    }
    std::string test_source;
    if (test_path != nullptr) {
        auto loaded = read_file(test_path);
        if (!loaded) {
            return EXIT_FAILURE;
        }
        test_source = std::move(*loaded);
    }
    const CodeMetrics metrics;
    std::cout << make_ok_response(to_json(metrics.summarize(*source, test_source))) << '\n';
    return EXIT_SUCCESS;
}

} // namespace

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------
int main(int argc, char* argv[]) {
    // 진단 로그는 stderr (stdout 은 CLI JSON 출력과 이벤트 로그용)
    spdlog::set_default_logger(spdlog::stderr_color_mt("gradegate"));

    const std::string mode = argc > 1 ? argv[1] : "serve";

    // ── 설정 로드 (fail-close) ──────────────────────────────────────────
    const std::string policy_path = env_str("GRADEGATE_POLICY_PATH", "config/policy.yaml");
    auto loaded = PolicyLoader::load(policy_path);
    if (!loaded) {
        spdlog::error("policy load failed ({}): {}", policy_path, loaded.error());
        return EXIT_FAILURE;
    }
    Policy policy = std::move(*loaded);
    policy.global.log_level   = env_str("GRADEGATE_LOG_LEVEL", policy.global.log_level);
    policy.sandbox.runner_path = resolve_runner_path(
        env_str("GRADEGATE_RUNNER_PATH", policy.sandbox.runner_path));
    spdlog::set_level(spdlog::level::from_str(policy.global.log_level));

    if (auto init = PythonRuntime::initialize(InterpreterMode::kHost); !init) {
        spdlog::error("{}", init.error());
        return EXIT_FAILURE;
    }

    const GradingProtocol protocol{policy};

    if (mode == "serve") {
        return serve(protocol, policy);
    }
    if (mode == "grade" && argc == 4) {
        return grade_once(protocol, argv[2], argv[3]);
    }
    if (mode == "validate" && argc == 3) {
        return validate_once(protocol, argv[2]);
    }
    if (mode == "metrics" && (argc == 3 || argc == 4)) {
        return metrics_once(argv[2], argc == 4 ? argv[3] : nullptr);
    }
    print_usage();
    return EXIT_FAILURE;
}
