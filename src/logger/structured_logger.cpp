// ---------------------------------------------------------------------------
// structured_logger.cpp
//
// spdlog 기반 구조화 이벤트 로거 구현.
// ---------------------------------------------------------------------------

#include "logger/structured_logger.hpp"

#include "server/json_writer.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <spdlog/common.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

namespace {

constexpr std::size_t kMaxFileSize = 100u * 1024u * 1024u;  // 100MB
constexpr std::size_t kMaxFiles    = 3;

// ---------------------------------------------------------------------------
// Helper: ISO8601 timestamp 포맷 (UTC, 밀리초)
// ---------------------------------------------------------------------------
std::string format_iso8601(const std::chrono::system_clock::time_point& tp) {
    const auto duration = tp.time_since_epoch();
    const auto seconds  = std::chrono::duration_cast<std::chrono::seconds>(duration);
    const auto millis   = std::chrono::duration_cast<std::chrono::milliseconds>(duration) - seconds;

    const std::time_t time_t_val = std::chrono::system_clock::to_time_t(tp);
    std::tm           tm_val{};
    ::gmtime_r(&time_t_val, &tm_val);

    std::ostringstream oss;
    oss << std::put_time(&tm_val, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0')
        << std::setw(3) << millis.count() << 'Z';
    return oss.str();
}

spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::kDebug: return spdlog::level::debug;
        case LogLevel::kInfo:  return spdlog::level::info;
        case LogLevel::kWarn:  return spdlog::level::warn;
        case LogLevel::kError: return spdlog::level::err;
    }
    return spdlog::level::info;
}

} // namespace

std::optional<LogLevel> log_level_from_string(std::string_view name) noexcept {
    if (name == "trace" || name == "debug") {
        return LogLevel::kDebug;
    }
    if (name == "info") {
        return LogLevel::kInfo;
    }
    if (name == "warn" || name == "warning") {
        return LogLevel::kWarn;
    }
    if (name == "error" || name == "critical") {
        return LogLevel::kError;
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// StructuredLogger 생성자
//   전역 레지스트리에 등록하지 않는다 (여러 인스턴스가 공존할 수 있음).
// ---------------------------------------------------------------------------
StructuredLogger::StructuredLogger(LogLevel min_level, const std::filesystem::path& log_path,
                                   LogFormat format)
    : min_level_(min_level)
    , format_(format)
    , log_path_(log_path)
{
    try {
        if (log_path_.has_parent_path()) {
            std::filesystem::create_directories(log_path_.parent_path());
        }

        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_sink_mt>());
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_path_.string(), kMaxFileSize, kMaxFiles));

        logger_ = std::make_shared<spdlog::logger>("gradegate.events", sinks.begin(), sinks.end());
        logger_->set_level(to_spdlog_level(min_level));

        // 구조화 로그는 각 메서드에서 본문을 만든다.
        logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] %v");
        logger_->flush_on(spdlog::level::warn);
    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    } catch (const std::filesystem::filesystem_error& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    }
}

StructuredLogger::~StructuredLogger() {
    if (logger_) {
        logger_->flush();
    }
}

StructuredLogger::StructuredLogger(StructuredLogger&&) noexcept            = default;
StructuredLogger& StructuredLogger::operator=(StructuredLogger&&) noexcept = default;

void StructuredLogger::log_grade(const GradeLog& entry) {
    if (!enabled(LogLevel::kInfo)) {
        return;
    }

    std::ostringstream line;
    if (format_ == LogFormat::kJson) {
        line << R"({"event":"grade_completed","request_id":")" << json_escape(entry.request_id)
             << R"(","score":)" << entry.score << R"(,"max_score":)" << entry.max_score
             << R"(,"probes_complete":)" << (entry.probes_complete ? "true" : "false")
             << R"(,"duration_ms":)" << entry.duration.count() << R"(,"timestamp":")"
             << format_iso8601(entry.timestamp) << R"("})";
    } else {
        line << "event=grade_completed request_id=" << entry.request_id
             << " score=" << entry.score << '/' << entry.max_score
             << " probes_complete=" << (entry.probes_complete ? "true" : "false")
             << " duration_ms=" << entry.duration.count();
    }
    logger_->info(line.str());
}

void StructuredLogger::log_failure(const FailureLog& entry) {
    const bool operator_fault = entry.kind == FailureKind::kContractViolation;
    const LogLevel level = operator_fault                              ? LogLevel::kError
                         : entry.kind == FailureKind::kInternalError ? LogLevel::kWarn
                                                                     : LogLevel::kInfo;
    if (!enabled(level)) {
        return;
    }

    const char* event = operator_fault ? "contract_violation" : "grade_failed";

    std::ostringstream line;
    if (format_ == LogFormat::kJson) {
        line << R"({"event":")" << event << R"(","request_id":")" << json_escape(entry.request_id)
             << R"(","kind":")" << to_string(entry.kind) << R"(","stage":")"
             << to_string(entry.stage) << R"(","detail":")" << json_escape(entry.detail)
             << R"(","exception_type":")" << json_escape(entry.exception_type)
             << R"(","operator_fault":)" << (operator_fault ? "true" : "false")
             << R"(,"duration_ms":)" << entry.duration.count() << R"(,"timestamp":")"
             << format_iso8601(entry.timestamp) << R"("})";
    } else {
        line << "event=" << event << " request_id=" << entry.request_id
             << " kind=" << to_string(entry.kind) << " stage=" << to_string(entry.stage)
             << " detail=" << entry.detail
             << " operator_fault=" << (operator_fault ? "true" : "false");
    }

    switch (level) {
        case LogLevel::kError: logger_->error(line.str()); break;
        case LogLevel::kWarn:  logger_->warn(line.str());  break;
        default:               logger_->info(line.str());  break;
    }
}

void StructuredLogger::flush() {
    if (logger_) {
        logger_->flush();
    }
}

// ---------------------------------------------------------------------------
// 내부 진단용 spdlog 래퍼
// ---------------------------------------------------------------------------
void StructuredLogger::debug(std::string_view msg) {
    if (logger_) {
        logger_->debug(msg);
    }
}

void StructuredLogger::info(std::string_view msg) {
    if (logger_) {
        logger_->info(msg);
    }
}

void StructuredLogger::warn(std::string_view msg) {
    if (logger_) {
        logger_->warn(msg);
    }
}

void StructuredLogger::error(std::string_view msg) {
    if (logger_) {
        logger_->error(msg);
    }
}
