#pragma once

// ---------------------------------------------------------------------------
// structured_logger.hpp
//
// spdlog 기반 구조화 이벤트 로거.
//
// [설계 원칙]
// - 싱글턴 금지: 생성자 주입 방식으로 의존성을 명시적으로 표현한다.
// - spdlog 기본 로거(진단 로그)와 별개의 logger 인스턴스를 보유한다.
//   싱크: stdout + rotating file (100MB x 3).
//
// [JSON 스키마]
//   {"event":"grade_completed","request_id":"...","score":N,"max_score":N,
//    "probes_complete":true,"duration_ms":N,"timestamp":"ISO8601"}
//   {"event":"grade_failed"|"contract_violation","request_id":"...",
//    "kind":"...","stage":"...","detail":"...","exception_type":"...",
//    "operator_fault":bool,"duration_ms":N,"timestamp":"ISO8601"}
//   LogFormat::kText 이면 같은 필드를 key=value 한 줄로 기록한다.
// ---------------------------------------------------------------------------

#include "log_types.hpp"

#include <filesystem>
#include <memory>
#include <string_view>

namespace spdlog {
class logger;
} // namespace spdlog

class StructuredLogger {
public:
    // 생성자
    //   min_level : 이 레벨 미만의 로그는 기록하지 않는다.
    //   log_path  : 로그 파일 경로 (디렉터리가 아닌 파일 경로)
    //   싱크 생성 실패 시 std::runtime_error.
    StructuredLogger(LogLevel min_level, const std::filesystem::path& log_path,
                     LogFormat format = LogFormat::kJson);

    ~StructuredLogger();

    // 복사 금지 (spdlog 인스턴스 소유권 명확화)
    StructuredLogger(const StructuredLogger&)            = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;

    StructuredLogger(StructuredLogger&&) noexcept;
    StructuredLogger& operator=(StructuredLogger&&) noexcept;

    void log_grade(const GradeLog& entry);

    // log_failure
    //   ContractViolation 은 error, InternalError 는 warn, 그 외는 info.
    void log_failure(const FailureLog& entry);

    void flush();

    // 내부 진단용 spdlog 래퍼
    //   학습자 데이터(소스, 출력)를 직접 전달하지 말 것.
    void debug(std::string_view msg);
    void info(std::string_view msg);
    void warn(std::string_view msg);
    void error(std::string_view msg);

private:
    [[nodiscard]] bool enabled(LogLevel level) const noexcept {
        return logger_ != nullptr && static_cast<int>(level) >= static_cast<int>(min_level_);
    }

    LogLevel                        min_level_;
    LogFormat                       format_;
    std::filesystem::path           log_path_;
    std::shared_ptr<spdlog::logger> logger_;
};
