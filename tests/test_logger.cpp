// ---------------------------------------------------------------------------
// test_logger.cpp
//
// StructuredLogger 단위 테스트
//
// [테스트 범위]
// - GradeLog / FailureLog JSON 필드
// - 실패 종류별 레벨: ContractViolation=error(operator_fault), InternalError=warn,
//   그 외=info → min_level 필터링
// - text 포맷
// - JSON 이스케이프 (따옴표, 역슬래시, 개행)
// - 상위 디렉터리 자동 생성, 멀티스레드 로깅
// - log_level_from_string
// ---------------------------------------------------------------------------

#include "logger/log_types.hpp"
#include "logger/structured_logger.hpp"

#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace {

// ---------------------------------------------------------------------------
// Helper: JSON 라인에서 최상위 필드 값 추출 (단순 구현)
// ---------------------------------------------------------------------------
class JsonLineParser {
public:
    explicit JsonLineParser(const std::string& json_str)
        : parsed_(json_str) {}

    bool has_field(const std::string& field) const {
        return parsed_.find("\"" + field + "\":") != std::string::npos;
    }

    std::string get_field(const std::string& field) const {
        const std::string search_key = "\"" + field + "\":";
        std::size_t       pos        = parsed_.find(search_key);
        if (pos == std::string::npos) {
            return "";
        }
        pos += search_key.length();

        std::ostringstream oss;
        if (pos < parsed_.size() && parsed_[pos] == '"') {
            ++pos;
            while (pos < parsed_.size() && parsed_[pos] != '"') {
                if (parsed_[pos] == '\\' && pos + 1 < parsed_.size()) {
                    ++pos;
                }
                oss << parsed_[pos];
                ++pos;
            }
        } else {
            // 숫자 또는 true/false
            while (pos < parsed_.size() && (std::isalnum(static_cast<unsigned char>(parsed_[pos]))
                                            || parsed_[pos] == '-' || parsed_[pos] == '.')) {
                oss << parsed_[pos];
                ++pos;
            }
        }
        return oss.str();
    }

private:
    std::string parsed_;
};

GradeLog sample_grade() {
    GradeLog entry;
    entry.request_id      = "req-42";
    entry.score           = 80;
    entry.max_score       = 100;
    entry.probes_complete = false;
    entry.duration        = std::chrono::milliseconds(1234);
    entry.timestamp       = std::chrono::system_clock::now();
    return entry;
}

FailureLog sample_failure(FailureKind kind) {
    FailureLog entry;
    entry.request_id     = "req-7";
    entry.kind           = kind;
    entry.stage          = GradeState::kExecutingGrader;
    entry.detail         = "Grader must define grade(user_ns) -> dict";
    entry.exception_type = "";
    entry.duration       = std::chrono::milliseconds(15);
    entry.timestamp      = std::chrono::system_clock::now();
    return entry;
}

} // namespace

// ---------------------------------------------------------------------------
// Fixture: Temporary log file
// ---------------------------------------------------------------------------
class StructuredLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        const std::string unique_name =
            std::string(info->test_suite_name()) + "_" + info->name();
        log_dir_  = fs::temp_directory_path() / "gradegate_test_logs" / unique_name;
        log_file_ = log_dir_ / "events.log";
        fs::remove_all(log_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(log_dir_, ec);
    }

    std::vector<std::string> read_log_lines() const {
        std::vector<std::string> lines;
        std::ifstream            file(log_file_);
        std::string              line;
        while (std::getline(file, line)) {
            // 타임스탬프 접두어를 건너뛰고 JSON 부분만
            const std::size_t json_start = line.find('{');
            if (json_start != std::string::npos) {
                lines.push_back(line.substr(json_start));
            }
        }
        return lines;
    }

    std::string read_all() const {
        std::ifstream      file(log_file_);
        std::ostringstream oss;
        oss << file.rdbuf();
        return oss.str();
    }

    fs::path log_dir_;
    fs::path log_file_;
};

// ---------------------------------------------------------------------------
// Test: GradeLog JSON 직렬화 (상위 디렉터리 자동 생성 포함)
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, GradeLogJsonFormat) {
    StructuredLogger logger(LogLevel::kInfo, log_file_);
    EXPECT_TRUE(fs::exists(log_dir_)) << "parent directory should be created";

    logger.log_grade(sample_grade());
    logger.flush();

    const auto lines = read_log_lines();
    ASSERT_EQ(lines.size(), 1u) << "No log lines found";

    const JsonLineParser parser(lines[0]);
    EXPECT_EQ(parser.get_field("event"), "grade_completed");
    EXPECT_EQ(parser.get_field("request_id"), "req-42");
    EXPECT_EQ(parser.get_field("score"), "80");
    EXPECT_EQ(parser.get_field("max_score"), "100");
    EXPECT_EQ(parser.get_field("probes_complete"), "false");
    EXPECT_EQ(parser.get_field("duration_ms"), "1234");
    ASSERT_TRUE(parser.has_field("timestamp"));
    EXPECT_EQ(parser.get_field("timestamp").back(), 'Z');
}

// ---------------------------------------------------------------------------
// Test: 계약 위반은 운영자 오류로 표시된다
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, ContractViolationIsOperatorFault) {
    StructuredLogger logger(LogLevel::kInfo, log_file_);
    logger.log_failure(sample_failure(FailureKind::kContractViolation));
    logger.flush();

    const auto lines = read_log_lines();
    ASSERT_EQ(lines.size(), 1u);
    const JsonLineParser parser(lines[0]);
    EXPECT_EQ(parser.get_field("event"), "contract_violation");
    EXPECT_EQ(parser.get_field("kind"), "contract_violation");
    EXPECT_EQ(parser.get_field("stage"), "executing_grader");
    EXPECT_EQ(parser.get_field("operator_fault"), "true");
    EXPECT_EQ(parser.get_field("detail"), "Grader must define grade(user_ns) -> dict");
}

TEST_F(StructuredLoggerTest, LearnerFailureIsNotOperatorFault) {
    StructuredLogger logger(LogLevel::kInfo, log_file_);
    FailureLog entry = sample_failure(FailureKind::kExecutionError);
    entry.stage          = GradeState::kExecutingSubmission;
    entry.detail         = "ZeroDivisionError: division by zero";
    entry.exception_type = "ZeroDivisionError";
    logger.log_failure(entry);
    logger.flush();

    const auto lines = read_log_lines();
    ASSERT_EQ(lines.size(), 1u);
    const JsonLineParser parser(lines[0]);
    EXPECT_EQ(parser.get_field("event"), "grade_failed");
    EXPECT_EQ(parser.get_field("kind"), "execution_error");
    EXPECT_EQ(parser.get_field("exception_type"), "ZeroDivisionError");
    EXPECT_EQ(parser.get_field("operator_fault"), "false");
}

// ---------------------------------------------------------------------------
// Test: 로그 레벨 필터링
//   warn 로거: 학습자 실패(info)와 채점 완료(info)는 버리고,
//   내부 오류(warn)와 계약 위반(error)만 남긴다.
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, LogLevelFiltering) {
    StructuredLogger logger(LogLevel::kWarn, log_file_);

    logger.log_grade(sample_grade());
    logger.log_failure(sample_failure(FailureKind::kTimeoutExceeded));
    logger.log_failure(sample_failure(FailureKind::kInternalError));
    logger.log_failure(sample_failure(FailureKind::kContractViolation));
    logger.flush();

    const auto lines = read_log_lines();
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(JsonLineParser(lines[0]).get_field("kind"), "internal_error");
    EXPECT_EQ(JsonLineParser(lines[1]).get_field("kind"), "contract_violation");
}

// ---------------------------------------------------------------------------
// Test: text 포맷
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, TextFormat) {
    StructuredLogger logger(LogLevel::kInfo, log_file_, LogFormat::kText);
    logger.log_grade(sample_grade());
    logger.flush();

    EXPECT_TRUE(read_log_lines().empty()) << "text format must not emit JSON";
    const std::string content = read_all();
    EXPECT_NE(content.find("event=grade_completed"), std::string::npos);
    EXPECT_NE(content.find("score=80/100"), std::string::npos);
}

// ---------------------------------------------------------------------------
// Test: JSON 이스케이프 처리
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, JsonEscaping) {
    StructuredLogger logger(LogLevel::kInfo, log_file_);

    FailureLog entry = sample_failure(FailureKind::kExecutionError);
    entry.request_id = "id\"with\\quotes";
    entry.detail     = "line one\nline two";
    logger.log_failure(entry);
    logger.flush();

    const auto lines = read_log_lines();
    ASSERT_EQ(lines.size(), 1u) << "escaped newline must keep the event on one line";
    EXPECT_NE(lines[0].find(R"(id\"with\\quotes)"), std::string::npos) << lines[0];
    EXPECT_NE(lines[0].find(R"(line one\nline two)"), std::string::npos) << lines[0];
}

// ---------------------------------------------------------------------------
// Test: 멀티스레드 동시 로깅
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, MultithreadedLogging) {
    StructuredLogger logger(LogLevel::kInfo, log_file_);

    constexpr int kThreads       = 4;
    constexpr int kLogsPerThread = 10;
    std::vector<std::thread> threads;

    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&logger, t]() {
            for (int i = 0; i < kLogsPerThread; ++i) {
                GradeLog entry = sample_grade();
                entry.request_id = "req-" + std::to_string(t) + "-" + std::to_string(i);
                logger.log_grade(entry);
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    logger.flush();

    EXPECT_EQ(read_log_lines().size(), static_cast<std::size_t>(kThreads * kLogsPerThread));
}

// ---------------------------------------------------------------------------
// Test: 디버그/정보/경고/에러 로깅
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, DiagnosticLogging) {
    StructuredLogger logger(LogLevel::kDebug, log_file_);

    logger.debug("Debug message");
    logger.info("Info message");
    logger.warn("Warning message");
    logger.error("Error message");
    logger.flush();

    const std::string content = read_all();
    EXPECT_NE(content.find("Debug message"), std::string::npos);
    EXPECT_NE(content.find("Error message"), std::string::npos);
}

// ---------------------------------------------------------------------------
// Test: 레벨 이름 해석
// ---------------------------------------------------------------------------
TEST(LogLevelFromString, KnownAndUnknownNames) {
    EXPECT_EQ(log_level_from_string("debug"), LogLevel::kDebug);
    EXPECT_EQ(log_level_from_string("trace"), LogLevel::kDebug);
    EXPECT_EQ(log_level_from_string("info"), LogLevel::kInfo);
    EXPECT_EQ(log_level_from_string("warning"), LogLevel::kWarn);
    EXPECT_EQ(log_level_from_string("critical"), LogLevel::kError);
    EXPECT_FALSE(log_level_from_string("loud").has_value());
    EXPECT_FALSE(log_level_from_string("").has_value());
}
