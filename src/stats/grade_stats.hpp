#pragma once

// ---------------------------------------------------------------------------
// grade_stats.hpp
//
// 채점 서비스 통계 수집기. 헤더 전용 (atomic inline 구현).
//
// [스레드 안전성]
// - on_request / on_graded / on_failed / on_sandbox_launch:
//   워커 스레드에서 concurrent 호출 안전 (atomic 사용).
// - snapshot():
//   UDS "stats" 조회 경로에서 호출. 갱신 경로와 mutex 없이 분리된다.
//
// [격리 원칙]
// - 통계 갱신 실패가 채점 결과로 전파되지 않도록 모든 갱신 메서드는
//   noexcept 로 선언한다.
// - 코어(GradingProtocol)는 이 타입을 모른다. 서비스 계층이 결과를 보고
//   갱신한다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>

inline constexpr std::size_t kFailureKindCount = 6;

// ---------------------------------------------------------------------------
// GradeStatsSnapshot
//   특정 시점의 통계 스냅샷 (불변 값 객체).
//   failures[k] : static_cast<size_t>(FailureKind) 별 실패 수
//   pass_rate   : graded_full / graded (graded == 0 이면 0.0)
// ---------------------------------------------------------------------------
struct GradeStatsSnapshot {
    std::uint64_t                                total_requests{0};
    std::uint64_t                                in_flight{0};
    std::uint64_t                                graded{0};
    std::uint64_t                                graded_full{0};   // score == max_score
    std::array<std::uint64_t, kFailureKindCount> failures{};
    std::uint64_t                                sandbox_launches{0};
    double                                       pass_rate{0.0};
    std::chrono::system_clock::time_point        captured_at{};

    [[nodiscard]] std::uint64_t failures_of(FailureKind kind) const noexcept {
        return failures[static_cast<std::size_t>(kind)];
    }
    [[nodiscard]] std::uint64_t contract_violations() const noexcept {
        return failures_of(FailureKind::kContractViolation);
    }
    [[nodiscard]] std::uint64_t timeouts() const noexcept {
        return failures_of(FailureKind::kTimeoutExceeded);
    }
};

class GradeStats {
public:
    GradeStats() noexcept = default;
    ~GradeStats()         = default;

    // 복사 금지 (atomic 은 복사 불가)
    GradeStats(const GradeStats&)            = delete;
    GradeStats& operator=(const GradeStats&) = delete;

    // 이동 금지
    GradeStats(GradeStats&&)            = delete;
    GradeStats& operator=(GradeStats&&) = delete;

    // on_request
    //   grade 요청 수락 시 호출. 반드시 on_graded/on_failed 중 하나가 뒤따른다.
    void on_request() noexcept {
        total_requests_.fetch_add(1, std::memory_order_relaxed);
        in_flight_.fetch_add(1, std::memory_order_relaxed);
    }

    void on_sandbox_launch() noexcept {
        sandbox_launches_.fetch_add(1, std::memory_order_relaxed);
    }

    void on_graded(const GradeResult& result) noexcept {
        graded_.fetch_add(1, std::memory_order_relaxed);
        if (result.score == result.max_score) {
            graded_full_.fetch_add(1, std::memory_order_relaxed);
        }
        finish();
    }

    void on_failed(FailureKind kind) noexcept {
        const auto idx = static_cast<std::size_t>(kind);
        if (idx < kFailureKindCount) {
            failures_[idx].fetch_add(1, std::memory_order_relaxed);
        }
        finish();
    }

    [[nodiscard]] GradeStatsSnapshot snapshot() const noexcept {
        GradeStatsSnapshot s{};
        s.total_requests   = total_requests_.load(std::memory_order_relaxed);
        s.in_flight        = in_flight_.load(std::memory_order_relaxed);
        s.graded           = graded_.load(std::memory_order_relaxed);
        s.graded_full      = graded_full_.load(std::memory_order_relaxed);
        s.sandbox_launches = sandbox_launches_.load(std::memory_order_relaxed);
        for (std::size_t i = 0; i < kFailureKindCount; ++i) {
            s.failures[i] = failures_[i].load(std::memory_order_relaxed);
        }
        if (s.graded > 0) {
            s.pass_rate = static_cast<double>(s.graded_full) / static_cast<double>(s.graded);
        }
        s.captured_at = std::chrono::system_clock::now();
        return s;
    }

private:
    void finish() noexcept {
        std::uint64_t current = in_flight_.load(std::memory_order_relaxed);
        while (current > 0 &&
               !in_flight_.compare_exchange_weak(current, current - 1, std::memory_order_relaxed)) {
        }
    }

    std::atomic<std::uint64_t>                              total_requests_{0};
    std::atomic<std::uint64_t>                              in_flight_{0};
    std::atomic<std::uint64_t>                              graded_{0};
    std::atomic<std::uint64_t>                              graded_full_{0};
    std::array<std::atomic<std::uint64_t>, kFailureKindCount> failures_{};
    std::atomic<std::uint64_t>                              sandbox_launches_{0};
};
