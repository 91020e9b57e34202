#pragma once

// ---------------------------------------------------------------------------
// stats_collector.hpp
//
// 요청 파이프라인 통계 수집기. 헤더 전용 (atomic inline 구현).
//
// [스레드 안전성]
// - on_* 갱신 메서드: 여러 세션에서 concurrent 호출 안전 (atomic 사용).
// - snapshot(): 갱신 경로와 contention 없이 읽기 가능.
//
// [격리 원칙]
// - 통계 수집 실패가 파이프라인 실패로 전파되지 않도록
//   모든 갱신 메서드는 noexcept 로 선언한다.
// ---------------------------------------------------------------------------

#include <atomic>
#include <chrono>
#include <cstdint>

// ---------------------------------------------------------------------------
// StatsSnapshot
//   특정 시점의 통계 스냅샷 (불변 값 객체).
//   deny_rate: (denied + blocked) / total_requests (total == 0 이면 0.0)
// ---------------------------------------------------------------------------
struct StatsSnapshot {
    std::uint64_t                              total_sessions{0};
    std::uint64_t                              active_sessions{0};
    std::uint64_t                              total_requests{0};
    std::uint64_t                              denied_requests{0};
    std::uint64_t                              blocked_requests{0};
    std::uint64_t                              errored_requests{0};
    std::uint64_t                              responded_requests{0};
    std::uint64_t                              sanitized_responses{0};
    double                                     deny_rate{0.0};
    std::chrono::system_clock::time_point      captured_at{};
};

class StatsCollector {
public:
    StatsCollector() noexcept = default;

    ~StatsCollector() = default;

    // 복사/이동 금지 (atomic 소유권 명확화)
    StatsCollector(const StatsCollector&)            = delete;
    StatsCollector& operator=(const StatsCollector&) = delete;
    StatsCollector(StatsCollector&&)                 = delete;
    StatsCollector& operator=(StatsCollector&&)      = delete;

    void on_session_open() noexcept {
        total_sessions_.fetch_add(1, std::memory_order_relaxed);
        active_sessions_.fetch_add(1, std::memory_order_relaxed);
    }

    // 언더플로우 방지: 0 이면 감소하지 않는다.
    void on_session_close() noexcept {
        std::uint64_t current = active_sessions_.load(std::memory_order_relaxed);
        while (current > 0 &&
               !active_sessions_.compare_exchange_weak(current, current - 1,
                                                       std::memory_order_relaxed)) {
        }
    }

    // 요청 수신 시 한 번. 터미널 상태별 메서드와 짝을 이룬다.
    void on_request() noexcept {
        total_requests_.fetch_add(1, std::memory_order_relaxed);
    }

    void on_denied() noexcept {
        denied_requests_.fetch_add(1, std::memory_order_relaxed);
    }

    void on_blocked() noexcept {
        blocked_requests_.fetch_add(1, std::memory_order_relaxed);
    }

    void on_errored() noexcept {
        errored_requests_.fetch_add(1, std::memory_order_relaxed);
    }

    // sanitized: 출력 정제 단계가 응답을 바꿨으면 true
    void on_responded(bool sanitized) noexcept {
        responded_requests_.fetch_add(1, std::memory_order_relaxed);
        if (sanitized) {
            sanitized_responses_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    [[nodiscard]] StatsSnapshot snapshot() const noexcept {
        const auto total   = total_requests_.load(std::memory_order_relaxed);
        const auto denied  = denied_requests_.load(std::memory_order_relaxed);
        const auto blocked = blocked_requests_.load(std::memory_order_relaxed);

        double deny_rate = 0.0;
        if (total > 0) {
            deny_rate = static_cast<double>(denied + blocked) / static_cast<double>(total);
        }

        return StatsSnapshot{
            .total_sessions      = total_sessions_.load(std::memory_order_relaxed),
            .active_sessions     = active_sessions_.load(std::memory_order_relaxed),
            .total_requests      = total,
            .denied_requests     = denied,
            .blocked_requests    = blocked,
            .errored_requests    = errored_requests_.load(std::memory_order_relaxed),
            .responded_requests  = responded_requests_.load(std::memory_order_relaxed),
            .sanitized_responses = sanitized_responses_.load(std::memory_order_relaxed),
            .deny_rate           = deny_rate,
            .captured_at         = std::chrono::system_clock::now(),
        };
    }

private:
    std::atomic<std::uint64_t> total_sessions_{0};
    std::atomic<std::uint64_t> active_sessions_{0};
    std::atomic<std::uint64_t> total_requests_{0};
    std::atomic<std::uint64_t> denied_requests_{0};
    std::atomic<std::uint64_t> blocked_requests_{0};
    std::atomic<std::uint64_t> errored_requests_{0};
    std::atomic<std::uint64_t> responded_requests_{0};
    std::atomic<std::uint64_t> sanitized_responses_{0};
};
