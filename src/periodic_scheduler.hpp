#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

// 전용 thread에서 callback을 고정 주기로 실행.
// - 실행은 항상 하나씩 (겹침 없음)
// - tick이 주기를 넘기면 다음 주기 경계로 밀림 (밀린 tick 몰아서 실행 안 함)
// - stop() 반환 이후에는 새 tick이 시작되지 않음 (실행 중인 tick은 끝까지 진행)
class PeriodicScheduler {
public:
    using Callback = std::function<void()>;
    using Clock = std::chrono::steady_clock;

    struct Stats {
        std::uint64_t ticks = 0;
        std::uint64_t overruns = 0;          // 주기를 넘긴 tick 수
        std::uint64_t skipped_periods = 0;   // 건너뛴 주기 경계 수
        std::uint64_t callback_errors = 0;
        std::chrono::microseconds max_exec{0};
    };

    PeriodicScheduler() = default;
    ~PeriodicScheduler();

    PeriodicScheduler(const PeriodicScheduler&) = delete;
    PeriodicScheduler& operator=(const PeriodicScheduler&) = delete;

    // 이미 실행 중이거나 period <= 0 이면 false
    bool start(Callback cb, std::chrono::microseconds period);

    void stop();

    bool running() const { return running_.load(); }
    bool in_flight() const { return in_flight_.load(); }
    Stats stats() const;

private:
    void run_();

    Callback cb_;
    std::chrono::microseconds period_{0};

    // worker_ 자체는 owner thread(start/stop 호출 쪽)만 만짐
    std::thread worker_;

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::thread::id worker_id_{};   // 빈 id = join할 thread 없음
    bool stop_requested_ = false;
    Stats stats_{};

    std::atomic<bool> running_{false};
    std::atomic<bool> in_flight_{false};
};
