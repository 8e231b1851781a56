#include "periodic_scheduler.hpp"
#include <exception>
#include <iostream>
#include <string>
#include <utility>

PeriodicScheduler::~PeriodicScheduler() {
    stop();
}

bool PeriodicScheduler::start(Callback cb, std::chrono::microseconds period) {
    if (!cb || period.count() <= 0) return false;
    if (running_.load()) return false;

    // 이전 실행이 callback 내부 stop()으로 끝난 경우 정리
    if (worker_.joinable()) worker_.join();

    // run_()은 mtx_부터 잡으므로 worker_id_ 기록 전에 callback이 돌 수 없음
    std::lock_guard<std::mutex> lk(mtx_);
    cb_ = std::move(cb);
    period_ = period;
    stop_requested_ = false;
    stats_ = Stats{};

    running_ = true;
    worker_ = std::thread(&PeriodicScheduler::run_, this);
    worker_id_ = worker_.get_id();
    return true;
}

void PeriodicScheduler::stop() {
    bool from_worker = false;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (worker_id_ == std::thread::id{}) return;
        stop_requested_ = true;
        from_worker = (std::this_thread::get_id() == worker_id_);
    }
    cv_.notify_all();

    // callback 안에서 호출되면 join 불가: 다음 tick 진입만 막음.
    // join은 다음 start() 또는 owner 쪽 stop()/소멸자에서
    if (from_worker) return;

    worker_.join();

    std::lock_guard<std::mutex> lk(mtx_);
    worker_id_ = std::thread::id{};
}

PeriodicScheduler::Stats PeriodicScheduler::stats() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return stats_;
}

void PeriodicScheduler::run_() {
    std::unique_lock<std::mutex> lk(mtx_);
    auto next = Clock::now() + period_;

    while (!stop_requested_) {
        // 다음 경계까지 대기 (stop 요청 시 바로 깨어남)
        if (cv_.wait_until(lk, next, [this] { return stop_requested_; })) break;
        lk.unlock();

        bool failed = false;
        std::string what;

        const auto t0 = Clock::now();
        in_flight_ = true;
        try {
            cb_();
        } catch (const std::exception& e) {
            failed = true;
            what = e.what();
        } catch (...) {
            // std::exception 외 타입도 thread 밖으로 내보내지 않음
            failed = true;
            what = "non-std exception";
        }
        in_flight_ = false;
        const auto t1 = Clock::now();

        if (failed) {
            std::cerr << "[scheduler] callback error: " << what << "\n";
        }

        lk.lock();
        ++stats_.ticks;
        if (failed) ++stats_.callback_errors;

        const auto exec = std::chrono::duration_cast<std::chrono::microseconds>(t1 - t0);
        if (exec > stats_.max_exec) stats_.max_exec = exec;

        // 경계 기준으로 다음 deadline (drift 없음)
        next += period_;
        if (t1 >= next) {
            const auto behind = (t1 - next) / period_ + 1;
            next += period_ * behind;
            ++stats_.overruns;
            stats_.skipped_periods += static_cast<std::uint64_t>(behind);
        }
    }

    running_ = false;
}
