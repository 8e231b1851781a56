#pragma once
#include <chrono>
#include <cstdint>
#include <vector>
#include "periodic_scheduler.hpp"
#include "subsystem.hpp"
#include "tunable_params.hpp"
#include "io/telemetry_sink.hpp"

// subsystem 목록 + 빠른 update 루프 소유.
// update는 전용 scheduler thread, telemetry는 main loop에서 round-robin으로 나눠 publish
class SubsystemHost {
public:
    explicit SubsystemHost(TunableParameterStore& params);
    ~SubsystemHost();

    // 실행 중에는 등록 불가
    bool add(ISubsystem& subsystem);

    bool start(std::chrono::microseconds period);
    void stop();

    void update_all();

    // main loop 주기마다 호출. 3회에 1번, subsystem 하나씩 publish
    void display(ITelemetrySink& sink);

    void tuning_init();

    const PeriodicScheduler& scheduler() const { return scheduler_; }
    std::uint64_t publish_failures() const { return publish_failures_; }

    static constexpr int DISPLAY_DIVIDER = 3;

private:
    TunableParameterStore& params_;
    std::vector<ISubsystem*> subsystems_;
    PeriodicScheduler scheduler_;

    int output_counter_ = 0;
    std::uint64_t publish_failures_ = 0;
};
