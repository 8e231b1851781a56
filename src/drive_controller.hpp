#pragma once
#include <cstdint>
#include <mutex>
#include "drive_types.hpp"
#include "drive_config.hpp"
#include "subsystem.hpp"
#include "tunable_params.hpp"
#include "io/actuator_pair.hpp"
#include "io/drive_sensors.hpp"
#include "io/intent_source.hpp"

struct DriveDebug {
    ControlMode mode = ControlMode::MANUAL_DRIVE;
    DriveModifiers modifiers{};

    // 이번 tick에 읽은 intent (mode에 따라 단위가 다름)
    double intent_forward = 0.0;  // MANUAL: forward, VELOCITY: linear_mps
    double intent_turn    = 0.0;  // MANUAL: turn,    VELOCITY: angular_radps

    SideOutputs out{};       // 실제로 쓴 값 (normalized or m/s)

    std::uint64_t ticks = 0;
    std::uint64_t actuator_faults = 0;
};

class DriveController final : public ISubsystem {
public:
    DriveController(IActuatorPair& actuators,
                    IDriveEncoders& encoders,
                    IHeadingSensor& heading,
                    TunableParameterStore& params,
                    const DriveConfig& cfg = DriveConfig{});

    // ----- main loop 쪽 (scheduler와 병렬) -----

    // -1.0 ~ 1.0, 제곱 등 가공하지 않은 값
    void set_manual_intent(double forward, double turn);

    // m/s, rad/s
    void set_velocity_intent(double linear_mps, double angular_radps);

    void toggle_reverse();
    void toggle_slow_turn();

    void reset();

    // input source 한 frame 반영: reset -> toggle 펄스 -> intent 순
    void apply_frame(const IntentFrame& frame);

    ControlMode mode() const;
    DriveModifiers modifiers() const;
    DriveDebug debug() const;

    // ----- ISubsystem -----
    const char* name() const override { return "Drivetrain"; }
    void update() override;
    bool publish_telemetry(ITelemetrySink& sink, bool detailed) override;
    void tuning_init() override;

private:
    void configure_actuators();
    void configure_encoders();

    // ----- 상태 핸들러 -----
    SideOutputs handle_manual(const ManualIntent& in, const DriveModifiers& mods,
                              std::uint64_t& faults);
    SideOutputs handle_velocity(const VelocityIntent& in, std::uint64_t& faults);

    static void count_fault(ActuatorStatus st, std::uint64_t& faults) {
        if (st != ActuatorStatus::OK) ++faults;
    }

private:
    IActuatorPair& actuators_;
    IDriveEncoders& encoders_;
    IHeadingSensor& heading_;
    TunableParameterStore& params_;
    const DriveConfig cfg_;

    // main loop <-> scheduler 공유 상태 (mtx_ 보호)
    mutable std::mutex mtx_;
    DriveIntent intent_ = ManualIntent{};
    DriveModifiers modifiers_{};

    // debug snapshot (mtx_ 보호)
    DriveDebug dbg_{};
};
