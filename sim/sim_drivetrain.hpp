#pragma once
#include <array>
#include <cstdint>
#include <mutex>
#include "pid.hpp"
#include "drive_config.hpp"
#include "io/actuator_pair.hpp"
#include "io/drive_sensors.hpp"

// 좌/우 1차 지연 plant + actuator 내부 velocity PID(kP + kFF).
// encoder는 rotor 기준 raw 값으로 내보냄 (회전수, RPM)
// write는 scheduler thread, step()/read는 main thread에서 올 수 있어 mtx_로 보호
class SimDrivetrain final : public IActuatorPair,
                            public IRawDriveEncoders,
                            public IHeadingSensor {
public:
    struct Config {
        double free_speed_mps = 4.0;   // duty 1.0 일 때 속도
        double alpha          = 0.15;  // 속도 1차 지연 계수 (step당)
        double track_width_m  = 0.60;
        double meters_per_rotation = encoder_position_factor(DriveConfig{});
        double coast_alpha    = 0.02;  // duty 0 + COAST 일 때 감속 계수
    };

    SimDrivetrain();
    explicit SimDrivetrain(Config cfg);

    // ----- IActuatorPair -----
    void configure(const ActuatorConfig& cfg) override;
    ActuatorStatus set_normalized(Side side, double value) override;
    ActuatorStatus set_velocity_target(Side side, double value,
                                       const VelocityGains& gains) override;

    // ----- IRawDriveEncoders -----
    double get_rotations(Side side) const override;
    double get_rpm(Side side) const override;
    void reset_rotations() override;

    // ----- IHeadingSensor -----
    double get_heading_rad() const override;

    // plant 진행
    void step(double dt);

    // true면 모든 write가 FAULT (명령은 반영되지 않음)
    void inject_fault(bool on);

    // plant 내부 값 (m/s, m)
    double wheel_velocity(Side side) const;
    double wheel_position(Side side) const;

    double duty(Side side) const;
    double follower_duty(Side side) const;
    ActuatorConfig actuator_config() const;

private:
    struct Channel {
        bool   velocity_mode = false;
        double duty = 0.0;           // -1 ~ 1
        double target_mps = 0.0;
        PID    pid{0.0};
        double follower_duty = 0.0;

        double velocity = 0.0;       // m/s
        double position = 0.0;       // m
    };

    static std::size_t idx(Side s) { return static_cast<std::size_t>(s); }

    Config cfg_;
    ActuatorConfig act_cfg_{};
    bool fault_ = false;

    std::array<Channel, 2> ch_{};
    double heading_ = 0.0;

    mutable std::mutex mtx_;
};
