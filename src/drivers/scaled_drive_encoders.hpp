#pragma once
#include "drive_config.hpp"
#include "io/drive_sensors.hpp"

// rotor 회전수/RPM -> wheel 기준 m, m/s.
// 제어 로직에는 항상 이 환산 값만 들어감
class ScaledDriveEncoders final : public IDriveEncoders {
public:
    ScaledDriveEncoders(IRawDriveEncoders& raw, const DriveConfig& cfg)
        : raw_(raw),
          position_factor_(encoder_position_factor(cfg)),
          velocity_factor_(encoder_velocity_factor(cfg)) {}

    double get_position(Side side) const override {
        return raw_.get_rotations(side) * position_factor_;
    }

    double get_velocity(Side side) const override {
        return raw_.get_rpm(side) * velocity_factor_;
    }

    void reset_position() override { raw_.reset_rotations(); }

    double position_factor() const { return position_factor_; }
    double velocity_factor() const { return velocity_factor_; }

private:
    IRawDriveEncoders& raw_;
    double position_factor_;
    double velocity_factor_;
};
