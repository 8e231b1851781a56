#pragma once
#include "../drive_types.hpp"

// 값은 이미 wheel 둘레 / 감속비로 환산된 상태 (m, m/s)
class IDriveEncoders {
public:
    virtual ~IDriveEncoders() = default;
    virtual double get_position(Side side) const = 0;
    virtual double get_velocity(Side side) const = 0;
    virtual void reset_position() = 0;
};

// 모터 축 기준 raw 값 (rotor 회전수, RPM). 환산은 ScaledDriveEncoders에서
class IRawDriveEncoders {
public:
    virtual ~IRawDriveEncoders() = default;
    virtual double get_rotations(Side side) const = 0;
    virtual double get_rpm(Side side) const = 0;
    virtual void reset_rotations() = 0;
};

class IHeadingSensor {
public:
    virtual ~IHeadingSensor() = default;
    virtual double get_heading_rad() const = 0;
};
