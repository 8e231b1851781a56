#pragma once
#include <cstdint>
#include <variant>

// =====================
// Control mode
// =====================
enum class ControlMode : std::uint8_t {
    MANUAL_DRIVE,
    VELOCITY_DRIVE
};

inline const char* mode_to_string(ControlMode m) {
    switch (m) {
        case ControlMode::MANUAL_DRIVE:   return "MANUAL_DRIVE";
        case ControlMode::VELOCITY_DRIVE: return "VELOCITY_DRIVE";
        default:                          return "UNKNOWN";
    }
}

enum class Side : std::uint8_t {
    LEFT  = 0,
    RIGHT = 1
};

// =====================
// Intent (mode는 variant 타입으로 결정)
// =====================

// -1.0 ~ 1.0 정규화 값
struct ManualIntent {
    double forward = 0.0;
    double turn    = 0.0;
};

// m/s, rad/s
struct VelocityIntent {
    double linear_mps    = 0.0;
    double angular_radps = 0.0;
};

using DriveIntent = std::variant<ManualIntent, VelocityIntent>;

inline ControlMode mode_of(const DriveIntent& intent) {
    return std::holds_alternative<VelocityIntent>(intent)
        ? ControlMode::VELOCITY_DRIVE
        : ControlMode::MANUAL_DRIVE;
}

struct DriveModifiers {
    bool reverse_enabled   = false;  // 앞/뒤 전환
    bool slow_turn_enabled = false;  // 회전 감속
};

// =====================
// Outputs to actuators
// =====================
struct SideOutputs {
    double left  = 0.0;
    double right = 0.0;
};

// closed-loop velocity gains (actuator 내부 PID에 전달)
struct VelocityGains {
    double kp  = 0.0;
    double kff = 0.0;
};
