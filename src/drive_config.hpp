#pragma once
#include <chrono>
#include "io/actuator_pair.hpp"

// =====================
// 하드웨어/기하 설정 (컴파일 기본값)
// =====================
struct DriveConfig {
    double track_width_m      = 0.60;    // 좌우 바퀴 중심 거리
    double wheel_diam_m       = 0.1524;  // 6 in
    double gearbox_reduction  = 10.71;

    std::chrono::microseconds update_period{5000};  // 5ms

    ActuatorConfig actuators{};
};

// rotor 회전수 -> wheel 이동거리
inline double encoder_position_factor(const DriveConfig& cfg) {
    constexpr double PI = 3.14159265358979323846;
    return PI * cfg.wheel_diam_m / cfg.gearbox_reduction;
}

// rotor RPM -> m/s
inline double encoder_velocity_factor(const DriveConfig& cfg) {
    return encoder_position_factor(cfg) / 60.0;
}
