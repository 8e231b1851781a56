#pragma once
#include <cstdint>
#include "../drive_types.hpp"

enum class ActuatorStatus : std::uint8_t {
    OK,
    FAULT
};

enum class IdleMode : std::uint8_t {
    BRAKE,
    COAST
};

// leader/follower 설정 (follower는 leader 명령을 그대로 따라감)
struct ActuatorConfig {
    int      current_limit_a  = 80;
    IdleMode leader_idle      = IdleMode::BRAKE;
    IdleMode follower_idle    = IdleMode::COAST;
    bool     followers_enabled = true;
};

// 좌/우 두 채널. follower 채널은 여기서 직접 주소 지정하지 않음
class IActuatorPair {
public:
    virtual ~IActuatorPair() = default;

    virtual void configure(const ActuatorConfig& cfg) = 0;

    // value: -1.0 ~ 1.0
    virtual ActuatorStatus set_normalized(Side side, double value) = 0;

    // value: m/s, gains는 actuator 쪽 closed-loop에서 사용
    virtual ActuatorStatus set_velocity_target(Side side, double value,
                                               const VelocityGains& gains) = 0;
};
