#pragma once
#include "drive_types.hpp"
#include "tunable_params.hpp"

// joystick 범위(-1~1) 입력을 선형으로 m/s, rad/s 로 환산
VelocityIntent joystick_to_velocity(double forward, double turn,
                                    const TunableParameterStore& params);
