#include "intent_mapping.hpp"

VelocityIntent joystick_to_velocity(double forward, double turn,
                                    const TunableParameterStore& params) {
    VelocityIntent v{};
    v.linear_mps    = forward * params.get(ParamKey::CLOSED_MAX_VEL, ParamDefault::CLOSED_MAX_VEL);
    v.angular_radps = turn    * params.get(ParamKey::CLOSED_MAX_ROT, ParamDefault::CLOSED_MAX_ROT);
    return v;
}
