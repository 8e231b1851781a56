#pragma once
#include <algorithm>

// actuator 내부 velocity loop: u = kff * target + kp * (target - current)
// 출력은 duty 범위로 clamp
class PID {
public:
    double kp;
    double kff;

    double output_min;
    double output_max;

    double last_error = 0.0;

    PID(double p, double ff = 0.0)
        : kp(p), kff(ff),
          output_min(-1.0),
          output_max(1.0)
    {}

    void set_gains(double p, double ff) {
        kp = p;
        kff = ff;
    }

    void reset() {
        last_error = 0.0;
    }

    double compute(double target, double current) {
        const double error = target - current;
        last_error = error;

        const double output = kff * target + kp * error;
        return std::clamp(output, output_min, output_max);
    }
};
