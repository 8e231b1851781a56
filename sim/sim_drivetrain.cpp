#include "sim_drivetrain.hpp"
#include <algorithm>
#include <cmath>

SimDrivetrain::SimDrivetrain() : SimDrivetrain(Config{}) {}

SimDrivetrain::SimDrivetrain(Config cfg) : cfg_(cfg) {}

void SimDrivetrain::configure(const ActuatorConfig& cfg) {
    std::lock_guard<std::mutex> lk(mtx_);
    act_cfg_ = cfg;
}

ActuatorStatus SimDrivetrain::set_normalized(Side side, double value) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (fault_) return ActuatorStatus::FAULT;

    Channel& c = ch_[idx(side)];
    c.velocity_mode = false;
    c.duty = std::clamp(value, -1.0, 1.0);
    return ActuatorStatus::OK;
}

ActuatorStatus SimDrivetrain::set_velocity_target(Side side, double value,
                                                  const VelocityGains& gains) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (fault_) return ActuatorStatus::FAULT;

    Channel& c = ch_[idx(side)];
    if (!c.velocity_mode) {
        c.pid.reset();
        c.velocity_mode = true;
    }
    c.target_mps = value;
    c.pid.set_gains(gains.kp, gains.kff);
    return ActuatorStatus::OK;
}

double SimDrivetrain::get_rotations(Side side) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return ch_[idx(side)].position / cfg_.meters_per_rotation;
}

double SimDrivetrain::get_rpm(Side side) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return ch_[idx(side)].velocity / cfg_.meters_per_rotation * 60.0;
}

void SimDrivetrain::reset_rotations() {
    std::lock_guard<std::mutex> lk(mtx_);
    for (auto& c : ch_) c.position = 0.0;
}

double SimDrivetrain::get_heading_rad() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return heading_;
}

void SimDrivetrain::step(double dt) {
    std::lock_guard<std::mutex> lk(mtx_);

    for (auto& c : ch_) {
        // velocity loop는 actuator 내부에서 돈다
        if (c.velocity_mode) {
            c.duty = c.pid.compute(c.target_mps, c.velocity);
        }
        c.follower_duty = act_cfg_.followers_enabled ? c.duty : 0.0;

        // ---- velocity (1st order lag) ----
        // duty 0: BRAKE면 평소처럼 감속, COAST면 천천히 굴러감
        const bool coasting = (c.duty == 0.0 && act_cfg_.leader_idle == IdleMode::COAST);
        const double a = coasting ? cfg_.coast_alpha : cfg_.alpha;
        const double v_cmd = c.duty * cfg_.free_speed_mps;
        c.velocity += (v_cmd - c.velocity) * a;

        // 작은 값 정리
        if (std::abs(c.velocity) < 1e-6) c.velocity = 0.0;

        c.position += c.velocity * dt;
    }

    // 반시계(+) 기준: 오른쪽이 빠르면 좌회전
    const double vl = ch_[idx(Side::LEFT)].velocity;
    const double vr = ch_[idx(Side::RIGHT)].velocity;
    heading_ += (vr - vl) / cfg_.track_width_m * dt;
}

void SimDrivetrain::inject_fault(bool on) {
    std::lock_guard<std::mutex> lk(mtx_);
    fault_ = on;
}

double SimDrivetrain::wheel_velocity(Side side) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return ch_[idx(side)].velocity;
}

double SimDrivetrain::wheel_position(Side side) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return ch_[idx(side)].position;
}

double SimDrivetrain::duty(Side side) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return ch_[idx(side)].duty;
}

double SimDrivetrain::follower_duty(Side side) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return ch_[idx(side)].follower_duty;
}

ActuatorConfig SimDrivetrain::actuator_config() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return act_cfg_;
}
