#include "drive_controller.hpp"
#include <iostream>
#include "arcade_drive.hpp"

DriveController::DriveController(IActuatorPair& actuators,
                                 IDriveEncoders& encoders,
                                 IHeadingSensor& heading,
                                 TunableParameterStore& params,
                                 const DriveConfig& cfg)
    : actuators_(actuators),
      encoders_(encoders),
      heading_(heading),
      params_(params),
      cfg_(cfg)
{
    configure_actuators();
    configure_encoders();
    reset();
}

void DriveController::configure_actuators() {
    actuators_.configure(cfg_.actuators);
}

void DriveController::configure_encoders() {
    // 환산 계수는 encoder 쪽 설정, 여기서는 위치 기준만 0으로
    encoders_.reset_position();
}

void DriveController::reset() {
    std::lock_guard<std::mutex> lk(mtx_);
    intent_ = ManualIntent{};
    modifiers_ = DriveModifiers{};
}

void DriveController::set_manual_intent(double forward, double turn) {
    std::lock_guard<std::mutex> lk(mtx_);
    intent_ = ManualIntent{forward, turn};
}

void DriveController::set_velocity_intent(double linear_mps, double angular_radps) {
    std::lock_guard<std::mutex> lk(mtx_);
    intent_ = VelocityIntent{linear_mps, angular_radps};
}

void DriveController::toggle_reverse() {
    std::lock_guard<std::mutex> lk(mtx_);
    modifiers_.reverse_enabled = !modifiers_.reverse_enabled;
}

void DriveController::toggle_slow_turn() {
    std::lock_guard<std::mutex> lk(mtx_);
    modifiers_.slow_turn_enabled = !modifiers_.slow_turn_enabled;
}

void DriveController::apply_frame(const IntentFrame& frame) {
    if (!frame.valid) return;

    if (frame.reset) reset();
    if (frame.toggle_reverse) toggle_reverse();
    if (frame.toggle_slow_turn) toggle_slow_turn();

    if (const auto* m = std::get_if<ManualIntent>(&frame.intent)) {
        set_manual_intent(m->forward, m->turn);
    } else if (const auto* v = std::get_if<VelocityIntent>(&frame.intent)) {
        set_velocity_intent(v->linear_mps, v->angular_radps);
    }
}

ControlMode DriveController::mode() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return mode_of(intent_);
}

DriveModifiers DriveController::modifiers() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return modifiers_;
}

DriveDebug DriveController::debug() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return dbg_;
}

void DriveController::update() {
    // 1) 공유 상태 snapshot (한 tick에 한 번만 읽음)
    DriveIntent intent;
    DriveModifiers mods;
    std::uint64_t faults = 0;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        intent = intent_;
        mods = modifiers_;
        faults = dbg_.actuator_faults;
    }

    // 2) 상태 처리 (lock 밖에서 actuator write)
    DriveDebug dbg{};
    dbg.mode = mode_of(intent);
    dbg.modifiers = mods;

    switch (dbg.mode) {
        case ControlMode::MANUAL_DRIVE: {
            const auto& in = std::get<ManualIntent>(intent);
            dbg.intent_forward = in.forward;
            dbg.intent_turn = in.turn;
            dbg.out = handle_manual(in, mods, faults);
            break;
        }
        case ControlMode::VELOCITY_DRIVE: {
            const auto& in = std::get<VelocityIntent>(intent);
            dbg.intent_forward = in.linear_mps;
            dbg.intent_turn = in.angular_radps;
            dbg.out = handle_velocity(in, faults);
            break;
        }
    }

    // 3) debug 갱신
    std::lock_guard<std::mutex> lk(mtx_);
    dbg.ticks = dbg_.ticks + 1;
    dbg.actuator_faults = faults;
    dbg_ = dbg;
}

SideOutputs DriveController::handle_manual(const ManualIntent& in, const DriveModifiers& mods,
                                           std::uint64_t& faults) {
    const double forward = mods.reverse_enabled ? -in.forward : in.forward;
    const double turn = mods.slow_turn_enabled
        ? in.turn * params_.get(ParamKey::SLOW_TURN_MULT, ParamDefault::SLOW_TURN_MULT)
        : in.turn;

    const SideOutputs out = arcade_drive(forward, turn);

    // fire-and-forget: 실패해도 재시도 없음, 다음 tick은 그대로 진행
    count_fault(actuators_.set_normalized(Side::LEFT, out.left), faults);
    count_fault(actuators_.set_normalized(Side::RIGHT, out.right), faults);
    return out;
}

SideOutputs DriveController::handle_velocity(const VelocityIntent& in, std::uint64_t& faults) {
    const double half_track = cfg_.track_width_m / 2.0;

    // 포화 처리 없음: actuator 쪽 한계에 맡김
    SideOutputs out{};
    out.left  = in.linear_mps - in.angular_radps * half_track;
    out.right = in.linear_mps + in.angular_radps * half_track;

    VelocityGains left_gains{};
    left_gains.kp  = params_.get(ParamKey::VEL_LEFT_P,  ParamDefault::VEL_P);
    left_gains.kff = params_.get(ParamKey::VEL_LEFT_FF, ParamDefault::VEL_FF);

    VelocityGains right_gains{};
    right_gains.kp  = params_.get(ParamKey::VEL_RIGHT_P,  ParamDefault::VEL_P);
    right_gains.kff = params_.get(ParamKey::VEL_RIGHT_FF, ParamDefault::VEL_FF);

    count_fault(actuators_.set_velocity_target(Side::LEFT, out.left, left_gains), faults);
    count_fault(actuators_.set_velocity_target(Side::RIGHT, out.right, right_gains), faults);
    return out;
}

bool DriveController::publish_telemetry(ITelemetrySink& sink, bool detailed) {
    const DriveDebug dbg = debug();
    bool ok = true;

    ok &= sink.put_bool_array("Drive Toggles",
                              {dbg.modifiers.reverse_enabled, dbg.modifiers.slow_turn_enabled});

    if (detailed) {
        ok &= sink.put_number_array("Drive Encoders (Lp, Rp, Lv, Rv)", {
            encoders_.get_position(Side::LEFT), encoders_.get_position(Side::RIGHT),
            encoders_.get_velocity(Side::LEFT), encoders_.get_velocity(Side::RIGHT)
        });
        ok &= sink.put_number_array("Drive PID Angle", {heading_.get_heading_rad()});
        ok &= sink.put_string("Drive State", mode_to_string(dbg.mode));
        ok &= sink.put_number("Drive Actuator Faults", static_cast<double>(dbg.actuator_faults));
    }
    return ok;
}

void DriveController::tuning_init() {
    params_.set_default(ParamKey::SLOW_TURN_MULT, ParamDefault::SLOW_TURN_MULT);

    params_.set_default(ParamKey::CLOSED_MAX_VEL, ParamDefault::CLOSED_MAX_VEL);
    params_.set_default(ParamKey::CLOSED_MAX_ROT, ParamDefault::CLOSED_MAX_ROT);

    params_.set_default(ParamKey::VEL_LEFT_P,   ParamDefault::VEL_P);
    params_.set_default(ParamKey::VEL_LEFT_FF,  ParamDefault::VEL_FF);
    params_.set_default(ParamKey::VEL_RIGHT_P,  ParamDefault::VEL_P);
    params_.set_default(ParamKey::VEL_RIGHT_FF, ParamDefault::VEL_FF);

    std::cout << "[drive] tunables seeded (" << params_.keys().size() << " keys)\n";
}
