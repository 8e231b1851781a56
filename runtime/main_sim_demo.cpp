#include <chrono>
#include <iostream>
#include <thread>

#include "drive_controller.hpp"
#include "intent_mapping.hpp"
#include "logger.hpp"
#include "subsystem_host.hpp"
#include "tunable_params.hpp"
#include "drivers/console_telemetry_sink.hpp"
#include "drivers/scaled_drive_encoders.hpp"
#include "sim_drivetrain.hpp"

// main(decision) loop: 20ms, drive update loop: 5ms (별도 thread)
static constexpr double MAIN_DT_S = 0.02;
static constexpr int END_TICK = 400;

int main() {
  DriveConfig cfg{};

  TunableParameterStore params;
  SimDrivetrain sim(SimDrivetrain::Config{
    .free_speed_mps = 4.0,
    .alpha          = 0.15,
    .track_width_m  = cfg.track_width_m,
    .meters_per_rotation = encoder_position_factor(cfg)
  });
  ScaledDriveEncoders encoders(sim, cfg);

  DriveController drive(sim, encoders, sim, params, cfg);
  SubsystemHost host(params);
  host.add(drive);
  host.tuning_init();
  params.set(ParamKey::TESTING, 1.0);

  ConsoleTelemetrySink sink;
  DriveCsvLogger csv("drive_trace.csv");

  if (!host.start(cfg.update_period)) return 1;

  using clock = std::chrono::steady_clock;
  auto next = clock::now();

  for (int tick = 0; tick < END_TICK; ++tick) {
    // ---- demo sequence ----
    if (tick == 0)   drive.set_manual_intent(0.5, 0.0);
    if (tick == 50)  drive.set_manual_intent(0.8, 0.6);
    if (tick == 100) drive.toggle_reverse();
    if (tick == 150) { drive.toggle_reverse(); drive.toggle_slow_turn(); drive.set_manual_intent(0.0, 1.0); }
    if (tick == 180) params.set(ParamKey::SLOW_TURN_MULT, 0.3);  // live tuning
    if (tick == 200) {
      const VelocityIntent v = joystick_to_velocity(0.5, 0.2, params);
      drive.set_velocity_intent(v.linear_mps, v.angular_radps);
    }
    if (tick == 300) drive.reset();

    sim.step(MAIN_DT_S);

    // ---- telemetry (host 내부에서 3회 1번으로 throttle) ----
    if (tick % 10 == 0) host.display(sink);

    csv.log(tick, MAIN_DT_S, drive.debug(),
            encoders.get_velocity(Side::LEFT), encoders.get_velocity(Side::RIGHT),
            sim.get_heading_rad(), host.scheduler().stats().overruns);

    next += std::chrono::milliseconds(20);
    std::this_thread::sleep_until(next);
  }

  host.stop();

  std::cout << "publish failures=" << host.publish_failures()
            << " actuator faults=" << drive.debug().actuator_faults << "\n";
  return 0;
}
