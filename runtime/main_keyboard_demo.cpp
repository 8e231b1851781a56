#include <iostream>
#include <thread>
#include <chrono>
#include <algorithm>

#include <termios.h>
#include <unistd.h>
#include <fcntl.h>

#include "drive_controller.hpp"        // -Isrc
#include "intent_mapping.hpp"
#include "subsystem_host.hpp"
#include "drivers/console_telemetry_sink.hpp"
#include "drivers/scaled_drive_encoders.hpp"
#include "sim_drivetrain.hpp"          // -Isim

static constexpr double DT_S = 0.02;

static void set_stdin_nonblocking_raw(bool enable) {
  static termios oldt{};
  static bool saved = false;

  if (enable) {
    if (!saved) {
      tcgetattr(STDIN_FILENO, &oldt);
      saved = true;
    }
    termios newt = oldt;
    newt.c_lflag &= ~(ICANON | ECHO);     // 라인버퍼/에코 끔
    tcsetattr(STDIN_FILENO, TCSANOW, &newt);

    int flags = fcntl(STDIN_FILENO, F_GETFL, 0);
    fcntl(STDIN_FILENO, F_SETFL, flags | O_NONBLOCK);
  } else {
    if (saved) tcsetattr(STDIN_FILENO, TCSANOW, &oldt);

    int flags = fcntl(STDIN_FILENO, F_GETFL, 0);
    fcntl(STDIN_FILENO, F_SETFL, flags & ~O_NONBLOCK);
  }
}

static int read_key_nonblock() {
  unsigned char c;
  ssize_t n = read(STDIN_FILENO, &c, 1);
  if (n == 1) return c;
  return -1;
}

int main() {
  DriveConfig cfg{};
  TunableParameterStore params;
  SimDrivetrain sim;
  ScaledDriveEncoders encoders(sim, cfg);

  DriveController drive(sim, encoders, sim, params, cfg);
  SubsystemHost host(params);
  host.add(drive);
  host.tuning_init();

  ConsoleTelemetrySink sink;

  std::cout
    << "==== Drivetrain Keyboard Demo ====\n"
    << "[W/S] forward +/-0.1\n"
    << "[A/D] turn -/+0.1\n"
    << "[X] stop (forward=turn=0)\n"
    << "[R] reverse toggle\n"
    << "[T] slow turn toggle\n"
    << "[V] velocity mode / [M] manual mode\n"
    << "[+/-] slow turn mult +/-0.1\n"
    << "[I] detailed telemetry toggle\n"
    << "[Z] reset\n"
    << "[Q] quit\n\n";

  if (!host.start(cfg.update_period)) return 1;

  set_stdin_nonblocking_raw(true);

  bool running = true;
  bool velocity_mode = false;
  double forward = 0.0;
  double turn = 0.0;

  while (running) {
    // ----- 키 입력 처리 -----
    int k = read_key_nonblock();
    if (k != -1) {
      switch (k) {
        case 'q': case 'Q': running = false; break;
        case 'w': case 'W': forward = std::clamp(forward + 0.1, -1.0, 1.0); break;
        case 's': case 'S': forward = std::clamp(forward - 0.1, -1.0, 1.0); break;
        case 'd': case 'D': turn = std::clamp(turn + 0.1, -1.0, 1.0); break;
        case 'a': case 'A': turn = std::clamp(turn - 0.1, -1.0, 1.0); break;
        case 'x': case 'X': forward = 0.0; turn = 0.0; break;
        case 'r': case 'R': drive.toggle_reverse(); break;
        case 't': case 'T': drive.toggle_slow_turn(); break;
        case 'v': case 'V': velocity_mode = true; break;
        case 'm': case 'M': velocity_mode = false; break;
        case 'z': case 'Z':
          drive.reset();
          velocity_mode = false; forward = 0.0; turn = 0.0;
          break;
        case '+': case '=': case '-': {
          const double step = (k == '-') ? -0.1 : 0.1;
          const double mult = params.get(ParamKey::SLOW_TURN_MULT, ParamDefault::SLOW_TURN_MULT);
          params.set(ParamKey::SLOW_TURN_MULT, std::clamp(mult + step, 0.0, 1.0));
          break;
        }
        case 'i': case 'I': {
          const bool on = params.get(ParamKey::TESTING, 0.0) > 0.5;
          params.set(ParamKey::TESTING, on ? 0.0 : 1.0);
          break;
        }
        default: break;
      }
    }

    // ----- intent 전달 (scheduler thread가 다음 tick에 소비) -----
    if (velocity_mode) {
      const VelocityIntent v = joystick_to_velocity(forward, turn, params);
      drive.set_velocity_intent(v.linear_mps, v.angular_radps);
    } else {
      drive.set_manual_intent(forward, turn);
    }

    sim.step(DT_S);

    // ----- 모니터: 10Hz 출력 -----
    static int div = 0;
    if (++div >= 5) {
      div = 0;
      const auto dbg = drive.debug();

      std::cout
        << "mode=" << mode_to_string(dbg.mode)
        << " rev=" << dbg.modifiers.reverse_enabled
        << " slow=" << dbg.modifiers.slow_turn_enabled
        << " in=(" << dbg.intent_forward << "," << dbg.intent_turn << ")"
        << " out=(" << dbg.out.left << "," << dbg.out.right << ")"
        << " vel=(" << encoders.get_velocity(Side::LEFT) << "," << encoders.get_velocity(Side::RIGHT) << ")"
        << "\n";

      host.display(sink);
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }

  set_stdin_nonblocking_raw(false);
  host.stop();
  std::cout << "bye\n";
  return 0;
}
