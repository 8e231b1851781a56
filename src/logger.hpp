#pragma once
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <string>
#include "drive_controller.hpp"

// tick 단위 CSV trace
struct DriveCsvLogger {
    std::ofstream file;
    bool enabled = true;

    DriveCsvLogger(const std::string& path, bool enable = true)
        : enabled(enable)
    {
        if (!enabled) return;
        file.open(path);
        file << "tick,time_s,mode,reverse,slow_turn,"
                "intent_forward,intent_turn,out_left,out_right,"
                "vel_left,vel_right,heading,actuator_faults,sched_overruns\n";
        file.flush();
    }

    ~DriveCsvLogger() {
        if (enabled && file.is_open()) file.close();
    }

    bool is_open() const { return enabled && file.is_open(); }

    void log(
        int tick,
        double dt_s,
        const DriveDebug& dbg,
        double vel_left, double vel_right, double heading,
        std::uint64_t sched_overruns
    ) {
        if (!is_open()) return;

        const double time_s = tick * dt_s;

        file << tick << ","
             << std::fixed << std::setprecision(3) << time_s << ","
             << mode_to_string(dbg.mode) << ","
             << (dbg.modifiers.reverse_enabled ? 1 : 0) << ","
             << (dbg.modifiers.slow_turn_enabled ? 1 : 0) << ","
             << std::setprecision(4) << dbg.intent_forward << ","
             << std::setprecision(4) << dbg.intent_turn << ","
             << std::setprecision(6) << dbg.out.left << ","
             << std::setprecision(6) << dbg.out.right << ","
             << std::setprecision(6) << vel_left << ","
             << std::setprecision(6) << vel_right << ","
             << std::setprecision(6) << heading << ","
             << dbg.actuator_faults << ","
             << sched_overruns
             << "\n";
    }
};
