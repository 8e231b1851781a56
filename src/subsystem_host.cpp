#include "subsystem_host.hpp"
#include <iostream>

SubsystemHost::SubsystemHost(TunableParameterStore& params)
    : params_(params) {}

SubsystemHost::~SubsystemHost() {
    stop();
}

bool SubsystemHost::add(ISubsystem& subsystem) {
    if (scheduler_.running()) return false;
    subsystems_.push_back(&subsystem);
    return true;
}

bool SubsystemHost::start(std::chrono::microseconds period) {
    const bool ok = scheduler_.start([this] { update_all(); }, period);
    if (ok) {
        std::cout << "[host] update loop started: " << subsystems_.size()
                  << " subsystem(s), period=" << period.count() << "us\n";
    } else {
        std::cerr << "[host] update loop start rejected\n";
    }
    return ok;
}

void SubsystemHost::stop() {
    if (!scheduler_.running()) return;
    scheduler_.stop();

    const auto st = scheduler_.stats();
    std::cout << "[host] update loop stopped: ticks=" << st.ticks
              << " overruns=" << st.overruns
              << " errors=" << st.callback_errors << "\n";
}

void SubsystemHost::update_all() {
    for (ISubsystem* s : subsystems_) {
        s->update();
    }
}

void SubsystemHost::display(ITelemetrySink& sink) {
    if (subsystems_.empty()) return;

    if (output_counter_ % DISPLAY_DIVIDER == 0) {
        const bool detailed = params_.get(ParamKey::TESTING, 0.0) > 0.5;
        ISubsystem* s = subsystems_[output_counter_ / DISPLAY_DIVIDER];

        bool ok = s->publish_telemetry(sink, detailed);

        const auto st = scheduler_.stats();
        ok &= sink.put_number("Scheduler Ticks", static_cast<double>(st.ticks));
        ok &= sink.put_number("Scheduler Overruns", static_cast<double>(st.overruns));

        if (!ok) ++publish_failures_;
    }

    output_counter_ = (output_counter_ + 1) %
        (static_cast<int>(subsystems_.size()) * DISPLAY_DIVIDER);
}

void SubsystemHost::tuning_init() {
    params_.set_default(ParamKey::TESTING, 0.0);
    for (ISubsystem* s : subsystems_) {
        s->tuning_init();
    }
}
