#pragma once
#include "intent_source.hpp"

template <typename ScenarioT>
class ScenarioIntentSource final : public IIntentSource {
public:
    ScenarioIntentSource(const ScenarioT& sc, double dt_s)
        : sc_(sc), dt_s_(dt_s) {
        sc_.init(frame_);
    }

    bool read(IntentFrame& out) override {
        if (tick_ >= sc_.end_tick()) return false;

        // 펄스는 매 tick 초기화, 필요하면 scenario가 다시 세움
        frame_.toggle_reverse = false;
        frame_.toggle_slow_turn = false;
        frame_.reset = false;
        sc_.apply(tick_, frame_);

        frame_.t_us = static_cast<std::uint64_t>(tick_ * dt_s_ * 1e6);
        frame_.valid = true;

        out = frame_;
        ++tick_;
        return true;
    }

    int tick() const { return tick_; }

private:
    const ScenarioT& sc_;
    double dt_s_ = 0.005;
    int tick_ = 0;
    IntentFrame frame_{};
};
