#pragma once
#include <cstdint>
#include "../drive_types.hpp"

// intent + 버튼 펄스 + 메타(시간/유효성) 묶음
struct IntentFrame {
    DriveIntent intent = ManualIntent{};
    bool toggle_reverse   = false;  // 1 tick 펄스
    bool toggle_slow_turn = false;  // 1 tick 펄스
    bool reset            = false;
    std::uint64_t t_us = 0;
    bool valid = true;
};

class IIntentSource {
public:
    virtual ~IIntentSource() = default;
    // main loop마다 poll. 더 이상 입력이 없으면 false
    virtual bool read(IntentFrame& frame) = 0;
};
