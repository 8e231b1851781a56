#pragma once
#include "io/telemetry_sink.hpp"

class ISubsystem {
public:
    virtual ~ISubsystem() = default;

    virtual const char* name() const = 0;

    // scheduler thread에서 주기 호출. 빠르고 non-blocking 이어야 함
    virtual void update() = 0;

    // main loop에서 호출 (느린 주기). 하나라도 실패하면 false
    virtual bool publish_telemetry(ITelemetrySink& sink, bool detailed) = 0;

    // tunable 기본값 등록
    virtual void tuning_init() = 0;
};
