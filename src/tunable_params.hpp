#pragma once
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

// 대시보드/설정 UI에서 쓰는 키 이름
struct ParamKey {
    static constexpr const char* TESTING            = "Testing";

    static constexpr const char* SLOW_TURN_MULT     = "Drive Slow Turn Mult";
    static constexpr const char* CLOSED_MAX_VEL     = "Drive Closed Max Vel";
    static constexpr const char* CLOSED_MAX_ROT     = "Drive Closed Max Rot";

    static constexpr const char* VEL_LEFT_P         = "Drive Vel Left kP";
    static constexpr const char* VEL_LEFT_FF        = "Drive Vel Left kFF";
    static constexpr const char* VEL_RIGHT_P        = "Drive Vel Right kP";
    static constexpr const char* VEL_RIGHT_FF       = "Drive Vel Right kFF";
};

// 컴파일 기본값 (키가 없을 때 fallback)
struct ParamDefault {
    static constexpr double SLOW_TURN_MULT = 0.5;
    static constexpr double CLOSED_MAX_VEL = 2.0;   // m/s
    static constexpr double CLOSED_MAX_ROT = 3.0;   // rad/s

    static constexpr double VEL_P  = 0.05;
    static constexpr double VEL_FF = 0.25;  // 1 / free speed(4 m/s)
};

// process 전역 대신 DriveController에 주입되는 live-tunable 저장소.
// get()은 절대 실패하지 않음: 키가 없으면 default 반환
class TunableParameterStore {
public:
    double get(const std::string& key, double def) const;

    // non-finite 값은 거부 (false)
    bool set(const std::string& key, double value);

    // 키가 없을 때만 넣음 (설정 UI에서 바꾼 값은 유지)
    bool set_default(const std::string& key, double value);

    bool contains(const std::string& key) const;
    std::vector<std::string> keys() const;

private:
    mutable std::mutex mtx_;
    std::unordered_map<std::string, double> values_;
};
