#pragma once
#include <string>
#include <vector>

// write-only key/value publish. 실패해도 제어 루프에는 영향 없음
class ITelemetrySink {
public:
    virtual ~ITelemetrySink() = default;
    virtual bool put_number(const std::string& key, double value) = 0;
    virtual bool put_string(const std::string& key, const std::string& value) = 0;
    virtual bool put_bool_array(const std::string& key, const std::vector<bool>& values) = 0;
    virtual bool put_number_array(const std::string& key, const std::vector<double>& values) = 0;
};
