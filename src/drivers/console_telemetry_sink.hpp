#pragma once
#include <iomanip>
#include <iostream>
#include "../../include/io/telemetry_sink.hpp"

// 대시보드 대신 콘솔에 한 줄씩 출력
class ConsoleTelemetrySink final : public ITelemetrySink {
public:
    explicit ConsoleTelemetrySink(std::ostream& os = std::cout) : os_(os) {}

    bool put_number(const std::string& key, double value) override {
        os_ << "[telemetry] " << key << "=" << std::setprecision(4) << value << "\n";
        return os_.good();
    }

    bool put_string(const std::string& key, const std::string& value) override {
        os_ << "[telemetry] " << key << "=" << value << "\n";
        return os_.good();
    }

    bool put_bool_array(const std::string& key, const std::vector<bool>& values) override {
        os_ << "[telemetry] " << key << "=[";
        for (size_t i = 0; i < values.size(); ++i) {
            os_ << (i ? "," : "") << (values[i] ? 1 : 0);
        }
        os_ << "]\n";
        return os_.good();
    }

    bool put_number_array(const std::string& key, const std::vector<double>& values) override {
        os_ << "[telemetry] " << key << "=[" << std::setprecision(4);
        for (size_t i = 0; i < values.size(); ++i) {
            os_ << (i ? "," : "") << values[i];
        }
        os_ << "]\n";
        return os_.good();
    }

private:
    std::ostream& os_;
};
