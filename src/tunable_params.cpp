#include "tunable_params.hpp"
#include <algorithm>
#include <cmath>

double TunableParameterStore::get(const std::string& key, double def) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = values_.find(key);
    if (it == values_.end()) return def;
    return it->second;
}

bool TunableParameterStore::set(const std::string& key, double value) {
    if (!std::isfinite(value)) return false;

    std::lock_guard<std::mutex> lk(mtx_);
    values_[key] = value;
    return true;
}

bool TunableParameterStore::set_default(const std::string& key, double value) {
    if (!std::isfinite(value)) return false;

    std::lock_guard<std::mutex> lk(mtx_);
    return values_.emplace(key, value).second;
}

bool TunableParameterStore::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return values_.count(key) != 0;
}

std::vector<std::string> TunableParameterStore::keys() const {
    std::vector<std::string> out;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        out.reserve(values_.size());
        for (const auto& kv : values_) out.push_back(kv.first);
    }
    std::sort(out.begin(), out.end());
    return out;
}
