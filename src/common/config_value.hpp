#pragma once

#include <cstdint>
#include <limits>
#include <nlohmann/json.hpp>

// Reads obj[key] into out when it is an integer within [lo, hi]. Returns
// false, leaving out untouched, for fractional or out-of-range values. A
// value that is not a number throws nlohmann::json::type_error like get<>.
template <typename T>
bool read_int_setting(const nlohmann::json& obj, const char* key, T& out, int64_t lo, int64_t hi) {
    auto it = obj.find(key);
    if (it == obj.end()) return true;

    int64_t value = 0;
    if (it->is_number_unsigned()) {
        auto u = it->get<uint64_t>();
        if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) return false;
        value = static_cast<int64_t>(u);
    } else if (it->is_number_float()) {
        return false;
    } else {
        value = it->get<int64_t>();
    }

    if (value < lo || value > hi) return false;
    out = static_cast<T>(value);
    return true;
}
