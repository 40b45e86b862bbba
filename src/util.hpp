#pragma once

#include <string>
#include <chrono>
#include <cstdint>
#include <vector>

namespace util {
    using Clock = std::chrono::steady_clock;

    std::string current_iso8601();
    int64_t current_timestamp_ms();
    double elapsed_ms(Clock::time_point start);

    double sigmoid(double z);
    double clamp01(double v);

    // Parses a full string as a double; false on trailing garbage or overflow
    bool parse_double(const std::string& text, double& out);

    std::string join(const std::vector<std::string>& items, const std::string& sep);
}
