#include "peershare/transfer/format.h"
#include <fmt/format.h>
#include <algorithm>
#include <cmath>

namespace peershare {

namespace {

std::string format_scaled(double value) {
    static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    constexpr int unit_count = sizeof(units) / sizeof(units[0]);

    if (value < 1.0) {
        return "0 B";
    }

    int unit = static_cast<int>(std::floor(std::log(value) / std::log(1024.0)));
    unit = std::min(std::max(unit, 0), unit_count - 1);

    double scaled = std::round(value / std::pow(1024.0, unit) * 10.0) / 10.0;
    if (scaled == std::floor(scaled)) {
        return fmt::format("{:.0f} {}", scaled, units[unit]);
    }
    return fmt::format("{:.1f} {}", scaled, units[unit]);
}

} // anonymous namespace

std::string format_bytes(uint64_t bytes) {
    return format_scaled(static_cast<double>(bytes));
}

std::string format_speed(double bytes_per_second) {
    return format_scaled(bytes_per_second > 0 ? bytes_per_second : 0.0) + "/s";
}

std::string format_eta(double seconds) {
    if (!std::isfinite(seconds) || seconds < 0) {
        return "--:--";
    }
    if (seconds < 60) {
        return fmt::format("{}s", static_cast<long long>(std::round(seconds)));
    }
    if (seconds < 3600) {
        auto mins = static_cast<long long>(std::floor(seconds / 60));
        auto secs = static_cast<long long>(std::round(std::fmod(seconds, 60.0)));
        return fmt::format("{}m {}s", mins, secs);
    }
    auto hours = static_cast<long long>(std::floor(seconds / 3600));
    auto mins = static_cast<long long>(std::round(std::fmod(seconds, 3600.0) / 60));
    return fmt::format("{}h {}m", hours, mins);
}

} // namespace peershare
