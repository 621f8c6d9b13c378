#pragma once
#include <chrono>
#include <cstddef>
#include <optional>

#include "config.hpp"

struct PacerReport {
    std::chrono::microseconds avg{0};
    std::chrono::microseconds max{0};
    size_t                    slow  = 0;
    size_t                    count = 0;
};

// inter-write interval statistics of the software pacer, one window per report
struct PacerMetrics {
    using Clock = std::chrono::steady_clock;

    std::chrono::microseconds        slow_threshold = config::pacer_slow_threshold;
    std::optional<Clock::time_point> last_write;
    std::chrono::microseconds        sum{0};
    std::chrono::microseconds        max{0};
    size_t                           count = 0;
    size_t                           slow  = 0;

    auto record(Clock::time_point now) -> void;
    auto take_report() -> PacerReport;
    auto reset() -> void;
};

struct UnderflowTracker {
    size_t last = 0;

    // the engine counter may have been reset behind our back
    auto delta(const size_t current) -> size_t {
        const auto ret = current >= last ? current - last : current;
        last           = current;
        return ret;
    }
};
