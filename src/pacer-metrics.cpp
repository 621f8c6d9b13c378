#include <algorithm>

#include "pacer-metrics.hpp"

auto PacerMetrics::record(const Clock::time_point now) -> void {
    if(last_write) {
        const auto dt = std::chrono::duration_cast<std::chrono::microseconds>(now - *last_write);
        sum += dt;
        count += 1;
        max = std::max(max, dt);
        if(dt > slow_threshold) {
            slow += 1;
        }
    }
    last_write = now;
}

auto PacerMetrics::take_report() -> PacerReport {
    auto report  = PacerReport();
    report.avg   = count != 0 ? std::chrono::microseconds(sum / count) : std::chrono::microseconds(0);
    report.max   = max;
    report.slow  = slow;
    report.count = count;

    // the next window starts now, last_write stays so its first interval is measured
    sum   = std::chrono::microseconds(0);
    max   = std::chrono::microseconds(0);
    count = 0;
    slow  = 0;
    return report;
}

auto PacerMetrics::reset() -> void {
    take_report();
    last_write.reset();
}
