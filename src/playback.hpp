#pragma once
#include <chrono>
#include <deque>
#include <memory>
#include <optional>
#include <string_view>

#include <coop/generator.hpp>
#include <coop/single-event.hpp>
#include <coop/task-handle.hpp>

#include "frame.hpp"
#include "pacer-metrics.hpp"
#include "params.hpp"
#include "vpio.hpp"

namespace transport {
struct LocalTransport;

enum class PacingMode : uint8_t {
    None,
    Native,   // engine thread paces, we only fill its staging ring
    Software, // our pacer task writes slices into the playback ring
};

auto to_string(PacingMode mode) -> const char*;

// logs at most once per interval
struct WarnLimiter {
    using Clock = std::chrono::steady_clock;

    Clock::duration                  interval;
    std::optional<Clock::time_point> last;

    auto allow(Clock::time_point now) -> bool;
};

// one debug metrics window
struct MetricsReport {
    PacerReport     pacer;
    size_t          underflows = 0; // since the previous report
    vpio::DebugInfo engine;
};

struct Playback {
    vpio::Engine*    engine;
    LocalTransport*  parent;
    const Params*    params;
    PacingMode       mode        = PacingMode::None;
    uint32_t         sample_rate = 0;
    size_t           unit_bytes  = 0; // one native 10ms frame
    size_t           slice_bytes = 0;
    coop::TaskHandle pacer_task;
    coop::TaskHandle metrics_task;
    bool             pacer_running   = false;
    bool             pacer_waiting   = false;
    bool             metrics_running = false;
    bool             running         = false;

    // software pacer state
    std::deque<std::vector<std::byte>> queue;
    std::vector<std::byte>             pending; // dequeued, partially written
    size_t                             pending_cursor = 0;
    std::unique_ptr<coop::SingleEvent> queue_event;
    PacerMetrics                       metrics;
    UnderflowTracker                   underflows;
    WarnLimiter                        format_warn = {config::format_warn_interval, std::nullopt};

    Playback(LocalTransport& parent, vpio::Engine& engine, const Params& params);

    auto start(uint32_t pipeline_sample_rate = 0) -> coop::Async<bool>;
    auto stop() -> void;
    auto cancel() -> void;
    auto write_audio_frame(AudioFrame frame) -> bool;
    auto interrupt() -> void;
    auto send_message(std::string_view message) -> void;
    auto chunk_bytes() const -> size_t;
    auto queued_bytes() const -> size_t;
    auto take_metrics_report() -> MetricsReport;

    auto start_native() -> bool;
    auto validate(const AudioFrame& frame) -> void;
    auto write_native(std::span<const std::byte> data) -> bool;
    auto write_slice(std::span<const std::byte> slice) -> void;
    auto pacer_main() -> coop::Async<void>;
    auto metrics_main() -> coop::Async<void>;
};
} // namespace transport
