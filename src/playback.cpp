#include <algorithm>

#include <coop/promise.hpp>
#include <coop/runner.hpp>
#include <coop/timer.hpp>

#include "macros/logger.hpp"
#include "playback.hpp"
#include "transport.hpp"

#define CUTIL_MACROS_PRINT_FUNC(...) LOG_ERROR(logger, __VA_ARGS__)
#include "macros/coop-unwrap.hpp"

namespace transport {
namespace {
auto logger = Logger("LOCALTALK_PLAYBACK");

auto to_ms(const std::chrono::microseconds us) -> double {
    return us.count() / 1000.0;
}
} // namespace

auto to_string(const PacingMode mode) -> const char* {
    switch(mode) {
    case PacingMode::None:
        return "none";
    case PacingMode::Native:
        return "native";
    case PacingMode::Software:
        return "software";
    }
    return "unknown";
}

auto WarnLimiter::allow(const Clock::time_point now) -> bool {
    if(last && now - *last < interval) {
        return false;
    }
    last = now;
    return true;
}

Playback::Playback(LocalTransport& parent, vpio::Engine& engine, const Params& params)
    : engine(&engine),
      parent(&parent),
      params(&params) {}

auto Playback::chunk_bytes() const -> size_t {
    const auto rate = sample_rate != 0 ? sample_rate : params->audio_out_sample_rate;
    return bytes_for_duration(rate, params->audio_out_channels, config::native_frame_ms * params->audio_out_10ms_chunks);
}

auto Playback::queued_bytes() const -> size_t {
    auto total = pending.size() - pending_cursor;
    for(const auto& chunk : queue) {
        total += chunk.size();
    }
    return total;
}

auto Playback::start_native() -> bool {
    const auto& caps = engine->caps;
    if(!caps.paced_playback || !caps.frame_write) {
        return false;
    }
    engine->fn.set_target_headroom_ms(params->playback_headroom_ms);
    const auto rc = engine->fn.start_playback_thread(params->slice_ms, params->preroll_ms);
    if(rc != 0) {
        LOG_WARN(logger, "engine playback thread failed to start rc={}, falling back to software pacing", rc);
        return false;
    }
    return true;
}

auto Playback::start(const uint32_t pipeline_sample_rate) -> coop::Async<bool> {
    if(running) {
        co_return true;
    }
    coop_ensure(params->slice_ms > 0, "invalid slice duration {}ms", params->slice_ms);
    coop_ensure(parent->ensure_stream_started());
    sample_rate = params->audio_out_sample_rate != 0 ? params->audio_out_sample_rate : pipeline_sample_rate;
    coop_ensure(sample_rate != 0, "no output sample rate configured");
    unit_bytes  = bytes_for_duration(sample_rate, params->audio_out_channels, config::native_frame_ms);
    slice_bytes = std::max(1uz, bytes_for_duration(sample_rate, params->audio_out_channels, params->slice_ms));
    coop_ensure(unit_bytes != 0, "output frame unit is zero");

    auto& runner = *co_await coop::reveal_runner();
    mode         = start_native() ? PacingMode::Native : PacingMode::Software;
    if(mode == PacingMode::Software) {
        queue_event = std::make_unique<coop::SingleEvent>();
        metrics.reset();
        runner.push_task(pacer_main(), &pacer_task);
        pacer_running = true;
    }
    LOG_INFO(logger, "playback started rate={} channels={} pacing={} slice={}ms preroll={}ms headroom={}ms",
             sample_rate, params->audio_out_channels, to_string(mode), params->slice_ms, params->preroll_ms, params->playback_headroom_ms);

    underflows.last = engine->read_debug().value_or(vpio::DebugInfo()).underflows;
    if(parent->debug_enabled()) {
        runner.push_task(metrics_main(), &metrics_task);
        metrics_running = true;
    }
    running = true;
    parent->on_side_ready(Side::Playback);
    co_return true;
}

auto Playback::stop() -> void {
    // tasks are destroyed before the engine thread or rings are touched again
    if(pacer_running) {
        pacer_task.cancel();
        pacer_running = false;
    }
    if(metrics_running) {
        metrics_task.cancel();
        metrics_running = false;
    }
    if(mode == PacingMode::Native) {
        engine->fn.stop_playback_thread();
    }
    if(running) {
        LOG_INFO(logger, "playback stopped");
    }
    mode          = PacingMode::None;
    running       = false;
    pacer_waiting = false;
    queue.clear();
    pending.clear();
    pending_cursor = 0;
    parent->on_side_stopped(Side::Playback);
}

auto Playback::cancel() -> void {
    if(running) {
        LOG_INFO(logger, "playback cancelled");
    }
    stop();
}

auto Playback::validate(const AudioFrame& frame) -> void {
    const auto rate_mismatch = frame.sample_rate != 0 && frame.sample_rate != sample_rate;
    const auto size_mismatch = frame.data.size() % unit_bytes != 0;
    if(!rate_mismatch && !size_mismatch) {
        return;
    }
    if(!format_warn.allow(WarnLimiter::Clock::now())) {
        return;
    }
    if(rate_mismatch) {
        LOG_WARN(logger, "output frame rate mismatch: frame={} transport={}", frame.sample_rate, sample_rate);
    }
    if(size_mismatch) {
        LOG_WARN(logger, "unexpected output frame size: {} bytes is not a multiple of 10ms={} bytes", frame.data.size(), unit_bytes);
    }
}

auto Playback::write_native(const std::span<const std::byte> data) -> bool {
    auto ok = true;
    for(auto offset = 0uz; offset < data.size(); offset += unit_bytes) {
        const auto unit    = data.subspan(offset, std::min(unit_bytes, data.size() - offset));
        const auto written = engine->fn.write_frame_10ms(unit.data(), unit.size());
        if(written != unit.size()) {
            LOG_WARN(logger, "staging ring accepted {} of {} bytes", written, unit.size());
            ok = false;
        }
    }
    return ok;
}

auto Playback::write_audio_frame(AudioFrame frame) -> bool {
    if(frame.data.empty()) {
        return true;
    }
    if(mode == PacingMode::None) {
        LOG_WARN(logger, "playback not started, dropping {} bytes", frame.data.size());
        return false;
    }
    validate(frame);
    if(mode == PacingMode::Native) {
        return write_native(frame.data);
    }
    queue.push_back(std::move(frame.data));
    if(pacer_waiting) {
        pacer_waiting = false;
        queue_event->notify();
    }
    return true;
}

auto Playback::interrupt() -> void {
    const auto dropped = queued_bytes();
    queue.clear();
    pending.clear();
    pending_cursor = 0;
    if(running) {
        if(engine->caps.flush) {
            engine->fn.flush_playback();
        }
        if(engine->caps.flush_input) {
            engine->fn.flush_input();
        }
    }
    LOG_DEBUG(logger, "interrupted, dropped {} queued bytes", dropped);
}

auto Playback::send_message(const std::string_view message) -> void {
    parent->emit_transport_message(message);
}

auto Playback::write_slice(const std::span<const std::byte> slice) -> void {
    const auto& fn = engine->fn;
    if(engine->caps.playback_write) {
        const auto written = fn.write_playback(slice.data(), slice.size());
        if(written != slice.size()) {
            LOG_WARN(logger, "playback ring accepted {} of {} bytes", written, slice.size());
        }
    } else {
        // no playback ring, single shot play blocks until the slice is out
        if(const auto rc = fn.play(slice.data(), slice.size()); rc != 0) {
            LOG_WARN(logger, "vpio_play failed rc={}", rc);
        }
    }
}

auto Playback::pacer_main() -> coop::Async<void> {
    const auto interval = std::chrono::milliseconds(params->slice_ms);
loop:
    if(pending_cursor == pending.size()) {
        pending.clear();
        pending_cursor = 0;
        while(queue.empty()) {
            queue_event   = std::make_unique<coop::SingleEvent>();
            pacer_waiting = true;
            co_await *queue_event;
        }
        pending = std::move(queue.front());
        queue.pop_front();
    }
    // top up a short tail with the next chunk, a lone tail is written as is
    while(pending.size() - pending_cursor < slice_bytes && !queue.empty()) {
        pending.erase(pending.begin(), pending.begin() + pending_cursor);
        pending_cursor = 0;
        append<std::byte>(pending, queue.front());
        queue.pop_front();
    }

    {
        const auto size = std::min(slice_bytes, pending.size() - pending_cursor);
        write_slice(std::span{pending}.subspan(pending_cursor, size));
        pending_cursor += size;
        metrics.record(PacerMetrics::Clock::now());
    }
    co_await coop::sleep(interval);
    goto loop;
}

auto Playback::take_metrics_report() -> MetricsReport {
    auto report = MetricsReport();
    // native pacing happens in the engine, our interval stats mean nothing there
    if(mode == PacingMode::Software) {
        report.pacer = metrics.take_report();
    }
    report.engine     = engine->read_debug().value_or(vpio::DebugInfo());
    report.underflows = underflows.delta(report.engine.underflows);
    return report;
}

auto Playback::metrics_main() -> coop::Async<void> {
loop:
    co_await coop::sleep(config::metrics_interval);
    {
        const auto report = take_metrics_report();
        const auto& info  = report.engine;
        LOG_INFO(logger, "pacer: avg={:.2f}ms max={:.2f}ms slow(>{}ms)={} underflows+={} play_ring={} capture_ring={} stage_ring={}/{}",
                 to_ms(report.pacer.avg), to_ms(report.pacer.max), config::pacer_slow_threshold.count(), report.pacer.slow,
                 report.underflows, info.playback_level, info.capture_level, info.staging_level, info.staging_capacity);
    }
    goto loop;
}
} // namespace transport
