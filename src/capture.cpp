#include <algorithm>
#include <exception>

#include <coop/promise.hpp>
#include <coop/runner.hpp>
#include <coop/timer.hpp>

#include "capture.hpp"
#include "macros/logger.hpp"
#include "transport.hpp"

#define CUTIL_MACROS_PRINT_FUNC(...) LOG_ERROR(logger, __VA_ARGS__)
#include "macros/coop-unwrap.hpp"

namespace transport {
namespace {
auto logger = Logger("LOCALTALK_CAPTURE");
} // namespace

Capture::Capture(LocalTransport& parent, vpio::Engine& engine, const Params& params)
    : engine(&engine),
      parent(&parent),
      params(&params) {}

auto Capture::frame_bytes() const -> size_t {
    return bytes_for_duration(sample_rate, params->audio_in_channels, params->capture_frame_ms);
}

auto Capture::read_engine() -> bool {
    const auto& fn = engine->fn;
    if(engine->caps.capture_read) {
        const auto read = fn.read_capture(scratch.data(), scratch.size());
        ensure(read <= scratch.size(), "engine returned {} bytes for a {} bytes buffer", read, scratch.size());
        assembler.push(std::span{scratch}.first(read));
        return true;
    }

    // no capture ring, record a short chunk and take it
    const auto rc = fn.record(config::record_fallback_secs);
    ensure(rc == 0, "vpio_record failed rc={}", rc);
    const auto size = fn.get_capture_size();
    if(size == 0) {
        return true;
    }
    if(scratch.size() < size) {
        scratch.resize(size);
    }
    const auto copied = fn.copy_capture(scratch.data(), size);
    ensure(copied <= size, "engine copied {} bytes for a {} bytes request", copied, size);
    assembler.push(std::span{scratch}.first(copied));
    if(copied > 0 && engine->caps.reset_capture) {
        fn.reset_capture();
    }
    return true;
}

auto Capture::poll_once() -> coop::Async<bool> {
    coop_ensure(read_engine());
    while(auto data = assembler.pop()) {
        if(!on_frame) {
            continue;
        }
        auto frame = AudioFrame{
            .data        = std::move(*data),
            .sample_rate = sample_rate,
            .channels    = params->audio_in_channels,
        };
        auto accepted = false;
        try {
            accepted = co_await on_frame(std::move(frame));
        } catch(const std::exception& e) {
            LOG_ERROR(logger, "capture consumer failed: {}", e.what());
            co_return false;
        }
        coop_ensure(accepted, "downstream rejected a capture frame");
    }
    co_return true;
}

auto Capture::poll_main() -> coop::Async<void> {
loop:
    if(!co_await poll_once()) {
        LOG_WARN(logger, "capture poll failed, retrying");
        co_await coop::sleep(config::poll_error_backoff);
        goto loop;
    }
    co_await coop::sleep(config::poll_interval);
    goto loop;
}

auto Capture::start(const uint32_t pipeline_sample_rate) -> coop::Async<bool> {
    if(running) {
        co_return true;
    }
    coop_ensure(parent->ensure_stream_started());
    sample_rate = params->audio_in_sample_rate != 0 ? params->audio_in_sample_rate : pipeline_sample_rate;
    coop_ensure(sample_rate != 0, "no input sample rate configured");

    const auto bytes = frame_bytes();
    coop_ensure(bytes != 0, "capture frame size is zero");
    assembler.reset(bytes);
    scratch.resize(std::max(bytes, config::capture_read_min));

    auto& runner = *co_await coop::reveal_runner();
    runner.push_task(poll_main(), &poll_task);
    running = true;
    LOG_INFO(logger, "capture started rate={} channels={} frame={} bytes source={}",
             sample_rate, params->audio_in_channels, bytes, engine->caps.capture_read ? "ring" : "record");

    parent->on_side_ready(Side::Capture);
    if(parent->debug_enabled()) {
        dump_debug();
    }
    co_return true;
}

auto Capture::stop() -> void {
    if(running) {
        // destroys the poll coroutine, no engine access past this point
        poll_task.cancel();
        running = false;
        assembler.reset(0);
        LOG_INFO(logger, "capture stopped");
    }
    parent->on_side_stopped(Side::Capture);
}

auto Capture::cancel() -> void {
    if(running) {
        LOG_INFO(logger, "capture cancelled");
    }
    stop();
}

auto Capture::push_app_message(std::string message) -> coop::Async<void> {
    if(on_app_message) {
        co_await on_app_message(std::move(message));
    }
}

auto Capture::dump_debug() const -> void {
    const auto info = engine->read_debug();
    if(!info) {
        LOG_INFO(logger, "engine debug not available");
        return;
    }
    LOG_INFO(logger, "engine debug: bypass={} rc={} in_rate={:.2f} out_rate={:.2f} capture_ring={} playback_ring={}",
             info->bypass, info->bypass_status, info->in_sample_rate, info->out_sample_rate, info->capture_level, info->playback_level);
}
} // namespace transport
