#include <cstdlib>

#include <coop/promise.hpp>

#include "macros/logger.hpp"
#include "transport.hpp"

#define CUTIL_MACROS_PRINT_FUNC(...) LOG_ERROR(logger, __VA_ARGS__)
#include "macros/coop-unwrap.hpp"

namespace transport {
namespace {
auto logger = Logger("LOCALTALK_TRANSPORT");

auto env_flag(const char* const name) -> bool {
    const auto value = std::getenv(name);
    return value != nullptr && value[0] != '\0' && std::string_view(value) != "0";
}
} // namespace

auto LocalTransport::init(vpio::Engine engine, Params params) -> bool {
    ensure(params.audio_in_channels > 0 && params.audio_out_channels > 0, "channel count must be positive");
    ensure(params.audio_out_10ms_chunks > 0, "audio_out_10ms_chunks must be positive");
    ensure(params.capture_frame_ms > 0, "capture frame duration must be positive");
    ensure(params.slice_ms > 0, "pacing slice must be positive");
    ensure(params.ring_capacity_secs > 0, "ring capacity must be positive");

    this->engine = std::move(engine);
    this->params = params;
    this->params.debug |= env_flag(config::debug_env);

    readiness = Readiness();
    if(this->params.audio_in_enabled) {
        readiness.required.insert(Side::Capture);
    }
    if(this->params.audio_out_enabled) {
        readiness.required.insert(Side::Playback);
    }
    if(readiness.required.empty()) {
        LOG_WARN(logger, "both audio directions disabled, no connection events will fire");
    }

    on_client_connected.name    = "client-connected";
    on_client_disconnected.name = "client-disconnected";
    on_app_message.name         = "app-message";
    on_transport_message.name   = "transport-message";
    return true;
}

auto LocalTransport::input() -> Capture& {
    if(!capture) {
        capture = std::make_unique<Capture>(*this, engine, params);
    }
    return *capture;
}

auto LocalTransport::output() -> Playback& {
    if(!playback) {
        playback = std::make_unique<Playback>(*this, engine, params);
    }
    return *playback;
}

auto LocalTransport::ensure_stream_started() -> bool {
    if(stream_started) {
        return true;
    }
    const auto rate     = params.audio_in_sample_rate != 0 ? params.audio_in_sample_rate : uint32_t(config::default_sample_rate);
    const auto channels = params.audio_in_channels;
    const auto capacity = size_t(params.ring_capacity_secs * rate * channels * config::bytes_per_sample);
    ensure(engine.start_stream(rate, channels, capacity), "failed to start engine stream");
    stream_started = true;
    LOG_INFO(logger, "engine stream started rate={} channels={} ring={} bytes", rate, channels, capacity);
    return true;
}

auto LocalTransport::on_side_ready(const Side side) -> void {
    LOG_DEBUG(logger, "{} ready", to_string(side));
    if(readiness.on_ready(side) == ReadinessEvent::Connected) {
        LOG_INFO(logger, "client connected");
        on_client_connected.fire();
    }
}

auto LocalTransport::on_side_stopped(const Side side) -> void {
    LOG_DEBUG(logger, "{} stopped", to_string(side));
    if(readiness.on_stopped(side) == ReadinessEvent::Disconnected) {
        LOG_INFO(logger, "client disconnected");
        on_client_disconnected.fire();
    }
}

auto LocalTransport::cleanup() -> void {
    if(capture && capture->running) {
        capture->stop();
    }
    if(playback && playback->running) {
        playback->stop();
    }
    if(stream_started) {
        engine.stop_stream();
        stream_started = false;
        LOG_INFO(logger, "engine stream stopped");
    }
}

auto LocalTransport::send_app_message(std::string message) -> coop::Async<bool> {
    coop_ensure(capture, "no input side to deliver the message");
    coop_ensure(readiness.phase() == ReadinessPhase::Connected, "not connected, message dropped");
    co_await capture->push_app_message(message);
    on_app_message.fire(message);
    co_return true;
}

auto LocalTransport::emit_transport_message(const std::string_view message) -> void {
    on_transport_message.fire(message);
}

auto LocalTransport::debug_enabled() const -> bool {
    return params.debug;
}
} // namespace transport
