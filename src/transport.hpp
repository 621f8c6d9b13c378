#pragma once
#include <memory>
#include <string>
#include <string_view>

#include <coop/generator.hpp>

#include "capture.hpp"
#include "observers.hpp"
#include "params.hpp"
#include "playback.hpp"
#include "readiness.hpp"
#include "vpio.hpp"

namespace transport {
// owns the engine, sides only borrow it
// must stay at its address once init() succeeded
struct LocalTransport {
    vpio::Engine              engine;
    Params                    params;
    Readiness                 readiness;
    bool                      stream_started = false;
    std::unique_ptr<Capture>  capture;
    std::unique_ptr<Playback> playback;

    Observers<>                 on_client_connected;
    Observers<>                 on_client_disconnected;
    Observers<std::string_view> on_app_message;
    Observers<std::string_view> on_transport_message;

    auto init(vpio::Engine engine, Params params) -> bool;
    auto input() -> Capture&;
    auto output() -> Playback&;
    auto cleanup() -> void;

    // inbound message from the application, requires a connected session
    auto send_app_message(std::string message) -> coop::Async<bool>;

    // called by the sides
    auto ensure_stream_started() -> bool;
    auto on_side_ready(Side side) -> void;
    auto on_side_stopped(Side side) -> void;
    auto emit_transport_message(std::string_view message) -> void;
    auto debug_enabled() const -> bool;
};
} // namespace transport
