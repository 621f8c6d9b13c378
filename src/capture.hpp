#pragma once
#include <functional>
#include <string>

#include <coop/generator.hpp>
#include <coop/task-handle.hpp>

#include "frame-assembler.hpp"
#include "params.hpp"
#include "vpio.hpp"

namespace transport {
struct LocalTransport;

// engine capture path -> fixed duration frames, in arrival order
struct Capture {
    vpio::Engine*          engine;
    LocalTransport*        parent;
    const Params*          params;
    coop::TaskHandle       poll_task;
    FrameAssembler         assembler;
    std::vector<std::byte> scratch;
    uint32_t               sample_rate = 0;
    bool                   running     = false;

    // downstream consumer, returning false counts as a failed tick
    std::function<coop::Async<bool>(AudioFrame)> on_frame;
    // urgent inbound message for the pipeline
    std::function<coop::Async<void>(std::string)> on_app_message;

    Capture(LocalTransport& parent, vpio::Engine& engine, const Params& params);

    auto start(uint32_t pipeline_sample_rate = 0) -> coop::Async<bool>;
    auto stop() -> void;
    auto cancel() -> void;
    auto push_app_message(std::string message) -> coop::Async<void>;

    auto frame_bytes() const -> size_t;
    auto poll_once() -> coop::Async<bool>;
    auto poll_main() -> coop::Async<void>;
    auto read_engine() -> bool;
    auto dump_debug() const -> void;
};
} // namespace transport
