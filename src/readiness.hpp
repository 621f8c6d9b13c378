#pragma once
#include <cstdint>

namespace transport {
enum class Side : uint8_t {
    Capture  = 1 << 0,
    Playback = 1 << 1,
};

auto to_string(Side side) -> const char*;

struct SideSet {
    uint8_t bits = 0;

    auto insert(Side side) -> void;
    auto erase(Side side) -> void;
    auto contains(Side side) const -> bool;
    auto includes(SideSet other) const -> bool; // other is a subset of this
    auto empty() const -> bool;
    auto clear() -> void;
};

enum class ReadinessEvent : uint8_t {
    None,
    Connected,
    Disconnected,
};

enum class ReadinessPhase : uint8_t {
    Idle,
    PartiallyReady,
    Connected,
};

// connection lifecycle synthesized from two independently started sides
struct Readiness {
    SideSet required;
    SideSet ready;
    bool    connected_emitted    = false;
    bool    disconnected_emitted = false;

    auto on_ready(Side side) -> ReadinessEvent;
    auto on_stopped(Side side) -> ReadinessEvent;
    auto phase() const -> ReadinessPhase;
};
} // namespace transport
