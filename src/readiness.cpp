#include "readiness.hpp"

namespace transport {
auto to_string(const Side side) -> const char* {
    switch(side) {
    case Side::Capture:
        return "capture";
    case Side::Playback:
        return "playback";
    }
    return "unknown";
}

auto SideSet::insert(const Side side) -> void {
    bits |= uint8_t(side);
}

auto SideSet::erase(const Side side) -> void {
    bits &= ~uint8_t(side);
}

auto SideSet::contains(const Side side) const -> bool {
    return (bits & uint8_t(side)) != 0;
}

auto SideSet::includes(const SideSet other) const -> bool {
    return (bits & other.bits) == other.bits;
}

auto SideSet::empty() const -> bool {
    return bits == 0;
}

auto SideSet::clear() -> void {
    bits = 0;
}

auto Readiness::on_ready(const Side side) -> ReadinessEvent {
    if(required.empty()) {
        return ReadinessEvent::None;
    }
    // previous session is over, start a fresh one
    if(disconnected_emitted) {
        ready.clear();
        connected_emitted    = false;
        disconnected_emitted = false;
    }
    if(!required.contains(side)) {
        return ReadinessEvent::None;
    }
    ready.insert(side);
    if(!connected_emitted && ready.includes(required)) {
        connected_emitted = true;
        return ReadinessEvent::Connected;
    }
    return ReadinessEvent::None;
}

auto Readiness::on_stopped(const Side side) -> ReadinessEvent {
    ready.erase(side);
    if(required.contains(side) && connected_emitted && !disconnected_emitted) {
        disconnected_emitted = true;
        return ReadinessEvent::Disconnected;
    }
    return ReadinessEvent::None;
}

auto Readiness::phase() const -> ReadinessPhase {
    if(disconnected_emitted || ready.empty()) {
        return ReadinessPhase::Idle;
    }
    return connected_emitted ? ReadinessPhase::Connected : ReadinessPhase::PartiallyReady;
}
} // namespace transport
