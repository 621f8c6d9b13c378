#pragma once
#include <optional>

#include "frame.hpp"

// reassembles an arbitrary byte stream into frames of exactly frame_bytes
struct FrameAssembler {
    size_t                 frame_bytes = 0;
    std::vector<std::byte> buffer;

    auto push(const std::span<const std::byte> bytes) -> void {
        append(buffer, bytes);
    }

    auto pop() -> std::optional<std::vector<std::byte>> {
        if(frame_bytes == 0 || buffer.size() < frame_bytes) {
            return std::nullopt;
        }
        auto frame = std::vector<std::byte>(buffer.begin(), buffer.begin() + frame_bytes);
        buffer.erase(buffer.begin(), buffer.begin() + frame_bytes);
        return frame;
    }

    auto remainder() const -> size_t {
        return buffer.size();
    }

    auto reset(const size_t bytes) -> void {
        frame_bytes = bytes;
        buffer.clear();
    }
};
