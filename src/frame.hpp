#pragma once
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "config.hpp"

struct AudioFrame {
    std::vector<std::byte> data;
    uint32_t               sample_rate = 0;
    uint32_t               channels    = 1;
};

inline auto bytes_for_duration(const uint32_t sample_rate, const uint32_t channels, const uint32_t ms) -> size_t {
    return size_t(sample_rate) * ms / 1000 * channels * config::bytes_per_sample;
}

template <class T>
auto append(std::vector<T>& vec, std::span<const T> span) -> void {
    vec.insert(vec.end(), span.begin(), span.end());
}
