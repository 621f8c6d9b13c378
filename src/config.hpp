#pragma once
#include <chrono>
#include <cstddef>

// pcm: signed 16bit little endian, interleaved

namespace config {
// audio format
constexpr auto bytes_per_sample    = 2;
constexpr auto native_frame_ms     = 10; // unit accepted by vpio_write_frame_10ms
constexpr auto default_sample_rate = 16000;

// capture
constexpr auto capture_frame_ms     = 20;
constexpr auto capture_read_min     = 1024uz; // bytes
constexpr auto record_fallback_secs = 0.02;
constexpr auto poll_interval        = std::chrono::milliseconds(5);
constexpr auto poll_error_backoff   = std::chrono::milliseconds(20);

// playback
constexpr auto pacer_slow_threshold = std::chrono::milliseconds(12);
constexpr auto metrics_interval     = std::chrono::seconds(1);
constexpr auto format_warn_interval = std::chrono::seconds(1);

// environment
constexpr auto library_env     = "VPIO_LIB";
constexpr auto debug_env       = "VPIO_DEBUG";
constexpr auto default_library = "./libvpio-pipewire.so";
} // namespace config
