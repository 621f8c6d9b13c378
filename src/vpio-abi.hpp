#pragma once
#include <cstddef>

// entry points exported by a native echo-cancelling engine
// all return codes: 0 on success
extern "C" {
// required
auto vpio_init(double sample_rate, int channels) -> int;
auto vpio_record(double seconds) -> int;
auto vpio_get_capture_size() -> size_t;
auto vpio_copy_capture(void* dst, size_t maxlen) -> size_t;
auto vpio_play(const void* data, size_t len) -> int;
auto vpio_shutdown() -> void;

// streaming rings
auto vpio_start_stream(double sample_rate, int channels, size_t ring_capacity_bytes) -> int;
auto vpio_stop_stream() -> void;
auto vpio_read_capture(void* dst, size_t maxlen) -> size_t;
auto vpio_write_playback(const void* src, size_t len) -> size_t;

// engine paced playback
auto vpio_write_frame_10ms(const void* data, size_t len) -> size_t;
auto vpio_start_playback_thread(int slice_ms, int preroll_ms) -> int;
auto vpio_stop_playback_thread() -> void;
auto vpio_set_target_headroom_ms(int ms) -> void;

// flush
auto vpio_flush_playback() -> void;
auto vpio_flush_input() -> void;
auto vpio_reset_capture() -> size_t;

// debug
auto vpio_get_bypass(unsigned int* bypass) -> int;
auto vpio_get_in_sample_rate() -> double;
auto vpio_get_out_sample_rate() -> double;
auto vpio_get_ring_levels(size_t* cap_level, size_t* play_level) -> size_t;
auto vpio_get_underflow_count() -> size_t;
auto vpio_reset_underflow_count() -> void;
auto vpio_get_staging_level() -> size_t;
auto vpio_get_staging_capacity() -> size_t;
}
