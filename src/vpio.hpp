#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include <dlfcn.h>

#include "macros/autoptr.hpp"
#include "vpio-abi.hpp"

namespace vpio {
declare_autoptr(DLHandle, void, dlclose);

// set once by bind(), never modified afterwards
struct Capabilities {
    bool streaming      = false; // vpio_start_stream
    bool capture_read   = false; // vpio_read_capture
    bool playback_write = false; // vpio_write_playback
    bool paced_playback = false; // playback thread + headroom
    bool frame_write    = false; // vpio_write_frame_10ms
    bool flush          = false; // vpio_flush_playback
    bool flush_input    = false;
    bool reset_capture  = false;
    bool debug          = false;
    bool staging_debug  = false;
};

struct Functions {
    decltype(&vpio_init)             init             = nullptr;
    decltype(&vpio_record)           record           = nullptr;
    decltype(&vpio_get_capture_size) get_capture_size = nullptr;
    decltype(&vpio_copy_capture)     copy_capture     = nullptr;
    decltype(&vpio_play)             play             = nullptr;
    decltype(&vpio_shutdown)         shutdown         = nullptr;

    decltype(&vpio_start_stream)   start_stream   = nullptr;
    decltype(&vpio_stop_stream)    stop_stream    = nullptr;
    decltype(&vpio_read_capture)   read_capture   = nullptr;
    decltype(&vpio_write_playback) write_playback = nullptr;

    decltype(&vpio_write_frame_10ms)       write_frame_10ms       = nullptr;
    decltype(&vpio_start_playback_thread)  start_playback_thread  = nullptr;
    decltype(&vpio_stop_playback_thread)   stop_playback_thread   = nullptr;
    decltype(&vpio_set_target_headroom_ms) set_target_headroom_ms = nullptr;

    decltype(&vpio_flush_playback) flush_playback = nullptr;
    decltype(&vpio_flush_input)    flush_input    = nullptr;
    decltype(&vpio_reset_capture)  reset_capture  = nullptr;

    decltype(&vpio_get_bypass)            get_bypass            = nullptr;
    decltype(&vpio_get_in_sample_rate)    get_in_sample_rate    = nullptr;
    decltype(&vpio_get_out_sample_rate)   get_out_sample_rate   = nullptr;
    decltype(&vpio_get_ring_levels)       get_ring_levels       = nullptr;
    decltype(&vpio_get_underflow_count)   get_underflow_count   = nullptr;
    decltype(&vpio_reset_underflow_count) reset_underflow_count = nullptr;
    decltype(&vpio_get_staging_level)     get_staging_level     = nullptr;
    decltype(&vpio_get_staging_capacity)  get_staging_capacity  = nullptr;
};

struct DebugInfo {
    unsigned int bypass           = 0;
    int          bypass_status    = 0;
    double       in_sample_rate   = 0;
    double       out_sample_rate  = 0;
    size_t       capture_level    = 0;
    size_t       playback_level   = 0;
    size_t       underflows       = 0;
    size_t       staging_level    = 0;
    size_t       staging_capacity = 0;
};

// returns nullptr for unknown names
using SymbolResolver = std::function<void*(const char* name)>;

struct Engine {
    AutoDLHandle handle;
    std::string  path;
    Functions    fn;
    Capabilities caps;

    auto start_stream(uint32_t sample_rate, uint32_t channels, size_t capacity_bytes) -> bool;
    auto stop_stream() -> void;
    auto read_debug() const -> std::optional<DebugInfo>;
};

auto default_library_path() -> std::string;
auto bind(const char* path) -> std::optional<Engine>;
auto bind_symbols(const SymbolResolver& resolver) -> std::optional<Engine>;
} // namespace vpio
