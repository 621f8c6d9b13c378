#pragma once
#include <cstdint>

#include "config.hpp"

namespace transport {
struct Params {
    bool     audio_in_enabled      = true;
    bool     audio_out_enabled     = true;
    uint32_t audio_in_sample_rate  = config::default_sample_rate; // 0: follow the pipeline
    uint32_t audio_out_sample_rate = config::default_sample_rate; // 0: follow the pipeline
    uint32_t audio_in_channels     = 1;
    uint32_t audio_out_channels    = 1;
    uint32_t audio_out_10ms_chunks = 1;
    uint32_t capture_frame_ms      = config::capture_frame_ms;
    double   ring_capacity_secs    = 2.0;
    int      preroll_ms            = 40;
    int      slice_ms              = 5;
    int      playback_headroom_ms  = 10;
    bool     debug                 = false; // 1Hz pacer metrics, also enabled by VPIO_DEBUG
};
} // namespace transport
