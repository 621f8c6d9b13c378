#include <algorithm>
#include <bit>
#include <cstring>
#include <string_view>
#include <unordered_map>

#include "fake-engine.hpp"

namespace fake {
State state;

namespace {
auto take(std::vector<std::byte>& from, const size_t limit) -> std::vector<std::byte> {
    const auto len  = std::min(limit, from.size());
    auto       head = std::vector<std::byte>(from.begin(), from.begin() + len);
    from.erase(from.begin(), from.begin() + len);
    return head;
}

auto init(const double sample_rate, const int channels) -> int {
    state.init_calls += 1;
    state.sample_rate = sample_rate;
    state.channels    = channels;
    return state.start_rc;
}

// moves what the device would deliver in the given time into the single shot buffer
auto record(const double seconds) -> int {
    state.record_calls += 1;
    const auto bytes = size_t(seconds * state.sample_rate + 0.5) * state.channels * 2;
    state.recorded   = take(state.capture, bytes);
    return 0;
}

auto get_capture_size() -> size_t {
    return state.recorded.size();
}

auto copy_capture(void* const dst, const size_t maxlen) -> size_t {
    const auto len = std::min(maxlen, state.recorded.size());
    if(len != 0) {
        std::memcpy(dst, state.recorded.data(), len);
    }
    return len;
}

auto play(const void* const data, const size_t len) -> int {
    state.play_calls += 1;
    const auto bytes = std::bit_cast<const std::byte*>(data);
    state.played.insert(state.played.end(), bytes, bytes + len);
    return 0;
}

auto shutdown() -> void {
    state.shutdown_calls += 1;
}

auto start_stream(const double sample_rate, const int channels, const size_t capacity) -> int {
    state.start_calls += 1;
    state.sample_rate = sample_rate;
    state.channels    = channels;
    state.capacity    = capacity;
    return state.start_rc;
}

auto stop_stream() -> void {
    state.stop_calls += 1;
}

auto read_capture(void* const dst, const size_t maxlen) -> size_t {
    const auto limit = state.read_chunk != 0 ? std::min(maxlen, state.read_chunk) : maxlen;
    const auto bytes = take(state.capture, limit);
    if(!bytes.empty()) {
        std::memcpy(dst, bytes.data(), bytes.size());
    }
    return bytes.size();
}

auto write_playback(const void* const src, const size_t len) -> size_t {
    const auto bytes = std::bit_cast<const std::byte*>(src);
    state.played.insert(state.played.end(), bytes, bytes + len);
    return len;
}

auto write_frame_10ms(const void* const data, const size_t len) -> size_t {
    const auto bytes = std::bit_cast<const std::byte*>(data);
    state.staged.insert(state.staged.end(), bytes, bytes + len);
    state.frame_writes.push_back(len);
    return len;
}

auto start_playback_thread(const int slice_ms, const int preroll_ms) -> int {
    if(state.thread_rc != 0) {
        return state.thread_rc;
    }
    state.thread_running = true;
    state.slice_ms       = slice_ms;
    state.preroll_ms     = preroll_ms;
    return 0;
}

auto stop_playback_thread() -> void {
    state.thread_running = false;
}

auto set_target_headroom_ms(const int ms) -> void {
    state.headroom_ms = ms;
}

auto flush_playback() -> void {
    state.flush_playback_calls += 1;
}

auto flush_input() -> void {
    state.flush_input_calls += 1;
    state.staged.clear();
}

auto reset_capture() -> size_t {
    state.reset_calls += 1;
    state.recorded.clear();
    return 0;
}

auto get_bypass(unsigned int* const bypass) -> int {
    *bypass = 0;
    return 0;
}

auto get_in_sample_rate() -> double {
    return state.sample_rate;
}

auto get_out_sample_rate() -> double {
    return state.sample_rate;
}

auto get_ring_levels(size_t* const cap_level, size_t* const play_level) -> size_t {
    *cap_level  = state.capture.size();
    *play_level = state.played.size();
    return *cap_level + *play_level;
}

auto get_underflow_count() -> size_t {
    return state.underflows;
}

auto reset_underflow_count() -> void {
    state.underflows = 0;
}

auto get_staging_level() -> size_t {
    return state.staged.size();
}

auto get_staging_capacity() -> size_t {
    return state.capacity;
}

template <class F>
auto symbol(F* const func) -> void* {
    return std::bit_cast<void*>(func);
}

const auto required_symbols = std::unordered_map<std::string_view, void*>{
    {"vpio_init", symbol(&init)},
    {"vpio_record", symbol(&record)},
    {"vpio_get_capture_size", symbol(&get_capture_size)},
    {"vpio_copy_capture", symbol(&copy_capture)},
    {"vpio_play", symbol(&play)},
    {"vpio_shutdown", symbol(&shutdown)},
};

const auto streaming_symbols = std::unordered_map<std::string_view, void*>{
    {"vpio_start_stream", symbol(&start_stream)},
    {"vpio_stop_stream", symbol(&stop_stream)},
    {"vpio_read_capture", symbol(&read_capture)},
    {"vpio_write_playback", symbol(&write_playback)},
    {"vpio_flush_playback", symbol(&flush_playback)},
    {"vpio_flush_input", symbol(&flush_input)},
    {"vpio_reset_capture", symbol(&reset_capture)},
    {"vpio_get_bypass", symbol(&get_bypass)},
    {"vpio_get_in_sample_rate", symbol(&get_in_sample_rate)},
    {"vpio_get_out_sample_rate", symbol(&get_out_sample_rate)},
    {"vpio_get_ring_levels", symbol(&get_ring_levels)},
    {"vpio_get_underflow_count", symbol(&get_underflow_count)},
    {"vpio_reset_underflow_count", symbol(&reset_underflow_count)},
    {"vpio_get_staging_level", symbol(&get_staging_level)},
    {"vpio_get_staging_capacity", symbol(&get_staging_capacity)},
};

const auto paced_symbols = std::unordered_map<std::string_view, void*>{
    {"vpio_write_frame_10ms", symbol(&write_frame_10ms)},
    {"vpio_start_playback_thread", symbol(&start_playback_thread)},
    {"vpio_stop_playback_thread", symbol(&stop_playback_thread)},
    {"vpio_set_target_headroom_ms", symbol(&set_target_headroom_ms)},
};

auto lookup(const std::unordered_map<std::string_view, void*>& table, const std::string_view name) -> void* {
    const auto it = table.find(name);
    return it != table.end() ? it->second : nullptr;
}
} // namespace

auto reset() -> void {
    state = State();
}

auto resolver(const Symbols symbols, const char* const omit) -> vpio::SymbolResolver {
    return [symbols, omit](const char* const name) -> void* {
        if(omit != nullptr && std::string_view(name) == omit) {
            return nullptr;
        }
        if(const auto ptr = lookup(required_symbols, name)) {
            return ptr;
        }
        if(symbols == Symbols::RequiredOnly) {
            return nullptr;
        }
        if(const auto ptr = lookup(streaming_symbols, name)) {
            return ptr;
        }
        if(symbols == Symbols::NoPacedThread) {
            return nullptr;
        }
        return lookup(paced_symbols, name);
    };
}

auto engine(const Symbols symbols) -> vpio::Engine {
    return std::move(*vpio::bind_symbols(resolver(symbols)));
}

auto pattern(const size_t offset, const size_t bytes) -> std::vector<std::byte> {
    auto data = std::vector<std::byte>(bytes);
    for(auto i = 0uz; i < bytes; i += 1) {
        data[i] = std::byte((offset + i) % 251);
    }
    return data;
}

auto filled(const size_t bytes, const std::byte value) -> std::vector<std::byte> {
    return std::vector<std::byte>(bytes, value);
}
} // namespace fake
