#include <algorithm>
#include <array>
#include <atomic>
#include <bit>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <functional>
#include <memory>
#include <string>
#include <system_error>
#include <thread>

#include <pipewire/pipewire.h>
#include <spa/param/audio/format-utils.h>

#include "byte-ring.hpp"
#include "macros/autoptr.hpp"
#include "macros/logger.hpp"
#include "util/cleaner.hpp"
#include "util/critical.hpp"
#include "vpio-abi.hpp"

namespace {
auto logger = Logger("VPIO_PW");
} // namespace

#define CUTIL_MACROS_PRINT_FUNC(...) LOG_ERROR(logger, __VA_ARGS__)
#include "macros/assert.hpp"

// echo cancelled duplex audio through pipewire's echo-cancel nodes
// the abi carries no handle, so there is at most one engine per process
namespace {
declare_autoptr(PWThreadLoop, pw_thread_loop, pw_thread_loop_destroy);
declare_autoptr(PWStream, pw_stream, pw_stream_destroy);

constexpr auto bytes_per_sample    = 2;
constexpr auto default_source      = "echo-cancel-source";
constexpr auto default_sink        = "echo-cancel-sink";
constexpr auto default_guard_mult  = 1.5;
constexpr auto render_decay_period = 100u; // process cycles
constexpr auto wait_step           = std::chrono::milliseconds(10);

enum class Mode : int {
    Idle,
    Record, // single shot capture buffer is filled
    Play,   // single shot buffer is rendered instead of the playback ring
};

struct SingleShot {
    std::vector<std::byte> capture;
    std::vector<std::byte> play;
    size_t                 play_cursor = 0;
};

struct Rings {
    engine::ByteRing capture;
    engine::ByteRing playback;
    bool             streaming = false;
};

struct Pacer {
    std::thread      thread;
    std::atomic_bool run         = false;
    std::atomic_int  slice_ms    = 5;
    std::atomic_int  preroll_ms  = 40;
    std::atomic_int  headroom_ms = 10;
    double           guard_mult  = default_guard_mult;
};

struct Engine {
    AutoPWThreadLoop loop;
    AutoPWStream     capture_stream;
    AutoPWStream     playback_stream;
    uint32_t         sample_rate = 16000;
    uint32_t         channels    = 1;
    bool             bypass      = false;

    std::atomic<Mode>          mode = Mode::Idle;
    Critical<Rings>            rings;
    Critical<SingleShot>       single;
    Critical<engine::ByteRing> staging; // 10ms frames waiting for the pacer

    // negotiated stream rates, 0 until the format is known
    std::atomic_uint32_t in_rate  = 0;
    std::atomic_uint32_t out_rate = 0;

    // render side statistics, written by the realtime thread
    std::atomic_size_t underflows   = 0;
    std::atomic_size_t render_last  = 0;
    std::atomic_size_t render_max   = 0;
    unsigned           render_count = 0;

    Pacer pacer;

    auto frame_bytes() const -> size_t {
        return size_t(channels) * bytes_per_sample;
    }

    auto bytes_per_ms() const -> size_t {
        return size_t(sample_rate) * frame_bytes() / 1000;
    }
};

auto instance = std::unique_ptr<Engine>();

auto env_or(const char* const name, const char* const fallback) -> const char* {
    const auto value = std::getenv(name);
    return value != nullptr && value[0] != '\0' ? value : fallback;
}

auto render_guard_mult() -> double {
    const auto value = std::getenv("VPIO_RENDER_GUARD_MULT");
    if(value == nullptr) {
        return default_guard_mult;
    }
    auto end  = (char*)nullptr;
    auto mult = std::strtod(value, &end);
    if(end == value) {
        LOG_WARN(logger, "ignoring malformed VPIO_RENDER_GUARD_MULT={}", value);
        return default_guard_mult;
    }
    return std::clamp(mult, 1.0, 4.0);
}

// realtime callbacks
auto on_param_changed(std::atomic_uint32_t& rate, const uint32_t id, const spa_pod* const param) -> void {
    if(param == NULL || id != SPA_PARAM_Format) {
        return;
    }
    auto info = spa_audio_info();
    if(spa_format_parse(param, &info.media_type, &info.media_subtype) < 0) {
        return;
    }
    if(info.media_type != SPA_MEDIA_TYPE_audio || info.media_subtype != SPA_MEDIA_SUBTYPE_raw) {
        return;
    }
    if(spa_format_audio_raw_parse(param, &info.info.raw) < 0) {
        return;
    }
    rate = info.info.raw.rate;
}

auto capture_on_param_changed(void* const userdata, const uint32_t id, const spa_pod* const param) -> void {
    on_param_changed(std::bit_cast<Engine*>(userdata)->in_rate, id, param);
}

auto playback_on_param_changed(void* const userdata, const uint32_t id, const spa_pod* const param) -> void {
    on_param_changed(std::bit_cast<Engine*>(userdata)->out_rate, id, param);
}

auto capture_on_process(void* const userdata) -> void {
    auto& self = *std::bit_cast<Engine*>(userdata);

    const auto pw_buffer = pw_stream_dequeue_buffer(self.capture_stream.get());
    if(pw_buffer == NULL) {
        return;
    }
    auto cleaner = Cleaner{[&] { pw_stream_queue_buffer(self.capture_stream.get(), pw_buffer); }};

    const auto& data = pw_buffer->buffer->datas[0];
    if(data.data == NULL) {
        return;
    }
    const auto offset = std::min(data.chunk->offset, data.maxsize);
    const auto size   = std::min(data.chunk->size, data.maxsize - offset);
    const auto bytes  = std::span{std::bit_cast<const std::byte*>(data.data) + offset, size};

    {
        auto [lock, rings] = self.rings.access();
        if(rings.streaming) {
            rings.capture.push(bytes, true);
        }
    }
    if(self.mode == Mode::Record) {
        auto [lock, single] = self.single.access();
        single.capture.insert(single.capture.end(), bytes.begin(), bytes.end());
    }
}

auto track_render_size(Engine& self, const size_t bytes) -> void {
    self.render_last = bytes;
    if(bytes > self.render_max) {
        self.render_max = bytes;
    }
    // decay slowly so one large pull does not inflate the guard forever
    self.render_count += 1;
    if(self.render_count % render_decay_period == 0) {
        const auto current = self.render_max.load();
        self.render_max    = std::max(current - current / 50, bytes);
    }
}

auto playback_on_process(void* const userdata) -> void {
    auto& self = *std::bit_cast<Engine*>(userdata);

    const auto pw_buffer = pw_stream_dequeue_buffer(self.playback_stream.get());
    if(pw_buffer == NULL) {
        return;
    }
    auto cleaner = Cleaner{[&] { pw_stream_queue_buffer(self.playback_stream.get(), pw_buffer); }};

    auto& data = pw_buffer->buffer->datas[0];
    if(data.data == NULL) {
        return;
    }
    const auto stride = self.frame_bytes();
    auto       size   = size_t(data.maxsize) / stride * stride;
    if(pw_buffer->requested != 0) {
        size = std::min<size_t>(pw_buffer->requested * stride, size);
    }
    const auto dst = std::span{std::bit_cast<std::byte*>(data.data), size};
    track_render_size(self, size);

    auto copied = 0uz;
    if(self.mode == Mode::Play) {
        auto [lock, single] = self.single.access();
        copied              = std::min(size, single.play.size() - single.play_cursor);
        std::memcpy(dst.data(), single.play.data() + single.play_cursor, copied);
        single.play_cursor += copied;
    } else {
        auto [lock, rings] = self.rings.access();
        copied             = rings.playback.pop(dst);
        if(rings.streaming && copied < size) {
            self.underflows += 1;
        }
    }
    std::memset(dst.data() + copied, 0, size - copied);

    data.chunk->offset = 0;
    data.chunk->stride = stride;
    data.chunk->size   = size;
}

const auto capture_stream_events = pw_stream_events{
    .version       = PW_VERSION_STREAM_EVENTS,
    .param_changed = capture_on_param_changed,
    .process       = capture_on_process,
};

const auto playback_stream_events = pw_stream_events{
    .version       = PW_VERSION_STREAM_EVENTS,
    .param_changed = playback_on_param_changed,
    .process       = playback_on_process,
};

// stream setup
auto create_stream(Engine& self, const char* const name, const char* const category, const char* const target, const pw_stream_events& events, const spa_direction direction) -> AutoPWStream {
    constexpr auto error_value = nullptr;

    const auto props = pw_properties_new(
        PW_KEY_MEDIA_TYPE, "Audio",
        PW_KEY_MEDIA_CATEGORY, category,
        PW_KEY_MEDIA_ROLE, "Communication",
        PW_KEY_APP_NAME, "localtalk",
        NULL);
    ensure_v(props != NULL);
    pw_properties_setf(props, PW_KEY_NODE_LATENCY, "%u/%u", self.sample_rate / 100, self.sample_rate);
    if(target != nullptr) {
        pw_properties_set(props, PW_KEY_TARGET_OBJECT, target);
    }

    // takes ownership of props
    auto stream = AutoPWStream(pw_stream_new_simple(pw_thread_loop_get_loop(self.loop.get()), name, props, &events, &self));
    ensure_v(stream.get() != NULL);

    // "The POD start is always aligned to 8 bytes."
    alignas(8) auto pod_builder_buffer = std::array<std::byte, 1024>();
    auto            pod_builder        = spa_pod_builder{.data = pod_builder_buffer.data(), .size = pod_builder_buffer.size()};

    auto format   = spa_audio_info_raw{.format = SPA_AUDIO_FORMAT_S16_LE, .rate = self.sample_rate, .channels = self.channels};
    auto params   = std::array{spa_format_audio_raw_build(&pod_builder, SPA_PARAM_EnumFormat, &format)};
    const auto rc = pw_stream_connect(stream.get(),
                                      direction,
                                      PW_ID_ANY,
                                      pw_stream_flags(PW_STREAM_FLAG_AUTOCONNECT |
                                                      PW_STREAM_FLAG_MAP_BUFFERS |
                                                      PW_STREAM_FLAG_RT_PROCESS),
                                      (const spa_pod**)params.data(), params.size());
    ensure_v(rc == 0, "failed to connect {} stream rc={}", name, rc);
    return stream;
}

auto open_engine(const double sample_rate, const int channels) -> bool {
    ensure(sample_rate > 0 && channels > 0, "invalid format rate={} channels={}", sample_rate, channels);
    pw_init(NULL, NULL);
    auto opened = false;
    auto deinit = Cleaner{[&opened] {
        if(!opened) {
            pw_deinit();
        }
    }};

    auto self              = std::make_unique<Engine>();
    self->sample_rate      = uint32_t(sample_rate);
    self->channels         = uint32_t(channels);
    self->bypass           = std::getenv("VPIO_PW_NO_AEC") != nullptr;
    self->pacer.guard_mult = render_guard_mult();

    const auto source = self->bypass ? nullptr : env_or("VPIO_PW_SOURCE", default_source);
    const auto sink   = self->bypass ? nullptr : env_or("VPIO_PW_SINK", default_sink);

    self->loop.reset(pw_thread_loop_new("vpio-pipewire", NULL));
    ensure(self->loop.get() != NULL);

    self->capture_stream = create_stream(*self, "localtalk-capture", "Capture", source, capture_stream_events, SPA_DIRECTION_INPUT);
    ensure(self->capture_stream.get() != NULL);
    self->playback_stream = create_stream(*self, "localtalk-playback", "Playback", sink, playback_stream_events, SPA_DIRECTION_OUTPUT);
    ensure(self->playback_stream.get() != NULL);
    ensure(pw_thread_loop_start(self->loop.get()) == 0);

    LOG_INFO(logger, "streams up rate={} channels={} source={} sink={}",
             self->sample_rate, self->channels, source != nullptr ? source : "default", sink != nullptr ? sink : "default");
    opened   = true;
    instance = std::move(self);
    return true;
}

auto stop_pacer(Engine& self) -> void {
    if(!self.pacer.run.exchange(false)) {
        return;
    }
    self.pacer.thread.join();
}

auto close_engine() -> void {
    if(!instance) {
        return;
    }
    auto& self = *instance;
    stop_pacer(self);
    // the loop thread must be gone before the streams it drives
    pw_thread_loop_stop(self.loop.get());
    self.capture_stream.reset();
    self.playback_stream.reset();
    self.loop.reset();
    instance.reset();
    pw_deinit();
}

// paced playback
auto playback_level(Engine& self) -> size_t {
    return self.rings.access().second.playback.level();
}

auto staging_to_playback(Engine& self, const size_t bytes) -> size_t {
    auto [staging_lock, staging] = self.staging.access();
    auto [rings_lock, rings]     = self.rings.access();

    return staging.move_to(rings.playback, bytes);
}

auto pacer_main(Engine& self) -> void {
    const auto bytes_per_ms = self.bytes_per_ms();
    const auto slice_ms     = self.pacer.slice_ms.load();
    const auto slice        = std::chrono::milliseconds(slice_ms);
    const auto slice_bytes  = bytes_per_ms * slice_ms;

    auto prerolled = false;
    while(self.pacer.run) {
        // drained, treat the next audio as a new segment
        if(playback_level(self) == 0) {
            prerolled = false;
        }

        if(!prerolled) {
            const auto need = size_t(self.pacer.preroll_ms) * bytes_per_ms;
            const auto have = playback_level(self);
            if(have < need) {
                if(staging_to_playback(self, need - have) == 0) {
                    std::this_thread::sleep_for(slice);
                }
                continue;
            }
            prerolled = true;
            LOG_DEBUG(logger, "preroll satisfied at {}ms", self.pacer.preroll_ms.load());
            continue;
        }

        // keep headroom above what the render callback pulls at once
        const auto headroom = size_t(self.pacer.headroom_ms) * bytes_per_ms;
        const auto guard    = size_t(double(self.render_max) * self.pacer.guard_mult);
        const auto desired  = std::max(headroom, guard) + slice_bytes;
        if(const auto level = playback_level(self); level < desired) {
            if(staging_to_playback(self, desired - level) == 0) {
                std::this_thread::sleep_for(slice);
            }
        }

        staging_to_playback(self, slice_bytes);
        std::this_thread::sleep_for(slice);
    }
}

auto write_staging(Engine& self, const std::span<const std::byte> data) -> size_t {
    auto [lock, staging] = self.staging.access();
    staging.grow(data.size());
    return staging.push(data, false);
}
} // namespace

extern "C" {
auto vpio_init(const double sample_rate, const int channels) -> int {
    close_engine();
    return open_engine(sample_rate, channels) ? 0 : -1;
}

auto vpio_record(const double seconds) -> int {
    if(!instance) {
        return -1;
    }
    auto& self = *instance;
    self.single.access().second.capture.clear();
    self.mode = Mode::Record;
    for(auto elapsed = std::chrono::duration<double>(0); elapsed.count() < seconds; elapsed += wait_step) {
        std::this_thread::sleep_for(wait_step);
    }
    self.mode = Mode::Idle;
    return 0;
}

auto vpio_get_capture_size() -> size_t {
    if(!instance) {
        return 0;
    }
    return instance->single.access().second.capture.size();
}

auto vpio_copy_capture(void* const dst, const size_t maxlen) -> size_t {
    if(!instance || dst == nullptr) {
        return 0;
    }
    auto [lock, single] = instance->single.access();
    const auto len      = std::min(maxlen, single.capture.size());
    std::memcpy(dst, single.capture.data(), len);
    return len;
}

auto vpio_play(const void* const data, const size_t len) -> int {
    if(!instance || data == nullptr) {
        return -1;
    }
    auto& self = *instance;
    {
        const auto bytes    = std::span{std::bit_cast<const std::byte*>(data), len};
        auto [lock, single] = self.single.access();
        single.play.assign(bytes.begin(), bytes.end());
        single.play_cursor = 0;
    }
    self.mode = Mode::Play;

    // returns once rendered, or after the nominal duration
    const auto duration = std::chrono::duration<double>(double(len) / double(self.bytes_per_ms() * 1000));
    for(auto elapsed = std::chrono::duration<double>(0); elapsed < duration; elapsed += wait_step) {
        {
            auto [lock, single] = self.single.access();
            if(single.play_cursor >= single.play.size()) {
                break;
            }
        }
        std::this_thread::sleep_for(wait_step);
    }
    self.mode = Mode::Idle;
    return 0;
}

auto vpio_shutdown() -> void {
    close_engine();
}

auto vpio_start_stream(const double sample_rate, const int channels, size_t ring_capacity_bytes) -> int {
    if(const auto rc = vpio_init(sample_rate, channels); rc != 0) {
        return rc;
    }
    auto& self = *instance;
    // at least one second
    ring_capacity_bytes = std::max(ring_capacity_bytes, self.bytes_per_ms() * 1000);
    {
        auto [lock, rings] = self.rings.access();
        rings.capture.reset(ring_capacity_bytes);
        rings.playback.reset(ring_capacity_bytes);
        rings.streaming = true;
    }
    self.staging.access().second.reset(ring_capacity_bytes);
    LOG_INFO(logger, "streaming rings ready capacity={} bytes", ring_capacity_bytes);
    return 0;
}

auto vpio_stop_stream() -> void {
    if(!instance) {
        return;
    }
    auto& self = *instance;
    stop_pacer(self);
    {
        auto [lock, rings] = self.rings.access();
        rings.streaming    = false;
        rings.capture.reset(0);
        rings.playback.reset(0);
    }
    self.staging.access().second.reset(0);
}

auto vpio_read_capture(void* const dst, const size_t maxlen) -> size_t {
    if(!instance || dst == nullptr) {
        return 0;
    }
    return instance->rings.access().second.capture.pop({std::bit_cast<std::byte*>(dst), maxlen});
}

auto vpio_write_playback(const void* const src, const size_t len) -> size_t {
    if(!instance || src == nullptr) {
        return 0;
    }
    return instance->rings.access().second.playback.push({std::bit_cast<const std::byte*>(src), len}, true);
}

auto vpio_write_frame_10ms(const void* const data, const size_t len) -> size_t {
    if(!instance || data == nullptr) {
        return 0;
    }
    return write_staging(*instance, {std::bit_cast<const std::byte*>(data), len});
}

auto vpio_start_playback_thread(int slice_ms, int preroll_ms) -> int {
    if(!instance) {
        return -1;
    }
    auto& self = *instance;
    if(self.pacer.run) {
        return 0;
    }
    self.pacer.slice_ms   = slice_ms > 0 ? slice_ms : 5;
    self.pacer.preroll_ms = std::max(preroll_ms, 0);
    self.pacer.run        = true;
    try {
        self.pacer.thread = std::thread(pacer_main, std::ref(self));
    } catch(const std::system_error& e) {
        self.pacer.run = false;
        LOG_ERROR(logger, "failed to create pacer thread: {}", e.what());
        return -1;
    }
    LOG_INFO(logger, "pacer thread started slice={}ms preroll={}ms headroom={}ms guard={:.2f}",
             self.pacer.slice_ms.load(), self.pacer.preroll_ms.load(), self.pacer.headroom_ms.load(), self.pacer.guard_mult);
    return 0;
}

auto vpio_stop_playback_thread() -> void {
    if(!instance) {
        return;
    }
    stop_pacer(*instance);
}

auto vpio_set_target_headroom_ms(const int ms) -> void {
    if(!instance) {
        return;
    }
    instance->pacer.headroom_ms = std::max(ms, 0);
}

auto vpio_flush_playback() -> void {
    if(!instance) {
        return;
    }
    instance->rings.access().second.playback.clear();
}

auto vpio_flush_input() -> void {
    if(!instance) {
        return;
    }
    instance->staging.access().second.clear();
}

auto vpio_reset_capture() -> size_t {
    if(!instance) {
        return 0;
    }
    instance->single.access().second.capture.clear();
    return 0;
}

auto vpio_get_bypass(unsigned int* const bypass) -> int {
    if(!instance || bypass == nullptr) {
        return -1;
    }
    *bypass = instance->bypass ? 1 : 0;
    return 0;
}

auto vpio_get_in_sample_rate() -> double {
    if(!instance) {
        return 0;
    }
    return instance->in_rate;
}

auto vpio_get_out_sample_rate() -> double {
    if(!instance) {
        return 0;
    }
    return instance->out_rate;
}

auto vpio_get_ring_levels(size_t* const cap_level, size_t* const play_level) -> size_t {
    auto capture  = 0uz;
    auto playback = 0uz;
    if(instance) {
        auto [lock, rings] = instance->rings.access();
        capture            = rings.capture.level();
        playback           = rings.playback.level();
    }
    if(cap_level != nullptr) {
        *cap_level = capture;
    }
    if(play_level != nullptr) {
        *play_level = playback;
    }
    return capture + playback;
}

auto vpio_get_underflow_count() -> size_t {
    return instance ? instance->underflows.load() : 0;
}

auto vpio_reset_underflow_count() -> void {
    if(instance) {
        instance->underflows = 0;
    }
}

auto vpio_get_staging_level() -> size_t {
    return instance ? instance->staging.access().second.level() : 0;
}

auto vpio_get_staging_capacity() -> size_t {
    return instance ? instance->staging.access().second.capacity() : 0;
}
}
