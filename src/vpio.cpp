#include <bit>
#include <cstdlib>

#include "config.hpp"
#include "macros/logger.hpp"
#include "vpio.hpp"

#define CUTIL_MACROS_PRINT_FUNC(...) LOG_ERROR(logger, __VA_ARGS__)
#include "macros/coop-unwrap.hpp"

namespace vpio {
namespace {
auto logger = Logger("LOCALTALK_VPIO");

template <class F>
auto resolve(const SymbolResolver& resolver, const char* const name, F& out) -> bool {
    out = std::bit_cast<F>(resolver(name));
    return out != nullptr;
}

auto resolve_required(const SymbolResolver& resolver, Functions& fn) -> bool {
    ensure(resolve(resolver, "vpio_init", fn.init), "missing vpio_init");
    ensure(resolve(resolver, "vpio_record", fn.record), "missing vpio_record");
    ensure(resolve(resolver, "vpio_get_capture_size", fn.get_capture_size), "missing vpio_get_capture_size");
    ensure(resolve(resolver, "vpio_copy_capture", fn.copy_capture), "missing vpio_copy_capture");
    ensure(resolve(resolver, "vpio_play", fn.play), "missing vpio_play");
    ensure(resolve(resolver, "vpio_shutdown", fn.shutdown), "missing vpio_shutdown");
    return true;
}

// every group is probed on its own, an absent symbol only clears its flag
auto probe_optional(const SymbolResolver& resolver, Functions& fn) -> Capabilities {
    auto caps = Capabilities();

    caps.streaming = resolve(resolver, "vpio_start_stream", fn.start_stream);
    resolve(resolver, "vpio_stop_stream", fn.stop_stream);
    caps.capture_read   = resolve(resolver, "vpio_read_capture", fn.read_capture);
    caps.playback_write = resolve(resolver, "vpio_write_playback", fn.write_playback);

    caps.frame_write    = resolve(resolver, "vpio_write_frame_10ms", fn.write_frame_10ms);
    caps.paced_playback = resolve(resolver, "vpio_start_playback_thread", fn.start_playback_thread) &&
                          resolve(resolver, "vpio_stop_playback_thread", fn.stop_playback_thread) &&
                          resolve(resolver, "vpio_set_target_headroom_ms", fn.set_target_headroom_ms);

    caps.flush         = resolve(resolver, "vpio_flush_playback", fn.flush_playback);
    caps.flush_input   = resolve(resolver, "vpio_flush_input", fn.flush_input);
    caps.reset_capture = resolve(resolver, "vpio_reset_capture", fn.reset_capture);

    caps.debug = resolve(resolver, "vpio_get_bypass", fn.get_bypass) &&
                 resolve(resolver, "vpio_get_in_sample_rate", fn.get_in_sample_rate) &&
                 resolve(resolver, "vpio_get_out_sample_rate", fn.get_out_sample_rate) &&
                 resolve(resolver, "vpio_get_ring_levels", fn.get_ring_levels) &&
                 resolve(resolver, "vpio_get_underflow_count", fn.get_underflow_count) &&
                 resolve(resolver, "vpio_reset_underflow_count", fn.reset_underflow_count);
    caps.staging_debug = resolve(resolver, "vpio_get_staging_level", fn.get_staging_level) &&
                         resolve(resolver, "vpio_get_staging_capacity", fn.get_staging_capacity);
    return caps;
}

auto yes_no(const bool value) -> const char* {
    return value ? "yes" : "no";
}
} // namespace

auto Engine::start_stream(const uint32_t sample_rate, const uint32_t channels, const size_t capacity_bytes) -> bool {
    if(caps.streaming) {
        const auto rc = fn.start_stream(sample_rate, channels, capacity_bytes);
        ensure(rc == 0, "vpio_start_stream failed rc={}", rc);
    } else {
        const auto rc = fn.init(sample_rate, channels);
        ensure(rc == 0, "vpio_init failed rc={}", rc);
    }
    return true;
}

auto Engine::stop_stream() -> void {
    if(fn.stop_stream != nullptr) {
        fn.stop_stream();
    }
    fn.shutdown();
}

auto Engine::read_debug() const -> std::optional<DebugInfo> {
    if(!caps.debug) {
        return std::nullopt;
    }
    auto info            = DebugInfo();
    info.bypass_status   = fn.get_bypass(&info.bypass);
    info.in_sample_rate  = fn.get_in_sample_rate();
    info.out_sample_rate = fn.get_out_sample_rate();
    fn.get_ring_levels(&info.capture_level, &info.playback_level);
    info.underflows = fn.get_underflow_count();
    if(caps.staging_debug) {
        info.staging_level    = fn.get_staging_level();
        info.staging_capacity = fn.get_staging_capacity();
    }
    return info;
}

auto default_library_path() -> std::string {
    if(const auto env = std::getenv(config::library_env); env != nullptr && env[0] != '\0') {
        return env;
    }
    return config::default_library;
}

auto bind_symbols(const SymbolResolver& resolver) -> std::optional<Engine> {
    auto engine = Engine();
    ensure(resolve_required(resolver, engine.fn));
    engine.caps = probe_optional(resolver, engine.fn);
    return engine;
}

auto bind(const char* const path) -> std::optional<Engine> {
    auto handle = AutoDLHandle(dlopen(path, RTLD_NOW | RTLD_LOCAL));
    if(!handle) {
        const auto error = dlerror();
        bail("failed to load engine library {}: {}", path, error != nullptr ? error : "unknown error");
    }
    const auto raw = handle.get();
    unwrap_mut(engine, bind_symbols([raw](const char* const name) { return dlsym(raw, name); }));
    engine.handle = std::move(handle);
    engine.path   = path;

    const auto& caps = engine.caps;
    LOG_INFO(logger, "loaded engine {} (streaming={} paced={} flush={} debug={})",
             engine.path, yes_no(caps.streaming), yes_no(caps.paced_playback && caps.frame_write), yes_no(caps.flush), yes_no(caps.debug));
    return std::move(engine);
}
} // namespace vpio
