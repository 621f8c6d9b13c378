#include <cmath>
#include <numbers>
#include <print>

#include <coop/promise.hpp>
#include <coop/runner.hpp>
#include <coop/task-handle.hpp>
#include <coop/timer.hpp>

#include "config.hpp"
#include "macros/logger.hpp"
#include "transport.hpp"
#include "util/argument-parser.hpp"
#include "util/cleaner.hpp"

#define CUTIL_MACROS_PRINT_FUNC(...) LOG_ERROR(logger, __VA_ARGS__)
#include "macros/coop-unwrap.hpp"

namespace {
auto logger = Logger("LOCALTALK");

auto library_path = "";
auto sample_rate  = uint32_t(config::default_sample_rate);
auto seconds      = uint32_t(10);
auto tone_hz      = uint32_t(440);
auto no_capture   = false;
auto no_playback  = false;
auto debug        = false;

// fills one output chunk with a sine wave, continuing from phase
auto render_tone(const size_t bytes, const uint32_t rate, double& phase) -> std::vector<std::byte> {
    auto       data = std::vector<std::byte>(bytes);
    const auto step = 2 * std::numbers::pi * tone_hz / rate;
    for(auto i = 0uz; i + 1 < bytes; i += config::bytes_per_sample) {
        const auto sample = int16_t(std::sin(phase) * 8000);
        data[i]           = std::byte(uint16_t(sample) & 0xff);
        data[i + 1]       = std::byte(uint16_t(sample) >> 8);
        phase             = std::fmod(phase + step, 2 * std::numbers::pi);
    }
    return data;
}

auto tone_main(transport::Playback& output) -> coop::Async<void> {
    const auto bytes    = output.chunk_bytes();
    const auto interval = std::chrono::milliseconds(config::native_frame_ms * output.params->audio_out_10ms_chunks);
    auto       phase    = 0.0;
loop:
    output.write_audio_frame({.data = render_tone(bytes, output.sample_rate, phase), .sample_rate = output.sample_rate, .channels = 1});
    co_await coop::sleep(interval);
    goto loop;
}

auto async_main() -> coop::Async<bool> {
    const auto path = library_path[0] != '\0' ? std::string(library_path) : vpio::default_library_path();
    coop_unwrap_mut(engine, vpio::bind(path.c_str()));

    auto session = transport::LocalTransport();
    coop_ensure(session.init(std::move(engine),
                               {
                                   .audio_in_enabled      = !no_capture,
                                   .audio_out_enabled     = !no_playback,
                                   .audio_in_sample_rate  = sample_rate,
                                   .audio_out_sample_rate = sample_rate,
                                   .debug                 = debug,
                               }));
    auto cleaner = Cleaner{[&] { session.cleanup(); }};

    session.on_client_connected.add([] { LOG_INFO(logger, "session connected"); });
    session.on_client_disconnected.add([] { LOG_INFO(logger, "session disconnected"); });

    auto frames = 0uz;
    if(!no_capture) {
        auto& input = session.input();
        if(!no_playback) {
            auto& output   = session.output();
            input.on_frame = [&output, &frames](AudioFrame frame) -> coop::Async<bool> {
                frames += 1;
                co_return output.write_audio_frame(std::move(frame));
            };
        } else {
            input.on_frame = [&frames](AudioFrame /*frame*/) -> coop::Async<bool> {
                frames += 1;
                co_return true;
            };
        }
        coop_ensure(co_await input.start());
    }

    auto tone_task = coop::TaskHandle();
    auto tone_on   = false;
    if(!no_playback) {
        auto& output = session.output();
        coop_ensure(co_await output.start());
        LOG_INFO(logger, "playback pacing: {}", transport::to_string(output.mode));
        if(no_capture) {
            (co_await coop::reveal_runner())->push_task(tone_main(output), &tone_task);
            tone_on = true;
        }
    }

    LOG_INFO(logger, "running for {}s", seconds);
    co_await coop::sleep(std::chrono::seconds(seconds));

    if(tone_on) {
        tone_task.cancel();
    }
    if(session.capture) {
        session.capture->stop();
    }
    if(session.playback) {
        session.playback->stop();
    }
    LOG_INFO(logger, "done, {} capture frames looped back", frames);
    co_return true;
}
} // namespace

auto main(const int argc, const char* const* argv) -> int {
    {
        auto parser = args::Parser<uint32_t>();
        auto help   = false;
        parser.kwarg(&library_path, {"-l", "--library"}, "PATH", "engine library (default: $VPIO_LIB or ./libvpio-pipewire.so)", {.state = args::State::DefaultValue});
        parser.kwarg(&sample_rate, {"-r", "--rate"}, "HZ", "sample rate", {.state = args::State::DefaultValue});
        parser.kwarg(&seconds, {"-t", "--time"}, "SECONDS", "duration of the session", {.state = args::State::DefaultValue});
        parser.kwarg(&tone_hz, {"-f", "--tone"}, "HZ", "test tone frequency when capture is disabled", {.state = args::State::DefaultValue});
        parser.kwflag(&no_capture, {"-nc", "--no-capture"}, "disable the capture side, play a test tone instead", {});
        parser.kwflag(&no_playback, {"-np", "--no-playback"}, "disable the playback side", {});
        parser.kwflag(&debug, {"-d", "--debug"}, "log engine and pacer metrics every second", {});
        parser.kwflag(&help, {"-h", "--help"}, "print this help message", {.no_error_check = true});
        if(!parser.parse(argc, argv) || help) {
            std::println("usage: localtalk-loopback {}", parser.get_help());
            return 0;
        }
    }
    auto runner = coop::Runner();
    runner.push_task(async_main());
    runner.run();
    return 0;
}
