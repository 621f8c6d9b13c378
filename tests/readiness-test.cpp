#include <gtest/gtest.h>

#include "readiness.hpp"

namespace {
using transport::Readiness;
using transport::ReadinessEvent;
using transport::ReadinessPhase;
using transport::Side;

auto both() -> Readiness {
    auto readiness = Readiness();
    readiness.required.insert(Side::Capture);
    readiness.required.insert(Side::Playback);
    return readiness;
}

TEST(ReadinessTest, ConnectsOnceBothSidesAreReady) {
    for(const auto [first, second] : {std::pair{Side::Capture, Side::Playback}, std::pair{Side::Playback, Side::Capture}}) {
        auto readiness = both();
        EXPECT_EQ(readiness.on_ready(first), ReadinessEvent::None);
        EXPECT_EQ(readiness.phase(), ReadinessPhase::PartiallyReady);
        EXPECT_EQ(readiness.on_ready(second), ReadinessEvent::Connected);
        EXPECT_EQ(readiness.phase(), ReadinessPhase::Connected);
        // repeated readiness does not reconnect
        EXPECT_EQ(readiness.on_ready(first), ReadinessEvent::None);
    }
}

TEST(ReadinessTest, DisconnectsOncePerSession) {
    auto readiness = both();
    readiness.on_ready(Side::Capture);
    readiness.on_ready(Side::Playback);
    EXPECT_EQ(readiness.on_stopped(Side::Playback), ReadinessEvent::Disconnected);
    EXPECT_EQ(readiness.phase(), ReadinessPhase::Idle);
    EXPECT_EQ(readiness.on_stopped(Side::Capture), ReadinessEvent::None);
    EXPECT_EQ(readiness.on_stopped(Side::Capture), ReadinessEvent::None);
}

TEST(ReadinessTest, StoppingBeforeConnectEmitsNothing) {
    auto readiness = both();
    readiness.on_ready(Side::Capture);
    EXPECT_EQ(readiness.on_stopped(Side::Capture), ReadinessEvent::None);
    EXPECT_EQ(readiness.phase(), ReadinessPhase::Idle);
    EXPECT_EQ(readiness.on_ready(Side::Playback), ReadinessEvent::None);
}

TEST(ReadinessTest, NewSessionAfterDisconnect) {
    auto readiness = both();
    readiness.on_ready(Side::Capture);
    readiness.on_ready(Side::Playback);
    readiness.on_stopped(Side::Capture);

    // the surviving playback side does not count towards the next session
    EXPECT_EQ(readiness.on_ready(Side::Capture), ReadinessEvent::None);
    EXPECT_FALSE(readiness.connected_emitted);
    EXPECT_FALSE(readiness.disconnected_emitted);
    EXPECT_EQ(readiness.on_ready(Side::Playback), ReadinessEvent::Connected);
    EXPECT_EQ(readiness.on_stopped(Side::Playback), ReadinessEvent::Disconnected);
}

TEST(ReadinessTest, SingleRequiredSide) {
    auto readiness = Readiness();
    readiness.required.insert(Side::Playback);
    EXPECT_EQ(readiness.on_ready(Side::Capture), ReadinessEvent::None);
    EXPECT_EQ(readiness.on_ready(Side::Playback), ReadinessEvent::Connected);
    EXPECT_EQ(readiness.on_stopped(Side::Capture), ReadinessEvent::None);
    EXPECT_EQ(readiness.on_stopped(Side::Playback), ReadinessEvent::Disconnected);
}

TEST(ReadinessTest, NoRequiredSidesNeverEmits) {
    auto readiness = Readiness();
    EXPECT_EQ(readiness.on_ready(Side::Capture), ReadinessEvent::None);
    EXPECT_EQ(readiness.on_ready(Side::Playback), ReadinessEvent::None);
    EXPECT_EQ(readiness.on_stopped(Side::Capture), ReadinessEvent::None);
    EXPECT_EQ(readiness.on_stopped(Side::Playback), ReadinessEvent::None);
}
} // namespace
