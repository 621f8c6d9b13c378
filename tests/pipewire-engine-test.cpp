#include <cstdlib>

#include <gtest/gtest.h>

#include "vpio.hpp"

namespace {
class PipeWireEngineTest : public ::testing::Test {
  protected:
    auto SetUp() -> void override {
        // no daemon listens on this name, stream creation fails
        setenv("PIPEWIRE_REMOTE", "localtalk-test-no-such-remote", 1);
    }

    auto TearDown() -> void override {
        unsetenv("PIPEWIRE_REMOTE");
    }
};

TEST_F(PipeWireEngineTest, FailedInitCanBeRetried) {
    auto engine = vpio::bind(LOCALTALK_ENGINE_PATH);
    ASSERT_TRUE(engine.has_value());
    const auto& fn = engine->fn;
    for(auto i = 0; i < 3; i += 1) {
        EXPECT_NE(fn.init(16000, 1), 0);
        EXPECT_EQ(fn.get_capture_size(), 0u);
        EXPECT_NE(fn.record(0.01), 0);
    }
    fn.shutdown();
}

TEST_F(PipeWireEngineTest, InvalidFormatIsRejected) {
    auto engine = vpio::bind(LOCALTALK_ENGINE_PATH);
    ASSERT_TRUE(engine.has_value());
    EXPECT_NE(engine->fn.init(0, 1), 0);
    EXPECT_NE(engine->fn.init(16000, 0), 0);
    engine->fn.shutdown();
}
} // namespace
