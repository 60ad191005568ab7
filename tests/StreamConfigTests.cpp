// StreamConfigTests.cpp
// Startup configuration validation.

#include <gtest/gtest.h>
#include "config.hpp"

class StreamConfigTest : public ::testing::Test {
protected:
    void SetUp() override { config_ = default_stream_config(); }

    StreamConfig config_;
};

TEST_F(StreamConfigTest, DefaultsAreValid) {
    EXPECT_TRUE(validate_stream_config(config_));
    EXPECT_EQ(config_.data_pin, 9u);
    EXPECT_EQ(config_.bck_pin, 10u);
    EXPECT_EQ(config_.lrck_pin, 11u);
    EXPECT_EQ(config_.sample_rate, SampleRate::Freq192kHz);
    EXPECT_TRUE(config_.is_24bit);
}

TEST_F(StreamConfigTest, AmplitudeNeedsHeadroom) {
    config_.amplitude = FULL_SCALE_24BIT;
    EXPECT_FALSE(validate_stream_config(config_));

    config_.amplitude = FULL_SCALE_24BIT - 1;
    EXPECT_TRUE(validate_stream_config(config_));
}

TEST_F(StreamConfigTest, AmplitudeMustBePositive) {
    config_.amplitude = 0;
    EXPECT_FALSE(validate_stream_config(config_));
    config_.amplitude = -5;
    EXPECT_FALSE(validate_stream_config(config_));
}

TEST_F(StreamConfigTest, ThirtyTwoBitModeWidensCeiling) {
    config_.is_24bit = false;
    config_.amplitude = 0x40000000;
    EXPECT_EQ(full_scale_for(config_), FULL_SCALE_32BIT);
    EXPECT_TRUE(validate_stream_config(config_));
}

TEST_F(StreamConfigTest, TableSizeBounds) {
    config_.table_size = 0;
    EXPECT_FALSE(validate_stream_config(config_));
    config_.table_size = MAX_TABLE_SIZE + 1;
    EXPECT_FALSE(validate_stream_config(config_));
    config_.table_size = MAX_TABLE_SIZE;
    EXPECT_TRUE(validate_stream_config(config_));
}

TEST_F(StreamConfigTest, PinsMustBeDistinct) {
    config_.lrck_pin = config_.bck_pin;
    EXPECT_FALSE(validate_stream_config(config_));
}

TEST_F(StreamConfigTest, PinsMustExist) {
    config_.led_pin = MAX_GPIO_COUNT;
    EXPECT_FALSE(validate_stream_config(config_));
}

TEST_F(StreamConfigTest, OnlyTwoPioBlocks) {
    config_.pio_index = 1;
    EXPECT_TRUE(validate_stream_config(config_));
    config_.pio_index = 2;
    EXPECT_FALSE(validate_stream_config(config_));
}

TEST_F(StreamConfigTest, BaseClockMustBePositive) {
    config_.base_clock_hz = 0.0f;
    EXPECT_FALSE(validate_stream_config(config_));
}
