/*****************************************************************************
BSD 3-Clause License

Copyright (c) 2025, 🍀☀🌕🌥 🌊
All rights reserved.
*****************************************************************************/


#include "quicwire/config/codec_config.h"
#include <gtest/gtest.h>

namespace config = quicwire::config;
namespace integration = quicwire::integration;

/**
 * @file codec_config_test.cpp
 * @brief Unit tests for codec_config defaults, presets and validation
 */

// ============================================================================
// Default and Preset Tests
// ============================================================================

TEST(CodecConfigTest, DefaultsAreValid)
{
	config::codec_config cfg;

	EXPECT_EQ(cfg.short_header_dcid_length, 8);
	EXPECT_EQ(cfg.packet_number_length, 4);
	EXPECT_EQ(cfg.initial_frame_capacity, 0);
	EXPECT_EQ(cfg.max_datagram_size, 1500);
	EXPECT_EQ(cfg.logger.min_level, integration::log_level::info);
	EXPECT_TRUE(cfg.validate().is_ok());
}

TEST(CodecConfigTest, PresetsAreValid)
{
	auto dev = config::codec_config::development();
	auto prod = config::codec_config::production();
	auto test = config::codec_config::testing();

	EXPECT_EQ(dev.logger.min_level, integration::log_level::debug);
	EXPECT_EQ(prod.initial_frame_capacity, 4);
	EXPECT_EQ(test.max_datagram_size, config::codec_config::min_datagram_size);
	EXPECT_EQ(test.logger.min_level, integration::log_level::warn);

	EXPECT_TRUE(dev.validate().is_ok());
	EXPECT_TRUE(prod.validate().is_ok());
	EXPECT_TRUE(test.validate().is_ok());
}

// ============================================================================
// Validation Tests
// ============================================================================

TEST(CodecConfigValidateTest, RejectsLongConnectionId)
{
	config::codec_config cfg;
	cfg.short_header_dcid_length = 20;
	EXPECT_TRUE(cfg.validate().is_ok());

	cfg.short_header_dcid_length = 21;
	auto result = cfg.validate();

	ASSERT_TRUE(result.is_err());
	EXPECT_EQ(result.error().code, quicwire::error_codes::common_errors::invalid_argument);
}

TEST(CodecConfigValidateTest, RejectsPacketNumberLength)
{
	config::codec_config cfg;

	cfg.packet_number_length = 0;
	EXPECT_TRUE(cfg.validate().is_err());

	cfg.packet_number_length = 5;
	EXPECT_TRUE(cfg.validate().is_err());

	cfg.packet_number_length = 1;
	EXPECT_TRUE(cfg.validate().is_ok());
}

TEST(CodecConfigValidateTest, RejectsDatagramSizeOutsideUdpLimits)
{
	config::codec_config cfg;

	cfg.max_datagram_size = 1199;
	EXPECT_TRUE(cfg.validate().is_err());

	cfg.max_datagram_size = 65528;
	EXPECT_TRUE(cfg.validate().is_err());

	cfg.max_datagram_size = 65527;
	EXPECT_TRUE(cfg.validate().is_ok());
}
