/*****************************************************************************
BSD 3-Clause License

Copyright (c) 2025, 🍀☀🌕🌥 🌊
All rights reserved.
*****************************************************************************/


#include "quicwire/protocols/quic/varint.h"
#include <gtest/gtest.h>

#include <array>
#include <vector>

using namespace quicwire;
using namespace quicwire::protocols::quic;

/**
 * @file quic_varint_test.cpp
 * @brief Unit tests for QUIC variable-length integers (RFC 9000 Section 16)
 */

// ============================================================================
// constexpr helpers
// ============================================================================

class VarintHelpersTest : public ::testing::Test
{
};

TEST_F(VarintHelpersTest, EncodedLengthBoundaries)
{
	EXPECT_EQ(varint::encoded_length(0), 1);
	EXPECT_EQ(varint::encoded_length(63), 1);
	EXPECT_EQ(varint::encoded_length(64), 2);
	EXPECT_EQ(varint::encoded_length(16383), 2);
	EXPECT_EQ(varint::encoded_length(16384), 4);
	EXPECT_EQ(varint::encoded_length(1073741823), 4);
	EXPECT_EQ(varint::encoded_length(1073741824), 8);
	EXPECT_EQ(varint::encoded_length(varint_max), 8);
}

TEST_F(VarintHelpersTest, LengthFromPrefix)
{
	EXPECT_EQ(varint::length_from_prefix(0x3F), 1);
	EXPECT_EQ(varint::length_from_prefix(0x40), 2);
	EXPECT_EQ(varint::length_from_prefix(0xBF), 4);
	EXPECT_EQ(varint::length_from_prefix(0xC0), 8);
}

TEST_F(VarintHelpersTest, IsValid)
{
	EXPECT_TRUE(varint::is_valid(0));
	EXPECT_TRUE(varint::is_valid(varint_max));
	EXPECT_FALSE(varint::is_valid(varint_max + 1));
	EXPECT_FALSE(varint::is_valid(UINT64_MAX));
}

TEST_F(VarintHelpersTest, AreConstexpr)
{
	static_assert(varint::encoded_length(42) == 1, "encoded_length should be constexpr");
	static_assert(varint::length_from_prefix(0x80) == 4, "length_from_prefix should be constexpr");
	static_assert(varint::is_valid(42), "is_valid should be constexpr");
	SUCCEED();
}

// ============================================================================
// Encode Tests
// ============================================================================

class VarintEncodeTest : public ::testing::Test
{
protected:
	std::array<uint8_t, 8> buffer_{};
};

TEST_F(VarintEncodeTest, SmallValuesAreSingleBytes)
{
	auto zero = varint::encode(0, buffer_);
	ASSERT_TRUE(zero.is_ok());
	EXPECT_EQ(zero.value(), 1);
	EXPECT_EQ(buffer_[0], 0x00);

	auto twenty_five = varint::encode(25, buffer_);
	ASSERT_TRUE(twenty_five.is_ok());
	EXPECT_EQ(buffer_[0], 0x19);

	auto sixty_three = varint::encode(63, buffer_);
	ASSERT_TRUE(sixty_three.is_ok());
	EXPECT_EQ(buffer_[0], 0x3F);
}

TEST_F(VarintEncodeTest, ClassBoundaries)
{
	EXPECT_EQ(varint::encode(63, buffer_).value(), 1);
	EXPECT_EQ(varint::encode(64, buffer_).value(), 2);
	EXPECT_EQ(varint::encode(16383, buffer_).value(), 2);
	EXPECT_EQ(varint::encode(16384, buffer_).value(), 4);
	EXPECT_EQ(varint::encode(1073741823, buffer_).value(), 4);
	EXPECT_EQ(varint::encode(1073741824, buffer_).value(), 8);
}

TEST_F(VarintEncodeTest, RfcSampleEncodings)
{
	// RFC 9000 Appendix A.1
	auto two = varint::encode(15293);
	ASSERT_TRUE(two.is_ok());
	EXPECT_EQ(two.value(), (std::vector<uint8_t>{0x7b, 0xbd}));

	auto four = varint::encode(494878333);
	ASSERT_TRUE(four.is_ok());
	EXPECT_EQ(four.value(), (std::vector<uint8_t>{0x9d, 0x7f, 0x3e, 0x7d}));

	auto eight = varint::encode(151288809941952652ULL);
	ASSERT_TRUE(eight.is_ok());
	EXPECT_EQ(eight.value(),
	          (std::vector<uint8_t>{0xc2, 0x19, 0x7c, 0x5e, 0xff, 0x14, 0xe8, 0x8c}));
}

TEST_F(VarintEncodeTest, WritesOnlyReportedBytes)
{
	buffer_.fill(0xAA);

	auto written = varint::encode(64, buffer_);

	ASSERT_TRUE(written.is_ok());
	EXPECT_EQ(written.value(), 2);
	EXPECT_EQ(buffer_[2], 0xAA);
	EXPECT_EQ(buffer_[7], 0xAA);
}

TEST_F(VarintEncodeTest, ValueAboveMaximumIsOutOfRange)
{
	auto result = varint::encode(varint_max + 1, buffer_);

	ASSERT_TRUE(result.is_err());
	EXPECT_EQ(result.error().code, error_codes::codec::value_out_of_range);
}

TEST_F(VarintEncodeTest, ShortBufferIsTooSmallForEveryClass)
{
	const std::array<uint64_t, 4> values = {63, 16383, 1073741823, varint_max};

	for (auto value : values)
	{
		const size_t needed = varint::encoded_length(value);
		std::vector<uint8_t> short_buffer(needed - 1);

		auto result = varint::encode(value, short_buffer);

		ASSERT_TRUE(result.is_err()) << "value=" << value;
		EXPECT_EQ(result.error().code, error_codes::codec::buffer_too_small);
	}
}

TEST_F(VarintEncodeTest, RoundTripAcrossClasses)
{
	const std::vector<uint64_t> values = {0, 1, 63, 64, 255, 16383, 16384,
	                                      1000000, 1073741823, 1073741824, varint_max};

	for (auto value : values)
	{
		auto written = varint::encode(value, buffer_);
		ASSERT_TRUE(written.is_ok()) << "value=" << value;

		auto decoded = varint::decode(std::span<const uint8_t>(buffer_.data(), written.value()));
		ASSERT_TRUE(decoded.is_ok()) << "value=" << value;
		EXPECT_EQ(decoded.value().first, value);
		EXPECT_EQ(decoded.value().second, written.value());
	}
}

// ============================================================================
// encode_with_length() Tests
// ============================================================================

class VarintEncodeWithLengthTest : public ::testing::Test
{
protected:
	std::array<uint8_t, 8> buffer_{};
};

TEST_F(VarintEncodeWithLengthTest, ForcedWidthDecodesToSameValue)
{
	for (size_t length : {1u, 2u, 4u, 8u})
	{
		auto written = varint::encode_with_length(42, length, buffer_);
		ASSERT_TRUE(written.is_ok()) << "length=" << length;
		EXPECT_EQ(written.value(), length);

		auto decoded = varint::decode(buffer_);
		ASSERT_TRUE(decoded.is_ok());
		EXPECT_EQ(decoded.value().first, 42);
		EXPECT_EQ(decoded.value().second, length);
	}
}

TEST_F(VarintEncodeWithLengthTest, InvalidWidthIsInvalidArgument)
{
	auto result = varint::encode_with_length(42, 3, buffer_);

	ASSERT_TRUE(result.is_err());
	EXPECT_EQ(result.error().code, error_codes::common_errors::invalid_argument);
}

TEST_F(VarintEncodeWithLengthTest, ValueTooWideForLengthIsOutOfRange)
{
	auto result = varint::encode_with_length(100, 1, buffer_);

	ASSERT_TRUE(result.is_err());
	EXPECT_EQ(result.error().code, error_codes::codec::value_out_of_range);
}

TEST_F(VarintEncodeWithLengthTest, ShortBufferIsTooSmall)
{
	std::array<uint8_t, 1> small{};

	auto result = varint::encode_with_length(1, 2, small);

	ASSERT_TRUE(result.is_err());
	EXPECT_EQ(result.error().code, error_codes::codec::buffer_too_small);
}

// ============================================================================
// Decode Tests
// ============================================================================

class VarintDecodeTest : public ::testing::Test
{
};

TEST_F(VarintDecodeTest, RfcSampleDecodings)
{
	// RFC 9000 Appendix A.1
	const std::vector<uint8_t> eight = {0xc2, 0x19, 0x7c, 0x5e, 0xff, 0x14, 0xe8, 0x8c};
	auto decoded = varint::decode(eight);
	ASSERT_TRUE(decoded.is_ok());
	EXPECT_EQ(decoded.value().first, 151288809941952652ULL);
	EXPECT_EQ(decoded.value().second, 8);

	const std::vector<uint8_t> one = {0x25};
	EXPECT_EQ(varint::decode(one).value().first, 37);
}

TEST_F(VarintDecodeTest, AcceptsNonCanonicalEncoding)
{
	// 37 as a two-byte varint
	const std::vector<uint8_t> data = {0x40, 0x25};

	auto decoded = varint::decode(data);

	ASSERT_TRUE(decoded.is_ok());
	EXPECT_EQ(decoded.value().first, 37);
	EXPECT_EQ(decoded.value().second, 2);
}

TEST_F(VarintDecodeTest, IgnoresTrailingBytes)
{
	const std::vector<uint8_t> data = {0x19, 0xFF, 0xFF};

	auto decoded = varint::decode(data);

	ASSERT_TRUE(decoded.is_ok());
	EXPECT_EQ(decoded.value().first, 25);
	EXPECT_EQ(decoded.value().second, 1);
}

TEST_F(VarintDecodeTest, EmptyInputIsTooSmall)
{
	std::vector<uint8_t> empty;

	auto result = varint::decode(empty);

	ASSERT_TRUE(result.is_err());
	EXPECT_EQ(result.error().code, error_codes::codec::buffer_too_small);
}

TEST_F(VarintDecodeTest, TruncatedInputIsTooSmall)
{
	const std::vector<std::vector<uint8_t>> truncated = {
		{0x40},
		{0x80, 0x00, 0x00},
		{0xC0, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00},
	};

	for (const auto& data : truncated)
	{
		auto result = varint::decode(data);
		ASSERT_TRUE(result.is_err()) << "size=" << data.size();
		EXPECT_EQ(result.error().code, error_codes::codec::buffer_too_small);
	}
}
