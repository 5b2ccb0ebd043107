/*
 * Borsh
 * Copyright (C) 2025 Swift Storm Studio
 *
 * This file is part of Borsh.
 *
 * Borsh is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
 *
 * Borsh is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with Borsh.  If not, see <https://www.gnu.org/licenses/>.
 */

// tests/serialization/primitives_test.cpp
#include "borsh/serialization/Serialization.hpp"

#include <gtest/gtest.h>
#include <cstring>
#include <limits>
#include <string>
#include <vector>

using namespace borsh::serialization;

namespace {
    using Bytes = std::vector<uint8_t>;

    std::span<const uint8_t> view(const Bytes& bytes) { return {bytes.data(), bytes.size()}; }
}

// ============================================================================
// Integers
// ============================================================================

TEST(PrimitivesTest, U32IsLittleEndian) {
    const auto bytes = to_bytes(uint32_t{0xDEADBEEF});
    EXPECT_EQ(bytes, (Bytes{0xEF, 0xBE, 0xAD, 0xDE}));
    EXPECT_EQ(from_bytes<uint32_t>(view(bytes)), 0xDEADBEEFu);
}

TEST(PrimitivesTest, SignedIntegersUseTwosComplement) {
    EXPECT_EQ(to_bytes(int16_t{-2}), (Bytes{0xFE, 0xFF}));
    EXPECT_EQ(to_bytes(int8_t{-128}), (Bytes{0x80}));
    EXPECT_EQ(to_bytes(int64_t{-1}), Bytes(8, 0xFF));

    const Bytes encoded{0x00, 0x00, 0x00, 0x80};
    EXPECT_EQ(from_bytes<int32_t>(view(encoded)), std::numeric_limits<int32_t>::min());
}

TEST(PrimitivesTest, U64Extremes) {
    EXPECT_EQ(to_bytes(uint64_t{0}), Bytes(8, 0x00));
    EXPECT_EQ(to_bytes(std::numeric_limits<uint64_t>::max()), Bytes(8, 0xFF));

    const auto bytes = to_bytes(uint64_t{0x0102030405060708});
    EXPECT_EQ(bytes, (Bytes{0x08, 0x07, 0x06, 0x05, 0x04, 0x03, 0x02, 0x01}));
}

TEST(PrimitivesTest, TruncatedIntegerFails) {
    const Bytes two{0x01, 0x02};
    auto data = view(two);
    EXPECT_THROW((void)deserialize<uint32_t>(data), FormatError);
}

// ============================================================================
// 128-bit
// ============================================================================

TEST(PrimitivesTest, U128MaxRoundTrips) {
    const auto bytes = to_bytes(UINT128_MAX_VALUE);
    EXPECT_EQ(bytes, Bytes(16, 0xFF));
    EXPECT_TRUE(from_bytes<uint128>(view(bytes)) == UINT128_MAX_VALUE);
}

TEST(PrimitivesTest, I128MinusOneMatchesU128MaxBytes) {
    const int128 minus_one = -1;
    const auto bytes = to_bytes(minus_one);
    EXPECT_EQ(bytes, to_bytes(UINT128_MAX_VALUE));
    EXPECT_TRUE(from_bytes<int128>(view(bytes)) == minus_one);
}

TEST(PrimitivesTest, I128BoundariesAreBytesReversed) {
    Bytes min_bytes(16, 0x00);
    min_bytes[15] = 0x80;
    EXPECT_EQ(to_bytes(INT128_MIN_VALUE), min_bytes);

    Bytes max_bytes(16, 0xFF);
    max_bytes[15] = 0x7F;
    EXPECT_EQ(to_bytes(INT128_MAX_VALUE), max_bytes);

    const uint128 one = 1;
    Bytes one_bytes(16, 0x00);
    one_bytes[0] = 0x01;
    EXPECT_EQ(to_bytes(one), one_bytes);
}

TEST(PrimitivesTest, Int128DecimalText) {
    EXPECT_EQ(to_string(UINT128_MAX_VALUE), "340282366920938463463374607431768211455");
    EXPECT_EQ(to_string(INT128_MIN_VALUE), "-170141183460469231731687303715884105728");
    EXPECT_EQ(to_string(static_cast<uint128>(0)), "0");

    EXPECT_TRUE(parse_u128("340282366920938463463374607431768211455") == UINT128_MAX_VALUE);
    EXPECT_TRUE(parse_i128("-170141183460469231731687303715884105728") == INT128_MIN_VALUE);

    EXPECT_THROW((void)parse_u128("340282366920938463463374607431768211456"), ValueError);
    EXPECT_THROW((void)parse_i128("170141183460469231731687303715884105728"), ValueError);
    EXPECT_THROW((void)parse_u128("12a"), ValueError);
    EXPECT_THROW((void)parse_u128(""), ValueError);
}

// ============================================================================
// Bool
// ============================================================================

TEST(PrimitivesTest, BoolEncodesAsSingleByte) {
    EXPECT_EQ(to_bytes(true), (Bytes{0x01}));
    EXPECT_EQ(to_bytes(false), (Bytes{0x00}));
}

TEST(PrimitivesTest, BoolRejectsBytesOtherThanZeroOrOne) {
    const Bytes two{0x02};
    EXPECT_THROW((void)from_bytes<bool>(view(two)), FormatError);

    const Bytes one{0x01};
    EXPECT_TRUE(from_bytes<bool>(view(one)));
}

// ============================================================================
// Floats
// ============================================================================

TEST(PrimitivesTest, FloatsAreIeee754LittleEndian) {
    EXPECT_EQ(to_bytes(1.0f), (Bytes{0x00, 0x00, 0x80, 0x3F}));
    EXPECT_EQ(to_bytes(-2.0), (Bytes{0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0xC0}));

    const auto bytes = to_bytes(3.25);
    EXPECT_DOUBLE_EQ(from_bytes<double>(view(bytes)), 3.25);
}

TEST(PrimitivesTest, NaNIsRejectedOnEncode) {
    EXPECT_THROW((void)to_bytes(std::numeric_limits<float>::quiet_NaN()), ValueError);
    EXPECT_THROW((void)to_bytes(std::numeric_limits<double>::quiet_NaN()), ValueError);
}

TEST(PrimitivesTest, NaNBitPatternIsRejectedOnDecode) {
    const Bytes f32_nan{0x00, 0x00, 0xC0, 0x7F};
    EXPECT_THROW((void)from_bytes<float>(view(f32_nan)), FormatError);

    const Bytes f64_nan{0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0xF0, 0x7F};
    EXPECT_THROW((void)from_bytes<double>(view(f64_nan)), FormatError);
}

TEST(PrimitivesTest, InfinityIsAllowed) {
    const auto bytes = to_bytes(std::numeric_limits<double>::infinity());
    EXPECT_EQ(from_bytes<double>(view(bytes)), std::numeric_limits<double>::infinity());
}

// ============================================================================
// String & Bytes
// ============================================================================

TEST(PrimitivesTest, StringHasU32LengthPrefix) {
    const auto bytes = to_bytes(std::string("abc"));
    EXPECT_EQ(bytes, (Bytes{0x03, 0x00, 0x00, 0x00, 0x61, 0x62, 0x63}));
    EXPECT_EQ(from_bytes<std::string>(view(bytes)), "abc");
}

TEST(PrimitivesTest, StringKeepsMultibyteUtf8) {
    const std::string text = "h\xC3\xA9llo \xF0\x9F\x98\x80";
    const auto bytes = to_bytes(text);
    EXPECT_EQ(bytes.size(), 4 + text.size());
    EXPECT_EQ(from_bytes<std::string>(view(bytes)), text);
}

TEST(PrimitivesTest, InvalidUtf8IsRejectedOnEncode) {
    EXPECT_THROW((void)to_bytes(std::string("\xFF")), ValueError);
    EXPECT_THROW((void)to_bytes(std::string("\xC3")), ValueError);
}

TEST(PrimitivesTest, InvalidUtf8IsRejectedOnDecode) {
    const Bytes overlong{0x02, 0x00, 0x00, 0x00, 0xC0, 0xAF};
    EXPECT_THROW((void)from_bytes<std::string>(view(overlong)), FormatError);

    const Bytes surrogate{0x03, 0x00, 0x00, 0x00, 0xED, 0xA0, 0x80};
    EXPECT_THROW((void)from_bytes<std::string>(view(surrogate)), FormatError);
}

TEST(PrimitivesTest, StringShorterThanPrefixFails) {
    const Bytes truncated{0x05, 0x00, 0x00, 0x00, 0x61};
    EXPECT_THROW((void)from_bytes<std::string>(view(truncated)), FormatError);
}

TEST(PrimitivesTest, BytesCarryNoUtf8Rule) {
    const Bytes payload{0xFF, 0x00, 0xC0};
    const auto bytes = to_bytes(payload);
    EXPECT_EQ(bytes, (Bytes{0x03, 0x00, 0x00, 0x00, 0xFF, 0x00, 0xC0}));
    EXPECT_EQ(from_bytes<Bytes>(view(bytes)), payload);
}

// ============================================================================
// Stream
// ============================================================================

TEST(PrimitivesTest, DeserializeAdvancesTheStream) {
    Bytes buf;
    serialize(buf, uint16_t{7});
    serialize(buf, std::string("x"));
    serialize(buf, true);

    auto data = view(buf);
    EXPECT_EQ(deserialize<uint16_t>(data), 7);
    EXPECT_EQ(deserialize<std::string>(data), "x");
    EXPECT_TRUE(deserialize<bool>(data));
    EXPECT_TRUE(data.empty());
}

TEST(PrimitivesTest, FromBytesIgnoresTrailingBytes) {
    const Bytes bytes{0x2A, 0xFF, 0xFF};
    EXPECT_EQ(from_bytes<uint8_t>(view(bytes)), 42);
}

TEST(PrimitivesTest, EncodedSizeMatchesOutput) {
    EXPECT_EQ(encoded_size(uint32_t{1}), 4u);
    EXPECT_EQ(encoded_size(INT128_MAX_VALUE), 16u);
    EXPECT_EQ(encoded_size(std::string("hello")), 9u);
    EXPECT_EQ(encoded_size(true), 1u);
}

// ============================================================================
// Public Keys
// ============================================================================

namespace {
    const std::string TOKEN_PROGRAM = "TokenkegQfeZyiNwAJbNbGKPFXCWuBvf9Ss623VQ5DA";

    const PublicKey TOKEN_PROGRAM_KEY{{6,   221, 246, 225, 215, 101, 161, 147, 217, 203, 225, 70,  206, 235, 121, 172,
                                       28,  180, 133, 237, 95,  91,  55,  145, 58,  140, 245, 133, 126, 255, 0,   169}};
}

TEST(PrimitivesTest, PublicKeyUsesBase58) {
    EXPECT_EQ(TOKEN_PROGRAM_KEY.to_base58(), TOKEN_PROGRAM);
    EXPECT_EQ(PublicKey::from_base58(TOKEN_PROGRAM), TOKEN_PROGRAM_KEY);

    // Leading zero bytes become '1's
    EXPECT_EQ(PublicKey{}.to_base58(), std::string(32, '1'));
    EXPECT_EQ(PublicKey::from_base58(std::string(32, '1')), PublicKey{});

    const std::string other = "J3dxNj7nDRRqRRXuEMynDG57DkZK4jYRuv3Garmb1i99";
    EXPECT_EQ(PublicKey::from_base58(other).to_base58(), other);
}

TEST(PrimitivesTest, PublicKeyIsFramedAsString) {
    const Bytes encoded = to_bytes(PublicKey{});

    Bytes expected{0x20, 0x00, 0x00, 0x00};
    expected.insert(expected.end(), 32, static_cast<uint8_t>('1'));
    EXPECT_EQ(encoded, expected);
    EXPECT_EQ(encoded_size(PublicKey{}), encoded.size());

    EXPECT_EQ(from_bytes<PublicKey>(view(to_bytes(TOKEN_PROGRAM_KEY))), TOKEN_PROGRAM_KEY);
    EXPECT_EQ(to_bytes(TOKEN_PROGRAM_KEY), to_bytes(TOKEN_PROGRAM));
}

TEST(PrimitivesTest, MalformedPublicKeysAreRejected) {
    EXPECT_FALSE(PublicKey::parse("abc").has_value());
    EXPECT_FALSE(PublicKey::parse("0OIl0OIl0OIl0OIl0OIl0OIl0OIl0OIl").has_value()); // outside the alphabet
    EXPECT_FALSE(PublicKey::parse(std::string(44, 'z')).has_value()); // 33 bytes
    EXPECT_THROW((void)PublicKey::from_base58("not a key"), ValueError);

    EXPECT_THROW((void)from_bytes<PublicKey>(view(to_bytes(std::string("hello")))), FormatError);
}
