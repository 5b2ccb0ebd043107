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

// tests/layout/codec_test.cpp
#include "borsh/layout/Codec.hpp"
#include "borsh/layout/SizeProbe.hpp"
#include "borsh/serialization/Fields.hpp"
#include "borsh/serialization/Serialization.hpp"

#include <gtest/gtest.h>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

using namespace borsh::layout;
using borsh::serialization::INT128_MIN_VALUE;
using borsh::serialization::UINT128_MAX_VALUE;

namespace {
    std::string error_of(const std::function<void()>& action) {
        try {
            action();
        } catch (const borsh::serialization::SerializationException& e) {
            return e.what();
        }
        return {};
    }

    struct Account {
        uint64_t lamports = 0;
        std::string owner;
        std::optional<uint8_t> bump;
        std::vector<uint16_t> slots;

        BORSH_FIELDS(lamports, owner, bump, slots)
    };

    LayoutPtr account_layout() {
        return structure({
            {"lamports", u64()},
            {"owner", string()},
            {"bump", option(u8())},
            {"slots", vec(u16())},
        });
    }

    /**
     * Three variants, the middle one unit-shaped.
     */
    LayoutPtr instruction_layout() {
        return enumeration({
            Variant::tuple("Transfer", {u64(), string()}),
            Variant::unit("Close"),
            Variant::named("Resize", {{"space", u32()}, {"zero", boolean()}}),
        });
    }
}

// ============================================================================
// Primitives
// ============================================================================

TEST(CodecTest, U32IsLittleEndian) {
    const auto bytes = encode(*u32(), Value(uint32_t{0xDEADBEEF}));
    EXPECT_EQ(bytes, (Bytes{0xEF, 0xBE, 0xAD, 0xDE}));

    const auto decoded = decode(*u32(), bytes);
    ASSERT_TRUE(decoded.is<uint32_t>());
    EXPECT_EQ(decoded.as<uint32_t>(), 0xDEADBEEFu);
}

TEST(CodecTest, StringHasLengthPrefix) {
    const auto bytes = encode(*string(), Value("abc"));
    EXPECT_EQ(bytes, (Bytes{0x03, 0x00, 0x00, 0x00, 0x61, 0x62, 0x63}));
    EXPECT_TRUE(decode(*string(), bytes) == Value("abc"));
}

TEST(CodecTest, IntegersAreNarrowedToTheLayoutWidth) {
    EXPECT_EQ(encode(*u8(), Value(int32_t{200})), (Bytes{0xC8}));
    EXPECT_EQ(encode(*i16(), Value(int64_t{-2})), (Bytes{0xFE, 0xFF}));
    EXPECT_EQ(encode(*u64(), Value(uint8_t{1})), (Bytes{0x01, 0, 0, 0, 0, 0, 0, 0}));

    EXPECT_THROW((void)encode(*u8(), Value(int32_t{256})), ValueError);
    EXPECT_THROW((void)encode(*u32(), Value(int32_t{-1})), ValueError);
    EXPECT_THROW((void)encode(*i8(), Value(int32_t{-129})), ValueError);
    EXPECT_THROW((void)encode(*u8(), Value(true)), ValueError);
    EXPECT_THROW((void)encode(*u8(), Value("1")), ValueError);
}

TEST(CodecTest, DecodedScalarsHaveTheLayoutKind) {
    const Bytes two{0x02, 0x00};
    EXPECT_TRUE(decode(*u16(), two).is<uint16_t>());
    EXPECT_TRUE(decode(*i16(), two).is<int16_t>());
    EXPECT_TRUE(decode(*boolean(), Bytes{0x01}).is<bool>());
}

TEST(CodecTest, Int128Boundaries) {
    const auto max_bytes = encode(*u128(), Value(UINT128_MAX_VALUE));
    EXPECT_EQ(max_bytes, Bytes(16, 0xFF));
    EXPECT_TRUE(decode(*u128(), max_bytes) == Value(UINT128_MAX_VALUE));

    const auto minus_one = encode(*i128(), Value(int32_t{-1}));
    EXPECT_EQ(minus_one, max_bytes);
    EXPECT_TRUE(decode(*i128(), minus_one) == Value(static_cast<int128>(-1)));

    const auto min_bytes = encode(*i128(), Value(INT128_MIN_VALUE));
    EXPECT_EQ(min_bytes[15], 0x80);
    EXPECT_TRUE(decode(*i128(), min_bytes) == Value(INT128_MIN_VALUE));

    EXPECT_THROW((void)encode(*i128(), Value(UINT128_MAX_VALUE)), ValueError);
}

TEST(CodecTest, BoolIsStrict) {
    EXPECT_EQ(encode(*boolean(), Value(true)), (Bytes{0x01}));
    EXPECT_THROW((void)decode(*boolean(), Bytes{0x02}), FormatError);
}

TEST(CodecTest, FloatsRejectNaN) {
    EXPECT_THROW((void)encode(*f32(), Value(std::numeric_limits<float>::quiet_NaN())), ValueError);
    EXPECT_THROW((void)encode(*f64(), Value(std::numeric_limits<double>::quiet_NaN())), ValueError);
    EXPECT_THROW((void)decode(*f32(), Bytes{0x00, 0x00, 0xC0, 0x7F}), FormatError);
    EXPECT_THROW((void)decode(*f64(), Bytes{0, 0, 0, 0, 0, 0, 0xF8, 0x7F}), FormatError);
}

TEST(CodecTest, FloatWidthsConvert) {
    EXPECT_EQ(encode(*f32(), Value(1.0)), (Bytes{0x00, 0x00, 0x80, 0x3F}));
    EXPECT_TRUE(decode(*f32(), Bytes{0x00, 0x00, 0x80, 0x3F}) == Value(1.0f));
    EXPECT_THROW((void)encode(*f32(), Value(1e300)), ValueError);
    EXPECT_THROW((void)encode(*f64(), Value(int32_t{1})), ValueError);
}

TEST(CodecTest, InvalidUtf8) {
    EXPECT_THROW((void)encode(*string(), Value("\xFF\xFE")), ValueError);
    EXPECT_THROW((void)decode(*string(), Bytes{0x01, 0x00, 0x00, 0x00, 0xFF}), FormatError);
}

// ============================================================================
// Option & Collections
// ============================================================================

TEST(CodecTest, OptionTags) {
    const auto layout = option(u8());
    EXPECT_EQ(encode(*layout, Value::some(Value(uint8_t{5}))), (Bytes{0x01, 0x05}));
    EXPECT_EQ(encode(*layout, Value::none()), (Bytes{0x00}));

    EXPECT_TRUE(decode(*layout, Bytes{0x01, 0x05}) == Value::some(Value(uint8_t{5})));
    EXPECT_TRUE(decode(*layout, Bytes{0x00}) == Value::none());
    EXPECT_THROW((void)decode(*layout, Bytes{0x02, 0x05}), FormatError);
}

TEST(CodecTest, EmptyVectorIsFourZeroBytes) {
    EXPECT_EQ(encode(*vec(u64()), Value(ValueList{})), Bytes(4, 0x00));

    for (const auto& element : {u8(), string(), option(u32()), instruction_layout()}) {
        EXPECT_TRUE(decode(*vec(element), Bytes(4, 0x00)) == Value(ValueList{})) << element->describe();
    }
}

TEST(CodecTest, VectorCountMustFitTheStream) {
    EXPECT_THROW((void)decode(*vec(u32()), Bytes{0xFF, 0xFF, 0xFF, 0xFF, 0x00}), FormatError);

    const auto message = error_of([] { (void)decode(*vec(u32()), Bytes{0x01, 0x00, 0x00, 0x00, 0x01, 0x02}); });
    EXPECT_NE(message.find("decode Vec<u32>"), std::string::npos) << message;
}

TEST(CodecTest, SetAndMapCountsMustFitTheStream) {
    const Bytes huge_count{0xFF, 0xFF, 0xFF, 0xFF, 0x00};
    EXPECT_THROW((void)decode(*hash_set(u64()), huge_count), FormatError);
    EXPECT_THROW((void)decode(*hash_map(u8(), string()), huge_count), FormatError);
    EXPECT_THROW((void)decode(*vec(option(u8())), huge_count), FormatError);
}

TEST(CodecTest, ZeroSizedElementsOnlyInEmptyCollections) {
    const Bytes huge_count{0xFF, 0xFF, 0xFF, 0xFF};
    for (const auto& layout : {vec(structure({})), vec(tuple({})), vec(array(u64(), 0)), hash_set(structure({})),
                               hash_map(tuple({}), structure({}))}) {
        EXPECT_THROW((void)decode(*layout, huge_count), FormatError) << layout->describe();
        EXPECT_THROW((void)probe_size(*layout, huge_count), FormatError) << layout->describe();

        const Bytes empty{0x00, 0x00, 0x00, 0x00};
        EXPECT_EQ(probe_size(*layout, empty), 4u) << layout->describe();
    }

    const auto message = error_of([] { (void)decode(*vec(structure({})), Bytes{0x02, 0x00, 0x00, 0x00}); });
    EXPECT_NE(message.find("2 zero-sized elements"), std::string::npos) << message;

    EXPECT_THROW((void)encode(*vec(structure({})), Value::list({Value::record({})})), ValueError);
    EXPECT_THROW((void)encode(*hash_set(tuple({})), Value::set({Value::list({})})), ValueError);
    EXPECT_EQ(encode(*vec(structure({})), Value::list({})), (Bytes{0x00, 0x00, 0x00, 0x00}));
    EXPECT_TRUE(decode(*vec(structure({})), Bytes{0x00, 0x00, 0x00, 0x00}) == Value::list({}));
}

TEST(CodecTest, ZeroSizedArrayElementsAreAllowed) {
    const auto layout = array(structure({}), 3);
    const auto value = Value::list({Value::record({}), Value::record({}), Value::record({})});
    EXPECT_TRUE(encode(*layout, value).empty());
    EXPECT_TRUE(decode(*layout, Bytes{}) == value);
}

TEST(CodecTest, TruncationNamesTheLayout) {
    const auto message = error_of([] { (void)decode(*u32(), Bytes{0x01, 0x02}); });
    EXPECT_EQ(message, "decode u32: insufficient data (need 4, got 2)");
}

TEST(CodecTest, FixedArrayLengthMustMatch) {
    const auto layout = array(u8(), 3);
    const auto value = Value::list({Value(uint8_t{1}), Value(uint8_t{2}), Value(uint8_t{3})});
    EXPECT_EQ(encode(*layout, value), (Bytes{0x01, 0x02, 0x03}));
    EXPECT_TRUE(decode(*layout, Bytes{0x01, 0x02, 0x03}) == value);

    EXPECT_THROW((void)encode(*layout, Value::list({Value(uint8_t{1})})), ValueError);
}

TEST(CodecTest, MapIsOrderedByEncodedKey) {
    const auto layout = hash_map(string(), u8());
    const auto first = Value::map({{Value("b"), Value(uint8_t{1})}, {Value("a"), Value(uint8_t{2})}});
    const auto second = Value::map({{Value("a"), Value(uint8_t{2})}, {Value("b"), Value(uint8_t{1})}});

    const Bytes expected{
        0x02, 0x00, 0x00, 0x00,
        0x01, 0x00, 0x00, 0x00, 'a', 0x02,
        0x01, 0x00, 0x00, 0x00, 'b', 0x01,
    };
    EXPECT_EQ(encode(*layout, first), expected);
    EXPECT_EQ(encode(*layout, second), expected);
    EXPECT_TRUE(decode(*layout, expected) == first);
}

TEST(CodecTest, MapKeysThatEncodeAlikeCollapse) {
    // int32 7 and uint8 7 both encode as the u16 key 07 00; the later entry wins
    const auto layout = hash_map(u16(), string());
    const auto value = Value::map({{Value(int32_t{7}), Value("old")}, {Value(uint8_t{7}), Value("new")}});
    EXPECT_EQ(encode(*layout, value), (Bytes{0x01, 0x00, 0x00, 0x00, 0x07, 0x00, 0x03, 0x00, 0x00, 0x00, 'n', 'e', 'w'}));
}

TEST(CodecTest, MapDecodeKeepsLastDuplicate) {
    const auto layout = hash_map(u8(), u8());
    const auto decoded = decode(*layout, Bytes{0x02, 0x00, 0x00, 0x00, 0x07, 0x01, 0x07, 0x02});
    EXPECT_TRUE(decoded == Value::map({{Value(uint8_t{7}), Value(uint8_t{2})}}));
}

TEST(CodecTest, SetIsCanonicalAndDeduplicated) {
    const auto layout = hash_set(u16());
    const auto value = Value::set({Value(uint16_t{256}), Value(uint16_t{1}), Value(uint16_t{1})});
    // 256 encodes as 00 01 and sorts before 1 (01 00)
    EXPECT_EQ(encode(*layout, value), (Bytes{0x02, 0x00, 0x00, 0x00, 0x00, 0x01, 0x01, 0x00}));
    EXPECT_TRUE(decode(*layout, encode(*layout, value)) == Value::set({Value(uint16_t{1}), Value(uint16_t{256})}));
}

TEST(CodecTest, TupleArityMustMatch) {
    const auto layout = tuple({u8(), boolean()});
    EXPECT_EQ(encode(*layout, Value::list({Value(uint8_t{9}), Value(false)})), (Bytes{0x09, 0x00}));
    EXPECT_THROW((void)encode(*layout, Value::list({Value(uint8_t{9})})), ValueError);
}

// ============================================================================
// Struct
// ============================================================================

TEST(CodecTest, StructRoundTripsAndMatchesTypedEncoding) {
    const Account account{500, "owner", uint8_t{254}, {1, 2}};
    const auto value = Value::record({
        {"lamports", Value(uint64_t{500})},
        {"owner", Value("owner")},
        {"bump", Value::some(Value(uint8_t{254}))},
        {"slots", Value::list({Value(uint16_t{1}), Value(uint16_t{2})})},
    });

    const auto layout = account_layout();
    const auto bytes = encode(*layout, value);
    EXPECT_EQ(bytes, borsh::serialization::to_bytes(account));
    EXPECT_TRUE(decode(*layout, bytes) == value);
}

TEST(CodecTest, StructFieldOrderComesFromTheLayout) {
    const auto layout = structure({{"a", u8()}, {"b", u8()}});
    const auto value = Value::record({{"b", Value(uint8_t{2})}, {"a", Value(uint8_t{1})}, {"extra", Value("ignored")}});
    EXPECT_EQ(encode(*layout, value), (Bytes{0x01, 0x02}));
}

TEST(CodecTest, MissingStructFieldFails) {
    const auto layout = account_layout();
    const auto value = Value::record({{"lamports", Value(uint64_t{1})}});
    const auto message = error_of([&] { (void)encode(*layout, value); });
    EXPECT_NE(message.find("missing field 'owner'"), std::string::npos) << message;
}

// ============================================================================
// Enum
// ============================================================================

TEST(CodecTest, UnitVariantIsItsDiscriminant) {
    EXPECT_EQ(encode(*instruction_layout(), Value::unit_variant("Close")), (Bytes{0x01}));
    EXPECT_TRUE(decode(*instruction_layout(), Bytes{0x01}) == Value::unit_variant("Close"));
}

TEST(CodecTest, PayloadVariantsRoundTrip) {
    const auto layout = instruction_layout();

    const auto transfer = Value::tuple_variant("Transfer", {Value(uint64_t{3}), Value("to")});
    const auto transfer_bytes = encode(*layout, transfer);
    EXPECT_EQ(transfer_bytes, (Bytes{0x00, 0x03, 0, 0, 0, 0, 0, 0, 0, 0x02, 0x00, 0x00, 0x00, 't', 'o'}));
    EXPECT_TRUE(decode(*layout, transfer_bytes) == transfer);

    const auto resize = Value::named_variant("Resize", {{"space", Value(uint32_t{64})}, {"zero", Value(true)}});
    const auto resize_bytes = encode(*layout, resize);
    EXPECT_EQ(resize_bytes, (Bytes{0x02, 0x40, 0x00, 0x00, 0x00, 0x01}));
    EXPECT_TRUE(decode(*layout, resize_bytes) == resize);
}

TEST(CodecTest, DiscriminantBeyondVariantCountFails) {
    EXPECT_THROW((void)decode(*instruction_layout(), Bytes{0x03}), FormatError);
    EXPECT_THROW((void)decode(*instruction_layout(), Bytes{0xFF}), FormatError);
    EXPECT_THROW((void)decode(*instruction_layout(), Bytes{}), FormatError);
}

TEST(CodecTest, UndeclaredVariantFails) {
    EXPECT_THROW((void)encode(*instruction_layout(), Value::unit_variant("Open")), ValueError);
    EXPECT_THROW((void)encode(*instruction_layout(), Value::tuple_variant("Close", {Value(uint8_t{1})})), ValueError);
    EXPECT_THROW((void)encode(*instruction_layout(), Value(uint8_t{1})), ValueError);
}

// ============================================================================
// Framing
// ============================================================================

TEST(CodecTest, TrailingBytes) {
    const Bytes padded{0x2A, 0x00, 0x00};
    EXPECT_TRUE(decode(*u8(), padded) == Value(uint8_t{42}));
    EXPECT_THROW((void)decode(*u8(), padded, DecodeOptions{.allow_trailing_bytes = false}), FormatError);
    EXPECT_TRUE(decode(*u8(), Bytes{0x2A}, DecodeOptions{.allow_trailing_bytes = false}) == Value(uint8_t{42}));

    const auto prefix = decode_prefix(*string(), Bytes{0x01, 0x00, 0x00, 0x00, 'x', 0xAA});
    EXPECT_TRUE(prefix.value == Value("x"));
    EXPECT_EQ(prefix.consumed, 5u);
}

TEST(CodecTest, StreamingDeserializeAdvances) {
    Bytes buf;
    serialize(buf, *u16(), Value(uint16_t{1}));
    serialize(buf, *string(), Value("ab"));

    std::span<const uint8_t> data(buf);
    EXPECT_TRUE(deserialize(*u16(), data) == Value(uint16_t{1}));
    EXPECT_TRUE(deserialize(*string(), data) == Value("ab"));
    EXPECT_TRUE(data.empty());
}

TEST(CodecTest, CodecBindsALayout) {
    EXPECT_THROW((void)Codec{nullptr}, SchemaError);

    const Codec codec(account_layout());
    const auto value = Value::record({
        {"lamports", Value(uint64_t{1})},
        {"owner", Value("")},
        {"bump", Value::none()},
        {"slots", Value(ValueList{})},
    });

    const auto bytes = codec.encode(value);
    EXPECT_EQ(bytes.size(), 8u + 4u + 1u + 4u);
    EXPECT_TRUE(codec.decode(bytes) == value);
    EXPECT_EQ(codec.probe_size(bytes), bytes.size());
    EXPECT_FALSE(codec.fixed_size().has_value());
    EXPECT_THROW((void)codec.static_size(), SizeUndefinedError);
}

// ============================================================================
// Public Keys
// ============================================================================

TEST(CodecTest, PublicKeyTravelsAsBase58String) {
    const auto key = PublicKey::from_base58("TokenkegQfeZyiNwAJbNbGKPFXCWuBvf9Ss623VQ5DA");
    const auto layout = structure({{"mint", public_key()}, {"amount", u64()}});
    const auto value = Value::record({{"mint", Value(key)}, {"amount", Value(uint64_t{10})}});

    const auto bytes = encode(*layout, value);
    EXPECT_EQ(bytes, borsh::serialization::to_bytes(std::make_tuple(std::string("TokenkegQfeZyiNwAJbNbGKPFXCWuBvf9Ss623VQ5DA"), uint64_t{10})));
    EXPECT_TRUE(decode(*layout, bytes) == value);
    EXPECT_EQ(probe_size(*layout, bytes), bytes.size());
}

TEST(CodecTest, PublicKeyRejectsOtherValuesAndText) {
    EXPECT_THROW((void)encode(*public_key(), Value("TokenkegQfeZyiNwAJbNbGKPFXCWuBvf9Ss623VQ5DA")), ValueError);

    const auto message = error_of([] { (void)decode(*public_key(), borsh::serialization::to_bytes(std::string("hello"))); });
    EXPECT_EQ(message, "decode PublicKey: not a base58 32-byte key");

    EXPECT_FALSE(fixed_size(*public_key()).has_value());
    EXPECT_EQ(min_size(*public_key()), 36u);
}
