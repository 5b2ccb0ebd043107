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

// borsh/codec/include/borsh/serialization/serializers/Primitives.hpp
#pragma once

#include "borsh/serialization/Core.hpp"
#include <bit>
#include <array>
#include <cmath>
#include <cstdint>
#include <limits>
#include <span>
#include <vector>
#include <concepts>
#include <algorithm>

/**
 * Primitive types serialization (integers up to 64 bit, float, double).
 * All values use Little Endian format.
 * Uses std::bit_cast for type-safe, UB-free conversions.
 */
namespace borsh::serialization {
    static_assert(std::endian::native == std::endian::little, "Borsh wire format requires a little-endian host");

    /**
     * Integers that map onto a fixed-width wire integer (bool excluded, 128-bit handled in Int128.hpp).
     */
    template <typename T>
    concept WireIntegral = std::integral<T> && !std::same_as<T, bool> && sizeof(T) <= 8;

    /**
     * IEEE-754 binary32/binary64.
     */
    template <typename T>
    concept WireFloat = std::same_as<T, float> || std::same_as<T, double>;

    // ========== Integral Types ==========

    template <WireIntegral T>
    void serialize_integral(std::vector<uint8_t>& buf, T value) {
        auto bytes = std::bit_cast<std::array<uint8_t, sizeof(T)>>(value);
        buf.insert(buf.end(), bytes.begin(), bytes.end());
    }

    template <WireIntegral T>
    [[nodiscard]] T deserialize_integral(std::span<const uint8_t>& data) {
        if (data.size() < sizeof(T)) { throw FormatError(detail::insufficient("deserialize_integral", sizeof(T), data.size())); }

        std::array<uint8_t, sizeof(T)> bytes;
        std::copy_n(data.begin(), sizeof(T), bytes.begin());
        data = data.subspan(sizeof(T));

        return std::bit_cast<T>(bytes);
    }

    // ========== Length Prefix ==========

    /**
     * Writes the u32 LE length/count prefix used by bytes, strings and collections.
     *
     * @throws ValueError if the length does not fit in 32 bits
     */
    inline void serialize_length(std::vector<uint8_t>& buf, size_t length) {
        if (length > std::numeric_limits<uint32_t>::max()) {
            throw ValueError("serialize_length: " + std::to_string(length) + " exceeds u32 length prefix");
        }
        serialize_integral(buf, static_cast<uint32_t>(length));
    }

    [[nodiscard]] inline uint32_t deserialize_length(std::span<const uint8_t>& data) { return deserialize_integral<uint32_t>(data); }

    // ========== Floating Point Types ==========

    /**
     * NaN has no canonical encoding and is rejected in both directions.
     */
    template <WireFloat T>
    void serialize_float(std::vector<uint8_t>& buf, T value) {
        if (std::isnan(value)) { throw ValueError("serialize_float: NaN is not supported"); }

        auto bytes = std::bit_cast<std::array<uint8_t, sizeof(T)>>(value);
        buf.insert(buf.end(), bytes.begin(), bytes.end());
    }

    template <WireFloat T>
    [[nodiscard]] T deserialize_float(std::span<const uint8_t>& data) {
        if (data.size() < sizeof(T)) { throw FormatError(detail::insufficient("deserialize_float", sizeof(T), data.size())); }

        std::array<uint8_t, sizeof(T)> bytes;
        std::copy_n(data.begin(), sizeof(T), bytes.begin());

        const T value = std::bit_cast<T>(bytes);
        if (std::isnan(value)) { throw FormatError("deserialize_float: NaN bit pattern is not supported"); }

        data = data.subspan(sizeof(T));
        return value;
    }
} // namespace borsh::serialization
