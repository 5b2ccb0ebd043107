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

// borsh/codec/include/borsh/serialization/serializers/Int128.hpp
#pragma once

#include "borsh/serialization/Core.hpp"
#include <algorithm>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

/**
 * u128 / i128 serialization.
 * Format: 16 bytes, least significant byte first (two's complement for i128).
 */
namespace borsh::serialization {
    __extension__ typedef unsigned __int128 uint128;
    __extension__ typedef __int128 int128;

    inline constexpr uint128 UINT128_MAX_VALUE = ~static_cast<uint128>(0);
    inline constexpr int128 INT128_MAX_VALUE = static_cast<int128>(UINT128_MAX_VALUE >> 1);
    inline constexpr int128 INT128_MIN_VALUE = -INT128_MAX_VALUE - 1;

    inline void serialize_u128(std::vector<uint8_t>& buf, uint128 value) {
        for (int i = 0; i < 16; ++i) { buf.push_back(static_cast<uint8_t>(value >> (8 * i))); }
    }

    inline void serialize_i128(std::vector<uint8_t>& buf, int128 value) { serialize_u128(buf, static_cast<uint128>(value)); }

    [[nodiscard]] inline uint128 deserialize_u128(std::span<const uint8_t>& data) {
        if (data.size() < 16) { throw FormatError(detail::insufficient("deserialize_u128", 16, data.size())); }

        uint128 value = 0;
        for (int i = 0; i < 16; ++i) { value |= static_cast<uint128>(data[i]) << (8 * i); }
        data = data.subspan(16);

        return value;
    }

    [[nodiscard]] inline int128 deserialize_i128(std::span<const uint8_t>& data) { return static_cast<int128>(deserialize_u128(data)); }

    // ========== Decimal Text ==========

    [[nodiscard]] inline std::string to_string(uint128 value) {
        if (value == 0) { return "0"; }

        std::string out;
        while (value != 0) {
            out.push_back(static_cast<char>('0' + static_cast<int>(value % 10)));
            value /= 10;
        }
        std::reverse(out.begin(), out.end());
        return out;
    }

    [[nodiscard]] inline std::string to_string(int128 value) {
        if (value >= 0) { return to_string(static_cast<uint128>(value)); }
        // Negate in unsigned space so INT128_MIN does not overflow
        return "-" + to_string(~static_cast<uint128>(value) + 1);
    }

    /**
     * Parses an unsigned decimal string.
     *
     * @throws ValueError on empty input, non-digit characters or overflow
     */
    [[nodiscard]] inline uint128 parse_u128(std::string_view text) {
        if (text.empty()) { throw ValueError("parse_u128: empty string"); }

        uint128 value = 0;
        for (const char c : text) {
            if (c < '0' || c > '9') { throw ValueError("parse_u128: invalid digit in '" + std::string(text) + "'"); }
            const auto digit = static_cast<uint128>(c - '0');
            if (value > (UINT128_MAX_VALUE - digit) / 10) { throw ValueError("parse_u128: overflow in '" + std::string(text) + "'"); }
            value = value * 10 + digit;
        }
        return value;
    }

    [[nodiscard]] inline int128 parse_i128(std::string_view text) {
        const bool negative = !text.empty() && text.front() == '-';
        const uint128 magnitude = parse_u128(negative ? text.substr(1) : text);
        const auto limit = static_cast<uint128>(INT128_MAX_VALUE) + (negative ? 1 : 0);

        if (magnitude > limit) { throw ValueError("parse_i128: out of range '" + std::string(text) + "'"); }
        return negative ? static_cast<int128>(~magnitude + 1) : static_cast<int128>(magnitude);
    }
} // namespace borsh::serialization
