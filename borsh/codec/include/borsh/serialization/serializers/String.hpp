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

// borsh/codec/include/borsh/serialization/serializers/String.hpp
#pragma once

#include "borsh/serialization/Core.hpp"
#include "Primitives.hpp"
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include <span>

/**
 * std::string serialization.
 * Format: [u32 length (LE)] + [UTF-8 bytes]
 */
namespace borsh::serialization {
    /**
     * Strict UTF-8 check: rejects overlong forms, surrogates, code points above
     * U+10FFFF and truncated sequences.
     */
    [[nodiscard]] inline bool is_valid_utf8(std::span<const uint8_t> bytes) noexcept {
        size_t i = 0;
        while (i < bytes.size()) {
            const uint8_t lead = bytes[i];
            if (lead < 0x80) {
                ++i;
                continue;
            }

            size_t len = 0;
            uint8_t lo = 0x80;
            uint8_t hi = 0xBF;
            if (lead >= 0xC2 && lead <= 0xDF) { len = 2; }
            else if (lead == 0xE0) {
                len = 3;
                lo = 0xA0;
            }
            else if (lead == 0xED) {
                len = 3;
                hi = 0x9F;
            }
            else if (lead >= 0xE1 && lead <= 0xEF) { len = 3; }
            else if (lead == 0xF0) {
                len = 4;
                lo = 0x90;
            }
            else if (lead == 0xF4) {
                len = 4;
                hi = 0x8F;
            }
            else if (lead >= 0xF1 && lead <= 0xF3) { len = 4; }
            else { return false; }

            if (bytes.size() - i < len) { return false; }
            if (bytes[i + 1] < lo || bytes[i + 1] > hi) { return false; }
            for (size_t k = 2; k < len; ++k) {
                if ((bytes[i + k] & 0xC0) != 0x80) { return false; }
            }
            i += len;
        }
        return true;
    }

    [[nodiscard]] inline bool is_valid_utf8(std::string_view str) noexcept {
        return is_valid_utf8(std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(str.data()), str.size()));
    }

    inline void serialize_string(std::vector<uint8_t>& buf, std::string_view str) {
        if (!is_valid_utf8(str)) { throw ValueError("serialize_string: string is not valid UTF-8"); }

        serialize_length(buf, str.size());
        buf.insert(buf.end(), str.begin(), str.end());
    }

    [[nodiscard]] inline std::string deserialize_string(std::span<const uint8_t>& data) {
        if (data.size() < 4) { throw FormatError(detail::insufficient("deserialize_string: length prefix", 4, data.size())); }
        const uint32_t len = deserialize_length(data);

        if (data.size() < len) { throw FormatError(detail::insufficient("deserialize_string: content", len, data.size())); }

        const auto content = data.first(len);
        if (!is_valid_utf8(content)) { throw FormatError("deserialize_string: payload is not valid UTF-8"); }

        std::string result(reinterpret_cast<const char*>(content.data()), len);
        data = data.subspan(len);

        return result;
    }
} // namespace borsh::serialization
