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

// borsh/codec/include/borsh/serialization/serializers/Optional.hpp
#pragma once

#include "borsh/serialization/Core.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

/**
 * std::optional<T> serialization.
 * Format: [u8 tag: 0 = none, 1 = some] + [value if some]
 */
namespace borsh::serialization {
    inline constexpr uint8_t OPTION_NONE_TAG = 0x00;
    inline constexpr uint8_t OPTION_SOME_TAG = 0x01;

    // Forward declarations
    template <typename T>
    void serialize(std::vector<uint8_t>& buf, const T& value);

    template <typename T>
    [[nodiscard]] T deserialize(std::span<const uint8_t>& data);

    /**
     * Reads the option tag and advances past it.
     *
     * @return true if a value follows
     * @throws FormatError on an empty stream or a tag other than 0/1
     */
    [[nodiscard]] inline bool deserialize_option_tag(std::span<const uint8_t>& data) {
        if (data.empty()) { throw FormatError("deserialize_option_tag: insufficient data"); }

        const uint8_t tag = data[0];
        if (tag != OPTION_NONE_TAG && tag != OPTION_SOME_TAG) {
            throw FormatError("deserialize_option_tag: invalid tag " + std::to_string(tag));
        }
        data = data.subspan(1);

        return tag == OPTION_SOME_TAG;
    }

    template <typename T>
    void serialize_optional(std::vector<uint8_t>& buf, const std::optional<T>& opt) {
        buf.push_back(opt.has_value() ? OPTION_SOME_TAG : OPTION_NONE_TAG);

        if (opt.has_value()) { serialize(buf, *opt); }
    }

    template <typename T>
    [[nodiscard]] std::optional<T> deserialize_optional(std::span<const uint8_t>& data) {
        if (deserialize_option_tag(data)) { return deserialize<T>(data); }

        return std::nullopt;
    }
} // namespace borsh::serialization
