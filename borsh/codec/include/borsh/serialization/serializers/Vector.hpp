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

// borsh/codec/include/borsh/serialization/serializers/Vector.hpp
#pragma once

#include "borsh/serialization/Core.hpp"
#include "Primitives.hpp"
#include <algorithm>
#include <cstdint>
#include <vector>
#include <span>

/**
 * std::vector<T> serialization.
 * Format: [u32 size (LE)] + [element1] + [element2] + ...
 */
namespace borsh::serialization {
    // Forward declarations for generic serialize / deserialize
    template <typename T>
    void serialize(std::vector<uint8_t>& buf, const T& value);

    template <typename T>
    [[nodiscard]] T deserialize(std::span<const uint8_t>& data);

    // ========== std::vector<uint8_t> (special case: bytes) ==========

    inline void serialize_bytes(std::vector<uint8_t>& buf, std::span<const uint8_t> bytes) {
        serialize_length(buf, bytes.size());
        buf.insert(buf.end(), bytes.begin(), bytes.end());
    }

    [[nodiscard]] inline std::vector<uint8_t> deserialize_bytes(std::span<const uint8_t>& data) {
        if (data.size() < 4) { throw FormatError(detail::insufficient("deserialize_bytes: length prefix", 4, data.size())); }
        const uint32_t len = deserialize_length(data);

        if (data.size() < len) { throw FormatError(detail::insufficient("deserialize_bytes: content", len, data.size())); }

        std::vector<uint8_t> result(data.begin(), data.begin() + len);
        data = data.subspan(len);

        return result;
    }

    // ========== std::vector<T> (generic) ==========

    template <typename T>
    void serialize_vector(std::vector<uint8_t>& buf, const std::vector<T>& vec) {
        serialize_length(buf, vec.size());

        for (const auto& item : vec) {
            const size_t mark = buf.size();
            serialize(buf, item);
            if (buf.size() == mark) { throw ValueError(detail::zero_sized("serialize_vector", vec.size())); }
        }
    }

    template <typename T>
    [[nodiscard]] std::vector<T> deserialize_vector(std::span<const uint8_t>& data) {
        const uint32_t size = deserialize_length(data);

        std::vector<T> result;
        // Never trust the prefix for more than the stream can hold
        result.reserve(std::min<size_t>(size, data.size()));

        for (uint32_t i = 0; i < size; i++) {
            const size_t before = data.size();
            result.push_back(deserialize<T>(data));
            if (data.size() == before) { throw FormatError(detail::zero_sized("deserialize_vector", size)); }
        }

        return result;
    }
} // namespace borsh::serialization
