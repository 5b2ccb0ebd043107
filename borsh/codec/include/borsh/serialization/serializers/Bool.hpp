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

// borsh/codec/include/borsh/serialization/serializers/Bool.hpp
#pragma once

#include "borsh/serialization/Core.hpp"
#include <cstdint>
#include <vector>
#include <span>

/**
 * bool serialization.
 * Format: [u8] (0 = false, 1 = true, anything else is malformed)
 */
namespace borsh::serialization {
    inline void serialize_bool(std::vector<uint8_t>& buf, bool value) { buf.push_back(value ? 1 : 0); }

    [[nodiscard]] inline bool deserialize_bool(std::span<const uint8_t>& data) {
        if (data.empty()) { throw FormatError("deserialize_bool: insufficient data"); }

        const uint8_t byte = data[0];
        if (byte > 1) { throw FormatError("deserialize_bool: invalid byte " + std::to_string(byte)); }
        data = data.subspan(1);

        return byte == 1;
    }
} // namespace borsh::serialization
