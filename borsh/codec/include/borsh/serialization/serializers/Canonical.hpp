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

// borsh/codec/include/borsh/serialization/serializers/Canonical.hpp
#pragma once

#include "Primitives.hpp"
#include <algorithm>
#include <cstdint>
#include <vector>

/**
 * Canonical ordering shared by maps and sets.
 *
 * Entries are compared by their encoded bytes (key || value for maps, the
 * element for sets), never by the decoded value, so the output does not
 * depend on insertion order, hash seeds or the key type's operator<.
 * Encodings of one layout are prefix-free, so for distinct keys the order of
 * key || value equals the order of the keys alone.
 */
namespace borsh::serialization {
    /**
     * Sorts pre-encoded entries and appends them as a u32-prefixed sequence.
     *
     * @param buf Output buffer
     * @param entries Encoded entries (consumed)
     */
    inline void serialize_canonical_entries(std::vector<uint8_t>& buf, std::vector<std::vector<uint8_t>> entries) {
        for (const auto& entry : entries) {
            if (entry.empty()) { throw ValueError(detail::zero_sized("serialize_canonical_entries", entries.size())); }
        }
        std::sort(entries.begin(), entries.end());

        serialize_length(buf, entries.size());
        for (const auto& entry : entries) { buf.insert(buf.end(), entry.begin(), entry.end()); }
    }
} // namespace borsh::serialization
