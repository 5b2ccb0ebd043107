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

// borsh/codec/include/borsh/serialization/serializers/Map.hpp
#pragma once

#include "Canonical.hpp"
#include "Primitives.hpp"
#include <map>
#include <unordered_map>
#include <span>
#include <vector>

/**
 * std::map<K, V> and std::unordered_map<K, V> serialization.
 * Format: [u32 size (LE)] + [key1][value1] + [key2][value2] + ...
 * Entries are sorted by their encoded bytes (see Canonical.hpp).
 */
namespace borsh::serialization {
    // Forward declarations
    template <typename T>
    void serialize(std::vector<uint8_t>& buf, const T& value);

    template <typename T>
    [[nodiscard]] T deserialize(std::span<const uint8_t>& data);

    template <typename MapT>
    void serialize_map(std::vector<uint8_t>& buf, const MapT& map) {
        std::vector<std::vector<uint8_t>> entries;
        entries.reserve(map.size());

        for (const auto& [key, value] : map) {
            std::vector<uint8_t> entry;
            serialize(entry, key);
            serialize(entry, value);
            entries.push_back(std::move(entry));
        }

        serialize_canonical_entries(buf, std::move(entries));
    }

    // ========== std::map ==========

    template <typename K, typename V>
    [[nodiscard]] std::map<K, V> deserialize_map(std::span<const uint8_t>& data) {
        const uint32_t size = deserialize_length(data);

        std::map<K, V> result;

        for (uint32_t i = 0; i < size; i++) {
            const size_t before = data.size();
            K key = deserialize<K>(data);
            V value = deserialize<V>(data);
            if (data.size() == before) { throw FormatError(detail::zero_sized("deserialize_map", size)); }
            result.insert_or_assign(std::move(key), std::move(value));
        }

        return result;
    }

    // ========== std::unordered_map ==========

    template <typename K, typename V>
    [[nodiscard]] std::unordered_map<K, V> deserialize_unordered_map(std::span<const uint8_t>& data) {
        const uint32_t size = deserialize_length(data);

        std::unordered_map<K, V> result;
        result.reserve(std::min<size_t>(size, data.size()));

        for (uint32_t i = 0; i < size; i++) {
            const size_t before = data.size();
            K key = deserialize<K>(data);
            V value = deserialize<V>(data);
            if (data.size() == before) { throw FormatError(detail::zero_sized("deserialize_map", size)); }
            result.insert_or_assign(std::move(key), std::move(value));
        }

        return result;
    }
} // namespace borsh::serialization
