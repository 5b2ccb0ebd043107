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

// borsh/codec/include/borsh/serialization/serializers/Set.hpp
#pragma once

#include "Canonical.hpp"
#include "Primitives.hpp"
#include <set>
#include <unordered_set>
#include <span>
#include <vector>

/**
 * std::set<T> and std::unordered_set<T> serialization.
 * Format: [u32 size (LE)] + [element1] + [element2] + ...
 * Elements are sorted by their encoded bytes (see Canonical.hpp).
 */
namespace borsh::serialization {
    // Forward declarations
    template <typename T>
    void serialize(std::vector<uint8_t>& buf, const T& value);

    template <typename T>
    [[nodiscard]] T deserialize(std::span<const uint8_t>& data);

    template <typename SetT>
    void serialize_set(std::vector<uint8_t>& buf, const SetT& set) {
        std::vector<std::vector<uint8_t>> entries;
        entries.reserve(set.size());

        for (const auto& item : set) {
            std::vector<uint8_t> entry;
            serialize(entry, item);
            entries.push_back(std::move(entry));
        }

        serialize_canonical_entries(buf, std::move(entries));
    }

    // ========== std::set ==========

    template <typename T>
    [[nodiscard]] std::set<T> deserialize_set(std::span<const uint8_t>& data) {
        const uint32_t size = deserialize_length(data);

        std::set<T> result;

        for (uint32_t i = 0; i < size; i++) {
            const size_t before = data.size();
            T element = deserialize<T>(data);
            if (data.size() == before) { throw FormatError(detail::zero_sized("deserialize_set", size)); }
            result.insert(std::move(element));
        }

        return result;
    }

    // ========== std::unordered_set ==========

    template <typename T>
    [[nodiscard]] std::unordered_set<T> deserialize_unordered_set(std::span<const uint8_t>& data) {
        const uint32_t size = deserialize_length(data);

        std::unordered_set<T> result;
        result.reserve(std::min<size_t>(size, data.size()));

        for (uint32_t i = 0; i < size; i++) {
            const size_t before = data.size();
            T element = deserialize<T>(data);
            if (data.size() == before) { throw FormatError(detail::zero_sized("deserialize_set", size)); }
            result.insert(std::move(element));
        }

        return result;
    }
} // namespace borsh::serialization
