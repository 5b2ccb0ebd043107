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

// borsh/codec/include/borsh/serialization/serializers/Tuple.hpp
#pragma once

#include <cstdint>
#include <tuple>
#include <utility>
#include <span>
#include <vector>

/**
 * std::pair<T1, T2> and std::tuple<Ts...> serialization.
 * Format: [first] + [second] + ... (positional, no count prefix)
 */
namespace borsh::serialization {
    // Forward declarations
    template <typename T>
    void serialize(std::vector<uint8_t>& buf, const T& value);

    template <typename T>
    [[nodiscard]] T deserialize(std::span<const uint8_t>& data);

    template <typename T1, typename T2>
    void serialize_pair(std::vector<uint8_t>& buf, const std::pair<T1, T2>& pair) {
        serialize(buf, pair.first);
        serialize(buf, pair.second);
    }

    template <typename T1, typename T2>
    [[nodiscard]] std::pair<T1, T2> deserialize_pair(std::span<const uint8_t>& data) {
        T1 first = deserialize<T1>(data);
        T2 second = deserialize<T2>(data);
        return {std::move(first), std::move(second)};
    }

    template <typename... Ts>
    void serialize_tuple(std::vector<uint8_t>& buf, const std::tuple<Ts...>& tuple) {
        std::apply([&buf](const auto&... items) { (serialize(buf, items), ...); }, tuple);
    }

    template <typename... Ts>
    [[nodiscard]] std::tuple<Ts...> deserialize_tuple(std::span<const uint8_t>& data) {
        // Braced init guarantees left-to-right evaluation
        return std::tuple<Ts...>{deserialize<Ts>(data)...};
    }
} // namespace borsh::serialization
