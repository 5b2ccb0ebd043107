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

// borsh/codec/include/borsh/serialization/Fields.hpp
#pragma once

#include <tuple>
#include <type_traits>

/**
 * BORSH_FIELDS - Declares the wire fields of a struct, in wire order.
 *
 * Usage:
 *   struct Counter {
 *       uint64_t count;
 *       std::string authority;
 *       std::optional<uint8_t> bump;
 *
 *       BORSH_FIELDS(count, authority, bump)
 *   };
 *
 * Members not listed are not serialized. The struct must be default
 * constructible; deserialization assigns each listed member in order.
 * An empty BORSH_FIELDS() declares a unit struct (zero bytes on the wire).
 */
#define BORSH_FIELDS(...) \
    [[nodiscard]] auto borsh_fields() noexcept { return std::tie(__VA_ARGS__); } \
    [[nodiscard]] auto borsh_fields() const noexcept { return std::tie(__VA_ARGS__); }

namespace borsh::serialization {
    /**
     * Types that declared their fields with BORSH_FIELDS.
     */
    template <typename T>
    concept FieldStruct = std::is_default_constructible_v<T> && requires(T& value, const T& cvalue) {
        value.borsh_fields();
        cvalue.borsh_fields();
    };
} // namespace borsh::serialization
