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

// borsh/codec/include/borsh/serialization/serializers/Variant.hpp
#pragma once

#include "borsh/serialization/Core.hpp"
#include <cstdint>
#include <span>
#include <utility>
#include <variant>
#include <vector>

/**
 * std::variant<Ts...> serialization (tagged union / enum).
 * Format: [u8 discriminant = alternative index] + [payload of that alternative]
 *
 * The alternative index is the wire discriminant, so alternatives must never be
 * reordered once data exists. std::monostate is a unit variant (no payload).
 */
namespace borsh::serialization {
    // Forward declarations
    template <typename T>
    void serialize(std::vector<uint8_t>& buf, const T& value);

    template <typename T>
    [[nodiscard]] T deserialize(std::span<const uint8_t>& data);

    template <typename... Ts>
    void serialize_variant(std::vector<uint8_t>& buf, const std::variant<Ts...>& value) {
        static_assert(sizeof...(Ts) <= 256, "a Borsh enum has at most 256 variants");

        if (value.valueless_by_exception()) { throw ValueError("serialize_variant: variant is valueless"); }

        buf.push_back(static_cast<uint8_t>(value.index()));
        std::visit([&buf](const auto& alternative) { serialize(buf, alternative); }, value);
    }

    namespace detail {
        template <typename Variant, size_t... I>
        [[nodiscard]] Variant deserialize_alternative(size_t index, std::span<const uint8_t>& data, std::index_sequence<I...>) {
            using Factory = Variant (*)(std::span<const uint8_t>&);
            static constexpr Factory factories[] = {
                [](std::span<const uint8_t>& d) -> Variant {
                    return Variant{std::in_place_index<I>, deserialize<std::variant_alternative_t<I, Variant>>(d)};
                }...
            };
            return factories[index](data);
        }
    } // namespace detail

    template <typename... Ts>
    [[nodiscard]] std::variant<Ts...> deserialize_variant(std::span<const uint8_t>& data) {
        static_assert(sizeof...(Ts) <= 256, "a Borsh enum has at most 256 variants");

        if (data.empty()) { throw FormatError("deserialize_variant: insufficient data for discriminant"); }

        const uint8_t index = data[0];
        if (index >= sizeof...(Ts)) {
            throw FormatError("deserialize_variant: discriminant " + std::to_string(index) +
                              " out of range (" + std::to_string(sizeof...(Ts)) + " variants)");
        }
        data = data.subspan(1);

        return detail::deserialize_alternative<std::variant<Ts...>>(index, data, std::index_sequence_for<Ts...>{});
    }
} // namespace borsh::serialization
