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

// borsh/codec/include/borsh/serialization/Serialization.hpp
#pragma once

// Import all serialization implementations
#include "Core.hpp"
#include "Fields.hpp"
#include "serializers/Primitives.hpp"
#include "serializers/Int128.hpp"
#include "serializers/Bool.hpp"
#include "serializers/String.hpp"
#include "serializers/Vector.hpp"
#include "serializers/Array.hpp"
#include "serializers/Optional.hpp"
#include "serializers/Map.hpp"
#include "serializers/Set.hpp"
#include "serializers/Tuple.hpp"
#include "serializers/Variant.hpp"
#include "serializers/PublicKey.hpp"

#include <optional>
#include <vector>
#include <map>
#include <unordered_map>
#include <set>
#include <unordered_set>
#include <utility>
#include <array>
#include <tuple>
#include <variant>
#include <string>
#include <type_traits>

/**
 * Main header of the typed (compile-time schema) Borsh API.
 *
 * Provides Borsh binary serialization for:
 * - Primitives: bool, (u)int8..64, uint128 / int128, float, double
 * - String: std::string (UTF-8)
 * - Bytes: std::vector<uint8_t>
 * - PublicKey: base58 text in String framing
 * - Containers: std::vector, std::array, std::map, std::unordered_map, std::set, std::unordered_set
 * - Optional: std::optional
 * - Aggregates: std::pair, std::tuple, structs declaring BORSH_FIELDS(...)
 * - Enums: std::variant (alternative index = discriminant), std::monostate as unit variant
 *
 * All values use Little Endian format.
 */
namespace borsh::serialization {
    // ========== Type Traits ==========

    template <typename T>
    struct is_std_array : std::false_type {};

    template <typename T, size_t N>
    struct is_std_array<std::array<T, N>> : std::true_type {
        using element_type = T;
        static constexpr size_t size = N;
    };

    template <typename T>
    inline constexpr bool is_std_array_v = is_std_array<T>::value;

    template <typename T>
    struct is_std_tuple : std::false_type {};

    template <typename... Ts>
    struct is_std_tuple<std::tuple<Ts...>> : std::true_type {};

    template <typename T>
    inline constexpr bool is_std_tuple_v = is_std_tuple<T>::value;

    template <typename T>
    struct is_std_variant : std::false_type {};

    template <typename... Ts>
    struct is_std_variant<std::variant<Ts...>> : std::true_type {};

    template <typename T>
    inline constexpr bool is_std_variant_v = is_std_variant<T>::value;

    template <typename T>
    struct is_std_vector : std::false_type {};

    template <typename T>
    struct is_std_vector<std::vector<T>> : std::true_type {};

    template <typename T>
    inline constexpr bool is_std_vector_v = is_std_vector<T>::value;

    template <typename T>
    struct is_std_optional : std::false_type {};

    template <typename T>
    struct is_std_optional<std::optional<T>> : std::true_type {};

    template <typename T>
    inline constexpr bool is_std_optional_v = is_std_optional<T>::value;

    template <typename T>
    struct is_std_map : std::false_type {};

    template <typename K, typename V>
    struct is_std_map<std::map<K, V>> : std::true_type {};

    template <typename K, typename V>
    struct is_std_map<std::unordered_map<K, V>> : std::true_type {};

    template <typename T>
    inline constexpr bool is_std_map_v = is_std_map<T>::value;

    template <typename T>
    struct is_std_set : std::false_type {};

    template <typename T>
    struct is_std_set<std::set<T>> : std::true_type {};

    template <typename T>
    struct is_std_set<std::unordered_set<T>> : std::true_type {};

    template <typename T>
    inline constexpr bool is_std_set_v = is_std_set<T>::value;

    template <typename T>
    struct is_std_pair : std::false_type {};

    template <typename T1, typename T2>
    struct is_std_pair<std::pair<T1, T2>> : std::true_type {};

    template <typename T>
    inline constexpr bool is_std_pair_v = is_std_pair<T>::value;

    // ========== Generic Serialize ==========

    /**
     * Generic serialize function that dispatches to the correct type handler.
     *
     * @param buf Output buffer (appended to)
     * @param value Value to encode
     * @throws ValueError if the value has no valid encoding (NaN, invalid UTF-8, oversized length)
     */
    template <typename T>
    void serialize(std::vector<uint8_t>& buf, const T& value) {
        // ========== Primitives ==========
        if constexpr (std::is_same_v<T, bool>) { serialize_bool(buf, value); }
        else if constexpr (std::is_same_v<T, uint128>) { serialize_u128(buf, value); }
        else if constexpr (std::is_same_v<T, int128>) { serialize_i128(buf, value); }
        else if constexpr (WireIntegral<T>) { serialize_integral(buf, value); }
        else if constexpr (WireFloat<T>) { serialize_float(buf, value); }

        // ========== Basic Types ==========
        else if constexpr (std::is_same_v<T, std::string>) { serialize_string(buf, value); }
        else if constexpr (std::is_same_v<T, std::vector<uint8_t>>) { serialize_bytes(buf, value); }
        else if constexpr (std::is_same_v<T, PublicKey>) { serialize_public_key(buf, value); }
        else if constexpr (std::is_same_v<T, std::monostate>) {}

        // ========== Containers ==========
        else if constexpr (is_std_vector_v<T>) { serialize_vector(buf, value); }
        else if constexpr (is_std_array_v<T>) { serialize_array(buf, value); }
        else if constexpr (is_std_optional_v<T>) { serialize_optional(buf, value); }
        else if constexpr (is_std_map_v<T>) { serialize_map(buf, value); }
        else if constexpr (is_std_set_v<T>) { serialize_set(buf, value); }

        // ========== Aggregates & Enums ==========
        else if constexpr (is_std_pair_v<T>) { serialize_pair(buf, value); }
        else if constexpr (is_std_tuple_v<T>) { serialize_tuple(buf, value); }
        else if constexpr (is_std_variant_v<T>) { serialize_variant(buf, value); }
        else if constexpr (FieldStruct<T>) { serialize_tuple(buf, value.borsh_fields()); }

        // ========== Unsupported ==========
        else {
            static_assert(std::is_void_v<T>,
                          "Unsupported type for serialization. "
                          "Supported: primitives, uint128/int128, bool, std::string, PublicKey, std::vector, std::array, "
                          "std::optional, std::map, std::unordered_map, std::set, std::unordered_set, "
                          "std::pair, std::tuple, std::variant, structs with BORSH_FIELDS.");
        }
    }

    // ========== Generic Deserialize ==========

    /**
     * Generic deserialize function that dispatches to the correct type handler.
     *
     * This function fulfills the forward declarations in all serialization headers.
     * Supports recursive deserialization for nested types.
     *
     * @param data Input data (will be advanced)
     * @return Deserialized value
     * @throws FormatError if the bytes are malformed or truncated
     */
    template <typename T>
    [[nodiscard]] T deserialize(std::span<const uint8_t>& data) {
        // ========== Primitives ==========
        if constexpr (std::is_same_v<T, bool>) { return deserialize_bool(data); }
        else if constexpr (std::is_same_v<T, uint128>) { return deserialize_u128(data); }
        else if constexpr (std::is_same_v<T, int128>) { return deserialize_i128(data); }
        else if constexpr (WireIntegral<T>) { return deserialize_integral<T>(data); }
        else if constexpr (WireFloat<T>) { return deserialize_float<T>(data); }

        // ========== Basic Types ==========
        else if constexpr (std::is_same_v<T, std::string>) { return deserialize_string(data); }
        else if constexpr (std::is_same_v<T, std::vector<uint8_t>>) { return deserialize_bytes(data); }
        else if constexpr (std::is_same_v<T, PublicKey>) { return deserialize_public_key(data); }
        else if constexpr (std::is_same_v<T, std::monostate>) { return std::monostate{}; }

        // ========== Containers ==========
        else if constexpr (is_std_vector_v<T>) { return deserialize_vector<typename T::value_type>(data); }
        else if constexpr (is_std_array_v<T>) {
            using Traits = is_std_array<T>;
            return deserialize_array<typename Traits::element_type, Traits::size>(data);
        }
        else if constexpr (is_std_optional_v<T>) { return deserialize_optional<typename T::value_type>(data); }
        else if constexpr (is_std_map_v<T>) {
            if constexpr (std::is_same_v<T, std::map<typename T::key_type, typename T::mapped_type>>) {
                return deserialize_map<typename T::key_type, typename T::mapped_type>(data);
            }
            else { return deserialize_unordered_map<typename T::key_type, typename T::mapped_type>(data); }
        }
        else if constexpr (is_std_set_v<T>) {
            if constexpr (std::is_same_v<T, std::set<typename T::key_type>>) { return deserialize_set<typename T::key_type>(data); }
            else { return deserialize_unordered_set<typename T::key_type>(data); }
        }

        // ========== Aggregates & Enums ==========
        else if constexpr (is_std_pair_v<T>) { return deserialize_pair<typename T::first_type, typename T::second_type>(data); }
        else if constexpr (is_std_tuple_v<T>) {
            return []<typename... Ts>(std::type_identity<std::tuple<Ts...>>, std::span<const uint8_t>& d) {
                return deserialize_tuple<Ts...>(d);
            }(std::type_identity<T>{}, data);
        }
        else if constexpr (is_std_variant_v<T>) {
            return []<typename... Ts>(std::type_identity<std::variant<Ts...>>, std::span<const uint8_t>& d) {
                return deserialize_variant<Ts...>(d);
            }(std::type_identity<T>{}, data);
        }
        else if constexpr (FieldStruct<T>) {
            T result{};
            std::apply([&data](auto&... fields) {
                ((fields = deserialize<std::remove_cvref_t<decltype(fields)>>(data)), ...);
            }, result.borsh_fields());
            return result;
        }

        // ========== Unsupported ==========
        else {
            static_assert(std::is_void_v<T>, "Unsupported type for deserialization. See serialize() for the supported list.");
            throw SerializationException("Unsupported type for deserialization");
        }
    }

    // ========== Size ==========

    /**
     * Returns the exact number of bytes serialize() will append for this value.
     */
    template <typename T>
    [[nodiscard]] size_t encoded_size(const T& value) {
        if constexpr (std::is_same_v<T, uint128> || std::is_same_v<T, int128>) { return 16; }
        else if constexpr (std::is_same_v<T, bool> || WireIntegral<T> || WireFloat<T>) { return sizeof(T); }
        else if constexpr (std::is_same_v<T, std::string> || std::is_same_v<T, std::vector<uint8_t>>) { return 4 + value.size(); }
        else if constexpr (std::is_same_v<T, PublicKey>) { return public_key_encoded_size(value); }
        else if constexpr (std::is_same_v<T, std::monostate>) { return 0; }
        else if constexpr (is_std_vector_v<T> || is_std_set_v<T>) {
            size_t total = 4; // size prefix
            for (const auto& item : value) { total += encoded_size(item); }
            return total;
        }
        else if constexpr (is_std_map_v<T>) {
            size_t total = 4; // size prefix
            for (const auto& [key, mapped] : value) { total += encoded_size(key) + encoded_size(mapped); }
            return total;
        }
        else if constexpr (is_std_array_v<T>) {
            size_t total = 0;
            for (const auto& item : value) { total += encoded_size(item); }
            return total;
        }
        else if constexpr (is_std_optional_v<T>) { return value.has_value() ? 1 + encoded_size(*value) : 1; }
        else if constexpr (is_std_pair_v<T>) { return encoded_size(value.first) + encoded_size(value.second); }
        else if constexpr (is_std_tuple_v<T>) {
            return std::apply([](const auto&... items) { return (size_t{0} + ... + encoded_size(items)); }, value);
        }
        else if constexpr (is_std_variant_v<T>) {
            return 1 + std::visit([](const auto& alternative) { return encoded_size(alternative); }, value);
        }
        else if constexpr (FieldStruct<T>) {
            return std::apply([](const auto&... fields) { return (size_t{0} + ... + encoded_size(fields)); }, value.borsh_fields());
        }
        else { static_assert(std::is_void_v<T>, "Unsupported type for encoded_size"); }
    }

    // ========== Convenience ==========

    template <typename T>
    [[nodiscard]] std::vector<uint8_t> to_bytes(const T& value) {
        std::vector<uint8_t> buf;
        buf.reserve(encoded_size(value));
        serialize(buf, value);
        return buf;
    }

    /**
     * Decodes one T from the front of bytes. Trailing bytes are ignored.
     */
    template <typename T>
    [[nodiscard]] T from_bytes(std::span<const uint8_t> bytes) { return deserialize<T>(bytes); }
} // namespace borsh::serialization
