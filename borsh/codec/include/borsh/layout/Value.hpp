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

// borsh/codec/include/borsh/layout/Value.hpp
#pragma once

#include "borsh/serialization/Core.hpp"
#include "borsh/serialization/serializers/Int128.hpp"
#include "borsh/serialization/serializers/PublicKey.hpp"
#include <cstdint>
#include <initializer_list>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace borsh::layout {
    using serialization::ValueError;
    using serialization::uint128;
    using serialization::int128;
    using serialization::PublicKey;

    class Value;

    namespace detail {
        template <typename T>
        inline constexpr bool is_wire_integer = std::is_same_v<T, int128> || std::is_same_v<T, uint128> ||
            (std::is_integral_v<T> && !std::is_same_v<T, bool> && sizeof(T) <= 8);

        template <typename T>
        inline constexpr bool is_signed_integer = std::is_same_v<T, int128> || (std::is_integral_v<T> && std::is_signed_v<T>);

        template <typename T>
        [[nodiscard]] constexpr uint128 max_magnitude() noexcept {
            if constexpr (std::is_same_v<T, uint128>) {
                return serialization::UINT128_MAX_VALUE;
            } else if constexpr (std::is_same_v<T, int128>) {
                return static_cast<uint128>(serialization::INT128_MAX_VALUE);
            } else {
                return static_cast<uint128>(std::numeric_limits<T>::max());
            }
        }
    } // namespace detail

    using Bytes = std::vector<uint8_t>;

    /**
     * Elements of an array, a vector, a tuple or a tuple variant payload.
     */
    using ValueList = std::vector<Value>;

    /**
     * OptionValue - Present (inner set) or absent (inner null).
     */
    struct OptionValue {
        std::shared_ptr<const Value> inner;

        [[nodiscard]] bool has_value() const noexcept { return inner != nullptr; }
    };

    /**
     * MapValue - Key/value entries. Order is not significant.
     */
    struct MapValue {
        std::vector<std::pair<Value, Value>> entries;
    };

    /**
     * SetValue - Elements. Order is not significant.
     */
    struct SetValue {
        ValueList elements;
    };

    /**
     * StructValue - Named fields, in declared order when produced by decode.
     */
    struct StructValue {
        std::vector<std::pair<std::string, Value>> fields;

        /**
         * Returns the field value, or nullptr if absent.
         */
        [[nodiscard]] const Value* find(std::string_view name) const noexcept;
    };

    /**
     * EnumValue - Variant identity plus payload.
     *
     * payload is null for a unit variant, holds a ValueList for a tuple
     * variant and a StructValue for a named-fields variant.
     */
    struct EnumValue {
        std::string variant;
        std::shared_ptr<const Value> payload;
    };

    /**
     * Value - Dynamic value of a runtime layout.
     *
     * Holds exactly one alternative. Scalars keep their exact width, so a value
     * decoded from a u8 layout is a uint8_t. A default-constructed Value is an
     * absent option.
     *
     * Thread-safety: Immutable after construction; shared payloads are const.
     */
    class Value {
    public:
        using Storage = std::variant<
            OptionValue,
            bool,
            int8_t,
            uint8_t,
            int16_t,
            uint16_t,
            int32_t,
            uint32_t,
            int64_t,
            uint64_t,
            int128,
            uint128,
            float,
            double,
            std::string,
            Bytes,
            ValueList,
            MapValue,
            SetValue,
            StructValue,
            EnumValue,
            PublicKey>;

        Value() = default;

        Value(bool v) : storage_{v} {}
        Value(int8_t v) : storage_{v} {}
        Value(uint8_t v) : storage_{v} {}
        Value(int16_t v) : storage_{v} {}
        Value(uint16_t v) : storage_{v} {}
        Value(int32_t v) : storage_{v} {}
        Value(uint32_t v) : storage_{v} {}
        Value(int64_t v) : storage_{v} {}
        Value(uint64_t v) : storage_{v} {}
        Value(int128 v) : storage_{v} {}
        Value(uint128 v) : storage_{v} {}
        Value(float v) : storage_{v} {}
        Value(double v) : storage_{v} {}
        Value(std::string v) : storage_{std::move(v)} {}
        Value(const char* v) : storage_{std::string(v)} {}
        Value(Bytes v) : storage_{std::move(v)} {}
        Value(ValueList v) : storage_{std::move(v)} {}
        Value(OptionValue v) : storage_{std::move(v)} {}
        Value(MapValue v) : storage_{std::move(v)} {}
        Value(SetValue v) : storage_{std::move(v)} {}
        Value(StructValue v) : storage_{std::move(v)} {}
        Value(EnumValue v) : storage_{std::move(v)} {}
        Value(PublicKey v) : storage_{v} {}

        // ==================== Builders ====================

        [[nodiscard]] static Value none() { return Value{OptionValue{}}; }
        [[nodiscard]] static Value some(Value inner);
        [[nodiscard]] static Value list(std::initializer_list<Value> items) { return Value{ValueList(items)}; }
        [[nodiscard]] static Value map(std::vector<std::pair<Value, Value>> entries) { return Value{MapValue{std::move(entries)}}; }
        [[nodiscard]] static Value set(ValueList elements) { return Value{SetValue{std::move(elements)}}; }
        [[nodiscard]] static Value record(std::vector<std::pair<std::string, Value>> fields) { return Value{StructValue{std::move(fields)}}; }
        [[nodiscard]] static Value unit_variant(std::string name);
        [[nodiscard]] static Value tuple_variant(std::string name, ValueList items);
        [[nodiscard]] static Value named_variant(std::string name, std::vector<std::pair<std::string, Value>> fields);

        // ==================== Accessors ====================

        [[nodiscard]] const Storage& storage() const noexcept { return storage_; }

        template <typename T>
        [[nodiscard]] bool is() const noexcept { return std::holds_alternative<T>(storage_); }

        /**
         * Returns the held alternative.
         *
         * @throws ValueError if the value holds another kind
         */
        template <typename T>
        [[nodiscard]] const T& as() const {
            if (const T* held = std::get_if<T>(&storage_)) { return *held; }
            throw ValueError("Value: expected " + std::string(kind_name_of<T>()) + ", holds " + std::string(kind_name()));
        }

        /**
         * True if the value holds any integer alternative (bool excluded).
         */
        [[nodiscard]] bool is_integer() const noexcept {
            return std::visit([](const auto& held) { return detail::is_wire_integer<std::decay_t<decltype(held)>>; }, storage_);
        }

        /**
         * Converts the held integer to T, whatever its own width and signedness.
         *
         * @return The value as T, or nullopt if it is not an integer or does not fit T
         */
        template <typename T>
        [[nodiscard]] std::optional<T> integer_as() const noexcept {
            return std::visit([](const auto& held) -> std::optional<T> {
                using H = std::decay_t<decltype(held)>;
                if constexpr (!detail::is_wire_integer<H>) {
                    return std::nullopt;
                } else {
                    constexpr uint128 max = detail::max_magnitude<T>();
                    if constexpr (detail::is_signed_integer<H>) {
                        if (held < 0) {
                            if constexpr (detail::is_signed_integer<T>) {
                                const uint128 magnitude = static_cast<uint128>(0) - static_cast<uint128>(held);
                                if (magnitude > max + 1) { return std::nullopt; }
                                return static_cast<T>(held);
                            } else {
                                return std::nullopt;
                            }
                        }
                    }
                    if (static_cast<uint128>(held) > max) { return std::nullopt; }
                    return static_cast<T>(held);
                }
            }, storage_);
        }

        /**
         * Returns a short name of the held kind ("u8", "string", "struct", ...).
         */
        [[nodiscard]] std::string_view kind_name() const noexcept;

        /**
         * Deep equality. Maps and sets compare as unordered collections.
         */
        friend bool operator==(const Value& lhs, const Value& rhs);

    private:
        template <typename T, typename... Ts>
        [[nodiscard]] static constexpr size_t index_of(std::type_identity<std::variant<Ts...>>) noexcept {
            constexpr bool matches[] = {std::is_same_v<T, Ts>...};
            for (size_t i = 0; i < sizeof...(Ts); ++i) {
                if (matches[i]) { return i; }
            }
            return sizeof...(Ts);
        }

        template <typename T>
        [[nodiscard]] static std::string_view kind_name_of() noexcept {
            return kind_name_at(index_of<T>(std::type_identity<Storage>{}));
        }

        [[nodiscard]] static std::string_view kind_name_at(size_t index) noexcept;

        Storage storage_;
    };

    bool operator==(const OptionValue& lhs, const OptionValue& rhs);
    bool operator==(const MapValue& lhs, const MapValue& rhs);
    bool operator==(const SetValue& lhs, const SetValue& rhs);
    bool operator==(const StructValue& lhs, const StructValue& rhs);
    bool operator==(const EnumValue& lhs, const EnumValue& rhs);
} // namespace borsh::layout
