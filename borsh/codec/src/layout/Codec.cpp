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

// borsh/codec/src/layout/Codec.cpp
#include "borsh/layout/Codec.hpp"
#include "borsh/layout/SizeProbe.hpp"
#include "borsh/serialization/serializers/Bool.hpp"
#include "borsh/serialization/serializers/Canonical.hpp"
#include "borsh/serialization/serializers/Int128.hpp"
#include "borsh/serialization/serializers/Optional.hpp"
#include "borsh/serialization/serializers/Primitives.hpp"
#include "borsh/serialization/serializers/PublicKey.hpp"
#include "borsh/serialization/serializers/String.hpp"
#include "borsh/serialization/serializers/Vector.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <set>
#include <string>

namespace borsh::layout {
    namespace {
        [[noreturn]] void reject(const Layout& layout, const std::string& what) {
            throw ValueError("encode " + layout.describe() + ": " + what);
        }

        [[noreturn]] void malformed(const Layout& layout, const std::string& what) {
            throw FormatError("decode " + layout.describe() + ": " + what);
        }

        template <typename T>
        [[nodiscard]] const T& expect(const Layout& layout, const Value& value, std::string_view expected) {
            if (const T* held = std::get_if<T>(&value.storage())) { return *held; }
            reject(layout, "expected " + std::string(expected) + ", got " + std::string(value.kind_name()));
        }

        // ==================== Scalars ====================

        template <typename T>
        [[nodiscard]] T to_integer(const Layout& layout, const Value& value) {
            if (const auto number = value.integer_as<T>()) { return *number; }
            if (!value.is_integer()) { reject(layout, "expected an integer, got " + std::string(value.kind_name())); }
            reject(layout, std::string(value.kind_name()) + " value is out of range");
        }

        [[nodiscard]] double to_float(const Layout& layout, const Value& value, bool single) {
            double number;
            if (const auto* f = std::get_if<float>(&value.storage())) {
                number = *f;
            } else if (const auto* d = std::get_if<double>(&value.storage())) {
                number = *d;
            } else {
                reject(layout, "expected a float, got " + std::string(value.kind_name()));
            }

            if (std::isnan(number)) { reject(layout, "NaN has no canonical encoding"); }
            if (single && std::isfinite(number) && std::fabs(number) > std::numeric_limits<float>::max()) {
                reject(layout, std::to_string(number) + " is out of range");
            }
            return number;
        }

        // ==================== Encode ====================

        void encode_value(std::vector<uint8_t>& buf, const Layout& layout, const Value& value);

        /**
         * Stand-in for a missing variant payload; encoding it against a
         * non-empty payload layout reports the missing element or field.
         */
        [[nodiscard]] const Value& empty_payload(VariantShape shape) {
            static const Value empty_list{ValueList{}};
            static const Value empty_record{StructValue{}};
            return shape == VariantShape::Named ? empty_record : empty_list;
        }

        /**
         * A count of zero-sized elements is not recoverable from the stream,
         * so only empty collections of them are encoded.
         */
        void reject_zero_sized(const Layout& layout, size_t count, size_t element_min) {
            if (element_min == 0 && count != 0) { reject(layout, std::to_string(count) + " zero-sized elements"); }
        }

        struct Encoder {
            std::vector<uint8_t>& buf;
            const Layout& layout;
            const Value& value;

            void operator()(const PrimitiveLayout& node) const {
                using namespace serialization;

                switch (node.kind) {
                    case Primitive::Bool: serialize_bool(buf, expect<bool>(layout, value, "bool")); break;
                    case Primitive::U8: serialize_integral(buf, to_integer<uint8_t>(layout, value)); break;
                    case Primitive::I8: serialize_integral(buf, to_integer<int8_t>(layout, value)); break;
                    case Primitive::U16: serialize_integral(buf, to_integer<uint16_t>(layout, value)); break;
                    case Primitive::I16: serialize_integral(buf, to_integer<int16_t>(layout, value)); break;
                    case Primitive::U32: serialize_integral(buf, to_integer<uint32_t>(layout, value)); break;
                    case Primitive::I32: serialize_integral(buf, to_integer<int32_t>(layout, value)); break;
                    case Primitive::U64: serialize_integral(buf, to_integer<uint64_t>(layout, value)); break;
                    case Primitive::I64: serialize_integral(buf, to_integer<int64_t>(layout, value)); break;
                    case Primitive::U128: serialize_u128(buf, to_integer<uint128>(layout, value)); break;
                    case Primitive::I128: serialize_i128(buf, to_integer<int128>(layout, value)); break;
                    case Primitive::F32: serialize_float(buf, static_cast<float>(to_float(layout, value, true))); break;
                    case Primitive::F64: serialize_float(buf, to_float(layout, value, false)); break;
                    case Primitive::String: {
                        const auto& text = expect<std::string>(layout, value, "string");
                        if (!is_valid_utf8(text)) { reject(layout, "invalid UTF-8"); }
                        serialize_string(buf, text);
                        break;
                    }
                    case Primitive::Bytes: serialize_bytes(buf, expect<Bytes>(layout, value, "bytes")); break;
                    case Primitive::PublicKey: serialize_public_key(buf, expect<PublicKey>(layout, value, "pubkey")); break;
                }
            }

            void operator()(const ArrayLayout& node) const {
                const auto& items = expect<ValueList>(layout, value, "list");
                if (items.size() != node.length) {
                    reject(layout, "expected " + std::to_string(node.length) + " elements, got " + std::to_string(items.size()));
                }
                for (const auto& item : items) { encode_value(buf, *node.element, item); }
            }

            void operator()(const VecLayout& node) const {
                const auto& items = expect<ValueList>(layout, value, "list");
                reject_zero_sized(layout, items.size(), min_size(*node.element));
                serialization::serialize_length(buf, items.size());
                for (const auto& item : items) { encode_value(buf, *node.element, item); }
            }

            void operator()(const OptionLayout& node) const {
                const auto& option = expect<OptionValue>(layout, value, "option");
                if (!option.has_value()) {
                    buf.push_back(serialization::OPTION_NONE_TAG);
                    return;
                }
                buf.push_back(serialization::OPTION_SOME_TAG);
                encode_value(buf, *node.inner, *option.inner);
            }

            void operator()(const MapLayout& node) const {
                const auto& map = expect<MapValue>(layout, value, "map");
                reject_zero_sized(layout, map.entries.size(), min_size(*node.key) + min_size(*node.value));

                // Keys that encode identically collapse; the last entry wins.
                std::map<std::vector<uint8_t>, std::vector<uint8_t>> unique;
                for (const auto& [key, item] : map.entries) {
                    std::vector<uint8_t> key_bytes;
                    encode_value(key_bytes, *node.key, key);
                    std::vector<uint8_t> item_bytes;
                    encode_value(item_bytes, *node.value, item);
                    unique.insert_or_assign(std::move(key_bytes), std::move(item_bytes));
                }

                std::vector<std::vector<uint8_t>> entries;
                entries.reserve(unique.size());
                for (const auto& [key_bytes, item_bytes] : unique) {
                    auto& entry = entries.emplace_back(key_bytes);
                    entry.insert(entry.end(), item_bytes.begin(), item_bytes.end());
                }
                serialization::serialize_canonical_entries(buf, std::move(entries));
            }

            void operator()(const SetLayout& node) const {
                const auto& set = expect<SetValue>(layout, value, "set");
                reject_zero_sized(layout, set.elements.size(), min_size(*node.element));

                std::set<std::vector<uint8_t>> unique;
                for (const auto& element : set.elements) {
                    std::vector<uint8_t> element_bytes;
                    encode_value(element_bytes, *node.element, element);
                    unique.insert(std::move(element_bytes));
                }
                serialization::serialize_canonical_entries(buf, std::vector<std::vector<uint8_t>>(unique.begin(), unique.end()));
            }

            void operator()(const TupleLayout& node) const {
                const auto& items = expect<ValueList>(layout, value, "list");
                if (items.size() != node.elements.size()) {
                    reject(layout, "expected " + std::to_string(node.elements.size()) + " elements, got " + std::to_string(items.size()));
                }
                for (size_t i = 0; i < items.size(); ++i) { encode_value(buf, *node.elements[i], items[i]); }
            }

            void operator()(const StructLayout& node) const {
                const auto& record = expect<StructValue>(layout, value, "struct");
                for (const auto& field : node.fields) {
                    const Value* field_value = record.find(field.name);
                    if (!field_value) { reject(layout, "missing field '" + field.name + "'"); }
                    encode_value(buf, *field.layout, *field_value);
                }
            }

            void operator()(const EnumLayout& node) const {
                const auto& chosen = expect<EnumValue>(layout, value, "enum");
                const auto ordinal = node.ordinal_of(chosen.variant);
                if (!ordinal) { reject(layout, "no variant named '" + chosen.variant + "'"); }

                const auto& variant = node.variants[*ordinal];
                if (variant.shape() == VariantShape::Unit) {
                    if (chosen.payload) { reject(layout, "unit variant '" + variant.name() + "' takes no payload"); }
                    buf.push_back(*ordinal);
                    return;
                }

                buf.push_back(*ordinal);
                encode_value(buf, *variant.payload(), chosen.payload ? *chosen.payload : empty_payload(variant.shape()));
            }
        };

        void encode_value(std::vector<uint8_t>& buf, const Layout& layout, const Value& value) {
            std::visit(Encoder{buf, layout, value}, layout.node());
        }

        // ==================== Decode ====================

        Value decode_value(const Layout& layout, std::span<const uint8_t>& data);

        /**
         * Rejects element counts the remaining stream cannot possibly hold,
         * before anything is allocated for them.
         */
        void check_count(const Layout& layout, size_t count, size_t element_min, size_t remaining) {
            if (element_min != 0 && count > remaining / element_min) {
                malformed(layout, "count " + std::to_string(count) + " exceeds remaining " + std::to_string(remaining) + " bytes");
            }
        }

        /**
         * check_count() for length-prefixed collections, which additionally
         * admit no zero-sized elements beyond an empty collection.
         */
        void check_prefixed_count(const Layout& layout, size_t count, size_t element_min, size_t remaining) {
            if (element_min == 0 && count != 0) { malformed(layout, std::to_string(count) + " zero-sized elements"); }
            check_count(layout, count, element_min, remaining);
        }

        [[nodiscard]] size_t reserve_bound(size_t count, std::span<const uint8_t> data) noexcept { return std::min(count, data.size()); }

        /**
         * Fails with the layout name when fewer than need bytes remain.
         */
        void require(const Layout& layout, std::span<const uint8_t> data, size_t need) {
            if (data.size() < need) {
                throw FormatError(serialization::detail::insufficient(("decode " + layout.describe()).c_str(), need, data.size()));
            }
        }

        [[nodiscard]] uint32_t read_count(const Layout& layout, std::span<const uint8_t>& data) {
            require(layout, data, sizeof(uint32_t));
            return serialization::deserialize_length(data);
        }

        [[nodiscard]] std::vector<uint8_t> consumed_bytes(std::span<const uint8_t> before, std::span<const uint8_t> after) {
            const auto used = before.first(before.size() - after.size());
            return std::vector<uint8_t>(used.begin(), used.end());
        }

        struct Decoder {
            const Layout& layout;
            std::span<const uint8_t>& data;

            Value operator()(const PrimitiveLayout& node) const {
                using namespace serialization;

                if (const auto width = fixed_size(layout)) {
                    require(layout, data, *width);
                } else {
                    require(layout, data, sizeof(uint32_t));
                    auto peek = data;
                    require(layout, data, sizeof(uint32_t) + static_cast<size_t>(deserialize_length(peek)));
                }

                switch (node.kind) {
                    case Primitive::Bool: return deserialize_bool(data);
                    case Primitive::U8: return deserialize_integral<uint8_t>(data);
                    case Primitive::I8: return deserialize_integral<int8_t>(data);
                    case Primitive::U16: return deserialize_integral<uint16_t>(data);
                    case Primitive::I16: return deserialize_integral<int16_t>(data);
                    case Primitive::U32: return deserialize_integral<uint32_t>(data);
                    case Primitive::I32: return deserialize_integral<int32_t>(data);
                    case Primitive::U64: return deserialize_integral<uint64_t>(data);
                    case Primitive::I64: return deserialize_integral<int64_t>(data);
                    case Primitive::U128: return deserialize_u128(data);
                    case Primitive::I128: return deserialize_i128(data);
                    case Primitive::F32: return deserialize_float<float>(data);
                    case Primitive::F64: return deserialize_float<double>(data);
                    case Primitive::String: return deserialize_string(data);
                    case Primitive::Bytes: return deserialize_bytes(data);
                    case Primitive::PublicKey: {
                        const auto key = PublicKey::parse(deserialize_string(data));
                        if (!key) { malformed(layout, "not a base58 32-byte key"); }
                        return *key;
                    }
                }
                malformed(layout, "unknown primitive kind");
            }

            Value operator()(const ArrayLayout& node) const {
                check_count(layout, node.length, min_size(*node.element), data.size());

                ValueList items;
                items.reserve(reserve_bound(node.length, data));
                for (uint32_t i = 0; i < node.length; ++i) { items.push_back(decode_value(*node.element, data)); }
                return items;
            }

            Value operator()(const VecLayout& node) const {
                const uint32_t count = read_count(layout, data);
                check_prefixed_count(layout, count, min_size(*node.element), data.size());

                ValueList items;
                items.reserve(reserve_bound(count, data));
                for (uint32_t i = 0; i < count; ++i) { items.push_back(decode_value(*node.element, data)); }
                return items;
            }

            Value operator()(const OptionLayout& node) const {
                require(layout, data, 1);
                if (!serialization::deserialize_option_tag(data)) { return Value::none(); }
                return Value::some(decode_value(*node.inner, data));
            }

            Value operator()(const MapLayout& node) const {
                const uint32_t count = read_count(layout, data);
                check_prefixed_count(layout, count, min_size(*node.key) + min_size(*node.value), data.size());

                // Duplicate keys (by encoded bytes): the last entry wins.
                MapValue map;
                map.entries.reserve(reserve_bound(count, data));
                std::map<std::vector<uint8_t>, size_t> positions;
                for (uint32_t i = 0; i < count; ++i) {
                    const auto before = data;
                    Value key = decode_value(*node.key, data);
                    auto key_bytes = consumed_bytes(before, data);
                    Value item = decode_value(*node.value, data);

                    const auto [it, inserted] = positions.try_emplace(std::move(key_bytes), map.entries.size());
                    if (inserted) {
                        map.entries.emplace_back(std::move(key), std::move(item));
                    } else {
                        map.entries[it->second].second = std::move(item);
                    }
                }
                return map;
            }

            Value operator()(const SetLayout& node) const {
                const uint32_t count = read_count(layout, data);
                check_prefixed_count(layout, count, min_size(*node.element), data.size());

                SetValue set;
                set.elements.reserve(reserve_bound(count, data));
                std::set<std::vector<uint8_t>> seen;
                for (uint32_t i = 0; i < count; ++i) {
                    const auto before = data;
                    Value element = decode_value(*node.element, data);
                    if (seen.insert(consumed_bytes(before, data)).second) { set.elements.push_back(std::move(element)); }
                }
                return set;
            }

            Value operator()(const TupleLayout& node) const {
                ValueList items;
                items.reserve(node.elements.size());
                for (const auto& element : node.elements) { items.push_back(decode_value(*element, data)); }
                return items;
            }

            Value operator()(const StructLayout& node) const {
                StructValue record;
                record.fields.reserve(node.fields.size());
                for (const auto& field : node.fields) { record.fields.emplace_back(field.name, decode_value(*field.layout, data)); }
                return record;
            }

            Value operator()(const EnumLayout& node) const {
                require(layout, data, 1);

                const uint8_t discriminant = data[0];
                if (discriminant >= node.variants.size()) {
                    malformed(layout, "discriminant " + std::to_string(discriminant) + " out of range (" +
                                      std::to_string(node.variants.size()) + " variants)");
                }
                data = data.subspan(1);

                const auto& variant = node.variants[discriminant];
                if (!variant.payload()) { return Value::unit_variant(variant.name()); }
                return EnumValue{variant.name(), std::make_shared<const Value>(decode_value(*variant.payload(), data))};
            }
        };

        Value decode_value(const Layout& layout, std::span<const uint8_t>& data) { return std::visit(Decoder{layout, data}, layout.node()); }
    } // anonymous namespace

    // ==================== Public API ====================

    void serialize(std::vector<uint8_t>& buf, const Layout& layout, const Value& value) { encode_value(buf, layout, value); }

    Value deserialize(const Layout& layout, std::span<const uint8_t>& data) { return decode_value(layout, data); }

    std::vector<uint8_t> encode(const Layout& layout, const Value& value) {
        std::vector<uint8_t> buf;
        if (const auto width = fixed_size(layout)) { buf.reserve(*width); }
        encode_value(buf, layout, value);
        return buf;
    }

    DecodeResult decode_prefix(const Layout& layout, std::span<const uint8_t> data) {
        auto rest = data;
        Value value = decode_value(layout, rest);
        return DecodeResult{std::move(value), data.size() - rest.size()};
    }

    Value decode(const Layout& layout, std::span<const uint8_t> data, const DecodeOptions& options) {
        auto result = decode_prefix(layout, data);
        if (!options.allow_trailing_bytes && result.consumed != data.size()) {
            malformed(layout, std::to_string(data.size() - result.consumed) + " trailing bytes after value");
        }
        return std::move(result.value);
    }

    // ==================== Codec ====================

    Codec::Codec(LayoutPtr layout) : layout_{std::move(layout)} {
        if (!layout_) { throw SchemaError("Codec: null layout"); }
    }

    std::optional<size_t> Codec::fixed_size() const noexcept { return layout::fixed_size(*layout_); }

    size_t Codec::static_size() const { return layout::static_size(*layout_); }

    size_t Codec::probe_size(std::span<const uint8_t> data) const { return layout::probe_size(*layout_, data); }
} // namespace borsh::layout
