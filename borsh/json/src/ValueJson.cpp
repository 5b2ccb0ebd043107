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

// borsh/json/src/ValueJson.cpp
#include "borsh/json/ValueJson.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

namespace borsh::json {
    using namespace layout;
    using serialization::ValueError;

    namespace {
        constexpr std::string_view POSITIVE_INFINITY = "Infinity";
        constexpr std::string_view NEGATIVE_INFINITY = "-Infinity";

        // ==================== Value -> JSON ====================

        // JSON has no infinity literal.
        template <typename T>
        [[nodiscard]] Json float_json(T number) {
            if (std::isinf(number)) { return std::string(number > 0 ? POSITIVE_INFINITY : NEGATIVE_INFINITY); }
            return number;
        }

        struct ToJson {
            Json operator()(const OptionValue& option) const { return option.has_value() ? to_json(*option.inner) : Json(nullptr); }
            Json operator()(bool flag) const { return flag; }
            Json operator()(int128 number) const { return serialization::to_string(number); }
            Json operator()(uint128 number) const { return serialization::to_string(number); }
            Json operator()(float number) const { return float_json(number); }
            Json operator()(double number) const { return float_json(number); }
            Json operator()(const std::string& text) const { return text; }
            Json operator()(const PublicKey& key) const { return key.to_base58(); }

            template <typename T>
                requires serialization::WireIntegral<T>
            Json operator()(T number) const { return number; }

            Json operator()(const Bytes& bytes) const {
                Json out = Json::array();
                for (const uint8_t byte : bytes) { out.push_back(byte); }
                return out;
            }

            Json operator()(const ValueList& items) const {
                Json out = Json::array();
                for (const auto& item : items) { out.push_back(to_json(item)); }
                return out;
            }

            Json operator()(const MapValue& map) const {
                const bool string_keys = std::all_of(map.entries.begin(), map.entries.end(), [](const auto& entry) {
                    return entry.first.template is<std::string>();
                });

                if (string_keys) {
                    Json out = Json::object();
                    for (const auto& [key, item] : map.entries) { out[key.as<std::string>()] = to_json(item); }
                    return out;
                }

                Json out = Json::array();
                for (const auto& [key, item] : map.entries) { out.push_back(Json::array({to_json(key), to_json(item)})); }
                return out;
            }

            Json operator()(const SetValue& set) const {
                Json out = Json::array();
                for (const auto& element : set.elements) { out.push_back(to_json(element)); }
                return out;
            }

            Json operator()(const StructValue& record) const {
                Json out = Json::object();
                for (const auto& [name, field] : record.fields) { out[name] = to_json(field); }
                return out;
            }

            Json operator()(const EnumValue& chosen) const {
                Json out = Json::object();
                out[chosen.variant] = chosen.payload ? to_json(*chosen.payload) : Json(nullptr);
                return out;
            }
        };

        // ==================== JSON -> Value ====================

        [[noreturn]] void mismatch(const Layout& layout, const std::string& what) {
            throw ValueError("from_json " + layout.describe() + ": " + what);
        }

        void expect_type(const Layout& layout, const Json& json, bool ok, std::string_view expected) {
            if (!ok) { mismatch(layout, "expected " + std::string(expected) + ", got " + json.type_name()); }
        }

        /**
         * Reads a JSON number or decimal string and narrows it to T.
         */
        template <typename T>
        [[nodiscard]] Value integer_from(const Layout& layout, const Json& json) {
            Value raw;
            if (json.is_number_unsigned()) {
                raw = json.get<uint64_t>();
            } else if (json.is_number_integer()) {
                raw = json.get<int64_t>();
            } else if (json.is_string()) {
                const auto& text = json.get_ref<const std::string&>();
                if (!text.empty() && text.front() == '-') {
                    raw = serialization::parse_i128(text);
                } else {
                    raw = serialization::parse_u128(text);
                }
            } else {
                mismatch(layout, std::string("expected an integer, got ") + json.type_name());
            }

            const auto number = raw.integer_as<T>();
            if (!number) { mismatch(layout, json.dump() + " is out of range"); }
            return *number;
        }

        template <typename T>
        [[nodiscard]] Value float_from(const Layout& layout, const Json& json) {
            if (json.is_string()) {
                const auto& text = json.get_ref<const std::string&>();
                if (text == POSITIVE_INFINITY) { return std::numeric_limits<T>::infinity(); }
                if (text == NEGATIVE_INFINITY) { return -std::numeric_limits<T>::infinity(); }
                mismatch(layout, "'" + text + "' is not a number");
            }
            expect_type(layout, json, json.is_number(), "number");

            const auto number = json.get<double>();
            if (std::fabs(number) > std::numeric_limits<T>::max()) { mismatch(layout, json.dump() + " is out of range"); }
            return static_cast<T>(number);
        }

        struct FromJson {
            const Layout& layout;
            const Json& json;

            Value operator()(const PrimitiveLayout& node) const {
                switch (node.kind) {
                    case Primitive::Bool:
                        expect_type(layout, json, json.is_boolean(), "boolean");
                        return json.get<bool>();
                    case Primitive::U8: return integer_from<uint8_t>(layout, json);
                    case Primitive::I8: return integer_from<int8_t>(layout, json);
                    case Primitive::U16: return integer_from<uint16_t>(layout, json);
                    case Primitive::I16: return integer_from<int16_t>(layout, json);
                    case Primitive::U32: return integer_from<uint32_t>(layout, json);
                    case Primitive::I32: return integer_from<int32_t>(layout, json);
                    case Primitive::U64: return integer_from<uint64_t>(layout, json);
                    case Primitive::I64: return integer_from<int64_t>(layout, json);
                    case Primitive::U128: return integer_from<uint128>(layout, json);
                    case Primitive::I128: return integer_from<int128>(layout, json);
                    case Primitive::F32: return float_from<float>(layout, json);
                    case Primitive::F64: return float_from<double>(layout, json);
                    case Primitive::String:
                        expect_type(layout, json, json.is_string(), "string");
                        return json.get<std::string>();
                    case Primitive::Bytes: {
                        expect_type(layout, json, json.is_array(), "array of bytes");
                        Bytes bytes;
                        bytes.reserve(json.size());
                        for (const auto& item : json) {
                            if (!item.is_number_unsigned() || item.get<uint64_t>() > std::numeric_limits<uint8_t>::max()) {
                                mismatch(layout, "byte " + item.dump() + " is not in 0..255");
                            }
                            bytes.push_back(item.get<uint8_t>());
                        }
                        return bytes;
                    }
                    case Primitive::PublicKey: {
                        expect_type(layout, json, json.is_string(), "base58 string");
                        const auto key = PublicKey::parse(json.get_ref<const std::string&>());
                        if (!key) { mismatch(layout, json.dump() + " is not a base58 32-byte key"); }
                        return *key;
                    }
                }
                mismatch(layout, "unknown primitive kind");
            }

            Value operator()(const ArrayLayout& node) const {
                expect_type(layout, json, json.is_array(), "array");
                if (json.size() != node.length) {
                    mismatch(layout, "expected " + std::to_string(node.length) + " elements, got " + std::to_string(json.size()));
                }
                return elements(*node.element);
            }

            Value operator()(const VecLayout& node) const {
                expect_type(layout, json, json.is_array(), "array");
                return elements(*node.element);
            }

            Value operator()(const OptionLayout& node) const {
                if (json.is_null()) { return Value::none(); }
                return Value::some(from_json(*node.inner, json));
            }

            Value operator()(const MapLayout& node) const {
                MapValue map;
                if (json.is_object()) {
                    for (const auto& [key, item] : json.items()) {
                        map.entries.emplace_back(from_json(*node.key, Json(key)), from_json(*node.value, item));
                    }
                    return map;
                }

                expect_type(layout, json, json.is_array(), "object or array of [key, value] pairs");
                for (const auto& pair : json) {
                    if (!pair.is_array() || pair.size() != 2) { mismatch(layout, "map entry " + pair.dump() + " is not a [key, value] pair"); }
                    map.entries.emplace_back(from_json(*node.key, pair[0]), from_json(*node.value, pair[1]));
                }
                return map;
            }

            Value operator()(const SetLayout& node) const {
                expect_type(layout, json, json.is_array(), "array");
                SetValue set;
                set.elements.reserve(json.size());
                for (const auto& item : json) { set.elements.push_back(from_json(*node.element, item)); }
                return set;
            }

            Value operator()(const TupleLayout& node) const {
                expect_type(layout, json, json.is_array(), "array");
                if (json.size() != node.elements.size()) {
                    mismatch(layout, "expected " + std::to_string(node.elements.size()) + " elements, got " + std::to_string(json.size()));
                }

                ValueList items;
                items.reserve(node.elements.size());
                for (size_t i = 0; i < node.elements.size(); ++i) { items.push_back(from_json(*node.elements[i], json[i])); }
                return items;
            }

            // Unknown members are ignored, as encode ignores extra fields.
            Value operator()(const StructLayout& node) const {
                expect_type(layout, json, json.is_object(), "object");
                StructValue record;
                record.fields.reserve(node.fields.size());
                for (const auto& field : node.fields) {
                    const auto it = json.find(field.name);
                    if (it == json.end()) { mismatch(layout, "missing field '" + field.name + "'"); }
                    record.fields.emplace_back(field.name, from_json(*field.layout, *it));
                }
                return record;
            }

            Value operator()(const EnumLayout& node) const {
                if (json.is_string()) { return variant(node, json.get<std::string>(), Json(nullptr)); }

                expect_type(layout, json, json.is_object() && json.size() == 1, "single-key object");
                const auto it = json.begin();
                return variant(node, it.key(), it.value());
            }

        private:
            Value elements(const Layout& element) const {
                ValueList items;
                items.reserve(json.size());
                for (const auto& item : json) { items.push_back(from_json(element, item)); }
                return items;
            }

            Value variant(const EnumLayout& node, const std::string& name, const Json& payload) const {
                const auto ordinal = node.ordinal_of(name);
                if (!ordinal) { mismatch(layout, "no variant named '" + name + "'"); }

                const auto& declared = node.variants[*ordinal];
                if (declared.shape() == VariantShape::Unit) {
                    if (!payload.is_null()) { mismatch(layout, "unit variant '" + name + "' takes no payload"); }
                    return Value::unit_variant(name);
                }
                return EnumValue{name, std::make_shared<const Value>(from_json(*declared.payload(), payload))};
            }
        };
    } // anonymous namespace

    Json to_json(const Value& value) { return std::visit(ToJson{}, value.storage()); }

    Value from_json(const Layout& layout, const Json& json) { return std::visit(FromJson{layout, json}, layout.node()); }
} // namespace borsh::json
