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

// borsh/codec/src/layout/Value.cpp
#include "borsh/layout/Value.hpp"

#include <algorithm>
#include <array>

namespace borsh::layout {
    namespace {
        constexpr std::array<std::string_view, std::variant_size_v<Value::Storage>> KIND_NAMES = {
            "option", "bool", "i8", "u8", "i16", "u16", "i32", "u32", "i64", "u64", "i128", "u128",
            "f32", "f64", "string", "bytes", "list", "map", "set", "struct", "enum", "pubkey",
        };

        bool same_payload(const std::shared_ptr<const Value>& lhs, const std::shared_ptr<const Value>& rhs) {
            if (!lhs || !rhs) { return !lhs && !rhs; }
            return *lhs == *rhs;
        }
    } // anonymous namespace

    const Value* StructValue::find(std::string_view name) const noexcept {
        for (const auto& [field_name, value] : fields) {
            if (field_name == name) { return &value; }
        }
        return nullptr;
    }

    // ==================== Builders ====================

    Value Value::some(Value inner) { return Value{OptionValue{std::make_shared<const Value>(std::move(inner))}}; }

    Value Value::unit_variant(std::string name) { return Value{EnumValue{std::move(name), nullptr}}; }

    Value Value::tuple_variant(std::string name, ValueList items) {
        return Value{EnumValue{std::move(name), std::make_shared<const Value>(std::move(items))}};
    }

    Value Value::named_variant(std::string name, std::vector<std::pair<std::string, Value>> fields) {
        return Value{EnumValue{std::move(name), std::make_shared<const Value>(StructValue{std::move(fields)})}};
    }

    // ==================== Kind Names ====================

    std::string_view Value::kind_name() const noexcept { return kind_name_at(storage_.index()); }

    std::string_view Value::kind_name_at(size_t index) noexcept {
        if (index >= KIND_NAMES.size()) { return "valueless"; }
        return KIND_NAMES[index];
    }

    // ==================== Equality ====================

    bool operator==(const Value& lhs, const Value& rhs) {
        if (lhs.storage().index() != rhs.storage().index()) { return false; }

        const auto& other = rhs.storage();
        return std::visit([&other](const auto& held) {
            using T = std::decay_t<decltype(held)>;
            return held == std::get<T>(other);
        }, lhs.storage());
    }

    bool operator==(const OptionValue& lhs, const OptionValue& rhs) { return same_payload(lhs.inner, rhs.inner); }

    bool operator==(const MapValue& lhs, const MapValue& rhs) {
        return lhs.entries.size() == rhs.entries.size() &&
            std::is_permutation(lhs.entries.begin(), lhs.entries.end(), rhs.entries.begin());
    }

    bool operator==(const SetValue& lhs, const SetValue& rhs) {
        return lhs.elements.size() == rhs.elements.size() &&
            std::is_permutation(lhs.elements.begin(), lhs.elements.end(), rhs.elements.begin());
    }

    bool operator==(const StructValue& lhs, const StructValue& rhs) { return lhs.fields == rhs.fields; }

    bool operator==(const EnumValue& lhs, const EnumValue& rhs) {
        return lhs.variant == rhs.variant && same_payload(lhs.payload, rhs.payload);
    }
} // namespace borsh::layout
