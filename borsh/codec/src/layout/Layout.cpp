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

// borsh/codec/src/layout/Layout.cpp
#include "borsh/layout/Layout.hpp"

#include <array>
#include <unordered_set>
#include <utility>

namespace borsh::layout {
    namespace {
        constexpr size_t PRIMITIVE_COUNT = static_cast<size_t>(Primitive::PublicKey) + 1;

        void require_child(const LayoutPtr& child, std::string_view where) {
            if (!child) { throw SchemaError(std::string(where) + ": null layout"); }
        }

        /**
         * Rules shared by variant names and the field names of named variants.
         */
        void check_variant_name(std::string_view name, std::string_view what) {
            if (name.empty()) { throw SchemaError("Unnamed " + std::string(what) + " not allowed"); }
            if (name == RESERVED_PAYLOAD_NAME) {
                throw SchemaError("The name '" + std::string(RESERVED_PAYLOAD_NAME) + "' is reserved and cannot be used as " +
                                  std::string(what) + " name");
            }
            if (name.front() == RESERVED_NAME_PREFIX) {
                throw SchemaError(std::string(what) + " name '" + std::string(name) + "' cannot start with '" +
                                  std::string(1, RESERVED_NAME_PREFIX) + "'");
            }
        }

        void check_fields(const std::vector<Field>& fields, std::string_view where) {
            std::unordered_set<std::string_view> seen;
            for (const auto& field : fields) {
                if (field.name.empty()) { throw SchemaError(std::string(where) + ": unnamed fields not allowed"); }
                require_child(field.layout, std::string(where) + " field '" + field.name + "'");
                if (!seen.insert(field.name).second) {
                    throw SchemaError(std::string(where) + ": duplicate field '" + field.name + "'");
                }
            }
        }

        std::string join_layouts(const std::vector<LayoutPtr>& layouts) {
            std::string out;
            for (size_t i = 0; i < layouts.size(); ++i) {
                if (i > 0) { out += ", "; }
                out += layouts[i]->describe();
            }
            return out;
        }

        std::string join_fields(const std::vector<Field>& fields) {
            std::string out;
            for (size_t i = 0; i < fields.size(); ++i) {
                if (i > 0) { out += ", "; }
                out += fields[i].name + ": " + fields[i].layout->describe();
            }
            return out;
        }

        /**
         * Describer - Renders a layout node as a type name.
         */
        struct Describer {
            std::string operator()(const PrimitiveLayout& node) const { return std::string(primitive_name(node.kind)); }

            std::string operator()(const ArrayLayout& node) const {
                return "[" + node.element->describe() + "; " + std::to_string(node.length) + "]";
            }

            std::string operator()(const VecLayout& node) const { return "Vec<" + node.element->describe() + ">"; }
            std::string operator()(const OptionLayout& node) const { return "Option<" + node.inner->describe() + ">"; }

            std::string operator()(const MapLayout& node) const {
                return "HashMap<" + node.key->describe() + ", " + node.value->describe() + ">";
            }

            std::string operator()(const SetLayout& node) const { return "HashSet<" + node.element->describe() + ">"; }
            std::string operator()(const TupleLayout& node) const { return "(" + join_layouts(node.elements) + ")"; }
            std::string operator()(const StructLayout& node) const { return "struct { " + join_fields(node.fields) + " }"; }

            std::string operator()(const EnumLayout& node) const {
                std::string out = "enum { ";
                for (size_t i = 0; i < node.variants.size(); ++i) {
                    const auto& variant = node.variants[i];
                    if (i > 0) { out += ", "; }
                    out += variant.name();

                    switch (variant.shape()) {
                        case VariantShape::Unit:
                            break;
                        case VariantShape::Tuple:
                            out += "(" + join_layouts(variant.payload()->as<TupleLayout>()->elements) + ")";
                            break;
                        case VariantShape::Named:
                            out += " { " + join_fields(variant.payload()->as<StructLayout>()->fields) + " }";
                            break;
                    }
                }
                return out + " }";
            }
        };
    } // anonymous namespace

    std::string_view primitive_name(Primitive kind) noexcept {
        switch (kind) {
            case Primitive::Bool: return "bool";
            case Primitive::U8: return "u8";
            case Primitive::I8: return "i8";
            case Primitive::U16: return "u16";
            case Primitive::I16: return "i16";
            case Primitive::U32: return "u32";
            case Primitive::I32: return "i32";
            case Primitive::U64: return "u64";
            case Primitive::I64: return "i64";
            case Primitive::U128: return "u128";
            case Primitive::I128: return "i128";
            case Primitive::F32: return "f32";
            case Primitive::F64: return "f64";
            case Primitive::String: return "String";
            case Primitive::Bytes: return "Bytes";
            case Primitive::PublicKey: return "PublicKey";
        }
        return "unknown";
    }

    // ==================== Variant ====================

    Variant::Variant(std::string name, VariantShape shape, LayoutPtr payload) : name_{std::move(name)}
                                                                                , shape_{shape}
                                                                                , payload_{std::move(payload)} {}

    Variant Variant::unit(std::string name) {
        check_variant_name(name, "enum variant");
        return Variant{std::move(name), VariantShape::Unit, nullptr};
    }

    Variant Variant::tuple(std::string name, std::vector<LayoutPtr> elements) {
        check_variant_name(name, "enum variant");
        auto payload = layout::tuple(std::move(elements));
        return Variant{std::move(name), VariantShape::Tuple, std::move(payload)};
    }

    Variant Variant::named(std::string name, std::vector<Field> fields) {
        check_variant_name(name, "enum variant");
        for (const auto& field : fields) { check_variant_name(field.name, "variant field"); }
        auto payload = structure(std::move(fields));
        return Variant{std::move(name), VariantShape::Named, std::move(payload)};
    }

    std::optional<uint8_t> EnumLayout::ordinal_of(std::string_view name) const {
        const auto it = ordinals.find(std::string(name));
        if (it == ordinals.end()) { return std::nullopt; }
        return it->second;
    }

    std::string Layout::describe() const { return std::visit(Describer{}, node_); }

    // ==================== Factories ====================

    namespace detail {
        struct LayoutAccess {
            [[nodiscard]] static LayoutPtr make(Layout::Node node) { return LayoutPtr(new Layout(std::move(node))); }
        };
    } // namespace detail

    const LayoutPtr& primitive(Primitive kind) {
        static const std::array<LayoutPtr, PRIMITIVE_COUNT> table = [] {
            std::array<LayoutPtr, PRIMITIVE_COUNT> t;
            for (size_t i = 0; i < PRIMITIVE_COUNT; ++i) {
                t[i] = detail::LayoutAccess::make(PrimitiveLayout{static_cast<Primitive>(i)});
            }
            return t;
        }();
        return table[static_cast<size_t>(kind)];
    }

    const LayoutPtr& boolean() { return primitive(Primitive::Bool); }
    const LayoutPtr& u8() { return primitive(Primitive::U8); }
    const LayoutPtr& i8() { return primitive(Primitive::I8); }
    const LayoutPtr& u16() { return primitive(Primitive::U16); }
    const LayoutPtr& i16() { return primitive(Primitive::I16); }
    const LayoutPtr& u32() { return primitive(Primitive::U32); }
    const LayoutPtr& i32() { return primitive(Primitive::I32); }
    const LayoutPtr& u64() { return primitive(Primitive::U64); }
    const LayoutPtr& i64() { return primitive(Primitive::I64); }
    const LayoutPtr& u128() { return primitive(Primitive::U128); }
    const LayoutPtr& i128() { return primitive(Primitive::I128); }
    const LayoutPtr& f32() { return primitive(Primitive::F32); }
    const LayoutPtr& f64() { return primitive(Primitive::F64); }
    const LayoutPtr& string() { return primitive(Primitive::String); }
    const LayoutPtr& bytes() { return primitive(Primitive::Bytes); }
    const LayoutPtr& public_key() { return primitive(Primitive::PublicKey); }

    LayoutPtr array(LayoutPtr element, uint32_t length) {
        require_child(element, "array");
        return detail::LayoutAccess::make(ArrayLayout{std::move(element), length});
    }

    LayoutPtr vec(LayoutPtr element) {
        require_child(element, "vec");
        return detail::LayoutAccess::make(VecLayout{std::move(element)});
    }

    LayoutPtr option(LayoutPtr inner) {
        require_child(inner, "option");
        return detail::LayoutAccess::make(OptionLayout{std::move(inner)});
    }

    LayoutPtr hash_map(LayoutPtr key, LayoutPtr value) {
        require_child(key, "hash_map key");
        require_child(value, "hash_map value");
        return detail::LayoutAccess::make(MapLayout{std::move(key), std::move(value)});
    }

    LayoutPtr hash_set(LayoutPtr element) {
        require_child(element, "hash_set");
        return detail::LayoutAccess::make(SetLayout{std::move(element)});
    }

    LayoutPtr tuple(std::vector<LayoutPtr> elements) {
        for (size_t i = 0; i < elements.size(); ++i) { require_child(elements[i], "tuple element " + std::to_string(i)); }
        return detail::LayoutAccess::make(TupleLayout{std::move(elements)});
    }

    LayoutPtr structure(std::vector<Field> fields) {
        check_fields(fields, "struct");
        return detail::LayoutAccess::make(StructLayout{std::move(fields)});
    }

    LayoutPtr enumeration(std::vector<Variant> variants) {
        if (variants.empty()) { throw SchemaError("enum: at least one variant is required"); }
        if (variants.size() > MAX_VARIANTS) {
            throw SchemaError("enum: " + std::to_string(variants.size()) + " variants exceed the limit of " + std::to_string(MAX_VARIANTS));
        }

        EnumLayout node;
        for (size_t i = 0; i < variants.size(); ++i) {
            const auto& name = variants[i].name();
            if (!node.ordinals.emplace(name, static_cast<uint8_t>(i)).second) {
                throw SchemaError("enum: duplicate variant '" + name + "'");
            }
        }
        node.variants = std::move(variants);

        return detail::LayoutAccess::make(std::move(node));
    }
} // namespace borsh::layout
