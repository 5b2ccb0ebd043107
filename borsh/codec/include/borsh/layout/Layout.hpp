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

// borsh/codec/include/borsh/layout/Layout.hpp
#pragma once

#include "borsh/serialization/Core.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace borsh::layout {
    using serialization::SchemaError;

    class Layout;

    /**
     * Shared, immutable schema node. Layouts are built once and reused by every
     * encode/decode call, from any number of threads.
     */
    using LayoutPtr = std::shared_ptr<const Layout>;

    /**
     * Primitive - Leaf kinds with a fixed wire rule.
     */
    enum class Primitive : uint8_t {
        Bool,
        U8,
        I8,
        U16,
        I16,
        U32,
        I32,
        U64,
        I64,
        U128,
        I128,
        F32,
        F64,
        String,
        Bytes,
        PublicKey, ///< base58 text in String framing
    };

    /**
     * Returns the Rust-style name of a primitive ("u8", "String", ...).
     */
    [[nodiscard]] std::string_view primitive_name(Primitive kind) noexcept;

    /**
     * Field - Named member of a struct or of a named-fields variant.
     */
    struct Field {
        std::string name;
        LayoutPtr layout;
    };

    // ==================== Layout Nodes ====================

    struct PrimitiveLayout {
        Primitive kind;
    };

    /**
     * Fixed-length array: exactly `length` elements, no prefix.
     */
    struct ArrayLayout {
        LayoutPtr element;
        uint32_t length;
    };

    struct VecLayout {
        LayoutPtr element;
    };

    struct OptionLayout {
        LayoutPtr inner;
    };

    struct MapLayout {
        LayoutPtr key;
        LayoutPtr value;
    };

    struct SetLayout {
        LayoutPtr element;
    };

    /**
     * Positional aggregate: elements back-to-back, no names, no count.
     */
    struct TupleLayout {
        std::vector<LayoutPtr> elements;
    };

    /**
     * Named aggregate: fields back-to-back in declared order.
     */
    struct StructLayout {
        std::vector<Field> fields;
    };

    /**
     * VariantShape - Payload shape of an enum variant.
     */
    enum class VariantShape : uint8_t {
        Unit, ///< No payload bytes
        Tuple, ///< Positional fields
        Named, ///< Named fields (names never reach the wire)
    };

    /**
     * Variant - One declared case of an enum.
     *
     * The ordinal is not stored here: it is the variant's position in the
     * enclosing EnumLayout, which is also its wire discriminant.
     */
    class Variant {
    public:
        [[nodiscard]] static Variant unit(std::string name);
        [[nodiscard]] static Variant tuple(std::string name, std::vector<LayoutPtr> elements);
        [[nodiscard]] static Variant named(std::string name, std::vector<Field> fields);

        [[nodiscard]] const std::string& name() const noexcept { return name_; }
        [[nodiscard]] VariantShape shape() const noexcept { return shape_; }

        /**
         * Returns the payload layout (TupleLayout or StructLayout node), or
         * nullptr for a unit variant.
         */
        [[nodiscard]] const LayoutPtr& payload() const noexcept { return payload_; }

    private:
        Variant(std::string name, VariantShape shape, LayoutPtr payload);

        std::string name_;
        VariantShape shape_;
        LayoutPtr payload_;
    };

    /**
     * Tagged union. Variants are indexed by declaration order.
     */
    struct EnumLayout {
        std::vector<Variant> variants;
        std::unordered_map<std::string, uint8_t> ordinals; ///< name -> discriminant, built once

        /**
         * Looks up the discriminant of a variant by name.
         */
        [[nodiscard]] std::optional<uint8_t> ordinal_of(std::string_view name) const;
    };

    // ==================== Layout ====================

    namespace detail {
        struct LayoutAccess;
    } // namespace detail

    /**
     * Layout - One immutable node of a runtime schema tree.
     *
     * The node is a closed set of kinds; codecs walk the tree with std::visit,
     * one overload per kind.
     */
    class Layout {
    public:
        using Node = std::variant<
            PrimitiveLayout,
            ArrayLayout,
            VecLayout,
            OptionLayout,
            MapLayout,
            SetLayout,
            TupleLayout,
            StructLayout,
            EnumLayout>;

        [[nodiscard]] const Node& node() const noexcept { return node_; }

        /**
         * Returns the node as T, or nullptr if it is another kind.
         */
        template <typename T>
        [[nodiscard]] const T* as() const noexcept { return std::get_if<T>(&node_); }

        /**
         * Renders a Rust-like type name, e.g. "Vec<Option<u8>>", used in error messages.
         */
        [[nodiscard]] std::string describe() const;

    private:
        // Only the validating factories below construct nodes.
        friend struct detail::LayoutAccess;

        explicit Layout(Node node) : node_{std::move(node)} {}

        Node node_;
    };

    // ==================== Factories ====================

    /**
     * Primitive layouts are process-wide constants.
     */
    [[nodiscard]] const LayoutPtr& primitive(Primitive kind);
    [[nodiscard]] const LayoutPtr& boolean();
    [[nodiscard]] const LayoutPtr& u8();
    [[nodiscard]] const LayoutPtr& i8();
    [[nodiscard]] const LayoutPtr& u16();
    [[nodiscard]] const LayoutPtr& i16();
    [[nodiscard]] const LayoutPtr& u32();
    [[nodiscard]] const LayoutPtr& i32();
    [[nodiscard]] const LayoutPtr& u64();
    [[nodiscard]] const LayoutPtr& i64();
    [[nodiscard]] const LayoutPtr& u128();
    [[nodiscard]] const LayoutPtr& i128();
    [[nodiscard]] const LayoutPtr& f32();
    [[nodiscard]] const LayoutPtr& f64();
    [[nodiscard]] const LayoutPtr& string();
    [[nodiscard]] const LayoutPtr& bytes();
    [[nodiscard]] const LayoutPtr& public_key();

    /**
     * Composite factories validate their input.
     *
     * @throws SchemaError on null children, unnamed or duplicate names,
     *         reserved names, or an enum with 0 or more than 256 variants
     */
    [[nodiscard]] LayoutPtr array(LayoutPtr element, uint32_t length);
    [[nodiscard]] LayoutPtr vec(LayoutPtr element);
    [[nodiscard]] LayoutPtr option(LayoutPtr inner);
    [[nodiscard]] LayoutPtr hash_map(LayoutPtr key, LayoutPtr value);
    [[nodiscard]] LayoutPtr hash_set(LayoutPtr element);
    [[nodiscard]] LayoutPtr tuple(std::vector<LayoutPtr> elements);
    [[nodiscard]] LayoutPtr structure(std::vector<Field> fields);
    [[nodiscard]] LayoutPtr enumeration(std::vector<Variant> variants);

    /**
     * Name reserved for the internal payload wrapper of tuple variants.
     */
    inline constexpr std::string_view RESERVED_PAYLOAD_NAME = "tuple_data";

    /**
     * Variant names and variant field names must not start with this prefix.
     */
    inline constexpr char RESERVED_NAME_PREFIX = '_';

    /**
     * Maximum number of enum variants (one discriminant byte).
     */
    inline constexpr size_t MAX_VARIANTS = 256;
} // namespace borsh::layout
