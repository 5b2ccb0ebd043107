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

// borsh/codec/src/layout/SizeProbe.cpp
#include "borsh/layout/SizeProbe.hpp"
#include "borsh/serialization/serializers/Optional.hpp"
#include "borsh/serialization/serializers/Primitives.hpp"
#include "borsh/serialization/serializers/PublicKey.hpp"

#include <limits>
#include <string>

namespace borsh::layout {
    namespace {
        constexpr size_t SIZE_LIMIT = std::numeric_limits<size_t>::max();

        [[nodiscard]] size_t saturating_add(size_t a, size_t b) noexcept { return a > SIZE_LIMIT - b ? SIZE_LIMIT : a + b; }

        [[nodiscard]] size_t saturating_mul(size_t a, size_t b) noexcept {
            if (a == 0 || b == 0) { return 0; }
            return a > SIZE_LIMIT / b ? SIZE_LIMIT : a * b;
        }

        [[nodiscard]] std::optional<size_t> primitive_width(Primitive kind) noexcept {
            switch (kind) {
                case Primitive::Bool:
                case Primitive::U8:
                case Primitive::I8: return 1;
                case Primitive::U16:
                case Primitive::I16: return 2;
                case Primitive::U32:
                case Primitive::I32:
                case Primitive::F32: return 4;
                case Primitive::U64:
                case Primitive::I64:
                case Primitive::F64: return 8;
                case Primitive::U128:
                case Primitive::I128: return 16;
                case Primitive::String:
                case Primitive::Bytes:
                case Primitive::PublicKey: return std::nullopt;
            }
            return std::nullopt;
        }

        // ==================== Fixed Size ====================

        struct FixedSizer {
            std::optional<size_t> operator()(const PrimitiveLayout& node) const noexcept { return primitive_width(node.kind); }

            std::optional<size_t> operator()(const ArrayLayout& node) const noexcept {
                if (node.length == 0) { return 0; }
                const auto width = fixed_size(*node.element);
                if (!width) { return std::nullopt; }
                if (*width != 0 && node.length > SIZE_LIMIT / *width) { return std::nullopt; }
                return *width * node.length;
            }

            std::optional<size_t> operator()(const VecLayout&) const noexcept { return std::nullopt; }
            std::optional<size_t> operator()(const OptionLayout&) const noexcept { return std::nullopt; }
            std::optional<size_t> operator()(const MapLayout&) const noexcept { return std::nullopt; }
            std::optional<size_t> operator()(const SetLayout&) const noexcept { return std::nullopt; }

            std::optional<size_t> operator()(const TupleLayout& node) const noexcept {
                size_t total = 0;
                for (const auto& element : node.elements) {
                    const auto width = fixed_size(*element);
                    if (!width) { return std::nullopt; }
                    total += *width;
                }
                return total;
            }

            std::optional<size_t> operator()(const StructLayout& node) const noexcept {
                size_t total = 0;
                for (const auto& field : node.fields) {
                    const auto width = fixed_size(*field.layout);
                    if (!width) { return std::nullopt; }
                    total += *width;
                }
                return total;
            }

            // Value dependent even when every variant has the same width.
            std::optional<size_t> operator()(const EnumLayout&) const noexcept { return std::nullopt; }
        };

        // ==================== Min Size ====================

        struct MinSizer {
            size_t operator()(const PrimitiveLayout& node) const noexcept {
                if (node.kind == Primitive::PublicKey) { return sizeof(uint32_t) + serialization::PUBLIC_KEY_MIN_TEXT; }
                return primitive_width(node.kind).value_or(sizeof(uint32_t));
            }

            size_t operator()(const ArrayLayout& node) const noexcept { return saturating_mul(min_size(*node.element), node.length); }
            size_t operator()(const VecLayout&) const noexcept { return sizeof(uint32_t); }
            size_t operator()(const OptionLayout&) const noexcept { return 1; }
            size_t operator()(const MapLayout&) const noexcept { return sizeof(uint32_t); }
            size_t operator()(const SetLayout&) const noexcept { return sizeof(uint32_t); }

            size_t operator()(const TupleLayout& node) const noexcept {
                size_t total = 0;
                for (const auto& element : node.elements) { total = saturating_add(total, min_size(*element)); }
                return total;
            }

            size_t operator()(const StructLayout& node) const noexcept {
                size_t total = 0;
                for (const auto& field : node.fields) { total = saturating_add(total, min_size(*field.layout)); }
                return total;
            }

            size_t operator()(const EnumLayout& node) const noexcept {
                size_t smallest = SIZE_LIMIT;
                for (const auto& variant : node.variants) {
                    const size_t payload = variant.payload() ? min_size(*variant.payload()) : 0;
                    if (payload < smallest) { smallest = payload; }
                }
                return saturating_add(1, smallest);
            }
        };

        // ==================== Probe ====================

        size_t probe_at(const Layout& layout, std::span<const uint8_t> data, size_t offset);

        /**
         * Returns offset + count after checking that count bytes remain.
         */
        size_t advance(const Layout& layout, std::span<const uint8_t> data, size_t offset, size_t count) {
            const size_t remaining = data.size() - offset;
            if (count > remaining) {
                throw FormatError(serialization::detail::insufficient(("probe " + layout.describe()).c_str(), count, remaining));
            }
            return offset + count;
        }

        uint32_t peek_length(const Layout& layout, std::span<const uint8_t> data, size_t offset) {
            advance(layout, data, offset, sizeof(uint32_t));
            auto view = data.subspan(offset);
            return serialization::deserialize_length(view);
        }

        /**
         * Length-prefixed collections admit zero-sized elements only when empty.
         */
        void check_prefixed(const Layout& owner, size_t count, size_t element_min) {
            if (element_min == 0 && count != 0) {
                throw FormatError("probe " + owner.describe() + ": " + std::to_string(count) + " zero-sized elements");
            }
        }

        size_t probe_elements(const Layout& owner, const Layout& element, std::span<const uint8_t> data, size_t offset, size_t count) {
            if (const auto width = fixed_size(element)) {
                if (*width != 0 && count > (data.size() - offset) / *width) {
                    throw FormatError("probe " + owner.describe() + ": " + std::to_string(count) + " elements exceed remaining " +
                                      std::to_string(data.size() - offset) + " bytes");
                }
                return offset + count * *width;
            }

            for (size_t i = 0; i < count; ++i) { offset = probe_at(element, data, offset); }
            return offset;
        }

        /**
         * Prober - Walks value-dependent nodes. Fixed-width nodes never reach it.
         */
        struct Prober {
            const Layout& layout;
            std::span<const uint8_t> data;
            size_t offset;

            // String or Bytes
            size_t operator()(const PrimitiveLayout&) const {
                const uint32_t length = peek_length(layout, data, offset);
                return advance(layout, data, offset + sizeof(uint32_t), length);
            }

            size_t operator()(const ArrayLayout& node) const { return probe_elements(layout, *node.element, data, offset, node.length); }

            size_t operator()(const VecLayout& node) const {
                const uint32_t count = peek_length(layout, data, offset);
                check_prefixed(layout, count, min_size(*node.element));
                return probe_elements(layout, *node.element, data, offset + sizeof(uint32_t), count);
            }

            size_t operator()(const OptionLayout& node) const {
                advance(layout, data, offset, 1);
                const uint8_t tag = data[offset];
                if (tag == serialization::OPTION_NONE_TAG) { return offset + 1; }
                if (tag != serialization::OPTION_SOME_TAG) {
                    throw FormatError("probe " + layout.describe() + ": invalid option tag " + std::to_string(tag));
                }
                return probe_at(*node.inner, data, offset + 1);
            }

            size_t operator()(const MapLayout& node) const {
                const uint32_t count = peek_length(layout, data, offset);
                check_prefixed(layout, count, min_size(*node.key) + min_size(*node.value));
                size_t pos = offset + sizeof(uint32_t);

                const auto key_width = fixed_size(*node.key);
                const auto value_width = fixed_size(*node.value);
                if (key_width && value_width) {
                    const size_t width = *key_width + *value_width;
                    if (width != 0 && count > (data.size() - pos) / width) {
                        throw FormatError("probe " + layout.describe() + ": " + std::to_string(count) + " entries exceed remaining " +
                                          std::to_string(data.size() - pos) + " bytes");
                    }
                    return pos + count * width;
                }

                for (uint32_t i = 0; i < count; ++i) {
                    pos = probe_at(*node.key, data, pos);
                    pos = probe_at(*node.value, data, pos);
                }
                return pos;
            }

            size_t operator()(const SetLayout& node) const {
                const uint32_t count = peek_length(layout, data, offset);
                check_prefixed(layout, count, min_size(*node.element));
                return probe_elements(layout, *node.element, data, offset + sizeof(uint32_t), count);
            }

            size_t operator()(const TupleLayout& node) const {
                size_t pos = offset;
                for (const auto& element : node.elements) { pos = probe_at(*element, data, pos); }
                return pos;
            }

            size_t operator()(const StructLayout& node) const {
                size_t pos = offset;
                for (const auto& field : node.fields) { pos = probe_at(*field.layout, data, pos); }
                return pos;
            }

            size_t operator()(const EnumLayout& node) const {
                advance(layout, data, offset, 1);
                const uint8_t discriminant = data[offset];
                if (discriminant >= node.variants.size()) {
                    throw FormatError("probe " + layout.describe() + ": discriminant " + std::to_string(discriminant) +
                                      " out of range (" + std::to_string(node.variants.size()) + " variants)");
                }

                const auto& payload = node.variants[discriminant].payload();
                if (!payload) { return offset + 1; }
                return probe_at(*payload, data, offset + 1);
            }
        };

        size_t probe_at(const Layout& layout, std::span<const uint8_t> data, size_t offset) {
            if (const auto width = fixed_size(layout)) { return advance(layout, data, offset, *width); }
            return std::visit(Prober{layout, data, offset}, layout.node());
        }
    } // anonymous namespace

    std::optional<size_t> fixed_size(const Layout& layout) noexcept { return std::visit(FixedSizer{}, layout.node()); }

    size_t static_size(const Layout& layout) {
        const auto width = fixed_size(layout);
        if (!width) { throw SizeUndefinedError("static size of " + layout.describe() + " is undefined: encoded size depends on the value"); }
        return *width;
    }

    size_t min_size(const Layout& layout) noexcept { return std::visit(MinSizer{}, layout.node()); }

    size_t probe_size(const Layout& layout, std::span<const uint8_t> data) { return probe_at(layout, data, 0); }

    std::span<const uint8_t> next_value_bytes(const Layout& layout, std::span<const uint8_t>& data) {
        const size_t length = probe_size(layout, data);
        const auto value = data.first(length);
        data = data.subspan(length);
        return value;
    }
} // namespace borsh::layout
