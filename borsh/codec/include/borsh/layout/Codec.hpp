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

// borsh/codec/include/borsh/layout/Codec.hpp
#pragma once

#include "Layout.hpp"
#include "Value.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

/**
 * Schema-driven encode/decode.
 *
 * Every function is a pure recursive walk over an immutable layout; nothing
 * is cached per call, so any number of threads may share one layout.
 */
namespace borsh::layout {
    using serialization::FormatError;

    /**
     * Decode configuration.
     */
    struct DecodeOptions {
        /**
         * Accept bytes after the decoded value. Account buffers are usually
         * allocated larger than their payload, so this defaults to true.
         */
        bool allow_trailing_bytes = true;
    };

    /**
     * DecodeResult - Decoded value and the number of bytes it occupied.
     */
    struct DecodeResult {
        Value value;
        size_t consumed;
    };

    /**
     * Appends the encoding of value to buf.
     *
     * @throws ValueError if the value does not fit the layout or has no encoding
     */
    void serialize(std::vector<uint8_t>& buf, const Layout& layout, const Value& value);

    /**
     * Decodes one value and advances data past it.
     *
     * @throws FormatError if the bytes are malformed or truncated
     */
    [[nodiscard]] Value deserialize(const Layout& layout, std::span<const uint8_t>& data);

    [[nodiscard]] std::vector<uint8_t> encode(const Layout& layout, const Value& value);

    [[nodiscard]] DecodeResult decode_prefix(const Layout& layout, std::span<const uint8_t> data);

    /**
     * Decodes the value at the front of data.
     *
     * @throws FormatError if malformed, or if trailing bytes remain and
     *         options.allow_trailing_bytes is false
     */
    [[nodiscard]] Value decode(const Layout& layout, std::span<const uint8_t> data, const DecodeOptions& options = {});

    /**
     * Codec - A schema node bound to the encode/decode/size operations.
     *
     * Cheap to copy (one shared pointer); stateless.
     */
    class Codec {
    public:
        /**
         * @throws SchemaError if layout is null
         */
        explicit Codec(LayoutPtr layout);

        [[nodiscard]] const LayoutPtr& layout() const noexcept { return layout_; }

        [[nodiscard]] std::vector<uint8_t> encode(const Value& value) const { return layout::encode(*layout_, value); }

        [[nodiscard]] Value decode(std::span<const uint8_t> data, const DecodeOptions& options = {}) const {
            return layout::decode(*layout_, data, options);
        }

        [[nodiscard]] DecodeResult decode_prefix(std::span<const uint8_t> data) const { return layout::decode_prefix(*layout_, data); }

        [[nodiscard]] std::optional<size_t> fixed_size() const noexcept;
        [[nodiscard]] size_t static_size() const;
        [[nodiscard]] size_t probe_size(std::span<const uint8_t> data) const;

    private:
        LayoutPtr layout_;
    };
} // namespace borsh::layout
