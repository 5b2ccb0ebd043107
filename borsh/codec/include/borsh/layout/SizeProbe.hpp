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

// borsh/codec/include/borsh/layout/SizeProbe.hpp
#pragma once

#include "Layout.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

/**
 * Size queries over runtime layouts.
 *
 * Statically sized layouts (scalars and aggregates of them) have a fixed
 * width. Option, enum and the length-prefixed kinds are value dependent:
 * their size is only known by reading the stream, which probe_size() does
 * with tag/length peeks instead of a full decode.
 */
namespace borsh::layout {
    using serialization::FormatError;
    using serialization::SizeUndefinedError;

    /**
     * Returns the encoded width of the layout, or nullopt if it depends on the value.
     */
    [[nodiscard]] std::optional<size_t> fixed_size(const Layout& layout) noexcept;

    /**
     * Returns the encoded width of the layout.
     *
     * @throws SizeUndefinedError if the layout is value dependent (Option, enum, ...)
     */
    [[nodiscard]] size_t static_size(const Layout& layout);

    /**
     * Returns the smallest number of bytes any value of the layout encodes to.
     * Used to reject element counts the remaining stream cannot hold.
     */
    [[nodiscard]] size_t min_size(const Layout& layout) noexcept;

    /**
     * Returns the byte length of the next encoded value at the front of data.
     *
     * Reads only option tags, enum discriminants and length prefixes; scalar
     * contents (UTF-8, NaN, bool range) are not validated.
     *
     * @param layout Layout of the next value
     * @param data Stream positioned at the value (not advanced)
     * @return Encoded length in bytes, always <= data.size()
     * @throws FormatError if the stream is truncated or a tag/discriminant is out of range
     */
    [[nodiscard]] size_t probe_size(const Layout& layout, std::span<const uint8_t> data);

    /**
     * Extracts the raw bytes of the next value without decoding it.
     *
     * @param layout Layout of the next value
     * @param data Input data (will be advanced past the value)
     * @return View of the value's bytes inside the original buffer
     * @throws FormatError as probe_size()
     */
    [[nodiscard]] std::span<const uint8_t> next_value_bytes(const Layout& layout, std::span<const uint8_t>& data);
} // namespace borsh::layout
