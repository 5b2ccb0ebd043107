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

// borsh/json/include/borsh/json/ValueJson.hpp
#pragma once

#include "borsh/layout/Layout.hpp"
#include "borsh/layout/Value.hpp"
#include <nlohmann/json.hpp>

/**
 * JSON view of runtime values, for inspection and for building values
 * from JSON arguments.
 *
 * Mapping:
 *  - integers up to 64 bits: numbers; u128/i128: decimal strings
 *  - floats: numbers, infinities as "Infinity" / "-Infinity"
 *  - public keys: base58 strings
 *  - bytes, lists, sets, tuples: arrays
 *  - option: null or the inner value
 *  - struct: object in declared field order
 *  - map: object if every key is a string, else an array of [key, value] pairs
 *  - enum: {"Variant": null | array | object}
 */
namespace borsh::json {
    using Json = nlohmann::ordered_json;

    /**
     * Renders a value as JSON. Does not need the layout.
     */
    [[nodiscard]] Json to_json(const layout::Value& value);

    /**
     * Builds a value of the layout's shape from JSON.
     *
     * Integers are converted to the layout's exact width; 128-bit integers
     * may be given as numbers or decimal strings. A unit variant may also be
     * given as a bare string ("Variant").
     *
     * @throws ValueError on shape, kind or range mismatch
     */
    [[nodiscard]] layout::Value from_json(const layout::Layout& layout, const Json& json);
} // namespace borsh::json
