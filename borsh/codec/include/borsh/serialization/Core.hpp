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

// borsh/codec/include/borsh/serialization/Core.hpp
#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace borsh::serialization {
    /**
     * Exception thrown when serialization/deserialization fails.
     *
     * Base of every error the codec raises. Catch this to handle all of them.
     */
    class SerializationException : public std::runtime_error {
    public:
        explicit SerializationException(const std::string& msg) : std::runtime_error(msg) {}
    };

    /**
     * Invalid schema construction (reserved or duplicate names, unnamed fields,
     * malformed variant declarations). Only raised while building a layout.
     */
    class SchemaError : public SerializationException {
    public:
        explicit SchemaError(const std::string& msg) : SerializationException(msg) {}
    };

    /**
     * Malformed input bytes: truncated stream, invalid UTF-8, NaN bit pattern,
     * out-of-range tag or discriminant, count larger than the remaining stream.
     */
    class FormatError : public SerializationException {
    public:
        explicit FormatError(const std::string& msg) : SerializationException(msg) {}
    };

    /**
     * Value that cannot be encoded: NaN float, fixed-array length mismatch,
     * undeclared enum variant, kind or range mismatch with the layout.
     */
    class ValueError : public SerializationException {
    public:
        explicit ValueError(const std::string& msg) : SerializationException(msg) {}
    };

    /**
     * Static size requested for a layout whose encoded size depends on the value.
     */
    class SizeUndefinedError : public SerializationException {
    public:
        explicit SizeUndefinedError(const std::string& msg) : SerializationException(msg) {}
    };

    namespace detail {
        [[nodiscard]] inline std::string insufficient(const char* what, size_t need, size_t got) {
            return std::string(what) + ": insufficient data (need " + std::to_string(need) + ", got " + std::to_string(got) + ")";
        }

        /**
         * Elements that encode to no bytes cannot be counted on the wire: the
         * prefix could claim any number of them without the stream growing.
         * Only an empty collection of them is accepted.
         */
        [[nodiscard]] inline std::string zero_sized(const char* what, size_t count) {
            return std::string(what) + ": " + std::to_string(count) + " zero-sized elements";
        }
    } // namespace detail
} // namespace borsh::serialization
