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

// borsh/codec/include/borsh/serialization/serializers/PublicKey.hpp
#pragma once

#include "borsh/serialization/Core.hpp"
#include "String.hpp"
#include <algorithm>
#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

/**
 * Account public key serialization.
 * Format: base58 text of the 32 key bytes, framed as a String
 *         ([u32 length (LE)] + [ASCII bytes]).
 */
namespace borsh::serialization {
    inline constexpr size_t PUBLIC_KEY_LENGTH = 32;

    /// Base58 text of 32 bytes is 32 (all zero) to 44 characters long.
    inline constexpr size_t PUBLIC_KEY_MIN_TEXT = 32;
    inline constexpr size_t PUBLIC_KEY_MAX_TEXT = 44;

    namespace detail {
        inline constexpr char BASE58_ALPHABET[] = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

        [[nodiscard]] inline int base58_digit(char c) noexcept {
            for (int i = 0; i < 58; ++i) {
                if (BASE58_ALPHABET[i] == c) { return i; }
            }
            return -1;
        }

        /**
         * Each leading zero byte becomes a '1'; the rest is a base-256 to
         * base-58 conversion.
         */
        [[nodiscard]] inline std::string encode_base58(std::span<const uint8_t> input) {
            size_t zeros = 0;
            while (zeros < input.size() && input[zeros] == 0) { ++zeros; }

            // log(256) / log(58), rounded up
            std::vector<uint8_t> digits((input.size() - zeros) * 138 / 100 + 1);
            size_t length = 0;
            for (size_t i = zeros; i < input.size(); ++i) {
                uint32_t carry = input[i];
                size_t j = 0;
                for (auto it = digits.rbegin(); (carry != 0 || j < length) && it != digits.rend(); ++it, ++j) {
                    carry += 256 * static_cast<uint32_t>(*it);
                    *it = static_cast<uint8_t>(carry % 58);
                    carry /= 58;
                }
                length = j;
            }

            std::string result(zeros, '1');
            for (auto it = digits.end() - static_cast<std::ptrdiff_t>(length); it != digits.end(); ++it) { result += BASE58_ALPHABET[*it]; }
            return result;
        }

        /**
         * @return The decoded bytes, or nullopt on a character outside the alphabet
         */
        [[nodiscard]] inline std::optional<std::vector<uint8_t>> decode_base58(std::string_view text) {
            size_t zeros = 0;
            while (zeros < text.size() && text[zeros] == '1') { ++zeros; }

            // log(58) / log(256), rounded up
            std::vector<uint8_t> bytes((text.size() - zeros) * 733 / 1000 + 1);
            size_t length = 0;
            for (size_t i = zeros; i < text.size(); ++i) {
                const int digit = base58_digit(text[i]);
                if (digit < 0) { return std::nullopt; }

                uint32_t carry = static_cast<uint32_t>(digit);
                size_t j = 0;
                for (auto it = bytes.rbegin(); (carry != 0 || j < length) && it != bytes.rend(); ++it, ++j) {
                    carry += 58 * static_cast<uint32_t>(*it);
                    *it = static_cast<uint8_t>(carry % 256);
                    carry /= 256;
                }
                length = j;
            }

            std::vector<uint8_t> result(zeros, 0);
            result.insert(result.end(), bytes.end() - static_cast<std::ptrdiff_t>(length), bytes.end());
            return result;
        }
    } // namespace detail

    /**
     * PublicKey - 32-byte account address.
     *
     * Travels as its base58 text, so a key occupies 36 to 48 bytes on the wire.
     */
    struct PublicKey {
        std::array<uint8_t, PUBLIC_KEY_LENGTH> bytes{};

        [[nodiscard]] std::string to_base58() const { return detail::encode_base58(bytes); }

        /**
         * @return The key, or nullopt if text is not base58 for exactly 32 bytes
         */
        [[nodiscard]] static std::optional<PublicKey> parse(std::string_view text) {
            if (text.size() < PUBLIC_KEY_MIN_TEXT || text.size() > PUBLIC_KEY_MAX_TEXT) { return std::nullopt; }

            const auto decoded = detail::decode_base58(text);
            if (!decoded || decoded->size() != PUBLIC_KEY_LENGTH) { return std::nullopt; }

            PublicKey key;
            std::copy(decoded->begin(), decoded->end(), key.bytes.begin());
            return key;
        }

        /**
         * @throws ValueError if text is not a base58 public key
         */
        [[nodiscard]] static PublicKey from_base58(std::string_view text) {
            if (auto key = parse(text)) { return *key; }
            throw ValueError("PublicKey: '" + std::string(text) + "' is not a base58 32-byte key");
        }

        bool operator==(const PublicKey&) const = default;
        auto operator<=>(const PublicKey&) const = default;
    };

    inline void serialize_public_key(std::vector<uint8_t>& buf, const PublicKey& key) { serialize_string(buf, key.to_base58()); }

    [[nodiscard]] inline PublicKey deserialize_public_key(std::span<const uint8_t>& data) {
        const std::string text = deserialize_string(data);
        if (auto key = PublicKey::parse(text)) { return *key; }
        throw FormatError("deserialize_public_key: '" + text + "' is not a base58 32-byte key");
    }

    [[nodiscard]] inline size_t public_key_encoded_size(const PublicKey& key) { return sizeof(uint32_t) + key.to_base58().size(); }
} // namespace borsh::serialization
