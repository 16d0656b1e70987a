#pragma once

#include <algorithm>
#include <charconv>
#include <concepts>
#include <optional>
#include <string_view>
#include <type_traits>

namespace MiniTftp::Meta {
    template <typename T>
    concept OctetKind = std::is_same_v<T, char> or std::is_same_v<T, unsigned char>;

    [[nodiscard]] constexpr char toLowerAscii(char c) noexcept {
        return (c >= 'A' and c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
    }

    /// NOTE: ASCII-only folding, TFTP mode names never carry anything else.
    [[nodiscard]] constexpr bool equalsIgnoreCase(std::string_view lhs, std::string_view rhs) noexcept {
        if (lhs.length() != rhs.length()) {
            return false;
        }

        return std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
            return toLowerAscii(a) == toLowerAscii(b);
        });
    }

    /// @brief Parses a whole decimal string, rejecting signs, blanks and trailing junk.
    template <std::unsigned_integral T>
    [[nodiscard]] std::optional<T> parseUnsigned(std::string_view text) noexcept {
        T value {};
        const auto* text_end = text.data() + text.length();

        if (text.empty()) {
            return {};
        }

        if (const auto [stop_ptr, parse_error] = std::from_chars(text.data(), text_end, value); parse_error != std::errc {} or stop_ptr != text_end) {
            return {};
        }

        return value;
    }
}
