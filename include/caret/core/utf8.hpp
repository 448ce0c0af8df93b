#ifndef AMT_CARET_CORE_UTF8_HPP
#define AMT_CARET_CORE_UTF8_HPP

#include "config.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace caret::core::utf8 {
    static constexpr std::array<std::uint8_t, 16> lookup {
        1, 1, 1, 1, 1, 1, 1, 1,
        1, 1, 1, 1, 2, 2, 3, 4
    };

    constexpr auto get_length(char c) noexcept -> std::uint8_t {
        auto const byte = static_cast<std::uint8_t>(c);
        return lookup[byte >> 4];
    }

    // Advances a zero-based display column past one codepoint.
    constexpr auto advance(dsize_t column, std::string_view codepoint, dsize_t tab_width) noexcept -> dsize_t {
        if (codepoint == "\t") {
            auto const tw = tab_width == 0 ? dsize_t{1} : tab_width;
            return (column / tw + 1) * tw;
        }
        return column + 1;
    }

    // Visits each codepoint of `text`. Truncated sequences at the end are
    // reported as a single short codepoint.
    template <typename Fn>
    constexpr auto for_each_codepoint(std::string_view text, Fn&& fn) -> void {
        for (std::size_t i = 0; i < text.size();) {
            std::size_t len = get_length(text[i]);
            if (i + len > text.size()) len = text.size() - i;
            fn(i, text.substr(i, len));
            i += len;
        }
    }

    /**
     * @brief Width of the text in display columns.
     * @param text text without line terminators.
     * @param tab_width tab stop distance; a tab advances to the next multiple.
     */
    constexpr auto display_width(std::string_view text, dsize_t tab_width) noexcept -> dsize_t {
        dsize_t column{};
        for_each_codepoint(text, [&](std::size_t, std::string_view cp) {
            column = advance(column, cp, tab_width);
        });
        return column;
    }

    /**
     * @brief 1-based display column of the byte at `offset` inside `line`.
     * An offset inside a multi-byte sequence maps to the column after it.
     */
    constexpr auto column_at(std::string_view line, std::size_t offset, dsize_t tab_width) noexcept -> dsize_t {
        if (offset > line.size()) offset = line.size();
        dsize_t column{};
        for_each_codepoint(line, [&](std::size_t pos, std::string_view cp) {
            if (pos >= offset) return;
            column = advance(column, cp, tab_width);
        });
        return column + 1;
    }

    inline auto expand_tabs(std::string_view line, dsize_t tab_width) -> std::string {
        std::string res;
        res.reserve(line.size());
        dsize_t column{};
        for_each_codepoint(line, [&](std::size_t, std::string_view cp) {
            auto next = advance(column, cp, tab_width);
            if (cp == "\t") res.append(next - column, ' ');
            else res.append(cp);
            column = next;
        });
        return res;
    }
} // namespace caret::core::utf8

#endif // AMT_CARET_CORE_UTF8_HPP
