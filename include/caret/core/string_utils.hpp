#ifndef CARET_CORE_STRING_UTILS_HPP
#define CARET_CORE_STRING_UTILS_HPP

#include "config.hpp"
#include "utf8.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace caret::core::utils {

    inline static auto rtrim(std::string& str, std::string_view chars = " \t\n\r\f\v") -> std::string& {
        str.erase(str.find_last_not_of(chars) + 1);
        return str;
    }

    static constexpr auto rtrim(std::string_view str, std::string_view chars = " \t\n\r\f\v") noexcept -> std::string_view {
        auto const it = str.find_last_not_of(chars);
        if (it == std::string_view::npos) return {};
        return str.substr(0, it + 1);
    }

    static constexpr auto strip_line_terminator(std::string_view line) noexcept -> std::string_view {
        if (line.ends_with('\n')) line.remove_suffix(1);
        if (line.ends_with('\r')) line.remove_suffix(1);
        return line;
    }

    static constexpr auto iequals(std::string_view lhs, std::string_view rhs) noexcept -> bool {
        if (lhs.size() != rhs.size()) return false;
        for (auto i = 0ul; i < lhs.size(); ++i) {
            auto l = lhs[i];
            auto r = rhs[i];
            if (l >= 'A' && l <= 'Z') l = static_cast<char>(l - 'A' + 'a');
            if (r >= 'A' && r <= 'Z') r = static_cast<char>(r - 'A' + 'a');
            if (l != r) return false;
        }
        return true;
    }

    /**
     * @brief Greedy word wrap measured in display columns.
     * Words wider than `width` are kept whole on their own line.
     */
    inline static auto wrap_words(std::string_view text, dsize_t width) -> std::vector<std::string> {
        auto lines = std::vector<std::string>{};
        if (width == 0) width = 1;

        std::string current;
        dsize_t current_width{};
        std::size_t i = 0;
        while (i < text.size()) {
            while (i < text.size() && text[i] == ' ') ++i;
            if (i >= text.size()) break;
            auto end = text.find(' ', i);
            if (end == std::string_view::npos) end = text.size();
            auto word = text.substr(i, end - i);
            i = end;

            auto word_width = utf8::display_width(word, 1);
            if (current.empty()) {
                current = word;
                current_width = word_width;
                continue;
            }

            if (current_width + 1 + word_width <= width) {
                current += ' ';
                current += word;
                current_width += 1 + word_width;
            } else {
                lines.push_back(std::move(current));
                current = word;
                current_width = word_width;
            }
        }
        if (!current.empty()) lines.push_back(std::move(current));
        return lines;
    }

} // namespace caret::core::utils

#endif // CARET_CORE_STRING_UTILS_HPP
