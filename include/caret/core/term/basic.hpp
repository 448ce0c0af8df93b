#ifndef AMT_CARET_CORE_TERM_BASIC_HPP
#define AMT_CARET_CORE_TERM_BASIC_HPP

#include "../config.hpp"
#include "color.hpp"
#include "style.hpp"
#include <format>
#include <iterator>
#include <string>
#include <string_view>

namespace caret::core::term {

    static constexpr std::string_view reset_code = "\x1b[0m";

    namespace detail {
        inline auto append_color(std::string& out, Color color, bool bg) -> void {
            if (color.is_rgb()) {
                std::format_to(std::back_inserter(out), "{};2;{};{};{}", bg ? 48 : 38, color.r, color.g, color.b);
                return;
            }

            unsigned code = color.reserved;
            if (code < 8) code += bg ? 40 : 30;
            else code = (bg ? 100 : 90) + code % 8;
            std::format_to(std::back_inserter(out), "{}", code);
        }
    } // namespace detail

    /**
     * @brief SGR escape sequence that selects `style` starting from the default
     * terminal state. Returns an empty string for the plain style.
     */
    inline auto to_ansi_code(caret::term::Style const& style) -> std::string {
        if (style.is_plain()) return {};

        std::string res = "\x1b[";
        bool first = true;
        auto sep = [&] {
            if (!first) res += ';';
            first = false;
        };

        if (style.bold)      { sep(); res += '1'; }
        if (style.dim)       { sep(); res += '2'; }
        if (style.italic)    { sep(); res += '3'; }
        if (style.underline) { sep(); res += '4'; }

        if (!style.text_color.is_default()) {
            sep();
            detail::append_color(res, style.text_color, false);
        }

        if (!style.bg_color.is_default()) {
            sep();
            detail::append_color(res, style.bg_color, true);
        }

        res += 'm';
        return res;
    }

} // namespace caret::core::term

#endif // AMT_CARET_CORE_TERM_BASIC_HPP
