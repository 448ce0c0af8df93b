#ifndef AMT_CARET_CORE_TERM_STYLE_HPP
#define AMT_CARET_CORE_TERM_STYLE_HPP

#include "color.hpp"
#include <format>

namespace caret::term {
    struct Style {
        Color text_color{ Color::Default };
        Color bg_color{ Color::Default };
        bool bold{false};
        bool dim{false};
        bool italic{false};
        bool underline{false};

        constexpr auto operator==(Style const&) const noexcept -> bool = default;

        constexpr auto is_plain() const noexcept -> bool {
            return *this == Style{};
        }

        static constexpr auto fg(Color color) noexcept -> Style {
            return { .text_color = color };
        }

        constexpr auto with_bold(bool value = true) const noexcept -> Style {
            auto tmp = *this;
            tmp.bold = value;
            return tmp;
        }

        constexpr auto with_bg(Color color) const noexcept -> Style {
            auto tmp = *this;
            tmp.bg_color = color;
            return tmp;
        }
    };
} // namespace caret::term

namespace caret {
    using term::Style;
} // namespace caret

template <>
struct std::formatter<caret::term::Style> {
    constexpr auto parse(auto& ctx) {
        auto it = ctx.begin();
        while (it != ctx.end()) {
            if (*it == '}') break;
            ++it;
        }
        return it;
    }

    auto format(caret::term::Style const& s, auto& ctx) const {
        auto out = ctx.out();
        out = std::format_to(out, "fg={}", s.text_color);
        if (!s.bg_color.is_default()) out = std::format_to(out, " bg={}", s.bg_color);
        if (s.bold) out = std::format_to(out, " bold");
        if (s.dim) out = std::format_to(out, " dim");
        if (s.italic) out = std::format_to(out, " italic");
        if (s.underline) out = std::format_to(out, " underline");
        return out;
    }
};

#endif // AMT_CARET_CORE_TERM_STYLE_HPP
