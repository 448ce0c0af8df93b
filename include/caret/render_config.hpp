#ifndef AMT_CARET_RENDER_CONFIG_HPP
#define AMT_CARET_RENDER_CONFIG_HPP

#include "basic.hpp"
#include "core/config.hpp"
#include "core/term/color.hpp"
#include "core/term/style.hpp"
#include <array>
#include <optional>
#include <string_view>

namespace caret {
    struct Markers {
        std::string_view primary            = "^";
        std::string_view secondary          = "-";
        std::string_view connector_start    = "/";
        std::string_view connector_bar      = "|";
        std::string_view connector_end      = "\\";
        std::string_view gutter_bar         = "|";
        std::string_view note               = "=";
        std::string_view elision            = "...";
    };

    struct RenderConfig {
        dsize_t tab_width{4};
        // Lines shown around the labelled lines of a file.
        dsize_t context_lines{0};
        // Interior lines of a multi-line span are shown when there are at most this many.
        dsize_t elision_threshold{3};
        std::optional<dsize_t> start_context_lines{};
        std::optional<dsize_t> end_context_lines{};
        dsize_t max_message_width{60};
        Markers markers{};
        std::array<Color, severity_elements_count> severity_colors{
            /*Bug    */ Color::Red,
            /*Error  */ Color::Red,
            /*Warning*/ Color::Yellow,
            /*Note   */ Color::Green,
            /*Help   */ Color::Cyan
        };
        Color secondary_color{ Color::Blue };
        Color gutter_color{ Color::Blue };

        constexpr auto leading_context() const noexcept -> dsize_t {
            return start_context_lines.value_or(context_lines);
        }

        constexpr auto trailing_context() const noexcept -> dsize_t {
            return end_context_lines.value_or(context_lines);
        }

        constexpr auto severity_color(Severity severity) const noexcept -> Color {
            return severity_colors[static_cast<std::size_t>(severity)];
        }

        constexpr auto label_style(Severity severity, LabelStyle style) const noexcept -> Style {
            if (style == LabelStyle::Primary) return Style::fg(severity_color(severity));
            return Style::fg(secondary_color);
        }

        constexpr auto marker(LabelStyle style) const noexcept -> std::string_view {
            return style == LabelStyle::Primary ? markers.primary : markers.secondary;
        }
    };
} // namespace caret

#endif // AMT_CARET_RENDER_CONFIG_HPP
