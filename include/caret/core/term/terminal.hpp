#ifndef AMT_CARET_CORE_TERM_TERMINAL_HPP
#define AMT_CARET_CORE_TERM_TERMINAL_HPP

#include "../string_utils.hpp"
#include "basic.hpp"
#include "config.hpp"
#include "style.hpp"
#include "writer.hpp"
#include <cstdio>
#include <optional>
#include <string_view>

namespace caret {

    enum class TerminalColorMode {
        Disable = 0,
        Enable,
        Auto
    };

    /**
     * @brief Parses a `--color` style argument.
     * Accepts `auto`, `always`, `ansi` and `never`, ignoring case.
     */
    constexpr auto parse_color_mode(std::string_view value) noexcept -> std::optional<TerminalColorMode> {
        using core::utils::iequals;
        if (iequals(value, "auto")) return TerminalColorMode::Auto;
        if (iequals(value, "always") || iequals(value, "ansi")) return TerminalColorMode::Enable;
        if (iequals(value, "never")) return TerminalColorMode::Disable;
        return std::nullopt;
    }

    template <typename T>
    struct Terminal {
        using writer_t = Writer<T>;

        Terminal(
            FILE* handle = stderr,
            TerminalColorMode mode = TerminalColorMode::Auto
        ) noexcept requires (detail::WriterHasHandle<T>)
            : m_writer(handle)
            , m_color_enabled(supports_color(handle, mode))
        {}

        Terminal(
            Writer<T> writer,
            TerminalColorMode mode = TerminalColorMode::Disable
        ) noexcept
            : m_writer(std::move(writer))
            , m_color_enabled(mode == TerminalColorMode::Enable)
        {}

        constexpr Terminal(Terminal const&) noexcept = default;
        constexpr Terminal(Terminal &&) noexcept = default;
        constexpr Terminal& operator=(Terminal const&) noexcept = default;
        constexpr Terminal& operator=(Terminal &&) noexcept = default;

        constexpr auto get_handle() noexcept -> FILE* requires (detail::WriterHasHandle<T>) {
            return m_writer.get_handle();
        }

        [[nodiscard]] auto write(std::string_view str) -> bool {
            return m_writer.write(str);
        }

        /**
         * @brief Switches the output to `style`.
         * Nothing is written when colors are disabled or the style is already
         * active. Attributes cannot be turned off individually, so the
         * terminal is reset before a different style is selected.
         */
        [[nodiscard]] auto set_style(Style const& style) -> bool {
            if (!m_color_enabled) return true;
            if (m_current_style == style) return true;
            if (!m_current_style.is_plain()) {
                if (!write(core::term::reset_code)) return false;
                m_current_style = Style{};
            }
            auto code = core::term::to_ansi_code(style);
            if (!write(code)) return false;
            m_current_style = style;
            return true;
        }

        [[nodiscard]] auto reset_style() -> bool {
            if (!m_color_enabled) return true;
            if (m_current_style.is_plain()) return true;
            if (!write(core::term::reset_code)) return false;
            m_current_style = Style{};
            return true;
        }

        constexpr auto current_style() const noexcept -> Style const& {
            return m_current_style;
        }

        auto flush() noexcept -> void {
            m_writer.flush();
        }

        auto is_displayed() const noexcept -> bool {
            return m_writer.is_displayed();
        }

        constexpr auto colors_enabled() const noexcept -> bool {
            return m_color_enabled;
        }

        constexpr auto enable_colors(bool enable) noexcept -> void {
            m_color_enabled = enable;
        }

        constexpr auto writer() noexcept -> writer_t& {
            return m_writer;
        }

        ~Terminal() noexcept {
            flush();
        }

    private:
        static auto supports_color(FILE* handle, TerminalColorMode mode) noexcept -> bool {
            if (mode != TerminalColorMode::Auto) return mode == TerminalColorMode::Enable;
            return core::term::supports_color(handle);
        }

    private:
        writer_t m_writer;
        bool m_color_enabled{false};
        Style m_current_style{};
    };

    Terminal(
        FILE* handle,
        TerminalColorMode mode
    ) -> Terminal<FILE*>;
} // namespace caret

#endif // AMT_CARET_CORE_TERM_TERMINAL_HPP
