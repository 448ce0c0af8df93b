#ifndef AMT_CARET_CORE_TERM_CONFIG_HPP
#define AMT_CARET_CORE_TERM_CONFIG_HPP

#include "../config.hpp"
#include <cstdio>
#include <cstdlib>
#include <string_view>

#ifdef CARET_OS_UNIX
    #include <unistd.h>
#elif defined(CARET_OS_WIN)
    #include <io.h>
#else
    #error "Unsupported platform"
#endif

namespace caret::core::term {

    namespace detail {
        static inline auto check_terminal_environment_for_colors() noexcept -> bool {
            auto const* term = std::getenv("TERM");
            if (term == nullptr) return false;

            std::string_view info(term);
            if (info.empty() || info == "dumb") return false;
            return (info == "ansi")
                || info == "cygwin"
                || info == "linux"
                || info.starts_with("tmux")
                || info.starts_with("screen")
                || info.starts_with("xterm")
                || info.starts_with("vt100")
                || info.starts_with("rxvt")
                || info.ends_with("color");
        }

        static inline auto get_fd_from_handle(FILE* handle) noexcept -> int {
            #ifdef CARET_OS_UNIX
                return fileno(handle);
            #else
                return _fileno(handle);
            #endif
        }
    } // namespace detail

    static inline auto is_displayed(int fd) noexcept -> bool {
        #ifdef CARET_OS_UNIX
            return isatty(fd) != 0;
        #else
            return _isatty(fd) != 0;
        #endif
    }

    static inline auto is_displayed(FILE* handle) noexcept -> bool {
        if (handle == nullptr) return false;
        return is_displayed(detail::get_fd_from_handle(handle));
    }

    // https://no-color.org: any non-empty value disables colors.
    static inline auto color_disabled_by_environment() noexcept -> bool {
        auto const* value = std::getenv("NO_COLOR");
        return value != nullptr && *value != '\0';
    }

    static inline auto supports_color(FILE* handle) noexcept -> bool {
        if (color_disabled_by_environment()) return false;
        return is_displayed(handle) && detail::check_terminal_environment_for_colors();
    }

} // namespace caret::core::term

#endif // AMT_CARET_CORE_TERM_CONFIG_HPP
