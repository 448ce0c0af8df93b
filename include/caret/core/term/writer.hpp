#ifndef AMT_CARET_CORE_TERM_WRITER_HPP
#define AMT_CARET_CORE_TERM_WRITER_HPP

#include "config.hpp"
#include <concepts>
#include <cstdio>
#include <string>
#include <string_view>

namespace caret {
    // A writer reports a rejected chunk by returning `false` from `write`.
    template <typename C>
    struct Writer;

    template <>
    struct Writer<FILE*> {
        constexpr Writer(FILE* handle) noexcept
            : m_handle(handle)
        {}

        auto is_displayed() const noexcept -> bool {
            return core::term::is_displayed(m_handle);
        }

        constexpr auto get_handle() const noexcept -> FILE* {
            return m_handle;
        }

        [[nodiscard]] auto write(std::string_view str) noexcept -> bool {
            if (str.empty()) return true;
            if (m_handle == nullptr) return false;
            auto written = std::fwrite(str.data(), 1, str.size(), m_handle);
            return written == str.size();
        }

        auto flush() noexcept -> void {
            if (m_handle) std::fflush(m_handle);
        }

    private:
        FILE* m_handle;
    };

    template <>
    struct Writer<std::string> {
        constexpr Writer(std::string& out) noexcept
            : m_out(&out)
        {}

        constexpr auto is_displayed() const noexcept -> bool {
            return false;
        }

        [[nodiscard]] auto write(std::string_view str) -> bool {
            m_out->append(str);
            return true;
        }

        constexpr auto flush() noexcept -> void {}

        constexpr auto str() const noexcept -> std::string const& {
            return *m_out;
        }

    private:
        std::string* m_out;
    };

    namespace detail {
        template <typename T>
        concept WriterHasHandle = requires (Writer<T> const& w) {
            { w.get_handle() } -> std::same_as<FILE*>;
        };
    } // namespace detail
} // namespace caret

#endif // AMT_CARET_CORE_TERM_WRITER_HPP
