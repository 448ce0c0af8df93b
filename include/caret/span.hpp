#ifndef AMT_CARET_SPAN_HPP
#define AMT_CARET_SPAN_HPP

#include "core/config.hpp"
#include <algorithm>
#include <concepts>
#include <cstddef>
#include <format>
#include <utility>

namespace caret {

    using file_id_t = std::size_t;

    /**
     * @brief Half-open byte range `[start, end)` inside one file's source text.
     *
     * The span does not validate itself against the source; a span with
     * `start > end` or past the end of the text is reported as `InvalidSpan`
     * when it is resolved.
     */
    struct Span {
        using size_type = dsize_t;
        constexpr Span() noexcept = default;
        constexpr Span(Span const&) noexcept = default;
        constexpr Span(Span &&) noexcept = default;
        constexpr Span& operator=(Span const&) noexcept = default;
        constexpr Span& operator=(Span &&) noexcept = default;
        constexpr ~Span() noexcept = default;

        constexpr Span(file_id_t file, size_type start, size_type end) noexcept
            : m_file(file)
            , m_start(start)
            , m_end(end)
        {}

        constexpr auto file() const noexcept -> file_id_t { return m_file; }
        constexpr auto start() const noexcept -> size_type { return m_start; }
        constexpr auto end() const noexcept -> size_type { return m_end; }
        constexpr auto size() const noexcept -> size_type { return is_valid() ? m_end - m_start : 0; }
        constexpr auto empty() const noexcept -> bool { return size() == 0; }
        constexpr auto is_valid() const noexcept -> bool { return m_start <= m_end; }

        static constexpr auto from_size(file_id_t file, size_type start, size_type size) noexcept -> Span {
            return Span(file, start, start + size);
        }

        constexpr auto with_start(size_type start) const noexcept -> Span {
            return Span(m_file, start, m_end);
        }

        constexpr auto with_end(size_type end) const noexcept -> Span {
            return Span(m_file, m_start, end);
        }

        constexpr auto shift(std::ptrdiff_t offset) const noexcept -> Span {
            auto s = static_cast<std::ptrdiff_t>(start()) + offset;
            auto e = static_cast<std::ptrdiff_t>(end()) + offset;
            return Span(
                m_file,
                static_cast<size_type>(std::max<std::ptrdiff_t>(s, 0)),
                static_cast<size_type>(std::max<std::ptrdiff_t>(e, 0))
            );
        }

        template <std::integral T>
        constexpr auto operator+(T offset) const noexcept -> Span {
            return shift(static_cast<std::ptrdiff_t>(offset));
        }

        template <std::integral T>
        constexpr auto operator-(T offset) const noexcept -> Span {
            return shift(-static_cast<std::ptrdiff_t>(offset));
        }

        constexpr auto intersects(Span other) const noexcept -> bool {
            if (other.m_file != m_file) return false;
            if (other.empty() || empty()) return false;
            // [------------)
            //         [----------)
            //
            // [------------)
            //              [----------)  no intersection
            auto lhs = *this;
            auto rhs = other;

            if (start() > other.start()) {
                std::swap(lhs, rhs);
            }
            return rhs.start() < lhs.end();
        }

        constexpr auto force_merge(Span other) const noexcept -> Span {
            // [-----------)
            //                [---------)
            //       |
            //       V
            // [------------------------)
            return Span(
                m_file,
                std::min(start(), other.start()),
                std::max(end(), other.end())
            );
        }

        constexpr auto contains(size_type offset) const noexcept -> bool {
            return offset >= start() && offset < end();
        }

        constexpr auto operator==(Span const& other) const noexcept -> bool = default;

    private:
        file_id_t m_file{};
        size_type m_start{};
        size_type m_end{};
    };

} // namespace caret


template <>
struct std::formatter<caret::Span> {
    constexpr auto parse(auto& ctx) {
        auto it = ctx.begin();
        while (it != ctx.end()) {
            if (*it == '}') break;
            ++it;
        }
        return it;
    }

    auto format(caret::Span const& s, auto& ctx) const {
        return std::format_to(ctx.out(), "Span(file={}, start={}, end={})", s.file(), s.start(), s.end());
    }
};


#endif // AMT_CARET_SPAN_HPP
