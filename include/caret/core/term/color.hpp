#ifndef AMT_CARET_CORE_TERM_COLOR_HPP
#define AMT_CARET_CORE_TERM_COLOR_HPP

#include <bit>
#include <cstdint>
#include <format>
#include <limits>
#include <string_view>

namespace caret {
    struct Color {
        using value_type = std::uint8_t;
        struct reserved_t{};

        // [rrggbb][16-color palette index, or `rgb` for true color]
        static constexpr auto rgb = value_type{100};
        static constexpr auto default_index = value_type{16};
        value_type r{};
        value_type g{};
        value_type b{};
        value_type reserved{default_index};

        constexpr Color() noexcept = default;
        constexpr Color(Color const&) noexcept = default;
        constexpr Color(Color &&) noexcept = default;
        constexpr Color& operator=(Color const&) noexcept = default;
        constexpr Color& operator=(Color &&) noexcept = default;
        constexpr ~Color() noexcept = default;

        constexpr Color(value_type v, reserved_t) noexcept
            : reserved(v)
        {}

        constexpr Color(value_type r, value_type g, value_type b) noexcept
            : r(r)
            , g(g)
            , b(b)
            , reserved(rgb)
        {}

        constexpr auto operator==(Color const&) const noexcept -> bool = default;

        constexpr auto to_int() const noexcept -> std::uint32_t {
            return std::bit_cast<std::uint32_t>(*this);
        }

        constexpr auto is_rgb() const noexcept -> bool {
            return reserved == rgb;
        }

        constexpr auto is_default() const noexcept -> bool {
            return reserved == default_index;
        }

        constexpr auto is_reserved() const noexcept -> bool {
            return reserved < default_index;
        }

        static const Color Black;
        static const Color Red;
        static const Color Green;
        static const Color Yellow;
        static const Color Blue;
        static const Color Magenta;
        static const Color Cyan;
        static const Color White;
        static const Color BrightBlack;
        static const Color BrightRed;
        static const Color BrightGreen;
        static const Color BrightYellow;
        static const Color BrightBlue;
        static const Color BrightMagenta;
        static const Color BrightCyan;
        static const Color BrightWhite;
        static const Color Default;
    };

    inline constexpr Color Color::Black              = Color{ 0, Color::reserved_t{} };
    inline constexpr Color Color::Red                = Color{ 1, Color::reserved_t{} };
    inline constexpr Color Color::Green              = Color{ 2, Color::reserved_t{} };
    inline constexpr Color Color::Yellow             = Color{ 3, Color::reserved_t{} };
    inline constexpr Color Color::Blue               = Color{ 4, Color::reserved_t{} };
    inline constexpr Color Color::Magenta            = Color{ 5, Color::reserved_t{} };
    inline constexpr Color Color::Cyan               = Color{ 6, Color::reserved_t{} };
    inline constexpr Color Color::White              = Color{ 7, Color::reserved_t{} };
    inline constexpr Color Color::BrightBlack        = Color{ 8, Color::reserved_t{} };
    inline constexpr Color Color::BrightRed          = Color{ 9, Color::reserved_t{} };
    inline constexpr Color Color::BrightGreen        = Color{10, Color::reserved_t{} };
    inline constexpr Color Color::BrightYellow       = Color{11, Color::reserved_t{} };
    inline constexpr Color Color::BrightBlue         = Color{12, Color::reserved_t{} };
    inline constexpr Color Color::BrightMagenta      = Color{13, Color::reserved_t{} };
    inline constexpr Color Color::BrightCyan         = Color{14, Color::reserved_t{} };
    inline constexpr Color Color::BrightWhite        = Color{15, Color::reserved_t{} };
    inline constexpr Color Color::Default            = Color{16, Color::reserved_t{} };

    namespace detail {
        constexpr auto color_name(Color c) noexcept -> std::string_view {
            constexpr std::string_view names[] = {
                "Black", "Red", "Green", "Yellow", "Blue", "Magenta", "Cyan", "White",
                "BrightBlack", "BrightRed", "BrightGreen", "BrightYellow",
                "BrightBlue", "BrightMagenta", "BrightCyan", "BrightWhite", "Default"
            };
            if (c.is_rgb()) return {};
            if (c.reserved > Color::default_index) return "Default";
            return names[c.reserved];
        }
    } // namespace detail
} // namespace caret

template <>
struct std::formatter<caret::Color> {
    constexpr auto parse(auto& ctx) {
        auto it = ctx.begin();
        while (it != ctx.end()) {
            if (*it == '}') break;
            ++it;
        }
        return it;
    }

    auto format(caret::Color const& c, auto& ctx) const {
        if (c.is_rgb()) {
            return std::format_to(ctx.out(), "RGB({}, {}, {})", c.r, c.g, c.b);
        }
        return std::format_to(ctx.out(), "{}", caret::detail::color_name(c));
    }
};

#endif // AMT_CARET_CORE_TERM_COLOR_HPP
