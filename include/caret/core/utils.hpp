#ifndef CARET_CORE_UTILS_HPP
#define CARET_CORE_UTILS_HPP

#include "config.hpp"
#include <cstddef>

namespace caret::core::utils {

    template <typename... Ts>
    struct overloaded: Ts... { using Ts::operator()...; };

    template <typename... Ts>
    overloaded(Ts...) -> overloaded<Ts...>;

    template <typename T>
    CARET_ALWAYS_INLINE static constexpr auto count_digits(T v) noexcept -> std::size_t {
        std::size_t count{0};
        while (v) {
            ++count;
            v /= T(10);
        }
        return count == 0 ? std::size_t{1} : count;
    }

} // namespace caret::core::utils

#endif // CARET_CORE_UTILS_HPP
