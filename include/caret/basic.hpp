#ifndef AMT_CARET_BASIC_HPP
#define AMT_CARET_BASIC_HPP

#include "core/config.hpp"
#include "forward.hpp"
#include "span.hpp"
#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace caret {

    enum class Severity: std::uint8_t {
        Bug = 0,
        Error,
        Warning,
        Note,
        Help
    };

    static constexpr auto severity_elements_count = std::size_t{5};

    [[nodiscard]] static inline constexpr auto to_string(Severity severity) noexcept -> std::string_view {
        switch (severity) {
            case Severity::Bug: return "bug";
            case Severity::Error: return "error";
            case Severity::Warning: return "warning";
            case Severity::Note: return "note";
            case Severity::Help: return "help";
        }
        return "unknown";
    }

    // Bug is the most severe, Help the least.
    [[nodiscard]] static inline constexpr auto severity_rank(Severity severity) noexcept -> unsigned {
        return static_cast<unsigned>(severity_elements_count) - static_cast<unsigned>(severity);
    }

    [[nodiscard]] static inline constexpr auto is_more_severe(Severity lhs, Severity rhs) noexcept -> bool {
        return severity_rank(lhs) > severity_rank(rhs);
    }

    enum class LabelStyle: std::uint8_t {
        Primary = 0,
        Secondary
    };

    [[nodiscard]] static inline constexpr auto to_string(LabelStyle style) noexcept -> std::string_view {
        switch (style) {
            case LabelStyle::Primary: return "primary";
            case LabelStyle::Secondary: return "secondary";
        }
        return "unknown";
    }

    struct Label {
        LabelStyle style{ LabelStyle::Primary };
        Span span{};
        std::optional<std::string> message{};

        static auto primary(Span span) -> Label {
            return { .style = LabelStyle::Primary, .span = span, .message = std::nullopt };
        }

        static auto secondary(Span span) -> Label {
            return { .style = LabelStyle::Secondary, .span = span, .message = std::nullopt };
        }

        auto with_message(std::string msg) && -> Label {
            message = std::move(msg);
            return std::move(*this);
        }

        auto with_message(std::string msg) const& -> Label {
            auto tmp = *this;
            tmp.message = std::move(msg);
            return tmp;
        }
    };

    struct Diagnostic {
        Severity severity{ Severity::Error };
        std::optional<std::string> code{};
        std::string message{};
        std::vector<Label> labels{};
        std::vector<std::string> notes{};

        static auto make(Severity severity, std::string message) -> Diagnostic {
            return { .severity = severity, .code = std::nullopt, .message = std::move(message), .labels = {}, .notes = {} };
        }

        static auto bug(std::string message) -> Diagnostic { return make(Severity::Bug, std::move(message)); }
        static auto error(std::string message) -> Diagnostic { return make(Severity::Error, std::move(message)); }
        static auto warning(std::string message) -> Diagnostic { return make(Severity::Warning, std::move(message)); }
        static auto note(std::string message) -> Diagnostic { return make(Severity::Note, std::move(message)); }
        static auto help(std::string message) -> Diagnostic { return make(Severity::Help, std::move(message)); }

        auto with_code(std::string c) && -> Diagnostic {
            code = std::move(c);
            return std::move(*this);
        }

        auto with_label(Label label) && -> Diagnostic {
            labels.push_back(std::move(label));
            return std::move(*this);
        }

        auto with_labels(std::vector<Label> ls) && -> Diagnostic {
            for (auto& l: ls) labels.push_back(std::move(l));
            return std::move(*this);
        }

        auto with_note(std::string n) && -> Diagnostic {
            notes.push_back(std::move(n));
            return std::move(*this);
        }
    };

    enum class EmitErrorKind: std::uint8_t {
        InvalidSpan = 0,
        WriteFailure
    };

    [[nodiscard]] static inline constexpr auto to_string(EmitErrorKind kind) noexcept -> std::string_view {
        switch (kind) {
            case EmitErrorKind::InvalidSpan: return "invalid span";
            case EmitErrorKind::WriteFailure: return "write failure";
        }
        return "unknown";
    }

    struct EmitError {
        EmitErrorKind kind{};
        std::string message{};

        static auto invalid_span(std::string message) -> EmitError {
            return { .kind = EmitErrorKind::InvalidSpan, .message = std::move(message) };
        }

        static auto write_failure(std::string message) -> EmitError {
            return { .kind = EmitErrorKind::WriteFailure, .message = std::move(message) };
        }
    };

} // namespace caret

template <>
struct std::formatter<caret::Severity> {
    constexpr auto parse(auto& ctx) {
        auto it = ctx.begin();
        while (it != ctx.end()) {
            if (*it == '}') break;
            ++it;
        }
        return it;
    }

    auto format(caret::Severity const& s, auto& ctx) const {
        return std::format_to(ctx.out(), "{}", caret::to_string(s));
    }
};

template <>
struct std::formatter<caret::LabelStyle> {
    constexpr auto parse(auto& ctx) {
        auto it = ctx.begin();
        while (it != ctx.end()) {
            if (*it == '}') break;
            ++it;
        }
        return it;
    }

    auto format(caret::LabelStyle const& s, auto& ctx) const {
        return std::format_to(ctx.out(), "{}", caret::to_string(s));
    }
};

template <>
struct std::formatter<caret::EmitError> {
    constexpr auto parse(auto& ctx) {
        auto it = ctx.begin();
        while (it != ctx.end()) {
            if (*it == '}') break;
            ++it;
        }
        return it;
    }

    auto format(caret::EmitError const& e, auto& ctx) const {
        return std::format_to(ctx.out(), "{}: {}", caret::to_string(e.kind), e.message);
    }
};

#endif // AMT_CARET_BASIC_HPP
