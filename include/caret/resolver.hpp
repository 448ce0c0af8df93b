#ifndef AMT_CARET_RESOLVER_HPP
#define AMT_CARET_RESOLVER_HPP

#include "basic.hpp"
#include "core/config.hpp"
#include "core/string_utils.hpp"
#include "core/utf8.hpp"
#include "files.hpp"
#include "render_config.hpp"
#include "span.hpp"
#include <expected>
#include <format>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace caret::internal {

    // 1-based line number and 1-based display column.
    struct LineColumn {
        dsize_t line{1};
        dsize_t column{1};

        constexpr auto operator==(LineColumn const&) const noexcept -> bool = default;
    };

    struct ResolvedLabel {
        LabelStyle style{ LabelStyle::Primary };
        std::optional<std::string_view> message{};
        file_id_t file{};
        // Position of the label inside `Diagnostic::labels`.
        std::size_t index{};
        LineColumn start{};
        LineColumn end{};

        constexpr auto is_multiline() const noexcept -> bool {
            return start.line != end.line;
        }
    };

    /**
     * @brief Text of a line without its terminator.
     * @param line_index zero-based line index.
     */
    inline auto line_text(Files const& files, file_id_t file, dsize_t line_index) -> std::optional<std::string_view> {
        auto src = files.source(file);
        auto range = files.line_span(file, line_index);
        if (!src || !range) return std::nullopt;
        if (range->end() > src->size() || !range->is_valid()) return std::nullopt;
        auto text = src->substr(range->start(), range->size());
        return core::utils::strip_line_terminator(text);
    }

    inline auto resolve_offset(
        Files const& files,
        file_id_t file,
        dsize_t offset,
        dsize_t tab_width
    ) -> std::optional<LineColumn> {
        auto loc = files.location(file, offset);
        if (!loc) return std::nullopt;
        auto text = line_text(files, file, loc->line);
        if (!text) return std::nullopt;
        return LineColumn{
            .line = loc->line + 1,
            .column = core::utf8::column_at(*text, loc->column, tab_width)
        };
    }

    /**
     * @brief Maps a label's byte span to line and display column coordinates.
     *
     * Spans are never clamped: an unknown file, `start > end` or an offset past
     * the end of the source is reported as `EmitErrorKind::InvalidSpan`.
     */
    inline auto resolve_label(
        Files const& files,
        Label const& label,
        std::size_t index,
        RenderConfig const& config
    ) -> std::expected<ResolvedLabel, EmitError> {
        auto const span = label.span;
        auto src = files.source(span.file());
        if (!src) {
            return std::unexpected(EmitError::invalid_span(
                std::format("label {} refers to unknown file {}", index, span.file())
            ));
        }

        if (!span.is_valid()) {
            return std::unexpected(EmitError::invalid_span(
                std::format("label {} has start {} past its end {}", index, span.start(), span.end())
            ));
        }

        if (span.end() > src->size()) {
            return std::unexpected(EmitError::invalid_span(
                std::format("label {} ends at {} but the file has {} bytes", index, span.end(), src->size())
            ));
        }

        auto start = resolve_offset(files, span.file(), span.start(), config.tab_width);
        auto end = resolve_offset(files, span.file(), span.end(), config.tab_width);
        if (!start || !end) {
            return std::unexpected(EmitError::invalid_span(
                std::format("label {} could not be located: {}", index, span)
            ));
        }

        auto message = std::optional<std::string_view>{};
        if (label.message) message = std::string_view(*label.message);

        return ResolvedLabel{
            .style = label.style,
            .message = message,
            .file = span.file(),
            .index = index,
            .start = *start,
            .end = *end
        };
    }

    // Resolves every label in order and stops at the first failure.
    inline auto resolve_labels(
        Files const& files,
        std::span<Label const> labels,
        RenderConfig const& config
    ) -> std::expected<std::vector<ResolvedLabel>, EmitError> {
        auto res = std::vector<ResolvedLabel>{};
        res.reserve(labels.size());
        for (auto i = 0ul; i < labels.size(); ++i) {
            auto label = resolve_label(files, labels[i], i, config);
            if (!label) return std::unexpected(std::move(label.error()));
            res.push_back(*label);
        }
        return res;
    }

} // namespace caret::internal

#endif // AMT_CARET_RESOLVER_HPP
