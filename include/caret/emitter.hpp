#ifndef AMT_CARET_EMITTER_HPP
#define AMT_CARET_EMITTER_HPP

#include "basic.hpp"
#include "core/string_utils.hpp"
#include "core/term/terminal.hpp"
#include "core/term/writer.hpp"
#include "core/utf8.hpp"
#include "document.hpp"
#include "files.hpp"
#include "layout.hpp"
#include "render_config.hpp"
#include "renderer.hpp"
#include "resolver.hpp"
#include <algorithm>
#include <expected>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <spdlog/spdlog.h>

namespace caret::internal {

    // Collects the styled pieces of one output row so trailing blanks can be
    // trimmed before the row reaches the document.
    struct RowBuilder {
        struct Piece {
            std::optional<Style> style;
            std::string text;
        };

        auto push(std::string text) -> RowBuilder& {
            m_pieces.push_back({ std::nullopt, std::move(text) });
            return *this;
        }

        auto push(Style style, std::string text) -> RowBuilder& {
            m_pieces.push_back({ style, std::move(text) });
            return *this;
        }

        auto finish(doc::Document& document) -> void {
            while (!m_pieces.empty()) {
                auto& text = m_pieces.back().text;
                core::utils::rtrim(text, " ");
                if (!text.empty()) break;
                m_pieces.pop_back();
            }

            for (auto& piece: m_pieces) {
                if (piece.style) document.push_styled(*piece.style, std::move(piece.text));
                else document.push_text(std::move(piece.text));
            }
            document.push_text("\n");
            m_pieces.clear();
        }

    private:
        std::vector<Piece> m_pieces;
    };

    inline auto connector_glyph(ConnectorGlyph glyph, Markers const& markers) noexcept -> std::string_view {
        switch (glyph) {
            case ConnectorGlyph::Start: return markers.connector_start;
            case ConnectorGlyph::Bar: return markers.connector_bar;
            case ConnectorGlyph::End: return markers.connector_end;
            case ConnectorGlyph::None: break;
        }
        return " ";
    }

    inline auto push_connectors(
        RowBuilder& builder,
        Row const& row,
        Severity severity,
        RenderConfig const& config
    ) -> void {
        for (auto const& cell: row.connectors) {
            if (cell.glyph == ConnectorGlyph::None) {
                builder.push(" ");
            } else {
                builder.push(config.label_style(severity, cell.style), std::string(connector_glyph(cell.glyph, config.markers)));
            }
            builder.push(" ");
        }
    }

    inline auto push_segments(
        RowBuilder& builder,
        std::vector<Segment> segments,
        Severity severity,
        RenderConfig const& config
    ) -> void {
        std::stable_sort(segments.begin(), segments.end(), [](Segment const& l, Segment const& r) {
            return l.column < r.column;
        });

        dsize_t cursor{1};
        for (auto& segment: segments) {
            if (segment.column > cursor) builder.push(std::string(segment.column - cursor, ' '));
            cursor = std::max(cursor, segment.column) + core::utf8::display_width(segment.text, config.tab_width);
            builder.push(config.label_style(severity, segment.style), std::move(segment.text));
        }
    }

    /**
     * @brief Writes the source text, coloring the columns covered by labels.
     * A primary label wins over a secondary one; otherwise the first label does.
     */
    inline auto push_source(
        RowBuilder& builder,
        Row const& row,
        Severity severity,
        RenderConfig const& config
    ) -> void {
        if (row.highlights.empty()) {
            builder.push(row.text);
            return;
        }

        auto style_at = [&row](dsize_t column) -> std::optional<LabelStyle> {
            auto res = std::optional<LabelStyle>{};
            for (auto const& h: row.highlights) {
                if (column < h.start_column || column >= h.end_column) continue;
                if (h.style == LabelStyle::Primary) return h.style;
                if (!res) res = h.style;
            }
            return res;
        };

        auto current = std::optional<LabelStyle>{};
        auto piece = std::string{};
        auto flush_piece = [&] {
            if (piece.empty()) return;
            if (current) builder.push(config.label_style(severity, *current), std::move(piece));
            else builder.push(std::move(piece));
            piece.clear();
        };

        // Tabs are already expanded, so every codepoint is one column wide.
        dsize_t column{1};
        core::utf8::for_each_codepoint(row.text, [&](std::size_t, std::string_view cp) {
            auto style = style_at(column);
            if (style != current) {
                flush_piece();
                current = style;
            }
            piece.append(cp);
            ++column;
        });
        flush_piece();
    }

    inline auto push_file(
        doc::Document& document,
        FileLayout const& layout,
        Severity severity,
        RenderConfig const& config
    ) -> void {
        auto const gutter = Style::fg(config.gutter_color);
        auto const width = layout.gutter_width;
        auto blank_gutter = std::format("{:>{}} {} ", "", width, config.markers.gutter_bar);

        document.push_text("\n");

        RowBuilder builder;
        builder
            .push(gutter, "-")
            .push(std::format(" {}:{}:{}", layout.name, layout.location.line, layout.location.column))
            .finish(document);

        for (auto const& row: layout.rows) {
            switch (row.kind) {
                case RowKind::Source: {
                    builder.push(gutter, std::format("{:>{}} {} ", row.line_number, width, config.markers.gutter_bar));
                    push_connectors(builder, row, severity, config);
                    push_source(builder, row, severity, config);
                    break;
                }
                case RowKind::Elision: {
                    builder.push(gutter, std::format("{:<{}}", config.markers.elision, width + 3));
                    push_connectors(builder, row, severity, config);
                    break;
                }
                case RowKind::Marker:
                case RowKind::Message: {
                    builder.push(gutter, blank_gutter);
                    push_connectors(builder, row, severity, config);
                    push_segments(builder, row.segments, severity, config);
                    break;
                }
            }
            builder.finish(document);
        }
    }

} // namespace caret::internal

namespace caret {

    /**
     * @brief Builds the styled document for a diagnostic.
     *
     * All labels are resolved before anything is laid out, so an invalid span
     * fails the whole diagnostic.
     */
    inline auto build_document(
        Diagnostic const& diagnostic,
        Files const& files,
        RenderConfig const& config = {}
    ) -> std::expected<doc::Document, EmitError> {
        auto labels = internal::resolve_labels(files, diagnostic.labels, config);
        if (!labels) return std::unexpected(std::move(labels.error()));

        auto layouts = internal::layout_labels(files, *labels, config);
        if (!layouts) return std::unexpected(std::move(layouts.error()));

        auto document = doc::Document{};
        auto const severity_style = Style::fg(config.severity_color(diagnostic.severity)).with_bold();

        auto header = std::string(to_string(diagnostic.severity));
        if (diagnostic.code) header += std::format("[{}]", *diagnostic.code);

        internal::RowBuilder builder;
        builder
            .push(severity_style, std::move(header))
            .push(Style{}.with_bold(), std::format(": {}", diagnostic.message))
            .finish(document);

        dsize_t gutter_width{1};
        for (auto const& layout: *layouts) {
            internal::push_file(document, layout, diagnostic.severity, config);
            gutter_width = std::max(gutter_width, layout.gutter_width);
        }

        for (auto const& note: diagnostic.notes) {
            builder
                .push(Style::fg(config.gutter_color), std::format("{:>{}} {}", "", gutter_width, config.markers.note))
                .push(std::format(" {}", note))
                .finish(document);
        }

        return document;
    }

    /**
     * @brief Renders one diagnostic to the terminal.
     *
     * Nothing is written when a label cannot be resolved. Colors follow the
     * terminal's mode; the text is the same either way.
     */
    template <typename T>
    auto emit(
        Terminal<T>& term,
        Diagnostic const& diagnostic,
        Files const& files,
        RenderConfig const& config = {}
    ) -> std::expected<void, EmitError> {
        spdlog::debug(
            "caret: emitting {} '{}' with {} label(s) and {} note(s)",
            to_string(diagnostic.severity), diagnostic.message, diagnostic.labels.size(), diagnostic.notes.size()
        );

        auto document = build_document(diagnostic, files, config);
        if (!document) {
            spdlog::debug("caret: dropped '{}': {}", diagnostic.message, document.error().message);
            return std::unexpected(std::move(document.error()));
        }

        if (spdlog::should_log(spdlog::level::trace)) {
            spdlog::trace("caret: document tree\n{}", document->debug_string());
        }

        auto res = render(*document, term);
        if (!res) spdlog::debug("caret: {}", res.error().message);
        return res;
    }

    // Renders into a string. Escape sequences are only present when `mode` is `Enable`.
    inline auto format(
        Diagnostic const& diagnostic,
        Files const& files,
        RenderConfig const& config = {},
        TerminalColorMode mode = TerminalColorMode::Disable
    ) -> std::expected<std::string, EmitError> {
        auto out = std::string{};
        {
            auto term = Terminal<std::string>(Writer<std::string>(out), mode);
            auto res = emit(term, diagnostic, files, config);
            if (!res) return std::unexpected(std::move(res.error()));
        }
        return out;
    }

} // namespace caret

#endif // AMT_CARET_EMITTER_HPP
