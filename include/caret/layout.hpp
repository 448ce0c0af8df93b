#ifndef AMT_CARET_LAYOUT_HPP
#define AMT_CARET_LAYOUT_HPP

#include "basic.hpp"
#include "core/config.hpp"
#include "core/string_utils.hpp"
#include "core/utf8.hpp"
#include "core/utils.hpp"
#include "files.hpp"
#include "render_config.hpp"
#include "resolver.hpp"
#include <algorithm>
#include <cassert>
#include <cstdint>
#include <expected>
#include <format>
#include <map>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include <spdlog/spdlog.h>

namespace caret::internal {

    enum class ConnectorGlyph: std::uint8_t {
        None = 0,
        Start,
        Bar,
        End
    };

    struct ConnectorCell {
        ConnectorGlyph glyph{ ConnectorGlyph::None };
        LabelStyle style{ LabelStyle::Primary };

        constexpr auto operator==(ConnectorCell const&) const noexcept -> bool = default;
    };

    // Text placed at a 1-based display column of the source area.
    struct Segment {
        dsize_t column{1};
        std::string text{};
        LabelStyle style{ LabelStyle::Primary };
    };

    enum class RowKind: std::uint8_t {
        Source = 0,
        Marker,
        Message,
        Elision
    };

    // Display columns `[start_column, end_column)` of a source row covered by a label.
    struct Highlight {
        dsize_t start_column{1};
        dsize_t end_column{1};
        LabelStyle style{ LabelStyle::Primary };

        constexpr auto operator==(Highlight const&) const noexcept -> bool = default;
    };

    struct Row {
        RowKind kind{ RowKind::Source };
        // Only set for source rows.
        dsize_t line_number{};
        std::string text{};
        std::vector<ConnectorCell> connectors{};
        std::vector<Segment> segments{};
        // Only set for source rows.
        std::vector<Highlight> highlights{};
    };

    /**
     * @brief Underline drawn below one displayed line.
     * Columns are 1-based and `end_column` is exclusive; a range is always at
     * least one column wide.
     */
    struct MarkerRange {
        dsize_t start_column{1};
        dsize_t end_column{2};
        LabelStyle style{ LabelStyle::Primary };
        std::optional<std::string_view> message{};
        // Position of the owning label in the file's label list.
        std::size_t label{};

        constexpr auto width() const noexcept -> dsize_t {
            return end_column - start_column;
        }

        constexpr auto overlaps(MarkerRange const& other) const noexcept -> bool {
            return end_column > other.start_column;
        }
    };

    struct FileLayout {
        file_id_t file{};
        std::string_view name{};
        // Position reported in the `- name:line:column` row.
        LineColumn location{};
        dsize_t gutter_width{1};
        dsize_t connector_columns{};
        std::vector<dsize_t> displayed_lines{};
        std::vector<Row> rows{};
    };

    inline auto make_range(
        dsize_t start,
        dsize_t end,
        LabelStyle style,
        std::optional<std::string_view> message,
        std::size_t label
    ) noexcept -> MarkerRange {
        return {
            .start_column = start,
            .end_column = std::max(end, static_cast<dsize_t>(start + 1)),
            .style = style,
            .message = message,
            .label = label
        };
    }

    // Sorted by start column, then Primary before Secondary, then label order.
    inline auto sort_ranges(std::vector<MarkerRange>& ranges) -> void {
        std::stable_sort(ranges.begin(), ranges.end(), [](MarkerRange const& l, MarkerRange const& r) {
            if (l.start_column != r.start_column) return l.start_column < r.start_column;
            if (l.style != r.style) return l.style == LabelStyle::Primary;
            return l.label < r.label;
        });
    }

    /**
     * @brief Greedy interval scheduling of sorted ranges into marker rows.
     * A range joins the first row whose last range ends at or before its start.
     */
    inline auto assign_rows(std::span<MarkerRange const> ranges) -> std::vector<std::vector<MarkerRange>> {
        auto rows = std::vector<std::vector<MarkerRange>>{};
        for (auto const& range: ranges) {
            auto placed = false;
            for (auto& row: rows) {
                if (row.back().overlaps(range)) continue;
                row.push_back(range);
                placed = true;
                break;
            }
            if (!placed) rows.push_back({ range });
        }
        return rows;
    }

    /**
     * @brief Picks a connector column for every multi-line label.
     *
     * Labels are visited by start line, ties in label order, and take the
     * smallest column not used by an already placed label whose line range
     * intersects theirs. Single-line labels get `std::nullopt`.
     */
    inline auto assign_connector_columns(std::span<ResolvedLabel const> labels) -> std::vector<std::optional<dsize_t>> {
        auto res = std::vector<std::optional<dsize_t>>(labels.size());
        auto order = std::vector<std::size_t>{};
        for (auto i = 0ul; i < labels.size(); ++i) {
            if (labels[i].is_multiline()) order.push_back(i);
        }

        std::stable_sort(order.begin(), order.end(), [labels](std::size_t l, std::size_t r) {
            return labels[l].start.line < labels[r].start.line;
        });

        auto intersects = [labels](std::size_t l, std::size_t r) {
            return labels[l].start.line <= labels[r].end.line && labels[r].start.line <= labels[l].end.line;
        };

        for (auto k = 0ul; k < order.size(); ++k) {
            auto current = order[k];
            dsize_t column{};
            auto used = true;
            while (used) {
                used = false;
                for (auto p = 0ul; p < k; ++p) {
                    auto other = order[p];
                    if (res[other] != column) continue;
                    if (!intersects(current, other)) continue;
                    used = true;
                    ++column;
                    break;
                }
            }
            res[current] = column;
        }
        return res;
    }

    /**
     * @brief Line numbers shown for a file, ascending.
     *
     * Every start and end line is shown, the interior of a multi-line label
     * when it is short enough, and the configured context around the first
     * and last labelled line clipped to `last_line`.
     */
    inline auto select_lines(
        std::span<ResolvedLabel const> labels,
        dsize_t last_line,
        RenderConfig const& config
    ) -> std::vector<dsize_t> {
        auto lines = std::set<dsize_t>{};
        for (auto const& label: labels) {
            lines.insert(label.start.line);
            lines.insert(label.end.line);
            if (!label.is_multiline()) continue;
            auto interior = label.end.line - label.start.line - 1;
            if (interior > config.elision_threshold) continue;
            for (auto l = label.start.line + 1; l < label.end.line; ++l) lines.insert(l);
        }

        if (lines.empty()) return {};

        auto first = *lines.begin();
        auto last = *lines.rbegin();
        auto before = config.leading_context();
        auto after = config.trailing_context();

        auto context_start = first > before ? first - before : dsize_t{1};
        for (auto l = context_start; l < first; ++l) lines.insert(l);
        for (auto l = last + 1; l <= last_line && l - last <= after; ++l) lines.insert(l);

        return { lines.begin(), lines.end() };
    }

    namespace detail {
        inline auto repeat(std::string_view glyph, dsize_t count) -> std::string {
            auto res = std::string{};
            res.reserve(glyph.size() * count);
            for (auto i = dsize_t{}; i < count; ++i) res.append(glyph);
            return res;
        }

        // Splits on explicit line breaks, then wraps each line to `max_message_width`.
        inline auto wrap_message(std::string_view message, RenderConfig const& config) -> std::vector<std::string> {
            auto lines = std::vector<std::string>{};
            while (true) {
                auto const pos = message.find('\n');
                auto line = core::utils::rtrim(message.substr(0, pos), "\r");
                if (core::utf8::display_width(line, 1) <= config.max_message_width) {
                    lines.emplace_back(line);
                } else {
                    for (auto& part: core::utils::wrap_words(line, config.max_message_width)) lines.push_back(std::move(part));
                }
                if (pos == std::string_view::npos) break;
                message.remove_prefix(pos + 1);
            }
            while (!lines.empty() && lines.back().empty()) lines.pop_back();
            return lines;
        }

        inline auto has_message(MarkerRange const& range) noexcept -> bool {
            return range.message.has_value() && !range.message->empty();
        }

        inline auto pending_bars(
            std::span<MarkerRange const> pending,
            RenderConfig const& config
        ) -> std::vector<Segment> {
            auto res = std::vector<Segment>{};
            res.reserve(pending.size());
            for (auto const& range: pending) {
                res.push_back(Segment{
                    .column = range.start_column,
                    .text = std::string(config.markers.connector_bar),
                    .style = range.style
                });
            }
            return res;
        }
    } // namespace detail

    /**
     * @brief Expands one marker row into the marker row and its message rows.
     *
     * The last range's message is appended inline. The remaining messages hang
     * below their ranges, right-most first, with bars kept under ranges whose
     * message has not been printed yet.
     */
    inline auto place_messages(
        std::span<MarkerRange const> ranges,
        RenderConfig const& config
    ) -> std::vector<Row> {
        auto rows = std::vector<Row>{};
        if (ranges.empty()) return rows;

        auto marker_row = Row{ .kind = RowKind::Marker };
        for (auto const& range: ranges) {
            marker_row.segments.push_back(Segment{
                .column = range.start_column,
                .text = detail::repeat(config.marker(range.style), range.width()),
                .style = range.style
            });
        }

        auto pending = std::vector<MarkerRange>{};
        for (auto i = 0ul; i + 1 < ranges.size(); ++i) {
            if (detail::has_message(ranges[i])) pending.push_back(ranges[i]);
        }

        auto const& last = ranges.back();
        auto inline_lines = std::vector<std::string>{};
        if (detail::has_message(last)) inline_lines = detail::wrap_message(*last.message, config);

        auto const inline_column = static_cast<dsize_t>(last.end_column + 1);
        if (!inline_lines.empty()) {
            marker_row.segments.push_back(Segment{
                .column = inline_column,
                .text = std::move(inline_lines.front()),
                .style = last.style
            });
        }
        rows.push_back(std::move(marker_row));

        for (auto i = 1ul; i < inline_lines.size(); ++i) {
            auto row = Row{ .kind = RowKind::Message, .segments = detail::pending_bars(pending, config) };
            row.segments.push_back(Segment{
                .column = inline_column,
                .text = std::move(inline_lines[i]),
                .style = last.style
            });
            rows.push_back(std::move(row));
        }

        while (!pending.empty()) {
            auto range = pending.back();
            pending.pop_back();
            for (auto& line: detail::wrap_message(*range.message, config)) {
                auto row = Row{ .kind = RowKind::Message, .segments = detail::pending_bars(pending, config) };
                row.segments.push_back(Segment{
                    .column = range.start_column,
                    .text = std::move(line),
                    .style = range.style
                });
                rows.push_back(std::move(row));
            }
        }

        return rows;
    }

    /**
     * @brief Lays out the labels of a single file.
     * @param labels resolved labels that all refer to `file`, in label order.
     */
    inline auto layout_file(
        Files const& files,
        file_id_t file,
        std::span<ResolvedLabel const> labels,
        RenderConfig const& config
    ) -> std::expected<FileLayout, EmitError> {
        auto name = files.name(file);
        auto count = files.line_count(file);
        if (!name || !count) {
            return std::unexpected(EmitError::invalid_span(std::format("unknown file {}", file)));
        }

        auto layout = FileLayout{ .file = file, .name = *name };
        if (labels.empty()) return layout;

        auto location = std::find_if(labels.begin(), labels.end(), [](ResolvedLabel const& l) {
            return l.style == LabelStyle::Primary;
        });
        layout.location = location == labels.end() ? labels.front().start : location->start;

        // A trailing newline leaves an empty last line; it is only shown when labelled.
        auto last_line = *count;
        if (last_line > 1) {
            auto text = line_text(files, file, last_line - 1);
            if (text && text->empty()) --last_line;
        }

        layout.displayed_lines = select_lines(labels, last_line, config);
        assert(!layout.displayed_lines.empty() && "every label shows its start line");
        layout.gutter_width = static_cast<dsize_t>(core::utils::count_digits(layout.displayed_lines.back()));

        auto columns = assign_connector_columns(labels);
        for (auto const& c: columns) {
            if (c) layout.connector_columns = std::max(layout.connector_columns, static_cast<dsize_t>(*c + 1));
        }

        auto source_row_of = std::map<dsize_t, std::size_t>{};
        auto end_row_of = std::vector<std::optional<std::size_t>>(labels.size());

        auto previous = std::optional<dsize_t>{};
        for (auto line: layout.displayed_lines) {
            if (previous && line > *previous + 1) {
                layout.rows.push_back(Row{ .kind = RowKind::Elision });
            }
            previous = line;

            auto text = line_text(files, file, line - 1);
            if (!text) {
                return std::unexpected(EmitError::invalid_span(
                    std::format("line {} of file {} is out of range", line, file)
                ));
            }

            auto const width = core::utf8::display_width(*text, config.tab_width);
            source_row_of[line] = layout.rows.size();
            auto source_row = Row{
                .kind = RowKind::Source,
                .line_number = line,
                .text = core::utf8::expand_tabs(*text, config.tab_width)
            };
            for (auto const& label: labels) {
                if (label.is_multiline() || label.start.line != line) continue;
                if (label.start.column == label.end.column) continue;
                source_row.highlights.push_back(Highlight{
                    .start_column = label.start.column,
                    .end_column = label.end.column,
                    .style = label.style
                });
            }
            layout.rows.push_back(std::move(source_row));

            auto ranges = std::vector<MarkerRange>{};
            for (auto i = 0ul; i < labels.size(); ++i) {
                auto const& label = labels[i];
                if (!label.is_multiline()) {
                    if (label.start.line != line) continue;
                    ranges.push_back(make_range(label.start.column, label.end.column, label.style, label.message, i));
                } else if (label.start.line == line) {
                    ranges.push_back(make_range(label.start.column, width + 1, label.style, std::nullopt, i));
                } else if (label.end.line == line) {
                    ranges.push_back(make_range(1, label.end.column, label.style, label.message, i));
                }
            }
            sort_ranges(ranges);

            for (auto const& marker_row: assign_rows(ranges)) {
                auto const first_row = layout.rows.size();
                for (auto const& range: marker_row) {
                    auto const& label = labels[range.label];
                    if (label.is_multiline() && label.end.line == line) end_row_of[range.label] = first_row;
                }
                for (auto& row: place_messages(marker_row, config)) layout.rows.push_back(std::move(row));
            }
        }

        for (auto& row: layout.rows) row.connectors.resize(layout.connector_columns);

        for (auto i = 0ul; i < labels.size(); ++i) {
            if (!columns[i]) continue;
            auto const column = *columns[i];
            auto const it = source_row_of.find(labels[i].start.line);
            assert(it != source_row_of.end() && "start line of a multi-line label is always displayed");
            auto const start = it->second;
            auto const end = end_row_of[i].value_or(start);
            assert(end < layout.rows.size());
            for (auto r = start; r <= end; ++r) {
                auto glyph = ConnectorGlyph::Bar;
                if (r == start) glyph = ConnectorGlyph::Start;
                else if (r == end) glyph = ConnectorGlyph::End;
                layout.rows[r].connectors[column] = ConnectorCell{ .glyph = glyph, .style = labels[i].style };
            }
        }

        spdlog::trace(
            "caret: file '{}' shows {} line(s) in {} row(s) with {} connector column(s)",
            layout.name, layout.displayed_lines.size(), layout.rows.size(), layout.connector_columns
        );

        return layout;
    }

    /**
     * @brief Groups resolved labels by file and lays out every file.
     * Files are ordered by the first label that references them.
     */
    inline auto layout_labels(
        Files const& files,
        std::span<ResolvedLabel const> labels,
        RenderConfig const& config
    ) -> std::expected<std::vector<FileLayout>, EmitError> {
        auto order = std::vector<file_id_t>{};
        auto groups = std::vector<std::vector<ResolvedLabel>>{};
        for (auto const& label: labels) {
            auto it = std::find(order.begin(), order.end(), label.file);
            if (it == order.end()) {
                order.push_back(label.file);
                groups.push_back({ label });
            } else {
                groups[static_cast<std::size_t>(std::distance(order.begin(), it))].push_back(label);
            }
        }

        auto res = std::vector<FileLayout>{};
        res.reserve(order.size());
        for (auto i = 0ul; i < order.size(); ++i) {
            auto layout = layout_file(files, order[i], groups[i], config);
            if (!layout) return std::unexpected(std::move(layout.error()));
            res.push_back(std::move(*layout));
        }
        return res;
    }

} // namespace caret::internal

#endif // AMT_CARET_LAYOUT_HPP
