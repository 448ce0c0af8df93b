#ifndef AMT_CARET_FILES_HPP
#define AMT_CARET_FILES_HPP

#include "core/config.hpp"
#include "forward.hpp"
#include "span.hpp"
#include <algorithm>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace caret {

    // Zero-based line index and zero-based byte column inside that line.
    struct Location {
        dsize_t line{};
        dsize_t column{};

        constexpr auto operator==(Location const&) const noexcept -> bool = default;
    };

    /**
     * @brief Read-only access to the source files referenced by spans.
     *
     * Implementations must be deterministic and safe for concurrent reads; the
     * renderer never mutates them. Every query returns `std::nullopt` for an
     * unknown file id or an out of range argument.
     */
    struct Files {
        virtual ~Files() = default;

        virtual auto name(file_id_t file) const -> std::optional<std::string_view> = 0;
        virtual auto source(file_id_t file) const -> std::optional<std::string_view> = 0;

        // Byte range of the line, excluding its `\n` terminator.
        virtual auto line_span(file_id_t file, dsize_t line_index) const -> std::optional<Span> = 0;

        // `byte_offset` may equal the source length (end of file).
        virtual auto location(file_id_t file, dsize_t byte_offset) const -> std::optional<Location> = 0;

        // Inverse of `location`. The column may point at the line terminator
        // but not past it.
        virtual auto byte_index(file_id_t file, dsize_t line_index, dsize_t column) const -> std::optional<dsize_t> {
            auto line = line_span(file, line_index);
            if (!line || column > line->size()) return std::nullopt;
            return line->start() + column;
        }

        virtual auto line_count(file_id_t file) const -> std::optional<dsize_t> {
            auto src = source(file);
            if (!src) return std::nullopt;
            auto last = location(file, static_cast<dsize_t>(src->size()));
            if (!last) return std::nullopt;
            return last->line + 1;
        }
    };

    /**
     * @brief In-memory files with a precomputed line index.
     * File ids are assigned in insertion order starting at zero.
     */
    struct SimpleFiles: Files {
    private:
        struct File {
            std::string name;
            std::string source;
            // Always starts with zero and stays sorted.
            std::vector<dsize_t> line_starts;
        };

    public:
        SimpleFiles() = default;
        SimpleFiles(SimpleFiles const&) = default;
        SimpleFiles(SimpleFiles &&) noexcept = default;
        SimpleFiles& operator=(SimpleFiles const&) = default;
        SimpleFiles& operator=(SimpleFiles &&) noexcept = default;
        ~SimpleFiles() override = default;

        auto add(std::string name, std::string source) -> file_id_t {
            auto file = File{ .name = std::move(name), .source = std::move(source), .line_starts = { 0 } };
            for (auto i = 0ul; i < file.source.size(); ++i) {
                if (file.source[i] == '\n') file.line_starts.push_back(static_cast<dsize_t>(i + 1));
            }
            m_files.push_back(std::move(file));
            return m_files.size() - 1;
        }

        constexpr auto size() const noexcept -> std::size_t { return m_files.size(); }

        auto name(file_id_t file) const -> std::optional<std::string_view> override {
            if (file >= m_files.size()) return std::nullopt;
            return std::string_view(m_files[file].name);
        }

        auto source(file_id_t file) const -> std::optional<std::string_view> override {
            if (file >= m_files.size()) return std::nullopt;
            return std::string_view(m_files[file].source);
        }

        auto line_span(file_id_t file, dsize_t line_index) const -> std::optional<Span> override {
            if (file >= m_files.size()) return std::nullopt;
            auto const& f = m_files[file];
            if (line_index >= f.line_starts.size()) return std::nullopt;

            auto start = f.line_starts[line_index];
            auto end = line_index + 1 < f.line_starts.size()
                ? f.line_starts[line_index + 1] - 1
                : static_cast<dsize_t>(f.source.size());
            return Span(file, start, end);
        }

        auto location(file_id_t file, dsize_t byte_offset) const -> std::optional<Location> override {
            if (file >= m_files.size()) return std::nullopt;
            auto const& f = m_files[file];
            if (byte_offset > f.source.size()) return std::nullopt;

            auto it = std::upper_bound(f.line_starts.begin(), f.line_starts.end(), byte_offset);
            auto line = static_cast<dsize_t>(std::distance(f.line_starts.begin(), it) - 1);
            return Location{ .line = line, .column = byte_offset - f.line_starts[line] };
        }

        auto byte_index(file_id_t file, dsize_t line_index, dsize_t column) const -> std::optional<dsize_t> override {
            if (file >= m_files.size()) return std::nullopt;
            auto const& f = m_files[file];
            if (line_index >= f.line_starts.size()) return std::nullopt;

            auto start = f.line_starts[line_index];
            auto end = line_index + 1 < f.line_starts.size()
                ? f.line_starts[line_index + 1] - 1
                : static_cast<dsize_t>(f.source.size());
            if (column > end - start) return std::nullopt;
            return start + column;
        }

        auto line_count(file_id_t file) const -> std::optional<dsize_t> override {
            if (file >= m_files.size()) return std::nullopt;
            return static_cast<dsize_t>(m_files[file].line_starts.size());
        }

    private:
        std::vector<File> m_files;
    };

} // namespace caret

template <>
struct std::formatter<caret::Location> {
    constexpr auto parse(auto& ctx) {
        auto it = ctx.begin();
        while (it != ctx.end()) {
            if (*it == '}') break;
            ++it;
        }
        return it;
    }

    auto format(caret::Location const& l, auto& ctx) const {
        return std::format_to(ctx.out(), "Location(line={}, column={})", l.line, l.column);
    }
};

#endif // AMT_CARET_FILES_HPP
