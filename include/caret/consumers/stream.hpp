#ifndef AMT_CARET_CONSUMERS_STREAM_HPP
#define AMT_CARET_CONSUMERS_STREAM_HPP

#include "base.hpp"
#include "../core/term/config.hpp"
#include "../core/term/terminal.hpp"
#include "../core/term/writer.hpp"
#include "../emitter.hpp"
#include "../files.hpp"
#include "../render_config.hpp"
#include <cstdio>
#include <mutex>
#include <string>
#include <utility>

namespace caret {
    /**
     * @brief Renders diagnostics to a `FILE*`.
     *
     * Each diagnostic is rendered into a private buffer first and written with
     * a single locked write, so diagnostics consumed from several threads never
     * interleave. Consecutive diagnostics are separated by an empty line.
     */
    struct StreamDiagnosticConsumer: DiagnosticConsumer {
        StreamDiagnosticConsumer(
            FILE* file,
            Files const* files,
            TerminalColorMode mode = TerminalColorMode::Auto,
            RenderConfig config = {}
        ) noexcept
            : m_out(file)
            , m_files(files)
            , m_config(std::move(config))
            , m_mode(resolve_mode(file, mode))
        {}
        StreamDiagnosticConsumer(StreamDiagnosticConsumer const&) = delete;
        StreamDiagnosticConsumer(StreamDiagnosticConsumer &&) = delete;
        StreamDiagnosticConsumer& operator=(StreamDiagnosticConsumer const&) = delete;
        StreamDiagnosticConsumer& operator=(StreamDiagnosticConsumer &&) = delete;
        ~StreamDiagnosticConsumer() noexcept override = default;

        auto consume(Diagnostic const& d) -> std::expected<void, EmitError> override {
            auto text = caret::format(d, *m_files, m_config, m_mode);
            if (!text) return std::unexpected(std::move(text.error()));

            std::lock_guard lock(m_mutex);
            if (m_has_printed && !m_out.write("\n")) {
                return std::unexpected(EmitError::write_failure("failed to separate diagnostics"));
            }
            if (!m_out.write(*text)) {
                return std::unexpected(EmitError::write_failure("failed to write the diagnostic to the stream"));
            }
            m_has_printed = true;
            return {};
        }

        auto flush() -> void override {
            std::lock_guard lock(m_mutex);
            m_out.flush();
        }

        auto reset() noexcept -> void {
            std::lock_guard lock(m_mutex);
            m_has_printed = false;
        }

        constexpr auto colors_enabled() const noexcept -> bool {
            return m_mode == TerminalColorMode::Enable;
        }

    private:
        static auto resolve_mode(FILE* file, TerminalColorMode mode) noexcept -> TerminalColorMode {
            if (mode != TerminalColorMode::Auto) return mode;
            return core::term::supports_color(file) ? TerminalColorMode::Enable : TerminalColorMode::Disable;
        }

    private:
        Writer<FILE*> m_out;
        Files const* m_files;
        RenderConfig m_config;
        TerminalColorMode m_mode;
        std::mutex m_mutex{};
        bool m_has_printed{false};
    };
} // namespace caret

#endif // AMT_CARET_CONSUMERS_STREAM_HPP
