#ifndef AMT_CARET_RENDERER_HPP
#define AMT_CARET_RENDERER_HPP

#include "basic.hpp"
#include "core/term/terminal.hpp"
#include "document.hpp"
#include <expected>
#include <format>

namespace caret {

    /**
     * @brief Writes a document through a terminal.
     *
     * Styled runs select their style before the text is written, unstyled runs
     * reset it. The terminal is always left in the default style. The first
     * chunk the writer rejects aborts the render with
     * `EmitErrorKind::WriteFailure`.
     */
    template <typename T>
    auto render(doc::Document const& document, Terminal<T>& term) -> std::expected<void, EmitError> {
        auto runs = document.flatten();
        for (auto i = 0ul; i < runs.size(); ++i) {
            auto const& run = runs[i];
            auto styled = run.style ? term.set_style(*run.style) : term.reset_style();
            if (!styled || !term.write(run.text)) {
                return std::unexpected(EmitError::write_failure(
                    std::format("writer rejected run {} of {}", i + 1, runs.size())
                ));
            }
        }

        if (!term.reset_style()) {
            return std::unexpected(EmitError::write_failure("writer rejected the final style reset"));
        }
        return {};
    }

} // namespace caret

#endif // AMT_CARET_RENDERER_HPP
