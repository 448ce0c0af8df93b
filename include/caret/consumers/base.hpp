#ifndef AMT_CARET_CONSUMERS_BASE_HPP
#define AMT_CARET_CONSUMERS_BASE_HPP

#include "../basic.hpp"
#include <expected>

namespace caret {
    struct DiagnosticConsumer {
        virtual ~DiagnosticConsumer() = default;
        virtual auto consume(Diagnostic const& diagnostic) -> std::expected<void, EmitError> = 0;
        virtual auto flush() -> void {}
    };
} // namespace caret

#endif // AMT_CARET_CONSUMERS_BASE_HPP
