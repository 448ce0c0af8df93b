#ifndef AMT_CARET_FORWARD_HPP
#define AMT_CARET_FORWARD_HPP

#include <cstdint>

namespace caret {

    enum class Severity: std::uint8_t;
    enum class LabelStyle: std::uint8_t;
    enum class EmitErrorKind: std::uint8_t;

    struct Span;
    struct Label;
    struct Diagnostic;
    struct EmitError;
    struct Location;

    struct Files;
    struct SimpleFiles;

    struct RenderConfig;

    struct DiagnosticConsumer;
    struct ErrorTrackingDiagnosticConsumer;
    struct StreamDiagnosticConsumer;

    template <typename C>
    struct Writer;

    template <typename T>
    struct Terminal;

    namespace doc {
        struct Node;
        struct Document;
    } // namespace doc

    namespace internal {
        struct ResolvedLabel;
        struct FileLayout;
    } // namespace internal
} // namespace caret

#endif // AMT_CARET_FORWARD_HPP
