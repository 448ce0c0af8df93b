#ifndef AMT_CARET_CONSUMERS_ERROR_TRACKING_HPP
#define AMT_CARET_CONSUMERS_ERROR_TRACKING_HPP

#include "base.hpp"

namespace caret {
    // Forwards every diagnostic and remembers whether an error or a bug went through.
    struct ErrorTrackingDiagnosticConsumer: DiagnosticConsumer {
        explicit constexpr ErrorTrackingDiagnosticConsumer(DiagnosticConsumer* consumer) noexcept
            : m_consumer(consumer)
        {}
        constexpr ErrorTrackingDiagnosticConsumer(ErrorTrackingDiagnosticConsumer const&) noexcept = default;
        constexpr ErrorTrackingDiagnosticConsumer(ErrorTrackingDiagnosticConsumer &&) noexcept = default;
        constexpr ErrorTrackingDiagnosticConsumer& operator=(ErrorTrackingDiagnosticConsumer const&) noexcept = default;
        constexpr ErrorTrackingDiagnosticConsumer& operator=(ErrorTrackingDiagnosticConsumer &&) noexcept = default;
        ~ErrorTrackingDiagnosticConsumer() noexcept override = default;

        auto consume(Diagnostic const& d) -> std::expected<void, EmitError> override {
            m_seen_error |= !is_more_severe(Severity::Error, d.severity);
            return m_consumer->consume(d);
        }

        auto flush() -> void override { m_consumer->flush(); }

        [[nodiscard]] constexpr auto seen_error() const noexcept -> bool { return m_seen_error; }

        constexpr auto reset() noexcept -> void {
            m_seen_error = false;
        }
    private:
        DiagnosticConsumer* m_consumer;
        bool m_seen_error{false};
    };
} // namespace caret

#endif // AMT_CARET_CONSUMERS_ERROR_TRACKING_HPP
