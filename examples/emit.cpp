#include <cstdio>
#include <cstdlib>
#include <print>
#include <string>
#include <string_view>
#include <vector>
#include "caret.hpp"
#include <spdlog/spdlog.h>

using namespace caret;

static constexpr std::string_view source =
    "fn main() {\n"
    "\tlet value = compute(1, 2;\n"
    "\tlet unused = {\n"
    "\t\tvalue + 1\n"
    "\t};\n"
    "}\n";

int main(int argc, char** argv) {
    auto mode = TerminalColorMode::Auto;
    for (auto i = 1; i < argc; ++i) {
        auto arg = std::string_view(argv[i]);
        if (!arg.starts_with("--color=")) {
            std::println(stderr, "usage: {} [--color=auto|always|ansi|never]", argv[0]);
            return 2;
        }
        auto parsed = parse_color_mode(arg.substr(8));
        if (!parsed) {
            std::println(stderr, "unknown color mode '{}'", arg.substr(8));
            return 2;
        }
        mode = *parsed;
    }

    if (auto const* level = std::getenv("CARET_LOG")) {
        spdlog::set_level(spdlog::level::from_str(level));
    }

    auto files = SimpleFiles();
    auto id = files.add("main.rs", std::string(source));

    auto consumer = StreamDiagnosticConsumer(stderr, &files, mode);
    auto tracker = ErrorTrackingDiagnosticConsumer(&consumer);

    auto diagnostics = std::vector<Diagnostic>{
        Diagnostic::error("unclosed delimiter")
            .with_code("E0001")
            .with_label(Label::primary(Span(id, 37, 37)).with_message("expected `)` here"))
            .with_label(Label::secondary(Span(id, 32, 33)).with_message("unclosed delimiter"))
            .with_note("every `(` needs a matching `)`"),
        Diagnostic::warning("unused variable")
            .with_label(Label::primary(Span(id, 44, 50)).with_message("never read"))
            .with_label(Label::secondary(Span(id, 53, 69)).with_message("this block is evaluated but its value is discarded"))
            .with_note("prefix the name with an underscore to silence this warning"),
    };

    for (auto const& diag: diagnostics) {
        if (auto res = tracker.consume(diag); !res) {
            std::println(stderr, "failed to emit '{}': {}", diag.message, res.error());
            return 1;
        }
    }
    tracker.flush();

    return tracker.seen_error() ? 1 : 0;
}
