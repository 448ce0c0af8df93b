#include <catch2/catch_test_macros.hpp>
#include <string>
#include "caret/core/term/terminal.hpp"
#include "caret/document.hpp"
#include "caret/renderer.hpp"
#include "mock.hpp"

TEST_CASE("Tree renderer", "[renderer]") {
    auto const red = Style::fg(Color::Red);
    auto document = doc::Document{};
    document
        .push_styled(red.with_bold(), "error")
        .push_text(": ")
        .push_styled(red, "oops")
        .push_text("\n");

    SECTION("Plain output omits escape sequences") {
        auto out = std::string{};
        auto term = Terminal<std::string>(Writer<std::string>(out), TerminalColorMode::Disable);
        auto res = render(document, term);
        REQUIRE(res.has_value());
        REQUIRE(out == "error: oops\n");
    }

    SECTION("Colored output switches styles only when they change") {
        auto out = std::string{};
        auto term = Terminal<std::string>(Writer<std::string>(out), TerminalColorMode::Enable);
        auto res = render(document, term);
        REQUIRE(res.has_value());
        REQUIRE(out ==
            "\x1b[1;31m" "error"
            "\x1b[0m" ": "
            "\x1b[31m" "oops"
            "\x1b[0m" "\n"
        );
        REQUIRE(term.current_style().is_plain());
        REQUIRE(strip_ansi(out) == "error: oops\n");
    }

    SECTION("The terminal is reset after a trailing styled run") {
        auto tail = doc::Document{};
        tail.push_styled(Style::fg(Color::Green), "ok");

        auto out = std::string{};
        auto term = Terminal<std::string>(Writer<std::string>(out), TerminalColorMode::Enable);
        REQUIRE(render(tail, term).has_value());
        REQUIRE(out == "\x1b[32mok\x1b[0m");
    }

    SECTION("Rejected writes stop the render") {
        auto sink = FailingSink{ .accept = 2 };
        auto term = Terminal<FailingSink>(Writer<FailingSink>(sink), TerminalColorMode::Disable);
        auto res = render(document, term);
        REQUIRE(!res.has_value());
        REQUIRE(res.error().kind == EmitErrorKind::WriteFailure);
        REQUIRE(sink.written == "error: ");
    }

    SECTION("Bright and true colors") {
        auto out = std::string{};
        auto term = Terminal<std::string>(Writer<std::string>(out), TerminalColorMode::Enable);
        auto styled = doc::Document{};
        styled
            .push_styled(Style::fg(Color::BrightCyan), "a")
            .push_styled(Style::fg(Color(10, 20, 30)).with_bg(Color::Blue), "b");
        REQUIRE(render(styled, term).has_value());
        REQUIRE(out == "\x1b[96ma\x1b[0m\x1b[38;2;10;20;30;44mb\x1b[0m");
    }
}
