#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include <string>
#include <string_view>
#include "caret/emitter.hpp"
#include "mock.hpp"

namespace {
    auto count_markers(std::string_view text, char marker) -> std::size_t {
        auto iter = LineIterator{ .str = std::string(text) };
        while (!iter.empty()) {
            auto line = iter.next();
            auto n = static_cast<std::size_t>(std::count(line.begin(), line.end(), marker));
            if (n != 0) return n;
        }
        return 0;
    }
} // namespace

TEST_CASE("Single line diagnostic", "[emitter]") {
    auto files = SimpleFiles();
    auto id = files.add("main.txt", "a\nb\nlet xyzw = 42;\n");
    auto diag = Diagnostic::error("unexpected token")
        .with_code("E0001")
        .with_label(Label::primary(Span(id, 8, 12)).with_message("here"))
        .with_note("note text");

    SECTION("Plain text") {
        auto out = caret::format(diag, files);
        REQUIRE(out.has_value());
        REQUIRE(*out ==
            "error[E0001]: unexpected token\n"
            "\n"
            "- main.txt:3:5\n"
            "3 | let xyzw = 42;\n"
            "  |     ^^^^ here\n"
            "  = note text\n"
        );
    }

    SECTION("Line by line through a terminal") {
        auto os = std::stringstream{};
        auto term = Terminal<std::stringstream>(Writer<std::stringstream>(os), TerminalColorMode::Disable);
        REQUIRE(emit(term, diag, files).has_value());

        auto iter = LineIterator{ .str = os.str() };
        REQUIRE(iter.next() == "error[E0001]: unexpected token");
        REQUIRE(iter.next() == "");
        REQUIRE(iter.next() == "- main.txt:3:5");
        REQUIRE(iter.next() == "3 | let xyzw = 42;");
        REQUIRE(iter.next() == "  |     ^^^^ here");
        REQUIRE(iter.next() == "  = note text");
        REQUIRE(iter.empty());
    }

    SECTION("Colors only add escape sequences") {
        auto plain = caret::format(diag, files);
        auto colored = caret::format(diag, files, {}, TerminalColorMode::Enable);
        REQUIRE(plain.has_value());
        REQUIRE(colored.has_value());
        REQUIRE(*plain != *colored);
        REQUIRE(colored->starts_with("\x1b[1;31merror[E0001]"));
        REQUIRE(strip_ansi(*colored) == *plain);
    }

    SECTION("Labelled source columns take the label color") {
        auto colored = caret::format(diag, files, {}, TerminalColorMode::Enable);
        REQUIRE(colored.has_value());
        REQUIRE(colored->find("\x1b[34m3 | \x1b[0mlet \x1b[31mxyzw\x1b[0m = 42;\n") != std::string::npos);
        REQUIRE(strip_ansi(*colored) == *caret::format(diag, files));
    }

    SECTION("Line breaks in a label message keep the gutter") {
        auto broken = Diagnostic::error("unexpected token")
            .with_label(Label::primary(Span(id, 8, 12)).with_message("here\nand here"));
        auto out = caret::format(broken, files);
        REQUIRE(out.has_value());
        REQUIRE(*out ==
            "error: unexpected token\n"
            "\n"
            "- main.txt:3:5\n"
            "3 | let xyzw = 42;\n"
            "  |     ^^^^ here\n"
            "  |          and here\n"
        );
    }

    SECTION("Theme colors") {
        auto config = RenderConfig{};
        config.severity_colors[static_cast<std::size_t>(Severity::Error)] = Color::Magenta;
        auto colored = caret::format(diag, files, config, TerminalColorMode::Enable);
        REQUIRE(colored.has_value());
        REQUIRE(colored->starts_with("\x1b[1;35merror"));
    }

    SECTION("Rendering is deterministic") {
        auto first = caret::format(diag, files);
        auto second = caret::format(diag, files);
        REQUIRE(first.has_value());
        REQUIRE(second.has_value());
        REQUIRE(*first == *second);
    }

    SECTION("Writer failures are reported") {
        auto sink = FailingSink{ .accept = 3 };
        auto term = Terminal<FailingSink>(Writer<FailingSink>(sink), TerminalColorMode::Disable);
        auto res = emit(term, diag, files);
        REQUIRE(!res.has_value());
        REQUIRE(res.error().kind == EmitErrorKind::WriteFailure);
    }
}

TEST_CASE("Multi-line diagnostic", "[emitter]") {
    auto files = SimpleFiles();
    auto id = files.add(
        "main.rs",
        "fn main() {\n"
        "    let a = {\n"
        "        compute(1)\n"
        "    };\n"
        "}\n"
    );
    auto diag = Diagnostic::error("mismatched types")
        .with_label(Label::primary(Span(id, 24, 50)).with_message("block"))
        .with_label(Label::secondary(Span(id, 34, 41)).with_message("call"));

    auto out = caret::format(diag, files);
    REQUIRE(out.has_value());
    REQUIRE(*out ==
        "error: mismatched types\n"
        "\n"
        "- main.rs:2:13\n"
        "2 | /     let a = {\n"
        "  | |             ^\n"
        "3 | |         compute(1)\n"
        "  | |         ------- call\n"
        "4 | |     };\n"
        "  | \\ ^^^^^ block\n"
    );
}

TEST_CASE("Overlapping labels on one line", "[emitter]") {
    auto files = SimpleFiles();
    auto id = files.add("main.txt", "let value = compute(1, 2);\n");

    SECTION("Overlapping labels stack on separate rows") {
        auto diag = Diagnostic::error("bad call")
            .with_label(Label::primary(Span(id, 4, 25)).with_message("outer"))
            .with_label(Label::secondary(Span(id, 12, 19)).with_message("inner"))
            .with_label(Label::secondary(Span(id, 0, 3)).with_message("kw"));

        auto out = caret::format(diag, files);
        REQUIRE(out.has_value());
        REQUIRE(*out ==
            "error: bad call\n"
            "\n"
            "- main.txt:1:5\n"
            "1 | let value = compute(1, 2);\n"
            "  | --- ^^^^^^^^^^^^^^^^^^^^^ outer\n"
            "  | kw\n"
            "  |             ------- inner\n"
        );
    }

    SECTION("Hanging messages keep bars under pending labels") {
        auto diag = Diagnostic::error("bad call")
            .with_label(Label::secondary(Span(id, 0, 3)).with_message("keyword"))
            .with_label(Label::secondary(Span(id, 4, 9)).with_message("binding"))
            .with_label(Label::primary(Span(id, 12, 19)).with_message("call"));

        auto out = caret::format(diag, files);
        REQUIRE(out.has_value());
        REQUIRE(*out ==
            "error: bad call\n"
            "\n"
            "- main.txt:1:13\n"
            "1 | let value = compute(1, 2);\n"
            "  | --- -----   ^^^^^^^ call\n"
            "  | |   binding\n"
            "  | keyword\n"
        );
    }
}

TEST_CASE("Secondary label inside a multi-line span", "[emitter]") {
    auto files = SimpleFiles();
    auto id = files.add("main.txt", "one\ntwo {\nabc\n}\nend\n");
    auto diag = Diagnostic::error("unterminated block")
        .with_label(Label::primary(Span(id, 4, 15)).with_message("block ends here"))
        .with_label(Label::secondary(Span(id, 10, 13)).with_message("inner"));

    auto out = caret::format(diag, files);
    REQUIRE(out.has_value());
    REQUIRE(*out ==
        "error: unterminated block\n"
        "\n"
        "- main.txt:2:1\n"
        "2 | / two {\n"
        "  | | ^^^^^\n"
        "3 | | abc\n"
        "  | | --- inner\n"
        "4 | | }\n"
        "  | \\ ^ block ends here\n"
    );
}

TEST_CASE("Elided lines", "[emitter]") {
    auto files = SimpleFiles();
    auto id = files.add("long.txt", "a\nb\nc\nd\ne\nf\ng\n");
    auto diag = Diagnostic::warning("long").with_label(Label::primary(Span(id, 0, 13)));

    auto out = caret::format(diag, files);
    REQUIRE(out.has_value());
    REQUIRE(*out ==
        "warning: long\n"
        "\n"
        "- long.txt:1:1\n"
        "1 | / a\n"
        "  | | ^\n"
        "... |\n"
        "7 | | g\n"
        "  | \\ ^\n"
    );

    SECTION("Context lines are shown around the labels") {
        auto short_diag = Diagnostic::note("context").with_label(Label::primary(Span(id, 6, 7)));
        auto config = RenderConfig{ .context_lines = 1 };
        auto res = caret::format(short_diag, files, config);
        REQUIRE(res.has_value());
        REQUIRE(*res ==
            "note: context\n"
            "\n"
            "- long.txt:4:1\n"
            "3 | c\n"
            "4 | d\n"
            "  | ^\n"
            "5 | e\n"
        );
    }
}

TEST_CASE("Files are grouped by first appearance", "[emitter]") {
    auto files = SimpleFiles();
    auto a = files.add("a.txt", "alpha\n");
    auto b = files.add("b.txt", "beta\n");
    auto diag = Diagnostic::error("duplicate definition")
        .with_label(Label::secondary(Span(b, 0, 4)).with_message("first here"))
        .with_label(Label::primary(Span(a, 0, 5)).with_message("redefined"));

    auto out = caret::format(diag, files);
    REQUIRE(out.has_value());
    REQUIRE(*out ==
        "error: duplicate definition\n"
        "\n"
        "- b.txt:1:1\n"
        "1 | beta\n"
        "  | ---- first here\n"
        "\n"
        "- a.txt:1:1\n"
        "1 | alpha\n"
        "  | ^^^^^ redefined\n"
    );
}

TEST_CASE("Diagnostics without labels", "[emitter]") {
    auto files = SimpleFiles();
    auto diag = Diagnostic::help("try again").with_note("first").with_note("second");
    auto out = caret::format(diag, files);
    REQUIRE(out.has_value());
    REQUIRE(*out == "help: try again\n  = first\n  = second\n");
}

TEST_CASE("Invalid spans write nothing", "[emitter]") {
    auto files = SimpleFiles();
    auto id = files.add("main.txt", "short\n");
    auto diag = Diagnostic::error("bad")
        .with_label(Label::primary(Span(id, 0, 2)))
        .with_label(Label::secondary(Span(id, 0, 50)));

    auto os = std::stringstream{};
    auto term = Terminal<std::stringstream>(Writer<std::stringstream>(os), TerminalColorMode::Enable);
    auto res = emit(term, diag, files);
    REQUIRE(!res.has_value());
    REQUIRE(res.error().kind == EmitErrorKind::InvalidSpan);
    REQUIRE(os.str().empty());
}

TEST_CASE("Underline width follows the tab width", "[emitter]") {
    auto files = SimpleFiles();
    auto id = files.add("tabs.txt", "a\tb\tcd\n");

    for (dsize_t tab_width = 1; tab_width <= 8; ++tab_width) {
        auto config = RenderConfig{ .tab_width = tab_width };
        auto on_tab = Diagnostic::error("tab").with_label(Label::primary(Span(id, 1, 2)));
        auto after_tab = Diagnostic::error("text").with_label(Label::primary(Span(id, 4, 6)));

        auto on_tab_out = caret::format(on_tab, files, config);
        auto after_tab_out = caret::format(after_tab, files, config);
        REQUIRE(on_tab_out.has_value());
        REQUIRE(after_tab_out.has_value());

        // The tab starts at column 2 and runs to the next tab stop.
        auto const tab_end = (1 / tab_width + 1) * tab_width;
        REQUIRE(count_markers(*on_tab_out, '^') == tab_end - 1);
        REQUIRE(count_markers(*after_tab_out, '^') == 2);
    }
}
