#include <catch2/catch_test_macros.hpp>
#include <string>
#include <vector>
#include "caret/document.hpp"

using namespace caret;
using namespace caret::doc;

TEST_CASE("Document flattening", "[document]") {
    auto const red = Style::fg(Color::Red);
    auto const blue = Style::fg(Color::Blue);

    SECTION("Unstyled text") {
        auto runs = flatten(Node::text("hello"));
        REQUIRE(runs.size() == 1);
        REQUIRE(!runs[0].style.has_value());
        REQUIRE(runs[0].text == "hello");
    }

    SECTION("Nearest enclosing style wins") {
        auto children = std::vector<Node>{};
        children.push_back(Node::text("a"));
        children.push_back(Node::styled(blue, "b"));
        children.push_back(Node::text("c"));
        auto runs = flatten(Node::styled(red, std::move(children)));

        REQUIRE(runs.size() == 3);
        REQUIRE(runs[0] == Run{ .style = red, .text = "a" });
        REQUIRE(runs[1] == Run{ .style = blue, .text = "b" });
        REQUIRE(runs[2] == Run{ .style = red, .text = "c" });
    }

    SECTION("Empty chunks are dropped and equal styles coalesce") {
        auto children = std::vector<Node>{};
        children.push_back(Node::text("x"));
        children.push_back(Node::text(""));
        children.push_back(Node::styled(red, ""));
        children.push_back(Node::styled(red, "y"));
        auto runs = flatten(Node::styled(red, std::move(children)));

        REQUIRE(runs.size() == 1);
        REQUIRE(runs[0] == Run{ .style = red, .text = "xy" });
    }

    SECTION("Documents coalesce across top level nodes") {
        auto document = Document{};
        document
            .push_text("a")
            .push_text("b")
            .push_styled(red, "c")
            .push_styled(red, "d")
            .push_text("e");

        auto runs = document.flatten();
        REQUIRE(runs.size() == 3);
        REQUIRE(runs[0] == Run{ .style = std::nullopt, .text = "ab" });
        REQUIRE(runs[1] == Run{ .style = red, .text = "cd" });
        REQUIRE(runs[2] == Run{ .style = std::nullopt, .text = "e" });
    }

    SECTION("An empty tree produces no runs") {
        REQUIRE(flatten(Node::styled(red, std::vector<Node>{})).empty());
        REQUIRE(Document{}.flatten().empty());
        REQUIRE(Document{}.empty());
    }

    SECTION("Debug dump") {
        auto children = std::vector<Node>{};
        children.push_back(Node::text("x"));
        auto text = debug_string(Node::styled(red.with_bold(), std::move(children)));
        REQUIRE(text == "<style fg=Red bold>\n  \"x\"\n");
    }
}
