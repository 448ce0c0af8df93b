#include <catch2/catch_test_macros.hpp>
#include "caret/core/string_utils.hpp"
#include "caret/core/utf8.hpp"
#include "caret/core/utils.hpp"

using namespace caret;

TEST_CASE("Utf8 columns", "[utf8]") {
    SECTION("Codepoint lengths") {
        REQUIRE(core::utf8::get_length('a') == 1);
        REQUIRE(core::utf8::get_length("é"[0]) == 2);
        REQUIRE(core::utf8::get_length("€"[0]) == 3);
        REQUIRE(core::utf8::get_length("😀"[0]) == 4);
    }

    SECTION("Display width counts codepoints") {
        REQUIRE(core::utf8::display_width("hello", 4) == 5);
        REQUIRE(core::utf8::display_width("héllo", 4) == 5);
        REQUIRE(core::utf8::display_width("", 4) == 0);
    }

    SECTION("Tabs advance to the next multiple of the tab width") {
        REQUIRE(core::utf8::display_width("\t", 4) == 4);
        REQUIRE(core::utf8::display_width("ab\t", 4) == 4);
        REQUIRE(core::utf8::display_width("abcd\t", 4) == 8);
        REQUIRE(core::utf8::display_width("a\tb", 8) == 9);
        REQUIRE(core::utf8::display_width("\t", 1) == 1);
        REQUIRE(core::utf8::display_width("\t", 0) == 1);
    }

    SECTION("Column of a byte offset") {
        auto line = std::string_view("let value = 42;");
        REQUIRE(core::utf8::column_at(line, 0, 4) == 1);
        REQUIRE(core::utf8::column_at(line, 4, 4) == 5);
        REQUIRE(core::utf8::column_at(line, line.size(), 4) == 16);
        REQUIRE(core::utf8::column_at(line, 100, 4) == 16);

        auto tabbed = std::string_view("\tx = 1");
        REQUIRE(core::utf8::column_at(tabbed, 1, 4) == 5);
        REQUIRE(core::utf8::column_at(tabbed, 1, 2) == 3);

        auto accented = std::string_view("é = 1");
        REQUIRE(core::utf8::column_at(accented, 2, 4) == 2);
    }

    SECTION("Tab expansion") {
        REQUIRE(core::utf8::expand_tabs("\tx", 4) == "    x");
        REQUIRE(core::utf8::expand_tabs("ab\tx", 4) == "ab  x");
        REQUIRE(core::utf8::expand_tabs("no tabs", 4) == "no tabs");
    }
}

TEST_CASE("String utilities", "[string_utils]") {
    SECTION("Trimming") {
        REQUIRE(core::utils::rtrim(std::string_view("abc   ")) == "abc");
        REQUIRE(core::utils::rtrim(std::string_view("   ")).empty());

        auto owned = std::string("  x \t");
        core::utils::rtrim(owned);
        REQUIRE(owned == "  x");

        REQUIRE(core::utils::strip_line_terminator("line\r\n") == "line");
        REQUIRE(core::utils::strip_line_terminator("line\n") == "line");
        REQUIRE(core::utils::strip_line_terminator("line") == "line");
    }

    SECTION("Case insensitive comparison") {
        STATIC_REQUIRE(core::utils::iequals("Always", "always"));
        STATIC_REQUIRE(!core::utils::iequals("never", "nevermore"));
    }

    SECTION("Word wrapping") {
        auto lines = core::utils::wrap_words("the quick brown fox jumps", 10);
        REQUIRE(lines.size() == 3);
        REQUIRE(lines[0] == "the quick");
        REQUIRE(lines[1] == "brown fox");
        REQUIRE(lines[2] == "jumps");

        auto long_word = core::utils::wrap_words("a extraordinarily b", 5);
        REQUIRE(long_word.size() == 3);
        REQUIRE(long_word[1] == "extraordinarily");

        REQUIRE(core::utils::wrap_words("", 10).empty());
    }

    SECTION("Digit count") {
        REQUIRE(core::utils::count_digits(0u) == 1);
        REQUIRE(core::utils::count_digits(9u) == 1);
        REQUIRE(core::utils::count_digits(10u) == 2);
        REQUIRE(core::utils::count_digits(12345u) == 5);
    }
}
