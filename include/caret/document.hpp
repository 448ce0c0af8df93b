#ifndef AMT_CARET_DOCUMENT_HPP
#define AMT_CARET_DOCUMENT_HPP

#include "core/term/style.hpp"
#include "forward.hpp"
#include "core/utils.hpp"
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace caret::doc {

    struct Text {
        std::string text;
    };

    struct Styled {
        Style style;
        std::vector<Node> children;
    };

    /**
     * @brief Node of a styled document tree.
     *
     * A chunk of text takes the style of its nearest enclosing `Styled` node;
     * text outside every styled region is unstyled.
     */
    struct Node {
        std::variant<Text, Styled> value;

        static auto text(std::string str) -> Node {
            return { .value = Text{ std::move(str) } };
        }

        static auto styled(Style style, std::vector<Node> children) -> Node {
            return { .value = Styled{ .style = style, .children = std::move(children) } };
        }

        static auto styled(Style style, std::string str) -> Node {
            auto children = std::vector<Node>{};
            children.push_back(text(std::move(str)));
            return styled(style, std::move(children));
        }
    };

    // Maximal piece of text sharing one effective style.
    struct Run {
        std::optional<Style> style{};
        std::string text{};

        auto operator==(Run const&) const -> bool = default;
    };

    namespace detail {
        inline auto flatten_into(Node const& node, std::optional<Style> const& style, std::vector<Run>& out) -> void {
            std::visit(core::utils::overloaded{
                [&](Text const& t) {
                    if (t.text.empty()) return;
                    if (!out.empty() && out.back().style == style) {
                        out.back().text += t.text;
                        return;
                    }
                    out.push_back(Run{ .style = style, .text = t.text });
                },
                [&](Styled const& s) {
                    auto inner = std::optional<Style>(s.style);
                    for (auto const& child: s.children) flatten_into(child, inner, out);
                }
            }, node.value);
        }

        inline auto debug_string_into(Node const& node, unsigned depth, std::string& out) -> void {
            auto indent = std::string(depth * 2, ' ');
            std::visit(core::utils::overloaded{
                [&](Text const& t) {
                    out += std::format("{}\"{}\"\n", indent, t.text);
                },
                [&](Styled const& s) {
                    out += std::format("{}<style {}>\n", indent, s.style);
                    for (auto const& child: s.children) debug_string_into(child, depth + 1, out);
                }
            }, node.value);
        }
    } // namespace detail

    /**
     * @brief Flattens a tree into runs in depth-first order.
     * Empty chunks are dropped and neighbours with equal style are merged.
     */
    inline auto flatten(Node const& node) -> std::vector<Run> {
        auto res = std::vector<Run>{};
        detail::flatten_into(node, std::nullopt, res);
        return res;
    }

    inline auto debug_string(Node const& node) -> std::string {
        auto res = std::string{};
        detail::debug_string_into(node, 0, res);
        return res;
    }

    struct Document {
        std::vector<Node> nodes{};

        auto push(Node node) -> Document& {
            nodes.push_back(std::move(node));
            return *this;
        }

        auto push_text(std::string str) -> Document& {
            return push(Node::text(std::move(str)));
        }

        auto push_styled(Style style, std::string str) -> Document& {
            return push(Node::styled(style, std::move(str)));
        }

        constexpr auto empty() const noexcept -> bool {
            return nodes.empty();
        }

        auto flatten() const -> std::vector<Run> {
            auto res = std::vector<Run>{};
            for (auto const& node: nodes) detail::flatten_into(node, std::nullopt, res);
            return res;
        }

        auto debug_string() const -> std::string {
            auto res = std::string{};
            for (auto const& node: nodes) detail::debug_string_into(node, 0, res);
            return res;
        }
    };

} // namespace caret::doc

#endif // AMT_CARET_DOCUMENT_HPP
