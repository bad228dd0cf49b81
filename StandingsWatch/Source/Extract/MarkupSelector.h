/* This file is part of StandingsWatch.
 *
 * StandingsWatch is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * StandingsWatch is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with StandingsWatch.  If not, see <http://www.gnu.org/licenses/>.
 */
#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "rapidxml.hpp"

/**
 * @brief The CSS subset needed to address cells in serialized standings markup.
 *
 * A selector is a whitespace-separated chain of compounds joined by the
 * descendant combinator. Each compound is an optional tag name (or '*')
 * followed by any number of ".class" and "[attr]" / "[attr=value]" tests.
 * Matching is scoped: ancestors are only searched up to and including the
 * scope node handed to select*().
 */
class MarkupSelector {
public:
    typedef rapidxml::xml_node<char> Node;

    MarkupSelector() = default;

    // Throws std::invalid_argument on malformed selector text.
    static MarkupSelector parse(const std::string& text);

    bool empty() const { return steps_.empty(); }
    const std::string& text() const { return text_; }

    // Descendant elements of scope (scope itself excluded), document order.
    const Node* selectFirst(const Node* scope) const;
    std::vector<const Node*> selectAll(const Node* scope) const;

    bool matches(const Node* element, const Node* scope) const;

    // Text pieces of all descendants, each trimmed, concatenated.
    static std::string textOf(const Node* node);
    static std::optional<std::string> attributeOf(const Node* node, const std::string& name);

private:
    struct Compound {
        std::string tag;                 // empty or "*" = any
        std::vector<std::string> classes;
        std::vector<std::pair<std::string, std::optional<std::string>>> attributes;

        bool matches(const Node* element) const;
    };

    static Compound parseCompound(const std::string& token);
    static void collectText(const Node* node, std::string& out);
    const Node* findFirst(const Node* node, const Node* scope) const;
    void findAll(const Node* node, const Node* scope, std::vector<const Node*>& out) const;

    std::string text_;
    std::vector<Compound> steps_;
};
