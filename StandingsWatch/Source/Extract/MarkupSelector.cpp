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

#include "MarkupSelector.h"
#include "../Utility/Utils.h"
#include <cctype>
#include <cstring>
#include <stdexcept>

namespace
{
    bool isNameChar(char c)
    {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_';
    }

    bool equalsIgnoreCase(const char* a, size_t aSize, const std::string& b)
    {
        if (aSize != b.size()) return false;
        for (size_t i = 0; i < aSize; ++i) {
            if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
                return false;
            }
        }
        return true;
    }

    bool hasClass(const char* classAttr, size_t size, const std::string& cls)
    {
        size_t i = 0;
        while (i < size) {
            while (i < size && std::isspace(static_cast<unsigned char>(classAttr[i]))) ++i;
            size_t start = i;
            while (i < size && !std::isspace(static_cast<unsigned char>(classAttr[i]))) ++i;
            if (i > start && i - start == cls.size() && std::strncmp(classAttr + start, cls.c_str(), cls.size()) == 0) {
                return true;
            }
        }
        return false;
    }
}

MarkupSelector MarkupSelector::parse(const std::string& text)
{
    MarkupSelector selector;
    selector.text_ = text;

    // Split on whitespace outside [...] and quotes
    std::string token;
    char quote = 0;
    int depth = 0;
    for (char c : text) {
        if (quote) {
            token += c;
            if (c == quote) quote = 0;
            continue;
        }
        if (c == '"' || c == '\'') {
            if (depth == 0) throw std::invalid_argument("quote outside attribute test in \"" + text + "\"");
            quote = c;
            token += c;
            continue;
        }
        if (c == '[') depth++;
        if (c == ']') depth--;
        if (depth < 0) throw std::invalid_argument("unbalanced ']' in \"" + text + "\"");
        if (depth == 0 && std::isspace(static_cast<unsigned char>(c))) {
            if (!token.empty()) {
                selector.steps_.push_back(parseCompound(token));
                token.clear();
            }
            continue;
        }
        token += c;
    }
    if (quote || depth != 0) {
        throw std::invalid_argument("unterminated attribute test in \"" + text + "\"");
    }
    if (!token.empty()) {
        selector.steps_.push_back(parseCompound(token));
    }
    return selector;
}

MarkupSelector::Compound MarkupSelector::parseCompound(const std::string& token)
{
    Compound compound;
    size_t i = 0;

    if (i < token.size() && token[i] == '*') {
        compound.tag = "*";
        ++i;
    }
    else {
        while (i < token.size() && isNameChar(token[i])) {
            compound.tag += token[i++];
        }
    }

    while (i < token.size()) {
        char c = token[i];
        if (c == '.') {
            ++i;
            std::string cls;
            while (i < token.size() && isNameChar(token[i])) cls += token[i++];
            if (cls.empty()) throw std::invalid_argument("empty class name in \"" + token + "\"");
            compound.classes.push_back(cls);
        }
        else if (c == '[') {
            size_t close = token.find(']', i);
            if (close == std::string::npos) throw std::invalid_argument("missing ']' in \"" + token + "\"");
            std::string body = token.substr(i + 1, close - i - 1);
            i = close + 1;

            size_t eq = body.find('=');
            std::string name = body.substr(0, eq);
            name = Utils::trim(name);
            if (name.empty()) throw std::invalid_argument("empty attribute name in \"" + token + "\"");

            std::optional<std::string> value;
            if (eq != std::string::npos) {
                std::string v = body.substr(eq + 1);
                v = Utils::trim(v);
                if (v.size() >= 2 && (v.front() == '"' || v.front() == '\'') && v.back() == v.front()) {
                    v = v.substr(1, v.size() - 2);
                }
                value = v;
            }
            compound.attributes.emplace_back(name, value);
        }
        else {
            throw std::invalid_argument(std::string("unsupported selector character '") + c + "' in \"" + token + "\"");
        }
    }
    return compound;
}

bool MarkupSelector::Compound::matches(const Node* element) const
{
    if (!element || element->type() != rapidxml::node_element) return false;

    if (!tag.empty() && tag != "*" && !equalsIgnoreCase(element->name(), element->name_size(), tag)) {
        return false;
    }

    if (!classes.empty()) {
        const rapidxml::xml_attribute<char>* classAttr = element->first_attribute("class");
        if (!classAttr) return false;
        for (const auto& cls : classes) {
            if (!hasClass(classAttr->value(), classAttr->value_size(), cls)) return false;
        }
    }

    for (const auto& test : attributes) {
        const rapidxml::xml_attribute<char>* attr = element->first_attribute(test.first.c_str());
        if (!attr) return false;
        if (test.second && std::string(attr->value(), attr->value_size()) != *test.second) return false;
    }
    return true;
}

bool MarkupSelector::matches(const Node* element, const Node* scope) const
{
    if (steps_.empty() || !steps_.back().matches(element)) return false;

    // Nearest matching ancestor per step is enough for descendant-only chains
    const Node* cursor = element;
    for (size_t step = steps_.size() - 1; step-- > 0;) {
        bool found = false;
        while (cursor != scope && cursor->parent()) {
            cursor = cursor->parent();
            if (steps_[step].matches(cursor)) {
                found = true;
                break;
            }
        }
        if (!found) return false;
    }
    return true;
}

const MarkupSelector::Node* MarkupSelector::findFirst(const Node* node, const Node* scope) const
{
    for (const Node* child = node->first_node(); child; child = child->next_sibling()) {
        if (child->type() != rapidxml::node_element) continue;
        if (matches(child, scope)) return child;
        if (const Node* hit = findFirst(child, scope)) return hit;
    }
    return nullptr;
}

void MarkupSelector::findAll(const Node* node, const Node* scope, std::vector<const Node*>& out) const
{
    for (const Node* child = node->first_node(); child; child = child->next_sibling()) {
        if (child->type() != rapidxml::node_element) continue;
        if (matches(child, scope)) out.push_back(child);
        findAll(child, scope, out);
    }
}

const MarkupSelector::Node* MarkupSelector::selectFirst(const Node* scope) const
{
    if (!scope || steps_.empty()) return nullptr;
    return findFirst(scope, scope);
}

std::vector<const MarkupSelector::Node*> MarkupSelector::selectAll(const Node* scope) const
{
    std::vector<const Node*> out;
    if (scope && !steps_.empty()) {
        findAll(scope, scope, out);
    }
    return out;
}

void MarkupSelector::collectText(const Node* node, std::string& out)
{
    for (const Node* child = node->first_node(); child; child = child->next_sibling()) {
        if (child->type() == rapidxml::node_data || child->type() == rapidxml::node_cdata) {
            out += std::string(Utils::trimEnds(std::string_view(child->value(), child->value_size())));
        }
        else if (child->type() == rapidxml::node_element) {
            collectText(child, out);
        }
    }
}

std::string MarkupSelector::textOf(const Node* node)
{
    std::string out;
    if (node) collectText(node, out);
    return out;
}

std::optional<std::string> MarkupSelector::attributeOf(const Node* node, const std::string& name)
{
    if (!node) return std::nullopt;
    const rapidxml::xml_attribute<char>* attr = node->first_attribute(name.c_str());
    if (!attr) return std::nullopt;
    return std::string(attr->value(), attr->value_size());
}
