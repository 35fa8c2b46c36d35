// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 OpenFixture Contributors
 *
 * This file is part of OpenFixture, which is free software: you can
 * redistribute it and/or modify it under the terms of the GNU General
 * Public License as published by the Free Software Foundation, either
 * version 3 of the License, or (at your option) any later version.
 *
 * See <https://www.gnu.org/licenses/>.
 */

#include "sexpr_parser.h"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <utility>

namespace openfixture {

namespace {

const std::string EMPTY;

bool is_delimiter(char c) {
    return c == '(' || c == ')' || c == '"' || std::isspace(static_cast<unsigned char>(c));
}

char unescape(char c) {
    switch (c) {
    case 'n':
        return '\n';
    case 't':
        return '\t';
    case 'r':
        return '\r';
    default:
        return c;
    }
}

} // namespace

// ============================================================================
// SexprNode
// ============================================================================

const std::string& SexprNode::head() const {
    if (is_list() && !children.empty() && children.front().is_atom()) {
        return children.front().value;
    }
    return EMPTY;
}

const SexprNode* SexprNode::find(const std::string& name) const {
    for (const auto& child : children) {
        if (child.is_list() && child.head() == name) {
            return &child;
        }
    }
    return nullptr;
}

std::vector<const SexprNode*> SexprNode::find_all(const std::string& name) const {
    std::vector<const SexprNode*> result;
    for (const auto& child : children) {
        if (child.is_list() && child.head() == name) {
            result.push_back(&child);
        }
    }
    return result;
}

std::optional<std::string> SexprNode::atom_at(size_t index) const {
    if (index >= children.size() || !children[index].is_atom()) {
        return std::nullopt;
    }
    return children[index].value;
}

std::optional<double> SexprNode::number_at(size_t index) const {
    auto text = atom_at(index);
    if (!text || text->empty()) {
        return std::nullopt;
    }
    // Decimal only; strtod would also take hex floats
    if (text->find_first_of("xX") != std::string::npos) {
        return std::nullopt;
    }

    char* end = nullptr;
    errno = 0;
    double value = std::strtod(text->c_str(), &end);
    if (end != text->c_str() + text->size() || errno == ERANGE || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

// ============================================================================
// SexprParser
// ============================================================================

SexprNode SexprParser::parse(const std::string& text) {
    // Open lists, innermost last
    std::vector<SexprNode> stack;
    std::optional<SexprNode> root;
    size_t line = 1;
    size_t i = 0;

    auto append = [&](SexprNode node) {
        if (stack.empty()) {
            throw SexprParseError("unexpected token outside of a list", node.line);
        }
        stack.back().children.push_back(std::move(node));
    };

    while (i < text.size()) {
        char c = text[i];

        if (c == '\n') {
            line++;
            i++;
            continue;
        }
        if (std::isspace(static_cast<unsigned char>(c))) {
            i++;
            continue;
        }

        if (c == '(') {
            if (root) {
                throw SexprParseError("content after the top-level list", line);
            }
            SexprNode list;
            list.kind = SexprNode::Kind::List;
            list.line = line;
            stack.push_back(std::move(list));
            i++;
            continue;
        }

        if (c == ')') {
            if (stack.empty()) {
                throw SexprParseError("unbalanced ')'", line);
            }
            SexprNode done = std::move(stack.back());
            stack.pop_back();
            if (stack.empty()) {
                root = std::move(done);
            } else {
                stack.back().children.push_back(std::move(done));
            }
            i++;
            continue;
        }

        SexprNode atom;
        atom.kind = SexprNode::Kind::Atom;
        atom.line = line;

        if (c == '"') {
            size_t start_line = line;
            i++;
            bool closed = false;
            while (i < text.size()) {
                char s = text[i];
                if (s == '\\' && i + 1 < text.size()) {
                    atom.value += unescape(text[i + 1]);
                    i += 2;
                    continue;
                }
                if (s == '"') {
                    closed = true;
                    i++;
                    break;
                }
                if (s == '\n') {
                    line++;
                }
                atom.value += s;
                i++;
            }
            if (!closed) {
                throw SexprParseError("unterminated string", start_line);
            }
        } else {
            size_t start = i;
            while (i < text.size() && !is_delimiter(text[i])) {
                i++;
            }
            atom.value = text.substr(start, i - start);
        }

        append(std::move(atom));
    }

    if (!stack.empty()) {
        throw SexprParseError("missing ')' for list opened here", stack.back().line);
    }
    if (!root) {
        throw SexprParseError("document is empty", line);
    }
    return std::move(*root);
}

} // namespace openfixture
