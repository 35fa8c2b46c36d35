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

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @file sexpr_parser.h
 * @brief S-expression reader for KiCad board files
 *
 * KiCad stores boards as nested lists:
 *
 *   (kicad_pcb (version 20221018)
 *     (gr_line (start 10 5) (end 110 5) (layer "Edge.Cuts") (width 0.1))
 *     ...)
 *
 * Atoms are bare tokens (`gr_line`, `10`, `Edge.Cuts`) or double-quoted
 * strings with backslash escapes. Quoted and bare forms of the same text
 * compare equal; KiCad 5 writes most names bare and KiCad 6+ quotes them.
 */

namespace openfixture {

/**
 * @brief Malformed S-expression input
 */
class SexprParseError : public std::runtime_error {
  public:
    SexprParseError(const std::string& what, size_t line)
        : std::runtime_error("line " + std::to_string(line) + ": " + what), line_(line) {}

    size_t line() const {
        return line_;
    }

  private:
    size_t line_;
};

/**
 * @brief One atom or list in the tree
 */
struct SexprNode {
    enum class Kind { Atom, List };

    Kind kind{Kind::List};
    std::string value;                ///< Atom text (unescaped)
    std::vector<SexprNode> children;  ///< List items
    size_t line{0};                   ///< Source line of the token or opening paren

    bool is_atom() const {
        return kind == Kind::Atom;
    }

    bool is_list() const {
        return kind == Kind::List;
    }

    size_t size() const {
        return children.size();
    }

    /**
     * @brief Leading atom of a list, e.g. "gr_line"
     * @return Head text, or empty string for atoms and empty lists
     */
    const std::string& head() const;

    /**
     * @brief First child list whose head matches
     * @return Child, or nullptr
     */
    const SexprNode* find(const std::string& name) const;

    /**
     * @brief All child lists whose head matches, in order
     */
    std::vector<const SexprNode*> find_all(const std::string& name) const;

    /**
     * @brief Atom text at a list position
     * @return Text, or std::nullopt if out of range or not an atom
     */
    std::optional<std::string> atom_at(size_t index) const;

    /**
     * @brief Numeric atom at a list position
     *
     * Only finite decimal numbers are accepted (no nan, inf or hex).
     *
     * @return Value, or std::nullopt if out of range or not a number
     */
    std::optional<double> number_at(size_t index) const;
};

/**
 * @brief Parses S-expression text into a tree
 */
class SexprParser {
  public:
    /**
     * @brief Parse a document with exactly one top-level list
     *
     * @param text Full document text
     * @return Root list node
     * @throws SexprParseError on unbalanced parentheses, unterminated strings,
     *         stray atoms outside the root list, or an empty document
     */
    static SexprNode parse(const std::string& text);
};

} // namespace openfixture
