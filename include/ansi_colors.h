// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file ansi_colors.h
 * @brief ANSI escape codes for the command-line summary
 *
 * Raw escape sequences, no terminfo lookup. Disabled automatically when
 * stdout is not a terminal.
 */

#pragma once

#include <string>
#include <unistd.h>

namespace openfixture {
namespace ansi {

// Check if output is a TTY (for auto-disable when piped)
inline bool is_tty() {
    return isatty(STDOUT_FILENO);
}

constexpr const char* RESET = "\033[0m";
constexpr const char* BOLD = "\033[1m";
constexpr const char* DIM = "\033[2m";
constexpr const char* CYAN = "\033[36m";
constexpr const char* WHITE = "\033[37m";
constexpr const char* BRIGHT_RED = "\033[91m";
constexpr const char* BRIGHT_GREEN = "\033[92m";
constexpr const char* BRIGHT_YELLOW = "\033[93m";
constexpr const char* BRIGHT_BLUE = "\033[94m";

/**
 * @brief Wraps text in escape codes when enabled
 */
class Painter {
  public:
    explicit Painter(bool enabled) : enabled_(enabled) {}

    bool enabled() const {
        return enabled_;
    }

    std::string paint(const char* code, const std::string& text) const {
        if (!enabled_) {
            return text;
        }
        return std::string(code) + text + RESET;
    }

    std::string success(const std::string& text) const {
        return paint(BRIGHT_GREEN, text);
    }

    std::string error(const std::string& text) const {
        return paint(BRIGHT_RED, text);
    }

    std::string warning(const std::string& text) const {
        return paint(BRIGHT_YELLOW, text);
    }

    std::string dim(const std::string& text) const {
        return paint(DIM, text);
    }

    std::string key(const std::string& text) const {
        return paint(BRIGHT_BLUE, text);
    }

    std::string value(const std::string& text) const {
        return paint(WHITE, text);
    }

    std::string section(const std::string& text) const {
        if (!enabled_) {
            return text;
        }
        return std::string(BOLD) + CYAN + text + RESET;
    }

  private:
    bool enabled_;
};

} // namespace ansi
} // namespace openfixture
