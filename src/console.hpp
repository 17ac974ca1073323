#pragma once

/**
 * Colored terminal output for the incfile CLI.
 */

#include <string>
#include <iostream>

namespace incfile {

// ========== ANSI Escape Codes ==========

// ANSI escape codes for terminal colors.
namespace ansi {
    constexpr const char* RESET = "\033[0m";
    constexpr const char* BOLD = "\033[1m";
    constexpr const char* RED = "\033[31m";
    constexpr const char* GREEN = "\033[32m";
    constexpr const char* YELLOW = "\033[33m";
    constexpr const char* CYAN = "\033[36m";
}

/**
 * Terminal output helper with color support.
 *
 * Results go to stdout so they can be piped; errors, warnings and progress
 * messages go to stderr. ANSI colors are only used when the target stream is
 * a TTY and TERM is not "dumb".
 */
class Console {
public:
    // Creates a Console instance and detects color support.
    Console();

    // ========== Basic Output ==========

    // Prints text followed by a newline.
    void println(const std::string& text = "") const;

    // ========== Colored Output ==========

    // Prints error message in red to stderr.
    void print_error(const std::string& text) const;

    // Prints warning message in yellow to stderr.
    void print_warning(const std::string& text) const;

    // Prints informational message in cyan to stderr.
    void print_info(const std::string& text) const;

    // Prints header text in bold cyan to stdout.
    void print_header(const std::string& text) const;

    // ========== Styled Output ==========

    // Prints text to stdout with a specific ANSI color code.
    void print_colored(const std::string& text, const char* color) const;

    // ========== Raw Output ==========

    // Prints text without newline or formatting (for file contents).
    void print_raw(const std::string& text) const;

private:
    bool out_colors_;  // True if stdout supports ANSI colors.
    bool err_colors_;  // True if stderr supports ANSI colors.

    // Writes a full line to stderr, wrapped in color when supported.
    void message(const std::string& text, const char* color) const;
};

} // namespace incfile
