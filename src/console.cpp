#include "console.hpp"
#include <cstdlib>
#include <unistd.h>

namespace incfile {

// Returns true if fd is a terminal that understands ANSI escape codes.
static bool supports_colors(int fd) {
    const char* term = std::getenv("TERM");
    if (!term || std::string(term) == "dumb") {
        return false;
    }
    return isatty(fd) != 0;
}

Console::Console()
    : out_colors_(supports_colors(STDOUT_FILENO)),
      err_colors_(supports_colors(STDERR_FILENO)) {}

void Console::println(const std::string& text) const {
    std::cout << text << std::endl;
}

void Console::message(const std::string& text, const char* color) const {
    if (err_colors_) {
        std::cerr << color << text << ansi::RESET << std::endl;
    } else {
        std::cerr << text << std::endl;
    }
}

void Console::print_error(const std::string& text) const {
    message(text, ansi::RED);
}

void Console::print_warning(const std::string& text) const {
    message(text, ansi::YELLOW);
}

void Console::print_info(const std::string& text) const {
    message(text, ansi::CYAN);
}

void Console::print_header(const std::string& text) const {
    if (out_colors_) {
        std::cout << ansi::BOLD << ansi::CYAN << text << ansi::RESET << std::endl;
    } else {
        std::cout << text << std::endl;
    }
}

void Console::print_colored(const std::string& text, const char* color) const {
    if (out_colors_) {
        std::cout << color << text << ansi::RESET;
    } else {
        std::cout << text;
    }
}

void Console::print_raw(const std::string& text) const {
    std::cout << text;
}

} // namespace incfile
