#include "console.hpp"
#include "utils.hpp"
#include <cstdlib>
#include <unistd.h>

namespace {
    const char* const RESET = "\033[0m";
    const char* const RED = "\033[0;31m";
    const char* const GREEN = "\033[0;32m";
    const char* const YELLOW = "\033[1;33m";
    const char* const BLUE = "\033[0;34m";
}

Console::Console(std::istream& in, std::ostream& out, std::ostream& err, bool assume_yes)
    : in(in), out(out), err(err), assume_yes(assume_yes), use_color(false) {}

Console Console::standard(bool assume_yes) {
    Console console(std::cin, std::cout, std::cerr, assume_yes);
    console.set_color(isatty(STDOUT_FILENO) && std::getenv("NO_COLOR") == nullptr);
    return console;
}

std::string Console::paint(const char* color, const std::string& text) const {
    if (!use_color) return text;
    return std::string(color) + text + RESET;
}

void Console::status(const std::string& message) {
    out << paint(BLUE, "[INFO]") << " " << message << std::endl;
}

void Console::success(const std::string& message) {
    out << paint(GREEN, "[SUCCESS]") << " " << message << std::endl;
}

void Console::warning(const std::string& message) {
    out << paint(YELLOW, "[WARNING]") << " " << message << std::endl;
}

void Console::error(const std::string& message) {
    err << paint(RED, "[ERROR]") << " " << message << std::endl;
}

void Console::banner(const std::string& title) {
    const std::string rule(48, '=');
    out << paint(BLUE, rule) << std::endl;
    out << paint(BLUE, "    " + title) << std::endl;
    out << paint(BLUE, rule) << std::endl;
}

void Console::blank() {
    out << std::endl;
}

void Console::passthrough(const std::string& text) {
    for (const auto& line : split_string(text, '\n')) {
        if (!line.empty()) out << "  " << line << std::endl;
    }
}

std::string Console::ask(const std::string& prompt) {
    out << prompt << std::flush;
    std::string line;
    if (!std::getline(in, line)) {
        out << std::endl;
        return "";
    }
    return trim(line);
}

bool Console::confirm(const std::string& prompt) {
    if (assume_yes) {
        out << prompt << " (y/N): y" << std::endl;
        return true;
    }
    std::string answer = ask(prompt + " (y/N): ");
    return answer == "y" || answer == "Y";
}
