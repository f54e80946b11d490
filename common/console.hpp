#ifndef CONSOLE_HPP
#define CONSOLE_HPP

#include <iostream>
#include <string>

// Colored status output and interactive y/N prompts.
//
// All pipeline stages talk to the user through one Console so that tests
// can feed answers from a stringstream and inspect what was printed.
class Console {
private:
    std::istream& in;
    std::ostream& out;
    std::ostream& err;
    bool assume_yes;
    bool use_color;

    std::string paint(const char* color, const std::string& text) const;

public:
    Console(std::istream& in, std::ostream& out, std::ostream& err, bool assume_yes = false);

    // Console bound to std::cin/std::cout/std::cerr. Colors follow isatty(1) and NO_COLOR.
    static Console standard(bool assume_yes);

    void set_color(bool value) { use_color = value; }

    void status(const std::string& message);
    void success(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);
    void banner(const std::string& title);
    void blank();

    // Raw tool output, echoed line by line.
    void passthrough(const std::string& text);

    // Prints the prompt and reads one line. Returns "" at end of input.
    std::string ask(const std::string& prompt);

    // "(y/N)" confirmation. Only "y"/"Y" counts as yes; EOF is no.
    // With assume_yes the prompt is echoed and answered automatically.
    bool confirm(const std::string& prompt);
};

#endif // CONSOLE_HPP
