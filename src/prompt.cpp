#include "prompt.hpp"
#include "util.hpp"

#include <iostream>
#include <termios.h>
#include <unistd.h>

namespace cortex {

bool Prompter::confirm(const std::string& question, bool default_yes) {
    std::string suffix = default_yes ? " (y/n) [y]: " : " (y/n) [n]: ";
    std::string answer = ask(question + suffix, default_yes ? "y" : "n");
    if (answer.empty()) return default_yes;
    return answer[0] == 'y' || answer[0] == 'Y';
}

void ConsolePrompter::say(const std::string& text) {
    std::cout << text << "\n";
}

std::string ConsolePrompter::ask(const std::string& question, const std::string& fallback) {
    std::cout << question << std::flush;
    std::string line;
    if (!std::getline(std::cin, line)) {
        std::cout << "\n";
        std::cin.clear();
        return fallback;
    }
    line = trim(line);
    return line.empty() ? fallback : line;
}

std::string ConsolePrompter::ask_secret(const std::string& question) {
    if (!isatty(STDIN_FILENO)) return ask(question, "");

    termios old_attrs{};
    if (tcgetattr(STDIN_FILENO, &old_attrs) != 0) return ask(question, "");
    termios quiet = old_attrs;
    quiet.c_lflag &= static_cast<tcflag_t>(~ECHO);
    tcsetattr(STDIN_FILENO, TCSANOW, &quiet);

    std::string value = ask(question, "");
    tcsetattr(STDIN_FILENO, TCSANOW, &old_attrs);
    std::cout << "\n";
    return value;
}

} // namespace cortex
