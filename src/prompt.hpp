#pragma once
#include <string>

namespace cortex {

// User interaction seam. A cancelled or exhausted input returns the default
// the caller supplied, so a step always finishes in a defined state.
class Prompter {
public:
    virtual ~Prompter() = default;

    virtual void say(const std::string& text) = 0;
    virtual std::string ask(const std::string& question, const std::string& fallback) = 0;

    // Input is not echoed where the terminal allows it
    virtual std::string ask_secret(const std::string& question) { return ask(question, ""); }

    bool confirm(const std::string& question, bool default_yes);
};

// stdin/stdout
class ConsolePrompter : public Prompter {
public:
    void say(const std::string& text) override;
    std::string ask(const std::string& question, const std::string& fallback) override;
    std::string ask_secret(const std::string& question) override;
};

} // namespace cortex
