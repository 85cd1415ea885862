#pragma once
#include "config.hpp"
#include "hardware.hpp"
#include "prompt.hpp"
#include "store.hpp"
#include "verifier.hpp"
#include <cstdlib>
#include <deque>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <unistd.h>
#include <utility>
#include <vector>

namespace cortex {

// Helper: create a temp directory
inline std::string make_temp_dir() {
    auto path = std::filesystem::temp_directory_path() / "cortex_test_XXXXXX";
    std::string tmpl = path.string();
    char* result = mkdtemp(tmpl.data());
    return result ? std::string(result) : "";
}

// RAII guard: redirects HOME to a temp dir, clears credential env vars,
// restores everything on destruction
struct TempHome {
    std::string dir;
    std::string old_home;
    std::string old_shell;
    Paths paths;

    TempHome() {
        dir = make_temp_dir();
        old_home = std::getenv("HOME") ? std::getenv("HOME") : "";
        old_shell = std::getenv("SHELL") ? std::getenv("SHELL") : "";
        setenv("HOME", dir.c_str(), 1);
        setenv("SHELL", "/bin/bash", 1);
        unsetenv("ANTHROPIC_API_KEY");
        unsetenv("OPENAI_API_KEY");
        std::filesystem::create_directories(dir + "/project");
        paths = Paths::under(dir + "/.cortex", dir + "/project");
    }

    ~TempHome() {
        setenv("HOME", old_home.c_str(), 1);
        if (old_shell.empty()) unsetenv("SHELL");
        else setenv("SHELL", old_shell.c_str(), 1);
        unsetenv("ANTHROPIC_API_KEY");
        unsetenv("OPENAI_API_KEY");
        std::filesystem::remove_all(dir);
    }

    TempHome(const TempHome&) = delete;
    TempHome& operator=(const TempHome&) = delete;

    void write(const std::string& path, const std::string& content) const {
        std::filesystem::create_directories(std::filesystem::path(path).parent_path());
        std::ofstream f(path);
        f << content;
    }

    std::string read(const std::string& path) const {
        std::ifstream f(path);
        return std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    }

    bool exists(const std::string& path) const {
        return std::filesystem::exists(path);
    }

    // A symlink to itself: present on disk but fails to open with ELOOP,
    // even for root
    void make_unreadable(const std::string& path) const {
        std::filesystem::create_directories(std::filesystem::path(path).parent_path());
        std::filesystem::create_symlink(path, path);
    }
};

// Answers questions from a script; an exhausted script behaves like EOF
class ScriptedPrompter : public Prompter {
public:
    explicit ScriptedPrompter(std::vector<std::string> answers = {})
        : answers_(answers.begin(), answers.end()) {}

    std::vector<std::string> said;
    std::vector<std::string> asked;

    void say(const std::string& text) override { said.push_back(text); }

    std::string ask(const std::string& question, const std::string& fallback) override {
        asked.push_back(question);
        if (answers_.empty()) return fallback;
        std::string a = answers_.front();
        answers_.pop_front();
        return a.empty() ? fallback : a;
    }

    bool said_contains(const std::string& needle) const {
        for (const auto& s : said) {
            if (s.find(needle) != std::string::npos) return true;
        }
        return false;
    }

private:
    std::deque<std::string> answers_;
};

class FakeVerifier : public CredentialVerifier {
public:
    bool result = true;
    int calls = 0;
    Credential last;

    bool verify(ProviderKind /*kind*/, const Credential& credential) override {
        ++calls;
        last = credential;
        return result;
    }
};

class FakeHardware : public HardwareDetector {
public:
    nlohmann::json detect() override {
        return {{"status", "detected"}, {"cpu_model", "Test CPU"}, {"ram_gb", 16},
                {"gpu", "none detected"}};
    }
};

class FakeSecretStore : public SecretStore {
public:
    bool accept = true;
    std::vector<std::pair<std::string, std::string>> stored;

    bool put(const std::string& name, const std::string& value) override {
        if (!accept) return false;
        stored.emplace_back(name, value);
        return true;
    }
};

inline std::string no_executable(const std::string&) { return ""; }
inline std::string fake_ollama(const std::string& name) {
    return name == "ollama" ? "/usr/local/bin/ollama" : "";
}

} // namespace cortex
