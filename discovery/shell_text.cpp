#include "discovery/shell_text.hpp"
#include <cctype>
#include <regex>
#include <sstream>

namespace switchscan::discovery::shell {

namespace {

const std::regex& login_prompt_regex() {
    static const std::regex re(R"((user\s*name|login|user)\s*:\s*$)", std::regex_constants::icase);
    return re;
}

const std::regex& password_prompt_regex() {
    static const std::regex re(R"(password\s*:\s*$)", std::regex_constants::icase);
    return re;
}

const std::regex& shell_prompt_regex() {
    static const std::regex re(R"(^\S.*[>#$%]\s*$)");
    return re;
}

const std::regex& rejected_regex() {
    static const std::regex re(
        R"((login incorrect|authentication failed|access denied|invalid (user|password|login)|bad password|login failed))",
        std::regex_constants::icase);
    return re;
}

const std::regex& pager_regex() {
    static const std::regex re(R"((--\s*more\s*--|press any key|q\s*=\s*quit))", std::regex_constants::icase);
    return re;
}

} // namespace

bool is_login_prompt(const std::string& tail) {
    return std::regex_search(tail, login_prompt_regex());
}

bool is_password_prompt(const std::string& tail) {
    return std::regex_search(tail, password_prompt_regex());
}

bool is_shell_prompt(const std::string& tail) {
    return std::regex_search(tail, shell_prompt_regex());
}

bool is_pager(const std::string& tail) {
    return std::regex_search(tail, pager_regex());
}

bool is_login_rejected(const std::string& text) {
    return std::regex_search(text, rejected_regex());
}

std::string last_line(const std::string& text) {
    auto pos = text.find_last_of('\n');
    return pos == std::string::npos ? text : text.substr(pos + 1);
}

std::string drop_last_line(const std::string& text) {
    auto pos = text.find_last_of('\n');
    return pos == std::string::npos ? std::string() : text.substr(0, pos + 1);
}

std::string rtrim(std::string text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.pop_back();
    }
    return text;
}

int remaining_ms(std::chrono::steady_clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

std::string clean_output(const std::string& raw, const std::string& command) {
    static const std::regex ansi_escape(R"(\x1B\[[0-9;?]*[A-Za-z])");
    std::string text = std::regex_replace(raw, ansi_escape, "");

    std::string erased;
    erased.reserve(text.size());
    for (char c : text) {
        if (c == '\b') {
            if (!erased.empty() && erased.back() != '\n') erased.pop_back();
        } else if (c != '\r') {
            erased.push_back(c);
        }
    }

    // Trailing text without a newline is the prompt
    erased = drop_last_line(erased);

    std::istringstream stream(erased);
    std::ostringstream out;
    std::string line;
    bool first = true;
    std::string trimmed_command = rtrim(command);
    while (std::getline(stream, line)) {
        if (first) {
            first = false;
            if (!trimmed_command.empty() && line.find(trimmed_command) != std::string::npos) {
                continue;
            }
        }
        out << line << '\n';
    }
    return out.str();
}

} // namespace switchscan::discovery::shell
