#pragma once

#include <chrono>
#include <string>

namespace switchscan::discovery::shell {

// Prompt and pager recognition shared by the CLI transports.
// `tail` is the last, unterminated line received so far.
bool is_login_prompt(const std::string& tail);
bool is_password_prompt(const std::string& tail);
bool is_shell_prompt(const std::string& tail);
bool is_pager(const std::string& tail);

// "Login incorrect", "Access denied" and similar anywhere in `text`
bool is_login_rejected(const std::string& text);

std::string last_line(const std::string& text);
std::string drop_last_line(const std::string& text);
std::string rtrim(std::string text);

// Milliseconds left before `deadline`, never negative
int remaining_ms(std::chrono::steady_clock::time_point deadline);

// Drops carriage returns, ANSI escapes, backspace erasure, the echoed command and the trailing prompt
std::string clean_output(const std::string& raw, const std::string& command);

} // namespace switchscan::discovery::shell
