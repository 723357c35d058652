#pragma once

#include "discovery/discovery_interface.hpp"

namespace switchscan::discovery {

// Management shell over a raw TCP connection with telnet option refusal.
// Handles username/password prompts, pagers and prompt-delimited command output.
class TelnetSession : public ICliSession {
public:
    TelnetSession(std::string host, Credentials credentials, SessionOptions options = {});
    ~TelnetSession() override;

    TelnetSession(const TelnetSession&) = delete;
    TelnetSession& operator=(const TelnetSession&) = delete;

    void open() override;
    std::string execute(const std::string& command) override;
    std::string banner() const override { return banner_; }
    void close() override;
    bool is_open() const override { return sock_ >= 0; }

    const std::string& get_prompt() const { return prompt_; }

    static SessionFactory factory();

    // Consumes complete telnet command sequences from `raw`, appending the
    // refusals to send back into `replies`. An incomplete trailing sequence stays in `raw`.
    static std::string strip_negotiation(std::string& raw, std::string& replies);

private:
    enum class Match {
        LOGIN,
        PASSWORD,
        PROMPT,
        REJECTED
    };

    std::string host_;
    Credentials credentials_;
    SessionOptions options_;
    int sock_;
    std::string banner_;
    std::string prompt_;
    std::string raw_tail_;  // Partial telnet sequence carried between reads

    void connect_socket();
    void send_raw(const std::string& data);
    void send_line(const std::string& line);

    // Reads until one of the login-phase patterns appears at the end of the buffer
    Match read_login_phase(std::string& text);

    // Reads until the shell prompt, answering pagers
    std::string read_until_prompt();

    // Appends newly received, negotiation-free text. Throws on timeout or EOF.
    void receive(std::string& text, std::chrono::steady_clock::time_point deadline);
};

} // namespace switchscan::discovery
