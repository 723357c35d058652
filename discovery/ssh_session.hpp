#pragma once

#include "discovery/discovery_interface.hpp"

struct ssh_session_struct;
struct ssh_channel_struct;

namespace switchscan::discovery {

// Interactive management shell over SSH (libssh). Password authentication,
// falling back to keyboard-interactive, then a pty shell read up to the prompt.
class SshSession : public ICliSession {
public:
    SshSession(std::string host, Credentials credentials, SessionOptions options = {});
    ~SshSession() override;

    SshSession(const SshSession&) = delete;
    SshSession& operator=(const SshSession&) = delete;

    void open() override;
    std::string execute(const std::string& command) override;
    std::string banner() const override { return banner_; }
    void close() override;
    bool is_open() const override;

    const std::string& get_prompt() const { return prompt_; }

    static SessionFactory factory();

private:
    std::string host_;
    Credentials credentials_;
    SessionOptions options_;
    ssh_session_struct* session_;
    ssh_channel_struct* channel_;
    std::string banner_;
    std::string prompt_;

    void configure_session();
    void verify_host_key();
    void authenticate();
    void open_shell();
    void send_raw(const std::string& data);

    // Appends newly received text. Throws on timeout, EOF or channel error.
    void receive(std::string& text, std::chrono::steady_clock::time_point deadline);

    // Reads until the shell prompt, answering pagers
    std::string read_until_prompt();

    std::string last_error() const;
};

} // namespace switchscan::discovery
