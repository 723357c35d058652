#include "discovery/ssh_session.hpp"
#include "discovery/shell_text.hpp"
#include <libssh/libssh.h>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace switchscan::discovery {

SshSession::SshSession(std::string host, Credentials credentials, SessionOptions options)
    : host_(std::move(host)),
      credentials_(std::move(credentials)),
      options_(options),
      session_(nullptr),
      channel_(nullptr) {}

SshSession::~SshSession() {
    close();
}

SessionFactory SshSession::factory() {
    return [](const std::string& host, const Credentials& credentials, const SessionOptions& options) {
        return std::make_unique<SshSession>(host, credentials, options);
    };
}

bool SshSession::is_open() const {
    return channel_ != nullptr && ssh_channel_is_open(channel_) != 0;
}

std::string SshSession::last_error() const {
    return session_ ? ssh_get_error(session_) : "no session";
}

void SshSession::open() {
    if (is_open()) {
        return;
    }

    session_ = ssh_new();
    if (session_ == nullptr) {
        throw TransportError("Cannot allocate SSH session for " + host_);
    }

    try {
        configure_session();
        if (ssh_connect(session_) != SSH_OK) {
            throw TransportError("Cannot connect to " + host_ + ":" + std::to_string(options_.port) +
                                 ": " + last_error());
        }
        verify_host_key();
        authenticate();
        open_shell();

        // Pre-login banner is sent by the server; the MOTD arrives on the shell
        char* issue = ssh_get_issue_banner(session_);
        if (issue != nullptr) {
            banner_ = issue;
            ssh_string_free_char(issue);
        }

        std::string text = read_until_prompt();
        banner_ += shell::drop_last_line(text);
        prompt_ = shell::rtrim(shell::last_line(text));
        spdlog::debug("Logged into {} over SSH as {} (prompt '{}')", host_, credentials_.username, prompt_);
    } catch (const std::exception&) {
        close();
        throw;
    }
}

void SshSession::configure_session() {
    unsigned int port = options_.port;
    long timeout_s = std::max<long>(1, static_cast<long>((options_.timeout.count() + 999) / 1000));

    if (ssh_options_set(session_, SSH_OPTIONS_HOST, host_.c_str()) < 0 ||
        ssh_options_set(session_, SSH_OPTIONS_PORT, &port) < 0 ||
        ssh_options_set(session_, SSH_OPTIONS_USER, credentials_.username.c_str()) < 0 ||
        ssh_options_set(session_, SSH_OPTIONS_TIMEOUT, &timeout_s) < 0) {
        throw TransportError("Invalid SSH options for " + host_ + ": " + last_error());
    }
}

void SshSession::verify_host_key() {
    // Switches are reached by address and rarely listed in known_hosts; only a changed key is refused
    switch (ssh_session_is_known_server(session_)) {
        case SSH_KNOWN_HOSTS_OK:
            return;
        case SSH_KNOWN_HOSTS_CHANGED:
        case SSH_KNOWN_HOSTS_OTHER:
            throw TransportError("Host key of " + host_ + " does not match known_hosts");
        case SSH_KNOWN_HOSTS_ERROR:
            throw TransportError("Cannot check host key of " + host_ + ": " + last_error());
        default:
            spdlog::debug("Accepting unknown host key of {}", host_);
            return;
    }
}

void SshSession::authenticate() {
    int rc = ssh_userauth_password(session_, nullptr, credentials_.password.c_str());
    if (rc == SSH_AUTH_SUCCESS) {
        return;
    }
    if (rc == SSH_AUTH_ERROR) {
        throw TransportError("Authentication with " + host_ + " failed: " + last_error());
    }

    // Many switch firmwares only offer keyboard-interactive
    rc = ssh_userauth_kbdint(session_, nullptr, nullptr);
    while (rc == SSH_AUTH_INFO) {
        int prompts = ssh_userauth_kbdint_getnprompts(session_);
        for (int i = 0; i < prompts; ++i) {
            if (ssh_userauth_kbdint_setanswer(session_, static_cast<unsigned int>(i),
                                              credentials_.password.c_str()) < 0) {
                throw TransportError("Keyboard-interactive login to " + host_ + " failed: " + last_error());
            }
        }
        rc = ssh_userauth_kbdint(session_, nullptr, nullptr);
    }

    if (rc == SSH_AUTH_SUCCESS) {
        return;
    }
    if (rc == SSH_AUTH_ERROR) {
        throw TransportError("Authentication with " + host_ + " failed: " + last_error());
    }
    throw AuthenticationError("Login as " + credentials_.username + " rejected by " + host_);
}

void SshSession::open_shell() {
    channel_ = ssh_channel_new(session_);
    if (channel_ == nullptr) {
        throw TransportError("Cannot create SSH channel to " + host_ + ": " + last_error());
    }
    if (ssh_channel_open_session(channel_) != SSH_OK) {
        throw TransportError("Cannot open SSH channel to " + host_ + ": " + last_error());
    }
    if (ssh_channel_request_pty_size(channel_, "vt100", 200, 48) != SSH_OK) {
        throw TransportError("PTY request refused by " + host_ + ": " + last_error());
    }
    if (ssh_channel_request_shell(channel_) != SSH_OK) {
        throw TransportError("Shell request refused by " + host_ + ": " + last_error());
    }
}

std::string SshSession::execute(const std::string& command) {
    if (!is_open()) {
        throw TransportError("Session to " + host_ + " is not open");
    }

    send_raw(command + "\n");
    return shell::clean_output(read_until_prompt(), command);
}

void SshSession::close() {
    if (channel_ != nullptr) {
        if (ssh_channel_is_open(channel_)) {
            ssh_channel_close(channel_);
        }
        ssh_channel_free(channel_);
        channel_ = nullptr;
    }
    if (session_ != nullptr) {
        if (ssh_is_connected(session_)) {
            ssh_disconnect(session_);
        }
        ssh_free(session_);
        session_ = nullptr;
    }
}

void SshSession::send_raw(const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        int n = ssh_channel_write(channel_, data.data() + sent, static_cast<uint32_t>(data.size() - sent));
        if (n == SSH_ERROR) {
            throw TransportError("Send to " + host_ + " failed: " + last_error());
        }
        sent += static_cast<size_t>(n);
    }
}

void SshSession::receive(std::string& text, std::chrono::steady_clock::time_point deadline) {
    char buffer[4096];
    while (true) {
        int wait = shell::remaining_ms(deadline);
        if (wait == 0) {
            throw TransportError("Timed out waiting for " + host_);
        }

        int n = ssh_channel_read_timeout(channel_, buffer, sizeof(buffer), 0, wait);
        if (n == SSH_ERROR) {
            throw TransportError("Receive from " + host_ + " failed: " + last_error());
        }
        if (n > 0) {
            text.append(buffer, static_cast<size_t>(n));
            return;
        }
        if (ssh_channel_is_eof(channel_)) {
            throw TransportError("Connection closed by " + host_);
        }
    }
}

std::string SshSession::read_until_prompt() {
    std::string text;
    auto deadline = std::chrono::steady_clock::now() + options_.timeout;
    while (true) {
        receive(text, deadline);

        std::string tail = shell::rtrim(shell::last_line(text));
        bool at_prompt = prompt_.empty() ? shell::is_shell_prompt(tail) : tail == prompt_;
        if (at_prompt) {
            return text;
        }

        if (shell::is_pager(tail)) {
            text = shell::drop_last_line(text);
            send_raw(" ");
            deadline = std::chrono::steady_clock::now() + options_.timeout;
        }
    }
}

} // namespace switchscan::discovery
