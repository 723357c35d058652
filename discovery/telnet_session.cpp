#include "discovery/telnet_session.hpp"
#include "discovery/shell_text.hpp"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstring>
#include <memory>

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace switchscan::discovery {

namespace {

// RFC 854 command bytes
constexpr unsigned char IAC = 255;
constexpr unsigned char DONT = 254;
constexpr unsigned char DO = 253;
constexpr unsigned char WONT = 252;
constexpr unsigned char WILL = 251;
constexpr unsigned char SB = 250;
constexpr unsigned char SE = 240;
constexpr unsigned char OPT_ECHO = 1;
constexpr unsigned char OPT_SGA = 3;

} // namespace

TelnetSession::TelnetSession(std::string host, Credentials credentials, SessionOptions options)
    : host_(std::move(host)), credentials_(std::move(credentials)), options_(options), sock_(-1) {}

TelnetSession::~TelnetSession() {
    close();
}

SessionFactory TelnetSession::factory() {
    return [](const std::string& host, const Credentials& credentials, const SessionOptions& options) {
        return std::make_unique<TelnetSession>(host, credentials, options);
    };
}

void TelnetSession::open() {
    if (is_open()) {
        return;
    }

    connect_socket();

    try {
        std::string text;
        Match match = read_login_phase(text);
        banner_ = shell::drop_last_line(text);

        if (match == Match::LOGIN) {
            send_line(credentials_.username);
            text.clear();
            match = read_login_phase(text);
            if (match == Match::LOGIN || match == Match::REJECTED) {
                throw AuthenticationError("Username rejected by " + host_);
            }
        }

        if (match == Match::PASSWORD) {
            send_line(credentials_.password);
            text.clear();
            match = read_login_phase(text);
            if (match != Match::PROMPT) {
                throw AuthenticationError("Login rejected by " + host_);
            }
            // Message of the day arrives between the password and the first prompt
            banner_ += shell::drop_last_line(text);
        }

        if (match == Match::REJECTED) {
            throw AuthenticationError("Login rejected by " + host_);
        }

        prompt_ = shell::rtrim(shell::last_line(text));
        spdlog::debug("Logged into {} as {} (prompt '{}')", host_, credentials_.username, prompt_);
    } catch (const std::exception&) {
        close();
        throw;
    }
}

std::string TelnetSession::execute(const std::string& command) {
    if (!is_open()) {
        throw TransportError("Session to " + host_ + " is not open");
    }

    send_line(command);
    return shell::clean_output(read_until_prompt(), command);
}

void TelnetSession::close() {
    if (sock_ < 0) {
        return;
    }
    if (::close(sock_) != 0) {
        spdlog::debug("Closing session to {} reported: {}", host_, std::strerror(errno));
    }
    sock_ = -1;
    raw_tail_.clear();
}

void TelnetSession::connect_socket() {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    std::string port = std::to_string(options_.port);
    addrinfo* result = nullptr;
    int rc = ::getaddrinfo(host_.c_str(), port.c_str(), &hints, &result);
    if (rc != 0) {
        throw TransportError("Cannot resolve " + host_ + ": " + ::gai_strerror(rc));
    }
    std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> guard(result, &::freeaddrinfo);

    int timeout = static_cast<int>(options_.timeout.count());
    std::string last_error = "no usable address";

    for (addrinfo* ai = result; ai != nullptr; ai = ai->ai_next) {
        int s = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (s < 0) {
            last_error = std::strerror(errno);
            continue;
        }

        int flags = ::fcntl(s, F_GETFL, 0);
        if (flags < 0 || ::fcntl(s, F_SETFL, flags | O_NONBLOCK) < 0) {
            last_error = std::strerror(errno);
            ::close(s);
            continue;
        }

        if (::connect(s, ai->ai_addr, ai->ai_addrlen) == 0) {
            sock_ = s;
            return;
        }
        if (errno != EINPROGRESS) {
            last_error = std::strerror(errno);
            ::close(s);
            continue;
        }

        pollfd pfd{s, POLLOUT, 0};
        rc = ::poll(&pfd, 1, timeout);
        if (rc <= 0) {
            last_error = rc == 0 ? "connect timed out" : std::strerror(errno);
            ::close(s);
            continue;
        }

        int err = 0;
        socklen_t len = sizeof(err);
        if (::getsockopt(s, SOL_SOCKET, SO_ERROR, &err, &len) != 0) {
            err = errno;
        }
        if (err != 0) {
            last_error = std::strerror(err);
            ::close(s);
            continue;
        }

        sock_ = s;
        return;
    }

    throw TransportError("Cannot connect to " + host_ + ":" + port + ": " + last_error);
}

void TelnetSession::send_raw(const std::string& data) {
    auto deadline = std::chrono::steady_clock::now() + options_.timeout;
    size_t sent = 0;
    while (sent < data.size()) {
        auto n = ::send(sock_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n > 0) {
            sent += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
            throw TransportError("Send to " + host_ + " failed: " + std::strerror(errno));
        }

        pollfd pfd{sock_, POLLOUT, 0};
        int rc = ::poll(&pfd, 1, shell::remaining_ms(deadline));
        if (rc == 0) {
            throw TransportError("Timed out sending to " + host_);
        }
        if (rc < 0 && errno != EINTR) {
            throw TransportError("Send to " + host_ + " failed: " + std::strerror(errno));
        }
    }
}

void TelnetSession::send_line(const std::string& line) {
    send_raw(line + "\r\n");
}

void TelnetSession::receive(std::string& text, std::chrono::steady_clock::time_point deadline) {
    while (true) {
        int wait = shell::remaining_ms(deadline);
        if (wait == 0) {
            throw TransportError("Timed out waiting for " + host_);
        }

        pollfd pfd{sock_, POLLIN, 0};
        int rc = ::poll(&pfd, 1, wait);
        if (rc < 0) {
            if (errno == EINTR) continue;
            throw TransportError("Receive from " + host_ + " failed: " + std::strerror(errno));
        }
        if (rc == 0) {
            throw TransportError("Timed out waiting for " + host_);
        }

        char buffer[4096];
        auto n = ::recv(sock_, buffer, sizeof(buffer), 0);
        if (n == 0) {
            throw TransportError("Connection closed by " + host_);
        }
        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
            throw TransportError("Receive from " + host_ + " failed: " + std::strerror(errno));
        }

        raw_tail_.append(buffer, static_cast<size_t>(n));
        std::string replies;
        text += strip_negotiation(raw_tail_, replies);
        if (!replies.empty()) {
            send_raw(replies);
        }
        return;
    }
}

TelnetSession::Match TelnetSession::read_login_phase(std::string& text) {
    auto deadline = std::chrono::steady_clock::now() + options_.timeout;
    while (true) {
        receive(text, deadline);

        if (shell::is_login_rejected(text)) {
            return Match::REJECTED;
        }
        std::string tail = shell::last_line(text);
        if (shell::is_password_prompt(tail)) {
            return Match::PASSWORD;
        }
        if (shell::is_login_prompt(tail)) {
            return Match::LOGIN;
        }
        if (shell::is_shell_prompt(tail)) {
            return Match::PROMPT;
        }
    }
}

std::string TelnetSession::read_until_prompt() {
    std::string text;
    auto deadline = std::chrono::steady_clock::now() + options_.timeout;
    while (true) {
        receive(text, deadline);

        std::string tail = shell::rtrim(shell::last_line(text));
        bool at_prompt = prompt_.empty() ? shell::is_shell_prompt(tail)
                                         : tail == prompt_;
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

std::string TelnetSession::strip_negotiation(std::string& raw, std::string& replies) {
    std::string out;
    out.reserve(raw.size());

    size_t i = 0;
    while (i < raw.size()) {
        auto c = static_cast<unsigned char>(raw[i]);
        if (c != IAC) {
            if (c != 0) {
                out.push_back(raw[i]);
            }
            ++i;
            continue;
        }

        if (i + 1 >= raw.size()) break;
        auto cmd = static_cast<unsigned char>(raw[i + 1]);

        if (cmd == IAC) {
            out.push_back(static_cast<char>(IAC));
            i += 2;
            continue;
        }

        if (cmd == DO || cmd == DONT || cmd == WILL || cmd == WONT) {
            if (i + 2 >= raw.size()) break;
            auto option = static_cast<unsigned char>(raw[i + 2]);
            if (cmd == DO) {
                replies.push_back(static_cast<char>(IAC));
                replies.push_back(static_cast<char>(WONT));
                replies.push_back(static_cast<char>(option));
            } else if (cmd == WILL) {
                bool accept = option == OPT_ECHO || option == OPT_SGA;
                replies.push_back(static_cast<char>(IAC));
                replies.push_back(static_cast<char>(accept ? DO : DONT));
                replies.push_back(static_cast<char>(option));
            }
            i += 3;
            continue;
        }

        if (cmd == SB) {
            size_t end = i + 2;
            bool complete = false;
            while (end + 1 < raw.size()) {
                if (static_cast<unsigned char>(raw[end]) == IAC &&
                    static_cast<unsigned char>(raw[end + 1]) == SE) {
                    complete = true;
                    break;
                }
                ++end;
            }
            if (!complete) break;
            i = end + 2;
            continue;
        }

        // NOP, GA and the other two-byte commands
        i += 2;
    }

    raw.erase(0, i);
    return out;
}

} // namespace switchscan::discovery
