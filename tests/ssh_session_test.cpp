#include "discovery/session_factory.hpp"
#include "discovery/ssh_session.hpp"
#include "discovery/telnet_session.hpp"
#include "loopback_server.hpp"
#include "gtest/gtest.h"

#include <stdexcept>

using namespace switchscan::discovery;
using switchscan::discovery::testing::LoopbackServer;

TEST(SessionTransport, ParsesNamesCaseInsensitively)
{
    EXPECT_EQ(parse_transport("ssh"), Transport::SSH);
    EXPECT_EQ(parse_transport("SSH"), Transport::SSH);
    EXPECT_EQ(parse_transport("Telnet"), Transport::TELNET);
    EXPECT_THROW(parse_transport("rlogin"), std::invalid_argument);
    EXPECT_THROW(parse_transport(""), std::invalid_argument);
}

TEST(SessionTransport, DefaultPorts)
{
    EXPECT_EQ(default_port(Transport::SSH), 22);
    EXPECT_EQ(default_port(Transport::TELNET), 23);
    EXPECT_EQ(SessionOptions{}.port, 22);
    EXPECT_STREQ(to_string(Transport::SSH), "ssh");
    EXPECT_STREQ(to_string(Transport::TELNET), "telnet");
}

TEST(SessionTransport, FactoryBuildsMatchingSession)
{
    SessionOptions options;
    Credentials credentials{"admin", "private"};

    auto ssh = make_session_factory(Transport::SSH)("192.0.2.1", credentials, options);
    ASSERT_TRUE(ssh != nullptr);
    EXPECT_TRUE(dynamic_cast<SshSession*>(ssh.get()) != nullptr);
    EXPECT_FALSE(ssh->is_open());

    auto telnet = make_session_factory(Transport::TELNET)("192.0.2.1", credentials, options);
    ASSERT_TRUE(telnet != nullptr);
    EXPECT_TRUE(dynamic_cast<TelnetSession*>(telnet.get()) != nullptr);
}

TEST(SshSessionState, StartsClosed)
{
    SshSession session("192.0.2.1", Credentials{"admin", "private"});
    EXPECT_FALSE(session.is_open());
    EXPECT_THROW(session.execute("show version"), TransportError);
    session.close();
    EXPECT_FALSE(session.is_open());
}

TEST(SshSessionLoopback, ConnectionRefused)
{
    SessionOptions options;
    options.port = LoopbackServer::unused_port();
    options.timeout = std::chrono::milliseconds(1000);

    SshSession session("127.0.0.1", Credentials{"admin", "private"}, options);
    EXPECT_THROW(session.open(), TransportError);
    EXPECT_FALSE(session.is_open());
}

TEST(SshSessionLoopback, UnsupportedProtocolVersion)
{
    LoopbackServer server([](int fd) {
        LoopbackServer::send_text(fd, "SSH-1.0-LegacySwitch\r\n");
        LoopbackServer::wait_for_close(fd);
    });
    ASSERT_TRUE(server.listening());

    SessionOptions options;
    options.port = server.port();
    options.timeout = std::chrono::milliseconds(1000);

    SshSession session("127.0.0.1", Credentials{"admin", "private"}, options);
    EXPECT_THROW(session.open(), TransportError);
    EXPECT_FALSE(session.is_open());
}
