#include <gtest/gtest.h>
#include <respx/net/connection.hpp>
#include "fake_server.hpp"

using namespace respx;
using respx::test::FakeServer;
using respx::test::Peer;

namespace {

    const std::string kHelloReply = "%2\r\n+server\r\n+redis\r\n+proto\r\n:3\r\n";

    Address local(uint16_t port) {
        Address a;
        a.host = "127.0.0.1";
        a.port = port;
        return a;
    }

    // Answers the greeting with a RESP3 map.
    void accept_hello(Peer& p) {
        EXPECT_EQ(p.read_line(), "HELLO 3 SETNAME respx-cli");
        p.write(kHelloReply);
    }

    void expect_request(Peer& p, const std::string& wire) {
        EXPECT_EQ(p.read_exact(wire.size()), wire);
    }

} // namespace

TEST(HelloTest, NoAuthGreeting) {
    EXPECT_EQ(Hello::no_auth().encode(), "HELLO 3 SETNAME respx-cli\r\n");
    EXPECT_EQ(Hello::no_auth("tool", 2).encode(), "HELLO 2 SETNAME tool\r\n");
}

TEST(HelloTest, PasswordGreeting) {
    EXPECT_EQ(Hello::with_password("alice", "s3cret").encode(),
        "HELLO 3 AUTH alice s3cret SETNAME respx-cli\r\n");
    // no user given: the default ACL user
    EXPECT_EQ(Hello::with_password("", "pw").encode(), "HELLO 3 AUTH default pw SETNAME respx-cli\r\n");
}

TEST(HelloTest, RejectsUnknownProtocol) {
    EXPECT_THROW(Hello::no_auth("x", 4), std::invalid_argument);
}

TEST(HelloTest, RejectsFieldsThatWouldSplitTheGreeting) {
    EXPECT_THROW(Hello::no_auth(""), std::invalid_argument);
    EXPECT_THROW(Hello::no_auth("my client"), std::invalid_argument);
    EXPECT_THROW(Hello::with_password("alice", "two words"), std::invalid_argument);
    EXPECT_THROW(Hello::with_password("alice", ""), std::invalid_argument);
    EXPECT_THROW(Hello::with_password("al ice", "pw"), std::invalid_argument);
    EXPECT_THROW(Hello::with_password("alice", "pw\r\nFLUSHALL"), std::invalid_argument);
    EXPECT_TRUE(Hello::is_token("p@ss:w0rd!"));
}

TEST(ConnectionTest, HandshakeThenCommand) {
    FakeServer server([](Peer& p) {
        accept_hello(p);
        expect_request(p, "*3\r\n$3\r\nset\r\n$5\r\nhello\r\n$5\r\nworld\r\n");
        p.write("+OK\r\n");
        expect_request(p, "*2\r\n$3\r\nget\r\n$5\r\nhello\r\n");
        p.write("$5\r\nworld\r\n");
        });

    Connection conn;
    EXPECT_EQ(conn.state(), Connection::State::Unconnected);
    RespValue greeting = conn.connect(local(server.port()), Hello::no_auth());
    ASSERT_EQ(greeting.map_size(), 2u);
    EXPECT_EQ(greeting.value(0), RespValue::simple_string("redis"));
    EXPECT_TRUE(conn.is_connected());

    EXPECT_EQ(conn.send("set hello world"), RespValue::simple_string("OK"));
    EXPECT_EQ(conn.send("get hello"), RespValue::bulk_string("world"));

    conn.close();
    EXPECT_EQ(conn.state(), Connection::State::Closed);
    EXPECT_EQ(server.join(), "");
}

TEST(ConnectionTest, AuthGreetingIsSentLiterally) {
    FakeServer server([](Peer& p) {
        EXPECT_EQ(p.read_line(), "HELLO 2 AUTH alice s3cret SETNAME tester");
        p.write("*2\r\n$6\r\nserver\r\n$5\r\nredis\r\n");
        });

    Connection conn;
    RespValue greeting = conn.connect(local(server.port()), Hello::with_password("alice", "s3cret", "tester", 2));
    EXPECT_TRUE(greeting.is(RespType::Array));
    EXPECT_TRUE(conn.is_connected());
    EXPECT_EQ(server.join(), "");
}

TEST(ConnectionTest, HandshakeRejected) {
    FakeServer server([](Peer& p) {
        p.read_line();
        p.write("-WRONGPASS invalid username-password pair\r\n");
        });

    Connection conn;
    try {
        conn.connect(local(server.port()), Hello::with_password("default", "nope"));
        FAIL() << "handshake should have been rejected";
    }
    catch (const HandshakeRejected& e) {
        EXPECT_EQ(e.server_text(), "WRONGPASS invalid username-password pair");
    }
    EXPECT_EQ(conn.state(), Connection::State::Closed);
    EXPECT_THROW(conn.send("PING"), std::logic_error);
    server.join();
}

TEST(ConnectionTest, ReplyAssembledAcrossReads) {
    FakeServer server([](Peer& p) {
        accept_hello(p);
        p.read_exact(14);   // *1 $4 PING
        p.write("$5\r\nhe");
        p.pause(50);
        p.write("llo\r\n");
        });

    Connection conn;
    conn.connect(local(server.port()), Hello::no_auth());
    EXPECT_EQ(conn.send("PING"), RespValue::bulk_string("hello"));
    EXPECT_EQ(server.join(), "");
}

TEST(ConnectionTest, SmallBufferAssemblesAcrossThreeReads) {
    const std::string payload(40, 'p');
    FakeServer server([&](Peer& p) {
        accept_hello(p);
        p.read_exact(14);
        p.write("*2\r\n$40\r\n" + payload.substr(0, 10));
        p.pause(30);
        p.write(payload.substr(10) + "\r\n");
        p.pause(30);
        p.write(":7\r\n");
        });

    ConnectionOptions opts;
    opts.buffer_capacity = 64;
    Connection conn(opts);
    conn.connect(local(server.port()), Hello::no_auth());
    RespValue v = conn.send("PING");
    ASSERT_TRUE(v.is(RespType::Array));
    ASSERT_EQ(v.elements().size(), 2u);
    EXPECT_EQ(v.elements()[0].str(), payload);
    EXPECT_EQ(v.elements()[1].integer(), 7);
    EXPECT_EQ(server.join(), "");
}

TEST(ConnectionTest, ErrorReplyIsAValueNotAFailure) {
    FakeServer server([](Peer& p) {
        accept_hello(p);
        p.read_exact(14);
        p.write("-ERR unknown command 'PING'\r\n");
        p.read_exact(14);
        p.write("+PONG\r\n");
        });

    Connection conn;
    conn.connect(local(server.port()), Hello::no_auth());
    RespValue v = conn.send("PING");
    EXPECT_TRUE(v.is_error());
    EXPECT_TRUE(conn.is_connected());
    EXPECT_EQ(conn.send("PING"), RespValue::simple_string("PONG"));
    EXPECT_EQ(server.join(), "");
}

TEST(ConnectionTest, PeerClosingMidFrameIsConnectionClosed) {
    FakeServer server([](Peer& p) {
        accept_hello(p);
        p.read_exact(14);
        p.write("$10\r\nabc");
        p.close();
        });

    Connection conn;
    conn.connect(local(server.port()), Hello::no_auth());
    EXPECT_THROW(conn.send("PING"), ConnectionClosed);
    EXPECT_EQ(conn.state(), Connection::State::Closed);
    EXPECT_THROW(conn.send("PING"), std::logic_error);
    server.join();
}

TEST(ConnectionTest, MalformedReplyIsProtocolError) {
    FakeServer server([](Peer& p) {
        accept_hello(p);
        p.read_exact(14);
        p.write("?oops\r\n");
        });

    Connection conn;
    conn.connect(local(server.port()), Hello::no_auth());
    EXPECT_THROW(conn.send("PING"), ProtocolError);
    EXPECT_EQ(conn.state(), Connection::State::Closed);
    server.join();
}

TEST(ConnectionTest, UnsolicitedBytesAreProtocolError) {
    FakeServer server([](Peer& p) {
        accept_hello(p);
        p.read_exact(14);
        // one reply plus a stray value in the same segment
        p.write("+PONG\r\n+EXTRA\r\n");
        });

    Connection conn;
    conn.connect(local(server.port()), Hello::no_auth());
    EXPECT_EQ(conn.send("PING"), RespValue::simple_string("PONG"));
    EXPECT_THROW(conn.send("PING"), ProtocolError);
    EXPECT_EQ(conn.state(), Connection::State::Closed);
    server.join();
}

TEST(ConnectionTest, FrameLargerThanBufferIsProtocolError) {
    FakeServer server([](Peer& p) {
        accept_hello(p);
        p.read_exact(14);
        p.write("$100\r\n" + std::string(100, 'x') + "\r\n");
        });

    ConnectionOptions opts;
    opts.buffer_capacity = 64;
    Connection conn(opts);
    conn.connect(local(server.port()), Hello::no_auth());
    EXPECT_THROW(conn.send("PING"), ProtocolError);
    EXPECT_EQ(conn.state(), Connection::State::Closed);
    server.join();
}

TEST(ConnectionTest, ReadTimeoutIsIoError) {
    FakeServer server([](Peer& p) {
        accept_hello(p);
        p.read_exact(14);
        p.pause(400);   // never answers in time
        });

    ConnectionOptions opts;
    opts.read_timeout = std::chrono::milliseconds(100);
    Connection conn(opts);
    conn.connect(local(server.port()), Hello::no_auth());
    try {
        conn.send("PING");
        FAIL() << "expected a timeout";
    }
    catch (const IoError& e) {
        EXPECT_EQ(e.code(), asio::error_code(asio::error::timed_out));
    }
    EXPECT_EQ(conn.state(), Connection::State::Closed);
    server.join();
}

TEST(ConnectionTest, EmptyCommandDoesNotTouchTheSocket) {
    FakeServer server([](Peer& p) {
        accept_hello(p);
        p.read_exact(14);
        p.write("+PONG\r\n");
        });

    Connection conn;
    conn.connect(local(server.port()), Hello::no_auth());
    EXPECT_THROW(conn.send("   "), std::invalid_argument);
    EXPECT_TRUE(conn.is_connected());
    EXPECT_EQ(conn.send("PING"), RespValue::simple_string("PONG"));
    EXPECT_EQ(server.join(), "");
}

TEST(ConnectionTest, SendBeforeConnect) {
    Connection conn;
    EXPECT_THROW(conn.send("PING"), std::logic_error);
}

TEST(ConnectionTest, ConnectTwiceIsLogicError) {
    FakeServer server([](Peer& p) { accept_hello(p); });
    Connection conn;
    conn.connect(local(server.port()), Hello::no_auth());
    EXPECT_THROW(conn.connect(local(server.port()), Hello::no_auth()), std::logic_error);
    server.join();
}

TEST(ConnectionTest, RefusedConnectIsIoError) {
    uint16_t port = 0;
    {
        // grab a free port, then release it so nothing listens there
        asio::io_context io;
        asio::ip::tcp::acceptor a(io, asio::ip::tcp::endpoint(asio::ip::address_v4::loopback(), 0));
        port = a.local_endpoint().port();
    }
    Connection conn;
    EXPECT_THROW(conn.connect(local(port), Hello::no_auth()), IoError);
    EXPECT_EQ(conn.state(), Connection::State::Closed);
}
