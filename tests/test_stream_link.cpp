#include <doctest/doctest.h>
#include "meshgate/stream_link.hpp"

#include <sys/socket.h>
#include <fcntl.h>

#include "nlohmann/json.hpp"

#include "meshgate/stream_io.hpp"

using namespace meshgate;
using nlohmann::json;

namespace {

// A connected pair: `link_fd` goes to the StreamRadioLink, `gw_fd` plays the gateway.
struct Pipe {
    int link_fd{-1};
    int gw_fd{-1};
    Pipe() {
        int sv[2];
        REQUIRE(::socketpair(AF_UNIX, SOCK_STREAM, 0, sv) == 0);
        link_fd = sv[0];
        gw_fd = sv[1];
        REQUIRE(::fcntl(link_fd, F_SETFL, O_NONBLOCK) == 0);
        REQUIRE(::fcntl(gw_fd, F_SETFL, O_NONBLOCK) == 0);
    }
    ~Pipe() { close_fd(gw_fd); }   // link_fd belongs to the link

    void gateway_sends(const std::string& doc) {
        std::vector<uint8_t> wire;
        slip::encode(reinterpret_cast<const uint8_t*>(doc.data()), doc.size(), wire);
        std::string error;
        REQUIRE(write_all(gw_fd, wire.data(), wire.size(), 1000, error));
    }

    // Next frame the link wrote, decoded as JSON (discarded on timeout).
    json gateway_receives() {
        std::vector<uint8_t> frame;
        uint8_t b = 0;
        for (int i = 0; i < 100000; ++i) {
            size_t got = 0;
            std::string error;
            if (read_some(gw_fd, &b, 1, 1000, got, error) != ReadResult::Data) break;
            if (dec.feed(b, frame)) return json::parse(frame.begin(), frame.end(), nullptr, false);
        }
        return json(json::value_t::discarded);
    }

    slip::Decoder dec;
};

} // namespace

TEST_CASE("parse_destination") {
    NodeNum n = 0;
    CHECK(parse_destination("", n));
    CHECK(n == BROADCAST_NODE);
    CHECK(parse_destination("^all", n));
    CHECK(n == BROADCAST_NODE);
    CHECK(parse_destination("!a1b2c3d4", n));
    CHECK(n == 0xa1b2c3d4u);
    CHECK(parse_destination("!F", n));
    CHECK(n == 0xfu);
    CHECK(parse_destination("1234", n));
    CHECK(n == 1234u);
    CHECK(parse_destination("4294967295", n));

    CHECK_FALSE(parse_destination("bogus", n));
    CHECK_FALSE(parse_destination("!", n));
    CHECK_FALSE(parse_destination("!123456789", n));
    CHECK_FALSE(parse_destination("!12zz", n));
    CHECK_FALSE(parse_destination("4294967296", n));
    CHECK_FALSE(parse_destination("-5", n));
    CHECK_FALSE(parse_destination("12 ", n));
}

TEST_CASE("parse_gateway_address: TCP forms") {
    GatewayAddress a;
    std::string err;

    REQUIRE(parse_gateway_address("meshtastic.local", a, err));
    CHECK(a.kind == GatewayAddress::Kind::Tcp);
    CHECK(a.host == "meshtastic.local");
    CHECK(a.port == DEFAULT_GATEWAY_PORT);

    REQUIRE(parse_gateway_address("tcp://10.0.0.5:4000", a, err));
    CHECK(a.host == "10.0.0.5");
    CHECK(a.port == 4000);

    REQUIRE(parse_gateway_address("[fe80::1]:4404", a, err));
    CHECK(a.host == "fe80::1");
    CHECK(a.port == 4404);

    REQUIRE(parse_gateway_address("fe80::1", a, err));
    CHECK(a.host == "fe80::1");
    CHECK(a.port == DEFAULT_GATEWAY_PORT);

    CHECK_FALSE(parse_gateway_address("", a, err));
    CHECK_FALSE(parse_gateway_address("host:0", a, err));
    CHECK_FALSE(parse_gateway_address("host:99999", a, err));
    CHECK_FALSE(parse_gateway_address("host:abc", a, err));
    CHECK(err.find("bad_port") == 0);
}

TEST_CASE("parse_gateway_address: serial forms") {
    GatewayAddress a;
    std::string err;

    REQUIRE(parse_gateway_address("/dev/ttyUSB0", a, err));
    CHECK(a.kind == GatewayAddress::Kind::Serial);
    CHECK(a.device == "/dev/ttyUSB0");
    CHECK(a.baud == DEFAULT_GATEWAY_BAUD);

    REQUIRE(parse_gateway_address("serial:/dev/ttyACM1@921600", a, err));
    CHECK(a.device == "/dev/ttyACM1");
    CHECK(a.baud == 921600);

    CHECK_FALSE(parse_gateway_address("serial:", a, err));
    CHECK_FALSE(parse_gateway_address("/dev/ttyUSB0@fast", a, err));
}

TEST_CASE("handshake learns the node number and keeps early packets") {
    Pipe p;
    StreamRadioLink link(p.link_fd, "test", 1000);

    // Already buffered before the handshake starts: chatter, a packet, then myInfo.
    p.gateway_sends("not json at all");
    p.gateway_sends(R"({"from":5,"fromId":"!00000005","decoded":{"portnum":"TEXT_MESSAGE_APP","text":"early"}})");
    p.gateway_sends(R"({"myInfo":{"myNodeNum":3735928559}})");

    std::string err;
    REQUIRE(link.handshake(1000, err));
    CHECK(link.local_node_id() == 3735928559u);

    const json hello = p.gateway_receives();
    REQUIRE_FALSE(hello.is_discarded());
    CHECK(hello == json{{"want_config", true}});

    PacketEvent e;
    std::string detail;
    REQUIRE(link.poll_event(e, 100, detail) == RxResult::Ok);
    CHECK(e.from == 5u);
    CHECK(e.text == std::string("early"));
    CHECK(link.poll_event(e, 10, detail) == RxResult::None);
}

TEST_CASE("handshake times out without myInfo") {
    Pipe p;
    StreamRadioLink link(p.link_fd, "test", 1000);
    std::string err;
    CHECK_FALSE(link.handshake(50, err));
    CHECK(err.find("handshake_timeout") == 0);
}

TEST_CASE("send_text writes a sendText frame; bad targets never reach the wire") {
    Pipe p;
    StreamRadioLink link(p.link_fd, "test", 1000);
    p.gateway_sends(R"({"myInfo":{"myNodeNum":1}})");
    std::string err;
    REQUIRE(link.handshake(1000, err));
    REQUIRE_FALSE(p.gateway_receives().is_discarded());   // want_config

    std::string detail;
    CHECK(link.send_text("hi", "bogus", detail) == TxResult::InvalidNode);

    REQUIRE(link.send_text("hi mesh", "!0000002a", detail) == TxResult::Ok);
    const json sent = p.gateway_receives();
    REQUIRE_FALSE(sent.is_discarded());
    CHECK(sent["sendText"]["text"] == "hi mesh");
    CHECK(sent["sendText"]["to"] == 42);
}

TEST_CASE("gateway hang-up surfaces as a link error") {
    Pipe p;
    StreamRadioLink link(p.link_fd, "test", 1000);
    p.gateway_sends(R"({"myInfo":{"myNodeNum":1}})");
    std::string err;
    REQUIRE(link.handshake(1000, err));

    close_fd(p.gw_fd);
    p.gw_fd = -1;

    PacketEvent e;
    std::string detail;
    CHECK(link.poll_event(e, 500, detail) == RxResult::Error);
    CHECK(detail == "eof");
}

TEST_CASE("a closed link refuses to send or poll") {
    Pipe p;
    StreamRadioLink link(p.link_fd, "test", 1000);
    link.close();

    std::string detail;
    CHECK(link.send_text("x", "", detail) == TxResult::Error);
    PacketEvent e;
    CHECK(link.poll_event(e, 10, detail) == RxResult::Error);
}

TEST_CASE("connector reports unreachable gateways") {
    StreamConnector::Options o;
    o.connect_timeout_ms = 200;
    StreamConnector c(o);
    std::string err;
    CHECK(c.connect("host:notaport", err) == nullptr);
    CHECK(err.find("bad_port") == 0);

    CHECK(c.connect("/dev/meshgate-does-not-exist", err) == nullptr);
    CHECK(err.find("open_failed") == 0);
}
