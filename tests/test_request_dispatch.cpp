#include <doctest/doctest.h>
#include "meshgate/request_dispatch.hpp"

#include <chrono>

#include "fake_gateway.hpp"

using namespace meshgate;
using namespace meshgate::testing;
using nlohmann::json;

namespace {

struct World {
    std::shared_ptr<FakeGateway> gw = std::make_shared<FakeGateway>();
    FakeConnector     connector{gw};
    TelemetryStore    telemetry;
    MessageStore      messages;
    NodeRegistry      nodes;
    EventDispatcher   dispatcher{telemetry, messages, nodes};
    ConnectionManager manager{connector, dispatcher, ConnectionManager::Options{"fake://gw", 5, 5}};
    QueryFacade       facade{telemetry, messages, nodes, manager};
    RequestHandler    handler{facade};

    json ask(const std::string& line) {
        const std::string reply = handler.handle_line(line);
        REQUIRE_FALSE(reply.empty());
        const json j = json::parse(reply, nullptr, false);
        REQUIRE_FALSE(j.is_discarded());
        return j;
    }
};

} // namespace

TEST_CASE("parse_request: --message swallows the rest of the line") {
    Request r;
    REQUIRE(parse_request("send_message --node_id !0000000a --message hello -- world  \r\n", r));
    CHECK(r.op == "send_message");
    CHECK(r.params["node_id"] == "!0000000a");
    CHECK(r.params["message"] == "hello -- world  ");
    CHECK(r.params.size() == 2);
}

TEST_CASE("parse_request: a target written after the text is still the target") {
    Request r;
    REQUIRE(parse_request("send_message --message hi --node_id !0000000a\r\n", r));
    CHECK(r.params["message"] == "hi");
    CHECK(r.params["node_id"] == "!0000000a");

    REQUIRE(parse_request("send --message see you -- later --to 42", r));
    CHECK(r.params["message"] == "see you -- later");
    CHECK(r.params["to"] == "42");

    // Only one trailing word counts as the id; anything else stays text.
    REQUIRE(parse_request("send_message --message use --node_id to pick a node", r));
    CHECK(r.params["message"] == "use --node_id to pick a node");
    CHECK(r.params.count("node_id") == 0);
}

TEST_CASE("parse_request: keys, empty values and stray words") {
    Request r;
    REQUIRE(parse_request("  delete_message stray --flag --message_id 0a1b2c3d4e", r));
    CHECK(r.op == "delete_message");
    CHECK(r.params["flag"].empty());
    CHECK(r.params["message_id"] == "0a1b2c3d4e");
    CHECK(r.params.count("stray") == 0);

    REQUIRE(parse_request("status\r\n", r));
    CHECK(r.op == "status");
    CHECK(r.params.empty());

    CHECK_FALSE(parse_request("", r));
    CHECK_FALSE(parse_request(" \t\r\n", r));
}

TEST_CASE("name_to_kind: spellings and aliases") {
    RequestKind k;
    REQUIRE(name_to_kind("Get-Last-Messages", k));
    CHECK(k == RequestKind::GET_LAST_MESSAGES);
    REQUIRE(name_to_kind("messages", k));
    CHECK(k == RequestKind::GET_LAST_MESSAGES);
    REQUIRE(name_to_kind("send", k));
    CHECK(k == RequestKind::SEND_MESSAGE);
    REQUIRE(name_to_kind("delete", k));
    CHECK(k == RequestKind::DELETE_MESSAGE);
    REQUIRE(name_to_kind("index", k));
    CHECK(k == RequestKind::HELP);
    REQUIRE(name_to_kind("GET_ENVIRONMENT_TELEMETRY", k));
    CHECK(k == RequestKind::GET_ENVIRONMENT_TELEMETRY);
    CHECK_FALSE(name_to_kind("frobnicate", k));
    CHECK_FALSE(name_to_kind("", k));
}

TEST_CASE("blank lines get no reply") {
    World w;
    CHECK(w.handler.handle_line("   \n").empty());
}

TEST_CASE("unknown operation is 404") {
    World w;
    const json j = w.ask("frobnicate --x 1");
    CHECK(j["code"] == 404);
    CHECK(j["body"]["error"] == "Unknown request: frobnicate");
}

TEST_CASE("send_message codes") {
    World w;

    json j = w.ask("send_message --node_id !00000001");
    CHECK(j["code"] == 404);
    CHECK(j["body"]["error"] == "Missing parameters: message");

    j = w.ask("send_message --message hi");
    CHECK(j["code"] == 200);
    CHECK(j["body"]["status"] == "error");
    CHECK(j["body"]["message"] == "Mesh interface not initialized");

    w.manager.start();
    REQUIRE(w.manager.wait_connected(std::chrono::milliseconds(3000)));

    j = w.ask("send_message --node_id bogus --message hi");
    CHECK(j["code"] == 400);
    CHECK(j["body"]["error"] == "Invalid node ID");

    j = w.ask("send --to !0000002a --message hi there");
    CHECK(j["code"] == 200);
    CHECK(j["body"]["status"] == "success");
    CHECK(j["body"]["message"] == "Message sent successfully");

    j = w.ask("send_message --message direct one --node_id !0000000a");
    CHECK(j["code"] == 200);
    CHECK(j["body"]["status"] == "success");

    std::lock_guard<std::mutex> l(w.gw->m);
    REQUIRE(w.gw->sent.size() == 2);
    CHECK(w.gw->sent[0].first == "hi there");
    CHECK(w.gw->sent[0].second == "!0000002a");
    CHECK(w.gw->sent[1].first == "direct one");
    CHECK(w.gw->sent[1].second == "!0000000a");
}

TEST_CASE("help documents a send_message order that reaches the named node") {
    World w;
    const json help = w.ask("help");
    const std::string usage = help["body"]["operations"]["send_message"].get<std::string>();
    CHECK(usage.find("--node_id") < usage.find("--message"));

    w.manager.start();
    REQUIRE(w.manager.wait_connected(std::chrono::milliseconds(3000)));

    const json j = w.ask("send_message --node_id !0000000a --message hello node");
    CHECK(j["code"] == 200);
    std::lock_guard<std::mutex> l(w.gw->m);
    REQUIRE(w.gw->sent.size() == 1);
    CHECK(w.gw->sent[0].first == "hello node");
    CHECK(w.gw->sent[0].second == "!0000000a");
}

TEST_CASE("delete_message codes") {
    World w;
    w.dispatcher.on_packet(text_packet(1, "hello"));
    w.dispatcher.on_packet(text_packet(2, "world"));

    json j = w.ask("delete_message");
    CHECK(j["code"] == 404);
    CHECK(j["body"]["error"] == "Missing parameters: message_id");

    j = w.ask("delete_message --message_id nope");
    CHECK(j["code"] == 400);
    CHECK(j["body"]["error"] == "Invalid message ID");

    const std::string id = w.messages.snapshot()[0].id.c_str();
    j = w.ask("delete --id " + id);
    CHECK(j["code"] == 200);
    CHECK(j["body"]["status"] == "success");

    j = w.ask("delete_message --message_id " + id);
    CHECK(j["code"] == 400);

    j = w.ask("get_last_messages");
    CHECK(j["code"] == 200);
    REQUIRE(j["body"].size() == 1);
    CHECK(j["body"].begin().value()["message"] == "world");
    CHECK(j["body"].begin().value()["node_id"] == 2);
}

TEST_CASE("read operations answer 200 with their documents") {
    World w;
    PacketEvent e = text_packet(0x0a, "x");
    e.from_id = std::string("!0000000a");
    w.dispatcher.on_packet(e);

    json j = w.ask("nodes");
    CHECK(j["code"] == 200);
    CHECK(j["body"]["10"]["long_id"] == "!0000000a");

    j = w.ask("get_device_telemetry");
    CHECK(j["code"] == 200);
    CHECK(j["body"].empty());

    j = w.ask("get_environment_telemetry");
    CHECK(j["body"].is_object());

    j = w.ask("status");
    CHECK(j["code"] == 200);
    CHECK(j["body"]["connected"] == false);
    CHECK(j["body"]["total_connection_attempts"] == 0);

    j = w.ask("help");
    CHECK(j["code"] == 200);
    CHECK(j["body"]["operations"].contains("send_message"));
    CHECK(j["body"]["operations"].size() == 8);
}
