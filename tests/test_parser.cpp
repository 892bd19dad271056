#include <doctest/doctest.h>
#include "meshgate/parser.hpp"

#include <chrono>

using namespace meshgate;
using nlohmann::json;

TEST_CASE("decode_frame: full telemetry packet") {
    const std::string frame = R"({"from":305419896,"to":4294967295,"fromId":"!12345678",
        "decoded":{"portnum":"TELEMETRY_APP","telemetry":{"time":1700000000,
        "deviceMetrics":{"batteryLevel":101,"voltage":4.2,"channelUtilization":3.5,"airUtilTx":0.7},
        "environmentMetrics":{"temperature":19.5,"relativeHumidity":55,"barometricPressure":1013.2}}}})";

    parser::GatewayFrame f;
    REQUIRE(parser::decode_frame(frame, f));
    REQUIRE(f.kind == parser::FrameKind::Packet);
    const PacketEvent& p = f.packet;
    CHECK(p.from == 305419896u);
    CHECK(p.to == BROADCAST_NODE);
    CHECK(p.from_id == std::string("!12345678"));
    CHECK(p.portnum == "TELEMETRY_APP");
    CHECK_FALSE(p.text.has_value());

    REQUIRE(p.telemetry.has_value());
    CHECK(p.telemetry->time == uint64_t{1700000000});
    REQUIRE(p.telemetry->device.has_value());
    CHECK(p.telemetry->device->battery_level == 101u);
    CHECK(*p.telemetry->device->voltage == doctest::Approx(4.2));
    REQUIRE(p.telemetry->environment.has_value());
    CHECK(*p.telemetry->environment->relative_humidity == doctest::Approx(55.0));
}

TEST_CASE("decode_frame: text packet and missing portnum") {
    parser::GatewayFrame f;
    REQUIRE(parser::decode_frame(R"({"from":7,"decoded":{"text":"hi there"}})", f));
    REQUIRE(f.kind == parser::FrameKind::Packet);
    CHECK(f.packet.text == std::string("hi there"));
    CHECK(f.packet.portnum == "UNKNOWN");
    CHECK_FALSE(f.packet.to.has_value());
    CHECK_FALSE(f.packet.telemetry.has_value());
}

TEST_CASE("decode_frame: wrong types are treated as absent") {
    parser::GatewayFrame f;
    REQUIRE(parser::decode_frame(
        R"({"from":"seven","fromId":12,"decoded":{"text":5,"telemetry":{"time":-1,"deviceMetrics":{"voltage":"high"}}}})", f));
    REQUIRE(f.kind == parser::FrameKind::Packet);
    CHECK_FALSE(f.packet.from.has_value());
    CHECK_FALSE(f.packet.from_id.has_value());
    CHECK_FALSE(f.packet.text.has_value());
    REQUIRE(f.packet.telemetry.has_value());
    CHECK_FALSE(f.packet.telemetry->time.has_value());
    REQUIRE(f.packet.telemetry->device.has_value());
    CHECK_FALSE(f.packet.telemetry->device->voltage.has_value());
}

TEST_CASE("decode_frame: node numbers beyond 32 bits are rejected") {
    parser::GatewayFrame f;
    REQUIRE(parser::decode_frame(R"({"from":4294967296,"decoded":{}})", f));
    CHECK_FALSE(f.packet.from.has_value());
}

TEST_CASE("decode_frame: handshake, unknown objects and garbage") {
    parser::GatewayFrame f;
    REQUIRE(parser::decode_frame(R"({"myInfo":{"myNodeNum":2882343476}})", f));
    CHECK(f.kind == parser::FrameKind::MyInfo);
    CHECK(f.my_node_num == 2882343476u);

    REQUIRE(parser::decode_frame(R"({"config":{"lora":{}}})", f));
    CHECK(f.kind == parser::FrameKind::Unknown);

    REQUIRE(parser::decode_frame(R"({"myInfo":{}})", f));
    CHECK(f.kind == parser::FrameKind::Unknown);

    CHECK_FALSE(parser::decode_frame("not json", f));
    CHECK_FALSE(parser::decode_frame("[1,2,3]", f));
    CHECK_FALSE(parser::decode_frame(std::string("\xff\xfe", 2), f));
}

TEST_CASE("outgoing gateway frames") {
    CHECK(json::parse(parser::want_config_json()) == json{{"want_config", true}});

    const json send = json::parse(parser::send_text_json("hello", 0xabcd));
    CHECK(send["sendText"]["text"] == "hello");
    CHECK(send["sendText"]["to"] == 0xabcd);
}

TEST_CASE("telemetry bodies render missing metrics as null under decimal node keys") {
    DeviceTelemetryMap dev;
    DeviceTelemetrySample s;
    s.node_id = 42;
    s.time = 99;
    s.metrics.battery_level = 50;
    dev[42] = s;

    const parser::Document body = parser::device_telemetry_json(dev);
    REQUIRE(body.contains("42"));
    CHECK(body["42"]["time"] == 99);
    CHECK(body["42"]["deviceMetrics"]["batteryLevel"] == 50);
    CHECK(body["42"]["deviceMetrics"]["voltage"].is_null());
    CHECK(body["42"]["deviceMetrics"]["channelUtilization"].is_null());
    CHECK(body["42"]["deviceMetrics"]["airUtilTx"].is_null());

    EnvironmentTelemetryMap env;
    EnvironmentTelemetrySample e;
    e.node_id = 3;
    e.time = 1;
    e.metrics.temperature = -4.5;
    env[3] = e;
    const parser::Document ebody = parser::environment_telemetry_json(env);
    CHECK(ebody["3"]["environmentMetrics"]["temperature"] == -4.5);
    CHECK(ebody["3"]["environmentMetrics"]["barometricPressure"].is_null());
}

TEST_CASE("messages body keeps arrival order") {
    std::vector<MessageEntry> entries(3);
    entries[0].id = "ffffffffff"; entries[0].node_id = 1; entries[0].text = "first";
    entries[1].id = "0000000000"; entries[1].node_id = 2; entries[1].text = "second";
    entries[2].id = "8888888888"; entries[2].node_id = 1; entries[2].text = "third";

    const parser::Document body = parser::messages_json(entries);
    std::vector<std::string> keys;
    for (auto it = body.begin(); it != body.end(); ++it) keys.push_back(it.key());
    REQUIRE(keys.size() == 3);
    CHECK(keys[0] == "ffffffffff");
    CHECK(keys[1] == "0000000000");
    CHECK(keys[2] == "8888888888");
    CHECK(body["0000000000"]["node_id"] == 2);
    CHECK(body["0000000000"]["message"] == "second");
}

TEST_CASE("status body before and after a connection") {
    ConnectionState s;
    parser::Document body = parser::status_json(s);
    CHECK(body["connected"] == false);
    CHECK(body["nodeid"].is_null());
    CHECK(body["last_connection_time"].is_null());
    CHECK(body["total_connection_attempts"] == 0);

    s.is_connected = true;
    s.local_node_id = 1234;
    s.connection_attempts = 3;
    s.last_connected_at = std::chrono::system_clock::time_point(std::chrono::seconds(1700000000));
    body = parser::status_json(s);
    CHECK(body["connected"] == true);
    CHECK(body["nodeid"] == "1234");
    CHECK(body["last_connection_time"].get<double>() == doctest::Approx(1700000000.0));
    CHECK(body["total_connection_attempts"] == 3);
}

TEST_CASE("response_line survives invalid UTF-8 in message text") {
    const std::string line = parser::response_line(200, parser::outcome_json(true, std::string("bad \xc3", 5)));
    const json j = json::parse(line, nullptr, false);
    REQUIRE_FALSE(j.is_discarded());
    CHECK(j["code"] == 200);
    CHECK(j["body"]["status"] == "success");
}
