#pragma once
// In-memory RadioLink / Connector for exercising ConnectionManager and
// QueryFacade without sockets. All knobs live in FakeGateway, shared by the
// connector and every link it hands out.

#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "meshgate/radio_link.hpp"

namespace meshgate {
namespace testing {

struct FakeGateway {
    std::mutex m;
    int refuse = 0;                          // connect() calls left to refuse
    int connects = 0;                        // connect() calls seen
    int closes = 0;                          // link close() calls seen
    NodeNum node = 0x1234;
    std::deque<PacketEvent> inbox;           // handed out by poll_event()
    bool drop = false;                       // next poll reports the link dead
    bool flap = false;                       // every poll reports the link dead
    TxResult tx_result = TxResult::Ok;
    std::vector<std::pair<std::string, std::string>> sent;   // (text, target)
    std::function<void()> on_connect;        // runs at the start of connect(), unlocked

    int connect_count() { std::lock_guard<std::mutex> l(m); return connects; }
    size_t sent_count() { std::lock_guard<std::mutex> l(m); return sent.size(); }
    void push(const PacketEvent& e) { std::lock_guard<std::mutex> l(m); inbox.push_back(e); }
    void kill_link() { std::lock_guard<std::mutex> l(m); drop = true; }
};

class FakeLink : public RadioLink {
public:
    explicit FakeLink(std::shared_ptr<FakeGateway> gw) : gw_(std::move(gw)) {}

    NodeNum local_node_id() const override { return node_; }

    RxResult poll_event(PacketEvent& out, int timeout_ms, std::string& detail) override {
        {
            std::lock_guard<std::mutex> l(gw_->m);
            if (closed_) { detail = "closed"; return RxResult::Error; }
            if (gw_->drop) { gw_->drop = false; detail = "fake_drop"; return RxResult::Error; }
            if (gw_->flap) { detail = "fake_flap"; return RxResult::Error; }
            if (!gw_->inbox.empty()) {
                out = gw_->inbox.front();
                gw_->inbox.pop_front();
                return RxResult::Ok;
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(timeout_ms < 5 ? timeout_ms : 5));
        return RxResult::None;
    }

    TxResult send_text(const std::string& text, const std::string& target, std::string& detail) override {
        std::lock_guard<std::mutex> l(gw_->m);
        if (target.rfind("bogus", 0) == 0) { detail = "invalid destination: " + target; return TxResult::InvalidNode; }
        if (gw_->tx_result != TxResult::Ok) { detail = "fake_tx_failure"; return gw_->tx_result; }
        gw_->sent.emplace_back(text, target);
        return TxResult::Ok;
    }

    void close() override {
        std::lock_guard<std::mutex> l(gw_->m);
        if (!closed_) { closed_ = true; ++gw_->closes; }
    }

    const char* name() const override { return "fake"; }

    NodeNum node_{0};

private:
    std::shared_ptr<FakeGateway> gw_;
    bool closed_{false};
};

class FakeConnector : public Connector {
public:
    explicit FakeConnector(std::shared_ptr<FakeGateway> gw) : gw_(std::move(gw)) {}

    std::unique_ptr<RadioLink> connect(const std::string& address, std::string& error) override {
        std::function<void()> hook;
        {
            std::lock_guard<std::mutex> l(gw_->m);
            hook = gw_->on_connect;
        }
        if (hook) hook();

        std::lock_guard<std::mutex> l(gw_->m);
        ++gw_->connects;
        if (gw_->refuse > 0) {
            --gw_->refuse;
            error = "refused by " + address;
            return nullptr;
        }
        auto link = std::make_unique<FakeLink>(gw_);
        link->node_ = gw_->node;
        return link;
    }

private:
    std::shared_ptr<FakeGateway> gw_;
};

/// Poll @p pred until it holds or @p timeout_ms passes.
template <typename Pred>
bool eventually(Pred pred, int timeout_ms = 3000) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return pred();
}

inline PacketEvent text_packet(NodeNum from, const std::string& text) {
    PacketEvent e;
    e.from = from;
    e.to = BROADCAST_NODE;
    e.portnum = "TEXT_MESSAGE_APP";
    e.text = text;
    return e;
}

} // namespace testing
} // namespace meshgate
