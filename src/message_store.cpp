// -----------------------------------------------------------------------------
// message_store.cpp: Implementation of MessageStore
//
// API & guarantees: include/meshgate/message_store.hpp
// Usage: tests/test_message_store.cpp
// -----------------------------------------------------------------------------
#include "meshgate/message_store.hpp"

namespace meshgate {

MessageStore::MessageStore()
: rng_(std::random_device{}()) {
  nonces_ = [this]() { return rng_(); };   // only ever called with mutex_ held
}

MessageStore::MessageStore(NonceSource nonces)
: nonces_(std::move(nonces)) {
}

// insert(): generate a unique key, append, then trim the front if over capacity.
bool MessageStore::insert(NodeNum node, const std::string& text, MessageKey& out_key) {
  std::lock_guard<std::mutex> lock(mutex_);

  MessageKey key;
  bool unique = false;
  for (int attempt = 0; attempt < KEY_ATTEMPTS && !unique; ++attempt) {
    if (!make_message_key(nonces_(), node, text, key)) return false;
    unique = !contains(key);               // collision: loop draws a fresh nonce
  }
  if (!unique) return false;

  // etl::deque cannot grow past MESSAGE_CAP, so the oldest entry leaves
  // before the new one is pushed. Observable size never exceeds the cap.
  if (entries_.full()) {
    entries_.pop_front();
  }

  MessageEntry entry;
  entry.id      = key;
  entry.node_id = node;
  entry.text    = text;
  entry.arrival = next_arrival_++;
  entries_.push_back(entry);

  out_key = key;
  return true;
}

bool MessageStore::remove(const MessageKey& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto it = entries_.begin(); it != entries_.end(); ++it) {
    if (it->id == id) {
      entries_.erase(it);
      return true;
    }
  }
  return false;
}

std::vector<MessageEntry> MessageStore::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::vector<MessageEntry>(entries_.begin(), entries_.end());
}

size_t MessageStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

bool MessageStore::contains(const MessageKey& id) const {
  for (const auto& e : entries_) {
    if (e.id == id) return true;
  }
  return false;
}

} // namespace meshgate
