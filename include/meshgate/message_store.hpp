/**
 * @file message_store.hpp
 * @brief Bounded FIFO cache of inbound text messages.
 *
 * @details
 * ## Field Brief
 * The mesh never stops talking. The MessageStore keeps the last
 * MESSAGE_CAP (100) text messages heard, in the exact order they arrived,
 * each under a locally generated MessageKey. When message 101 arrives the
 * single oldest one falls off the front. Nothing is ever reordered.
 *
 * ```
 *   insert() ──► [ m1 | m2 | ... | m100 ] ──► evict m1 on the 101st insert
 *                  ▲                  ▲
 *               oldest             newest
 * ```
 *
 * ## Guarantees
 * - size() <= MESSAGE_CAP at every observable point.
 * - Keys are unique among the entries present when a key is issued; on a
 *   collision a fresh nonce is drawn and the key regenerated.
 * - remove() deletes exactly one entry or reports that the key is absent.
 * - Every operation takes the store mutex for one short step; snapshot()
 *   hands back a copy.
 *
 * ## Memory
 * Entries live in a fixed-capacity `etl::deque`, so the slot count never
 * grows past MESSAGE_CAP. Message text itself is a heap string.
 */
#ifndef MESHGATE_MESSAGE_STORE_HPP
#define MESHGATE_MESSAGE_STORE_HPP

#include <stdint.h>
#include <functional>
#include <mutex>
#include <random>
#include <string>
#include <vector>

#include "etl/deque.h"
#include "meshgate/message_key.hpp"
#include "meshgate/packet.hpp"

namespace meshgate {

/// One cached message.
struct MessageEntry {
  MessageKey  id;
  NodeNum     node_id{0};
  std::string text;
  uint64_t    arrival{0};   ///< monotonically increasing insertion counter
};

class MessageStore {
public:
  /// Maximum number of cached messages.
  static constexpr size_t MESSAGE_CAP = 100;

  /// How many fresh nonces insert() tries before giving up on a key.
  static constexpr int KEY_ATTEMPTS = 16;

  /// Source of per-message nonces. Must be callable under the store lock.
  using NonceSource = std::function<uint64_t()>;

  /// Store with nonces drawn from a std::mt19937_64 seeded by std::random_device.
  MessageStore();

  /// Store with an explicit nonce source (tests pin collisions with this).
  explicit MessageStore(NonceSource nonces);

  /**
   * @brief Append a message, evicting the oldest entry if the cache is full.
   *
   * @param node     Sender node number.
   * @param text     Message body.
   * @param out_key  Receives the key under which the message was stored.
   * @retval true   Stored.
   * @retval false  No unique key could be produced (hash failure); nothing stored.
   */
  bool insert(NodeNum node, const std::string& text, MessageKey& out_key);

  /// Remove the entry with key @p id. Returns false if no such entry exists.
  bool remove(const MessageKey& id);

  /// Copy of all entries, oldest first.
  std::vector<MessageEntry> snapshot() const;

  size_t size() const;
  static constexpr size_t capacity() { return MESSAGE_CAP; }

private:
  // Callers hold mutex_.
  bool contains(const MessageKey& id) const;

  mutable std::mutex                         mutex_;
  etl::deque<MessageEntry, MESSAGE_CAP>      entries_;
  uint64_t                                   next_arrival_{0};
  std::mt19937_64                            rng_;
  NonceSource                                nonces_;
};

} // namespace meshgate

#endif // MESHGATE_MESSAGE_STORE_HPP
