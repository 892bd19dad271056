/**
 * @page mg-message-key meshgate Message Keys
 * @file message_key.hpp
 * @brief Short local identifiers for cached inbound text messages.
 *
 * @details
 * ## What a MessageKey is
 * Every text message that lands in the MessageStore gets a 10-character
 * lowercase hex handle, e.g. `3fa81c09be`. Clients use it to delete a message
 * once they have shown or forwarded it. It is purely local: it never goes on
 * the air and has nothing to do with the radio's own packet ids.
 *
 * ## How it is made
 * | Input          | Bytes                 | Why                                     |
 * |----------------|-----------------------|-----------------------------------------|
 * | nonce          | 8 (raw, little end.)  | two identical texts get different keys  |
 * | sender node    | decimal digits        | ties the key to who said it             |
 * | text           | UTF-8 as received     | ties the key to what was said           |
 *
 * The concatenation is hashed with SHA-256 and the first 5 digest bytes are
 * written as 10 hex digits. That leaves 40 bits, against a cache that never
 * holds more than 100 entries, so collisions are astronomically rare. The
 * store still checks and asks for a fresh nonce if one happens.
 *
 * ## Shape checks
 * is_message_key() lets the request layer refuse anything that cannot be a
 * key before a store lookup: wrong length, or characters outside `[0-9a-f]`.
 */
#ifndef MESHGATE_MESSAGE_KEY_HPP
#define MESHGATE_MESSAGE_KEY_HPP

#include "etl/string.h"
#include <stdint.h>
#include <stddef.h>
#include <string>

#include "meshgate/packet.hpp"

namespace meshgate {

/// Number of hex characters in a message key.
static constexpr size_t MESSAGE_KEY_LEN = 10;

/// Fixed-capacity key string; never allocates.
using MessageKey = etl::string<MESSAGE_KEY_LEN>;

/**
 * @brief Derive a key from a nonce, the sender and the text.
 *
 * @param nonce  Fresh random value (see MessageStore).
 * @param node   Sender node number.
 * @param text   Message body.
 * @param out    Receives the 10-digit lowercase hex key on success.
 * @return false only if the hash backend reports an error; @p out is then cleared.
 */
bool make_message_key(uint64_t nonce, NodeNum node, const std::string& text, MessageKey& out);

/// True iff @p s is exactly MESSAGE_KEY_LEN lowercase hex digits.
bool is_message_key(const std::string& s);

} // namespace meshgate

#endif // MESHGATE_MESSAGE_KEY_HPP
