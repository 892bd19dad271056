#pragma once

/**
 * @file slip.hpp
 * @brief SLIP framing for the gateway byte stream.
 *
 * @details
 * OVERVIEW
 * --------
 * The gateway link is a plain byte stream (TCP socket or serial TTY). Every
 * JSON document on it is wrapped in one SLIP frame so both sides know exactly
 * where a document begins and ends.
 *
 *   END       (0xC0) marks frame boundaries.
 *   ESC       (0xDB) introduces an escaped code.
 *   ESC_END   (0xDC) stands in for END inside payloads.
 *   ESC_ESC   (0xDD) stands in for ESC inside payloads.
 *
 * Decoding rules:
 *   - Bytes before the first END are boot chatter and are ignored.
 *   - An END closes the current frame if it holds any bytes, and in either
 *     case opens the next one. Back-to-back frames may share one END.
 *   - ESC followed by anything other than ESC_END / ESC_ESC drops the frame
 *     and waits for the next END.
 *   - A frame longer than the decoder's limit is dropped the same way, so a
 *     peer that never sends END cannot grow the buffer without bound.
 *
 * EXAMPLE
 * -------
 * @code
 *   meshgate::slip::Decoder dec;
 *   std::vector<uint8_t> frame;
 *   for (uint8_t b : incoming_bytes) {
 *       if (dec.feed(b, frame)) handle(frame);
 *   }
 * @endcode
 */

#include <cstddef>
#include <cstdint>
#include <vector>

namespace meshgate {
namespace slip {

static constexpr uint8_t END     = 0xC0;
static constexpr uint8_t ESC     = 0xDB;
static constexpr uint8_t ESC_END = 0xDC;
static constexpr uint8_t ESC_ESC = 0xDD;

/// Largest payload the decoder will assemble.
static constexpr size_t DEFAULT_MAX_FRAME = 64 * 1024;

/**
 * @brief Append one encoded frame for @p in to @p out.
 *
 * Unlike a fresh-buffer encoder, this appends so a caller can batch several
 * frames into one write.
 */
inline void encode(const uint8_t* in, size_t n, std::vector<uint8_t>& out) {
    out.reserve(out.size() + n * 2 + 2);
    out.push_back(END);
    for (size_t i = 0; i < n; ++i) {
        const uint8_t b = in[i];
        if (b == END) {
            out.push_back(ESC);
            out.push_back(ESC_END);
        } else if (b == ESC) {
            out.push_back(ESC);
            out.push_back(ESC_ESC);
        } else {
            out.push_back(b);
        }
    }
    out.push_back(END);
}

/**
 * @brief Stateful byte-at-a-time decoder.
 */
class Decoder {
public:
    explicit Decoder(size_t max_frame = DEFAULT_MAX_FRAME) : max_frame_(max_frame) {}

    /**
     * @brief Feed one byte. Returns true when @p frame holds a complete payload.
     */
    bool feed(uint8_t b, std::vector<uint8_t>& frame) {
        if (b == END) {
            const bool complete = in_frame_ && !buf_.empty();
            if (complete) frame.swap(buf_);
            buf_.clear();
            in_frame_ = true;
            esc_ = false;
            return complete;
        }

        if (!in_frame_) return false;

        if (esc_) {
            esc_ = false;
            if      (b == ESC_END) b = END;
            else if (b == ESC_ESC) b = ESC;
            else { drop(); return false; }
        } else if (b == ESC) {
            esc_ = true;
            return false;
        }

        if (buf_.size() >= max_frame_) { drop(); return false; }
        buf_.push_back(b);
        return false;
    }

    /// Forget any partial frame and wait for the next END.
    void reset() { drop(); }

    /// Frames dropped for a bad escape or for length since construction.
    size_t dropped() const { return dropped_; }

private:
    void drop() {
        if (in_frame_ && !buf_.empty()) ++dropped_;
        buf_.clear();
        in_frame_ = false;
        esc_ = false;
    }

    std::vector<uint8_t> buf_;
    size_t max_frame_;
    size_t dropped_{0};
    bool   in_frame_{false};
    bool   esc_{false};
};

} // namespace slip
} // namespace meshgate
