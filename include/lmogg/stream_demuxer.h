/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#ifndef LMSHAO_LMOGG_STREAM_DEMUXER_H
#define LMSHAO_LMOGG_STREAM_DEMUXER_H

#include <cstddef>
#include <cstdint>
#include <vector>

#include "lmogg/ogg_types.h"

namespace lmshao::lmogg {

struct StreamStats {
    uint64_t pages = 0;
    uint64_t packets = 0;
    uint64_t sequence_gaps = 0;
    uint64_t dropped_fragments = 0;
    uint64_t pages_after_eos = 0;
};

/**
 * @brief Packet reassembly for a single logical bitstream.
 *
 * Pages of one serial number go in, in stream order; complete packets come
 * out. Packets may span any number of pages. Lost or out-of-place pages only
 * ever cost the packets they touch.
 */
class StreamDemuxer {
public:
    enum class State : uint8_t {
        kIdle,         // No partial packet
        kAccumulating, // Waiting for the rest of a packet
        kTerminated    // EOS packet delivered, stream is closed
    };

    explicit StreamDemuxer(uint32_t serial);

    /**
     * @brief Feed the next page of this stream.
     * @param page Page whose serial matches this stream
     * @param packets Completed packets are appended here
     * @return First stream error seen on this page, or OggError::kOk
     */
    OggError PageIn(const OggPage &page, std::vector<OggPacket> &packets);

    // Drop a partial packet left at end of input. Returns true if one was pending.
    bool Flush();

    uint32_t Serial() const { return serial_; }
    State GetState() const { return state_; }
    bool IsTerminated() const { return state_ == State::kTerminated; }
    size_t PendingBytes() const { return pending_.size(); }
    uint32_t ExpectedSequence() const { return expected_sequence_; }
    const StreamStats &Stats() const { return stats_; }

private:
    void DropPending();

    uint32_t serial_;
    State state_ = State::kIdle;
    std::vector<uint8_t> pending_;
    uint32_t expected_sequence_ = 0;
    bool first_page_ = true;
    bool bos_pending_ = false; // Next packet out is the first of the stream
    uint64_t packet_no_ = 0;
    StreamStats stats_;
};

} // namespace lmshao::lmogg

#endif // LMSHAO_LMOGG_STREAM_DEMUXER_H
