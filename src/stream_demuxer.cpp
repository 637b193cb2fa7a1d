/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#include "lmogg/stream_demuxer.h"

#include <utility>

#include "internal_logger.h"

namespace lmshao::lmogg {

StreamDemuxer::StreamDemuxer(uint32_t serial) : serial_(serial) {}

OggError StreamDemuxer::PageIn(const OggPage &page, std::vector<OggPacket> &packets)
{
    if (page.serial != serial_) {
        LMOGG_LOGW("Page for serial 0x%08X fed to stream 0x%08X", page.serial, serial_);
        return OggError::kSerialMismatch;
    }
    if (state_ == State::kTerminated) {
        stats_.pages_after_eos++;
        LMOGG_LOGW("Stream 0x%08X: ignoring page seq %u after end of stream", serial_, page.sequence_number);
        return OggError::kPageAfterEos;
    }

    OggError status = OggError::kOk;
    stats_.pages++;

    if (!first_page_ && page.sequence_number != expected_sequence_) {
        LMOGG_LOGW("Stream 0x%08X: page sequence gap, expected %u got %u", serial_, expected_sequence_,
                   page.sequence_number);
        stats_.sequence_gaps++;
        status = OggError::kSequenceGap;
        if (state_ == State::kAccumulating) {
            DropPending();
        }
    }
    first_page_ = false;
    expected_sequence_ = page.sequence_number + 1;

    if (page.IsBos() && packet_no_ == 0) {
        bos_pending_ = true;
    }

    size_t seg = 0;
    size_t offset = 0;
    if (page.IsContinued()) {
        if (state_ != State::kAccumulating) {
            // Head of the packet is gone, skip what is left of it
            while (seg < page.segment_count) {
                uint8_t lacing = page.segment_table[seg++];
                offset += lacing;
                if (lacing < kOggContinuationLacing) {
                    break;
                }
            }
            stats_.dropped_fragments++;
            LMOGG_LOGW("Stream 0x%08X: continued page seq %u without a packet head, skipped %zu bytes", serial_,
                       page.sequence_number, offset);
            if (status == OggError::kOk) {
                status = OggError::kMissingContinuation;
            }
        }
    } else if (state_ == State::kAccumulating) {
        LMOGG_LOGW("Stream 0x%08X: page seq %u does not continue pending %zu bytes", serial_, page.sequence_number,
                   pending_.size());
        DropPending();
        if (status == OggError::kOk) {
            status = OggError::kMissingContinuation;
        }
    }

    size_t first_new = packets.size();
    for (; seg < page.segment_count; ++seg) {
        uint8_t lacing = page.segment_table[seg];
        pending_.insert(pending_.end(), page.payload + offset, page.payload + offset + lacing);
        offset += lacing;
        if (lacing == kOggContinuationLacing) {
            state_ = State::kAccumulating;
            continue;
        }

        OggPacket packet;
        packet.serial = serial_;
        packet.data = std::move(pending_);
        packet.bos = bos_pending_;
        packet.packet_no = packet_no_++;
        packets.push_back(std::move(packet));
        pending_.clear();
        bos_pending_ = false;
        state_ = State::kIdle;
        stats_.packets++;
    }

    if (packets.size() > first_new) {
        packets.back().granule_position = page.granule_position;
    }

    if (page.IsEos()) {
        if (state_ == State::kAccumulating) {
            LMOGG_LOGW("Stream 0x%08X: end-of-stream page seq %u ends inside a packet", serial_, page.sequence_number);
        } else {
            if (packets.size() > first_new) {
                packets.back().eos = true;
            }
            state_ = State::kTerminated;
            LMOGG_LOGD("Stream 0x%08X terminated after %llu packets", serial_, (unsigned long long)packet_no_);
        }
    }

    return status;
}

bool StreamDemuxer::Flush()
{
    if (state_ != State::kAccumulating) {
        return false;
    }
    LMOGG_LOGW("Stream 0x%08X: dropping %zu bytes of an unfinished packet", serial_, pending_.size());
    DropPending();
    return true;
}

void StreamDemuxer::DropPending()
{
    pending_.clear();
    state_ = State::kIdle;
    stats_.dropped_fragments++;
}

} // namespace lmshao::lmogg
