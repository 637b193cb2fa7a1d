/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#ifndef LMSHAO_LMOGG_TYPES_H
#define LMSHAO_LMOGG_TYPES_H

#include <cstddef>
#include <cstdint>
#include <vector>

namespace lmshao::lmogg {

// Page header layout (RFC 3533)
constexpr size_t kOggPageHeaderSize = 27;     // Fixed part before segment table
constexpr size_t kOggMaxSegments = 255;       // Max segment table entries
constexpr size_t kOggMaxPageSize = 65307;     // 27 + 255 + 255 * 255
constexpr uint8_t kOggContinuationLacing = 255;

// Header type flags
enum OggHeaderType : uint8_t {
    kOggContinuedPacket = 0x01,
    kOggBeginningOfStream = 0x02,
    kOggEndOfStream = 0x04,
};

// Conditions reported by the scanner, the stream demuxers and the decoder.
// Codes below 100 are recoverable; 100 and above abort the decode.
enum class OggError : int {
    kOk = 0,
    kBadCapture = 1,           // Bytes skipped while looking for "OggS"
    kMalformedHeader = 2,      // Stream structure version != 0
    kCrcMismatch = 3,          // Page checksum does not match
    kTruncatedPage = 4,        // Page cut short by end of input
    kSequenceGap = 5,          // Page sequence number skipped
    kPageAfterEos = 6,         // Page for a stream that already ended
    kMissingContinuation = 7,  // Packet fragment lost across pages
    kSerialMismatch = 8,       // Page routed to the wrong stream
    kIncompletePacket = 9,     // Fragment pending at end of input
    kBufferAllocFailed = 100,  // Fatal: scan buffer could not grow
    kSourceOpenFailed = 101,   // Fatal: input could not be opened
};

const char *OggErrorString(OggError error);

/**
 * @brief Non-owning view of one validated Ogg page.
 *
 * header, segment_table and payload point into the buffer the page was
 * parsed from. Copy anything that must outlive the next scanner advance.
 */
struct OggPage {
    const uint8_t *header = nullptr;
    size_t header_size = 0;  // 27 + segment_count

    uint8_t version = 0;
    uint8_t header_type = 0;
    int64_t granule_position = -1;
    uint32_t serial = 0;
    uint32_t sequence_number = 0;
    uint32_t checksum = 0;

    const uint8_t *segment_table = nullptr;
    size_t segment_count = 0;

    const uint8_t *payload = nullptr;
    size_t payload_size = 0;

    bool IsContinued() const { return (header_type & kOggContinuedPacket) != 0; }
    bool IsBos() const { return (header_type & kOggBeginningOfStream) != 0; }
    bool IsEos() const { return (header_type & kOggEndOfStream) != 0; }
    size_t TotalSize() const { return header_size + payload_size; }

    // Number of packets that complete on this page
    size_t PacketsCompleted() const
    {
        size_t count = 0;
        for (size_t i = 0; i < segment_count; ++i) {
            if (segment_table[i] < kOggContinuationLacing) {
                ++count;
            }
        }
        return count;
    }
};

// One reassembled packet of a logical stream.
struct OggPacket {
    uint32_t serial = 0;
    std::vector<uint8_t> data;
    bool bos = false;               // First packet of the stream
    bool eos = false;               // Last packet of the stream
    int64_t granule_position = -1;  // Set on the last packet completed on a page
    uint64_t packet_no = 0;         // Index within the stream
};

} // namespace lmshao::lmogg

#endif // LMSHAO_LMOGG_TYPES_H
