/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#include "lmogg/page_parser.h"

#include <cstring>

#include "internal_logger.h"

namespace lmshao::lmogg {

// Header field offsets (RFC 3533)
static constexpr size_t kVersionOffset = 4;
static constexpr size_t kHeaderTypeOffset = 5;
static constexpr size_t kGranuleOffset = 6;
static constexpr size_t kSerialOffset = 14;
static constexpr size_t kSequenceOffset = 18;
static constexpr size_t kChecksumOffset = 22;
static constexpr size_t kSegmentCountOffset = 26;

static constexpr uint8_t kCapturePattern[4] = {'O', 'g', 'g', 'S'};

static inline uint32_t ReadUnsignedLE32(const uint8_t *p)
{
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) | (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

static inline uint64_t ReadUnsignedLE64(const uint8_t *p)
{
    uint64_t v = 0;
    for (int i = 7; i >= 0; --i) {
        v = (v << 8) | p[i];
    }
    return v;
}

PageParseResult ParsePageHeader(const uint8_t *data, size_t size, OggPage &page)
{
    if (size < sizeof(kCapturePattern)) {
        return PageParseResult::kNeedMoreData;
    }
    if (std::memcmp(data, kCapturePattern, sizeof(kCapturePattern)) != 0) {
        return PageParseResult::kBadCapture;
    }
    if (size < kOggPageHeaderSize) {
        return PageParseResult::kNeedMoreData;
    }

    uint8_t version = data[kVersionOffset];
    if (version != 0) {
        LMOGG_LOGD("Unsupported stream structure version %u", version);
        return PageParseResult::kMalformedHeader;
    }

    size_t segment_count = data[kSegmentCountOffset];
    size_t header_size = kOggPageHeaderSize + segment_count;
    if (size < header_size) {
        return PageParseResult::kNeedMoreData;
    }

    page.header = data;
    page.header_size = header_size;
    page.version = version;
    page.header_type = data[kHeaderTypeOffset];
    page.granule_position = static_cast<int64_t>(ReadUnsignedLE64(data + kGranuleOffset));
    page.serial = ReadUnsignedLE32(data + kSerialOffset);
    page.sequence_number = ReadUnsignedLE32(data + kSequenceOffset);
    page.checksum = ReadUnsignedLE32(data + kChecksumOffset);
    page.segment_table = data + kOggPageHeaderSize;
    page.segment_count = segment_count;

    size_t payload_size = 0;
    for (size_t i = 0; i < segment_count; ++i) {
        payload_size += page.segment_table[i];
    }
    page.payload = data + header_size;
    page.payload_size = payload_size;
    return PageParseResult::kOk;
}

size_t PageSize(const OggPage &page)
{
    return page.header_size + page.payload_size;
}

const char *OggErrorString(OggError error)
{
    switch (error) {
        case OggError::kOk:
            return "ok";
        case OggError::kBadCapture:
            return "capture pattern not found";
        case OggError::kMalformedHeader:
            return "malformed page header";
        case OggError::kCrcMismatch:
            return "page checksum mismatch";
        case OggError::kTruncatedPage:
            return "page truncated by end of input";
        case OggError::kSequenceGap:
            return "page sequence gap";
        case OggError::kPageAfterEos:
            return "page after end of stream";
        case OggError::kMissingContinuation:
            return "packet continuation lost";
        case OggError::kSerialMismatch:
            return "page serial mismatch";
        case OggError::kIncompletePacket:
            return "incomplete packet at end of input";
        case OggError::kBufferAllocFailed:
            return "scan buffer allocation failed";
        case OggError::kSourceOpenFailed:
            return "input could not be opened";
    }
    return "unknown error";
}

} // namespace lmshao::lmogg
