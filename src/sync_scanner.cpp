/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#include "lmogg/sync_scanner.h"

#include <algorithm>
#include <cstring>
#include <new>

#include "internal_logger.h"
#include "lmogg/ogg_crc.h"
#include "lmogg/page_parser.h"

namespace lmshao::lmogg {

static constexpr uint8_t kCapturePattern[4] = {'O', 'g', 'g', 'S'};
static constexpr size_t kGrowthSlack = 4096;

// Offset of the first full capture pattern, or of a trailing partial match
// that may complete with more data. Returns size if neither exists.
static size_t FindCapture(const uint8_t *data, size_t size)
{
    const uint8_t *p = data;
    const uint8_t *end = data + size;
    while (p < end) {
        p = static_cast<const uint8_t *>(std::memchr(p, kCapturePattern[0], static_cast<size_t>(end - p)));
        if (!p) {
            break;
        }
        size_t n = std::min(static_cast<size_t>(end - p), sizeof(kCapturePattern));
        if (std::memcmp(p, kCapturePattern, n) == 0) {
            return static_cast<size_t>(p - data);
        }
        ++p;
    }
    return size;
}

SyncScanner::SyncScanner(const SyncScannerOptions &opts) : opts_(opts)
{
    if (opts_.max_buffer_size < kOggMaxPageSize) {
        LMOGG_LOGW("max_buffer_size %zu below max page size, raised to %zu", opts_.max_buffer_size, kOggMaxPageSize);
        opts_.max_buffer_size = kOggMaxPageSize;
    }
}

uint8_t *SyncScanner::Reserve(size_t size)
{
    size_t tail = storage_.size() - fill_;
    if (tail < size && read_ > 0) {
        // Drop the consumed prefix before growing
        std::memmove(storage_.data(), storage_.data() + read_, fill_ - read_);
        fill_ -= read_;
        read_ = 0;
        tail = storage_.size() - fill_;
    }

    if (tail < size) {
        size_t needed = fill_ + size;
        if (needed > opts_.max_buffer_size) {
            LMOGG_LOGE("Scan buffer limit exceeded: need %zu, max %zu", needed, opts_.max_buffer_size);
            return nullptr;
        }
        size_t grown = std::max({storage_.size() * 2, needed + kGrowthSlack, opts_.initial_capacity});
        grown = std::min(grown, opts_.max_buffer_size);
        try {
            storage_.resize(grown);
        } catch (const std::bad_alloc &) {
            LMOGG_LOGF("Failed to grow scan buffer to %zu bytes", grown);
            return nullptr;
        }
    }

    reserved_ = size;
    return storage_.data() + fill_;
}

bool SyncScanner::Commit(size_t size)
{
    if (size > reserved_) {
        LMOGG_LOGE("Commit of %zu bytes exceeds reserved window of %zu", size, reserved_);
        return false;
    }
    fill_ += size;
    reserved_ = 0;
    return true;
}

SyncResult SyncScanner::NextPage(OggPage &page)
{
    while (true) {
        size_t avail = fill_ - read_;
        const uint8_t *base = storage_.data() + read_;

        size_t offset = FindCapture(base, avail);
        if (offset > 0) {
            LMOGG_LOGD("Resync: skipping %zu bytes", offset);
            Skip(offset);
            RecordError(OggError::kBadCapture);
            continue;
        }

        OggPage candidate;
        PageParseResult result = ParsePageHeader(base, avail, candidate);
        if (result == PageParseResult::kMalformedHeader) {
            stats_.malformed_headers++;
            RecordError(OggError::kMalformedHeader);
            Skip(1);
            continue;
        }

        bool complete = (result == PageParseResult::kOk) && avail >= PageSize(candidate);
        if (!complete) {
            if (!end_of_input_ || avail < sizeof(kCapturePattern)) {
                return NeedMoreData();
            }
            // Cut short by end of input: a false capture or a lost tail
            LMOGG_LOGD("Truncated page candidate at end of input (%zu bytes left)", avail);
            stats_.truncated_pages++;
            RecordError(OggError::kTruncatedPage);
            Skip(1);
            continue;
        }

        size_t total = PageSize(candidate);
        uint32_t crc = ComputePageChecksum(base, total);
        if (crc != candidate.checksum) {
            LMOGG_LOGW("CRC mismatch for serial 0x%08X seq %u: stored 0x%08X, computed 0x%08X", candidate.serial,
                       candidate.sequence_number, candidate.checksum, crc);
            stats_.crc_failures++;
            RecordError(OggError::kCrcMismatch);
            Skip(1);
            continue;
        }

        read_ += total;
        stats_.pages++;
        page = candidate;
        return SyncResult::kPageReady;
    }
}

SyncResult SyncScanner::NeedMoreData()
{
    if (!end_of_input_) {
        return SyncResult::kNeedMoreData;
    }
    if (fill_ > read_) {
        LMOGG_LOGD("Discarding %zu trailing bytes at end of input", fill_ - read_);
        Skip(fill_ - read_);
    }
    return SyncResult::kEndOfInput;
}

void SyncScanner::Skip(size_t count)
{
    read_ += count;
    stats_.bytes_skipped += count;
}

void SyncScanner::RecordError(OggError error)
{
    if (last_error_ == OggError::kOk) {
        last_error_ = error;
    }
}

void SyncScanner::Reset()
{
    read_ = 0;
    fill_ = 0;
    reserved_ = 0;
    end_of_input_ = false;
    last_error_ = OggError::kOk;
}

OggError SyncScanner::TakeLastError()
{
    OggError error = last_error_;
    last_error_ = OggError::kOk;
    return error;
}

} // namespace lmshao::lmogg
