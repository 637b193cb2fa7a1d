/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#ifndef LMSHAO_LMOGG_SYNC_SCANNER_H
#define LMSHAO_LMOGG_SYNC_SCANNER_H

#include <cstddef>
#include <cstdint>
#include <vector>

#include "lmcore/noncopyable.h"
#include "lmogg/ogg_types.h"

namespace lmshao::lmogg {

struct SyncScannerOptions {
    size_t initial_capacity = 8192;
    size_t max_buffer_size = 4 * 1024 * 1024; // Reserve() fails beyond this
};

enum class SyncResult : uint8_t {
    kPageReady,
    kNeedMoreData,
    kEndOfInput
};

struct SyncStats {
    uint64_t pages = 0;
    uint64_t bytes_skipped = 0;
    uint64_t crc_failures = 0;
    uint64_t malformed_headers = 0;
    uint64_t truncated_pages = 0;
};

/**
 * @brief Turns a raw byte stream into validated Ogg pages.
 *
 * Usage:
 * @code
 * SyncScanner scanner;
 * OggPage page;
 * while (true) {
 *     SyncResult r = scanner.NextPage(page);
 *     if (r == SyncResult::kPageReady) { ... continue; }
 *     if (r == SyncResult::kEndOfInput) break;
 *     uint8_t *buf = scanner.Reserve(4096);
 *     size_t n = Read(buf, 4096);
 *     n ? scanner.Commit(n) : scanner.SetEndOfInput();
 * }
 * @endcode
 *
 * A returned page aliases the internal buffer and stays valid until the next
 * Reserve() or Reset().
 */
class SyncScanner final : public lmcore::NonCopyable {
public:
    explicit SyncScanner(const SyncScannerOptions &opts = SyncScannerOptions{});
    ~SyncScanner() = default;

    // Writable window of at least size bytes at the fill mark, nullptr if the
    // buffer cannot grow that far.
    uint8_t *Reserve(size_t size);

    // Largest size Reserve() accepts without exceeding max_buffer_size
    size_t ReservableBytes() const { return opts_.max_buffer_size - (fill_ - read_); }

    // Mark size bytes of the last reserved window as written.
    bool Commit(size_t size);

    // The source has no more bytes; pending partial data can never complete.
    void SetEndOfInput() { end_of_input_ = true; }
    bool IsEndOfInput() const { return end_of_input_; }

    SyncResult NextPage(OggPage &page);

    void Reset();

    size_t BufferedBytes() const { return fill_ - read_; }
    size_t Capacity() const { return storage_.size(); }
    const SyncStats &Stats() const { return stats_; }
    void ResetStats() { stats_ = SyncStats{}; }

    // First resync error since the last call, kOk once read
    OggError TakeLastError();

private:
    void Skip(size_t count);
    void RecordError(OggError error);
    SyncResult NeedMoreData();

    SyncScannerOptions opts_;
    std::vector<uint8_t> storage_;
    size_t read_ = 0;     // Start of unconsumed data
    size_t fill_ = 0;     // End of committed data
    size_t reserved_ = 0; // Window handed out by the last Reserve()
    bool end_of_input_ = false;
    OggError last_error_ = OggError::kOk;
    SyncStats stats_;
};

} // namespace lmshao::lmogg

#endif // LMSHAO_LMOGG_SYNC_SCANNER_H
