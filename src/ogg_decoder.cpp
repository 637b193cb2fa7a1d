/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#include "lmogg/ogg_decoder.h"

#include <algorithm>
#include <cstdio>
#include <iterator>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "internal_logger.h"
#include "lmogg/stream_demuxer.h"
#include "lmogg/sync_scanner.h"

namespace lmshao::lmogg {

static constexpr size_t kDefaultChunkSize = 4096;

static SyncScannerOptions MakeScannerOptions(const OggDecoderOptions &opts)
{
    SyncScannerOptions scanner_opts;
    scanner_opts.max_buffer_size = opts.max_buffer_size;
    return scanner_opts;
}

class OggDecoder::Impl {
public:
    Impl(IByteSource &source, std::unique_ptr<IByteSource> owned, const OggDecoderOptions &opts)
        : owned_source_(std::move(owned)), source_(source), opts_(opts), scanner_(MakeScannerOptions(opts))
    {
        if (opts_.chunk_size == 0) {
            opts_.chunk_size = kDefaultChunkSize;
        }
    }

    void SetListener(IOggDemuxListener *listener) { listener_ = listener; }

    PullResult PullPage(OggPage &page)
    {
        if (has_next_) {
            page = next_page_;
            has_next_ = false;
            return PullResult::kPage;
        }
        return FetchPage(page);
    }

    bool HasNextPage()
    {
        if (!has_next_) {
            has_next_ = FetchPage(next_page_) == PullResult::kPage;
        }
        return has_next_;
    }

    RouteResult Route(const OggPage &page)
    {
        RouteResult result;
        result.serial = page.serial;

        if (ended_serials_.count(page.serial) != 0) {
            statistics_["pages_after_eos"]++;
            result.status = OggError::kPageAfterEos;
            LMOGG_LOGW("Ignoring page seq %u for ended stream 0x%08X", page.sequence_number, page.serial);
            NotifyError(result.status, page.serial);
            return result;
        }

        auto it = streams_.find(page.serial);
        if (it == streams_.end()) {
            if (!page.IsBos()) {
                LMOGG_LOGW("Stream 0x%08X starts without a BOS page (seq %u)", page.serial, page.sequence_number);
            }
            it = streams_.emplace(page.serial, StreamDemuxer(page.serial)).first;
            statistics_["streams"]++;
            LMOGG_LOGI("New logical stream 0x%08X", page.serial);
            if (listener_) {
                listener_->OnStreamStart(page.serial);
            }
        }

        StreamDemuxer &stream = it->second;
        StreamStats before = stream.Stats();
        result.status = stream.PageIn(page, result.packets);
        const StreamStats &after = stream.Stats();
        statistics_["sequence_gaps"] += after.sequence_gaps - before.sequence_gaps;
        statistics_["dropped_fragments"] += after.dropped_fragments - before.dropped_fragments;
        statistics_["packets"] += result.packets.size();

        if (result.status != OggError::kOk) {
            NotifyError(result.status, page.serial);
        }
        if (listener_) {
            for (const auto &packet : result.packets) {
                listener_->OnPacket(packet);
            }
        }

        if (stream.IsTerminated()) {
            streams_.erase(it);
            ended_serials_.insert(page.serial);
            if (listener_) {
                listener_->OnStreamEnd(page.serial);
            }
            if (opts_.stop_when_all_streams_ended && streams_.empty()) {
                LMOGG_LOGI("All logical streams ended");
                stopped_ = true;
            }
        }
        return result;
    }

    bool DecodeAll(PacketMap *out)
    {
        OggPage page;
        PullResult pulled;
        while ((pulled = PullPage(page)) == PullResult::kPage) {
            RouteResult routed = Route(page);
            if (out && routed.status != OggError::kPageAfterEos) {
                auto &packets = (*out)[routed.serial];
                packets.insert(packets.end(), std::make_move_iterator(routed.packets.begin()),
                               std::make_move_iterator(routed.packets.end()));
            }
        }
        return pulled != PullResult::kFatalError;
    }

    bool IsFatal() const { return fatal_; }
    size_t LiveStreamCount() const { return streams_.size(); }

    std::unordered_map<std::string, uint64_t> GetStatistics() const
    {
        auto stats = statistics_;
        const SyncStats &sync = scanner_.Stats();
        stats["pages"] = sync.pages;
        stats["bytes_skipped"] = sync.bytes_skipped;
        stats["crc_failures"] = sync.crc_failures;
        stats["malformed_headers"] = sync.malformed_headers;
        stats["truncated_pages"] = sync.truncated_pages;
        return stats;
    }

    void ResetStatistics()
    {
        statistics_.clear();
        scanner_.ResetStats();
    }

private:
    PullResult FetchPage(OggPage &page)
    {
        if (fatal_) {
            return PullResult::kFatalError;
        }
        if (stopped_) {
            return PullResult::kEndOfInput;
        }

        while (true) {
            SyncResult result = scanner_.NextPage(page);
            OggError resync = scanner_.TakeLastError();
            if (resync != OggError::kOk && listener_) {
                listener_->OnError(static_cast<int>(resync), OggErrorString(resync));
            }

            if (result == SyncResult::kPageReady) {
                LMOGG_LOGD("Page serial=0x%08X seq=%u segments=%zu size=%zu", page.serial, page.sequence_number,
                           page.segment_count, page.TotalSize());
                return PullResult::kPage;
            }
            if (result == SyncResult::kEndOfInput) {
                FinishStreams();
                return PullResult::kEndOfInput;
            }
            if (!FeedScanner()) {
                return PullResult::kFatalError;
            }
        }
    }

    bool FeedScanner()
    {
        // A page being assembled may already occupy most of the buffer
        size_t request = std::min(opts_.chunk_size, scanner_.ReservableBytes());
        uint8_t *buffer = request > 0 ? scanner_.Reserve(request) : nullptr;
        if (!buffer) {
            fatal_ = true;
            LMOGG_LOGF("Cannot reserve %zu bytes in scan buffer, aborting decode", request);
            if (listener_) {
                listener_->OnError(static_cast<int>(OggError::kBufferAllocFailed),
                                   OggErrorString(OggError::kBufferAllocFailed));
            }
            return false;
        }

        size_t bytes_read = source_.Read(buffer, request);
        if (!scanner_.Commit(bytes_read)) {
            fatal_ = true;
            LMOGG_LOGF("Source returned %zu bytes for a %zu byte request", bytes_read, request);
            return false;
        }
        statistics_["bytes_read"] += bytes_read;

        if (bytes_read == 0 || source_.IsEof()) {
            LMOGG_LOGD("End of input after %llu bytes", (unsigned long long)statistics_["bytes_read"]);
            scanner_.SetEndOfInput();
        }
        return true;
    }

    // Incomplete packets can never finish once the input is exhausted
    void FinishStreams()
    {
        if (finished_) {
            return;
        }
        finished_ = true;
        for (auto &kv : streams_) {
            if (kv.second.Flush()) {
                statistics_["incomplete_packets"]++;
                NotifyError(OggError::kIncompletePacket, kv.first);
            }
        }
    }

    void NotifyError(OggError error, uint32_t serial)
    {
        if (!listener_) {
            return;
        }
        char msg[96];
        std::snprintf(msg, sizeof(msg), "%s (serial 0x%08X)", OggErrorString(error), serial);
        listener_->OnError(static_cast<int>(error), msg);
    }

    std::unique_ptr<IByteSource> owned_source_;
    IByteSource &source_;
    OggDecoderOptions opts_;
    SyncScanner scanner_;

    std::unordered_map<uint32_t, StreamDemuxer> streams_;
    std::unordered_set<uint32_t> ended_serials_;

    OggPage next_page_;
    bool has_next_{false};
    bool fatal_{false};
    bool stopped_{false};
    bool finished_{false};

    std::unordered_map<std::string, uint64_t> statistics_;
    IOggDemuxListener *listener_{nullptr};
};

// OggDecoder public API
OggDecoder::OggDecoder(IByteSource &source, const OggDecoderOptions &opts)
    : impl_(new Impl(source, nullptr, opts))
{
}

OggDecoder::OggDecoder(std::unique_ptr<Impl> impl) : impl_(std::move(impl)) {}

OggDecoder::~OggDecoder() = default;

std::unique_ptr<OggDecoder> OggDecoder::Open(const std::string &path, const OggDecoderOptions &opts)
{
    std::unique_ptr<MappedFileSource> source = MappedFileSource::Open(path);
    if (!source) {
        LMOGG_LOGE("%s: %s", OggErrorString(OggError::kSourceOpenFailed), path.c_str());
        return nullptr;
    }
    IByteSource &ref = *source;
    std::unique_ptr<Impl> impl(new Impl(ref, std::move(source), opts));
    return std::unique_ptr<OggDecoder>(new OggDecoder(std::move(impl)));
}

void OggDecoder::SetListener(IOggDemuxListener *listener)
{
    impl_->SetListener(listener);
}

PullResult OggDecoder::PullPage(OggPage &page)
{
    return impl_->PullPage(page);
}

bool OggDecoder::HasNextPage()
{
    return impl_->HasNextPage();
}

RouteResult OggDecoder::Route(const OggPage &page)
{
    return impl_->Route(page);
}

bool OggDecoder::DecodeAll(PacketMap &out)
{
    return impl_->DecodeAll(&out);
}

bool OggDecoder::Run()
{
    return impl_->DecodeAll(nullptr);
}

bool OggDecoder::IsFatal() const
{
    return impl_->IsFatal();
}

size_t OggDecoder::LiveStreamCount() const
{
    return impl_->LiveStreamCount();
}

std::unordered_map<std::string, uint64_t> OggDecoder::GetStatistics() const
{
    return impl_->GetStatistics();
}

void OggDecoder::ResetStatistics()
{
    impl_->ResetStatistics();
}

} // namespace lmshao::lmogg
