/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#ifndef LMSHAO_LMOGG_OGG_DECODER_H
#define LMSHAO_LMOGG_OGG_DECODER_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "lmcore/noncopyable.h"
#include "lmogg/byte_source.h"
#include "lmogg/ogg_listeners.h"
#include "lmogg/ogg_types.h"

namespace lmshao::lmogg {

struct OggDecoderOptions {
    size_t chunk_size = 4096;                 // Bytes requested from the source per read
    size_t max_buffer_size = 4 * 1024 * 1024; // Scan buffer limit
    bool stop_when_all_streams_ended = false; // Stop once every stream seen has ended
};

enum class PullResult : uint8_t {
    kPage,
    kEndOfInput,
    kFatalError
};

struct RouteResult {
    uint32_t serial = 0;
    OggError status = OggError::kOk;
    std::vector<OggPacket> packets;
};

using PacketMap = std::map<uint32_t, std::vector<OggPacket>>;

/**
 * @brief Ogg demultiplexer driving a byte source.
 *
 * Streaming use:
 * @code
 * OggDecoder decoder(source);
 * OggPage page;
 * while (decoder.PullPage(page) == PullResult::kPage) {
 *     RouteResult r = decoder.Route(page);
 *     for (auto &packet : r.packets) { ... }
 * }
 * @endcode
 *
 * Batch use: DecodeAll() fills a serial -> packets map.
 *
 * Pages returned by PullPage() alias the scan buffer and are invalidated by
 * the next PullPage()/HasNextPage(). Packets are always owned copies.
 */
class OggDecoder final : public lmcore::NonCopyable {
public:
    // Decode from an external source; the decoder never closes it.
    explicit OggDecoder(IByteSource &source, const OggDecoderOptions &opts = OggDecoderOptions{});

    // Decode a file; the decoder owns the mapping and releases it on destruction.
    static std::unique_ptr<OggDecoder> Open(const std::string &path,
                                            const OggDecoderOptions &opts = OggDecoderOptions{});

    ~OggDecoder();

    void SetListener(IOggDemuxListener *listener);

    PullResult PullPage(OggPage &page);

    // True if PullPage() would return a page. The page is kept for that call.
    bool HasNextPage();

    RouteResult Route(const OggPage &page);

    // Decode everything into out. False only on a fatal error; packets
    // reconstructed until then are kept.
    bool DecodeAll(PacketMap &out);

    // Decode everything, delivering packets to the listener only.
    bool Run();

    bool IsFatal() const;
    size_t LiveStreamCount() const;

    std::unordered_map<std::string, uint64_t> GetStatistics() const;
    void ResetStatistics();

private:
    class Impl;
    explicit OggDecoder(std::unique_ptr<Impl> impl);

    std::unique_ptr<Impl> impl_;
};

} // namespace lmshao::lmogg

#endif // LMSHAO_LMOGG_OGG_DECODER_H
