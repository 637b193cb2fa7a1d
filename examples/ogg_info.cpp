/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#include <cstdio>
#include <cstring>
#include <map>
#include <string>

#include "lmcore/mapped_file.h"
#include "lmogg/byte_source.h"
#include "lmogg/ogg_decoder.h"

using namespace lmshao::lmogg;

struct StreamSummary {
    size_t pages = 0;
    size_t packets = 0;
    uint64_t bytes = 0;
    int64_t last_granule = -1;
    bool ended = false;
};

int main(int argc, char **argv)
{
    if (argc < 2) {
        std::fprintf(stderr, "Usage: %s <input.ogg>\n", argv[0]);
        return 1;
    }

    const std::string path = argv[1];
    auto mf = lmshao::lmcore::MappedFile::Open(path);
    if (!mf || !mf->IsValid()) {
        printf("Cannot open input file: %s\n", path.c_str());
        return 2;
    }

    MemoryByteSource source(mf->Data(), mf->Size());
    OggDecoder decoder(source);
    std::map<uint32_t, StreamSummary> streams;

    OggPage page;
    PullResult pulled;
    while ((pulled = decoder.PullPage(page)) == PullResult::kPage) {
        printf("Stream 0x%08X, page #%u, %zu packet(s)", page.serial, page.sequence_number, page.PacketsCompleted());
        if (page.IsBos())
            printf(", BoS");
        if (page.IsEos())
            printf(", EoS");
        if (page.IsContinued())
            printf(", continued");
        printf("\n");

        RouteResult routed = decoder.Route(page);
        StreamSummary &summary = streams[routed.serial];
        summary.pages++;
        for (const auto &packet : routed.packets) {
            summary.packets++;
            summary.bytes += packet.data.size();
            if (packet.granule_position >= 0)
                summary.last_granule = packet.granule_position;
            if (packet.eos)
                summary.ended = true;
        }
    }

    if (pulled == PullResult::kFatalError) {
        printf("Decode aborted for: %s\n", path.c_str());
        return 3;
    }

    printf("\n%zu logical stream(s)\n", streams.size());
    for (const auto &kv : streams) {
        printf("  0x%08X: %zu pages, %zu packets, %llu bytes, granule %lld%s\n", kv.first, kv.second.pages,
               kv.second.packets, (unsigned long long)kv.second.bytes, (long long)kv.second.last_granule,
               kv.second.ended ? "" : " (no EoS)");
    }

    auto stats = decoder.GetStatistics();
    printf("Skipped bytes: %llu, CRC failures: %llu\n", (unsigned long long)stats["bytes_skipped"],
           (unsigned long long)stats["crc_failures"]);
    return 0;
}
