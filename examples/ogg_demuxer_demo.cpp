/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#include <sys/stat.h>
#include <sys/types.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <utility>

#include "lmogg/lmogg_logger.h"
#include "lmogg/ogg_decoder.h"

using namespace lmshao::lmogg;

// Streaming demux: every logical stream is written to <outdir>/stream-<serial>.bin
// as a sequence of [u32 little-endian length][packet bytes] records.

static std::set<uint32_t> ParseSerialList(const std::string &arg)
{
    std::set<uint32_t> out;
    size_t start = 0;
    while (start < arg.size()) {
        size_t comma = arg.find(',', start);
        std::string tok = (comma == std::string::npos) ? arg.substr(start) : arg.substr(start, comma - start);
        if (!tok.empty()) {
            char *end = nullptr;
            unsigned long v = std::strtoul(tok.c_str(), &end, 0);
            if (end && *end == '\0') {
                out.insert(static_cast<uint32_t>(v));
            } else {
                std::fprintf(stderr, "Ignoring bad serial: %s\n", tok.c_str());
            }
        }
        if (comma == std::string::npos)
            break;
        start = comma + 1;
    }
    return out;
}

class DemoListener : public IOggDemuxListener {
public:
    DemoListener(std::string outdir, std::set<uint32_t> filter) : outdir_(std::move(outdir)), filter_(std::move(filter))
    {
    }

    void OnStreamStart(uint32_t serial) override
    {
        if (!Selected(serial))
            return;
        char name[32];
        std::snprintf(name, sizeof(name), "/stream-%08x.bin", serial);
        std::string path = outdir_ + name;
        outputs_[serial].open(path, std::ios::binary);
        if (!outputs_[serial].is_open()) {
            std::fprintf(stderr, "Failed to open output file: %s\n", path.c_str());
        } else {
            printf("Stream 0x%08X -> %s\n", serial, path.c_str());
        }
    }

    void OnPacket(const OggPacket &packet) override
    {
        auto it = outputs_.find(packet.serial);
        if (it == outputs_.end() || !it->second.is_open())
            return;
        uint8_t len[4];
        uint32_t size = static_cast<uint32_t>(packet.data.size());
        for (int i = 0; i < 4; ++i)
            len[i] = static_cast<uint8_t>(size >> (8 * i));
        it->second.write(reinterpret_cast<const char *>(len), sizeof(len));
        it->second.write(reinterpret_cast<const char *>(packet.data.data()),
                         static_cast<std::streamsize>(packet.data.size()));
        printf("Packet stream 0x%08X #%llu size %zu granule %lld%s%s\n", packet.serial,
               (unsigned long long)packet.packet_no, packet.data.size(), (long long)packet.granule_position,
               packet.bos ? " BoS" : "", packet.eos ? " EoS" : "");
    }

    void OnStreamEnd(uint32_t serial) override
    {
        printf("End of stream 0x%08X\n", serial);
        auto it = outputs_.find(serial);
        if (it != outputs_.end())
            it->second.close();
    }

    void OnError(int code, const std::string &msg) override
    {
        std::fprintf(stderr, "Error(%d): %s\n", code, msg.c_str());
    }

private:
    bool Selected(uint32_t serial) const { return filter_.empty() || filter_.count(serial) != 0; }

    std::string outdir_;
    std::set<uint32_t> filter_;
    std::map<uint32_t, std::ofstream> outputs_;
};

int main(int argc, char **argv)
{
    if (argc < 2) {
        std::fprintf(stderr, "Usage: %s <input.ogg|-> [--streams=S1,S2,...] [--outdir=DIR] [--chunk=N]\n", argv[0]);
        return 1;
    }

    InitLmoggLogger(lmshao::lmcore::LogLevel::kInfo);

    std::string input_path = argv[1];
    std::set<uint32_t> serial_filter;
    std::string outdir = ".";
    OggDecoderOptions opts;
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.rfind("--streams=", 0) == 0) {
            serial_filter = ParseSerialList(arg.substr(10));
        } else if (arg.rfind("--outdir=", 0) == 0) {
            outdir = arg.substr(9);
        } else if (arg.rfind("--chunk=", 0) == 0) {
            opts.chunk_size = static_cast<size_t>(std::strtoul(arg.substr(8).c_str(), nullptr, 10));
        }
    }

    if (mkdir(outdir.c_str(), 0755) != 0 && errno != EEXIST) {
        std::fprintf(stderr, "Cannot create output directory %s: %s\n", outdir.c_str(), std::strerror(errno));
        return 1;
    }

    // stdin is read in place; a path is opened and owned by the decoder
    std::unique_ptr<StdioByteSource> stdin_source;
    std::unique_ptr<OggDecoder> decoder;
    if (input_path == "-") {
        stdin_source.reset(new StdioByteSource(stdin));
        decoder.reset(new OggDecoder(*stdin_source, opts));
    } else {
        decoder = OggDecoder::Open(input_path, opts);
        if (!decoder) {
            std::fprintf(stderr, "Failed to open: %s\n", input_path.c_str());
            return 1;
        }
    }

    DemoListener listener(outdir, serial_filter);
    decoder->SetListener(&listener);
    bool ok = decoder->Run();

    auto stats = decoder->GetStatistics();
    printf("Demux %s: %llu pages, %llu packets, %llu streams, %llu bytes skipped\n", ok ? "finished" : "aborted",
           (unsigned long long)stats["pages"], (unsigned long long)stats["packets"],
           (unsigned long long)stats["streams"], (unsigned long long)stats["bytes_skipped"]);
    return ok ? 0 : 1;
}
