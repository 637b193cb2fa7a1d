/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#include <cassert>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

#include "lmogg/ogg_decoder.h"
#include "ogg_test_utils.h"

using namespace lmshao::lmogg;

class RecordingListener : public IOggDemuxListener {
public:
    void OnStreamStart(uint32_t serial) override { events.push_back("start:" + std::to_string(serial)); }

    void OnPacket(const OggPacket &packet) override
    {
        events.push_back("packet:" + std::to_string(packet.serial) + ":" + std::to_string(packet.data.size()));
    }

    void OnStreamEnd(uint32_t serial) override { events.push_back("end:" + std::to_string(serial)); }

    void OnError(int code, const std::string &msg) override
    {
        (void)msg;
        errors.push_back(code);
    }

    std::vector<std::string> events;
    std::vector<int> errors;
};

static bool Contains(const std::vector<int> &codes, OggError error)
{
    for (int c : codes) {
        if (c == static_cast<int>(error)) {
            return true;
        }
    }
    return false;
}

int main()
{
    // Empty input
    {
        MemoryByteSource source(nullptr, 0);
        OggDecoder decoder(source);
        OggPage page;
        assert(decoder.PullPage(page) == PullResult::kEndOfInput);
        assert(!decoder.HasNextPage());
        PacketMap out;
        assert(decoder.DecodeAll(out));
        assert(out.empty());
        assert(!decoder.IsFatal());
    }

    // One page, two packets
    {
        std::vector<uint8_t> stream = test::BuildPage(0x1234, 0, 0, 960, {10, 20}, test::MakeBytes(30, 5));
        MemoryByteSource source(stream.data(), stream.size());
        OggDecoder decoder(source);
        PacketMap out;
        assert(decoder.DecodeAll(out));
        assert(out.size() == 1);
        const auto &packets = out[0x1234];
        assert(packets.size() == 2);
        assert(packets[0].data.size() == 10);
        assert(packets[1].data.size() == 20);
        assert(!packets[0].bos && !packets[1].bos);
        assert(!packets[0].eos && !packets[1].eos);
        assert(packets[0].granule_position == -1);
        assert(packets[1].granule_position == 960);
        assert(std::memcmp(packets[1].data.data(), stream.data() + 29 + 10, 20) == 0);
    }

    // Many pages: every byte is read, every page is found
    {
        const uint32_t kPages = 50;
        std::vector<uint8_t> stream;
        size_t payload_total = 0;
        for (uint32_t seq = 0; seq < kPages; ++seq) {
            uint8_t flags = seq == 0 ? kOggBeginningOfStream : (seq == kPages - 1 ? kOggEndOfStream : 0);
            size_t size = 100 + seq * 13;
            payload_total += size;
            test::Append(stream, test::BuildPacketPage(77, seq, flags, seq * 100, {test::MakeBytes(size, seq)}));
        }
        MemoryByteSource source(stream.data(), stream.size());
        OggDecoder decoder(source);
        PacketMap out;
        assert(decoder.DecodeAll(out));
        size_t got = 0;
        for (const auto &p : out[77]) {
            got += p.data.size();
        }
        assert(out[77].size() == kPages);
        assert(got == payload_total);
        assert(out[77].back().eos);
        auto stats = decoder.GetStatistics();
        assert(stats["pages"] == kPages);
        assert(stats["packets"] == kPages);
        assert(stats["bytes_read"] == stream.size());
        assert(stats["bytes_skipped"] == 0);
        assert(stats["streams"] == 1);
        assert(decoder.LiveStreamCount() == 0);
    }

    // Two interleaved streams with a packet spanning pages
    {
        std::vector<uint8_t> stream;
        test::Append(stream, test::BuildPage(1, 0, kOggBeginningOfStream, -1, {255, 255}, test::MakeBytes(510, 1)));
        test::Append(stream, test::BuildPacketPage(2, 0, kOggBeginningOfStream, 0, {test::MakeBytes(10, 2)}));
        test::Append(stream, test::BuildPage(1, 1, kOggContinuedPacket, 600, {90}, test::MakeBytes(90, 3)));
        test::Append(stream, test::BuildPacketPage(2, 1, kOggEndOfStream, 20, {test::MakeBytes(20, 4)}));
        test::Append(stream, test::BuildPacketPage(1, 2, kOggEndOfStream, 605, {test::MakeBytes(5, 5)}));

        MemoryByteSource source(stream.data(), stream.size());
        OggDecoderOptions opts;
        opts.chunk_size = 100;
        OggDecoder decoder(source, opts);
        PacketMap out;
        assert(decoder.DecodeAll(out));
        assert(out.size() == 2);
        assert(out[1].size() == 2);
        assert(out[1][0].data.size() == 600);
        assert(out[1][0].granule_position == 600);
        assert(out[1][1].eos);
        assert(out[2].size() == 2);
        assert(out[2][0].data.size() == 10);
        assert(out[2][1].data.size() == 20);
        assert(out[2][1].eos);
    }

    // Corrupted page is skipped and shows up as a sequence gap
    {
        std::vector<uint8_t> p0 = test::BuildPacketPage(5, 0, kOggBeginningOfStream, 0, {test::MakeBytes(40, 1)});
        std::vector<uint8_t> p1 = test::BuildPacketPage(5, 1, 0, 1, {test::MakeBytes(40, 2)});
        std::vector<uint8_t> p2 = test::BuildPacketPage(5, 2, 0, 2, {test::MakeBytes(40, 3)});
        p1[30] ^= 0xFF;
        std::vector<uint8_t> stream;
        test::Append(stream, p0);
        test::Append(stream, p1);
        test::Append(stream, p2);

        MemoryByteSource source(stream.data(), stream.size());
        OggDecoder decoder(source);
        RecordingListener listener;
        decoder.SetListener(&listener);
        PacketMap out;
        assert(decoder.DecodeAll(out));
        assert(out[5].size() == 2);
        assert(out[5][1].granule_position == 2);
        auto stats = decoder.GetStatistics();
        assert(stats["crc_failures"] == 1);
        assert(stats["sequence_gaps"] == 1);
        assert(stats["pages"] == 2);
        assert(Contains(listener.errors, OggError::kCrcMismatch));
        assert(Contains(listener.errors, OggError::kSequenceGap));
    }

    // Page after end of stream is dropped
    {
        std::vector<uint8_t> stream;
        test::Append(stream, test::BuildPacketPage(8, 0, kOggBeginningOfStream, 0, {test::MakeBytes(10, 0)}));
        test::Append(stream, test::BuildPacketPage(8, 1, kOggEndOfStream, 1, {test::MakeBytes(10, 1)}));
        test::Append(stream, test::BuildPacketPage(8, 2, 0, 2, {test::MakeBytes(10, 2)}));

        MemoryByteSource source(stream.data(), stream.size());
        OggDecoder decoder(source);
        PacketMap out;
        assert(decoder.DecodeAll(out));
        assert(out[8].size() == 2);
        assert(decoder.LiveStreamCount() == 0);
        auto stats = decoder.GetStatistics();
        assert(stats["pages_after_eos"] == 1);
        assert(stats["streams"] == 1);
    }

    // Lookahead does not consume the page
    {
        std::vector<uint8_t> stream;
        test::Append(stream, test::BuildPacketPage(3, 0, kOggBeginningOfStream, 0, {test::MakeBytes(10, 0)}));
        test::Append(stream, test::BuildPacketPage(3, 1, kOggEndOfStream, 1, {test::MakeBytes(11, 0)}));

        MemoryByteSource source(stream.data(), stream.size());
        OggDecoder decoder(source);
        OggPage page;
        assert(decoder.HasNextPage());
        assert(decoder.HasNextPage());
        assert(decoder.PullPage(page) == PullResult::kPage);
        assert(page.sequence_number == 0);
        RouteResult r0 = decoder.Route(page);
        assert(r0.status == OggError::kOk && r0.packets.size() == 1);
        assert(decoder.HasNextPage());
        assert(decoder.PullPage(page) == PullResult::kPage);
        assert(page.sequence_number == 1);
        RouteResult r1 = decoder.Route(page);
        assert(r1.packets.size() == 1 && r1.packets[0].eos);
        assert(!decoder.HasNextPage());
        assert(decoder.PullPage(page) == PullResult::kEndOfInput);
        assert(decoder.GetStatistics()["pages"] == 2);
    }

    // Reading one byte at a time gives the same result
    {
        std::vector<uint8_t> stream;
        test::Append(stream, test::BuildPage(4, 0, kOggBeginningOfStream, -1, {255}, test::MakeBytes(255, 0)));
        test::Append(stream, test::BuildPage(4, 1, kOggContinuedPacket, 9, {45, 3}, test::MakeBytes(48, 1)));

        MemoryByteSource source(stream.data(), stream.size());
        OggDecoderOptions opts;
        opts.chunk_size = 1;
        OggDecoder decoder(source, opts);
        PacketMap out;
        assert(decoder.DecodeAll(out));
        assert(out[4].size() == 2);
        assert(out[4][0].data.size() == 300);
        assert(out[4][1].data.size() == 3);
        assert(out[4][1].granule_position == 9);
        assert(decoder.GetStatistics()["bytes_read"] == stream.size());
    }

    // Packet still open at end of input is reported and dropped
    {
        std::vector<uint8_t> stream;
        test::Append(stream, test::BuildPacketPage(6, 0, kOggBeginningOfStream, 0, {test::MakeBytes(12, 0)}));
        test::Append(stream, test::BuildPage(6, 1, 0, -1, {255, 255}, test::MakeBytes(510, 0)));

        MemoryByteSource source(stream.data(), stream.size());
        OggDecoder decoder(source);
        RecordingListener listener;
        decoder.SetListener(&listener);
        PacketMap out;
        assert(decoder.DecodeAll(out));
        assert(out[6].size() == 1);
        assert(decoder.GetStatistics()["incomplete_packets"] == 1);
        assert(Contains(listener.errors, OggError::kIncompletePacket));
        assert(decoder.LiveStreamCount() == 1);
    }

    // Listener sees stream lifecycle in order
    {
        std::vector<uint8_t> stream;
        test::Append(stream, test::BuildPacketPage(1, 0, kOggBeginningOfStream, 0, {test::MakeBytes(3, 0)}));
        test::Append(stream,
                     test::BuildPacketPage(1, 1, kOggEndOfStream, 1, {test::MakeBytes(4, 0), test::MakeBytes(5, 0)}));

        MemoryByteSource source(stream.data(), stream.size());
        OggDecoder decoder(source);
        RecordingListener listener;
        decoder.SetListener(&listener);
        assert(decoder.Run());
        std::vector<std::string> expected = {"start:1", "packet:1:3", "packet:1:4", "packet:1:5", "end:1"};
        assert(listener.events == expected);
        assert(listener.errors.empty());
    }

    // Optional stop once every stream has ended
    {
        std::vector<uint8_t> stream;
        test::Append(stream, test::BuildPacketPage(1, 0, kOggBeginningOfStream | kOggEndOfStream, 0,
                                                   {test::MakeBytes(3, 0)}));
        test::Append(stream, test::BuildPacketPage(2, 0, kOggBeginningOfStream, 0, {test::MakeBytes(3, 0)}));

        {
            MemoryByteSource source(stream.data(), stream.size());
            OggDecoder decoder(source);
            PacketMap out;
            assert(decoder.DecodeAll(out));
            assert(out.size() == 2);
        }
        {
            MemoryByteSource source(stream.data(), stream.size());
            OggDecoderOptions opts;
            opts.stop_when_all_streams_ended = true;
            OggDecoder decoder(source, opts);
            PacketMap out;
            assert(decoder.DecodeAll(out));
            assert(out.size() == 1);
            assert(out.count(1) == 1);
        }
    }

    // Largest pages decode with the smallest buffer limit, whatever the chunk size
    {
        std::vector<uint8_t> stream = test::BuildPacketPage(1, 0, kOggBeginningOfStream | kOggEndOfStream, 64000,
                                                            {test::MakeBytes(64000, 7)});
        assert(stream.size() == 64278);
        for (size_t chunk : {size_t(4096), size_t(60000), size_t(70000)}) {
            MemoryByteSource source(stream.data(), stream.size());
            OggDecoderOptions opts;
            opts.chunk_size = chunk;
            opts.max_buffer_size = kOggMaxPageSize;
            OggDecoder decoder(source, opts);
            PacketMap out;
            assert(decoder.DecodeAll(out));
            assert(!decoder.IsFatal());
            assert(out[1].size() == 1);
            assert(out[1][0].data.size() == 64000);
            assert(out[1][0].eos);
            assert(std::memcmp(out[1][0].data.data(), stream.data() + 278, 64000) == 0);
        }
    }

    // Source reporting more bytes than requested is fatal
    {
        class OverreportingSource : public IByteSource {
        public:
            size_t Read(uint8_t *dst, size_t size) override
            {
                std::memset(dst, 0, size);
                return size + 1;
            }
            bool IsEof() const override { return false; }
        };

        OverreportingSource source;
        OggDecoder decoder(source);
        OggPage page;
        assert(decoder.PullPage(page) == PullResult::kFatalError);
        assert(decoder.IsFatal());
        assert(decoder.PullPage(page) == PullResult::kFatalError);
        PacketMap out;
        assert(!decoder.DecodeAll(out));
    }

    // Resetting statistics clears scanner counters too
    {
        std::vector<uint8_t> p0 = test::BuildPacketPage(5, 0, kOggBeginningOfStream, 0, {test::MakeBytes(40, 1)});
        std::vector<uint8_t> p1 = test::BuildPacketPage(5, 1, 0, 1, {test::MakeBytes(40, 2)});
        std::vector<uint8_t> p2 = test::BuildPacketPage(5, 2, 0, 2, {test::MakeBytes(40, 3)});
        p1[30] ^= 0xFF;
        std::vector<uint8_t> stream = {'x', 'y'};
        test::Append(stream, p0);
        test::Append(stream, p1);
        test::Append(stream, p2);

        MemoryByteSource source(stream.data(), stream.size());
        OggDecoder decoder(source);
        OggPage page;
        assert(decoder.PullPage(page) == PullResult::kPage);
        decoder.Route(page);
        auto before = decoder.GetStatistics();
        assert(before["pages"] == 1);
        assert(before["bytes_skipped"] == 2);

        decoder.ResetStatistics();
        auto cleared = decoder.GetStatistics();
        for (const auto &kv : cleared) {
            assert(kv.second == 0);
        }

        assert(decoder.PullPage(page) == PullResult::kPage);
        assert(page.sequence_number == 2);
        decoder.Route(page);
        auto after = decoder.GetStatistics();
        assert(after["pages"] == 1);
        assert(after["crc_failures"] == 1);
        assert(after["bytes_skipped"] == p1.size());
        assert(after["sequence_gaps"] == 1);
        assert(after["packets"] == 1);
    }

    // File input
    {
        assert(OggDecoder::Open("/nonexistent/dir/input.ogg") == nullptr);

        std::vector<uint8_t> stream;
        test::Append(stream, test::BuildPacketPage(9, 0, kOggBeginningOfStream, 0, {test::MakeBytes(64, 0)}));
        test::Append(stream, test::BuildPacketPage(9, 1, kOggEndOfStream, 1, {test::MakeBytes(64, 1)}));
        std::string path = "lmogg_decoder_test.ogg";
        std::FILE *fp = std::fopen(path.c_str(), "wb");
        assert(fp != nullptr);
        assert(std::fwrite(stream.data(), 1, stream.size(), fp) == stream.size());
        std::fclose(fp);

        {
            auto decoder = OggDecoder::Open(path);
            assert(decoder != nullptr);
            PacketMap out;
            assert(decoder->DecodeAll(out));
            assert(out[9].size() == 2);
        }
        std::remove(path.c_str());
    }

    // Stdio input is left open for the caller
    {
        std::vector<uint8_t> stream = test::BuildPacketPage(2, 0, kOggBeginningOfStream, 0, {test::MakeBytes(30, 0)});
        std::FILE *fp = std::tmpfile();
        assert(fp != nullptr);
        assert(std::fwrite(stream.data(), 1, stream.size(), fp) == stream.size());
        std::rewind(fp);
        {
            StdioByteSource source(fp);
            OggDecoder decoder(source);
            PacketMap out;
            assert(decoder.DecodeAll(out));
            assert(out[2].size() == 1);
            assert(out[2][0].data.size() == 30);
        }
        std::rewind(fp);
        uint8_t first = 0;
        assert(std::fread(&first, 1, 1, fp) == 1);
        assert(first == 'O');
        std::fclose(fp);
    }

    return 0;
}
