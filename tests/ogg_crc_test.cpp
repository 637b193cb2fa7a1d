/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#include <cassert>
#include <cstdint>
#include <cstring>
#include <vector>

#include "lmogg/ogg_crc.h"
#include "ogg_test_utils.h"

using namespace lmshao::lmogg;

int main()
{
    // Check value: CRC-32/CKSUM without the final inversion
    {
        const char *check = "123456789";
        uint32_t crc = OggCrc32(reinterpret_cast<const uint8_t *>(check), std::strlen(check));
        assert(crc == 0x89A1897Fu);
    }

    // Empty input keeps the initial value
    {
        assert(OggCrc32(nullptr, 0) == 0);
        assert(OggCrc32(nullptr, 0, 0x1234u) == 0x1234u);
    }

    // Chained computation matches one-shot
    {
        std::vector<uint8_t> data = test::MakeBytes(1000, 3);
        uint32_t whole = OggCrc32(data.data(), data.size());
        uint32_t part = OggCrc32(data.data(), 333);
        part = OggCrc32(data.data() + 333, data.size() - 333, part);
        assert(whole == part);
    }

    // Page checksum does not depend on what is stored in the checksum field
    {
        std::vector<uint8_t> page = test::BuildPacketPage(0x11223344u, 5, 0, 960, {test::MakeBytes(40, 1)});
        uint32_t stored = page[22] | (page[23] << 8) | (page[24] << 16) | (static_cast<uint32_t>(page[25]) << 24);
        assert(ComputePageChecksum(page.data(), page.size()) == stored);

        page[22] ^= 0xFF;
        page[25] ^= 0x5A;
        assert(ComputePageChecksum(page.data(), page.size()) == stored);

        page[40] ^= 0x01;
        assert(ComputePageChecksum(page.data(), page.size()) != stored);
    }

    return 0;
}
