/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#include "lmogg/ogg_crc.h"

#include <array>

namespace lmshao::lmogg {

static constexpr uint32_t kCrcPolynomial = 0x04C11DB7u;
static constexpr size_t kChecksumOffset = 22;
static constexpr size_t kChecksumSize = 4;

static constexpr std::array<uint32_t, 256> MakeCrcTable()
{
    std::array<uint32_t, 256> table{};
    for (uint32_t i = 0; i < 256; ++i) {
        uint32_t r = i << 24;
        for (int bit = 0; bit < 8; ++bit) {
            r = (r & 0x80000000u) ? ((r << 1) ^ kCrcPolynomial) : (r << 1);
        }
        table[i] = r;
    }
    return table;
}

static constexpr std::array<uint32_t, 256> kCrcTable = MakeCrcTable();

uint32_t OggCrc32(const uint8_t *data, size_t size, uint32_t crc)
{
    for (size_t i = 0; i < size; ++i) {
        crc = (crc << 8) ^ kCrcTable[((crc >> 24) & 0xFF) ^ data[i]];
    }
    return crc;
}

uint32_t ComputePageChecksum(const uint8_t *page, size_t size)
{
    if (size < kChecksumOffset + kChecksumSize) {
        return OggCrc32(page, size);
    }
    static const uint8_t kZeros[kChecksumSize] = {0, 0, 0, 0};
    uint32_t crc = OggCrc32(page, kChecksumOffset);
    crc = OggCrc32(kZeros, kChecksumSize, crc);
    return OggCrc32(page + kChecksumOffset + kChecksumSize, size - kChecksumOffset - kChecksumSize, crc);
}

} // namespace lmshao::lmogg
