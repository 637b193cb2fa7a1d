/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#ifndef LMSHAO_LMOGG_OGG_CRC_H
#define LMSHAO_LMOGG_OGG_CRC_H

#include <cstddef>
#include <cstdint>

namespace lmshao::lmogg {

// Ogg CRC-32: polynomial 0x04C11DB7, no reflection, initial value 0, no final xor.
uint32_t OggCrc32(const uint8_t *data, size_t size, uint32_t crc = 0);

// Checksum of a complete page, with the checksum field (bytes 22..25) taken as zero.
uint32_t ComputePageChecksum(const uint8_t *page, size_t size);

} // namespace lmshao::lmogg

#endif // LMSHAO_LMOGG_OGG_CRC_H
