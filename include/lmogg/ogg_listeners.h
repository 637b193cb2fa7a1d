/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#ifndef LMSHAO_LMOGG_LISTENERS_H
#define LMSHAO_LMOGG_LISTENERS_H

#include <cstdint>
#include <string>

#include "lmogg/ogg_types.h"

namespace lmshao::lmogg {

// Observer for OggDecoder events. Callbacks run on the decoding thread, inside
// Route()/DecodeAll()/Run().
class IOggDemuxListener {
public:
    virtual ~IOggDemuxListener() = default;

    // First page of a new serial number seen
    virtual void OnStreamStart(uint32_t serial) = 0;

    // Called for each reassembled packet
    virtual void OnPacket(const OggPacket &packet) = 0;

    // Stream delivered its end-of-stream packet
    virtual void OnStreamEnd(uint32_t serial) = 0;

    // Recoverable page/stream errors and fatal errors; code is an OggError
    virtual void OnError(int code, const std::string &msg) = 0;
};

} // namespace lmshao::lmogg

#endif // LMSHAO_LMOGG_LISTENERS_H
