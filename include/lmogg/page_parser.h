/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#ifndef LMSHAO_LMOGG_PAGE_PARSER_H
#define LMSHAO_LMOGG_PAGE_PARSER_H

#include <cstddef>
#include <cstdint>

#include "lmogg/ogg_types.h"

namespace lmshao::lmogg {

enum class PageParseResult : uint8_t {
    kOk,
    kNeedMoreData,    // Header or segment table not fully available
    kBadCapture,      // Data does not start with "OggS"
    kMalformedHeader  // Unsupported stream structure version
};

// Decode the fixed header and segment table at data. On kOk every header field
// of page is filled and segment_table/header alias data. payload is set up as
// well, but only the caller knows whether size covers it; see PageSize().
PageParseResult ParsePageHeader(const uint8_t *data, size_t size, OggPage &page);

// Full page length of a parsed header: 27 + segments + sum(segments).
size_t PageSize(const OggPage &page);

} // namespace lmshao::lmogg

#endif // LMSHAO_LMOGG_PAGE_PARSER_H
