/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#include "lmogg/byte_source.h"

#include <algorithm>
#include <cstring>

#include "internal_logger.h"

namespace lmshao::lmogg {

size_t MemoryByteSource::Read(uint8_t *dst, size_t size)
{
    size_t remain = (pos_ < size_) ? (size_ - pos_) : 0;
    size_t to_read = std::min(size, remain);
    if (to_read > 0) {
        std::memcpy(dst, data_ + pos_, to_read);
        pos_ += to_read;
    }
    return to_read;
}

std::unique_ptr<MappedFileSource> MappedFileSource::Open(const std::string &path)
{
    std::shared_ptr<lmcore::MappedFile> file = lmcore::MappedFile::Open(path);
    if (!file || !file->IsValid()) {
        LMOGG_LOGE("Cannot open input file: %s", path.c_str());
        return nullptr;
    }
    LMOGG_LOGI("Opened %s (%zu bytes)", path.c_str(), file->Size());
    return std::unique_ptr<MappedFileSource>(new MappedFileSource(std::move(file)));
}

size_t MappedFileSource::Read(uint8_t *dst, size_t size)
{
    size_t total = file_->Size();
    size_t remain = (pos_ < total) ? (total - pos_) : 0;
    size_t to_read = std::min(size, remain);
    if (to_read > 0) {
        std::memcpy(dst, file_->Data() + pos_, to_read);
        pos_ += to_read;
    }
    return to_read;
}

size_t StdioByteSource::Read(uint8_t *dst, size_t size)
{
    if (!file_) {
        return 0;
    }
    size_t n = std::fread(dst, 1, size, file_);
    if (n < size && std::ferror(file_)) {
        LMOGG_LOGE("Read error on input stream");
    }
    return n;
}

bool StdioByteSource::IsEof() const
{
    return !file_ || std::feof(file_) || std::ferror(file_);
}

} // namespace lmshao::lmogg
