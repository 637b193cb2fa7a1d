/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#ifndef LMSHAO_LMOGG_BYTE_SOURCE_H
#define LMSHAO_LMOGG_BYTE_SOURCE_H

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <string>
#include <utility>

#include "lmcore/mapped_file.h"
#include "lmcore/noncopyable.h"

namespace lmshao::lmogg {

// Input of an OggDecoder. Read() blocks until at least one byte is available
// and returns 0 only once the source is exhausted.
class IByteSource {
public:
    virtual ~IByteSource() = default;

    virtual size_t Read(uint8_t *dst, size_t size) = 0;
    virtual bool IsEof() const = 0;
};

// Sequential reader over a caller-owned memory block
class MemoryByteSource : public IByteSource {
public:
    MemoryByteSource(const uint8_t *data, size_t size) : data_(data), size_(size) {}

    size_t Read(uint8_t *dst, size_t size) override;
    bool IsEof() const override { return pos_ >= size_; }

    size_t Tell() const { return pos_; }

private:
    const uint8_t *data_;
    size_t size_;
    size_t pos_ = 0;
};

// Reader over a memory-mapped file, which it owns
class MappedFileSource final : public IByteSource, public lmcore::NonCopyable {
public:
    static std::unique_ptr<MappedFileSource> Open(const std::string &path);

    size_t Read(uint8_t *dst, size_t size) override;
    bool IsEof() const override { return pos_ >= file_->Size(); }

    size_t Size() const { return file_->Size(); }

private:
    explicit MappedFileSource(std::shared_ptr<lmcore::MappedFile> file) : file_(std::move(file)) {}

    std::shared_ptr<lmcore::MappedFile> file_;
    size_t pos_ = 0;
};

// Reader over a stdio stream such as stdin or a pipe. The stream is not closed.
class StdioByteSource : public IByteSource {
public:
    explicit StdioByteSource(std::FILE *file) : file_(file) {}

    size_t Read(uint8_t *dst, size_t size) override;
    bool IsEof() const override;

private:
    std::FILE *file_;
};

} // namespace lmshao::lmogg

#endif // LMSHAO_LMOGG_BYTE_SOURCE_H
