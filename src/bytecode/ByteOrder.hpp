//===----------------------------------------------------------------------===//
//
// Part of the RulesVM project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/bytecode/ByteOrder.hpp
// Purpose: Big-endian byte sink and bounds-checked byte source for the
//          bytecode image codec.
// Key invariants: ByteSource never reads past its span. The first failed read
//                 latches failed() and records its offset; later reads return
//                 zero.
// Ownership/Lifetime: ByteSink owns its buffer; ByteSource borrows its span.
// Links: bytecode/BytecodeWriter.cpp, bytecode/BytecodeReader.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rulesvm::bytecode
{

/// @brief Append-only big-endian output buffer.
class ByteSink
{
  public:
    void u8(uint8_t v)
    {
        bytes_.push_back(v);
    }

    void u16(uint16_t v)
    {
        bytes_.push_back(static_cast<uint8_t>(v >> 8));
        bytes_.push_back(static_cast<uint8_t>(v));
    }

    void u32(uint32_t v)
    {
        bytes_.push_back(static_cast<uint8_t>(v >> 24));
        bytes_.push_back(static_cast<uint8_t>(v >> 16));
        bytes_.push_back(static_cast<uint8_t>(v >> 8));
        bytes_.push_back(static_cast<uint8_t>(v));
    }

    void i32(int32_t v)
    {
        u32(static_cast<uint32_t>(v));
    }

    /// @brief Write raw bytes with no length prefix.
    void raw(std::span<const uint8_t> data)
    {
        bytes_.insert(bytes_.end(), data.begin(), data.end());
    }

    /// @brief Write a u16 length prefix followed by the bytes of @p s.
    /// @pre s.size() <= 0xFFFF.
    void string(std::string_view s)
    {
        u16(static_cast<uint16_t>(s.size()));
        bytes_.insert(bytes_.end(), s.begin(), s.end());
    }

    /// @brief Overwrite a big-endian u32 at @p offset.
    void patchU32(size_t offset, uint32_t v)
    {
        bytes_[offset] = static_cast<uint8_t>(v >> 24);
        bytes_[offset + 1] = static_cast<uint8_t>(v >> 16);
        bytes_[offset + 2] = static_cast<uint8_t>(v >> 8);
        bytes_[offset + 3] = static_cast<uint8_t>(v);
    }

    size_t size() const
    {
        return bytes_.size();
    }

    std::vector<uint8_t> take()
    {
        return std::move(bytes_);
    }

  private:
    std::vector<uint8_t> bytes_;
};

/// @brief Bounds-checked big-endian reader with a sticky failure flag.
class ByteSource
{
  public:
    explicit ByteSource(std::span<const uint8_t> data, size_t pos = 0) : data_(data), pos_(pos) {}

    uint8_t u8()
    {
        if (!require(1))
            return 0;
        return data_[pos_++];
    }

    uint16_t u16()
    {
        if (!require(2))
            return 0;
        const uint16_t v = static_cast<uint16_t>((data_[pos_] << 8) | data_[pos_ + 1]);
        pos_ += 2;
        return v;
    }

    uint32_t u32()
    {
        if (!require(4))
            return 0;
        const uint32_t v = (static_cast<uint32_t>(data_[pos_]) << 24) |
                           (static_cast<uint32_t>(data_[pos_ + 1]) << 16) |
                           (static_cast<uint32_t>(data_[pos_ + 2]) << 8) |
                           static_cast<uint32_t>(data_[pos_ + 3]);
        pos_ += 4;
        return v;
    }

    int32_t i32()
    {
        return static_cast<int32_t>(u32());
    }

    /// @brief Read a u16 length-prefixed string.
    std::string string()
    {
        const uint16_t len = u16();
        if (!require(len))
            return {};
        std::string s(reinterpret_cast<const char *>(data_.data() + pos_), len);
        pos_ += len;
        return s;
    }

    size_t position() const
    {
        return pos_;
    }

    void seek(size_t pos)
    {
        pos_ = pos;
    }

    bool failed() const
    {
        return failed_;
    }

    /// @brief Offset of the first read that ran past the end.
    size_t failureOffset() const
    {
        return failureOffset_;
    }

  private:
    bool require(size_t n)
    {
        if (failed_)
            return false;
        if (pos_ > data_.size() || data_.size() - pos_ < n)
        {
            failed_ = true;
            failureOffset_ = pos_;
            return false;
        }
        return true;
    }

    std::span<const uint8_t> data_;
    size_t pos_;
    bool failed_ = false;
    size_t failureOffset_ = 0;
};

} // namespace rulesvm::bytecode
