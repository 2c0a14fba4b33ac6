#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// Byte streams for record encoding.
//
// ByteWriter appends into an owned buffer; ByteReader walks a borrowed span
// and throws std::out_of_range when asked for more bytes than it holds.
// Both satisfy the write()/read() contract the ser_* templates expect.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace core {

class ByteWriter {
public:
    ByteWriter() = default;

    explicit ByteWriter(size_t expected_size) { buf_.reserve(expected_size); }

    void write(std::span<const uint8_t> data) {
        buf_.insert(buf_.end(), data.begin(), data.end());
    }

    [[nodiscard]] size_t size() const noexcept { return buf_.size(); }

    /// Everything written so far.
    [[nodiscard]] std::span<const uint8_t> bytes() const noexcept {
        return buf_;
    }

    /// Hand the buffer to the caller; the writer is left empty.
    [[nodiscard]] std::vector<uint8_t> release() {
        std::vector<uint8_t> out;
        out.swap(buf_);
        return out;
    }

private:
    std::vector<uint8_t> buf_;
};

class ByteReader {
public:
    explicit ByteReader(std::span<const uint8_t> data)
        : data_(data) {}

    void read(std::span<uint8_t> out) {
        require(out.size());
        if (!out.empty()) {
            std::memcpy(out.data(), data_.data() + pos_, out.size());
        }
        pos_ += out.size();
    }

    [[nodiscard]] size_t remaining() const noexcept {
        return data_.size() - pos_;
    }

    [[nodiscard]] bool eof() const noexcept { return pos_ == data_.size(); }

private:
    void require(size_t n) const {
        if (n > remaining()) {
            throw std::out_of_range(
                "ByteReader: need " + std::to_string(n) + " bytes at offset " +
                std::to_string(pos_) + ", have " + std::to_string(remaining()));
        }
    }

    std::span<const uint8_t> data_;
    size_t                   pos_ = 0;
};

}  // namespace core
