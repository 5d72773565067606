#pragma once
// Copyright (c) 2024-2026 The txcombine Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <stdexcept>
#include <utility>
#include <vector>

namespace core {

// ---------------------------------------------------------------------------
// DataStream -- serialization stream backed by std::vector<uint8_t>
// ---------------------------------------------------------------------------
// Writes append; reads consume from an internal cursor. Reading past the
// end throws std::runtime_error, which the deserializing caller converts
// into a core::Error at its boundary.
// ---------------------------------------------------------------------------
class DataStream {
public:
    DataStream() = default;

    explicit DataStream(std::span<const uint8_t> data)
        : buf_(data.begin(), data.end()) {}

    void write(std::span<const uint8_t> data) {
        buf_.insert(buf_.end(), data.begin(), data.end());
    }

    void read(std::span<uint8_t> out) {
        if (out.size() > remaining()) {
            throw std::runtime_error(
                "DataStream::read(): attempted read past end of stream");
        }
        if (!out.empty()) {
            std::memcpy(out.data(), buf_.data() + read_pos_, out.size());
        }
        read_pos_ += out.size();
    }

    /// Returns the next byte without consuming it.
    [[nodiscard]] uint8_t peek() const {
        if (eof()) {
            throw std::runtime_error(
                "DataStream::peek(): stream is exhausted");
        }
        return buf_[read_pos_];
    }

    [[nodiscard]] size_t size() const noexcept { return buf_.size(); }

    [[nodiscard]] size_t remaining() const noexcept {
        return buf_.size() - read_pos_;
    }

    [[nodiscard]] bool eof() const noexcept {
        return read_pos_ >= buf_.size();
    }

    [[nodiscard]] const std::vector<uint8_t>& bytes() const noexcept {
        return buf_;
    }

    /// Move the internal buffer out. Resets the stream to empty state.
    [[nodiscard]] std::vector<uint8_t> release() {
        read_pos_ = 0;
        return std::move(buf_);
    }

private:
    std::vector<uint8_t> buf_;
    size_t               read_pos_ = 0;
};

// ---------------------------------------------------------------------------
// SizeCounter -- write-only sink that only counts bytes
// ---------------------------------------------------------------------------
class SizeCounter {
public:
    void write(std::span<const uint8_t> data) noexcept { size_ += data.size(); }
    [[nodiscard]] size_t size() const noexcept { return size_; }

private:
    size_t size_ = 0;
};

}  // namespace core
