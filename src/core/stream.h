#pragma once
// Copyright (c) 2024-2026 The N3TX Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace core {

// ---------------------------------------------------------------------------
// Stream exceptions
// ---------------------------------------------------------------------------
// The readers throw; every public deserialize() entry point catches these
// and converts them into a core::Error, so they never leave the library.

/// A read asked for more bytes than remain in the buffer.
class OutOfBoundsError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// The bytes are present but do not form a valid encoding.
class FormatError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ---------------------------------------------------------------------------
// BinaryWriter -- append-only byte sink backed by std::vector<uint8_t>
// ---------------------------------------------------------------------------
class BinaryWriter {
public:
    BinaryWriter() = default;

    void write(std::span<const uint8_t> data) {
        buf_.insert(buf_.end(), data.begin(), data.end());
    }

    [[nodiscard]] size_t size() const noexcept { return buf_.size(); }
    [[nodiscard]] bool empty() const noexcept { return buf_.empty(); }

    [[nodiscard]] const uint8_t* data() const noexcept {
        return buf_.data();
    }

    [[nodiscard]] std::span<const uint8_t> view() const noexcept {
        return std::span<const uint8_t>(buf_);
    }

    [[nodiscard]] const std::vector<uint8_t>& bytes() const noexcept {
        return buf_;
    }

    /// Move the internal buffer out.  Resets the writer to empty state.
    [[nodiscard]] std::vector<uint8_t> release() {
        std::vector<uint8_t> out = std::move(buf_);
        buf_.clear();
        return out;
    }

    void clear() { buf_.clear(); }
    void reserve(size_t n) { buf_.reserve(n); }

private:
    std::vector<uint8_t> buf_;
};

// ---------------------------------------------------------------------------
// BinaryReader -- read cursor over a borrowed byte span (zero-copy)
// ---------------------------------------------------------------------------
// The caller must keep the underlying bytes alive while the reader is in
// use.  A single checkpoint can be taken with mark() and restored with
// reset(), which lets parsers attempt a pattern and back out on mismatch.
// ---------------------------------------------------------------------------
class BinaryReader {
public:
    explicit BinaryReader(std::span<const uint8_t> data)
        : data_(data) {}

    void read(std::span<uint8_t> buf) {
        if (buf.size() > available()) {
            throw OutOfBoundsError(
                "BinaryReader::read(): need " + std::to_string(buf.size()) +
                " bytes at offset " + std::to_string(pos_) + ", have " +
                std::to_string(available()));
        }
        if (!buf.empty()) {
            std::memcpy(buf.data(), data_.data() + pos_, buf.size());
        }
        pos_ += buf.size();
    }

    /// Borrow the next @p n bytes without copying and advance past them.
    [[nodiscard]] std::span<const uint8_t> take(size_t n) {
        if (n > available()) {
            throw OutOfBoundsError(
                "BinaryReader::take(): need " + std::to_string(n) +
                " bytes at offset " + std::to_string(pos_) + ", have " +
                std::to_string(available()));
        }
        auto out = data_.subspan(pos_, n);
        pos_ += n;
        return out;
    }

    /// Return the next byte without consuming it.
    [[nodiscard]] uint8_t peek() const {
        if (available() == 0) {
            throw OutOfBoundsError("BinaryReader::peek(): end of data");
        }
        return data_[pos_];
    }

    void skip(size_t n) {
        if (n > available()) {
            throw OutOfBoundsError(
                "BinaryReader::skip(): attempted skip past end of data");
        }
        pos_ += n;
    }

    [[nodiscard]] size_t position() const noexcept { return pos_; }

    [[nodiscard]] size_t available() const noexcept {
        return data_.size() - pos_;
    }

    [[nodiscard]] bool eof() const noexcept { return pos_ >= data_.size(); }

    void mark() noexcept { mark_ = pos_; }
    void reset() noexcept { pos_ = mark_; }

    [[nodiscard]] std::span<const uint8_t> remaining_view() const noexcept {
        return data_.subspan(pos_);
    }

private:
    std::span<const uint8_t> data_;
    size_t                   pos_  = 0;
    size_t                   mark_ = 0;
};

}  // namespace core
