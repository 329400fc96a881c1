#pragma once

#include "wirepod/core/Stream.hpp"

#include <cstddef>
#include <cstdint>
#include <system_error>

namespace wirepod::codec {

/**
 * @brief Wraps the caller's stream and counts bytes consumed by one top-level decode.
 */
class ReadCursor {
public:
    explicit ReadCursor(InputStream& stream, std::size_t start = 0)
    : stream_(stream), position_(start) {}

    ReadCursor(const ReadCursor&) = delete;
    ReadCursor& operator=(const ReadCursor&) = delete;

    std::error_code read(std::uint8_t* out, std::size_t count) {
        auto ec = stream_.readExact(out, count);
        if (!ec) {
            position_ += count;
        }
        return ec;
    }

    std::size_t position() const noexcept { return position_; }

private:
    InputStream& stream_;
    std::size_t position_;
};

/**
 * @brief Wraps the caller's stream and counts bytes produced by one top-level encode.
 */
class WriteCursor {
public:
    explicit WriteCursor(OutputStream& stream, std::size_t start = 0)
    : stream_(stream), position_(start) {}

    WriteCursor(const WriteCursor&) = delete;
    WriteCursor& operator=(const WriteCursor&) = delete;

    std::error_code write(const std::uint8_t* bytes, std::size_t count) {
        auto ec = stream_.writeAll(bytes, count);
        if (!ec) {
            position_ += count;
        }
        return ec;
    }

    std::size_t position() const noexcept { return position_; }

private:
    OutputStream& stream_;
    std::size_t position_;
};

} // namespace wirepod::codec
