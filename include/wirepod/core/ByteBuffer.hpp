#pragma once

#include "wirepod/core/ByteView.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace wirepod {

/**
 * @brief Growable byte sink used as the in-memory encode target.
 */
class ByteBuffer {
public:
    ByteBuffer();
    explicit ByteBuffer(std::size_t reserveBytes);

    void clear();
    void append(const std::uint8_t* bytes, std::size_t count);

    const std::uint8_t* data() const { return buffer.data(); }
    std::size_t size() const { return buffer.size(); }
    ByteView view() const { return ByteView(buffer.data(), buffer.size()); }
    const std::vector<std::uint8_t>& bytes() const { return buffer; }

    // Moves the accumulated bytes out, leaving the buffer empty.
    std::vector<std::uint8_t> release();

private:
    std::vector<std::uint8_t> buffer;
};

} // namespace wirepod
