#include "wirepod/core/ByteBuffer.hpp"

#include "wirepod/core/CodecConfig.hpp"

#include <utility>

namespace wirepod {

ByteBuffer::ByteBuffer()
: ByteBuffer(config::WIREPOD_DEFAULT_BUFFER_RESERVE) {}

ByteBuffer::ByteBuffer(std::size_t reserveBytes) {
    buffer.reserve(reserveBytes);
}

void ByteBuffer::clear() {
    buffer.clear();
}

void ByteBuffer::append(const std::uint8_t* bytes, std::size_t count) {
    if (count == 0) {
        return;
    }
    buffer.insert(buffer.end(), bytes, bytes + count);
}

std::vector<std::uint8_t> ByteBuffer::release() {
    std::vector<std::uint8_t> out;
    out.swap(buffer);
    return out;
}

} // namespace wirepod
