#include "wirepod/core/Stream.hpp"

#include "wirepod/core/Error.hpp"

#include <cstring>

namespace wirepod {

MemoryInputStream::MemoryInputStream(ByteView view)
: view(view) {}

std::error_code MemoryInputStream::readExact(std::uint8_t* out, std::size_t count) {
    if (count > remaining()) {
        return make_error_code(Errc::end_of_stream);
    }
    if (count > 0) {
        std::memcpy(out, view.data() + offset, count);
        offset += count;
    }
    return {};
}

BufferOutputStream::BufferOutputStream(ByteBuffer& target)
: target(target) {}

std::error_code BufferOutputStream::writeAll(const std::uint8_t* bytes, std::size_t count) {
    target.append(bytes, count);
    return {};
}

} // namespace wirepod
