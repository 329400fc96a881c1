#pragma once

#include "wirepod/core/ByteBuffer.hpp"
#include "wirepod/core/ByteView.hpp"

#include <cstddef>
#include <cstdint>
#include <system_error>

namespace wirepod {

/**
 * @brief Blocking byte source consumed by the codec.
 *
 * `readExact` either fills all @p count bytes or returns an error; the codec
 * treats each call as atomic and never retries.
 */
class InputStream {
public:
    virtual ~InputStream() = default;
    virtual std::error_code readExact(std::uint8_t* out, std::size_t count) = 0;
};

/**
 * @brief Blocking byte sink fed by the codec.
 */
class OutputStream {
public:
    virtual ~OutputStream() = default;
    virtual std::error_code writeAll(const std::uint8_t* bytes, std::size_t count) = 0;
};

class MemoryInputStream final : public InputStream {
public:
    explicit MemoryInputStream(ByteView view);

    std::error_code readExact(std::uint8_t* out, std::size_t count) override;

    std::size_t consumed() const { return offset; }
    std::size_t remaining() const { return view.size() - offset; }

private:
    ByteView view;
    std::size_t offset = 0;
};

class BufferOutputStream final : public OutputStream {
public:
    explicit BufferOutputStream(ByteBuffer& target);

    std::error_code writeAll(const std::uint8_t* bytes, std::size_t count) override;

private:
    ByteBuffer& target;
};

} // namespace wirepod
