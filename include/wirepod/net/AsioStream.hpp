#pragma once
#include "wirepod/net/NetConfig.hpp"
#include "wirepod/core/Stream.hpp"
#include "wirepod/log/Log.hpp"

#include <cstddef>
#include <cstdint>

namespace wirepod::net {

/**
 * @brief Feeds a codec from any synchronous Asio read stream.
 *
 * Works with `tcp::socket`, `asio::local::stream_protocol::socket`, serial
 * ports and anything else modelling SyncReadStream. The stream is borrowed
 * and must outlive the adapter. Asio errors (`asio::error::eof`,
 * `connection_reset`, ...) are handed back unchanged, so the codec reports
 * them as I/O failures.
 */
template <typename SyncReadStream>
class AsioInputStream final : public InputStream {
public:
    explicit AsioInputStream(SyncReadStream& stream) : stream_(stream) {}

    std::error_code readExact(std::uint8_t* out, std::size_t count) override {
        std::error_code ec;
        const std::size_t transferred = asio::read(stream_, asio::buffer(out, count), ec);
        if (ec) {
            logError("[AsioInputStream] read_exact ", count, " bytes failed after ", transferred,
                     ": ", ec.message(), "\n");
            return ec;
        }
        consumed_ += transferred;
        return {};
    }

    std::size_t consumed() const { return consumed_; }

private:
    SyncReadStream& stream_;
    std::size_t consumed_ = 0;
};

/**
 * @brief Writes codec output to any synchronous Asio write stream.
 */
template <typename SyncWriteStream>
class AsioOutputStream final : public OutputStream {
public:
    explicit AsioOutputStream(SyncWriteStream& stream) : stream_(stream) {}

    std::error_code writeAll(const std::uint8_t* bytes, std::size_t count) override {
        std::error_code ec;
        const std::size_t transferred = asio::write(stream_, asio::buffer(bytes, count), ec);
        if (ec) {
            logError("[AsioOutputStream] write_all ", count, " bytes failed after ", transferred,
                     ": ", ec.message(), "\n");
            return ec;
        }
        written_ += transferred;
        return {};
    }

    std::size_t written() const { return written_; }

private:
    SyncWriteStream& stream_;
    std::size_t written_ = 0;
};

} // namespace wirepod::net
