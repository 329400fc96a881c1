#pragma once

#include <asio.hpp>
#include <system_error>

namespace wirepod::net {

/**
 * @brief Centralises networking aliases so higher-level code never includes Asio directly.
 *
 * Exposes:
 * - `wirepod::net::asio` as the standalone Asio namespace.
 * - `wirepod::net::tcp` as the protocol alias for socket streams.
 */
namespace asio = ::asio;

using tcp = asio::ip::tcp;
} // namespace wirepod::net
