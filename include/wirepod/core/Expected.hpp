// Expected.hpp
// -----------------------------------------------------------------------------
// Central aliases for tl::expected / tl::unexpected so the rest of the codebase
// names the success/error pair consistently. Codec operations default to
// CodecError (see Error.hpp); the stream layer uses std::error_code directly.

#pragma once

#include <type_traits>
#include <utility>

#include <tl/expected.hpp>

namespace wirepod {

template <typename T, typename E>
using expected = tl::expected<T, E>;

template <typename E>
using unexpected_t = tl::unexpected<E>;

template <typename E>
[[nodiscard]] constexpr unexpected_t<std::decay_t<E>> unexpected(E&& error) {
    return unexpected_t<std::decay_t<E>>(std::forward<E>(error));
}

} // namespace wirepod
