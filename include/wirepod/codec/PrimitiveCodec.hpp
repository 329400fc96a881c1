#pragma once

#include "wirepod/codec/Cursor.hpp"
#include "wirepod/core/ByteOrder.hpp"
#include "wirepod/core/Error.hpp"
#include "wirepod/schema/Primitive.hpp"

#include <cstdint>
#include <string_view>

namespace wirepod::codec {

// Fixed-width scalar I/O. @p order is resolved (Native becomes the host order)
// before any byte is touched; single-byte types ignore it.
Result<schema::Scalar> readPrimitive(ReadCursor& in, schema::PrimitiveType type,
                                     ByteOrder order, std::string_view where);

// Fails with value_mismatch when @p value is not exactly of @p type.
Result<void> writePrimitive(WriteCursor& out, schema::PrimitiveType type, const schema::Scalar& value,
                            ByteOrder order, std::string_view where);

// Tags, length prefixes and magic values: bool or narrow integers carried as
// a sign-extended 64-bit pattern.
Result<std::uint64_t> readBits(ReadCursor& in, schema::PrimitiveType type,
                               ByteOrder order, std::string_view where);

// Fails with length_overflow when @p bits does not fit @p type.
Result<void> writeBits(WriteCursor& out, schema::PrimitiveType type, std::uint64_t bits,
                       ByteOrder order, std::string_view where);

} // namespace wirepod::codec
