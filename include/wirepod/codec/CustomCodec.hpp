#pragma once

#include "wirepod/codec/Context.hpp"
#include "wirepod/codec/Cursor.hpp"
#include "wirepod/core/ByteOrder.hpp"
#include "wirepod/core/Error.hpp"
#include "wirepod/schema/Value.hpp"

#include <cstddef>
#include <string>

namespace wirepod::codec {

/**
 * @brief Hand-written leaf codec plugged into a schema with Type::custom().
 *
 * Used where a field's wire form cannot be declared, or depends on ambient
 * state: the cursors expose the byte offset within the top-level operation
 * and @p context carries caller-supplied values. @p order is the byte order
 * resolved for the enclosing schema.
 *
 * Implementations must keep size(), decode() and encode() consistent: encode
 * writes exactly size(value) bytes and decode reads back the same count.
 * They are shared between threads and must not keep per-call state.
 */
class CustomCodec {
public:
    virtual ~CustomCodec() = default;

    virtual std::string name() const = 0;
    virtual Result<std::size_t> size(const schema::Value& value) const = 0;
    virtual Result<schema::Value> decode(ReadCursor& in, Context& context, ByteOrder order) const = 0;
    virtual Result<void> encode(const schema::Value& value, WriteCursor& out,
                                Context& context, ByteOrder order) const = 0;
};

} // namespace wirepod::codec
