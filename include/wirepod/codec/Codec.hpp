#pragma once

#include "wirepod/codec/Context.hpp"
#include "wirepod/codec/FieldCodec.hpp"
#include "wirepod/core/ByteOrder.hpp"
#include "wirepod/core/ByteView.hpp"
#include "wirepod/core/Error.hpp"
#include "wirepod/core/Stream.hpp"
#include "wirepod/schema/Registry.hpp"
#include "wirepod/schema/Schema.hpp"
#include "wirepod/schema/Value.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>
#include <vector>

namespace wirepod::codec {

/**
 * @brief Size/decode/encode for one schema, compiled once.
 *
 * compile() resolves every field of the schema (recursively through nested
 * schemas) into codec nodes, so schema errors surface before any I/O. The
 * compiled codec is immutable and can be shared by threads working on
 * distinct streams; copies share the compiled tree.
 *
 * Usage sketch:
 *   auto codec = Codec::compile(packetSchema);
 *   auto bytes = codec->encodeToBuffer(value);
 *   auto back  = codec->decodeFromBuffer(ByteView(*bytes));
 */
class Codec {
public:
    static Result<Codec> compile(schema::SchemaPtr schema);
    static Result<Codec> compile(const schema::Registry& registry, std::string_view name);

    // Pure; fails only when @p value does not fit the schema or selects an excluded variant.
    Result<std::size_t> encodedSize(const schema::Value& value) const;

    // On success exactly encodedSize(result) bytes were consumed from @p stream.
    Result<schema::Value> decode(InputStream& stream, Context& context) const;
    Result<schema::Value> decode(InputStream& stream) const;

    // On success exactly encodedSize(value) bytes were written to @p stream.
    Result<void> encode(const schema::Value& value, OutputStream& stream, Context& context) const;
    Result<void> encode(const schema::Value& value, OutputStream& stream) const;

    Result<std::vector<std::uint8_t>> encodeToBuffer(const schema::Value& value) const;
    Result<std::vector<std::uint8_t>> encodeToBuffer(const schema::Value& value, Context& context) const;

    // Decodes from the front of @p bytes; trailing bytes are left unread.
    Result<schema::Value> decodeFromBuffer(ByteView bytes) const;
    Result<schema::Value> decodeFromBuffer(ByteView bytes, Context& context) const;

    const schema::SchemaPtr& schema() const noexcept { return schema_; }
    ByteOrder byteOrder() const noexcept { return order_; }

private:
    Codec(schema::SchemaPtr schema, ByteOrder order, std::shared_ptr<const FieldCodec> root)
    : schema_(std::move(schema)), order_(order), root_(std::move(root)) {}

    schema::SchemaPtr schema_;
    ByteOrder order_;
    std::shared_ptr<const FieldCodec> root_;
};

} // namespace wirepod::codec
