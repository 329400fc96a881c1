#include "wirepod/codec/Codec.hpp"

#include "wirepod/core/ByteBuffer.hpp"
#include "wirepod/core/CodecConfig.hpp"
#include "wirepod/log/Log.hpp"

#include <string>
#include <utility>

namespace wirepod::codec {

using schema::Value;

Result<Codec> Codec::compile(schema::SchemaPtr schema) {
    if (!schema) {
        logError("[Codec] compile called without a schema\n");
        return makeError(Errc::schema_error, "<null>", "no schema to compile");
    }
    // A schema without its own byte order takes the process default at compile time.
    const ByteOrder fallback = config::CodecConfig::defaultByteOrder();
    ResolveScope scope{schema->meta(), concreteOrder(fallback), schema->name()};
    const ByteOrder order = effectiveOrder(scope);

    auto root = resolveField(schema::Type::composite(schema), scope);
    if (!root) {
        logError("[Codec] failed to compile ", schema->name(), ": ", root.error().describe(), "\n");
        return unexpected(std::move(root.error()));
    }
    return Codec(std::move(schema), order, std::shared_ptr<const FieldCodec>(std::move(*root)));
}

Result<Codec> Codec::compile(const schema::Registry& registry, std::string_view name) {
    auto schema = registry.find(name);
    if (!schema) {
        logError("[Codec] no schema registered as ", name, "\n");
        return makeError(Errc::schema_error, std::string(name), "no schema registered under this name");
    }
    return compile(std::move(schema));
}

Result<std::size_t> Codec::encodedSize(const Value& value) const {
    return root_->size(value);
}

Result<Value> Codec::decode(InputStream& stream, Context& context) const {
    ReadCursor cursor(stream);
    return root_->decode(cursor, context);
}

Result<Value> Codec::decode(InputStream& stream) const {
    Context context;
    return decode(stream, context);
}

Result<void> Codec::encode(const Value& value, OutputStream& stream, Context& context) const {
    WriteCursor cursor(stream);
    return root_->encode(value, cursor, context);
}

Result<void> Codec::encode(const Value& value, OutputStream& stream) const {
    Context context;
    return encode(value, stream, context);
}

Result<std::vector<std::uint8_t>> Codec::encodeToBuffer(const Value& value) const {
    Context context;
    return encodeToBuffer(value, context);
}

Result<std::vector<std::uint8_t>> Codec::encodeToBuffer(const Value& value, Context& context) const {
    auto size = encodedSize(value);
    if (!size) return unexpected(std::move(size.error()));

    ByteBuffer buffer(*size);
    BufferOutputStream stream(buffer);
    auto ok = encode(value, stream, context);
    if (!ok) return unexpected(std::move(ok.error()));
    return buffer.release();
}

Result<Value> Codec::decodeFromBuffer(ByteView bytes) const {
    Context context;
    return decodeFromBuffer(bytes, context);
}

Result<Value> Codec::decodeFromBuffer(ByteView bytes, Context& context) const {
    MemoryInputStream stream(bytes);
    return decode(stream, context);
}

} // namespace wirepod::codec
