#pragma once

#include "wirepod/codec/Context.hpp"
#include "wirepod/codec/Cursor.hpp"
#include "wirepod/core/ByteOrder.hpp"
#include "wirepod/core/Error.hpp"
#include "wirepod/schema/Metadata.hpp"
#include "wirepod/schema/Type.hpp"
#include "wirepod/schema/Value.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <utility>

namespace wirepod::codec {

/**
 * @brief Compiled size/decode/encode rule for one field type.
 *
 * Nodes are built once by resolveField() and are immutable afterwards; all
 * per-call state lives in the cursors and the caller's Context.
 */
class FieldCodec {
public:
    explicit FieldCodec(std::string path) : path_(std::move(path)) {}
    virtual ~FieldCodec() = default;

    FieldCodec(const FieldCodec&) = delete;
    FieldCodec& operator=(const FieldCodec&) = delete;

    virtual Result<std::size_t> size(const schema::Value& value) const = 0;
    virtual Result<schema::Value> decode(ReadCursor& in, Context& context) const = 0;
    virtual Result<void> encode(const schema::Value& value, WriteCursor& out, Context& context) const = 0;

    const std::string& path() const noexcept { return path_; }

protected:
    unexpected_t<CodecError> fail(Errc code, std::string detail) const;
    unexpected_t<CodecError> mismatch(const char* expected, const schema::Value& got) const;

    // Rewrites an element error's `path[]` prefix to `path[index]`.
    CodecError atIndex(CodecError error, std::size_t index) const;

private:
    std::string path_;
};

using FieldCodecPtr = std::unique_ptr<const FieldCodec>;

// Everything a field inherits from its surroundings at compile time.
struct ResolveScope {
    schema::Metadata meta;   // merged outer -> inner
    ByteOrder order = ByteOrder::Native;  // concrete order of the enclosing schema
    std::string path;
};

// Byte order a node uses: its own merged setting when present, else the inherited one.
ByteOrder effectiveOrder(const ResolveScope& scope);

Result<FieldCodecPtr> resolveField(const schema::Type& type, const ResolveScope& scope);

} // namespace wirepod::codec
