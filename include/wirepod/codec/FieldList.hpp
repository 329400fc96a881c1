#pragma once

#include "wirepod/codec/FieldCodec.hpp"
#include "wirepod/schema/Schema.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace wirepod::codec {

/**
 * @brief Ordered field nodes shared by record bodies and variant payloads.
 *
 * Handles the publishing role: a field with a publish slot stores its value
 * in the Context after decode and before encode.
 */
class FieldList {
public:
    static Result<FieldList> compile(const std::vector<schema::Field>& fields, const ResolveScope& scope);

    std::size_t count() const noexcept { return entries_.size(); }

    Result<std::size_t> size(std::size_t index, const schema::Value& value) const;
    Result<void> decode(std::size_t index, std::vector<schema::Value>& out,
                        ReadCursor& in, Context& context) const;
    Result<void> encode(std::size_t index, const schema::Value& value,
                        WriteCursor& out, Context& context) const;

    // Appends a value obtained elsewhere (a kept tag) as if field @p index had decoded it.
    void adopt(std::size_t index, schema::Value value, std::vector<schema::Value>& out,
               Context& context) const;

private:
    struct Entry {
        FieldCodecPtr codec;
        std::string publishSlot;
    };

    std::vector<Entry> entries_;
};

} // namespace wirepod::codec
