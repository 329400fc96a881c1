#pragma once

#include "wirepod/codec/FieldCodec.hpp"
#include "wirepod/schema/Schema.hpp"

namespace wirepod::codec {

// Fields in declaration order with the magic (if any) spliced in before
// field `magic.beforeField`. Values are Record values with one entry per field.
Result<FieldCodecPtr> makeRecordCodec(const schema::Schema& record, const ResolveScope& scope);

} // namespace wirepod::codec
