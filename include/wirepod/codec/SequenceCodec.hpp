#pragma once

#include "wirepod/codec/FieldCodec.hpp"

namespace wirepod::codec {

/**
 * @brief Length-prefixed sequence node.
 *
 * The prefix is read and written with the size type of `merge(scope.meta,
 * type.sizing())`. In count mode it holds the element count; in byte mode
 * (`byteSized`) it holds the summed encoded size of the elements, and decode
 * keeps reading elements until that budget is exactly spent.
 */
Result<FieldCodecPtr> makeSequenceCodec(const schema::Type& type, const ResolveScope& scope);

} // namespace wirepod::codec
