#pragma once

#include "wirepod/codec/FieldCodec.hpp"
#include "wirepod/schema/Schema.hpp"

namespace wirepod::codec {

/**
 * @brief Tag-dispatched sum type node.
 *
 * Decode reads the discriminant and takes the first non-excluded variant whose
 * TagMatch accepts it, then the default variant, else fails with
 * unrecognized_discriminant. With keep-tag the discriminant becomes the first
 * payload field and no extra bytes are read or written for it.
 */
Result<FieldCodecPtr> makeSumCodec(const schema::Schema& sum, const ResolveScope& scope);

} // namespace wirepod::codec
