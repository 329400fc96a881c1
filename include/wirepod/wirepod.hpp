#pragma once

// Umbrella header for the codec engine. The asio adapters are not included
// here; pull in "wirepod/net/AsioStream.hpp" where a socket is involved.

#include "wirepod/core/ByteBuffer.hpp"
#include "wirepod/core/ByteOrder.hpp"
#include "wirepod/core/ByteView.hpp"
#include "wirepod/core/CodecConfig.hpp"
#include "wirepod/core/Error.hpp"
#include "wirepod/core/Expected.hpp"
#include "wirepod/core/Stream.hpp"
#include "wirepod/log/Log.hpp"
#include "wirepod/schema/Metadata.hpp"
#include "wirepod/schema/Primitive.hpp"
#include "wirepod/schema/Registry.hpp"
#include "wirepod/schema/Schema.hpp"
#include "wirepod/schema/Type.hpp"
#include "wirepod/schema/Value.hpp"
#include "wirepod/codec/Codec.hpp"
#include "wirepod/codec/Context.hpp"
#include "wirepod/codec/Cursor.hpp"
#include "wirepod/codec/CustomCodec.hpp"
#include "wirepod/codec/PrimitiveCodec.hpp"
