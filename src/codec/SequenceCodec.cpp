#include "wirepod/codec/SequenceCodec.hpp"

#include "wirepod/codec/PrimitiveCodec.hpp"
#include "wirepod/core/CodecConfig.hpp"

#include <algorithm>
#include <memory>
#include <utility>
#include <vector>

namespace wirepod::codec {

using schema::PrimitiveType;
using schema::Value;

namespace {

class SequenceNode final : public FieldCodec {
public:
    SequenceNode(std::string path, FieldCodecPtr element, PrimitiveType sizeType,
                 bool byteSized, ByteOrder order)
    : FieldCodec(std::move(path))
    , element_(std::move(element))
    , sizeType_(sizeType)
    , byteSized_(byteSized)
    , order_(order) {}

    Result<std::size_t> size(const Value& value) const override {
        auto payload = payloadSize(value);
        if (!payload) return payload;
        if (!schema::fitsIn(sizeType_, prefixFor(value, *payload))) {
            return overflow(prefixFor(value, *payload));
        }
        return schema::primitiveSize(sizeType_) + *payload;
    }

    Result<Value> decode(ReadCursor& in, Context& context) const override {
        auto prefix = readBits(in, sizeType_, order_, path());
        if (!prefix) return unexpected(std::move(prefix.error()));
        if (schema::isSigned(sizeType_) && static_cast<std::int64_t>(*prefix) < 0) {
            return fail(Errc::malformed_length,
                        "negative length " + std::to_string(static_cast<std::int64_t>(*prefix)));
        }
        return byteSized_ ? decodeBytes(in, context, *prefix) : decodeCount(in, context, *prefix);
    }

    Result<void> encode(const Value& value, WriteCursor& out, Context& context) const override {
        std::uint64_t prefix = 0;
        if (byteSized_) {
            auto payload = payloadSize(value);
            if (!payload) return unexpected(std::move(payload.error()));
            prefix = *payload;
        } else {
            if (value.kind() != Value::Kind::List) {
                return mismatch("list", value);
            }
            prefix = value.size();
        }
        if (!schema::fitsIn(sizeType_, prefix)) {
            return overflow(prefix);
        }
        auto ok = writeBits(out, sizeType_, prefix, order_, path());
        if (!ok) return ok;
        for (std::size_t i = 0; i < value.size(); ++i) {
            ok = element_->encode(value[i], out, context);
            if (!ok) return unexpected(atIndex(std::move(ok.error()), i));
        }
        return {};
    }

private:
    Result<std::size_t> payloadSize(const Value& value) const {
        if (value.kind() != Value::Kind::List) {
            return mismatch("list", value);
        }
        std::size_t total = 0;
        for (std::size_t i = 0; i < value.size(); ++i) {
            auto n = element_->size(value[i]);
            if (!n) return unexpected(atIndex(std::move(n.error()), i));
            total += *n;
        }
        return total;
    }

    std::uint64_t prefixFor(const Value& value, std::size_t payload) const {
        return byteSized_ ? payload : value.size();
    }

    unexpected_t<CodecError> overflow(std::uint64_t prefix) const {
        return fail(Errc::length_overflow, std::string(byteSized_ ? "byte length " : "count ")
                                               + std::to_string(prefix) + " does not fit "
                                               + schema::toString(sizeType_));
    }

    // Pre-allocation is capped so a hostile prefix cannot force a huge reserve.
    static std::size_t reserveFor(std::uint64_t hint) {
        return static_cast<std::size_t>(
            std::min<std::uint64_t>(hint, config::CodecConfig::sequenceReserveLimit()));
    }

    Result<Value> decodeCount(ReadCursor& in, Context& context, std::uint64_t count) const {
        std::vector<Value> items;
        items.reserve(reserveFor(count));
        const std::size_t limit = config::CodecConfig::sequenceReserveLimit();
        for (std::uint64_t i = 0; i < count; ++i) {
            const std::size_t start = in.position();
            auto item = element_->decode(in, context);
            if (!item) return unexpected(atIndex(std::move(item.error()), static_cast<std::size_t>(i)));
            // Zero-sized elements never reach the end of the stream, so the count alone bounds the loop.
            if (in.position() == start && count > limit) {
                return fail(Errc::malformed_length, "count " + std::to_string(count)
                                                        + " of zero-sized elements exceeds "
                                                        + std::to_string(limit));
            }
            items.push_back(std::move(*item));
        }
        return Value::list(std::move(items));
    }

    Result<Value> decodeBytes(ReadCursor& in, Context& context, std::uint64_t budget) const {
        std::vector<Value> items;
        while (budget > 0) {
            const std::size_t start = in.position();
            auto item = element_->decode(in, context);
            if (!item) return unexpected(atIndex(std::move(item.error()), items.size()));
            const std::uint64_t used = in.position() - start;
            if (used == 0) {
                return fail(Errc::malformed_length, "zero-sized element cannot fill a byte length");
            }
            if (used > budget) {
                return fail(Errc::malformed_length,
                            "element " + std::to_string(items.size()) + " overruns the byte length by "
                                + std::to_string(used - budget));
            }
            budget -= used;
            items.push_back(std::move(*item));
        }
        return Value::list(std::move(items));
    }

    FieldCodecPtr element_;
    PrimitiveType sizeType_;
    bool byteSized_;
    ByteOrder order_;
};

} // namespace

Result<FieldCodecPtr> makeSequenceCodec(const schema::Type& type, const ResolveScope& scope) {
    const schema::Metadata sizing = schema::merge(scope.meta, type.sizing());
    if (!sizing.sizeType || !schema::isNarrowInteger(*sizing.sizeType)) {
        return makeError(Errc::schema_error, scope.path, "sequence needs an integer size type");
    }
    const ByteOrder order = effectiveOrder(ResolveScope{sizing, scope.order, scope.path});
    auto element = resolveField(type.element(), ResolveScope{sizing, order, scope.path + "[]"});
    if (!element) return unexpected(std::move(element.error()));
    return std::make_unique<SequenceNode>(scope.path, std::move(*element), *sizing.sizeType,
                                          sizing.countsBytes(), order);
}

} // namespace wirepod::codec
