#include "wirepod/codec/SumCodec.hpp"

#include "wirepod/codec/FieldList.hpp"
#include "wirepod/codec/PrimitiveCodec.hpp"

#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace wirepod::codec {

using schema::PrimitiveType;
using schema::Value;

namespace {

struct VariantEntry {
    std::string name;
    std::optional<schema::TagMatch> tag;
    std::optional<std::int64_t> emit;
    bool keepTag = false;
    bool excluded = false;
    FieldList fields;
};

std::string tagText(std::uint64_t bits, bool isSigned) {
    return isSigned ? std::to_string(static_cast<std::int64_t>(bits)) : std::to_string(bits);
}

class SumNode final : public FieldCodec {
public:
    SumNode(std::string path, PrimitiveType tagType, ByteOrder order,
            std::vector<VariantEntry> variants, std::optional<std::size_t> defaultIndex)
    : FieldCodec(std::move(path))
    , tagType_(tagType)
    , order_(order)
    , variants_(std::move(variants))
    , default_(defaultIndex) {}

    Result<std::size_t> size(const Value& value) const override {
        auto selected = encodable(value);
        if (!selected) return unexpected(std::move(selected.error()));
        const auto& variant = variants_[*selected];
        std::size_t total = variant.keepTag ? 0 : schema::primitiveSize(tagType_);
        for (std::size_t i = 0; i < variant.fields.count(); ++i) {
            auto n = variant.fields.size(i, value[i]);
            if (!n) return n;
            total += *n;
        }
        return total;
    }

    Result<Value> decode(ReadCursor& in, Context& context) const override {
        auto bits = readBits(in, tagType_, order_, path() + ".<tag>");
        if (!bits) return unexpected(std::move(bits.error()));

        auto selected = select(*bits);
        if (!selected) {
            return fail(Errc::unrecognized_discriminant,
                        "tag " + tagText(*bits, schema::isSigned(tagType_)) + " matches no variant");
        }
        const auto& variant = variants_[*selected];

        std::vector<Value> items;
        items.reserve(variant.fields.count());
        std::size_t first = 0;
        if (variant.keepTag) {
            auto tag = schema::makeScalar(tagType_, *bits);
            if (!tag) {
                return fail(Errc::unrecognized_discriminant, "tag does not fit " + std::string(schema::toString(tagType_)));
            }
            variant.fields.adopt(0, Value(*tag), items, context);
            first = 1;
        }
        for (std::size_t i = first; i < variant.fields.count(); ++i) {
            auto ok = variant.fields.decode(i, items, in, context);
            if (!ok) return unexpected(std::move(ok.error()));
        }
        return Value::variant(*selected, std::move(items));
    }

    Result<void> encode(const Value& value, WriteCursor& out, Context& context) const override {
        auto selected = encodable(value);
        if (!selected) return unexpected(std::move(selected.error()));
        const auto& variant = variants_[*selected];
        if (!variant.keepTag) {
            auto ok = writeBits(out, tagType_, static_cast<std::uint64_t>(*variant.emit), order_, path() + ".<tag>");
            if (!ok) return ok;
        }
        for (std::size_t i = 0; i < variant.fields.count(); ++i) {
            auto ok = variant.fields.encode(i, value[i], out, context);
            if (!ok) return ok;
        }
        return {};
    }

private:
    std::optional<std::size_t> select(std::uint64_t bits) const {
        const bool isSigned = schema::isSigned(tagType_);
        for (std::size_t i = 0; i < variants_.size(); ++i) {
            const auto& v = variants_[i];
            if (!v.excluded && v.tag && v.tag->matches(bits, isSigned)) {
                return i;
            }
        }
        return default_;
    }

    // Index of the variant @p value selects, after shape and exclusion checks.
    Result<std::size_t> encodable(const Value& value) const {
        if (value.kind() != Value::Kind::Variant || value.variantIndex() >= variants_.size()) {
            return mismatch("variant", value);
        }
        const auto& variant = variants_[value.variantIndex()];
        if (variant.excluded) {
            return fail(Errc::unencodable_variant, "variant " + variant.name + " cannot be encoded");
        }
        if (value.size() != variant.fields.count()) {
            return fail(Errc::value_mismatch, "variant " + variant.name + " expects "
                                                  + std::to_string(variant.fields.count()) + " fields, got "
                                                  + std::to_string(value.size()));
        }
        return value.variantIndex();
    }

    PrimitiveType tagType_;
    ByteOrder order_;
    std::vector<VariantEntry> variants_;
    std::optional<std::size_t> default_;
};

} // namespace

Result<FieldCodecPtr> makeSumCodec(const schema::Schema& sum, const ResolveScope& scope) {
    if (sum.shape() != schema::Schema::Shape::Sum) {
        return makeError(Errc::schema_error, scope.path, sum.name() + " is not a sum type");
    }
    const ByteOrder order = effectiveOrder(scope);

    std::vector<VariantEntry> variants;
    variants.reserve(sum.variants().size());
    for (const auto& v : sum.variants()) {
        const schema::Metadata vmeta = schema::merge(scope.meta, v.meta);
        const std::string path = scope.path + "::" + v.name;
        std::vector<schema::Field> declared = v.fields;
        if (vmeta.keepsTag() && !declared.empty()) {
            // The kept tag is written back through field 0, so it must use the tag's order.
            declared.front().meta.byteOrder = order;
        }
        auto fields = FieldList::compile(declared, ResolveScope{vmeta, order, path});
        if (!fields) return unexpected(std::move(fields.error()));

        VariantEntry entry{v.name, v.tag, v.emit, vmeta.keepsTag(), v.excluded, std::move(*fields)};
        if (!entry.emit && entry.tag) {
            entry.emit = entry.tag->singleLiteral();
        }
        if (!entry.keepTag && !entry.excluded && !entry.emit) {
            return makeError(Errc::schema_error, path, "variant needs a single tag value to emit without keep_tag");
        }
        variants.push_back(std::move(entry));
    }
    return std::make_unique<SumNode>(scope.path, sum.tagType(), order, std::move(variants), sum.defaultVariant());
}

} // namespace wirepod::codec
