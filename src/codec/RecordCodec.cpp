#include "wirepod/codec/RecordCodec.hpp"

#include "wirepod/codec/FieldList.hpp"
#include "wirepod/codec/PrimitiveCodec.hpp"

#include <iomanip>
#include <optional>
#include <sstream>
#include <utility>
#include <vector>

namespace wirepod::codec {

using schema::Value;

namespace {

std::string hex(std::uint64_t v, std::size_t width) {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::setw(static_cast<int>(width * 2)) << std::setfill('0') << v;
    return oss.str();
}

class RecordNode final : public FieldCodec {
public:
    RecordNode(std::string path, FieldList fields, std::optional<schema::Magic> magic, ByteOrder order)
    : FieldCodec(std::move(path))
    , fields_(std::move(fields))
    , magic_(std::move(magic))
    , order_(order) {}

    Result<std::size_t> size(const Value& value) const override {
        if (!accepts(value)) {
            return mismatch(expectedShape().c_str(), value);
        }
        std::size_t total = magic_ ? schema::primitiveSize(magic_->type) : 0;
        for (std::size_t i = 0; i < fields_.count(); ++i) {
            auto n = fields_.size(i, value[i]);
            if (!n) return n;
            total += *n;
        }
        return total;
    }

    Result<Value> decode(ReadCursor& in, Context& context) const override {
        std::vector<Value> items;
        items.reserve(fields_.count());
        for (std::size_t i = 0; i <= fields_.count(); ++i) {
            if (magic_ && magic_->beforeField == i) {
                auto ok = checkMagic(in);
                if (!ok) return unexpected(std::move(ok.error()));
            }
            if (i == fields_.count()) break;
            auto ok = fields_.decode(i, items, in, context);
            if (!ok) return unexpected(std::move(ok.error()));
        }
        return Value::record(std::move(items));
    }

    Result<void> encode(const Value& value, WriteCursor& out, Context& context) const override {
        if (!accepts(value)) {
            return mismatch(expectedShape().c_str(), value);
        }
        for (std::size_t i = 0; i <= fields_.count(); ++i) {
            if (magic_ && magic_->beforeField == i) {
                auto ok = writeBits(out, magic_->type, magic_->value, order_, path() + ".<magic>");
                if (!ok) return ok;
            }
            if (i == fields_.count()) break;
            auto ok = fields_.encode(i, value[i], out, context);
            if (!ok) return ok;
        }
        return {};
    }

private:
    bool accepts(const Value& value) const {
        return value.kind() == Value::Kind::Record && value.size() == fields_.count();
    }

    std::string expectedShape() const {
        return "record of " + std::to_string(fields_.count()) + " fields";
    }

    Result<void> checkMagic(ReadCursor& in) const {
        const std::string where = path() + ".<magic>";
        auto bits = readBits(in, magic_->type, order_, where);
        if (!bits) return unexpected(std::move(bits.error()));
        // Compare within the magic's width so sign extension cannot hide a match.
        const std::size_t width = schema::primitiveSize(magic_->type);
        const std::uint64_t mask = width >= 8 ? ~std::uint64_t{0} : ((std::uint64_t{1} << (8 * width)) - 1);
        if ((*bits & mask) != (magic_->value & mask)) {
            return makeError(Errc::bad_magic, where,
                             "expected " + hex(magic_->value & mask, width) + ", got " + hex(*bits & mask, width));
        }
        return {};
    }

    FieldList fields_;
    std::optional<schema::Magic> magic_;
    ByteOrder order_;
};

} // namespace

Result<FieldCodecPtr> makeRecordCodec(const schema::Schema& record, const ResolveScope& scope) {
    if (record.shape() != schema::Schema::Shape::Record) {
        return makeError(Errc::schema_error, scope.path, record.name() + " is not a record");
    }
    const ByteOrder order = effectiveOrder(scope);
    auto fields = FieldList::compile(record.fields(), ResolveScope{scope.meta, order, scope.path});
    if (!fields) return unexpected(std::move(fields.error()));
    return std::make_unique<RecordNode>(scope.path, std::move(*fields), record.magic(), order);
}

} // namespace wirepod::codec
