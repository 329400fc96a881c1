#include "wirepod/codec/FieldCodec.hpp"

#include "wirepod/codec/CustomCodec.hpp"
#include "wirepod/codec/PrimitiveCodec.hpp"
#include "wirepod/codec/RecordCodec.hpp"
#include "wirepod/codec/SequenceCodec.hpp"
#include "wirepod/codec/SumCodec.hpp"
#include "wirepod/schema/Schema.hpp"

#include <memory>
#include <utility>
#include <vector>

namespace wirepod::codec {

using schema::PrimitiveType;
using schema::Type;
using schema::Value;

unexpected_t<CodecError> FieldCodec::fail(Errc code, std::string detail) const {
    return makeError(code, path_, std::move(detail));
}

unexpected_t<CodecError> FieldCodec::mismatch(const char* expected, const Value& got) const {
    return fail(Errc::value_mismatch, std::string("expected ") + expected + ", got " + got.describe());
}

CodecError FieldCodec::atIndex(CodecError error, std::size_t index) const {
    const std::string prefix = path_ + "[]";
    if (error.where.compare(0, prefix.size(), prefix) == 0) {
        error.where.replace(0, prefix.size(), path_ + "[" + std::to_string(index) + "]");
    }
    return error;
}

ByteOrder effectiveOrder(const ResolveScope& scope) {
    if (scope.meta.byteOrder) {
        return concreteOrder(*scope.meta.byteOrder);
    }
    return concreteOrder(scope.order);
}

namespace {

class PrimitiveNode final : public FieldCodec {
public:
    PrimitiveNode(std::string path, PrimitiveType type, ByteOrder order)
    : FieldCodec(std::move(path)), type_(type), order_(order) {}

    Result<std::size_t> size(const Value& value) const override {
        if (!value.isScalar() || schema::scalarType(value.scalar()) != type_) {
            return mismatch(schema::toString(type_), value);
        }
        return schema::primitiveSize(type_);
    }

    Result<Value> decode(ReadCursor& in, Context&) const override {
        auto scalar = readPrimitive(in, type_, order_, path());
        if (!scalar) {
            return unexpected(std::move(scalar.error()));
        }
        return Value(*scalar);
    }

    Result<void> encode(const Value& value, WriteCursor& out, Context&) const override {
        if (!value.isScalar()) {
            return mismatch(schema::toString(type_), value);
        }
        return writePrimitive(out, type_, value.scalar(), order_, path());
    }

private:
    PrimitiveType type_;
    ByteOrder order_;
};

class FixedArrayNode final : public FieldCodec {
public:
    FixedArrayNode(std::string path, FieldCodecPtr element, std::size_t length)
    : FieldCodec(std::move(path)), element_(std::move(element)), length_(length) {}

    Result<std::size_t> size(const Value& value) const override {
        if (value.kind() != Value::Kind::List || value.size() != length_) {
            return mismatch(("list of " + std::to_string(length_)).c_str(), value);
        }
        std::size_t total = 0;
        for (std::size_t i = 0; i < length_; ++i) {
            auto n = element_->size(value[i]);
            if (!n) return unexpected(atIndex(std::move(n.error()), i));
            total += *n;
        }
        return total;
    }

    Result<Value> decode(ReadCursor& in, Context& context) const override {
        std::vector<Value> items;
        items.reserve(length_);
        for (std::size_t i = 0; i < length_; ++i) {
            auto item = element_->decode(in, context);
            if (!item) return unexpected(atIndex(std::move(item.error()), i));
            items.push_back(std::move(*item));
        }
        return Value::list(std::move(items));
    }

    Result<void> encode(const Value& value, WriteCursor& out, Context& context) const override {
        if (value.kind() != Value::Kind::List || value.size() != length_) {
            return mismatch(("list of " + std::to_string(length_)).c_str(), value);
        }
        for (std::size_t i = 0; i < length_; ++i) {
            auto ok = element_->encode(value[i], out, context);
            if (!ok) return unexpected(atIndex(std::move(ok.error()), i));
        }
        return {};
    }

private:
    FieldCodecPtr element_;
    std::size_t length_;
};

// Positional elements; the empty tuple is the unit value.
class TupleNode final : public FieldCodec {
public:
    TupleNode(std::string path, std::vector<FieldCodecPtr> elements)
    : FieldCodec(std::move(path)), elements_(std::move(elements)) {}

    Result<std::size_t> size(const Value& value) const override {
        if (!accepts(value)) {
            return mismatch(expectedShape().c_str(), value);
        }
        std::size_t total = 0;
        for (std::size_t i = 0; i < elements_.size(); ++i) {
            auto n = elements_[i]->size(value[i]);
            if (!n) return unexpected(std::move(n.error()));
            total += *n;
        }
        return total;
    }

    Result<Value> decode(ReadCursor& in, Context& context) const override {
        if (elements_.empty()) {
            return Value::unit();
        }
        std::vector<Value> items;
        items.reserve(elements_.size());
        for (const auto& element : elements_) {
            auto item = element->decode(in, context);
            if (!item) return unexpected(std::move(item.error()));
            items.push_back(std::move(*item));
        }
        return Value::list(std::move(items));
    }

    Result<void> encode(const Value& value, WriteCursor& out, Context& context) const override {
        if (!accepts(value)) {
            return mismatch(expectedShape().c_str(), value);
        }
        for (std::size_t i = 0; i < elements_.size(); ++i) {
            auto ok = elements_[i]->encode(value[i], out, context);
            if (!ok) return ok;
        }
        return {};
    }

private:
    bool accepts(const Value& value) const {
        if (elements_.empty() && value.kind() == Value::Kind::Unit) {
            return true;
        }
        return value.kind() == Value::Kind::List && value.size() == elements_.size();
    }

    std::string expectedShape() const {
        return elements_.empty() ? std::string("unit") : "tuple of " + std::to_string(elements_.size());
    }

    std::vector<FieldCodecPtr> elements_;
};

class SkippedNode final : public FieldCodec {
public:
    SkippedNode(std::string path, Value defaultValue)
    : FieldCodec(std::move(path)), default_(std::move(defaultValue)) {}

    Result<std::size_t> size(const Value&) const override { return std::size_t{0}; }

    Result<Value> decode(ReadCursor&, Context&) const override { return default_; }

    Result<void> encode(const Value&, WriteCursor&, Context&) const override { return {}; }

private:
    Value default_;
};

class ContextNode final : public FieldCodec {
public:
    ContextNode(std::string path, std::string slot)
    : FieldCodec(std::move(path)), slot_(std::move(slot)) {}

    Result<std::size_t> size(const Value&) const override { return std::size_t{0}; }

    Result<Value> decode(ReadCursor&, Context& context) const override {
        const Value* found = context.find(slot_);
        if (!found) {
            return fail(Errc::missing_context, "context slot '" + slot_ + "' is not set");
        }
        return *found;
    }

    Result<void> encode(const Value& value, WriteCursor&, Context& context) const override {
        context.set(slot_, value);
        return {};
    }

private:
    std::string slot_;
};

class CustomNode final : public FieldCodec {
public:
    CustomNode(std::string path, std::shared_ptr<const CustomCodec> codec, ByteOrder order)
    : FieldCodec(std::move(path)), codec_(std::move(codec)), order_(order) {}

    Result<std::size_t> size(const Value& value) const override {
        auto n = codec_->size(value);
        if (!n) return unexpected(located(std::move(n.error())));
        return n;
    }

    Result<Value> decode(ReadCursor& in, Context& context) const override {
        auto value = codec_->decode(in, context, order_);
        if (!value) return unexpected(located(std::move(value.error())));
        return value;
    }

    Result<void> encode(const Value& value, WriteCursor& out, Context& context) const override {
        auto ok = codec_->encode(value, out, context, order_);
        if (!ok) return unexpected(located(std::move(ok.error())));
        return ok;
    }

private:
    CodecError located(CodecError error) const {
        if (error.where.empty()) {
            error.where = path();
        }
        return error;
    }

    std::shared_ptr<const CustomCodec> codec_;
    ByteOrder order_;
};

} // namespace

Result<FieldCodecPtr> resolveField(const Type& type, const ResolveScope& scope) {
    const ByteOrder order = effectiveOrder(scope);
    switch (type.kind()) {
        case Type::Kind::Primitive:
            return std::make_unique<PrimitiveNode>(scope.path, type.primitiveType(), order);

        case Type::Kind::Composite: {
            const auto& nested = type.schema();
            if (!nested) {
                return makeError(Errc::schema_error, scope.path, "composite field has no schema");
            }
            ResolveScope inner{nested->meta(), order, scope.path};
            if (nested->shape() == schema::Schema::Shape::Record) {
                return makeRecordCodec(*nested, inner);
            }
            return makeSumCodec(*nested, inner);
        }

        case Type::Kind::FixedArray: {
            ResolveScope inner{scope.meta, order, scope.path + "[]"};
            auto element = resolveField(type.element(), inner);
            if (!element) return unexpected(std::move(element.error()));
            return std::make_unique<FixedArrayNode>(scope.path, std::move(*element), type.length());
        }

        case Type::Kind::Tuple: {
            std::vector<FieldCodecPtr> elements;
            elements.reserve(type.elements().size());
            for (std::size_t i = 0; i < type.elements().size(); ++i) {
                ResolveScope inner{scope.meta, order, scope.path + "." + std::to_string(i)};
                auto element = resolveField(type.elements()[i], inner);
                if (!element) return unexpected(std::move(element.error()));
                elements.push_back(std::move(*element));
            }
            return std::make_unique<TupleNode>(scope.path, std::move(elements));
        }

        case Type::Kind::Sequence:
            return makeSequenceCodec(type, ResolveScope{scope.meta, order, scope.path});

        case Type::Kind::Skipped:
            return std::make_unique<SkippedNode>(scope.path, type.defaultValue());

        case Type::Kind::Context:
            if (type.slot().empty()) {
                return makeError(Errc::schema_error, scope.path, "context field needs a slot name");
            }
            return std::make_unique<ContextNode>(scope.path, type.slot());

        case Type::Kind::Custom:
            if (!type.customCodec()) {
                return makeError(Errc::schema_error, scope.path, "custom field has no codec");
            }
            return std::make_unique<CustomNode>(scope.path, type.customCodec(), order);
    }
    return makeError(Errc::schema_error, scope.path, "unsupported field type");
}

} // namespace wirepod::codec
