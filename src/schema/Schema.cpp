#include "wirepod/schema/Schema.hpp"

#include "wirepod/log/Log.hpp"

#include <set>
#include <utility>

namespace wirepod::schema {

Field makeField(std::string name, Type type, Metadata meta) {
    return Field{std::move(name), std::move(type), meta, {}};
}

std::optional<std::size_t> Schema::findField(std::string_view name) const {
    for (std::size_t i = 0; i < fields_.size(); ++i) {
        if (fields_[i].name == name) return i;
    }
    return std::nullopt;
}

std::optional<std::size_t> Schema::findVariant(std::string_view name) const {
    for (std::size_t i = 0; i < variants_.size(); ++i) {
        if (variants_[i].name == name) return i;
    }
    return std::nullopt;
}

namespace {

unexpected_t<CodecError> schemaError(const std::string& where, std::string detail) {
    logError("[SchemaBuilder] ", where, ": ", detail, "\n");
    return makeError(Errc::schema_error, where, std::move(detail));
}

Result<void> validateType(const Type& type, const Metadata& meta, const std::string& path) {
    switch (type.kind()) {
        case Type::Kind::Primitive:
        case Type::Kind::Skipped:
            return {};
        case Type::Kind::Composite:
            if (!type.schema()) {
                return schemaError(path, "composite field has no schema");
            }
            return {};
        case Type::Kind::FixedArray:
            return validateType(type.element(), meta, path + "[]");
        case Type::Kind::Tuple:
            for (std::size_t i = 0; i < type.elements().size(); ++i) {
                auto ok = validateType(type.elements()[i], meta, path + "." + std::to_string(i));
                if (!ok) return ok;
            }
            return {};
        case Type::Kind::Sequence: {
            const Metadata sizing = merge(meta, type.sizing());
            if (!sizing.sizeType) {
                return schemaError(path, "sequence needs a size type");
            }
            if (!isNarrowInteger(*sizing.sizeType)) {
                return schemaError(path, std::string("size type must be an integer of at most 64 bits, got ")
                                             + toString(*sizing.sizeType));
            }
            return validateType(type.element(), sizing, path + "[]");
        }
        case Type::Kind::Context:
            if (type.slot().empty()) {
                return schemaError(path, "context field needs a slot name");
            }
            return {};
        case Type::Kind::Custom:
            if (!type.customCodec()) {
                return schemaError(path, "custom field has no codec");
            }
            return {};
    }
    return schemaError(path, "unsupported field type");
}

Result<void> validateFields(const std::vector<Field>& fields, const Metadata& outer, const std::string& owner) {
    std::set<std::string> seen;
    for (std::size_t i = 0; i < fields.size(); ++i) {
        const auto& f = fields[i];
        const std::string path = owner + "." + (f.name.empty() ? std::to_string(i) : f.name);
        if (!f.name.empty() && !seen.insert(f.name).second) {
            return schemaError(path, "duplicate field name");
        }
        auto ok = validateType(f.type, merge(outer, f.meta), path);
        if (!ok) return ok;
    }
    return {};
}

} // namespace

// ---------------------------------------------------------------------------
// RecordBuilder
// ---------------------------------------------------------------------------

RecordBuilder::RecordBuilder(std::string name)
: name_(std::move(name)) {}

RecordBuilder& RecordBuilder::meta(const Metadata& meta) {
    meta_ = merge(meta_, meta);
    return *this;
}

RecordBuilder& RecordBuilder::byteOrder(ByteOrder order) {
    meta_.byteOrder = order;
    return *this;
}

RecordBuilder& RecordBuilder::magic(PrimitiveType type, std::uint64_t value) {
    magic_ = Magic{type, value, fields_.size()};
    return *this;
}

RecordBuilder& RecordBuilder::field(std::string name, Type type, Metadata meta) {
    fields_.push_back(makeField(std::move(name), std::move(type), meta));
    return *this;
}

RecordBuilder& RecordBuilder::field(Field field) {
    fields_.push_back(std::move(field));
    return *this;
}

RecordBuilder& RecordBuilder::publish(std::string name, Type type, std::string slot, Metadata meta) {
    Field f = makeField(std::move(name), std::move(type), meta);
    f.publishSlot = std::move(slot);
    fields_.push_back(std::move(f));
    return *this;
}

RecordBuilder& RecordBuilder::skip(std::string name, Value defaultValue) {
    return field(std::move(name), Type::skipped(std::move(defaultValue)));
}

Result<SchemaPtr> RecordBuilder::build() const {
    if (magic_) {
        if (!isNarrowInteger(magic_->type)) {
            return schemaError(name_, std::string("magic must be an integer of at most 64 bits, got ")
                                          + toString(magic_->type));
        }
        if (!fitsIn(magic_->type, magic_->value)) {
            return schemaError(name_, "magic value does not fit its type");
        }
    }
    if (meta_.keepTag || meta_.keepDiff) {
        return schemaError(name_, "keep_tag only applies to sum variants");
    }
    auto ok = validateFields(fields_, meta_, name_);
    if (!ok) return unexpected(ok.error());

    auto schema = std::make_shared<Schema>(Schema::BuilderKey{});
    schema->name_ = name_;
    schema->shape_ = Schema::Shape::Record;
    schema->meta_ = meta_;
    schema->fields_ = fields_;
    schema->magic_ = magic_;
    return SchemaPtr(std::move(schema));
}

// ---------------------------------------------------------------------------
// SumBuilder
// ---------------------------------------------------------------------------

SumBuilder::SumBuilder(std::string name)
: name_(std::move(name)) {}

SumBuilder::SumBuilder(std::string name, PrimitiveType tagType)
: name_(std::move(name)) {
    meta_.tagType = tagType;
}

SumBuilder& SumBuilder::meta(const Metadata& meta) {
    meta_ = merge(meta_, meta);
    return *this;
}

SumBuilder& SumBuilder::tagType(PrimitiveType type) {
    meta_.tagType = type;
    return *this;
}

SumBuilder& SumBuilder::byteOrder(ByteOrder order) {
    meta_.byteOrder = order;
    return *this;
}

SumBuilder& SumBuilder::keepTag() {
    meta_.keepTag = true;
    return *this;
}

SumBuilder& SumBuilder::variant(Variant variant) {
    variants_.push_back(std::move(variant));
    return *this;
}

SumBuilder& SumBuilder::variant(std::string name, TagMatch tag, std::vector<Field> fields, Metadata meta) {
    Variant v;
    v.name = std::move(name);
    v.tag = std::move(tag);
    v.meta = meta;
    v.fields = std::move(fields);
    return variant(std::move(v));
}

SumBuilder& SumBuilder::fallback(std::string name, std::vector<Field> fields, Metadata meta) {
    Variant v;
    v.name = std::move(name);
    v.meta = meta;
    v.fields = std::move(fields);
    return variant(std::move(v));
}

SumBuilder& SumBuilder::excluded(std::string name, std::vector<Field> fields) {
    Variant v;
    v.name = std::move(name);
    v.fields = std::move(fields);
    v.excluded = true;
    return variant(std::move(v));
}

Result<SchemaPtr> SumBuilder::build() const {
    if (!meta_.tagType) {
        return schemaError(name_, "sum type needs a tag type");
    }
    const PrimitiveType tagType = *meta_.tagType;
    if (!isTagCapable(tagType)) {
        return schemaError(name_, std::string("tag type must be bool or an integer of at most 64 bits, got ")
                                      + toString(tagType));
    }
    if (variants_.empty()) {
        return schemaError(name_, "sum type declares no variants");
    }

    std::optional<std::size_t> defaultIndex;
    std::set<std::string> names;
    for (std::size_t i = 0; i < variants_.size(); ++i) {
        const auto& v = variants_[i];
        const std::string path = name_ + "::" + v.name;
        if (!names.insert(v.name).second) {
            return schemaError(path, "duplicate variant name");
        }
        const Metadata vmeta = merge(meta_, v.meta);

        if (!v.excluded) {
            if (defaultIndex) {
                return schemaError(path, v.tag ? "default variant must be the last variant"
                                               : "only one variant may omit its tag");
            }
            if (!v.tag) {
                defaultIndex = i;
            }
        }

        if (vmeta.keepDiff && !vmeta.keepsTag()) {
            return schemaError(path, "keep_diff requires keep_tag");
        }
        if (vmeta.keepsTag()) {
            if (v.fields.empty()) {
                return schemaError(path, "cannot keep tag on a variant without fields");
            }
            const Type& first = v.fields.front().type;
            if (first.kind() != Type::Kind::Primitive || first.primitiveType() != tagType) {
                return schemaError(path, std::string("keep_tag needs a first field of the tag type ")
                                             + toString(tagType));
            }
        } else if (!v.excluded) {
            std::optional<std::int64_t> emit = v.emit;
            if (!emit && v.tag) {
                emit = v.tag->singleLiteral();
            }
            if (!emit) {
                return schemaError(path, "variant needs a single tag value to emit without keep_tag");
            }
            if (!fitsIn(tagType, static_cast<std::uint64_t>(*emit))) {
                return schemaError(path, "tag value does not fit the tag type");
            }
        }

        auto ok = validateFields(v.fields, vmeta, path);
        if (!ok) return unexpected(ok.error());
    }

    auto schema = std::make_shared<Schema>(Schema::BuilderKey{});
    schema->name_ = name_;
    schema->shape_ = Schema::Shape::Sum;
    schema->meta_ = meta_;
    schema->tagType_ = tagType;
    schema->variants_ = variants_;
    schema->defaultVariant_ = defaultIndex;
    return SchemaPtr(std::move(schema));
}

} // namespace wirepod::schema
