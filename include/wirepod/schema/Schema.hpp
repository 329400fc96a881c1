#pragma once

#include "wirepod/core/Error.hpp"
#include "wirepod/schema/Metadata.hpp"
#include "wirepod/schema/Type.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wirepod::schema {

// Literal constant validated on decode and emitted on encode; not a field.
struct Magic {
    PrimitiveType type = PrimitiveType::U32;
    std::uint64_t value = 0;
    std::size_t beforeField = 0;  // 0 = start of record, fields().size() = end
};

struct Field {
    std::string name;
    Type type;
    Metadata meta;
    // When set, the field's value is also stored in this context slot after
    // decode and before encode, for later siblings and nested codecs.
    std::string publishSlot;
};

Field makeField(std::string name, Type type, Metadata meta = {});

struct Variant {
    std::string name;
    std::optional<TagMatch> tag;        // nullopt: default variant
    std::optional<std::int64_t> emit;   // literal written on encode when the tag is not a single literal
    Metadata meta;
    std::vector<Field> fields;
    bool excluded = false;              // never selected on decode, refused on encode

    Variant& emitting(std::int64_t value) {
        emit = value;
        return *this;
    }
};

class Schema;
using SchemaPtr = std::shared_ptr<const Schema>;

/**
 * @brief Immutable description of one type's wire layout.
 *
 * Built through RecordBuilder or SumBuilder, which reject invalid
 * declarations; a Schema that exists is structurally valid.
 */
class Schema {
    // Only the builders can name this, so only they can construct a Schema.
    struct BuilderKey {
        explicit BuilderKey() = default;
    };

public:
    enum class Shape : std::uint8_t { Record, Sum };

    explicit Schema(BuilderKey) {}

    const std::string& name() const noexcept { return name_; }
    Shape shape() const noexcept { return shape_; }
    const Metadata& meta() const noexcept { return meta_; }

    // Record shape
    const std::vector<Field>& fields() const noexcept { return fields_; }
    const std::optional<Magic>& magic() const noexcept { return magic_; }
    std::optional<std::size_t> findField(std::string_view name) const;

    // Sum shape
    PrimitiveType tagType() const noexcept { return tagType_; }
    const std::vector<Variant>& variants() const noexcept { return variants_; }
    std::optional<std::size_t> defaultVariant() const noexcept { return defaultVariant_; }
    std::optional<std::size_t> findVariant(std::string_view name) const;

private:
    friend class RecordBuilder;
    friend class SumBuilder;

    std::string name_;
    Shape shape_ = Shape::Record;
    Metadata meta_;
    std::vector<Field> fields_;
    std::optional<Magic> magic_;
    PrimitiveType tagType_ = PrimitiveType::U8;
    std::vector<Variant> variants_;
    std::optional<std::size_t> defaultVariant_;
};

/**
 * @brief Declares a record: ordered fields, optional magic, metadata.
 *
 * Usage sketch:
 *   auto packet = RecordBuilder("Packet")
 *       .byteOrder(ByteOrder::Big)
 *       .magic(PrimitiveType::U16, 0xabcd)
 *       .field("kind", Type::primitive(PrimitiveType::U16))
 *       .field("values", Type::sequence(Type::primitive(PrimitiveType::U32)),
 *              Metadata::sized(PrimitiveType::U16))
 *       .build();
 */
class RecordBuilder {
public:
    explicit RecordBuilder(std::string name);

    RecordBuilder& meta(const Metadata& meta);
    RecordBuilder& byteOrder(ByteOrder order);
    // Placed before the next declared field.
    RecordBuilder& magic(PrimitiveType type, std::uint64_t value);
    RecordBuilder& field(std::string name, Type type, Metadata meta = {});
    RecordBuilder& field(Field field);
    RecordBuilder& publish(std::string name, Type type, std::string slot, Metadata meta = {});
    RecordBuilder& skip(std::string name, Value defaultValue = Value::unit());

    Result<SchemaPtr> build() const;

private:
    std::string name_;
    Metadata meta_;
    std::vector<Field> fields_;
    std::optional<Magic> magic_;
};

/**
 * @brief Declares a sum type: tag type plus variants tried in order.
 */
class SumBuilder {
public:
    explicit SumBuilder(std::string name);
    SumBuilder(std::string name, PrimitiveType tagType);

    SumBuilder& meta(const Metadata& meta);
    SumBuilder& tagType(PrimitiveType type);
    SumBuilder& byteOrder(ByteOrder order);
    SumBuilder& keepTag();

    SumBuilder& variant(Variant variant);
    SumBuilder& variant(std::string name, TagMatch tag, std::vector<Field> fields = {}, Metadata meta = {});
    SumBuilder& fallback(std::string name, std::vector<Field> fields = {}, Metadata meta = {});
    SumBuilder& excluded(std::string name, std::vector<Field> fields = {});

    Result<SchemaPtr> build() const;

private:
    std::string name_;
    Metadata meta_;
    std::vector<Variant> variants_;
};

} // namespace wirepod::schema
