#pragma once

#include "wirepod/schema/Metadata.hpp"
#include "wirepod/schema/Primitive.hpp"
#include "wirepod/schema/Value.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace wirepod::codec {
class CustomCodec;
} // namespace wirepod::codec

namespace wirepod::schema {

class Schema;

/**
 * @brief Declared type of one field.
 *
 * Closed set of shapes; the field codec resolver turns each into a
 * size/decode/encode rule when a schema is compiled.
 */
class Type {
public:
    enum class Kind : std::uint8_t {
        Primitive,
        Composite,
        FixedArray,
        Tuple,
        Sequence,
        Skipped,
        Context,
        Custom
    };

    static Type primitive(PrimitiveType type);
    static Type composite(std::shared_ptr<const Schema> schema);
    static Type fixedArray(Type element, std::size_t length);
    static Type tuple(std::vector<Type> elements);
    static Type unit() { return tuple({}); }
    // @p sizing is layered on top of the enclosing field's metadata.
    static Type sequence(Type element, Metadata sizing = {});
    // Never on the wire; decodes as @p defaultValue.
    static Type skipped(Value defaultValue = Value::unit());
    // Never on the wire; exchanged with the context slot @p slot.
    static Type context(std::string slot);
    static Type custom(std::shared_ptr<const codec::CustomCodec> codec);

    Kind kind() const noexcept { return kind_; }
    PrimitiveType primitiveType() const noexcept { return primitive_; }
    const std::shared_ptr<const Schema>& schema() const noexcept { return schema_; }
    const Type& element() const { return children_.front(); }
    const std::vector<Type>& elements() const noexcept { return children_; }
    std::size_t length() const noexcept { return length_; }
    const Metadata& sizing() const noexcept { return sizing_; }
    const Value& defaultValue() const noexcept { return default_; }
    const std::string& slot() const noexcept { return slot_; }
    const std::shared_ptr<const codec::CustomCodec>& customCodec() const noexcept { return custom_; }

    std::string describe() const;

private:
    explicit Type(Kind kind) : kind_(kind) {}

    Kind kind_ = Kind::Tuple;
    PrimitiveType primitive_ = PrimitiveType::U8;
    std::shared_ptr<const Schema> schema_;
    std::vector<Type> children_;
    std::size_t length_ = 0;
    Metadata sizing_;
    Value default_;
    std::string slot_;
    std::shared_ptr<const codec::CustomCodec> custom_;
};

const char* toString(Type::Kind kind) noexcept;

} // namespace wirepod::schema
