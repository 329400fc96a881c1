#include "wirepod/schema/Type.hpp"

#include "wirepod/codec/CustomCodec.hpp"
#include "wirepod/schema/Schema.hpp"

#include <sstream>
#include <utility>

namespace wirepod::schema {

Type Type::primitive(PrimitiveType type) {
    Type t(Kind::Primitive);
    t.primitive_ = type;
    return t;
}

Type Type::composite(std::shared_ptr<const Schema> schema) {
    Type t(Kind::Composite);
    t.schema_ = std::move(schema);
    return t;
}

Type Type::fixedArray(Type element, std::size_t length) {
    Type t(Kind::FixedArray);
    t.children_.push_back(std::move(element));
    t.length_ = length;
    return t;
}

Type Type::tuple(std::vector<Type> elements) {
    Type t(Kind::Tuple);
    t.children_ = std::move(elements);
    t.length_ = t.children_.size();
    return t;
}

Type Type::sequence(Type element, Metadata sizing) {
    Type t(Kind::Sequence);
    t.children_.push_back(std::move(element));
    t.sizing_ = sizing;
    return t;
}

Type Type::skipped(Value defaultValue) {
    Type t(Kind::Skipped);
    t.default_ = std::move(defaultValue);
    return t;
}

Type Type::context(std::string slot) {
    Type t(Kind::Context);
    t.slot_ = std::move(slot);
    return t;
}

Type Type::custom(std::shared_ptr<const codec::CustomCodec> codec) {
    Type t(Kind::Custom);
    t.custom_ = std::move(codec);
    return t;
}

std::string Type::describe() const {
    std::ostringstream os;
    switch (kind_) {
        case Kind::Primitive:
            os << toString(primitive_);
            break;
        case Kind::Composite:
            os << (schema_ ? schema_->name() : std::string("<null schema>"));
            break;
        case Kind::FixedArray:
            os << '[' << children_.front().describe() << "; " << length_ << ']';
            break;
        case Kind::Tuple:
            os << '(';
            for (std::size_t i = 0; i < children_.size(); ++i) {
                if (i) os << ", ";
                os << children_[i].describe();
            }
            os << ')';
            break;
        case Kind::Sequence:
            os << "seq<" << children_.front().describe() << '>';
            break;
        case Kind::Skipped:
            os << "skip";
            break;
        case Kind::Context:
            os << "context(" << slot_ << ')';
            break;
        case Kind::Custom:
            os << "custom(" << (custom_ ? custom_->name() : std::string("<null>")) << ')';
            break;
    }
    return os.str();
}

const char* toString(Type::Kind kind) noexcept {
    switch (kind) {
        case Type::Kind::Primitive:  return "primitive";
        case Type::Kind::Composite:  return "composite";
        case Type::Kind::FixedArray: return "fixed array";
        case Type::Kind::Tuple:      return "tuple";
        case Type::Kind::Sequence:   return "sequence";
        case Type::Kind::Skipped:    return "skipped";
        case Type::Kind::Context:    return "context";
        case Type::Kind::Custom:     return "custom";
    }
    return "unknown";
}

} // namespace wirepod::schema
