#include "wirepod/schema/Value.hpp"

#include <iomanip>
#include <sstream>
#include <type_traits>
#include <utility>

namespace wirepod::schema {

Value Value::record(std::vector<Value> fields) {
    return Value(Kind::Record, 0, std::move(fields));
}

Value Value::variant(std::size_t index, std::vector<Value> fields) {
    return Value(Kind::Variant, index, std::move(fields));
}

Value Value::list(std::vector<Value> items) {
    return Value(Kind::List, 0, std::move(items));
}

bool operator==(const Value& a, const Value& b) {
    if (a.kind_ != b.kind_) {
        return false;
    }
    switch (a.kind_) {
        case Value::Kind::Unit:
            return true;
        case Value::Kind::Scalar:
            return a.scalar_ == b.scalar_;
        case Value::Kind::Variant:
            if (a.index_ != b.index_) {
                return false;
            }
            break;
        case Value::Kind::Record:
        case Value::Kind::List:
            break;
    }
    return a.items_ == b.items_;
}

namespace {

void describeScalar(std::ostream& os, const Scalar& scalar) {
    std::visit([&os](auto v) {
        using T = decltype(v);
        if constexpr (std::is_same_v<T, bool>) {
            os << (v ? "true" : "false");
        } else if constexpr (std::is_same_v<T, Int128> || std::is_same_v<T, UInt128>) {
            os << "0x" << std::hex << std::setfill('0')
               << std::setw(16) << v.high << std::setw(16) << v.low
               << std::dec << std::setfill(' ');
        } else if constexpr (std::is_integral_v<T>) {
            os << +v;
        } else {
            os << v;
        }
        os << ':' << toString(scalarType(Scalar(v)));
    }, scalar);
}

void describeItems(std::ostream& os, const std::vector<Value>& items, char open, char close) {
    os << open;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i) os << ", ";
        os << items[i].describe();
    }
    os << close;
}

} // namespace

std::string Value::describe() const {
    std::ostringstream os;
    switch (kind_) {
        case Kind::Unit:
            os << "()";
            break;
        case Kind::Scalar:
            describeScalar(os, scalar_);
            break;
        case Kind::Record:
            describeItems(os, items_, '{', '}');
            break;
        case Kind::Variant:
            os << '#' << index_;
            describeItems(os, items_, '(', ')');
            break;
        case Kind::List:
            describeItems(os, items_, '[', ']');
            break;
    }
    return os.str();
}

const char* toString(Value::Kind kind) noexcept {
    switch (kind) {
        case Value::Kind::Unit:    return "unit";
        case Value::Kind::Scalar:  return "scalar";
        case Value::Kind::Record:  return "record";
        case Value::Kind::Variant: return "variant";
        case Value::Kind::List:    return "list";
    }
    return "unknown";
}

} // namespace wirepod::schema
