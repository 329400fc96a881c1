#pragma once

#include "wirepod/schema/Primitive.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace wirepod::schema {

/**
 * @brief Dynamic value described by a Schema.
 *
 * - Unit: payload of empty tuples.
 * - Scalar: one primitive.
 * - Record: one entry per declared field, skipped and context fields included.
 * - Variant: index of the sum-type variant plus its payload fields.
 * - List: elements of a fixed array, tuple or sequence.
 */
class Value {
public:
    enum class Kind : std::uint8_t { Unit, Scalar, Record, Variant, List };

    Value() = default;
    Value(Scalar scalar)  // NOLINT: implicit so scalars read naturally in literals
    : kind_(Kind::Scalar), scalar_(scalar) {}

    template <typename T, typename = std::enable_if_t<std::is_arithmetic<T>::value>>
    static Value of(T v) { return Value(Scalar(v)); }

    static Value unit() { return Value(); }
    static Value record(std::vector<Value> fields);
    static Value variant(std::size_t index, std::vector<Value> fields = {});
    static Value list(std::vector<Value> items);

    Kind kind() const noexcept { return kind_; }
    bool isScalar() const noexcept { return kind_ == Kind::Scalar; }

    // Only meaningful when kind() == Kind::Scalar.
    const Scalar& scalar() const noexcept { return scalar_; }

    // Record fields, variant payload or list elements.
    const std::vector<Value>& items() const noexcept { return items_; }
    std::vector<Value>& items() noexcept { return items_; }
    std::size_t size() const noexcept { return items_.size(); }
    const Value& operator[](std::size_t i) const { return items_[i]; }

    std::size_t variantIndex() const noexcept { return index_; }

    // Returns the scalar when it holds exactly a T.
    template <typename T>
    std::optional<T> as() const {
        if (kind_ != Kind::Scalar) {
            return std::nullopt;
        }
        if (const T* v = std::get_if<T>(&scalar_)) {
            return *v;
        }
        return std::nullopt;
    }

    std::string describe() const;

    friend bool operator==(const Value& a, const Value& b);
    friend bool operator!=(const Value& a, const Value& b) { return !(a == b); }

private:
    Value(Kind kind, std::size_t index, std::vector<Value> items)
    : kind_(kind), index_(index), items_(std::move(items)) {}

    Kind kind_ = Kind::Unit;
    Scalar scalar_{};
    std::size_t index_ = 0;
    std::vector<Value> items_;
};

const char* toString(Value::Kind kind) noexcept;

} // namespace wirepod::schema
