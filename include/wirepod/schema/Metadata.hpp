#pragma once

#include "wirepod/core/ByteOrder.hpp"
#include "wirepod/schema/Primitive.hpp"

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

namespace wirepod::schema {

/**
 * @brief Rule selecting a sum-type variant from a decoded discriminant.
 *
 * A match is a union of inclusive ranges; a literal is the range [v, v].
 * Bounds are stored as 64-bit patterns and compared in the signedness of the
 * tag type, so unsigned tags above INT64_MAX are written as their bit pattern.
 */
class TagMatch {
public:
    struct Range {
        std::int64_t first = 0;
        std::int64_t last = 0;
    };

    static TagMatch literal(std::int64_t value);
    static TagMatch range(std::int64_t first, std::int64_t last);
    static TagMatch anyOf(std::initializer_list<std::int64_t> values);

    // Extends the union (`6..=8 | 10` is range(6, 8).orLiteral(10)).
    TagMatch& orLiteral(std::int64_t value);
    TagMatch& orRange(std::int64_t first, std::int64_t last);

    bool matches(std::uint64_t bits, bool isSigned) const noexcept;

    // The value when the match is exactly one literal.
    std::optional<std::int64_t> singleLiteral() const noexcept;

    const std::vector<Range>& ranges() const noexcept { return ranges_; }
    std::string describe() const;

private:
    std::vector<Range> ranges_;
};

/**
 * @brief Encoding options layered record/sum -> variant -> field -> sequence.
 *
 * Every member is optional; merge() lets an inner layer override what it sets
 * and inherit the rest.
 */
struct Metadata {
    std::optional<PrimitiveType> tagType;
    std::optional<bool> keepTag;
    std::optional<std::int64_t> keepDiff;   // accepted, has no effect on the wire
    std::optional<PrimitiveType> sizeType;
    std::optional<bool> byteSized;
    std::optional<ByteOrder> byteOrder;

    static Metadata sized(PrimitiveType type, bool countBytes = false) {
        Metadata m;
        m.sizeType = type;
        m.byteSized = countBytes;
        return m;
    }

    static Metadata ordered(ByteOrder order) {
        Metadata m;
        m.byteOrder = order;
        return m;
    }

    static Metadata keepingTag(std::optional<std::int64_t> diff = std::nullopt) {
        Metadata m;
        m.keepTag = true;
        m.keepDiff = diff;
        return m;
    }

    bool keepsTag() const { return keepTag.value_or(false); }
    bool countsBytes() const { return byteSized.value_or(false); }
};

Metadata merge(const Metadata& outer, const Metadata& inner);

} // namespace wirepod::schema
