#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <variant>

namespace wirepod::schema {

// Order matches the alternatives of Scalar so that scalarType() is an index cast.
enum class PrimitiveType : std::uint8_t {
    Bool,
    I8, I16, I32, I64, I128,
    U8, U16, U32, U64, U128,
    F32, F64
};

// 128-bit integers travel as two 64-bit halves (two's complement for Int128).
struct Int128 {
    std::uint64_t high = 0;
    std::uint64_t low = 0;
};

struct UInt128 {
    std::uint64_t high = 0;
    std::uint64_t low = 0;
};

inline bool operator==(const Int128& a, const Int128& b) { return a.high == b.high && a.low == b.low; }
inline bool operator!=(const Int128& a, const Int128& b) { return !(a == b); }
inline bool operator==(const UInt128& a, const UInt128& b) { return a.high == b.high && a.low == b.low; }
inline bool operator!=(const UInt128& a, const UInt128& b) { return !(a == b); }

using Scalar = std::variant<bool,
                            std::int8_t, std::int16_t, std::int32_t, std::int64_t, Int128,
                            std::uint8_t, std::uint16_t, std::uint32_t, std::uint64_t, UInt128,
                            float, double>;

constexpr std::size_t primitiveSize(PrimitiveType type) noexcept {
    switch (type) {
        case PrimitiveType::Bool: return 1;
        case PrimitiveType::I8:   return 1;
        case PrimitiveType::I16:  return 2;
        case PrimitiveType::I32:  return 4;
        case PrimitiveType::I64:  return 8;
        case PrimitiveType::I128: return 16;
        case PrimitiveType::U8:   return 1;
        case PrimitiveType::U16:  return 2;
        case PrimitiveType::U32:  return 4;
        case PrimitiveType::U64:  return 8;
        case PrimitiveType::U128: return 16;
        case PrimitiveType::F32:  return 4;
        case PrimitiveType::F64:  return 8;
    }
    return 0;
}

constexpr bool isSigned(PrimitiveType type) noexcept {
    switch (type) {
        case PrimitiveType::I8:
        case PrimitiveType::I16:
        case PrimitiveType::I32:
        case PrimitiveType::I64:
        case PrimitiveType::I128:
            return true;
        default:
            return false;
    }
}

// Integer types of at most 64 bits: the only types allowed as length prefixes.
constexpr bool isNarrowInteger(PrimitiveType type) noexcept {
    switch (type) {
        case PrimitiveType::I8:
        case PrimitiveType::I16:
        case PrimitiveType::I32:
        case PrimitiveType::I64:
        case PrimitiveType::U8:
        case PrimitiveType::U16:
        case PrimitiveType::U32:
        case PrimitiveType::U64:
            return true;
        default:
            return false;
    }
}

// Discriminants may additionally be bool.
constexpr bool isTagCapable(PrimitiveType type) noexcept {
    return type == PrimitiveType::Bool || isNarrowInteger(type);
}

const char* toString(PrimitiveType type) noexcept;

inline PrimitiveType scalarType(const Scalar& value) noexcept {
    return static_cast<PrimitiveType>(value.index());
}

// Bit pattern of a bool or narrow integer, sign-extended for signed types.
std::optional<std::uint64_t> scalarBits(const Scalar& value) noexcept;

// True when @p bits (interpreted per the signedness of @p type) is representable by @p type.
bool fitsIn(PrimitiveType type, std::uint64_t bits) noexcept;

// Builds a scalar of a bool / narrow integer type from a bit pattern. Returns
// nullopt for other types or when the value is out of range.
std::optional<Scalar> makeScalar(PrimitiveType type, std::uint64_t bits) noexcept;

} // namespace wirepod::schema
