#include "wirepod/schema/Primitive.hpp"

#include <limits>
#include <type_traits>

namespace wirepod::schema {

const char* toString(PrimitiveType type) noexcept {
    switch (type) {
        case PrimitiveType::Bool: return "bool";
        case PrimitiveType::I8:   return "i8";
        case PrimitiveType::I16:  return "i16";
        case PrimitiveType::I32:  return "i32";
        case PrimitiveType::I64:  return "i64";
        case PrimitiveType::I128: return "i128";
        case PrimitiveType::U8:   return "u8";
        case PrimitiveType::U16:  return "u16";
        case PrimitiveType::U32:  return "u32";
        case PrimitiveType::U64:  return "u64";
        case PrimitiveType::U128: return "u128";
        case PrimitiveType::F32:  return "f32";
        case PrimitiveType::F64:  return "f64";
    }
    return "unknown";
}

std::optional<std::uint64_t> scalarBits(const Scalar& value) noexcept {
    return std::visit([](auto v) -> std::optional<std::uint64_t> {
        using T = decltype(v);
        if constexpr (std::is_same_v<T, bool>) {
            return v ? 1u : 0u;
        } else if constexpr (std::is_integral_v<T> && std::is_signed_v<T>) {
            return static_cast<std::uint64_t>(static_cast<std::int64_t>(v));
        } else if constexpr (std::is_integral_v<T>) {
            return static_cast<std::uint64_t>(v);
        } else {
            return std::nullopt;
        }
    }, value);
}

namespace {

template <typename T>
bool inRange(std::uint64_t bits) noexcept {
    if constexpr (std::is_signed_v<T>) {
        const auto v = static_cast<std::int64_t>(bits);
        return v >= std::numeric_limits<T>::min() && v <= std::numeric_limits<T>::max();
    } else {
        return bits <= std::numeric_limits<T>::max();
    }
}

template <typename T>
std::optional<Scalar> narrow(std::uint64_t bits) noexcept {
    if (!inRange<T>(bits)) {
        return std::nullopt;
    }
    if constexpr (std::is_signed_v<T>) {
        return Scalar(static_cast<T>(static_cast<std::int64_t>(bits)));
    } else {
        return Scalar(static_cast<T>(bits));
    }
}

} // namespace

bool fitsIn(PrimitiveType type, std::uint64_t bits) noexcept {
    return makeScalar(type, bits).has_value();
}

std::optional<Scalar> makeScalar(PrimitiveType type, std::uint64_t bits) noexcept {
    switch (type) {
        case PrimitiveType::Bool:
            if (bits > 1) return std::nullopt;
            return Scalar(bits == 1);
        case PrimitiveType::I8:  return narrow<std::int8_t>(bits);
        case PrimitiveType::I16: return narrow<std::int16_t>(bits);
        case PrimitiveType::I32: return narrow<std::int32_t>(bits);
        case PrimitiveType::I64: return narrow<std::int64_t>(bits);
        case PrimitiveType::U8:  return narrow<std::uint8_t>(bits);
        case PrimitiveType::U16: return narrow<std::uint16_t>(bits);
        case PrimitiveType::U32: return narrow<std::uint32_t>(bits);
        case PrimitiveType::U64: return narrow<std::uint64_t>(bits);
        default:
            return std::nullopt;
    }
}

} // namespace wirepod::schema
