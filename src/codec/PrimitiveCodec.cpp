#include "wirepod/codec/PrimitiveCodec.hpp"

#include <algorithm>
#include <array>
#include <cstring>
#include <string>
#include <type_traits>

namespace wirepod::codec {

using schema::Int128;
using schema::PrimitiveType;
using schema::Scalar;
using schema::UInt128;

namespace {

constexpr std::size_t kMaxWidth = 16;
using Raw = std::array<std::uint8_t, kMaxWidth>;

std::uint64_t loadLittle(const std::uint8_t* p, std::size_t n) {
    std::uint64_t v = 0;
    for (std::size_t i = 0; i < n; ++i) {
        v |= static_cast<std::uint64_t>(p[i]) << (8 * i);
    }
    return v;
}

void storeLittle(std::uint64_t v, std::uint8_t* p, std::size_t n) {
    for (std::size_t i = 0; i < n; ++i) {
        p[i] = static_cast<std::uint8_t>((v >> (8 * i)) & 0xFF);
    }
}

// Wire bytes are normalised to little-endian before decoding and produced
// little-endian before writing; big-endian simply reverses the window.
bool needsSwap(ByteOrder order) {
    return concreteOrder(order) == ByteOrder::Big;
}

template <typename T>
T fromLow(const std::uint8_t* p) {
    const std::uint64_t bits = loadLittle(p, sizeof(T));
    if constexpr (std::is_same_v<T, float>) {
        const auto narrowBits = static_cast<std::uint32_t>(bits);
        float f;
        std::memcpy(&f, &narrowBits, sizeof f);
        return f;
    } else if constexpr (std::is_same_v<T, double>) {
        double d;
        std::memcpy(&d, &bits, sizeof d);
        return d;
    } else {
        return static_cast<T>(bits);
    }
}

Scalar decodeRaw(PrimitiveType type, const std::uint8_t* p) {
    switch (type) {
        case PrimitiveType::Bool: return Scalar(p[0] != 0);
        case PrimitiveType::I8:   return Scalar(fromLow<std::int8_t>(p));
        case PrimitiveType::I16:  return Scalar(fromLow<std::int16_t>(p));
        case PrimitiveType::I32:  return Scalar(fromLow<std::int32_t>(p));
        case PrimitiveType::I64:  return Scalar(fromLow<std::int64_t>(p));
        case PrimitiveType::I128: return Scalar(Int128{loadLittle(p + 8, 8), loadLittle(p, 8)});
        case PrimitiveType::U8:   return Scalar(fromLow<std::uint8_t>(p));
        case PrimitiveType::U16:  return Scalar(fromLow<std::uint16_t>(p));
        case PrimitiveType::U32:  return Scalar(fromLow<std::uint32_t>(p));
        case PrimitiveType::U64:  return Scalar(fromLow<std::uint64_t>(p));
        case PrimitiveType::U128: return Scalar(UInt128{loadLittle(p + 8, 8), loadLittle(p, 8)});
        case PrimitiveType::F32:  return Scalar(fromLow<float>(p));
        case PrimitiveType::F64:  return Scalar(fromLow<double>(p));
    }
    return Scalar(false);
}

void encodeRaw(const Scalar& value, std::uint8_t* p) {
    std::visit([p](auto v) {
        using T = decltype(v);
        if constexpr (std::is_same_v<T, bool>) {
            p[0] = v ? 1 : 0;
        } else if constexpr (std::is_same_v<T, Int128> || std::is_same_v<T, UInt128>) {
            storeLittle(v.low, p, 8);
            storeLittle(v.high, p + 8, 8);
        } else if constexpr (std::is_same_v<T, float>) {
            std::uint32_t bits;
            std::memcpy(&bits, &v, sizeof bits);
            storeLittle(bits, p, sizeof bits);
        } else if constexpr (std::is_same_v<T, double>) {
            std::uint64_t bits;
            std::memcpy(&bits, &v, sizeof bits);
            storeLittle(bits, p, sizeof bits);
        } else {
            storeLittle(static_cast<std::uint64_t>(v), p, sizeof(T));
        }
    }, value);
}

} // namespace

Result<Scalar> readPrimitive(ReadCursor& in, PrimitiveType type, ByteOrder order, std::string_view where) {
    const std::size_t width = schema::primitiveSize(type);
    Raw raw{};
    if (auto ec = in.read(raw.data(), width)) {
        return makeError(ec, std::string(where),
                         std::string("reading ") + schema::toString(type) + " at offset "
                             + std::to_string(in.position()));
    }
    if (width > 1 && needsSwap(order)) {
        std::reverse(raw.begin(), raw.begin() + width);
    }
    return decodeRaw(type, raw.data());
}

Result<void> writePrimitive(WriteCursor& out, PrimitiveType type, const Scalar& value,
                            ByteOrder order, std::string_view where) {
    if (schema::scalarType(value) != type) {
        return makeError(Errc::value_mismatch, std::string(where),
                         std::string("expected ") + schema::toString(type) + ", got "
                             + schema::toString(schema::scalarType(value)));
    }
    const std::size_t width = schema::primitiveSize(type);
    Raw raw{};
    encodeRaw(value, raw.data());
    if (width > 1 && needsSwap(order)) {
        std::reverse(raw.begin(), raw.begin() + width);
    }
    if (auto ec = out.write(raw.data(), width)) {
        return makeError(ec, std::string(where),
                         std::string("writing ") + schema::toString(type) + " at offset "
                             + std::to_string(out.position()));
    }
    return {};
}

Result<std::uint64_t> readBits(ReadCursor& in, PrimitiveType type, ByteOrder order, std::string_view where) {
    auto scalar = readPrimitive(in, type, order, where);
    if (!scalar) {
        return unexpected(std::move(scalar.error()));
    }
    auto bits = schema::scalarBits(*scalar);
    if (!bits) {
        return makeError(Errc::schema_error, std::string(where),
                         std::string(schema::toString(type)) + " cannot carry a tag or length");
    }
    return *bits;
}

Result<void> writeBits(WriteCursor& out, PrimitiveType type, std::uint64_t bits,
                       ByteOrder order, std::string_view where) {
    auto scalar = schema::makeScalar(type, bits);
    if (!scalar) {
        return makeError(Errc::length_overflow, std::string(where),
                         std::to_string(bits) + " does not fit " + schema::toString(type));
    }
    return writePrimitive(out, type, *scalar, order, where);
}

} // namespace wirepod::codec
