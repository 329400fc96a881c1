#pragma once

#include <cstdint>
#include <cstring>

namespace wirepod {

enum class ByteOrder : std::uint8_t { Big, Little, Native };

inline bool hostIsLittleEndian() noexcept {
    const std::uint16_t probe = 0x0102;
    std::uint8_t first = 0;
    std::memcpy(&first, &probe, 1);
    return first == 0x02;
}

// Native resolves to the host order; Big and Little are returned unchanged.
inline ByteOrder concreteOrder(ByteOrder order) noexcept {
    if (order != ByteOrder::Native) {
        return order;
    }
    return hostIsLittleEndian() ? ByteOrder::Little : ByteOrder::Big;
}

inline const char* toString(ByteOrder order) noexcept {
    switch (order) {
        case ByteOrder::Big:    return "big";
        case ByteOrder::Little: return "little";
        case ByteOrder::Native: return "native";
    }
    return "unknown";
}

} // namespace wirepod
