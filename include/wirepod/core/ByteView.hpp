#pragma once

#include <cstddef>
#include <cstdint>

namespace wirepod {

// Minimal read-only byte slice (stand-in for std::span<const std::uint8_t>)
struct ByteView {
    const std::uint8_t* ptr = nullptr;
    std::size_t len = 0;

    ByteView() = default;
    ByteView(const std::uint8_t* p, std::size_t n) : ptr(p), len(n) {}

    template<class Container>
    explicit ByteView(const Container& c)
    : ptr(reinterpret_cast<const std::uint8_t*>(c.data())), len(c.size()) {}

    std::size_t size() const { return len; }
    bool empty() const { return len == 0; }
    const std::uint8_t* data() const { return ptr; }
    const std::uint8_t& operator[](std::size_t i) const { return ptr[i]; }

    ByteView subspan(std::size_t n) const {
        if (n > len) return {};
        return ByteView(ptr + n, len - n);
    }
};

} // namespace wirepod
