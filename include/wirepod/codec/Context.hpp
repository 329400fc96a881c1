#pragma once

#include "wirepod/schema/Value.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <string_view>

namespace wirepod::codec {

/**
 * @brief Caller-owned ambient state threaded through one decode or encode.
 *
 * Holds named slots. Codecs only write to it from context fields, publishing
 * fields, and custom codecs that choose to.
 */
class Context {
public:
    Context() = default;

    void set(std::string slot, schema::Value value);
    const schema::Value* find(std::string_view slot) const;
    bool contains(std::string_view slot) const { return find(slot) != nullptr; }
    bool erase(std::string_view slot);
    void clear() { slots_.clear(); }
    std::size_t size() const { return slots_.size(); }

private:
    std::map<std::string, schema::Value, std::less<>> slots_;
};

} // namespace wirepod::codec
