#include "wirepod/codec/Context.hpp"

#include <utility>

namespace wirepod::codec {

void Context::set(std::string slot, schema::Value value) {
    auto it = slots_.find(slot);
    if (it != slots_.end()) {
        it->second = std::move(value);
        return;
    }
    slots_.emplace(std::move(slot), std::move(value));
}

const schema::Value* Context::find(std::string_view slot) const {
    auto it = slots_.find(slot);
    return it == slots_.end() ? nullptr : &it->second;
}

bool Context::erase(std::string_view slot) {
    auto it = slots_.find(slot);
    if (it == slots_.end()) {
        return false;
    }
    slots_.erase(it);
    return true;
}

} // namespace wirepod::codec
