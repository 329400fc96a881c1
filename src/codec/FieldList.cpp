#include "wirepod/codec/FieldList.hpp"

#include <utility>

namespace wirepod::codec {

using schema::Value;

Result<FieldList> FieldList::compile(const std::vector<schema::Field>& fields, const ResolveScope& scope) {
    FieldList list;
    list.entries_.reserve(fields.size());
    for (std::size_t i = 0; i < fields.size(); ++i) {
        const auto& field = fields[i];
        ResolveScope inner{schema::merge(scope.meta, field.meta), scope.order,
                           scope.path + "." + (field.name.empty() ? std::to_string(i) : field.name)};
        auto codec = resolveField(field.type, inner);
        if (!codec) return unexpected(std::move(codec.error()));
        list.entries_.push_back(Entry{std::move(*codec), field.publishSlot});
    }
    return std::move(list);
}

Result<std::size_t> FieldList::size(std::size_t index, const Value& value) const {
    return entries_[index].codec->size(value);
}

Result<void> FieldList::decode(std::size_t index, std::vector<Value>& out,
                               ReadCursor& in, Context& context) const {
    auto value = entries_[index].codec->decode(in, context);
    if (!value) return unexpected(std::move(value.error()));
    adopt(index, std::move(*value), out, context);
    return {};
}

Result<void> FieldList::encode(std::size_t index, const Value& value,
                               WriteCursor& out, Context& context) const {
    const auto& entry = entries_[index];
    if (!entry.publishSlot.empty()) {
        context.set(entry.publishSlot, value);
    }
    return entry.codec->encode(value, out, context);
}

void FieldList::adopt(std::size_t index, Value value, std::vector<Value>& out, Context& context) const {
    const auto& entry = entries_[index];
    if (!entry.publishSlot.empty()) {
        context.set(entry.publishSlot, value);
    }
    out.push_back(std::move(value));
}

} // namespace wirepod::codec
