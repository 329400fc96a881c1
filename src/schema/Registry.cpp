#include "wirepod/schema/Registry.hpp"

#include "wirepod/log/Log.hpp"

namespace wirepod::schema {

Result<void> Registry::add(SchemaPtr schema) {
    if (!schema) {
        logError("[Registry] refusing null schema\n");
        return makeError(Errc::schema_error, "<registry>", "null schema");
    }
    std::lock_guard lock(mutex_);
    auto [it, inserted] = schemas_.emplace(schema->name(), schema);
    if (!inserted) {
        logError("[Registry] duplicate schema '", schema->name(), "'\n");
        return makeError(Errc::schema_error, schema->name(), "schema already registered");
    }
    logInfo("[Registry] registered ", schema->name(), " (",
            schema->shape() == Schema::Shape::Record ? "record" : "sum", ")\n");
    return {};
}

Result<SchemaPtr> Registry::add(const Result<SchemaPtr>& built) {
    if (!built) {
        return unexpected(built.error());
    }
    auto ok = add(*built);
    if (!ok) {
        return unexpected(ok.error());
    }
    return *built;
}

SchemaPtr Registry::find(std::string_view name) const {
    std::lock_guard lock(mutex_);
    auto it = schemas_.find(name);
    return it == schemas_.end() ? nullptr : it->second;
}

std::vector<std::string> Registry::names() const {
    std::lock_guard lock(mutex_);
    std::vector<std::string> out;
    out.reserve(schemas_.size());
    for (const auto& entry : schemas_) {
        out.push_back(entry.first);
    }
    return out;
}

std::size_t Registry::size() const {
    std::lock_guard lock(mutex_);
    return schemas_.size();
}

} // namespace wirepod::schema
