#pragma once

#include "wirepod/core/Error.hpp"
#include "wirepod/schema/Schema.hpp"

#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace wirepod::schema {

/**
 * @brief Maps type names to their schemas.
 *
 * Filled once at registration time (by hand or by a generator) and then only
 * read. Thread-safe.
 */
class Registry {
public:
    Registry() = default;
    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    // Registers @p schema under its name; a second schema with the same name is a schema error.
    Result<void> add(SchemaPtr schema);

    // Registers the outcome of a builder, passing a build failure through.
    Result<SchemaPtr> add(const Result<SchemaPtr>& built);

    SchemaPtr find(std::string_view name) const;
    bool contains(std::string_view name) const { return find(name) != nullptr; }
    std::vector<std::string> names() const;
    std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, SchemaPtr, std::less<>> schemas_;
};

} // namespace wirepod::schema
