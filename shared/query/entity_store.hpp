#pragma once
#include <functional>
#include <map>
#include <shared_mutex>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "command/command_def.hpp"
#include "common/result.h"
#include "query_types.hpp"

namespace query {

// Host-side knowledge of the queryable entity types.
class EntityTypeResolver {
public:
    virtual ~EntityTypeResolver() = default;

    // ordered key -> label, used to fill a Choice option
    virtual command::ChoiceList types() const = 0;
    virtual std::vector<std::string> fields(const std::string& type) const = 0;
    virtual bool contains(const std::string& type) const = 0;
};

class EntitySource : public EntityTypeResolver {
public:
    // snapshot of the records of one entity type
    virtual Result<std::vector<Json>> rows(const std::string& type) const = 0;
};

/**
 * In-memory entity records, one ordered JSON object per record.
 * Readers take a shared lock; define/insert/purge take it exclusively.
 */
class EntityStore : public EntitySource {
public:
    void define(const std::string& type, const std::string& label,
                std::vector<std::string> fields);

    Result<void> insert(const std::string& type, Json record);

    // Removes (or with dry_run only counts) the records matching pred.
    Result<size_t> purge(const std::string& type,
                         const std::function<bool(const Json&)>& pred,
                         bool dry_run);

    command::ChoiceList types() const override;
    std::vector<std::string> fields(const std::string& type) const override;
    bool contains(const std::string& type) const override;
    Result<std::vector<Json>> rows(const std::string& type) const override;

    size_t size(const std::string& type) const;

private:
    struct Entity {
        std::string label;
        std::vector<std::string> fields;
        std::vector<Json> records;
    };

    mutable std::shared_mutex mutex_;
    std::map<std::string, Entity> entities_;
};

/**
 * entities:
 *   User:
 *     label: Users            # optional
 *     fields: [id, name]      # optional, taken from the first record otherwise
 *     records:
 *       - { id: 1, name: Alice }
 */
class EntityFixtureLoader {
public:
    static Result<void> loadFile(const std::string& path, EntityStore& store);
    static Result<void> load(const YAML::Node& root, EntityStore& store);

    static Json toJson(const YAML::Node& node);

private:
    inline static constexpr const char* LOG_TAG = "EntityFixtureLoader";
};

} // namespace query
