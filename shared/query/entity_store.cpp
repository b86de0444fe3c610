#include "entity_store.hpp"

#include <algorithm>
#include <mutex>

#include <fmt/core.h>

#include "common/result_helper.hpp"
#include "logging/logging.hpp"

namespace query {

void EntityStore::define(const std::string& type, const std::string& label,
                         std::vector<std::string> fields) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto& e = entities_[type];
    e.label = label.empty() ? type : label;
    e.fields = std::move(fields);
}

Result<void> EntityStore::insert(const std::string& type, Json record) {
    if (!record.is_object())
        return Error(ResultCode::InvalidArgument, "entity record must be an object");

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = entities_.find(type);
    if (it == entities_.end())
        return Error(ResultCode::UnknownEntityType, fmt::format("Entity type '{}' does not exist.", type));

    auto& e = it->second;
    if (e.fields.empty()) {
        for (const auto& item : record.items()) e.fields.push_back(item.key());
    }
    e.records.push_back(std::move(record));
    return OK();
}

Result<size_t> EntityStore::purge(const std::string& type,
                                  const std::function<bool(const Json&)>& pred,
                                  bool dry_run) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = entities_.find(type);
    if (it == entities_.end()) {
        return Result<size_t>::Error(ResultCode::UnknownEntityType,
                                     fmt::format("Entity type '{}' does not exist.", type));
    }

    auto& records = it->second.records;
    auto matched = static_cast<size_t>(std::count_if(records.begin(), records.end(), pred));
    if (!dry_run) {
        records.erase(std::remove_if(records.begin(), records.end(), pred), records.end());
    }
    return Result<size_t>::OK(matched);
}

command::ChoiceList EntityStore::types() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    command::ChoiceList list;
    for (const auto& [type, e] : entities_) list.emplace_back(type, e.label);
    return list;
}

std::vector<std::string> EntityStore::fields(const std::string& type) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = entities_.find(type);
    return it == entities_.end() ? std::vector<std::string>{} : it->second.fields;
}

bool EntityStore::contains(const std::string& type) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entities_.count(type) > 0;
}

Result<std::vector<Json>> EntityStore::rows(const std::string& type) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = entities_.find(type);
    if (it == entities_.end()) {
        return Result<std::vector<Json>>::Error(ResultCode::UnknownEntityType,
                                                fmt::format("Entity type '{}' does not exist.", type));
    }
    return Result<std::vector<Json>>::OK(it->second.records);
}

size_t EntityStore::size(const std::string& type) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = entities_.find(type);
    return it == entities_.end() ? 0 : it->second.records.size();
}

// ---------------------------------------------------------------------------
// EntityFixtureLoader
// ---------------------------------------------------------------------------

Json EntityFixtureLoader::toJson(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            return nullptr;
        case YAML::NodeType::Sequence: {
            Json arr = Json::array();
            for (const auto& item : node) arr.push_back(toJson(item));
            return arr;
        }
        case YAML::NodeType::Map: {
            Json obj = Json::object();
            for (const auto& item : node) obj[item.first.as<std::string>()] = toJson(item.second);
            return obj;
        }
        case YAML::NodeType::Scalar:
            break;
    }

    // quoted scalars stay strings
    if (node.Tag() == "!") return node.Scalar();

    long long i = 0;
    if (YAML::convert<long long>::decode(node, i)) return i;
    double d = 0.0;
    if (YAML::convert<double>::decode(node, d)) return d;
    bool b = false;
    if (YAML::convert<bool>::decode(node, b)) return b;
    return node.Scalar();
}

Result<void> EntityFixtureLoader::loadFile(const std::string& path, EntityStore& store) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        LOG_ERROR(LOG_TAG, "failed to load entity fixture {}: {}", path, e.what());
        return Error(ResultCode::InvalidArgument, fmt::format("entity fixture {}: {}", path, e.what()));
    }
    return load(root, store);
}

Result<void> EntityFixtureLoader::load(const YAML::Node& root, EntityStore& store) {
    if (!root["entities"]) return OK();

    try {
        for (const auto& it : root["entities"]) {
            const auto type = it.first.as<std::string>();
            const auto& node = it.second;

            std::vector<std::string> fields;
            if (node["fields"]) fields = node["fields"].as<std::vector<std::string>>();
            store.define(type, node["label"].as<std::string>(type), std::move(fields));

            if (!node["records"]) continue;
            for (const auto& rec : node["records"]) {
                auto r = store.insert(type, toJson(rec));
                RETURN_IF_ERR_MSG(r, fmt::format("entity fixture record of {}", type));
            }
            LOG_DEBUG(LOG_TAG, "entity {} loaded ({} records)", type, store.size(type));
        }
    } catch (const YAML::Exception& e) {
        return Error(ResultCode::InvalidArgument, std::string("entity fixture: ") + e.what());
    }
    return OK();
}

} // namespace query
