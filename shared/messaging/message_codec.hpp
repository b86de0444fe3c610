#pragma once
#include <nlohmann/json.hpp>

#include "common/message.hpp"

namespace message {

using json = nlohmann::ordered_json;

// std::string, bool, int, int64_t, long long, double; anything else throws std::runtime_error
json toJson(const Values& values);

// scalars only; nested arrays and objects are kept as their JSON text
Values fromJson(const json& object);

} // namespace message
