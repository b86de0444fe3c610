#pragma once

#include <any>
#include <string>
#include <unordered_map>


namespace message {

// Option values as handed in by the request layer: std::string, bool,
// int64_t, int or double.
using Values = std::unordered_map<std::string, std::any>;

} // namespace message
