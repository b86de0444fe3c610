#pragma once
#include <any>
#include <optional>
#include <string>

#include "common/result.h"
#include "command_def.hpp"

namespace command {

class CommandHelper {
public:
    // Base option pass: required keys first, then each key's rules in
    // declared order. The first failure wins.
    static Result<void, ValidationError> validate(const OptionValues& values,
                                                  const OptionSchema& schema);

    // absent, empty string or false
    static bool isEmpty(const std::any& value);
    static bool isEmpty(const OptionValues& values, const std::string& key);

    static std::optional<double> asNumber(const std::any& value);
    static std::string asText(const std::any& value);
    static bool asBool(const std::any& value);

    // Keeps only schema keys, filling absent ones from defaults.
    static OptionValues collect(const OptionValues& values, const OptionSchema& schema);

    template<typename T>
    static T get(const OptionValues& values, const std::string& key) {
        return std::any_cast<T>(values.at(key));
    }

    template<typename T>
    static T getOr(const OptionValues& values, const std::string& key, const T& defaultValue) {
        auto it = values.find(key);
        if (it == values.end() || !it->second.has_value()) return defaultValue;
        if (it->second.type() != typeid(T)) return defaultValue;
        return std::any_cast<T>(it->second);
    }

private:
    static Result<void, ValidationError> applyRule(const std::string& key,
                                                   const std::any& value,
                                                   const Rule& rule);
    static Result<void, ValidationError> checkChoice(const std::string& key,
                                                     const OptionSpec& spec,
                                                     const std::any& value);
};

} // namespace command
