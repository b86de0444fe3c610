#include "message_codec.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>

namespace message {

json toJson(const Values& values) {
    json j = json::object();

    for (const auto& [key, val] : values) {
        if (!val.has_value()) {
            j[key] = nullptr;
        }
        else if (val.type() == typeid(int)) {
            j[key] = std::any_cast<int>(val);
        }
        else if (val.type() == typeid(int64_t)) {
            j[key] = std::any_cast<int64_t>(val);
        }
        else if (val.type() == typeid(long long)) {
            j[key] = std::any_cast<long long>(val);
        }
        else if (val.type() == typeid(double)) {
            j[key] = std::any_cast<double>(val);
        }
        else if (val.type() == typeid(bool)) {
            j[key] = std::any_cast<bool>(val);
        }
        else if (val.type() == typeid(std::string)) {
            j[key] = std::any_cast<std::string>(val);
        }
        else if (val.type() == typeid(const char*)) {
            j[key] = std::string(std::any_cast<const char*>(val));
        }
        else {
            throw std::runtime_error("Unsupported type in message::Values (" + key + ")");
        }
    }

    return j;
}

Values fromJson(const json& object) {
    Values values;
    if (!object.is_object()) return values;

    for (const auto& [key, val] : object.items()) {
        if (val.is_number_integer()) {
            values[key] = val.get<int64_t>();
        }
        else if (val.is_number_float()) {
            values[key] = val.get<double>();
        }
        else if (val.is_boolean()) {
            values[key] = val.get<bool>();
        }
        else if (val.is_string()) {
            values[key] = val.get<std::string>();
        }
        else if (val.is_structured()) {
            values[key] = val.dump();
        }
        // null: absent
    }

    return values;
}

} // namespace message
