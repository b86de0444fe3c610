#pragma once
#include <chrono>
#include <string>

#include <nlohmann/json.hpp>

namespace audit {

// One attempted execution, handed to the persistence side as-is.
struct AuditRecord {
    std::string command;
    nlohmann::ordered_json options = nlohmann::ordered_json::object();
    std::string user;
    int exit_code = 0;
    std::string output;
    double elapsed_seconds = 0.0;
    std::string environment;
    std::chrono::system_clock::time_point started_at;
    std::chrono::system_clock::time_point completed_at;

    nlohmann::ordered_json toJson() const;
};

} // namespace audit
