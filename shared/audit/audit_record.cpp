#include "audit_record.hpp"

#include "output/output_formatter.hpp"

namespace audit {

nlohmann::ordered_json AuditRecord::toJson() const {
    nlohmann::ordered_json j;
    j["command"] = command;
    j["options"] = options;
    j["user"] = user;
    j["exit_code"] = exit_code;
    j["output"] = output;
    j["elapsed_seconds"] = elapsed_seconds;
    j["environment"] = environment;
    j["started_at"] = output::OutputFormatter::formatTimestamp(started_at);
    j["completed_at"] = output::OutputFormatter::formatTimestamp(completed_at);
    return j;
}

} // namespace audit
