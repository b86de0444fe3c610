#include "bus_audit_sink.hpp"

#include "logging/logging.hpp"

namespace audit {

Result<void> BusAuditSink::emit(const AuditRecord& record) {
    const auto payload = record.toJson().dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
    auto r = bus_.publish(topic_, payload);
    if (!r) {
        LOGW("audit record for {} not published: {}", record.command, to_string(r));
        return r;
    }
    LOGD("audit record for {} published ({} bytes)", record.command, payload.size());
    return OK();
}

} // namespace audit
