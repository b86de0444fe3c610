#include "audit_sink.hpp"

#include "logging/logging.hpp"

namespace audit {

Result<void> LogAuditSink::emit(const AuditRecord& record) {
    LOGI("{} by {} in {}: exit={} elapsed={:.3f}s options={}",
         record.command, record.user.empty() ? "CLI" : record.user, record.environment,
         record.exit_code, record.elapsed_seconds, record.options.dump());
    return OK();
}

} // namespace audit
