#pragma once
#include <string>

#include "audit_sink.hpp"
#include "messaging/message_bus.hpp"

namespace audit {

// Publishes each record as JSON under `topic` on the message bus.
class BusAuditSink : public AuditSink {
public:
    explicit BusAuditSink(messaging::MessageBus& bus, std::string topic = "command.executed")
        : bus_(bus), topic_(std::move(topic)) {}

    Result<void> emit(const AuditRecord& record) override;

private:
    messaging::MessageBus& bus_;
    const std::string topic_;

    inline static constexpr const char* LOG_TAG = "Audit";
};

} // namespace audit
