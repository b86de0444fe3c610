#pragma once
#include <mutex>
#include <vector>

#include "common/result.h"
#include "audit_record.hpp"

namespace audit {

class AuditSink {
public:
    virtual ~AuditSink() = default;
    virtual Result<void> emit(const AuditRecord& record) = 0;
};

// Writes one summary line per record to the "Audit" log tag.
class LogAuditSink : public AuditSink {
public:
    Result<void> emit(const AuditRecord& record) override;

private:
    inline static constexpr const char* LOG_TAG = "Audit";
};

// Keeps records in memory.
class MemoryAuditSink : public AuditSink {
public:
    Result<void> emit(const AuditRecord& record) override {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.push_back(record);
        return OK();
    }

    std::vector<AuditRecord> records() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<AuditRecord> records_;
};

} // namespace audit
