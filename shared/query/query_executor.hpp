#pragma once
#include <string>
#include <string_view>

#include "common/result.h"
#include "entity_store.hpp"
#include "query_types.hpp"

namespace query {

struct ExecutionOutcome {
    bool ok = false;
    Json value;                 // scalar, object or array of records
    double elapsed_seconds = 0.0;
    std::string error_message;
    ResultCode code = ResultCode::OK;

    int exitCode() const noexcept { return ok ? 0 : 1; }
};

/**
 * Runs a method-chain expression against one entity type.
 *
 * The expression is re-checked by QueryValidator on every call and the
 * checked chain is what gets interpreted. Errors never escape run(): they
 * come back as a failed ExecutionOutcome carrying the elapsed time.
 */
class QueryExecutor {
public:
    explicit QueryExecutor(const EntitySource& source) : source_(source) {}

    ExecutionOutcome run(const std::string& entity_type, std::string_view expression) const;

    // Interprets an already checked chain over the given records.
    // Throws EvaluationError.
    static Json evaluate(const std::string& entity_type, std::vector<Json> records,
                         const QueryChain& chain);

private:
    inline static constexpr const char* LOG_TAG = "QueryExecutor";

    const EntitySource& source_;
};

} // namespace query
