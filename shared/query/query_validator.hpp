#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "common/result.h"
#include "query_types.hpp"

namespace query {

struct QueryValidationResult {
    bool accepted = false;
    std::optional<std::string> rejected_verb;
    std::optional<std::string> rejected_pattern;
    ResultCode code = ResultCode::OK;
    std::string message;

    static QueryValidationResult accept() {
        QueryValidationResult r;
        r.accepted = true;
        return r;
    }
    static QueryValidationResult disallowedVerb(const std::string& verb);
    static QueryValidationResult disallowedPattern(const std::string& pattern);
    static QueryValidationResult malformed(const std::string& reason);

    explicit operator bool() const noexcept { return accepted; }
};

/**
 * Gate between an untrusted expression and the interpreter.
 *
 * Three passes, all required, no state kept between calls:
 *   1. every lexed call verb must be on the read-only allowlist
 *   2. the raw string must not match any denylist pattern
 *   3. the string must parse as a method chain
 */
class QueryValidator {
public:
    static constexpr size_t kMaxExpressionLength = 4096;

    static QueryValidationResult check(std::string_view expression);

    // check() plus the parsed chain; the chain returned is the one that was checked.
    static Result<QueryChain> parse(std::string_view expression);

    static bool isAllowedVerb(std::string_view verb);

    static const std::vector<std::string>& allowedVerbs();
    static const std::vector<std::string>& deniedPatterns();

private:
    static QueryValidationResult checkImpl(std::string_view expression, QueryChain* chain);
};

} // namespace query
