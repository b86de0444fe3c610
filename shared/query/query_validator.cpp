#include "query_validator.hpp"

#include <algorithm>
#include <regex>

#include <fmt/core.h>

#include "common/string_helper.hpp"
#include "query_lexer.hpp"
#include "query_parser.hpp"

namespace query {

namespace {

// read-only operations understood by the interpreter
const std::vector<std::string> kAllowedVerbs = {
    // filtering
    "where", "orWhere", "whereIn", "whereNotIn", "whereBetween", "whereNotBetween",
    "whereNull", "whereNotNull", "whereDate", "whereMonth", "whereYear", "whereTime",
    "whereColumn",
    // ordering / limiting
    "orderBy", "orderByDesc", "latest", "oldest", "limit", "offset", "skip", "take",
    // projection / grouping
    "select", "addSelect", "distinct", "groupBy", "having",
    // termination
    "get", "first", "find", "findOrFail", "sole", "pluck", "value", "lazy",
    "paginate", "simplePaginate", "toArray", "toJson",
    // aggregation
    "count", "max", "min", "avg", "sum", "exists", "doesntExist",
};

struct DeniedPattern {
    std::string text;
    std::regex re;
};

DeniedPattern deny(const std::string& text, const std::string& expr) {
    return {text, std::regex(expr, std::regex::ECMAScript | std::regex::icase)};
}

// mutation, schema change, raw statement / connection access,
// variable interpolation and process execution
const std::vector<DeniedPattern>& patterns() {
    static const std::vector<DeniedPattern> list = {
        deny("save(",         R"(save\s*\()"),
        deny("create(",       R"(create\s*\()"),
        deny("update(",       R"(update\s*\()"),
        deny("delete(",       R"(delete\s*\()"),
        deny("destroy(",      R"(destroy\s*\()"),
        deny("forceDelete(",  R"(forceDelete\s*\()"),
        deny("insert(",       R"(insert\s*\()"),
        deny("truncate(",     R"(truncate\s*\()"),
        deny("exec(",         R"(exec\s*\()"),
        deny("query(",        R"(query\s*\()"),
        deny("statement(",    R"(statement\s*\()"),
        deny("dropIfExists(", R"(dropIfExists\s*\()"),
        deny("drop(",         R"(drop\s*\()"),
        deny("alter(",        R"(alter\s*\()"),
        deny("schema::",      R"(schema\s*::)"),
        deny("DB::",          R"(DB\s*::)"),
        deny("$_",            R"(\$_)"),
        deny("eval(",         R"(eval\s*\()"),
        deny("assert(",       R"(assert\s*\()"),
        deny("system(",       R"(system\s*\()"),
        deny("passthru(",     R"(passthru\s*\()"),
        deny("shell_exec(",   R"(shell_exec\s*\()"),
        deny("proc_open(",    R"(proc_open\s*\()"),
    };
    return list;
}

} // namespace

QueryValidationResult QueryValidationResult::disallowedVerb(const std::string& verb) {
    QueryValidationResult r;
    r.code = ResultCode::DisallowedVerb;
    r.rejected_verb = verb;
    r.message = fmt::format("Method '{}' is not allowed. Only read-only query methods are permitted.", verb);
    return r;
}

QueryValidationResult QueryValidationResult::disallowedPattern(const std::string& pattern) {
    QueryValidationResult r;
    r.code = ResultCode::DisallowedPattern;
    r.rejected_pattern = pattern;
    r.message = fmt::format("Query contains a disallowed operation ({}). Only read-only queries are allowed.",
                            pattern);
    return r;
}

QueryValidationResult QueryValidationResult::malformed(const std::string& reason) {
    QueryValidationResult r;
    r.code = ResultCode::MalformedQuery;
    r.message = "Query could not be parsed: " + reason;
    return r;
}

const std::vector<std::string>& QueryValidator::allowedVerbs() {
    return kAllowedVerbs;
}

const std::vector<std::string>& QueryValidator::deniedPatterns() {
    static const std::vector<std::string> texts = [] {
        std::vector<std::string> out;
        for (const auto& p : patterns()) out.push_back(p.text);
        return out;
    }();
    return texts;
}

bool QueryValidator::isAllowedVerb(std::string_view verb) {
    auto lower = toLower(verb);
    return std::any_of(kAllowedVerbs.begin(), kAllowedVerbs.end(),
                       [&lower](const std::string& v) { return toLower(v) == lower; });
}

QueryValidationResult QueryValidator::check(std::string_view expression) {
    return checkImpl(expression, nullptr);
}

Result<QueryChain> QueryValidator::parse(std::string_view expression) {
    QueryChain chain;
    auto r = checkImpl(expression, &chain);
    if (!r) return Result<QueryChain>::Error(r.code, r.message);
    return Result<QueryChain>::OK(std::move(chain));
}

QueryValidationResult QueryValidator::checkImpl(std::string_view expression, QueryChain* chain) {
    if (expression.size() > kMaxExpressionLength) {
        return QueryValidationResult::malformed(
            fmt::format("expression longer than {} characters", kMaxExpressionLength));
    }

    auto tokens = QueryLexer::tokenize(expression);

    // allowlist
    if (tokens) {
        for (const auto& verb : QueryLexer::callVerbs(tokens.value())) {
            if (!isAllowedVerb(verb)) return QueryValidationResult::disallowedVerb(verb);
        }
    }

    // denylist, on the raw text including string literals
    const std::string raw(expression);
    for (const auto& p : patterns()) {
        if (std::regex_search(raw, p.re)) return QueryValidationResult::disallowedPattern(p.text);
    }

    if (!tokens) return QueryValidationResult::malformed(tokens.error().value_or("lexer error"));

    auto parsed = QueryParser::parse(tokens.value());
    if (!parsed) return QueryValidationResult::malformed(parsed.error().value_or("parse error"));

    if (chain) *chain = std::move(parsed.value());
    return QueryValidationResult::accept();
}

} // namespace query
