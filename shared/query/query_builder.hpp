#pragma once
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "query_types.hpp"

namespace query {

enum class DatePart {
    Date,   // YYYY-MM-DD
    Month,
    Year,
    Time    // HH:MM:SS
};

/**
 * Read-only query over a snapshot of entity records.
 *
 * Clauses accumulate the way a SQL builder does and are applied in SQL order
 * when the query is materialised:
 *   where -> group by -> having -> order by -> select -> distinct -> offset/limit
 * AND binds tighter than OR.
 *
 * Invalid operators or argument types raise EvaluationError.
 */
class QueryBuilder {
public:
    explicit QueryBuilder(std::vector<Json> records);

    // where(column, value) / where(column, op, value)
    QueryBuilder& where(const std::string& column, const std::string& op, const Json& value,
                        bool or_connective = false);
    QueryBuilder& whereIn(const std::string& column, const Json& values, bool negate = false);
    QueryBuilder& whereBetween(const std::string& column, const Json& low, const Json& high,
                               bool negate = false);
    QueryBuilder& whereNull(const std::string& column, bool negate = false);
    QueryBuilder& whereDatePart(const std::string& column, DatePart part,
                                const std::string& op, const Json& value);
    QueryBuilder& whereColumn(const std::string& first, const std::string& op,
                              const std::string& second);

    QueryBuilder& orderBy(const std::string& column, bool descending = false);
    QueryBuilder& limit(long long count);
    QueryBuilder& offset(long long count);
    QueryBuilder& select(const std::vector<std::string>& columns);
    QueryBuilder& addSelect(const std::vector<std::string>& columns);
    QueryBuilder& distinct();
    QueryBuilder& groupBy(const std::vector<std::string>& columns);
    QueryBuilder& having(const std::string& column, const std::string& op, const Json& value);

    // ---------------------------------------------------------------------
    // terminals
    // ---------------------------------------------------------------------
    std::vector<Json> get() const;
    std::optional<Json> first() const;

    // column values of the windowed result, or an object keyed by key_column
    Json pluck(const std::string& column, const std::optional<std::string>& key_column) const;

    // aggregates ignore offset/limit
    size_t count() const;
    Json max(const std::string& column) const;
    Json min(const std::string& column) const;
    Json sum(const std::string& column) const;
    Json avg(const std::string& column) const;

    // page is 1-based; rows outside the window are counted in total
    size_t total() const { return count(); }
    std::vector<Json> page(long long per_page, long long page) const;

    static bool isOperator(const std::string& op);

    // SQL LIKE, case-insensitive, % and _ wildcards
    static bool like(const std::string& text, const std::string& pattern);

    // nullopt when the two values cannot be ordered (null, object, mixed types)
    static std::optional<int> compare(const Json& a, const Json& b);

    // Integer totals that would leave the long long range are summed as double.
    static Json sumValues(const std::vector<Json>& values);

private:
    using Predicate = std::function<bool(const Json&)>;

    struct Condition {
        bool or_connective = false;
        Predicate test;
    };

    struct Order {
        std::string column;
        bool descending = false;
    };

    std::vector<Json> records_;
    std::vector<Condition> conditions_;
    std::vector<Condition> having_;
    std::vector<Order> orders_;
    std::vector<std::string> columns_;
    std::vector<std::string> group_by_;
    bool distinct_ = false;
    std::optional<long long> limit_;
    long long offset_ = 0;

    QueryBuilder& addCondition(bool or_connective, Predicate test);

    static bool matches(const std::vector<Condition>& conditions, const Json& record);
    static bool test(const Json& lhs, const std::string& op, const Json& rhs);
    static Json field(const Json& record, const std::string& column);

    std::vector<Json> filtered() const;
    std::vector<Json> materialise(bool windowed, bool projected) const;
    std::vector<Json> numericColumn(const std::string& column) const;
};

} // namespace query
