#include "query_builder.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <unordered_set>

#include <fmt/core.h>

#include "common/string_helper.hpp"

namespace query {

namespace {

Json numberOf(const Json& v) {
    if (v.is_boolean()) return v.get<bool>() ? 1 : 0;
    if (v.is_number()) return v;
    if (v.is_string()) {
        if (auto n = parseNumber(v.get<std::string>())) return *n;
    }
    return nullptr;
}

std::optional<Json> datePart(const Json& v, DatePart part) {
    if (!v.is_string()) return std::nullopt;
    const auto& s = v.get_ref<const std::string&>();

    switch (part) {
        case DatePart::Date:
            if (s.size() < 10) return std::nullopt;
            return Json(s.substr(0, 10));
        case DatePart::Year: {
            if (s.size() < 4) return std::nullopt;
            auto n = parseNumber(s.substr(0, 4));
            if (!n) return std::nullopt;
            return Json(static_cast<long long>(*n));
        }
        case DatePart::Month: {
            if (s.size() < 7) return std::nullopt;
            auto n = parseNumber(s.substr(5, 2));
            if (!n) return std::nullopt;
            return Json(static_cast<long long>(*n));
        }
        case DatePart::Time:
            if (s.size() < 19) return std::nullopt;
            return Json(s.substr(11, 8));
    }
    return std::nullopt;
}

// nulls first, then numbers, then strings, then the rest
int typeRank(const Json& v) {
    if (v.is_null()) return 0;
    if (v.is_boolean() || v.is_number()) return 1;
    if (v.is_string()) return 2;
    return 3;
}

// Total order for sorting: rank by type first, then compare within the
// rank. Numeric strings are not coerced here, so "9" sorts as text.
int orderValues(const Json& a, const Json& b) {
    int ra = typeRank(a), rb = typeRank(b);
    if (ra != rb) return ra < rb ? -1 : 1;
    if (ra == 0) return 0;
    if (ra == 1 || ra == 2) {
        if (auto c = QueryBuilder::compare(a, b)) return *c;
    }
    auto da = a.dump(), db = b.dump();
    return da < db ? -1 : (da > db ? 1 : 0);
}

} // namespace

QueryBuilder::QueryBuilder(std::vector<Json> records)
    : records_(std::move(records)) {}

// ---------------------------------------------------------------------------
// clauses
// ---------------------------------------------------------------------------

QueryBuilder& QueryBuilder::addCondition(bool or_connective, Predicate test) {
    conditions_.push_back({or_connective, std::move(test)});
    return *this;
}

QueryBuilder& QueryBuilder::where(const std::string& column, const std::string& op,
                                  const Json& value, bool or_connective) {
    auto normalized = toLower(op);
    if (!isOperator(normalized))
        throw EvaluationError(fmt::format("Illegal operator '{}'", op));

    // where(col, null) means whereNull
    if (value.is_null() && (normalized == "=" || normalized == "==")) {
        return addCondition(or_connective, [column](const Json& r) { return field(r, column).is_null(); });
    }
    if (value.is_null() && (normalized == "!=" || normalized == "<>")) {
        return addCondition(or_connective, [column](const Json& r) { return !field(r, column).is_null(); });
    }
    return addCondition(or_connective, [column, normalized, value](const Json& r) {
        return test(field(r, column), normalized, value);
    });
}

QueryBuilder& QueryBuilder::whereIn(const std::string& column, const Json& values, bool negate) {
    if (!values.is_array())
        throw EvaluationError(fmt::format("whereIn expects an array of values for '{}'", column));

    return addCondition(false, [column, values, negate](const Json& r) {
        const auto v = field(r, column);
        if (v.is_null()) return false;
        bool found = std::any_of(values.begin(), values.end(),
                                 [&v](const Json& candidate) { return test(v, "=", candidate); });
        return negate ? !found : found;
    });
}

QueryBuilder& QueryBuilder::whereBetween(const std::string& column, const Json& low,
                                         const Json& high, bool negate) {
    return addCondition(false, [column, low, high, negate](const Json& r) {
        const auto v = field(r, column);
        if (v.is_null()) return false;
        bool inside = test(v, ">=", low) && test(v, "<=", high);
        return negate ? !inside : inside;
    });
}

QueryBuilder& QueryBuilder::whereNull(const std::string& column, bool negate) {
    return addCondition(false, [column, negate](const Json& r) {
        return field(r, column).is_null() != negate;
    });
}

QueryBuilder& QueryBuilder::whereDatePart(const std::string& column, DatePart part,
                                          const std::string& op, const Json& value) {
    auto normalized = toLower(op);
    if (!isOperator(normalized))
        throw EvaluationError(fmt::format("Illegal operator '{}'", op));

    return addCondition(false, [column, part, normalized, value](const Json& r) {
        auto extracted = datePart(field(r, column), part);
        return extracted && test(*extracted, normalized, value);
    });
}

QueryBuilder& QueryBuilder::whereColumn(const std::string& first, const std::string& op,
                                        const std::string& second) {
    auto normalized = toLower(op);
    if (!isOperator(normalized))
        throw EvaluationError(fmt::format("Illegal operator '{}'", op));

    return addCondition(false, [first, normalized, second](const Json& r) {
        return test(field(r, first), normalized, field(r, second));
    });
}

QueryBuilder& QueryBuilder::orderBy(const std::string& column, bool descending) {
    orders_.push_back({column, descending});
    return *this;
}

QueryBuilder& QueryBuilder::limit(long long count) {
    if (count < 0) throw EvaluationError("limit must not be negative");
    limit_ = count;
    return *this;
}

QueryBuilder& QueryBuilder::offset(long long count) {
    if (count < 0) throw EvaluationError("offset must not be negative");
    offset_ = count;
    return *this;
}

QueryBuilder& QueryBuilder::select(const std::vector<std::string>& columns) {
    columns_ = columns;
    return *this;
}

QueryBuilder& QueryBuilder::addSelect(const std::vector<std::string>& columns) {
    if (columns_.empty()) columns_.push_back("*");
    columns_.insert(columns_.end(), columns.begin(), columns.end());
    return *this;
}

QueryBuilder& QueryBuilder::distinct() {
    distinct_ = true;
    return *this;
}

QueryBuilder& QueryBuilder::groupBy(const std::vector<std::string>& columns) {
    group_by_.insert(group_by_.end(), columns.begin(), columns.end());
    return *this;
}

QueryBuilder& QueryBuilder::having(const std::string& column, const std::string& op, const Json& value) {
    auto normalized = toLower(op);
    if (!isOperator(normalized))
        throw EvaluationError(fmt::format("Illegal operator '{}'", op));

    having_.push_back({false, [column, normalized, value](const Json& r) {
        return test(field(r, column), normalized, value);
    }});
    return *this;
}

// ---------------------------------------------------------------------------
// evaluation
// ---------------------------------------------------------------------------

bool QueryBuilder::isOperator(const std::string& op) {
    static const std::unordered_set<std::string> ops = {
        "=", "==", "!=", "<>", "<", "<=", ">", ">=", "like", "not like"
    };
    return ops.count(toLower(op)) > 0;
}

bool QueryBuilder::like(const std::string& text, const std::string& pattern) {
    const auto t = toLower(text);
    const auto p = toLower(pattern);

    // classic wildcard match with backtracking on the last '%'
    size_t ti = 0, pi = 0;
    size_t star = std::string::npos, mark = 0;
    while (ti < t.size()) {
        if (pi < p.size() && (p[pi] == '_' || p[pi] == t[ti])) {
            ++ti;
            ++pi;
        } else if (pi < p.size() && p[pi] == '%') {
            star = pi++;
            mark = ti;
        } else if (star != std::string::npos) {
            pi = star + 1;
            ti = ++mark;
        } else {
            return false;
        }
    }
    while (pi < p.size() && p[pi] == '%') ++pi;
    return pi == p.size();
}

std::optional<int> QueryBuilder::compare(const Json& a, const Json& b) {
    if (a.is_null() || b.is_null()) return std::nullopt;

    if (a.is_string() && b.is_string()) {
        int c = a.get_ref<const std::string&>().compare(b.get_ref<const std::string&>());
        return c < 0 ? -1 : (c > 0 ? 1 : 0);
    }

    bool a_num = a.is_number() || a.is_boolean();
    bool b_num = b.is_number() || b.is_boolean();
    if (a_num || b_num) {
        auto x = numberOf(a), y = numberOf(b);
        if (x.is_null() || y.is_null()) return std::nullopt;
        if (x.is_number_integer() && y.is_number_integer()) {
            auto i = x.get<long long>(), j = y.get<long long>();
            return i < j ? -1 : (i > j ? 1 : 0);
        }
        auto i = x.get<double>(), j = y.get<double>();
        return i < j ? -1 : (i > j ? 1 : 0);
    }

    if (a == b) return 0;
    return std::nullopt;
}

bool QueryBuilder::test(const Json& lhs, const std::string& op, const Json& rhs) {
    if (op == "like" || op == "not like") {
        if (lhs.is_null() || !rhs.is_string()) return false;
        auto text = lhs.is_string() ? lhs.get<std::string>() : lhs.dump();
        bool m = like(text, rhs.get<std::string>());
        return op == "like" ? m : !m;
    }

    auto c = compare(lhs, rhs);
    if (op == "=" || op == "==") return c && *c == 0;
    if (op == "!=" || op == "<>") {
        if (c) return *c != 0;
        return !lhs.is_null() && !rhs.is_null();
    }
    if (!c) return false;
    if (op == "<")  return *c < 0;
    if (op == "<=") return *c <= 0;
    if (op == ">")  return *c > 0;
    if (op == ">=") return *c >= 0;
    return false;
}

Json QueryBuilder::field(const Json& record, const std::string& column) {
    if (!record.is_object()) return nullptr;
    auto it = record.find(column);
    return it == record.end() ? Json(nullptr) : *it;
}

bool QueryBuilder::matches(const std::vector<Condition>& conditions, const Json& record) {
    if (conditions.empty()) return true;

    // (a AND b) OR (c AND d)
    bool group = true;
    for (size_t i = 0; i < conditions.size(); ++i) {
        const auto& c = conditions[i];
        if (c.or_connective && i > 0) {
            if (group) return true;
            group = true;
        }
        if (group && !c.test(record)) group = false;
    }
    return group;
}

std::vector<Json> QueryBuilder::filtered() const {
    std::vector<Json> rows;
    for (const auto& r : records_) {
        if (matches(conditions_, r)) rows.push_back(r);
    }
    if (group_by_.empty()) return rows;

    std::vector<Json> groups;
    std::map<std::string, size_t> index;
    for (const auto& r : rows) {
        Json key = Json::array();
        for (const auto& c : group_by_) key.push_back(field(r, c));

        auto [it, inserted] = index.emplace(key.dump(), groups.size());
        if (!inserted) {
            auto& g = groups[it->second];
            g["count"] = g["count"].get<long long>() + 1;
            continue;
        }

        Json g = Json::object();
        for (const auto& c : group_by_) g[c] = field(r, c);
        for (const auto& c : columns_) {
            if (c != "*" && !g.contains(c)) g[c] = field(r, c);
        }
        g["count"] = 1;
        groups.push_back(std::move(g));
    }

    std::vector<Json> out;
    for (auto& g : groups) {
        if (matches(having_, g)) out.push_back(std::move(g));
    }
    return out;
}

std::vector<Json> QueryBuilder::materialise(bool windowed, bool projected) const {
    auto rows = filtered();

    if (!orders_.empty()) {
        std::stable_sort(rows.begin(), rows.end(), [this](const Json& a, const Json& b) {
            for (const auto& o : orders_) {
                int c = orderValues(field(a, o.column), field(b, o.column));
                if (c != 0) return o.descending ? c > 0 : c < 0;
            }
            return false;
        });
    }

    bool all_columns = columns_.empty() ||
        std::find(columns_.begin(), columns_.end(), "*") != columns_.end();
    if (projected && group_by_.empty() && !all_columns) {
        for (auto& r : rows) {
            Json p = Json::object();
            for (const auto& c : columns_) p[c] = field(r, c);
            r = std::move(p);
        }
    }

    if (projected && distinct_) {
        std::unordered_set<std::string> seen;
        std::vector<Json> unique;
        for (auto& r : rows) {
            if (seen.insert(r.dump()).second) unique.push_back(std::move(r));
        }
        rows = std::move(unique);
    }

    if (!windowed) return rows;

    auto begin = std::min(rows.size(), static_cast<size_t>(offset_));
    auto end = rows.size();
    if (limit_) end = std::min(end, begin + static_cast<size_t>(*limit_));
    return std::vector<Json>(std::make_move_iterator(rows.begin() + begin),
                             std::make_move_iterator(rows.begin() + end));
}

// ---------------------------------------------------------------------------
// terminals
// ---------------------------------------------------------------------------

std::vector<Json> QueryBuilder::get() const {
    return materialise(true, true);
}

std::optional<Json> QueryBuilder::first() const {
    auto rows = get();
    if (rows.empty()) return std::nullopt;
    return rows.front();
}

Json QueryBuilder::pluck(const std::string& column, const std::optional<std::string>& key_column) const {
    auto rows = materialise(true, false);

    if (key_column) {
        Json out = Json::object();
        for (const auto& r : rows) {
            auto k = field(r, *key_column);
            out[k.is_string() ? k.get<std::string>() : k.dump()] = field(r, column);
        }
        return out;
    }

    Json out = Json::array();
    for (const auto& r : rows) out.push_back(field(r, column));
    return out;
}

size_t QueryBuilder::count() const {
    return filtered().size();
}

std::vector<Json> QueryBuilder::numericColumn(const std::string& column) const {
    std::vector<Json> values;
    for (const auto& r : filtered()) {
        auto n = numberOf(field(r, column));
        if (!n.is_null()) values.push_back(std::move(n));
    }
    return values;
}

Json QueryBuilder::max(const std::string& column) const {
    Json best = nullptr;
    for (const auto& r : filtered()) {
        auto v = field(r, column);
        if (v.is_null()) continue;
        if (best.is_null() || orderValues(v, best) > 0) best = v;
    }
    return best;
}

Json QueryBuilder::min(const std::string& column) const {
    Json best = nullptr;
    for (const auto& r : filtered()) {
        auto v = field(r, column);
        if (v.is_null()) continue;
        if (best.is_null() || orderValues(v, best) < 0) best = v;
    }
    return best;
}

Json QueryBuilder::sum(const std::string& column) const {
    return sumValues(numericColumn(column));
}

Json QueryBuilder::sumValues(const std::vector<Json>& values) {
    constexpr auto kMax = std::numeric_limits<long long>::max();
    constexpr auto kMin = std::numeric_limits<long long>::min();

    long long total = 0;
    bool integral = true;
    for (const auto& v : values) {
        if (!v.is_number_integer() ||
            (v.is_number_unsigned() && v.get<unsigned long long>() > static_cast<unsigned long long>(kMax))) {
            integral = false;
            break;
        }
        const auto x = v.get<long long>();
        if ((x > 0 && total > kMax - x) || (x < 0 && total < kMin - x)) {
            integral = false;
            break;
        }
        total += x;
    }
    if (integral) return total;

    double sum = 0.0;
    for (const auto& v : values) sum += v.get<double>();
    return sum;
}

Json QueryBuilder::avg(const std::string& column) const {
    auto values = numericColumn(column);
    if (values.empty()) return nullptr;
    double total = 0.0;
    for (const auto& v : values) total += v.get<double>();
    return total / static_cast<double>(values.size());
}

std::vector<Json> QueryBuilder::page(long long per_page, long long page) const {
    if (per_page <= 0) throw EvaluationError("perPage must be positive");
    if (page <= 0) throw EvaluationError("page must be positive");

    auto rows = materialise(false, true);
    // a page starting past the last representable offset is necessarily empty
    if (page - 1 > std::numeric_limits<long long>::max() / per_page) return {};
    auto begin = std::min(rows.size(), static_cast<size_t>((page - 1) * per_page));
    auto end = std::min(rows.size(), begin + static_cast<size_t>(per_page));
    return std::vector<Json>(rows.begin() + begin, rows.begin() + end);
}

} // namespace query
