#include "query_executor.hpp"

#include <algorithm>
#include <chrono>
#include <functional>
#include <optional>
#include <unordered_map>

#include <fmt/core.h>

#include "common/string_helper.hpp"
#include "logging/logging.hpp"
#include "query_builder.hpp"
#include "query_validator.hpp"

namespace query {

namespace {

// A chain either still holds a query over records or has produced a value.
struct Evaluation {
    std::optional<QueryBuilder> rows;
    Json value;

    static Evaluation query(std::vector<Json> records) {
        Evaluation e;
        e.rows.emplace(std::move(records));
        return e;
    }
    static Evaluation result(Json v) {
        Evaluation e;
        e.value = std::move(v);
        return e;
    }
};

struct Context {
    const std::string& entity_type;
};

// ---------------------------------------------------------------------------
// argument helpers
// ---------------------------------------------------------------------------

void arity(const Call& c, size_t min, size_t max) {
    if (c.args.size() < min || c.args.size() > max) {
        if (min == max)
            throw EvaluationError(fmt::format("{}() expects {} argument(s), {} given", c.verb, min, c.args.size()));
        throw EvaluationError(fmt::format("{}() expects {} to {} arguments, {} given",
                                          c.verb, min, max, c.args.size()));
    }
}

std::string text(const Call& c, size_t i) {
    const auto& a = c.args.at(i);
    if (!a.is_string())
        throw EvaluationError(fmt::format("{}() argument {} must be a string", c.verb, i + 1));
    return a.get<std::string>();
}

long long integer(const Call& c, size_t i) {
    const auto& a = c.args.at(i);
    if (a.is_number_integer()) return a.get<long long>();
    if (a.is_string()) {
        auto n = parseNumber(a.get<std::string>());
        if (n) {
            if (auto whole = toInteger(*n)) return *whole;
        }
    }
    throw EvaluationError(fmt::format("{}() argument {} must be an integer", c.verb, i + 1));
}

// select('a', 'b') or select(['a', 'b'])
std::vector<std::string> columns(const Call& c) {
    std::vector<std::string> out;
    for (const auto& a : c.args) {
        if (a.is_string()) {
            out.push_back(a.get<std::string>());
        } else if (a.is_array()) {
            for (const auto& item : a) {
                if (!item.is_string())
                    throw EvaluationError(fmt::format("{}() column names must be strings", c.verb));
                out.push_back(item.get<std::string>());
            }
        } else {
            throw EvaluationError(fmt::format("{}() column names must be strings", c.verb));
        }
    }
    return out;
}

// (column, value) or (column, operator, value)
std::pair<std::string, Json> comparison(const Call& c) {
    arity(c, 2, 3);
    if (c.args.size() == 2) return {"=", c.args[1]};
    return {text(c, 1), c.args[2]};
}

std::pair<Json, Json> range(const Call& c) {
    arity(c, 2, 2);
    const auto& r = c.args[1];
    if (!r.is_array() || r.size() != 2)
        throw EvaluationError(fmt::format("{}() expects a [low, high] pair", c.verb));
    return {r[0], r[1]};
}

// ---------------------------------------------------------------------------
// verb tables
// ---------------------------------------------------------------------------

using Modifier = std::function<void(QueryBuilder&, const Call&)>;
using Terminal = std::function<Evaluation(const QueryBuilder&, const Call&, const Context&)>;
using ValueVerb = std::function<Json(const Json&, const Call&)>;

Modifier datePart(DatePart part) {
    return [part](QueryBuilder& q, const Call& c) {
        auto [op, v] = comparison(c);
        q.whereDatePart(text(c, 0), part, op, v);
    };
}

const std::unordered_map<std::string, Modifier>& modifiers() {
    static const std::unordered_map<std::string, Modifier> table = {
        {"where", [](QueryBuilder& q, const Call& c) {
            auto [op, v] = comparison(c);
            q.where(text(c, 0), op, v);
        }},
        {"orwhere", [](QueryBuilder& q, const Call& c) {
            auto [op, v] = comparison(c);
            q.where(text(c, 0), op, v, true);
        }},
        {"wherein", [](QueryBuilder& q, const Call& c) {
            arity(c, 2, 2);
            q.whereIn(text(c, 0), c.args[1]);
        }},
        {"wherenotin", [](QueryBuilder& q, const Call& c) {
            arity(c, 2, 2);
            q.whereIn(text(c, 0), c.args[1], true);
        }},
        {"wherebetween", [](QueryBuilder& q, const Call& c) {
            auto [lo, hi] = range(c);
            q.whereBetween(text(c, 0), lo, hi);
        }},
        {"wherenotbetween", [](QueryBuilder& q, const Call& c) {
            auto [lo, hi] = range(c);
            q.whereBetween(text(c, 0), lo, hi, true);
        }},
        {"wherenull", [](QueryBuilder& q, const Call& c) {
            arity(c, 1, 1);
            q.whereNull(text(c, 0));
        }},
        {"wherenotnull", [](QueryBuilder& q, const Call& c) {
            arity(c, 1, 1);
            q.whereNull(text(c, 0), true);
        }},
        {"wheredate",  datePart(DatePart::Date)},
        {"wheremonth", datePart(DatePart::Month)},
        {"whereyear",  datePart(DatePart::Year)},
        {"wheretime",  datePart(DatePart::Time)},
        {"wherecolumn", [](QueryBuilder& q, const Call& c) {
            arity(c, 2, 3);
            if (c.args.size() == 2) q.whereColumn(text(c, 0), "=", text(c, 1));
            else q.whereColumn(text(c, 0), text(c, 1), text(c, 2));
        }},
        {"orderby", [](QueryBuilder& q, const Call& c) {
            arity(c, 1, 2);
            auto dir = c.args.size() == 2 ? toLower(text(c, 1)) : std::string("asc");
            if (dir != "asc" && dir != "desc")
                throw EvaluationError("Order direction must be \"asc\" or \"desc\".");
            q.orderBy(text(c, 0), dir == "desc");
        }},
        {"orderbydesc", [](QueryBuilder& q, const Call& c) {
            arity(c, 1, 1);
            q.orderBy(text(c, 0), true);
        }},
        {"latest", [](QueryBuilder& q, const Call& c) {
            arity(c, 0, 1);
            q.orderBy(c.args.empty() ? "created_at" : text(c, 0), true);
        }},
        {"oldest", [](QueryBuilder& q, const Call& c) {
            arity(c, 0, 1);
            q.orderBy(c.args.empty() ? "created_at" : text(c, 0), false);
        }},
        {"limit",  [](QueryBuilder& q, const Call& c) { arity(c, 1, 1); q.limit(integer(c, 0)); }},
        {"take",   [](QueryBuilder& q, const Call& c) { arity(c, 1, 1); q.limit(integer(c, 0)); }},
        {"offset", [](QueryBuilder& q, const Call& c) { arity(c, 1, 1); q.offset(integer(c, 0)); }},
        {"skip",   [](QueryBuilder& q, const Call& c) { arity(c, 1, 1); q.offset(integer(c, 0)); }},
        {"select", [](QueryBuilder& q, const Call& c) {
            q.select(c.args.empty() ? std::vector<std::string>{"*"} : columns(c));
        }},
        {"addselect", [](QueryBuilder& q, const Call& c) {
            arity(c, 1, 64);
            q.addSelect(columns(c));
        }},
        {"distinct", [](QueryBuilder& q, const Call& c) { arity(c, 0, 0); q.distinct(); }},
        {"groupby", [](QueryBuilder& q, const Call& c) {
            arity(c, 1, 64);
            q.groupBy(columns(c));
        }},
        {"having", [](QueryBuilder& q, const Call& c) {
            auto [op, v] = comparison(c);
            q.having(text(c, 0), op, v);
        }},
    };
    return table;
}

Json firstOrNull(const QueryBuilder& q) {
    auto r = q.first();
    return r ? *r : Json(nullptr);
}

Json paginate(const QueryBuilder& q, const Call& c, bool simple) {
    arity(c, 0, 2);
    long long per_page = c.args.size() > 0 ? integer(c, 0) : 15;
    long long page = c.args.size() > 1 ? integer(c, 1) : 1;

    auto data = q.page(per_page, page);
    auto total = static_cast<long long>(q.total());

    Json out = Json::object();
    out["current_page"] = page;
    out["data"] = data;
    out["per_page"] = per_page;
    if (data.empty()) {
        out["from"] = nullptr;
        out["to"] = nullptr;
    } else {
        // a non-empty page starts inside the row set, so the offset fits
        long long from = (page - 1) * per_page + 1;
        out["from"] = from;
        out["to"] = from + static_cast<long long>(data.size()) - 1;
    }
    // page * per_page < total, without forming the product
    if (simple) {
        out["has_more_pages"] = total > 0 && page <= (total - 1) / per_page;
    } else {
        out["total"] = total;
        out["last_page"] = total == 0 ? 1LL : (total - 1) / per_page + 1;
    }
    return out;
}

Json findById(const QueryBuilder& q, const Call& c) {
    arity(c, 1, 1);
    QueryBuilder by_id(q);
    by_id.where("id", "=", c.args[0]);
    return firstOrNull(by_id);
}

const std::unordered_map<std::string, Terminal>& terminals() {
    static const std::unordered_map<std::string, Terminal> table = {
        {"get", [](const QueryBuilder& q, const Call& c, const Context&) {
            arity(c, 0, 1);
            if (!c.args.empty()) {
                QueryBuilder selected(q);
                selected.select(columns(c));
                return Evaluation::query(selected.get());
            }
            return Evaluation::query(q.get());
        }},
        {"lazy", [](const QueryBuilder& q, const Call& c, const Context&) {
            arity(c, 0, 1);
            return Evaluation::query(q.get());
        }},
        {"first", [](const QueryBuilder& q, const Call& c, const Context&) {
            arity(c, 0, 0);
            return Evaluation::result(firstOrNull(q));
        }},
        {"find", [](const QueryBuilder& q, const Call& c, const Context&) {
            return Evaluation::result(findById(q, c));
        }},
        {"findorfail", [](const QueryBuilder& q, const Call& c, const Context& ctx) {
            auto r = findById(q, c);
            if (r.is_null())
                throw EvaluationError(fmt::format("No query results for entity [{}] {}", ctx.entity_type, c.args[0].dump()));
            return Evaluation::result(r);
        }},
        {"sole", [](const QueryBuilder& q, const Call& c, const Context& ctx) {
            arity(c, 0, 0);
            auto rows = q.get();
            if (rows.empty())
                throw EvaluationError(fmt::format("No query results for entity [{}]", ctx.entity_type));
            if (rows.size() > 1)
                throw EvaluationError(fmt::format("{} records were found", rows.size()));
            return Evaluation::result(rows.front());
        }},
        {"pluck", [](const QueryBuilder& q, const Call& c, const Context&) {
            arity(c, 1, 2);
            std::optional<std::string> key;
            if (c.args.size() == 2) key = text(c, 1);
            return Evaluation::result(q.pluck(text(c, 0), key));
        }},
        {"value", [](const QueryBuilder& q, const Call& c, const Context&) {
            arity(c, 1, 1);
            auto column = text(c, 0);
            auto r = q.first();
            if (!r || !r->contains(column)) return Evaluation::result(nullptr);
            return Evaluation::result((*r)[column]);
        }},
        {"count", [](const QueryBuilder& q, const Call& c, const Context&) {
            arity(c, 0, 1);
            return Evaluation::result(static_cast<long long>(q.count()));
        }},
        {"max", [](const QueryBuilder& q, const Call& c, const Context&) {
            arity(c, 1, 1);
            return Evaluation::result(q.max(text(c, 0)));
        }},
        {"min", [](const QueryBuilder& q, const Call& c, const Context&) {
            arity(c, 1, 1);
            return Evaluation::result(q.min(text(c, 0)));
        }},
        {"sum", [](const QueryBuilder& q, const Call& c, const Context&) {
            arity(c, 1, 1);
            return Evaluation::result(q.sum(text(c, 0)));
        }},
        {"avg", [](const QueryBuilder& q, const Call& c, const Context&) {
            arity(c, 1, 1);
            return Evaluation::result(q.avg(text(c, 0)));
        }},
        {"exists", [](const QueryBuilder& q, const Call& c, const Context&) {
            arity(c, 0, 0);
            return Evaluation::result(q.count() > 0);
        }},
        {"doesntexist", [](const QueryBuilder& q, const Call& c, const Context&) {
            arity(c, 0, 0);
            return Evaluation::result(q.count() == 0);
        }},
        {"toarray", [](const QueryBuilder& q, const Call& c, const Context&) {
            arity(c, 0, 0);
            return Evaluation::result(Json(q.get()));
        }},
        {"tojson", [](const QueryBuilder& q, const Call& c, const Context&) {
            arity(c, 0, 0);
            return Evaluation::result(Json(q.get()).dump());
        }},
        {"paginate", [](const QueryBuilder& q, const Call& c, const Context&) {
            return Evaluation::result(paginate(q, c, false));
        }},
        {"simplepaginate", [](const QueryBuilder& q, const Call& c, const Context&) {
            return Evaluation::result(paginate(q, c, true));
        }},
    };
    return table;
}

double numeric(const Json& v, const Call& c) {
    if (v.is_number()) return v.get<double>();
    throw EvaluationError(fmt::format("{}() on a non-numeric value", c.verb));
}

Json extreme(const Json& list, const Call& c, bool largest) {
    Json best = nullptr;
    for (const auto& v : list) {
        if (v.is_null()) continue;
        auto cmp = QueryBuilder::compare(v, best.is_null() ? v : best);
        if (!cmp) throw EvaluationError(fmt::format("{}() on values that cannot be compared", c.verb));
        if (best.is_null() || (largest ? *cmp > 0 : *cmp < 0)) best = v;
    }
    return best;
}

// Column-less forms on a produced list (pluck results and the like).
const std::unordered_map<std::string, ValueVerb>& listVerbs() {
    static const std::unordered_map<std::string, ValueVerb> table = {
        {"count", [](const Json& v, const Call&) { return Json(static_cast<long long>(v.size())); }},
        {"first", [](const Json& v, const Call&) { return v.empty() ? Json(nullptr) : v.front(); }},
        {"take", [](const Json& v, const Call& c) {
            arity(c, 1, 1);
            auto n = integer(c, 0);
            Json out = Json::array();
            if (n >= 0) {
                for (size_t i = 0; i < v.size() && i < static_cast<size_t>(n); ++i) out.push_back(v[i]);
            } else {
                // negative takes from the end
                const auto back = 0ULL - static_cast<unsigned long long>(n);
                auto skip = v.size() > back ? v.size() - static_cast<size_t>(back) : 0;
                for (size_t i = skip; i < v.size(); ++i) out.push_back(v[i]);
            }
            return out;
        }},
        {"sum", [](const Json& v, const Call& c) {
            std::vector<Json> values;
            for (const auto& x : v) {
                if (!x.is_number()) throw EvaluationError(fmt::format("{}() on a non-numeric value", c.verb));
                values.push_back(x);
            }
            return QueryBuilder::sumValues(values);
        }},
        {"avg", [](const Json& v, const Call& c) {
            if (v.empty()) return Json(nullptr);
            double total = 0.0;
            for (const auto& x : v) total += numeric(x, c);
            return Json(total / static_cast<double>(v.size()));
        }},
        {"max", [](const Json& v, const Call& c) { return extreme(v, c, true); }},
        {"min", [](const Json& v, const Call& c) { return extreme(v, c, false); }},
    };
    return table;
}

const char* typeName(const Json& v) {
    return v.type_name();
}

Evaluation step(Evaluation current, const Call& call, const Context& ctx) {
    const auto verb = toLower(call.verb);

    if (current.rows) {
        auto& q = *current.rows;
        if (auto it = modifiers().find(verb); it != modifiers().end()) {
            it->second(q, call);
            return current;
        }
        if (auto it = terminals().find(verb); it != terminals().end()) {
            return it->second(q, call, ctx);
        }
        throw EvaluationError(fmt::format("Call to undefined method {}()", call.verb));
    }

    const auto& v = current.value;
    if (verb == "toarray") {
        arity(call, 0, 0);
        return current;
    }
    if (verb == "tojson") {
        arity(call, 0, 0);
        return Evaluation::result(v.dump());
    }

    if (v.is_array()) {
        if (call.args.empty() || verb == "take") {
            if (auto it = listVerbs().find(verb); it != listVerbs().end())
                return Evaluation::result(it->second(v, call));
        }
        // a list of records behaves like a query over those records
        std::vector<Json> records(v.begin(), v.end());
        return step(Evaluation::query(std::move(records)), call, ctx);
    }

    throw EvaluationError(fmt::format("Call to {}() on {}", call.verb, typeName(v)));
}

} // namespace

Json QueryExecutor::evaluate(const std::string& entity_type, std::vector<Json> records,
                             const QueryChain& chain) {
    const Context ctx{entity_type};
    auto current = Evaluation::query(std::move(records));
    for (const auto& call : chain) {
        current = step(std::move(current), call, ctx);
    }

    // a chain ending on the query itself fetches it
    if (current.rows) return Json(current.rows->get());
    return current.value;
}

ExecutionOutcome QueryExecutor::run(const std::string& entity_type, std::string_view expression) const {
    const auto start = std::chrono::steady_clock::now();
    auto elapsed = [&start]() {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    };

    ExecutionOutcome outcome;
    auto fail = [&](ResultCode code, const std::string& message) {
        outcome.ok = false;
        outcome.code = code;
        outcome.error_message = message;
        outcome.elapsed_seconds = elapsed();
        LOGW("query on {} failed ({}): {}", entity_type, to_string(code), message);
        return outcome;
    };

    auto chain = QueryValidator::parse(expression);
    if (!chain) return fail(chain.code(), chain.error().value_or("query rejected"));

    if (!source_.contains(entity_type))
        return fail(ResultCode::UnknownEntityType, fmt::format("Entity type '{}' does not exist.", entity_type));

    auto rows = source_.rows(entity_type);
    if (!rows) return fail(rows.code(), rows.error().value_or("entity rows unavailable"));

    try {
        outcome.value = evaluate(entity_type, std::move(rows.value()), chain.value());
    } catch (const EvaluationError& e) {
        return fail(ResultCode::ExecutionError, fmt::format("Query execution failed: {}", e.what()));
    } catch (const nlohmann::json::exception& e) {
        return fail(ResultCode::ExecutionError, fmt::format("Query execution failed: {}", e.what()));
    } catch (const std::exception& e) {
        return fail(ResultCode::ExecutionError, fmt::format("Query execution failed: {}", e.what()));
    }

    outcome.ok = true;
    outcome.code = ResultCode::OK;
    outcome.elapsed_seconds = elapsed();
    LOGD("query on {} completed in {:.3f}s", entity_type, outcome.elapsed_seconds);
    return outcome;
}

} // namespace query
