#include <string>

#include <gtest/gtest.h>

#include "query/query_executor.hpp"
#include "query/query_validator.hpp"
#include "test_support.hpp"

using namespace query;

class QueryExecutorTest : public ::testing::Test {
protected:
    std::shared_ptr<EntityStore> store = testing_support::sampleStore();
    QueryExecutor executor{*store};
};

TEST_F(QueryExecutorTest, WhereGetReturnsMatchingRecords) {
    auto out = executor.run("User", "where('age', 18)->get()");
    ASSERT_TRUE(out.ok) << out.error_message;
    EXPECT_EQ(out.exitCode(), 0);
    EXPECT_EQ(out.code, ResultCode::OK);
    ASSERT_TRUE(out.value.is_array());
    ASSERT_EQ(out.value.size(), 1u);
    EXPECT_EQ(out.value[0]["name"], "Bob");
    EXPECT_GE(out.elapsed_seconds, 0.0);
}

TEST_F(QueryExecutorTest, HugeFloatLiteralIsRejectedNotThrown) {
    auto out = executor.run("User", "where('age', " + std::string(400, '9') + ".5)->get()");
    EXPECT_FALSE(out.ok);
    EXPECT_EQ(out.code, ResultCode::MalformedQuery);
    EXPECT_EQ(out.exitCode(), 1);
}

TEST_F(QueryExecutorTest, ChainEndingOnQueryFetchesRecords) {
    auto out = executor.run("User", "where('status', 'active')");
    ASSERT_TRUE(out.ok);
    EXPECT_EQ(out.value.size(), 2u);
}

TEST_F(QueryExecutorTest, RejectedExpressionNeverRuns) {
    auto out = executor.run("User", "delete()");
    EXPECT_FALSE(out.ok);
    EXPECT_EQ(out.exitCode(), 1);
    EXPECT_EQ(out.code, ResultCode::DisallowedVerb);
    EXPECT_EQ(store->size("User"), 4u);

    out = executor.run("User", "where('name', 'DB::raw')->get()");
    EXPECT_EQ(out.code, ResultCode::DisallowedPattern);

    out = executor.run("User", "where('name'");
    EXPECT_EQ(out.code, ResultCode::MalformedQuery);
}

TEST_F(QueryExecutorTest, UnknownEntityType) {
    auto out = executor.run("Invoice", "get()");
    EXPECT_FALSE(out.ok);
    EXPECT_EQ(out.code, ResultCode::UnknownEntityType);
    EXPECT_EQ(out.error_message, "Entity type 'Invoice' does not exist.");
}

TEST_F(QueryExecutorTest, EvaluationErrorsBecomeExecutionErrors) {
    auto out = executor.run("User", "where('age', 'between', 1)->get()");
    EXPECT_FALSE(out.ok);
    EXPECT_EQ(out.code, ResultCode::ExecutionError);
    EXPECT_EQ(out.error_message, "Query execution failed: Illegal operator 'between'");

    out = executor.run("User", "findOrFail(99)");
    EXPECT_EQ(out.code, ResultCode::ExecutionError);
    EXPECT_EQ(out.error_message, "Query execution failed: No query results for entity [User] 99");

    out = executor.run("User", "orderBy('name', 'sideways')->get()");
    EXPECT_EQ(out.code, ResultCode::ExecutionError);

    out = executor.run("User", "count()->where('a', 1)");
    EXPECT_EQ(out.code, ResultCode::ExecutionError);
}

TEST_F(QueryExecutorTest, ScalarTerminals) {
    auto count = executor.run("User", "where('status', 'active')->count()");
    ASSERT_TRUE(count.ok);
    EXPECT_EQ(count.value, 2);

    auto exists = executor.run("User", "where('age', '>', 100)->exists()");
    ASSERT_TRUE(exists.ok);
    EXPECT_EQ(exists.value, false);

    auto sum = executor.run("User", "sum('age')");
    ASSERT_TRUE(sum.ok);
    EXPECT_EQ(sum.value, 104);

    auto value = executor.run("User", "orderBy('age', 'desc')->value('name')");
    ASSERT_TRUE(value.ok);
    EXPECT_EQ(value.value, "Carol");

    auto none = executor.run("User", "where('id', 42)->first()");
    ASSERT_TRUE(none.ok);
    EXPECT_TRUE(none.value.is_null());
}

TEST_F(QueryExecutorTest, FindAndSole) {
    auto found = executor.run("User", "find(3)");
    ASSERT_TRUE(found.ok);
    EXPECT_EQ(found.value["name"], "Carol");

    auto sole = executor.run("User", "where('name', 'Bob')->sole()");
    ASSERT_TRUE(sole.ok);
    EXPECT_EQ(sole.value["id"], 2);

    auto many = executor.run("User", "where('status', 'active')->sole()");
    EXPECT_EQ(many.code, ResultCode::ExecutionError);
}

TEST_F(QueryExecutorTest, LatestDefaultsToCreatedAt) {
    auto out = executor.run("User", "latest()->first()");
    ASSERT_TRUE(out.ok);
    EXPECT_EQ(out.value["name"], "Carol");

    out = executor.run("User", "oldest()->first()");
    ASSERT_TRUE(out.ok);
    EXPECT_EQ(out.value["name"], "Dave");
}

TEST_F(QueryExecutorTest, PluckAndListVerbs) {
    auto out = executor.run("User", "orderBy('id')->pluck('name')");
    ASSERT_TRUE(out.ok);
    EXPECT_EQ(out.value, Json::array({"Alice", "Bob", "Carol", "Dave"}));

    out = executor.run("User", "orderBy('id')->pluck('name')->take(-2)");
    ASSERT_TRUE(out.ok);
    EXPECT_EQ(out.value, Json::array({"Carol", "Dave"}));

    out = executor.run("User", "pluck('age')->count()");
    ASSERT_TRUE(out.ok);
    EXPECT_EQ(out.value, 4);

    out = executor.run("User", "pluck('name', 'id')");
    ASSERT_TRUE(out.ok);
    EXPECT_EQ(out.value["2"], "Bob");
}

TEST_F(QueryExecutorTest, ResultListActsAsQuery) {
    auto out = executor.run("User", "get()->where('age', '>', 30)->count()");
    ASSERT_TRUE(out.ok);
    EXPECT_EQ(out.value, 2);

    out = executor.run("User", "get()->first()");
    ASSERT_TRUE(out.ok);
    EXPECT_EQ(out.value["id"], 1);
}

TEST_F(QueryExecutorTest, Paginate) {
    auto out = executor.run("User", "orderBy('id')->paginate(3, 2)");
    ASSERT_TRUE(out.ok);
    const auto& p = out.value;
    EXPECT_EQ(p["current_page"], 2);
    EXPECT_EQ(p["per_page"], 3);
    EXPECT_EQ(p["total"], 4);
    EXPECT_EQ(p["last_page"], 2);
    EXPECT_EQ(p["from"], 4);
    EXPECT_EQ(p["to"], 4);
    ASSERT_EQ(p["data"].size(), 1u);
    EXPECT_EQ(p["data"][0]["name"], "Dave");

    out = executor.run("User", "simplePaginate(2)");
    ASSERT_TRUE(out.ok);
    EXPECT_EQ(out.value["has_more_pages"], true);
    EXPECT_FALSE(out.value.contains("total"));
}

TEST_F(QueryExecutorTest, PageBeyondAnyOffsetIsEmpty) {
    auto out = executor.run("User", "simplePaginate(4611686018427387904, 3)");
    ASSERT_TRUE(out.ok) << out.error_message;
    EXPECT_TRUE(out.value["data"].empty());
    EXPECT_EQ(out.value["has_more_pages"], false);
    EXPECT_TRUE(out.value["from"].is_null());
    EXPECT_TRUE(out.value["to"].is_null());

    out = executor.run("User", "paginate(9223372036854775807, 9223372036854775807)");
    ASSERT_TRUE(out.ok) << out.error_message;
    EXPECT_TRUE(out.value["data"].empty());
    EXPECT_EQ(out.value["total"], 4);
    EXPECT_EQ(out.value["last_page"], 1);

    out = executor.run("User", "simplePaginate(3, 1)");
    ASSERT_TRUE(out.ok);
    EXPECT_EQ(out.value["has_more_pages"], true);
    out = executor.run("User", "simplePaginate(2, 2)");
    ASSERT_TRUE(out.ok);
    EXPECT_EQ(out.value["has_more_pages"], false);
}

TEST_F(QueryExecutorTest, ExtremeTakeAndLimitArguments) {
    auto out = executor.run("User", "orderBy('id')->pluck('name')->take(-9223372036854775808)");
    ASSERT_TRUE(out.ok) << out.error_message;
    EXPECT_EQ(out.value.size(), 4u);

    out = executor.run("User", "limit('1e30')->get()");
    EXPECT_FALSE(out.ok);
    EXPECT_EQ(out.code, ResultCode::ExecutionError);
}

TEST_F(QueryExecutorTest, ListSumFallsBackToDoubleOnOverflow) {
    EntityStore big;
    big.define("Big", "Big", {"n"});
    ASSERT_TRUE(big.insert("Big", {{"n", 9223372036854775807LL}}));
    ASSERT_TRUE(big.insert("Big", {{"n", 9223372036854775807LL}}));
    QueryExecutor big_executor{big};

    auto out = big_executor.run("Big", "pluck('n')->sum()");
    ASSERT_TRUE(out.ok) << out.error_message;
    ASSERT_TRUE(out.value.is_number_float());
    EXPECT_DOUBLE_EQ(out.value.get<double>(), 2.0 * 9223372036854775807.0);

    out = big_executor.run("Big", "sum('n')");
    ASSERT_TRUE(out.ok) << out.error_message;
    EXPECT_GT(out.value.get<double>(), 1.8e19);
}

TEST_F(QueryExecutorTest, GroupByCounts) {
    auto out = executor.run("User", "groupBy('status')->having('count', '>', 1)->get()");
    ASSERT_TRUE(out.ok);
    ASSERT_EQ(out.value.size(), 1u);
    EXPECT_EQ(out.value[0]["status"], "active");
    EXPECT_EQ(out.value[0]["count"], 2);
}

TEST_F(QueryExecutorTest, ToJsonProducesString) {
    auto out = executor.run("User", "where('id', 1)->select('id', 'name')->toJson()");
    ASSERT_TRUE(out.ok);
    ASSERT_TRUE(out.value.is_string());
    EXPECT_EQ(out.value.get<std::string>(), R"([{"id":1,"name":"Alice"}])");
}

TEST_F(QueryExecutorTest, VerbsAreCaseInsensitive) {
    auto out = executor.run("User", "WHERE('age', '>=', 34)->OrderByDesc('age')->PLUCK('name')");
    ASSERT_TRUE(out.ok) << out.error_message;
    EXPECT_EQ(out.value, Json::array({"Carol", "Alice"}));
}

TEST(QueryExecutorEvaluateTest, EvaluatesParsedChain) {
    auto chain = QueryValidator::parse("whereIn('k', ['a', 'c'])->count()");
    ASSERT_TRUE(chain);
    std::vector<Json> rows = {{{"k", "a"}}, {{"k", "b"}}, {{"k", "c"}}};
    EXPECT_EQ(QueryExecutor::evaluate("Thing", rows, chain.value()), 2);
}
