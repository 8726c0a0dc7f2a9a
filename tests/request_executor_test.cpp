#include <gtest/gtest.h>

#include "mock_server.hpp"
#include "request_executor.hpp"

using namespace std::chrono_literals;

namespace {

VariableContext empty_context() {
    return VariableContext(EnvironmentSource::fixed({}));
}

Request get(const std::string& url) {
    Request r;
    r.method = "GET";
    r.url = url;
    return r;
}

Expectation expect_status(StatusExpectation status) {
    Expectation e;
    e.status = std::move(status);
    return e;
}

} // namespace

class RequestExecutorTest : public ::testing::Test {
protected:
    MockServer server;
    RequestExecutor executor{5000ms};
    VariableContext ctx = empty_context();
};

TEST_F(RequestExecutorTest, MatchingStatusPasses) {
    auto r = executor.execute("ok", get(server.url("/status/200")), expect_status(200), ctx);

    EXPECT_TRUE(r.passed);
    EXPECT_EQ(r.name, "ok");
    EXPECT_EQ(r.response_status, std::optional<int>(200));
    EXPECT_FALSE(r.error.has_value());
    EXPECT_GT(r.duration.count(), 0);
}

TEST_F(RequestExecutorTest, StatusMismatchNamesBothCodes) {
    auto r = executor.execute("nf", get(server.url("/status/404")), expect_status(200), ctx);

    EXPECT_FALSE(r.passed);
    EXPECT_EQ(r.response_status, std::optional<int>(404));
    ASSERT_TRUE(r.error.has_value());
    EXPECT_EQ(*r.error, "Expected status 200 but got 404");
}

TEST_F(RequestExecutorTest, TemplatedStatusIsSubstituted) {
    ctx.set("code", "201");
    auto r = executor.execute("t", get(server.url("/status/201")), expect_status(std::string("{{code}}")), ctx);
    EXPECT_TRUE(r.passed);

    auto bad = executor.execute("t", get(server.url("/status/201")), expect_status(std::string("abc")), ctx);
    EXPECT_FALSE(bad.passed);
    EXPECT_EQ(bad.error, std::optional<std::string>("Invalid status code: abc"));
}

TEST_F(RequestExecutorTest, NoExpectationPassesBelow400) {
    auto ok = executor.execute("a", get(server.url("/status/302")), std::nullopt, ctx);
    auto bad = executor.execute("b", get(server.url("/status/500")), std::nullopt, ctx);

    EXPECT_TRUE(ok.passed);
    EXPECT_FALSE(bad.passed);
    EXPECT_EQ(bad.error, std::optional<std::string>("HTTP 500"));
}

TEST_F(RequestExecutorTest, JsonPathExpectations) {
    Expectation e = expect_status(200);
    e.jsonpath = std::map<std::string, nlohmann::json>{
        {"$.user.name", "alice"},
        {"$.active", true},
        {"$.count", "{{n}}"},
    };
    ctx.set("n", "3");

    auto r = executor.execute("json", get(server.url("/users/1")), e, ctx);
    EXPECT_TRUE(r.passed) << r.error.value_or("");

    e.jsonpath = std::map<std::string, nlohmann::json>{{"$.missing", 1}};
    auto missing = executor.execute("json", get(server.url("/users/1")), e, ctx);
    EXPECT_FALSE(missing.passed);
    EXPECT_EQ(missing.error, std::optional<std::string>("Field 'missing' not found in JSON"));
}

TEST_F(RequestExecutorTest, JsonPathAgainstNonJsonBodyFails) {
    Expectation e;
    e.jsonpath = std::map<std::string, nlohmann::json>{{"$.a", 1}};

    auto r = executor.execute("text", get(server.url("/text")), e, ctx);
    EXPECT_FALSE(r.passed);
    EXPECT_EQ(r.response_status, std::optional<int>(200));
    EXPECT_EQ(r.error, std::optional<std::string>("Response body is not valid JSON"));
}

TEST_F(RequestExecutorTest, HeadersParamsAndBodyAreSubstituted) {
    ctx.set("token", "t-1");
    ctx.set("term", "widgets");

    Request r;
    r.method = "POST";
    r.url = server.url("/echo");
    r.headers = std::map<std::string, std::string>{{"X-Token", "{{token}}"}};
    r.params = std::map<std::string, std::string>{{"q", "{{term}}"}};
    r.body = R"({"name":"{{term}}"})";

    Expectation e = expect_status(200);
    e.jsonpath = std::map<std::string, nlohmann::json>{
        {"$.token", "t-1"},
        {"$.q", "widgets"},
        {"$.body", R"({"name":"widgets"})"},
    };

    auto result = executor.execute("echo", r, e, ctx);
    EXPECT_TRUE(result.passed) << result.error.value_or("");
    EXPECT_EQ(server.query(), "q=widgets");
}

TEST_F(RequestExecutorTest, InvalidInputBecomesFailedResult) {
    auto bad_url = executor.execute("u", get("not a url"), std::nullopt, ctx);
    EXPECT_FALSE(bad_url.passed);
    EXPECT_FALSE(bad_url.response_status.has_value());
    EXPECT_EQ(bad_url.error, std::optional<std::string>("Invalid URL: not a url"));

    Request bad_method = get(server.url("/text"));
    bad_method.method = "GE T";
    auto m = executor.execute("m", bad_method, std::nullopt, ctx);
    EXPECT_FALSE(m.passed);
    EXPECT_EQ(m.error, std::optional<std::string>("Invalid HTTP method: GE T"));
    EXPECT_EQ(server.hits("/text"), 0);
}

TEST_F(RequestExecutorTest, ConnectionRefusedHasNoStatus) {
    auto r = executor.execute("down", get(unreachable_url()), expect_status(200), ctx);

    EXPECT_FALSE(r.passed);
    EXPECT_FALSE(r.response_status.has_value());
    ASSERT_TRUE(r.error.has_value());
    EXPECT_EQ(r.error->rfind("Failed to send HTTP request", 0), 0u);
}

TEST_F(RequestExecutorTest, TimeoutIsAFailedResult) {
    RequestExecutor fast(100ms);
    auto r = fast.execute("slow", get(server.url("/slow")), std::nullopt, ctx);

    EXPECT_FALSE(r.passed);
    EXPECT_FALSE(r.response_status.has_value());
}

TEST(UrlParsingTest, SplitsOriginAndPath) {
    auto u = parse_url("http://localhost:8080/api/users?id=1#frag");
    EXPECT_EQ(u.scheme_host_port, "http://localhost:8080");
    EXPECT_EQ(u.path, "/api/users?id=1");

    EXPECT_EQ(parse_url("https://example.com").path, "/");
    EXPECT_EQ(parse_url("http://example.com?x=1").path, "/?x=1");

    EXPECT_THROW(parse_url("ftp://example.com/"), std::invalid_argument);
    EXPECT_THROW(parse_url("http:///path"), std::invalid_argument);
    EXPECT_THROW(parse_url("http://{{host}}/"), std::invalid_argument);
}

TEST(MethodParsingTest, AcceptsTokens) {
    EXPECT_EQ(parse_method("PATCH"), "PATCH");
    EXPECT_EQ(parse_method("PROPFIND"), "PROPFIND");
    EXPECT_THROW(parse_method(""), std::invalid_argument);
    EXPECT_THROW(parse_method("GET\n"), std::invalid_argument);
}
