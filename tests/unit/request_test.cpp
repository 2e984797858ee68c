#include <gtest/gtest.h>
#include <reqmatch/http/header_map.h>
#include <reqmatch/http/request.h>

#include <optional>
#include <sstream>
#include <string>

using namespace reqmatch::http;

// =============================================================================
// Defaults
// =============================================================================
TEST(RequestDefaults, DefaultConstructedRequest) {
    Request request;
    EXPECT_EQ(request.method, "GET");
    EXPECT_EQ(request.path, "/");
    EXPECT_TRUE(request.query.empty());
    EXPECT_FALSE(request.fragment.has_value());
    EXPECT_TRUE(request.headers.empty());
    EXPECT_FALSE(request.body.has_value());
}

// =============================================================================
// Parser
// =============================================================================
TEST(RequestParser, EmptyInputYieldsDefault) {
    EXPECT_EQ(parse_request(""), Request{});
}

TEST(RequestParser, SlashOnlyYieldsDefault) {
    EXPECT_EQ(parse_request("/"), Request{});
}

TEST(RequestParser, WhitespaceOnlyYieldsDefault) {
    EXPECT_EQ(parse_request("  \t\n "), Request{});
}

TEST(RequestParser, PlainPath) {
    auto request = parse_request("/some/path");
    EXPECT_EQ(request.path, "/some/path");
    EXPECT_TRUE(request.query.empty());
    EXPECT_FALSE(request.fragment.has_value());
}

TEST(RequestParser, PathWithoutLeadingSlashIsPrefixed) {
    EXPECT_EQ(parse_request("some/path").path, "/some/path");
}

TEST(RequestParser, SurroundingWhitespaceIsTrimmed) {
    auto request = parse_request("  /path?key=value  ");
    EXPECT_EQ(request.path, "/path");
    ASSERT_EQ(request.query.count("key"), 1u);
    EXPECT_EQ(request.query.at("key"), std::optional<std::string>("value"));
}

TEST(RequestParser, OnlyOneLeadingSlashIsStripped) {
    EXPECT_EQ(parse_request("//double").path, "//double");
}

TEST(RequestParser, PathWithQuery) {
    Request expected;
    expected.path = "/path";
    expected.query = {{"key", "value"}};
    EXPECT_EQ(parse_request("/path?key=value"), expected);
}

TEST(RequestParser, PathQueryAndFragment) {
    auto request = parse_request("/path?key=value#hash");
    EXPECT_EQ(request.path, "/path");
    EXPECT_EQ(request.query, (QueryMap{{"key", "value"}}));
    EXPECT_EQ(request.fragment, std::optional<std::string>("hash"));
}

TEST(RequestParser, QueryWithoutPath) {
    auto request = parse_request("?key=value&empty_key");
    EXPECT_EQ(request.path, "/");
    ASSERT_EQ(request.query.size(), 2u);
    EXPECT_EQ(request.query.at("key"), std::optional<std::string>("value"));
    EXPECT_FALSE(request.query.at("empty_key").has_value());
}

TEST(RequestParser, KeyWithEmptyValueHasNoValue) {
    auto request = parse_request("/p?flag=");
    ASSERT_EQ(request.query.count("flag"), 1u);
    EXPECT_FALSE(request.query.at("flag").has_value());
}

TEST(RequestParser, ValueKeepsLaterEqualsSigns) {
    auto request = parse_request("/p?expr=a=b");
    EXPECT_EQ(request.query.at("expr"), std::optional<std::string>("a=b"));
}

TEST(RequestParser, DuplicateKeyLastOccurrenceWins) {
    auto request = parse_request("/p?key=first&key=second");
    ASSERT_EQ(request.query.size(), 1u);
    EXPECT_EQ(request.query.at("key"), std::optional<std::string>("second"));
}

TEST(RequestParser, DuplicateKeyLaterFlagOverwritesValue) {
    auto request = parse_request("/p?key=value&key");
    ASSERT_EQ(request.query.size(), 1u);
    EXPECT_FALSE(request.query.at("key").has_value());
}

TEST(RequestParser, TrailingQuestionMarkHasNoQuery) {
    auto request = parse_request("/path?");
    EXPECT_EQ(request.path, "/path");
    EXPECT_TRUE(request.query.empty());
}

TEST(RequestParser, EmptyFragmentIsAbsent) {
    auto request = parse_request("/path#");
    EXPECT_EQ(request.path, "/path");
    EXPECT_FALSE(request.fragment.has_value());
}

TEST(RequestParser, FragmentOnly) {
    auto request = parse_request("#anchor");
    EXPECT_EQ(request.path, "/");
    EXPECT_EQ(request.fragment, std::optional<std::string>("anchor"));
}

TEST(RequestParser, QuestionMarkInsideFragmentIsNotQuery) {
    auto request = parse_request("/path#frag?x=1");
    EXPECT_TRUE(request.query.empty());
    EXPECT_EQ(request.fragment, std::optional<std::string>("frag?x=1"));
}

TEST(RequestParser, SecondHashStaysInFragment) {
    auto request = parse_request("/path#a#b");
    EXPECT_EQ(request.fragment, std::optional<std::string>("a#b"));
}

TEST(RequestParser, FromIsParseAlias) {
    EXPECT_EQ(Request::from("/a?b=c#d"), parse_request("/a?b=c#d"));
}

TEST(RequestParser, ParsedRequestKeepsDefaultMethodHeadersAndBody) {
    auto request = parse_request("/a?b#c");
    EXPECT_EQ(request.method, "GET");
    EXPECT_TRUE(request.headers.empty());
    EXPECT_FALSE(request.body.has_value());
}

// =============================================================================
// Builders
// =============================================================================
TEST(RequestBuilder, WithMethodTouchesOnlyMethod) {
    Request base = parse_request("/path?k=v#f");
    Request built = base.with_method("post");
    EXPECT_EQ(built.method, "post");
    EXPECT_EQ(built.path, base.path);
    EXPECT_EQ(built.query, base.query);
    EXPECT_EQ(built.fragment, base.fragment);
    EXPECT_EQ(base.method, "GET");
}

TEST(RequestBuilder, WithPathNormalizesLeadingSlash) {
    EXPECT_EQ(Request{}.with_path("api/v1").path, "/api/v1");
    EXPECT_EQ(Request{}.with_path("/api/v1").path, "/api/v1");
    EXPECT_EQ(Request{}.with_path("").path, "/");
}

TEST(RequestBuilder, WithQueryValueAndFlag) {
    Request request = Request{}.with_query("key", "value").with_query("flag");
    EXPECT_EQ(request.query.at("key"), std::optional<std::string>("value"));
    EXPECT_FALSE(request.query.at("flag").has_value());
}

TEST(RequestBuilder, WithHeaderChains) {
    Request request = Request{}
                          .with_header("Content-Type", "text/plain")
                          .with_header("X-Trace", "1");
    EXPECT_EQ(request.headers.size(), 2u);
    EXPECT_EQ(request.headers.get("Content-Type"), std::optional<std::string>("text/plain"));
    EXPECT_EQ(request.headers.get("X-Trace"), std::optional<std::string>("1"));
}

TEST(RequestBuilder, SetHeaderLeavesArgumentsIntact) {
    const std::string name = "X-Request-Id";
    std::string value = "abc";
    Request request;
    request.set_header(name, value);
    Request copy = request.with_header(name, "def");
    EXPECT_EQ(name, "X-Request-Id");
    EXPECT_EQ(value, "abc");
    EXPECT_EQ(request.headers.get(name), std::optional<std::string>("abc"));
    EXPECT_EQ(copy.headers.get(name), std::optional<std::string>("def"));
}

TEST(RequestBuilder, WithFragmentEmptyIsAbsent) {
    EXPECT_FALSE(Request{}.with_fragment("").fragment.has_value());
    EXPECT_EQ(Request{}.with_fragment("top").fragment, std::optional<std::string>("top"));
}

TEST(RequestBuilder, WithBodyKeepsEmptyBody) {
    Request request = Request{}.with_body("");
    ASSERT_TRUE(request.body.has_value());
    EXPECT_EQ(*request.body, "");
}

TEST(RequestBuilder, SettersMutateInPlace) {
    Request request;
    request.set_method("DELETE");
    request.set_path("items/1");
    request.set_query("force", std::string("true"));
    request.set_fragment(std::string("x"));
    request.set_header("Authorization", "token");
    request.set_body(std::string("{}"));

    EXPECT_EQ(request.method, "DELETE");
    EXPECT_EQ(request.path, "/items/1");
    EXPECT_EQ(request.query.at("force"), std::optional<std::string>("true"));
    EXPECT_EQ(request.fragment, std::optional<std::string>("x"));
    EXPECT_TRUE(request.headers.has("Authorization"));
    EXPECT_EQ(request.body, std::optional<std::string>("{}"));

    request.set_fragment(std::nullopt);
    request.set_body(std::nullopt);
    EXPECT_FALSE(request.fragment.has_value());
    EXPECT_FALSE(request.body.has_value());
}

TEST(RequestBuilder, EqualityComparesEveryField) {
    Request a = parse_request("/p?k=v#f").with_header("h", "1").with_body("b");
    Request b = a;
    EXPECT_EQ(a, b);
    EXPECT_NE(a, b.with_method("PUT"));
    EXPECT_NE(a, b.with_path("/q"));
    EXPECT_NE(a, b.with_query("k"));
    EXPECT_NE(a, b.with_fragment("g"));
    EXPECT_NE(a, b.with_header("h", "2"));
    EXPECT_NE(a, b.with_body("c"));
}

// =============================================================================
// Rendering
// =============================================================================
TEST(RequestRendering, DefaultRequest) {
    EXPECT_EQ(Request{}.to_string(), "[GET /]");
}

TEST(RequestRendering, QueryAndFragment) {
    EXPECT_EQ(parse_request("/path?key=value&flag#hash").to_string(),
              "[GET /path?flag&key=value#hash]");
}

TEST(RequestRendering, HeadersAndBody) {
    Request request = parse_request("/submit")
                          .with_method("POST")
                          .with_header("b-header", "2")
                          .with_header("a-header", "1")
                          .with_body("payload");
    EXPECT_EQ(request.to_string(),
              "[POST /submit | with headers {\"a-header\" = \"1\", \"b-header\" = \"2\"}"
              " | with body \"payload\"]");
}

TEST(RequestRendering, MethodRenderedVerbatim) {
    EXPECT_EQ(Request{}.with_method("patch").to_string(), "[patch /]");
}

TEST(RequestRendering, StreamOperatorMatchesToString) {
    Request request = parse_request("/a?b=c").with_body("");
    std::ostringstream oss;
    oss << request;
    EXPECT_EQ(oss.str(), request.to_string());
    EXPECT_EQ(oss.str(), "[GET /a?b=c | with body \"\"]");
}

// =============================================================================
// HeaderMap
// =============================================================================
TEST(HeaderMapTest, SetAndGet) {
    HeaderMap map;
    map.set("Content-Type", "text/html");
    EXPECT_EQ(map.get("Content-Type"), std::optional<std::string>("text/html"));
}

TEST(HeaderMapTest, NamesAreCaseSensitive) {
    HeaderMap map;
    map.set("Content-Type", "text/html");
    EXPECT_FALSE(map.has("content-type"));
    EXPECT_FALSE(map.get("CONTENT-TYPE").has_value());
}

TEST(HeaderMapTest, SetOverwritesPreviousValue) {
    HeaderMap map;
    map.set("Accept", "text/html");
    map.set("Accept", "application/json");
    EXPECT_EQ(map.size(), 1u);
    EXPECT_EQ(map.get("Accept"), std::optional<std::string>("application/json"));
}

TEST(HeaderMapTest, RemoveAndEmpty) {
    HeaderMap map;
    EXPECT_TRUE(map.empty());
    map.set("X-A", "1");
    EXPECT_FALSE(map.empty());
    map.remove("X-A");
    EXPECT_TRUE(map.empty());
    map.remove("X-Missing");
    EXPECT_EQ(map.size(), 0u);
}

TEST(HeaderMapTest, IteratesInNameOrder) {
    HeaderMap map;
    map.set("b", "2");
    map.set("a", "1");
    map.set("c", "3");
    std::string names;
    for (const auto& [name, value] : map) {
        names += name;
    }
    EXPECT_EQ(names, "abc");
}
