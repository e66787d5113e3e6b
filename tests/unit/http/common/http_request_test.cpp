#include <catch2/catch_test_macros.hpp>
#include <routekit/http.hpp>

using namespace routekit::http;

// ============================================================================
// method names
// ============================================================================

TEST_CASE("HTTP method names", "[http][request]") {

    SECTION("Every routable method has a name that parses back") {
        for (auto m : all_methods) {
            REQUIRE(parse_method(get_method(m)) == m);
        }
    }

    SECTION("Known names") {
        REQUIRE(get_method(method::DELETE) == "DELETE");
        REQUIRE(parse_method("PATCH") == method::PATCH);
    }

    SECTION("Method tokens are case-sensitive") {
        REQUIRE(parse_method("get") == method::UNKNOWN);
        REQUIRE(parse_method("") == method::UNKNOWN);
        REQUIRE(parse_method("BREW") == method::UNKNOWN);
    }
}

// ============================================================================
// request target
// ============================================================================

TEST_CASE("HTTP request target", "[http][request]") {

    SECTION("Defaults") {
        http_request request;
        REQUIRE(request.get_method() == method::GET);
        REQUIRE(request.get_uri() == "/");
        REQUIRE(request.get_path() == "/");
        REQUIRE(request.get_query().empty());
    }

    SECTION("Path and query are split") {
        http_request request(method::GET, "/search/items?q=hello+world&page=2&tag=a&tag=b");
        REQUIRE(request.get_path() == "/search/items");
        REQUIRE(request.get_query() == "q=hello+world&page=2&tag=a&tag=b");
        REQUIRE(request.has_query_parameter("q"));
        REQUIRE(request.get_query_parameter("q") == "hello world");
        REQUIRE(request.get_query_parameter("page") == "2");
        REQUIRE(request.get_query_parameters().count("tag") == 2);
        REQUIRE_FALSE(request.has_query_parameter("missing"));
        REQUIRE(request.get_query_parameter("missing").empty());
    }

    SECTION("Path is not decoded") {
        http_request request(method::GET, "/files/a%20b");
        REQUIRE(request.get_path() == "/files/a%20b");
    }

    SECTION("Leading slash is added") {
        http_request request(method::GET, "users");
        REQUIRE(request.get_path() == "/users");

        request.set_uri("?only=query");
        REQUIRE(request.get_path() == "/");
        REQUIRE(request.get_query_parameter("only") == "query");
    }

    SECTION("set_uri resets previous query parameters") {
        http_request request(method::GET, "/a?x=1");
        request.set_uri("/b");
        REQUIRE_FALSE(request.has_query_parameter("x"));
    }

    SECTION("Method from string") {
        http_request request;
        request.set_method("PUT");
        REQUIRE(request.get_method() == method::PUT);
        request.set_method("put");
        REQUIRE(request.get_method() == method::UNKNOWN);
    }
}

// ============================================================================
// body
// ============================================================================

TEST_CASE("HTTP request body", "[http][request]") {
    http_request request(method::POST, "/upload");

    SECTION("set_content updates Content-Length") {
        request.set_content("hello");
        REQUIRE(request.get_body() == "hello");
        REQUIRE(request.get_header("Content-Length") == "5");
        REQUIRE(request.get_content_length() == 5u);
    }

    SECTION("set_content with type") {
        request.set_content("{}", "application/json");
        REQUIRE(request.get_content_type() == "application/json");
        REQUIRE(request.is_content_type("application/json"));
    }
}
