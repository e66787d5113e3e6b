#include <catch2/catch_test_macros.hpp>
#include <routekit/http_server.hpp>
#include "../../../../fixtures/endpoint_fixture.hpp"

#include <stdexcept>

using namespace routekit::http;
using routekit::http::test::call_sync;
using routekit::http::test::echo;
using routekit::http::test::text;

namespace {

    // endpoint that never answers
    class silent : public endpoint {
    public:
        routekit::awaitable<response_ptr> call(std::shared_ptr<request>) const override {
            co_return nullptr;
        }
    };

}

TEST_CASE("Router registration", "[router][unit]") {
    router r;

    SECTION("Builder syntax") {
        r[method::GET]["/users"] = [](http_response& res) {
            res.set_content("list");
        };
        r[method::POST]["/users"] = [](request& req, http_response& res) {
            res.set_status(http_response::status::created);
            res.set_content(req.body());
        };

        REQUIRE(r.size() == 2);
        REQUIRE(call_sync(r, method::GET, "/users")->get_content() == "list");

        auto created = call_sync(r, method::POST, "/users", "payload");
        REQUIRE(created->get_status() == http_response::status::created);
        REQUIRE(created->get_content() == "payload");
    }

    SECTION("Helper methods") {
        r.get("/a", text("get"))
         .put("/a", text("put"))
         .del("/a", text("delete"))
         .patch("/a", text("patch"));

        REQUIRE(call_sync(r, method::PUT, "/a")->get_content() == "put");
        REQUIRE(call_sync(r, method::DELETE, "/a")->get_content() == "delete");
        REQUIRE(call_sync(r, method::PATCH, "/a")->get_content() == "patch");
    }

    SECTION("Awaitable handlers") {
        r.get("/async", [](request& req, http_response& res) -> routekit::awaitable<void> {
            res.set_content("async " + req.path());
            co_return;
        });
        REQUIRE(call_sync(r, method::GET, "/async")->get_content() == "async /async");
    }

    SECTION("Endpoint handlers returning their own response") {
        r.get("/raw", [](std::shared_ptr<request>) -> routekit::awaitable<response_ptr> {
            co_return http_response::stock_http_reply(http_response::status::accepted);
        });
        REQUIRE(call_sync(r, method::GET, "/raw")->get_status() == http_response::status::accepted);
    }

    SECTION("Duplicated routes are rejected") {
        r.get("/users/:id", text("a"));
        REQUIRE_THROWS_AS(r.get("/users/:id", text("b")), registration_error);
        // same shape, different capture name
        REQUIRE_THROWS_AS(r.get("/users/:name", text("b")), registration_error);
        // trailing slash does not make a different route
        REQUIRE_THROWS_AS(r.get("/users/:id/", text("b")), registration_error);
        // other method on the same shape is fine
        REQUIRE_NOTHROW(r.post("/users/:name", text("c")));
        // different regex is a different shape
        REQUIRE_NOTHROW(r.get("/users/:id<[0-9]+>", text("d")));
        REQUIRE(r.size() == 3);
    }

    SECTION("Invalid patterns are rejected") {
        REQUIRE_THROWS_AS(r.get("/files/*path/x", text("a")), compile_error);
        REQUIRE_THROWS_AS(r.add(method::UNKNOWN, "/x", text("a")), registration_error);
        REQUIRE_THROWS_AS(r.add(method::GET, "/x", endpoint_ptr{}), registration_error);
        REQUIRE(r.empty());
    }

    SECTION("Routes are listed in registration order") {
        r.post("/b", text("b"));
        r.get("/a/:id<[0-9]+>", text("a"));
        auto routes = r.routes();
        REQUIRE(routes.size() == 2);
        REQUIRE(routes[0].http_method == method::POST);
        REQUIRE(routes[0].route == "/b");
        REQUIRE(routes[1].route == "/a/:id<[0-9]+>");
    }
}

TEST_CASE("Router matching", "[router][unit]") {
    router r;

    SECTION("Captured parameters reach the handler") {
        r.get("/users/:user/devices/:device", echo());
        auto res = call_sync(r, method::GET, "/users/john/devices/d%201");
        REQUIRE(res->get_content() == "/users/john/devices/d%201|user=john, device=d 1");
    }

    SECTION("Trailing and repeated slashes are ignored") {
        r.get("/api/users", text("users"));
        REQUIRE(call_sync(r, method::GET, "/api/users/")->get_content() == "users");
        REQUIRE(call_sync(r, method::GET, "//api//users")->get_content() == "users");
    }

    SECTION("Root route") {
        r.get("/", text("root"));
        REQUIRE(call_sync(r, method::GET, "/")->get_content() == "root");
        REQUIRE(call_sync(r, method::GET, "/x")->get_status() == http_response::status::not_found);
    }

    SECTION("Query string is not part of the path") {
        r.get("/search", [](request& req, http_response& res) {
            res.set_content(req.query("q"));
        });
        REQUIRE(call_sync(r, method::GET, "/search?q=router")->get_content() == "router");
    }

    SECTION("Case sensitive by default") {
        r.get("/About", text("about"));
        REQUIRE(call_sync(r, method::GET, "/about")->get_status() == http_response::status::not_found);
    }

    SECTION("Ignore case") {
        r.set_ignore_case(true);
        r.get("/About", text("about"));
        REQUIRE(call_sync(r, method::GET, "/aBOUT")->get_content() == "about");
        REQUIRE_THROWS_AS(r.get("/about", text("again")), registration_error);
    }

    SECTION("Case policy is fixed once routes exist") {
        r.get("/a", text("a"));
        REQUIRE_THROWS_AS(r.set_ignore_case(true), registration_error);
    }

    SECTION("Wildcard captures the remainder") {
        r.get("/static/*path", echo());
        REQUIRE(call_sync(r, method::GET, "/static/css/app.css")->get_content() == "/static/css/app.css|path=css/app.css");
        REQUIRE(call_sync(r, method::GET, "/static")->get_content() == "/static|path=");
    }
}

TEST_CASE("Router precedence", "[router][unit]") {
    router r;

    SECTION("Literal beats capture whatever the registration order") {
        r.get("/users/:id", text("capture"));
        r.get("/users/me", text("literal"));
        REQUIRE(call_sync(r, method::GET, "/users/me")->get_content() == "literal");
        REQUIRE(call_sync(r, method::GET, "/users/42")->get_content() == "capture");
    }

    SECTION("Regex beats plain capture") {
        r.get("/items/:name", text("name"));
        r.get("/items/:id<[0-9]+>", text("id"));
        REQUIRE(call_sync(r, method::GET, "/items/42")->get_content() == "id");
        REQUIRE(call_sync(r, method::GET, "/items/abc")->get_content() == "name");
    }

    SECTION("Captures beat a wildcard at equal literal count") {
        r.get("/*rest", text("wildcard"));
        r.get("/:a/:b", text("captures"));
        REQUIRE(call_sync(r, method::GET, "/x/y")->get_content() == "captures");
        REQUIRE(call_sync(r, method::GET, "/x/y/z")->get_content() == "wildcard");
        REQUIRE(call_sync(r, method::GET, "/")->get_content() == "wildcard");
    }

    SECTION("More literals win across positions") {
        r.get("/:a/b/c", text("two literals"));
        r.get("/a/:b/:c", text("one literal"));
        REQUIRE(call_sync(r, method::GET, "/a/b/c")->get_content() == "two literals");
        REQUIRE(call_sync(r, method::GET, "/a/x/c")->get_content() == "one literal");
    }

    SECTION("Leftmost specific segment breaks ties") {
        r.get("/:x/a", text("right"));
        r.get("/a/:x", text("left"));
        REQUIRE(call_sync(r, method::GET, "/a/a")->get_content() == "left");
    }

    SECTION("Backtracks when the specific branch has no match further down") {
        r.get("/files/new/edit", text("literal"));
        r.get("/files/:id/view", text("capture"));
        REQUIRE(call_sync(r, method::GET, "/files/new/view")->get_content() == "capture");
    }

    SECTION("Overlapping regexes at one position ignore registration order") {
        router reversed;
        r.get("/item/:id<[0-9]+>", text("any digits"));
        r.get("/item/:n<[0-9]{1,3}>", text("up to three"));
        reversed.get("/item/:n<[0-9]{1,3}>", text("up to three"));
        reversed.get("/item/:id<[0-9]+>", text("any digits"));

        // "[0-9]+" sorts before "[0-9]{1,3}"
        REQUIRE(call_sync(r, method::GET, "/item/12")->get_content() == "any digits");
        REQUIRE(call_sync(reversed, method::GET, "/item/12")->get_content() == "any digits");
        REQUIRE(call_sync(reversed, method::GET, "/item/12345")->get_content() == "any digits");
    }

    SECTION("A less specific route serves methods the best one lacks") {
        r.post("/users/me", text("post me"));
        r.get("/users/:id", text("get id"));
        REQUIRE(call_sync(r, method::GET, "/users/me")->get_content() == "get id");
        REQUIRE(call_sync(r, method::POST, "/users/me")->get_content() == "post me");
    }
}

TEST_CASE("Router unmatched requests", "[router][unit]") {
    router r;
    r.get("/users", text("list"));
    r.post("/users", text("create"));

    SECTION("Unknown path is 404") {
        auto res = call_sync(r, method::GET, "/nothing");
        REQUIRE(res->get_status() == http_response::status::not_found);
    }

    SECTION("Known path with another method is 405 with Allow") {
        auto res = call_sync(r, method::DELETE, "/users");
        REQUIRE(res->get_status() == http_response::status::not_allowed);
        REQUIRE(res->get_header("Allow") == "GET, POST, HEAD");
    }

    SECTION("Allow header can be disabled") {
        r.set_allow_header(false);
        auto res = call_sync(r, method::DELETE, "/users");
        REQUIRE(res->get_status() == http_response::status::not_allowed);
        REQUIRE_FALSE(res->has_header("Allow"));
    }

    SECTION("Allow collects methods of every matching route") {
        r.put("/:collection", text("put"));
        auto res = call_sync(r, method::DELETE, "/users");
        REQUIRE(res->get_header("Allow") == "GET, POST, PUT, HEAD");
    }

    SECTION("Custom not found handler") {
        r.set_not_found_handler([](request& req, http_response& res) {
            res.set_status(http_response::status::not_found);
            res.set_content("missing " + req.path());
        });
        auto res = call_sync(r, method::GET, "/nothing");
        REQUIRE(res->get_status() == http_response::status::not_found);
        REQUIRE(res->get_content() == "missing /nothing");
    }

    SECTION("Custom method not allowed handler keeps the Allow header") {
        r.set_method_not_allowed_handler([](http_response& res) {
            res.set_status(http_response::status::not_allowed);
            res.set_content("nope");
        });
        auto res = call_sync(r, method::PATCH, "/users");
        REQUIRE(res->get_content() == "nope");
        REQUIRE(res->get_header("Allow") == "GET, POST, HEAD");
    }

    SECTION("Fallback handlers answering nothing become 500") {
        endpoint_ptr nothing = std::make_shared<silent>();
        r.set_not_found_handler(nothing);
        r.set_method_not_allowed_handler(nothing);
        REQUIRE(call_sync(r, method::GET, "/nothing")->get_status() == http_response::status::internal_server_error);
        REQUIRE(call_sync(r, method::PATCH, "/users")->get_status() == http_response::status::internal_server_error);
    }

    SECTION("Empty fallback handlers are rejected") {
        REQUIRE_THROWS_AS(r.set_not_found_handler(endpoint_ptr{}), registration_error);
        REQUIRE_THROWS_AS(r.set_method_not_allowed_handler(endpoint_ptr{}), registration_error);
    }
}

TEST_CASE("Router HEAD requests", "[router][unit]") {
    router r;
    r.get("/doc", text("document"));

    SECTION("HEAD is served by GET without a body") {
        auto res = call_sync(r, method::HEAD, "/doc");
        REQUIRE(res->get_status() == http_response::status::ok);
        REQUIRE(res->get_content().empty());
        REQUIRE(res->get_header("Content-Length") == "8");
        REQUIRE(res->get_content_type() == "text/plain");
    }

    SECTION("Explicit HEAD route is preferred") {
        r.head("/doc", [](http_response& res) {
            res.set_header("X-Head", "1");
        });
        auto res = call_sync(r, method::HEAD, "/doc");
        REQUIRE(res->get_header("X-Head") == "1");
    }

    SECTION("Fallback can be disabled") {
        r.set_head_fallback(false);
        auto res = call_sync(r, method::HEAD, "/doc");
        REQUIRE(res->get_status() == http_response::status::not_allowed);
        REQUIRE(res->get_header("Allow") == "GET");
    }
}

TEST_CASE("Router resolve", "[router][unit]") {
    router r;
    r.get("/users/:id<[0-9]+>", text("user"));

    SECTION("Resolved route") {
        auto outcome = r.resolve(method::GET, "/users/7");
        auto* match = std::get_if<resolved>(&outcome);
        REQUIRE(match);
        REQUIRE(match->handler);
        REQUIRE(match->params == path_params{{"id", "7"}});
        REQUIRE(match->path == "/users/7");
        REQUIRE(match->route == "/users/:id<[0-9]+>");
        REQUIRE_FALSE(match->head_fallback);
    }

    SECTION("Not found") {
        REQUIRE(std::holds_alternative<route_not_found>(r.resolve(method::GET, "/users/abc")));
    }

    SECTION("Method not allowed") {
        auto outcome = r.resolve(method::POST, "/users/7");
        auto* not_allowed = std::get_if<method_not_allowed>(&outcome);
        REQUIRE(not_allowed);
        REQUIRE(not_allowed->allowed == std::vector<method>{method::GET, method::HEAD});
    }
}

TEST_CASE("Router handler failures", "[router][unit]") {
    router r;

    SECTION("Exceptions become 500") {
        r.get("/boom", [](http_response&) {
            throw std::runtime_error("boom");
        });
        auto res = call_sync(r, method::GET, "/boom");
        REQUIRE(res->get_status() == http_response::status::internal_server_error);
    }

    SECTION("Exceptions in awaitable handlers become 500") {
        r.get("/boom", [](request&, http_response&) -> routekit::awaitable<void> {
            throw std::runtime_error("boom");
            co_return;
        });
        auto res = call_sync(r, method::GET, "/boom");
        REQUIRE(res->get_status() == http_response::status::internal_server_error);
    }

    SECTION("Missing response becomes 500") {
        r.get("/null", [](std::shared_ptr<request>) -> routekit::awaitable<response_ptr> {
            co_return nullptr;
        });
        auto res = call_sync(r, method::GET, "/null");
        REQUIRE(res->get_status() == http_response::status::internal_server_error);
    }
}

TEST_CASE("Router regex precedence policy", "[router][unit]") {
    router r;
    r.set_regex_precedence(false);
    r.get("/items/:name", text("name"));
    r.get("/items/:id<[0-9]+>", text("id"));

    // without regex precedence, a regex capture only wins ties against a plain capture
    REQUIRE(call_sync(r, method::GET, "/items/42")->get_content() == "id");
    REQUIRE(call_sync(r, method::GET, "/items/abc")->get_content() == "name");
}

TEST_CASE("Router long path segments", "[router][unit]") {
    router r;
    r.get("/item/:id<\\d+>", echo());
    std::string digits(200000, '4');

    SECTION("Matching regex") {
        auto res = call_sync(r, method::GET, "/item/" + digits);
        REQUIRE(res->get_status() == http_response::status::ok);
        REQUIRE(res->get_content() == "/item/" + digits + "|id=" + digits);
    }

    SECTION("Rejecting regex") {
        auto res = call_sync(r, method::GET, "/item/" + digits + "z");
        REQUIRE(res->get_status() == http_response::status::not_found);
    }
}
