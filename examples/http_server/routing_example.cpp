#include <routekit/http_server.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <ctime>

using namespace routekit;
using namespace routekit::http::middlewares;

namespace {

    struct app_config {
        std::string name;
        std::string version;
    };

    // Routes of the users API, mounted below /api/:version
    http::router users_api() {
        http::router api;

        // Response-only signature, when the request is not needed
        api[http::method::GET]["/users"] = [](http::http_response& res) {
            res.set_content("user1,user2,user3", "text/plain");
        };

        // User detail, restricted to alphanumeric, underscore, dash, 1-32 chars
        api[http::method::GET]["/users/:user<" ROUTEKIT_ALPHANUM_ID ">"] = [](http::request& req, http::http_response& res) {
            res.set_content("user " + req["user"] + " (api " + req["version"] + ")", "text/plain");
        };

        // Literal routes win over captures, whatever the registration order
        api[http::method::GET]["/users/me"] = [](http::request& req, http::http_response& res) {
            res.set_content("current user: " + req.get_auth_user(), "text/plain");
        };

        api[http::method::POST]["/users"] = [](http::request& req, http::http_response& res) {
            res.set_status(http::http_response::status::created);
            res.set_content(req.body(), "text/plain");
        };

        api[http::method::DELETE]["/users/:user/devices/:device<" ROUTEKIT_ID_PATTERN ">"] = [](http::request& req, http::http_response& res) {
            LOG_INFO("Deleting device {} for user {}", req["device"], req["user"]);
            res.set_status(http::http_response::status::no_content);
        };

        return api;
    }

    // Awaitable handler, the way I/O bound work would be written
    awaitable<void> file_handler(http::request& req, http::http_response& res) {
        res.set_content("file '" + req["path"] + "' (seen as " + req.path() + ")", "text/plain");
        co_return;
    }

}

int main(int argc, char* argv[]) {
    logging::enable();
    LOG_INFO("Starting routing example");

    auto app = std::make_shared<http::router>();

    (*app)[http::method::GET]["/"] = [](http::request& req, http::http_response& res) {
        const auto* config = req.get_data<app_config>();
        res.set_content("Welcome to " + config->name + " " + config->version, "text/plain");
    };

    app->get("/health", [](http::http_response& res) {
        res.set_content("ok " + std::to_string(std::time(nullptr)), "text/plain");
    });

    app->get("/files/*path", file_handler);

    // Everything below /api/:version comes from another router
    app->mount("/api/:version", users_api());

    // An opaque endpoint receiving every method below /admin, behind basic auth
    auto admin = http::make_endpoint([](http::request& req, http::http_response& res) {
        res.set_content("admin area " + req.path() + " for " + req.get_auth_user(), "text/plain");
    })->with(basic_auth("admin", "admin", "secret"));
    app->nest("/admin", admin);

    for (const auto& route : app->routes()) {
        LOG_INFO("  {} {}", route.http_method ? http::get_method(*route.http_method) : "*", route.route);
    }

    // Application wide middlewares, the last one runs first
    auto service = app
        ->with(add_data<app_config>(app_config{"routekit", "1.0.0"}))
        ->with(set_header().overriding("Server", "routekit"))
        ->with(cors())
        ->with(catch_exception())
        ->with(request_logger());

    // Dispatch a few requests in-process, as a connection layer would
    const std::pair<http::method, std::string> requests[] = {
        {http::method::GET, "/"},
        {http::method::GET, "/api/v1/users/me"},
        {http::method::GET, "/api/v1/users/john_doe"},
        {http::method::HEAD, "/api/v2/users"},
        {http::method::DELETE, "/api/v1/users/john/devices/7"},
        {http::method::PUT, "/api/v1/users"},
        {http::method::GET, "/files/docs/readme%20first.txt"},
        {http::method::GET, "/admin/stats"},
        {http::method::GET, "/missing"},
    };

    boost::asio::io_context io_context;
    for (const auto& [method, uri] : requests) {
        auto req = std::make_shared<http::request>(std::make_shared<http::http_request>(method, uri));
        co_spawn(io_context, service->call(req), [uri = uri](std::exception_ptr e, http::response_ptr res) {
            if (e) {
                LOG_ERROR("request {} failed", uri);
                return;
            }
            LOG_INFO("{} -> {} {}", uri, res->get_status_code(), res->get_content());
        });
    }
    io_context.run();

    return 0;
}
