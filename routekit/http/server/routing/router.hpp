#ifndef ROUTEKIT_HTTP_ROUTER_HPP
#define ROUTEKIT_HTTP_ROUTER_HPP

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "route_tree.hpp"
#include "routing_error.hpp"
#include "../endpoint.hpp"

namespace routekit::http {

class route_builder;

/**
 * Request routing outcome. A path that matches some route but none of its methods yields
 * method_not_allowed with the methods that would have been accepted.
 */
struct resolved {
    endpoint_ptr handler;
    path_params params;
    /// path the handler will see, without the prefixes of mounted routers
    std::string path;
    /// HEAD served by a GET handler, the response body must be dropped
    bool head_fallback = false;
    /// pattern that matched, as registered (prefixes included)
    std::string route;
};

struct route_not_found {};

struct method_not_allowed {
    std::vector<method> allowed;
};

using resolution = std::variant<resolved, route_not_found, method_not_allowed>;

/// A registered route, as reported by router::routes()
struct route_info {
    std::optional<method> http_method;
    std::string route;
};

/**
 * Endpoint dispatching requests to the handlers registered for their method and path. When more
 * than one route matches a path, the most specific one wins, whatever the registration order:
 * literals beat regex captures, that beat plain captures, that beat wildcards.
 *
 * Routes are registered while building the application. Once serving, the router is immutable
 * and can be shared between concurrent requests.
 */
class router : public endpoint {
public:
    router();
    ~router() override = default;

    router(router&&) noexcept = default;
    router& operator=(router&&) noexcept = default;

    /// route builder, i.e., router[method::GET]["/users/:id"] = handler
    route_builder operator[](method http_method);

    /// register a handler, throws compile_error or registration_error
    router& add(method http_method, std::string_view route, endpoint_ptr handler);

    template<typename F>
    router& add(method http_method, std::string_view route, F&& handler) {
        return add(http_method, route, make_endpoint(std::forward<F>(handler)));
    }

    template<typename F> router& get(std::string_view route, F&& handler)     { return add(method::GET, route, std::forward<F>(handler)); }
    template<typename F> router& post(std::string_view route, F&& handler)    { return add(method::POST, route, std::forward<F>(handler)); }
    template<typename F> router& put(std::string_view route, F&& handler)     { return add(method::PUT, route, std::forward<F>(handler)); }
    template<typename F> router& del(std::string_view route, F&& handler)     { return add(method::DELETE, route, std::forward<F>(handler)); }
    template<typename F> router& patch(std::string_view route, F&& handler)   { return add(method::PATCH, route, std::forward<F>(handler)); }
    template<typename F> router& head(std::string_view route, F&& handler)    { return add(method::HEAD, route, std::forward<F>(handler)); }
    template<typename F> router& options(std::string_view route, F&& handler) { return add(method::OPTIONS, route, std::forward<F>(handler)); }
    template<typename F> router& connect(std::string_view route, F&& handler) { return add(method::CONNECT, route, std::forward<F>(handler)); }
    template<typename F> router& trace(std::string_view route, F&& handler)   { return add(method::TRACE, route, std::forward<F>(handler)); }

    /**
     * Move every route of child under prefix. The prefix can hold captures but not a wildcard.
     * With strip set, handlers of the child see the path without the prefix. Nothing is
     * registered if any child route conflicts with the existing ones.
     */
    router& mount(std::string_view prefix, router&& child, bool strip = true);

    /// serve prefix and everything below it, for every method, with an opaque endpoint
    router& nest(std::string_view prefix, endpoint_ptr target, bool strip = true);

    template<typename F>
    router& nest(std::string_view prefix, F&& target, bool strip = true) {
        return nest(prefix, make_endpoint(std::forward<F>(target)), strip);
    }

    /// find the handler for a method and path, without calling it
    resolution resolve(method http_method, std::string_view path) const;

    awaitable<response_ptr> call(std::shared_ptr<request> req) const override;

    /// registered routes, in registration order
    std::vector<route_info> routes() const;

    size_t size() const { return tree_.size(); }
    bool empty() const { return tree_.empty(); }

    // configuration
    /// compare literal segments ignoring case; must be set before adding routes
    void set_ignore_case(bool ignore_case);
    /// prefer routes with more regex captures over plain captures (default true)
    void set_regex_precedence(bool enabled);
    /// serve HEAD with the GET handler when there is no HEAD route (default true)
    void set_head_fallback(bool enabled);
    /// add an Allow header to 405 responses (default true)
    void set_allow_header(bool enabled);
    void set_not_found_handler(endpoint_ptr handler);
    void set_method_not_allowed_handler(endpoint_ptr handler);

    template<typename F>
    void set_not_found_handler(F&& handler) {
        set_not_found_handler(make_endpoint(std::forward<F>(handler)));
    }

    template<typename F>
    void set_method_not_allowed_handler(F&& handler) {
        set_method_not_allowed_handler(make_endpoint(std::forward<F>(handler)));
    }

private:
    void insert(std::optional<method> http_method, route_target target);

    route_tree tree_;
    endpoint_ptr not_found_handler_;
    endpoint_ptr method_not_allowed_handler_;
    bool regex_precedence_ = true;
    bool head_fallback_ = true;
    bool allow_header_ = true;
};

/// comma separated method list, as used by the Allow header
std::string join_methods(const std::vector<method>& methods);

} // namespace routekit::http

#endif // ROUTEKIT_HTTP_ROUTER_HPP
