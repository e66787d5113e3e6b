#ifndef ROUTEKIT_HTTP_ROUTE_BUILDER_HPP
#define ROUTEKIT_HTTP_ROUTE_BUILDER_HPP

#include <string>
#include <utility>
#include "router.hpp"

namespace routekit::http {

// Pending registration of a method and pattern, completed by assigning a handler
class route_binding {
public:
    route_binding(router& owner, method http_method, std::string route)
        : router_(owner), method_(http_method), route_(std::move(route)) {}

    template<typename F>
    route_binding& operator=(F&& handler) {
        router_.add(method_, route_, std::forward<F>(handler));
        return *this;
    }

    const std::string& route() const { return route_; }

private:
    router& router_;
    method method_;
    std::string route_;
};

class route_builder {
public:
    route_builder(router& owner, method http_method)
        : router_(owner), method_(http_method) {}

    // Start a route with the given pattern
    route_binding operator[](std::string route) {
        return route_binding(router_, method_, std::move(route));
    }

private:
    router& router_;
    method method_;
};

} // namespace routekit::http

#endif // ROUTEKIT_HTTP_ROUTE_BUILDER_HPP
