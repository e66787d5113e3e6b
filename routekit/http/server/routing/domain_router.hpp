#ifndef ROUTEKIT_HTTP_DOMAIN_ROUTER_HPP
#define ROUTEKIT_HTTP_DOMAIN_ROUTER_HPP

#include <memory>
#include <string>
#include <string_view>

#include "routing_error.hpp"
#include "../endpoint.hpp"

namespace routekit::http {

/**
 * Endpoint dispatching on the Host header, usually with a router per domain. Patterns are dot
 * separated labels, compared ignoring case, with the port removed from the host:
 *
 *   "example.com"      exact host
 *   "+.example.com"    '+' matches exactly one label (api.example.com, not a.b.example.com)
 *   "*.example.com"    '*' matches one or more leading labels
 *   "*"                any host, including a missing Host header
 *
 * At each label an exact match is tried first, then '+', then '*'.
 */
class domain_router : public endpoint {
public:
    domain_router();
    ~domain_router() override;

    domain_router(domain_router&&) noexcept;
    domain_router& operator=(domain_router&&) noexcept;

    /// throws registration_error on a malformed or duplicated pattern
    domain_router& at(std::string_view pattern, endpoint_ptr target);

    template<typename F>
    domain_router& at(std::string_view pattern, F&& target) {
        return at(pattern, make_endpoint(std::forward<F>(target)));
    }

    /// endpoint serving host, nullptr if none
    endpoint_ptr find(std::string_view host) const;

    awaitable<response_ptr> call(std::shared_ptr<request> req) const override;

    void set_not_found_handler(endpoint_ptr handler);

    template<typename F>
    void set_not_found_handler(F&& handler) {
        set_not_found_handler(make_endpoint(std::forward<F>(handler)));
    }

    size_t size() const { return size_; }

private:
    struct node;

    std::unique_ptr<node> root_;
    endpoint_ptr not_found_handler_;
    size_t size_ = 0;
};

/// lower-cased host name without its port ("[::1]:80" gives "[::1]")
std::string host_name(std::string_view host);

} // namespace routekit::http

#endif // ROUTEKIT_HTTP_DOMAIN_ROUTER_HPP
