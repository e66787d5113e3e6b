#ifndef ROUTEKIT_HTTP_MIDDLEWARE_CORS_HPP
#define ROUTEKIT_HTTP_MIDDLEWARE_CORS_HPP

#include <chrono>
#include <set>
#include <string>
#include <vector>
#include "../endpoint.hpp"
#include "../../common/method.hpp"

namespace routekit::http::middlewares {

/**
 * Cross-origin resource sharing. Preflight requests (OPTIONS with Access-Control-Request-Method)
 * are answered here with 204 and never reach the wrapped endpoint. Other requests get the CORS
 * headers added to their response.
 *
 * With no allowed origin configured every origin is accepted ("*"). Otherwise the request Origin
 * is echoed back when listed, and a preflight from any other origin is rejected with 403.
 */
class cors : public middleware {
public:
    cors();

    cors& allow_origin(std::string origin);
    cors& allow_method(method http_method);
    cors& allow_header(std::string header);
    cors& allow_credentials(bool allow);
    cors& max_age(std::chrono::seconds age);

    endpoint_ptr transform(endpoint_ptr inner) const override;

private:
    std::set<std::string> origins_;
    std::vector<method> methods_;
    std::vector<std::string> headers_;
    bool custom_methods_ = false;
    bool custom_headers_ = false;
    bool credentials_ = false;
    std::chrono::seconds max_age_{86400};
};

}

#endif
