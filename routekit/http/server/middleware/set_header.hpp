#ifndef ROUTEKIT_HTTP_MIDDLEWARE_SET_HEADER_HPP
#define ROUTEKIT_HTTP_MIDDLEWARE_SET_HEADER_HPP

#include <string>
#include <vector>
#include "../endpoint.hpp"

namespace routekit::http::middlewares {

/**
 * Adds headers to every response of the wrapped endpoint, in the order they were configured.
 *
 * Example:
 *   auto ep = handler->with(set_header().overriding("Server", "routekit").appending("X-Tag", "a"));
 */
class set_header : public middleware {
public:
    /// replace any header with the same key
    set_header& overriding(std::string key, std::string value);

    /// add the header, keeping existing ones with the same key
    set_header& appending(std::string key, std::string value);

    endpoint_ptr transform(endpoint_ptr inner) const override;

private:
    struct action {
        bool replace;
        std::string key;
        std::string value;
    };

    std::vector<action> actions_;
};

}

#endif
