#ifndef ROUTEKIT_HTTP_MIDDLEWARE_PROPAGATE_HEADER_HPP
#define ROUTEKIT_HTTP_MIDDLEWARE_PROPAGATE_HEADER_HPP

#include <string>
#include <vector>
#include "../endpoint.hpp"

namespace routekit::http::middlewares {

/// Copies the configured request headers, every value of each, into the response
class propagate_header : public middleware {
public:
    propagate_header& header(std::string key);

    endpoint_ptr transform(endpoint_ptr inner) const override;

private:
    std::vector<std::string> keys_;
};

}

#endif
