#ifndef ROUTEKIT_HTTP_MIDDLEWARE_REQUEST_LOGGER_HPP
#define ROUTEKIT_HTTP_MIDDLEWARE_REQUEST_LOGGER_HPP

#include "../endpoint.hpp"

namespace routekit::http::middlewares {

/// Logs method, path, status and elapsed time of every request at info level
class request_logger : public middleware {
public:
    endpoint_ptr transform(endpoint_ptr inner) const override;
};

}

#endif
