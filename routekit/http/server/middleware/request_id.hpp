#ifndef ROUTEKIT_HTTP_MIDDLEWARE_REQUEST_ID_HPP
#define ROUTEKIT_HTTP_MIDDLEWARE_REQUEST_ID_HPP

#include <string>
#include "../endpoint.hpp"
#include "../../common/headers.hpp"

namespace routekit::http::middlewares {

/// Request identifier, available to handlers through request::get_data<request_id_value>()
struct request_id_value {
    std::string id;
};

/**
 * Tags every request with a random UUID, stored as request data and echoed in a response header
 * (X-Request-Id by default). With reuse_incoming set, a non empty id sent by the client in the
 * same header is kept instead.
 */
class request_id : public middleware {
public:
    explicit request_id(std::string header_name = std::string(header::x_request_id));

    request_id& reuse_incoming(bool reuse);

    endpoint_ptr transform(endpoint_ptr inner) const override;

private:
    std::string header_name_;
    bool reuse_incoming_ = false;
};

}

#endif
