#ifndef ROUTEKIT_HTTP_MIDDLEWARE_SIZE_LIMIT_HPP
#define ROUTEKIT_HTTP_MIDDLEWARE_SIZE_LIMIT_HPP

#include <cstddef>
#include "../endpoint.hpp"

namespace routekit::http::middlewares {

/**
 * Rejects request bodies larger than max_size bytes. Requests must declare their Content-Length:
 * 411 Length Required when missing, 413 Payload Too Large when above the limit.
 */
class size_limit : public middleware {
public:
    explicit size_limit(size_t max_size);

    endpoint_ptr transform(endpoint_ptr inner) const override;

private:
    size_t max_size_;
};

}

#endif
