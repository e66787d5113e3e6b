#include "size_limit.hpp"
#include "../../../util/logger.hpp"

namespace routekit::http::middlewares {

size_limit::size_limit(size_t max_size) : max_size_(max_size) {}

endpoint_ptr size_limit::transform(endpoint_ptr inner) const {
    return inner->around([max_size = max_size_](std::shared_ptr<request> req, endpoint_ptr next)
                             -> awaitable<response_ptr> {
        auto http_request = req->get_http_request();
        auto length = http_request->get_content_length();
        if (!length) {
            co_return http_response::stock_http_reply(http_response::status::length_required);
        }

        if (*length > max_size || http_request->get_body().size() > max_size) {
            LOG_DEBUG("request body of {} bytes exceeds limit of {}", *length, max_size);
            co_return http_response::stock_http_reply(http_response::status::payload_too_large);
        }

        co_return co_await next->call(req);
    });
}

}
