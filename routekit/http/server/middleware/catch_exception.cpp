#include "catch_exception.hpp"
#include "../../../util/logger.hpp"

#include <string>

namespace routekit::http::middlewares {

catch_exception::catch_exception(exception_handler handler) : handler_(std::move(handler)) {}

endpoint_ptr catch_exception::transform(endpoint_ptr inner) const {
    return inner->around([handler = handler_](std::shared_ptr<request> req, endpoint_ptr next) -> awaitable<response_ptr> {
        std::string path = req->path();
        try {
            co_return co_await next->call(std::move(req));
        } catch (const std::exception& e) {
            LOG_ERROR("exception handling {}: {}", path, e.what());
            if (handler) {
                if (auto res = handler(e)) co_return res;
            }
        }
        co_return http_response::stock_http_reply(http_response::status::internal_server_error);
    });
}

}
