#include "request_logger.hpp"
#include "../../../util/logger.hpp"

#include <chrono>

namespace routekit::http::middlewares {

endpoint_ptr request_logger::transform(endpoint_ptr inner) const {
    return inner->around([](std::shared_ptr<request> req, endpoint_ptr next) -> awaitable<response_ptr> {
        auto start = std::chrono::steady_clock::now();
        // the router may strip the path while dispatching
        auto path = req->original_path();
        auto res = co_await next->call(req);
        auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start);
        LOG_INFO("{} {} {} {:.3f}ms", get_method(req->get_method()), path,
                 res ? res->get_status_code() : 0, elapsed.count() / 1000.0);
        co_return res;
    });
}

}
