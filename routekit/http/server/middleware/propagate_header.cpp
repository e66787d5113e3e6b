#include "propagate_header.hpp"

#include <algorithm>
#include <boost/algorithm/string/predicate.hpp>

namespace routekit::http::middlewares {

propagate_header& propagate_header::header(std::string key) {
    auto same = [&key](const std::string& other) { return boost::algorithm::iequals(key, other); };
    if (std::none_of(keys_.begin(), keys_.end(), same)) {
        keys_.push_back(std::move(key));
    }
    return *this;
}

endpoint_ptr propagate_header::transform(endpoint_ptr inner) const {
    return inner->around([keys = keys_](std::shared_ptr<request> req, endpoint_ptr next) -> awaitable<response_ptr> {
        std::vector<std::pair<std::string, std::string>> copied;
        auto http_request = req->get_http_request();
        for (const auto& key : keys) {
            for (auto& value : http_request->get_headers_with_key(key)) {
                copied.emplace_back(key, std::move(value));
            }
        }

        auto res = co_await next->call(std::move(req));
        if (res) {
            for (auto& [key, value] : copied) {
                res->add_header(std::move(key), std::move(value));
            }
        }
        co_return res;
    });
}

}
