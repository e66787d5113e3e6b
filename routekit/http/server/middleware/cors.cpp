#include "cors.hpp"
#include "../../common/headers.hpp"

#include <boost/algorithm/string/join.hpp>

namespace routekit::http::middlewares {

namespace {

    struct cors_config {
        std::set<std::string> origins;
        std::string methods;
        std::string headers;
        bool credentials;
        std::string max_age;
    };

    // origin to answer with, empty if the request origin is not allowed
    std::string allowed_origin(const cors_config& config, const request& req) {
        if (config.origins.empty()) return "*";
        const auto& origin = req.header(header::origin);
        if (config.origins.count(origin)) return origin;
        return {};
    }

    void add_cors_headers(const cors_config& config, const std::string& origin, http_response& res) {
        res.set_header(std::string(header::access_control_allow_origin), origin);
        if (origin != "*") res.add_header(std::string(header::vary), "Origin");
        if (config.credentials) {
            res.set_header(std::string(header::access_control_allow_credentials), "true");
        }
    }

}

cors::cors() :
    methods_{method::GET, method::POST, method::PUT, method::DELETE, method::OPTIONS, method::HEAD, method::PATCH},
    headers_{"Content-Type", "Authorization", "X-Requested-With"}
{
}

cors& cors::allow_origin(std::string origin) {
    origins_.insert(std::move(origin));
    return *this;
}

cors& cors::allow_method(method http_method) {
    // the first explicit method replaces the defaults
    if (!custom_methods_) {
        methods_.clear();
        custom_methods_ = true;
    }
    methods_.push_back(http_method);
    return *this;
}

cors& cors::allow_header(std::string header) {
    if (!custom_headers_) {
        headers_.clear();
        custom_headers_ = true;
    }
    headers_.push_back(std::move(header));
    return *this;
}

cors& cors::allow_credentials(bool allow) {
    credentials_ = allow;
    return *this;
}

cors& cors::max_age(std::chrono::seconds age) {
    max_age_ = age;
    return *this;
}

endpoint_ptr cors::transform(endpoint_ptr inner) const {
    std::vector<std::string> method_names;
    for (auto m : methods_) method_names.push_back(get_method(m));

    auto config = std::make_shared<const cors_config>(cors_config{
        origins_,
        boost::algorithm::join(method_names, ", "),
        boost::algorithm::join(headers_, ", "),
        credentials_,
        std::to_string(max_age_.count())
    });

    return inner->around([config](std::shared_ptr<request> req, endpoint_ptr next) -> awaitable<response_ptr> {
        auto origin = allowed_origin(*config, *req);

        if (req->get_method() == method::OPTIONS &&
            req->get_http_request()->has_header(header::access_control_request_method)) {
            if (origin.empty()) {
                co_return http_response::stock_http_reply(http_response::status::forbidden);
            }
            auto res = std::make_shared<http_response>(http_response::status::no_content);
            add_cors_headers(*config, origin, *res);
            res->set_header(std::string(header::access_control_allow_methods), config->methods);
            res->set_header(std::string(header::access_control_allow_headers), config->headers);
            res->set_header(std::string(header::access_control_max_age), config->max_age);
            co_return res;
        }

        auto res = co_await next->call(req);
        if (res && !origin.empty()) add_cors_headers(*config, origin, *res);
        co_return res;
    });
}

}
