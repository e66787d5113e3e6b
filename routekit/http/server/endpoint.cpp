#include "endpoint.hpp"
#include "../../util/logger.hpp"

namespace routekit::http {

namespace {

    // every endpoint in a chain must answer, a missing response becomes a 500
    response_ptr ensure_response(response_ptr res, const char* source) {
        if (!res) {
            LOG_ERROR("{} returned no response", source);
            return http_response::stock_http_reply(http_response::status::internal_server_error);
        }
        return res;
    }

    class before_endpoint : public endpoint {
    public:
        before_endpoint(endpoint_ptr inner, before_function fn) :
            inner_(std::move(inner)), fn_(std::move(fn)) {}

        awaitable<response_ptr> call(std::shared_ptr<request> req) const override {
            fn_(*req);
            co_return co_await inner_->call(std::move(req));
        }

    private:
        endpoint_ptr inner_;
        before_function fn_;
    };

    class after_endpoint : public endpoint {
    public:
        after_endpoint(endpoint_ptr inner, after_function fn) :
            inner_(std::move(inner)), fn_(std::move(fn)) {}

        awaitable<response_ptr> call(std::shared_ptr<request> req) const override {
            auto res = ensure_response(co_await inner_->call(std::move(req)), "wrapped endpoint");
            fn_(*res);
            co_return res;
        }

    private:
        endpoint_ptr inner_;
        after_function fn_;
    };

    class around_endpoint : public endpoint {
    public:
        around_endpoint(endpoint_ptr inner, around_function fn) :
            inner_(std::move(inner)), fn_(std::move(fn)) {}

        awaitable<response_ptr> call(std::shared_ptr<request> req) const override {
            co_return ensure_response(co_await fn_(std::move(req), inner_), "around middleware");
        }

    private:
        endpoint_ptr inner_;
        around_function fn_;
    };

}

endpoint_ptr endpoint::with(const middleware& mw) const {
    return mw.transform(shared_from_this());
}

endpoint_ptr endpoint::with_if(bool enable, const middleware& mw) const {
    if (!enable) return shared_from_this();
    return with(mw);
}

endpoint_ptr endpoint::before(before_function fn) const {
    return std::make_shared<before_endpoint>(shared_from_this(), std::move(fn));
}

endpoint_ptr endpoint::after(after_function fn) const {
    return std::make_shared<after_endpoint>(shared_from_this(), std::move(fn));
}

endpoint_ptr endpoint::around(around_function fn) const {
    return std::make_shared<around_endpoint>(shared_from_this(), std::move(fn));
}

endpoint_ptr endpoint::map(map_function fn) const {
    return around([fn = std::move(fn)](std::shared_ptr<request> req, endpoint_ptr next) -> awaitable<response_ptr> {
        auto res = ensure_response(co_await next->call(std::move(req)), "mapped endpoint");
        co_return fn(std::move(res));
    });
}

endpoint_ptr endpoint::and_then(and_then_function fn) const {
    return around([fn = std::move(fn)](std::shared_ptr<request> req, endpoint_ptr next) -> awaitable<response_ptr> {
        auto res = ensure_response(co_await next->call(std::move(req)), "chained endpoint");
        co_return co_await fn(std::move(res));
    });
}

endpoint_ptr endpoint::catch_all_error(error_function fn) const {
    return catch_error<std::exception>(std::move(fn));
}

endpoint_ptr endpoint::inspect_error(inspect_function fn) const {
    return around([fn = std::move(fn)](std::shared_ptr<request> req, endpoint_ptr next) -> awaitable<response_ptr> {
        try {
            co_return co_await next->call(std::move(req));
        } catch (const std::exception& e) {
            fn(e);
            throw;
        }
    });
}

callback_endpoint::callback_endpoint(handler_response_only callback) : callback_(std::move(callback)) {}

callback_endpoint::callback_endpoint(handler_request_response callback) : callback_(std::move(callback)) {}

callback_endpoint::callback_endpoint(handler_awaitable callback) : callback_(std::move(callback)) {}

callback_endpoint::callback_endpoint(handler_endpoint callback) : callback_(std::move(callback)) {}

awaitable<response_ptr> callback_endpoint::call(std::shared_ptr<request> req) const {
    if (std::holds_alternative<handler_endpoint>(callback_)) {
        co_return ensure_response(co_await std::get<handler_endpoint>(callback_)(std::move(req)), "endpoint callback");
    }

    auto res = std::make_shared<http_response>();

    if (std::holds_alternative<handler_response_only>(callback_)) {
        std::get<handler_response_only>(callback_)(*res);
    }
    else if (std::holds_alternative<handler_request_response>(callback_)) {
        std::get<handler_request_response>(callback_)(*req, *res);
    }
    else if (std::holds_alternative<handler_awaitable>(callback_)) {
        co_await std::get<handler_awaitable>(callback_)(*req, *res);
    }

    co_return res;
}

status_endpoint::status_endpoint(http_response::status status_code) : status_(status_code) {}

awaitable<response_ptr> status_endpoint::call(std::shared_ptr<request>) const {
    co_return http_response::stock_http_reply(status_);
}

endpoint_ptr make_endpoint(endpoint_ptr ep) {
    return ep;
}

endpoint_ptr make_endpoint(handler_response_only handler) {
    return std::make_shared<callback_endpoint>(std::move(handler));
}

endpoint_ptr make_endpoint(handler_request_response handler) {
    return std::make_shared<callback_endpoint>(std::move(handler));
}

endpoint_ptr make_endpoint(handler_endpoint handler) {
    return std::make_shared<callback_endpoint>(std::move(handler));
}

} // namespace routekit::http
