#ifndef ROUTEKIT_HTTP_ENDPOINT_HPP
#define ROUTEKIT_HTTP_ENDPOINT_HPP

#include <concepts>
#include <exception>
#include <functional>
#include <memory>
#include <utility>
#include <variant>

#include "request.hpp"
#include "../common/http_response.hpp"
#include "../../util/types.hpp"

namespace routekit::http {

class endpoint;
class middleware;

using endpoint_ptr = std::shared_ptr<const endpoint>;
using response_ptr = std::shared_ptr<http_response>;

// Composition callbacks
using before_function = std::function<void(request&)>;
using after_function = std::function<void(http_response&)>;
using around_function = std::function<awaitable<response_ptr>(std::shared_ptr<request>, endpoint_ptr)>;
using map_function = std::function<response_ptr(response_ptr)>;
using and_then_function = std::function<awaitable<response_ptr>(response_ptr)>;
using error_function = std::function<response_ptr(const std::exception&)>;
using inspect_function = std::function<void(const std::exception&)>;

/**
 * Anything that turns a request into a response. Failures are responses too (4xx/5xx), so every
 * composition point has a single return type. Endpoints are shared between concurrent requests
 * and must not keep per-request state.
 *
 * The composition helpers use shared_from_this(), so they are only available on endpoints owned
 * by a std::shared_ptr.
 */
class endpoint : public std::enable_shared_from_this<endpoint> {
public:
    endpoint() = default;
    virtual ~endpoint() = default;

    virtual awaitable<response_ptr> call(std::shared_ptr<request> req) const = 0;

    /// wrap this endpoint with a middleware; the last applied middleware runs first
    endpoint_ptr with(const middleware& mw) const;

    /// same as with(), or this endpoint unchanged when enable is false
    endpoint_ptr with_if(bool enable, const middleware& mw) const;

    /// run fn on the request before calling this endpoint
    endpoint_ptr before(before_function fn) const;

    /// run fn on the response produced by this endpoint
    endpoint_ptr after(after_function fn) const;

    /// fn decides whether and how to call this endpoint (passed as next)
    endpoint_ptr around(around_function fn) const;

    /// replace the response produced by this endpoint with the one returned by fn
    endpoint_ptr map(map_function fn) const;

    /// like map(), for continuations that need to suspend
    endpoint_ptr and_then(and_then_function fn) const;

    /// answer with fn(e) when this endpoint throws an E, other exceptions propagate
    template<typename E>
    endpoint_ptr catch_error(std::function<response_ptr(const E&)> fn) const;

    /// answer with fn(e) for any std::exception thrown by this endpoint
    endpoint_ptr catch_all_error(error_function fn) const;

    /// observe exceptions thrown by this endpoint without handling them
    endpoint_ptr inspect_error(inspect_function fn) const;

    /// make a copy of value available through request::get_data<T>()
    template<typename T>
    endpoint_ptr data(T value) const {
        return before([value = std::move(value)](request& req) {
            req.set_data<T>(value);
        });
    }
};

template<typename E>
endpoint_ptr endpoint::catch_error(std::function<response_ptr(const E&)> fn) const {
    return around([fn = std::move(fn)](std::shared_ptr<request> req, endpoint_ptr next) -> awaitable<response_ptr> {
        try {
            co_return co_await next->call(std::move(req));
        } catch (const E& e) {
            co_return fn(e);
        }
    });
}

/**
 * Transforms an endpoint into another one. Composition happens once, while building the
 * application, and the resulting chain is immutable.
 */
class middleware {
public:
    middleware() = default;
    virtual ~middleware() = default;

    virtual endpoint_ptr transform(endpoint_ptr inner) const = 0;
};

// Handler callbacks accepted by make_endpoint
using handler_response_only = std::function<void(http_response&)>;
using handler_request_response = std::function<void(request&, http_response&)>;
using handler_awaitable = std::function<awaitable<void>(request&, http_response&)>;
using handler_endpoint = std::function<awaitable<response_ptr>(std::shared_ptr<request>)>;

/**
 * Terminal endpoint built from a plain callback. The callback receives a fresh 200 response to
 * fill in.
 */
class callback_endpoint : public endpoint {
public:
    explicit callback_endpoint(handler_response_only callback);
    explicit callback_endpoint(handler_request_response callback);
    explicit callback_endpoint(handler_awaitable callback);
    explicit callback_endpoint(handler_endpoint callback);

    awaitable<response_ptr> call(std::shared_ptr<request> req) const override;

private:
    std::variant<
        handler_response_only,
        handler_request_response,
        handler_awaitable,
        handler_endpoint
    > callback_;
};

/// Endpoint that always answers with a stock reply for the given status
class status_endpoint : public endpoint {
public:
    explicit status_endpoint(http_response::status status);

    awaitable<response_ptr> call(std::shared_ptr<request> req) const override;

private:
    http_response::status status_;
};

endpoint_ptr make_endpoint(endpoint_ptr ep);
endpoint_ptr make_endpoint(handler_response_only handler);
endpoint_ptr make_endpoint(handler_request_response handler);
endpoint_ptr make_endpoint(handler_endpoint handler);

// Awaitable handlers need a template + requires to avoid ambiguity with the
// std::function<void(...)> overloads
template<typename F>
    requires requires(F f, request& req, http_response& res) {
        { f(req, res) } -> std::same_as<awaitable<void>>;
    }
endpoint_ptr make_endpoint(F&& handler) {
    return std::make_shared<callback_endpoint>(handler_awaitable(std::forward<F>(handler)));
}

} // namespace routekit::http

#endif // ROUTEKIT_HTTP_ENDPOINT_HPP
