#ifndef ROUTEKIT_HTTP_MIDDLEWARE_CATCH_EXCEPTION_HPP
#define ROUTEKIT_HTTP_MIDDLEWARE_CATCH_EXCEPTION_HPP

#include <exception>
#include <functional>
#include "../endpoint.hpp"

namespace routekit::http::middlewares {

using exception_handler = std::function<response_ptr(const std::exception&)>;

/**
 * Turns exceptions thrown by the wrapped endpoint into a response, a 500 stock reply unless a
 * handler is provided.
 */
class catch_exception : public middleware {
public:
    catch_exception() = default;
    explicit catch_exception(exception_handler handler);

    endpoint_ptr transform(endpoint_ptr inner) const override;

private:
    exception_handler handler_;
};

}

#endif
