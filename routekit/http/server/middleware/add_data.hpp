#ifndef ROUTEKIT_HTTP_MIDDLEWARE_ADD_DATA_HPP
#define ROUTEKIT_HTTP_MIDDLEWARE_ADD_DATA_HPP

#include "../endpoint.hpp"

namespace routekit::http::middlewares {

/**
 * Makes a copy of value available to the wrapped endpoint through request::get_data<T>(). Useful
 * to share application state (a database pool, a configuration...) with handlers.
 */
template<typename T>
class add_data : public middleware {
public:
    explicit add_data(T value) : value_(std::move(value)) {}

    endpoint_ptr transform(endpoint_ptr inner) const override {
        return inner->before([value = value_](request& req) {
            req.set_data<T>(value);
        });
    }

private:
    T value_;
};

}

#endif
