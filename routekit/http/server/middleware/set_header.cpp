#include "set_header.hpp"

namespace routekit::http::middlewares {

set_header& set_header::overriding(std::string key, std::string value) {
    actions_.push_back({true, std::move(key), std::move(value)});
    return *this;
}

set_header& set_header::appending(std::string key, std::string value) {
    actions_.push_back({false, std::move(key), std::move(value)});
    return *this;
}

endpoint_ptr set_header::transform(endpoint_ptr inner) const {
    return inner->after([actions = actions_](http_response& res) {
        for (const auto& action : actions) {
            if (action.replace) {
                res.remove_header(action.key);
                res.add_header(action.key, action.value);
            } else {
                res.add_header(action.key, action.value);
            }
        }
    });
}

}
