#ifndef ROUTEKIT_HTTP_MIDDLEWARE_NORMALIZE_PATH_HPP
#define ROUTEKIT_HTTP_MIDDLEWARE_NORMALIZE_PATH_HPP

#include <string>
#include <string_view>
#include "../endpoint.hpp"

namespace routekit::http::middlewares {

/**
 * Rewrites the request path before the wrapped endpoint sees it: runs of '/' are merged and the
 * trailing slash is trimmed, kept or forced. Routing already ignores empty segments, so this
 * only changes the path handlers observe. request::original_path() is left untouched.
 */
class normalize_path : public middleware {
public:
    enum class trailing_slash {
        trim,
        merge_only,
        always
    };

    explicit normalize_path(trailing_slash style = trailing_slash::trim);

    /// normalized form of path under the configured style
    std::string normalize(std::string_view path) const;

    endpoint_ptr transform(endpoint_ptr inner) const override;

private:
    trailing_slash style_;
};

}

#endif
