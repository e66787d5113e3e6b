#ifndef ROUTEKIT_HTTP_HPP
#define ROUTEKIT_HTTP_HPP

// Common HTTP types
#include <routekit/http/common/method.hpp>
#include <routekit/http/common/headers.hpp>
#include <routekit/http/common/http_request.hpp>
#include <routekit/http/common/http_response.hpp>

// Utilities
#include <routekit/http/util/url.hpp>
#include <routekit/util/logger.hpp>

#endif // ROUTEKIT_HTTP_HPP
