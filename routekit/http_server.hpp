#ifndef ROUTEKIT_HTTP_SERVER_HPP
#define ROUTEKIT_HTTP_SERVER_HPP

#include <routekit/http.hpp>

// Endpoints
#include <routekit/http/server/request.hpp>
#include <routekit/http/server/endpoint.hpp>

// Routing
#include <routekit/http/server/routing/routing_error.hpp>
#include <routekit/http/server/routing/pattern.hpp>
#include <routekit/http/server/routing/router.hpp>
#include <routekit/http/server/routing/route_builder.hpp>
#include <routekit/http/server/routing/domain_router.hpp>

// Middlewares
#include <routekit/http/server/middleware/add_data.hpp>
#include <routekit/http/server/middleware/basic_auth.hpp>
#include <routekit/http/server/middleware/catch_exception.hpp>
#include <routekit/http/server/middleware/cors.hpp>
#include <routekit/http/server/middleware/normalize_path.hpp>
#include <routekit/http/server/middleware/propagate_header.hpp>
#include <routekit/http/server/middleware/request_id.hpp>
#include <routekit/http/server/middleware/request_logger.hpp>
#include <routekit/http/server/middleware/set_header.hpp>
#include <routekit/http/server/middleware/size_limit.hpp>

#endif // ROUTEKIT_HTTP_SERVER_HPP
