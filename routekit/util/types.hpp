#ifndef ROUTEKIT_TYPES
#define ROUTEKIT_TYPES

#include <functional>
#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>

namespace routekit {

    // Awaitable type alias
    template<typename T = void>
    using awaitable = boost::asio::awaitable<T>;

    // Import commonly used awaitable utilities
    using boost::asio::use_awaitable;
    using boost::asio::co_spawn;
    using boost::asio::detached;

}

#endif
