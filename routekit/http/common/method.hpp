#ifndef ROUTEKIT_HTTP_METHOD_HPP
#define ROUTEKIT_HTTP_METHOD_HPP

#include <array>
#include <cstddef>
#include <string>
#include <string_view>

namespace routekit::http{

    enum class method{
        GET,
        POST,
        PUT,
        DELETE,
        HEAD,
        OPTIONS,
        CONNECT,
        PATCH,
        TRACE,
        UNKNOWN
    };

    /// number of routable methods (UNKNOWN excluded)
    inline constexpr std::size_t method_count = static_cast<std::size_t>(method::UNKNOWN);

    inline constexpr std::array<method, method_count> all_methods{
        method::GET, method::POST, method::PUT, method::DELETE, method::HEAD,
        method::OPTIONS, method::CONNECT, method::PATCH, method::TRACE
    };

    const std::string& get_method(method http_method);

    /// case-sensitive, as method tokens are (RFC 9110 9.1)
    method parse_method(std::string_view http_method);

}

#endif
