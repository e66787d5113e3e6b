#ifndef ROUTEKIT_HTTP_MIDDLEWARE_BASIC_AUTH_HPP
#define ROUTEKIT_HTTP_MIDDLEWARE_BASIC_AUTH_HPP

#include <functional>
#include <map>
#include <string>
#include "../endpoint.hpp"

namespace routekit::http::middlewares {

// Authentication verification function: returns true if the credentials are valid
using auth_verify_function = std::function<bool(const std::string& username, const std::string& password)>;

/**
 * HTTP Basic authentication (RFC 7617). Requests without valid credentials are answered with 401
 * and a WWW-Authenticate challenge. On success the user name is available through
 * request::get_auth_user().
 */
class basic_auth : public middleware {
public:
    basic_auth(std::string realm, auth_verify_function verify);

    /// single user
    basic_auth(std::string realm, const std::string& username, const std::string& password);

    /// user to password map
    basic_auth(std::string realm, const std::map<std::string, std::string>& users);

    endpoint_ptr transform(endpoint_ptr inner) const override;

private:
    std::string realm_;
    auth_verify_function verify_;
};

}

#endif
