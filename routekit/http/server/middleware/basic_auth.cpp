#include "basic_auth.hpp"
#include "../../common/headers.hpp"
#include "../../../util/base64.hpp"
#include "../../../util/logger.hpp"

#include <stdexcept>
#include <boost/algorithm/string/predicate.hpp>

namespace routekit::http::middlewares {

namespace {

    response_ptr unauthorized(const std::string& realm, const std::string& message) {
        auto res = std::make_shared<http_response>(http_response::status::unauthorized);
        res->set_header(std::string(header::www_authenticate), "Basic realm=\"" + realm + "\"");
        res->set_content(message, "text/plain");
        return res;
    }

}

basic_auth::basic_auth(std::string realm, auth_verify_function verify) :
    realm_(std::move(realm)),
    verify_(std::move(verify))
{
    if (!verify_) throw std::invalid_argument("basic auth requires a verify function");
}

basic_auth::basic_auth(std::string realm, const std::string& username, const std::string& password) :
    basic_auth(std::move(realm), [username, password](const std::string& u, const std::string& p) {
        return u == username && p == password;
    })
{
}

basic_auth::basic_auth(std::string realm, const std::map<std::string, std::string>& users) :
    basic_auth(std::move(realm), [users](const std::string& u, const std::string& p) {
        auto it = users.find(u);
        return it != users.end() && it->second == p;
    })
{
}

endpoint_ptr basic_auth::transform(endpoint_ptr inner) const {
    return inner->around([realm = realm_, verify = verify_](std::shared_ptr<request> req, endpoint_ptr next)
                             -> awaitable<response_ptr> {
        const auto& auth_header = req->header(header::authorization);
        if (auth_header.empty()) {
            co_return unauthorized(realm, "Authentication required");
        }

        if (!boost::algorithm::istarts_with(auth_header, "Basic ")) {
            co_return unauthorized(realm, "Invalid authentication");
        }

        // decode base64 credentials
        std::string decoded;
        try {
            decoded = ::routekit::util::base64::decode(std::string_view(auth_header).substr(6));
        } catch (const std::invalid_argument& e) {
            LOG_DEBUG("invalid basic auth credentials: {}", e.what());
            co_return unauthorized(realm, "Invalid credentials format");
        }

        // parse username:password
        auto colon_pos = decoded.find(':');
        if (colon_pos == std::string::npos) {
            co_return unauthorized(realm, "Invalid credentials format");
        }

        std::string username = decoded.substr(0, colon_pos);
        std::string password = decoded.substr(colon_pos + 1);

        if (!verify(username, password)) {
            LOG_DEBUG("rejected basic auth for user '{}'", username);
            co_return unauthorized(realm, "Invalid username or password");
        }

        req->set_auth_user(username);
        co_return co_await next->call(req);
    });
}

}
