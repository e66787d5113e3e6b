#ifndef ROUTEKIT_HTTP_ROUTING_ERROR_HPP
#define ROUTEKIT_HTTP_ROUTING_ERROR_HPP

#include <stdexcept>
#include <string>

namespace routekit::http {

// Build-time routing failures. They are thrown while the application registers its routes and are
// never produced while serving requests.
class routing_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Malformed route pattern: bad regex, misplaced wildcard, duplicated capture name...
class compile_error : public routing_error {
public:
    compile_error(const std::string& pattern, const std::string& reason)
        : routing_error("invalid route pattern '" + pattern + "': " + reason) {}
};

// Route table conflict: duplicated route, capture clash while mounting...
class registration_error : public routing_error {
public:
    using routing_error::routing_error;
};

} // namespace routekit::http

#endif // ROUTEKIT_HTTP_ROUTING_ERROR_HPP
