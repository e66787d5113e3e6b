#ifndef ROUTEKIT_HTTP_METHOD_TABLE_HPP
#define ROUTEKIT_HTTP_METHOD_TABLE_HPP

#include <array>
#include <memory>
#include <optional>
#include <vector>

#include "pattern.hpp"
#include "../endpoint.hpp"
#include "../../common/method.hpp"

namespace routekit::http {

/**
 * A handler registered for one method on one route shape. Routes that differ only in their
 * capture names share the same shape, so each target keeps its own pattern for binding.
 */
struct route_target {
    endpoint_ptr handler;
    pattern route;
    /// path positions hidden from the handler (prefixes of mounted routers)
    std::vector<bool> stripped;
};

using route_target_ptr = std::shared_ptr<const route_target>;

/**
 * Method to handler table of a single route shape. A target registered for any method answers
 * every method without its own handler.
 */
class method_table {
public:
    /// false if the method slot is already taken
    bool insert(method http_method, route_target_ptr target);

    /// false if the any method slot is already taken
    bool insert_any(route_target_ptr target);

    bool contains(method http_method) const;
    bool contains_any() const;

    /// exact method, then the any method slot, then GET for HEAD if head_fallback is set
    struct lookup_result {
        route_target_ptr target;
        bool head_fallback = false;
    };
    std::optional<lookup_result> find(method http_method, bool head_fallback) const;

    /// explicitly registered methods, in declaration order
    std::vector<method> allowed_methods() const;

    /// all registered targets, with std::nullopt standing for the any method slot
    std::vector<std::pair<std::optional<method>, route_target_ptr>> entries() const;

    bool empty() const;

private:
    std::array<route_target_ptr, method_count> methods_;
    route_target_ptr any_;
};

} // namespace routekit::http

#endif // ROUTEKIT_HTTP_METHOD_TABLE_HPP
