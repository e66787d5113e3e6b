#ifndef ROUTEKIT_HTTP_ROUTE_TREE_HPP
#define ROUTEKIT_HTTP_ROUTE_TREE_HPP

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "method_table.hpp"
#include "pattern.hpp"

namespace routekit::http {

/**
 * Prefix tree over route segments. Every node keeps its literal children in a hash map, so lookup
 * cost depends on the path depth and on how many dynamic branches match, not on the number of
 * registered routes. Routes with the same shape (same literals, regexes, captures and wildcard,
 * whatever their capture names) end in the same terminal node and share a method table.
 */
class route_tree {
public:
    /// a terminal node matching the looked up path
    struct candidate {
        const pattern* shape;
        const method_table* methods;
    };

    /// a registered target, std::nullopt method standing for any method
    using entry = std::pair<std::optional<method>, route_target_ptr>;

    explicit route_tree(bool ignore_case = false);
    ~route_tree();

    route_tree(route_tree&&) noexcept;
    route_tree& operator=(route_tree&&) noexcept;

    /// literals are compared lower-cased when enabled; only allowed while empty
    void set_ignore_case(bool ignore_case);
    bool ignore_case() const { return ignore_case_; }

    /// false if the shape already has a handler for the method
    bool insert(std::optional<method> http_method, route_target_ptr target);

    /// whether insert() would fail for this method and pattern
    bool contains(std::optional<method> http_method, const pattern& route) const;

    /// key identifying a route shape under the current case policy
    std::string shape_key(const pattern& route) const;

    /// every terminal matching the (already split) path, in no particular order
    std::vector<candidate> lookup(const std::vector<std::string_view>& path_segments) const;

    /// registered targets, in registration order
    const std::vector<entry>& entries() const { return entries_; }

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

private:
    struct node;

    node* find_node(const pattern& route) const;
    node& get_or_create(const pattern& route);
    std::string literal_key(std::string_view text) const;

    std::unique_ptr<node> root_;
    std::vector<entry> entries_;
    bool ignore_case_;
};

} // namespace routekit::http

#endif // ROUTEKIT_HTTP_ROUTE_TREE_HPP
