#include "method_table.hpp"

namespace routekit::http {

namespace {
    size_t slot(method http_method) {
        return static_cast<size_t>(http_method);
    }
}

bool method_table::insert(method http_method, route_target_ptr target) {
    if (http_method == method::UNKNOWN) return false;
    auto& entry = methods_[slot(http_method)];
    if (entry) return false;
    entry = std::move(target);
    return true;
}

bool method_table::insert_any(route_target_ptr target) {
    if (any_) return false;
    any_ = std::move(target);
    return true;
}

bool method_table::contains(method http_method) const {
    return http_method != method::UNKNOWN && methods_[slot(http_method)] != nullptr;
}

bool method_table::contains_any() const {
    return any_ != nullptr;
}

std::optional<method_table::lookup_result> method_table::find(method http_method, bool head_fallback) const {
    if (contains(http_method)) return lookup_result{methods_[slot(http_method)], false};
    if (any_) return lookup_result{any_, false};
    if (head_fallback && http_method == method::HEAD && contains(method::GET)) {
        return lookup_result{methods_[slot(method::GET)], true};
    }
    return std::nullopt;
}

std::vector<method> method_table::allowed_methods() const {
    std::vector<method> allowed;
    for (auto m : all_methods) {
        if (contains(m)) allowed.push_back(m);
    }
    return allowed;
}

std::vector<std::pair<std::optional<method>, route_target_ptr>> method_table::entries() const {
    std::vector<std::pair<std::optional<method>, route_target_ptr>> result;
    for (auto m : all_methods) {
        if (contains(m)) result.emplace_back(m, methods_[slot(m)]);
    }
    if (any_) result.emplace_back(std::nullopt, any_);
    return result;
}

bool method_table::empty() const {
    return !any_ && allowed_methods().empty();
}

}
