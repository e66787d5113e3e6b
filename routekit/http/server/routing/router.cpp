#include "router.hpp"
#include "route_builder.hpp"
#include "../../common/headers.hpp"
#include "../../../util/logger.hpp"

#include <algorithm>

namespace routekit::http {

router::router() :
    not_found_handler_(std::make_shared<status_endpoint>(http_response::status::not_found)),
    method_not_allowed_handler_(std::make_shared<status_endpoint>(http_response::status::not_allowed))
{
}

route_builder router::operator[](method http_method) {
    return route_builder(*this, http_method);
}

void router::insert(std::optional<method> http_method, route_target target) {
    if (!target.handler) {
        throw registration_error("route '" + target.route.str() + "' has no handler");
    }
    auto route = target.route.str();
    if (!tree_.insert(http_method, std::make_shared<const route_target>(std::move(target)))) {
        throw registration_error("duplicated route " +
                                 (http_method ? get_method(*http_method) : std::string("*")) + " " + route);
    }
    LOG_DEBUG("registered route {} {}", http_method ? get_method(*http_method) : std::string("*"), route);
}

router& router::add(method http_method, std::string_view route, endpoint_ptr handler) {
    if (http_method == method::UNKNOWN) {
        throw registration_error("cannot register route '" + std::string(route) + "' for an unknown method");
    }
    auto compiled = pattern::compile(route);
    std::vector<bool> stripped(compiled.segments().size(), false);
    insert(http_method, route_target{std::move(handler), std::move(compiled), std::move(stripped)});
    return *this;
}

router& router::mount(std::string_view prefix, router&& child, bool strip) {
    auto compiled_prefix = pattern::compile(prefix);
    if (compiled_prefix.has_wildcard()) {
        throw registration_error("mount prefix '" + std::string(prefix) + "' cannot contain a wildcard");
    }
    if (&child == this) {
        throw registration_error("a router cannot be mounted on itself");
    }

    // build and validate every route before touching the tree
    std::vector<std::pair<std::optional<method>, route_target>> pending;
    std::vector<std::pair<std::optional<method>, std::string>> keys;
    for (const auto& [http_method, target] : child.tree_.entries()) {
        auto route = pattern::concat(compiled_prefix, target->route);

        std::vector<bool> stripped(compiled_prefix.segments().size(), strip);
        stripped.insert(stripped.end(), target->stripped.begin(), target->stripped.end());

        auto key = std::make_pair(http_method, tree_.shape_key(route));
        if (tree_.contains(http_method, route) || std::find(keys.begin(), keys.end(), key) != keys.end()) {
            throw registration_error("duplicated route " +
                                     (http_method ? get_method(*http_method) : std::string("*")) + " " +
                                     route.str() + " while mounting '" + std::string(prefix) + "'");
        }
        keys.push_back(std::move(key));
        pending.emplace_back(http_method, route_target{target->handler, std::move(route), std::move(stripped)});
    }

    for (auto& [http_method, target] : pending) {
        insert(http_method, std::move(target));
    }

    child.tree_ = route_tree(child.tree_.ignore_case());
    return *this;
}

router& router::nest(std::string_view prefix, endpoint_ptr target, bool strip) {
    if (!target) {
        throw registration_error("cannot nest an empty endpoint at '" + std::string(prefix) + "'");
    }
    auto root = pattern::compile(prefix);
    if (root.has_wildcard()) {
        throw registration_error("nest prefix '" + std::string(prefix) + "' cannot contain a wildcard");
    }
    auto below = pattern::concat(root, pattern::compile("*"));

    if (tree_.contains(std::nullopt, root) || tree_.contains(std::nullopt, below)) {
        throw registration_error("duplicated nest at '" + root.str() + "'");
    }

    std::vector<bool> stripped(root.segments().size(), strip);
    insert(std::nullopt, route_target{target, root, stripped});
    stripped.push_back(false);
    insert(std::nullopt, route_target{target, std::move(below), std::move(stripped)});
    return *this;
}

resolution router::resolve(method http_method, std::string_view path) const {
    auto segments = split_path(path);
    auto candidates = tree_.lookup(segments);
    if (candidates.empty()) return route_not_found{};

    std::stable_sort(candidates.begin(), candidates.end(),
                     [this](const route_tree::candidate& a, const route_tree::candidate& b) {
                         return outranks(*a.shape, *b.shape, regex_precedence_);
                     });

    std::vector<method> allowed;
    for (const auto& candidate : candidates) {
        if (auto found = candidate.methods->find(http_method, head_fallback_)) {
            const auto& target = *found->target;
            return resolved{
                target.handler,
                target.route.extract(segments),
                strip_path(path, target.stripped),
                found->head_fallback,
                target.route.str()
            };
        }
        for (auto m : candidate.methods->allowed_methods()) {
            allowed.push_back(m);
        }
    }

    if (head_fallback_ && std::find(allowed.begin(), allowed.end(), method::GET) != allowed.end()) {
        allowed.push_back(method::HEAD);
    }
    std::sort(allowed.begin(), allowed.end());
    allowed.erase(std::unique(allowed.begin(), allowed.end()), allowed.end());
    return method_not_allowed{std::move(allowed)};
}

awaitable<response_ptr> router::call(std::shared_ptr<request> req) const {
    auto outcome = resolve(req->get_method(), req->path());

    if (auto* match = std::get_if<resolved>(&outcome)) {
        LOG_DEBUG("matched route {} for {} {}", match->route, get_method(req->get_method()), req->path());
        req->add_uri_parameters(match->params);
        req->set_path(match->path);

        response_ptr res;
        try {
            res = co_await match->handler->call(req);
        } catch (const std::exception& e) {
            LOG_ERROR("exception handling route {}: {}", match->route, e.what());
        }

        if (!res) {
            res = http_response::stock_http_reply(http_response::status::internal_server_error);
        } else if (match->head_fallback) {
            // keep the headers the GET handler produced, including its Content-Length
            res->clear_content();
        }
        co_return res;
    }

    if (auto* not_allowed = std::get_if<method_not_allowed>(&outcome)) {
        LOG_DEBUG("method {} not allowed for {}", get_method(req->get_method()), req->path());
        auto res = co_await method_not_allowed_handler_->call(req);
        if (!res) {
            LOG_ERROR("method not allowed handler returned no response");
            co_return http_response::stock_http_reply(http_response::status::internal_server_error);
        }
        if (allow_header_ && !res->has_header(header::allow)) {
            res->set_header(std::string(header::allow), join_methods(not_allowed->allowed));
        }
        co_return res;
    }

    LOG_DEBUG("no route found for {} {}", get_method(req->get_method()), req->path());
    auto res = co_await not_found_handler_->call(req);
    if (!res) {
        LOG_ERROR("not found handler returned no response");
        co_return http_response::stock_http_reply(http_response::status::internal_server_error);
    }
    co_return res;
}

std::vector<route_info> router::routes() const {
    std::vector<route_info> result;
    result.reserve(tree_.size());
    for (const auto& [http_method, target] : tree_.entries()) {
        result.push_back({http_method, target->route.str()});
    }
    return result;
}

void router::set_ignore_case(bool ignore_case) {
    tree_.set_ignore_case(ignore_case);
}

void router::set_regex_precedence(bool enabled) {
    regex_precedence_ = enabled;
}

void router::set_head_fallback(bool enabled) {
    head_fallback_ = enabled;
}

void router::set_allow_header(bool enabled) {
    allow_header_ = enabled;
}

void router::set_not_found_handler(endpoint_ptr handler) {
    if (!handler) throw registration_error("not found handler cannot be empty");
    not_found_handler_ = std::move(handler);
}

void router::set_method_not_allowed_handler(endpoint_ptr handler) {
    if (!handler) throw registration_error("method not allowed handler cannot be empty");
    method_not_allowed_handler_ = std::move(handler);
}

std::string join_methods(const std::vector<method>& methods) {
    std::string result;
    for (auto m : methods) {
        if (!result.empty()) result += ", ";
        result += get_method(m);
    }
    return result;
}

}
