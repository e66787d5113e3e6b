#include "domain_router.hpp"
#include "../../common/headers.hpp"
#include "../../../util/logger.hpp"

#include <unordered_map>
#include <vector>
#include <boost/algorithm/string.hpp>

namespace routekit::http {

struct domain_router::node {
    std::unordered_map<std::string, std::unique_ptr<node>> named;
    std::unique_ptr<node> plus;
    endpoint_ptr star;
    endpoint_ptr target;
};

namespace {

    std::vector<std::string> split_labels(const std::string& text) {
        std::vector<std::string> labels;
        boost::algorithm::split(labels, text, boost::algorithm::is_any_of("."));
        return labels;
    }

    template<typename Node>
    const endpoint_ptr* match(const Node& current, const std::vector<std::string>& labels, size_t remaining) {
        if (remaining == 0) return current.target ? &current.target : nullptr;

        const auto& label = labels[remaining - 1];
        auto named = current.named.find(label);
        if (named != current.named.end()) {
            if (auto found = match(*named->second, labels, remaining - 1)) return found;
        }

        if (current.plus) {
            if (auto found = match(*current.plus, labels, remaining - 1)) return found;
        }

        return current.star ? &current.star : nullptr;
    }

}

domain_router::domain_router() :
    root_(std::make_unique<node>()),
    not_found_handler_(std::make_shared<status_endpoint>(http_response::status::not_found))
{
}

domain_router::~domain_router() = default;

domain_router::domain_router(domain_router&&) noexcept = default;

domain_router& domain_router::operator=(domain_router&&) noexcept = default;

domain_router& domain_router::at(std::string_view pattern, endpoint_ptr target) {
    if (!target) {
        throw registration_error("domain '" + std::string(pattern) + "' has no handler");
    }

    auto labels = split_labels(boost::algorithm::to_lower_copy(std::string(pattern)));
    for (size_t i = 0; i < labels.size(); ++i) {
        if (labels[i].empty()) {
            throw registration_error("empty label in domain pattern '" + std::string(pattern) + "'");
        }
        if (labels[i] == "*" && i != 0) {
            throw registration_error("'*' must be the first label of domain pattern '" + std::string(pattern) + "'");
        }
    }

    node* current = root_.get();
    for (auto label = labels.rbegin(); label != labels.rend(); ++label) {
        if (*label == "*") {
            if (current->star) throw registration_error("duplicated domain '" + std::string(pattern) + "'");
            current->star = std::move(target);
            ++size_;
            LOG_DEBUG("registered domain {}", pattern);
            return *this;
        }

        auto& child = *label == "+" ? current->plus : current->named[*label];
        if (!child) child = std::make_unique<node>();
        current = child.get();
    }

    if (current->target) throw registration_error("duplicated domain '" + std::string(pattern) + "'");
    current->target = std::move(target);
    ++size_;
    LOG_DEBUG("registered domain {}", pattern);
    return *this;
}

endpoint_ptr domain_router::find(std::string_view host) const {
    auto name = host_name(host);
    if (name.empty()) return root_->star;

    auto labels = split_labels(name);
    auto found = match(*root_, labels, labels.size());
    return found ? *found : nullptr;
}

awaitable<response_ptr> domain_router::call(std::shared_ptr<request> req) const {
    const auto& host = req->header(header::host);
    if (auto target = find(host)) {
        co_return co_await target->call(req);
    }

    LOG_DEBUG("no domain found for host '{}'", host);
    auto res = co_await not_found_handler_->call(req);
    if (!res) {
        LOG_ERROR("not found handler returned no response");
        co_return http_response::stock_http_reply(http_response::status::internal_server_error);
    }
    co_return res;
}

void domain_router::set_not_found_handler(endpoint_ptr handler) {
    if (!handler) throw registration_error("not found handler cannot be empty");
    not_found_handler_ = std::move(handler);
}

std::string host_name(std::string_view host) {
    auto name = boost::algorithm::trim_copy(std::string(host));
    if (!name.empty() && name.front() == '[') {
        auto end = name.find(']');
        if (end != std::string::npos) name.resize(end + 1);
    } else {
        auto port = name.find(':');
        if (port != std::string::npos) name.resize(port);
    }
    // fully qualified form
    if (!name.empty() && name.back() == '.') name.pop_back();
    boost::algorithm::to_lower(name);
    return name;
}

}
