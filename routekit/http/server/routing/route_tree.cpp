#include "route_tree.hpp"
#include "routing_error.hpp"
#include "../../../util/logger.hpp"

#include <algorithm>
#include <unordered_map>
#include <boost/algorithm/string.hpp>

namespace routekit::http {

struct route_tree::node {
    struct terminal {
        pattern shape;
        method_table methods;
    };

    std::unordered_map<std::string, std::unique_ptr<node>> literals;
    std::vector<std::pair<segment, std::unique_ptr<node>>> regexes;
    std::unique_ptr<node> capture;
    std::unique_ptr<node> wildcard;
    std::unique_ptr<terminal> end;
};

namespace {

    struct lookup_state {
        const std::vector<std::string>& decoded;
        const std::vector<std::string>& keys;
        std::vector<route_tree::candidate>& out;
    };

}

route_tree::route_tree(bool ignore_case) :
    root_(std::make_unique<node>()),
    ignore_case_(ignore_case)
{
}

route_tree::~route_tree() = default;

route_tree::route_tree(route_tree&&) noexcept = default;

route_tree& route_tree::operator=(route_tree&&) noexcept = default;

void route_tree::set_ignore_case(bool ignore_case) {
    if (!empty()) {
        throw registration_error("case sensitivity cannot change once routes are registered");
    }
    ignore_case_ = ignore_case;
}

std::string route_tree::literal_key(std::string_view text) const {
    if (!ignore_case_) return std::string(text);
    return boost::algorithm::to_lower_copy(std::string(text));
}

std::string route_tree::shape_key(const pattern& route) const {
    std::string key;
    for (const auto& seg : route.segments()) {
        key += '/';
        switch (seg.get_kind()) {
            case segment::kind::literal:
                key += 'L';
                key += literal_key(seg.text());
                break;
            case segment::kind::capture_regex:
                key += 'R';
                key += seg.text();
                break;
            case segment::kind::capture:
                key += 'C';
                break;
            case segment::kind::wildcard:
                key += 'W';
                break;
        }
    }
    return key;
}

route_tree::node* route_tree::find_node(const pattern& route) const {
    node* current = root_.get();
    for (const auto& seg : route.segments()) {
        switch (seg.get_kind()) {
            case segment::kind::literal: {
                auto it = current->literals.find(literal_key(seg.text()));
                current = it != current->literals.end() ? it->second.get() : nullptr;
                break;
            }
            case segment::kind::capture_regex: {
                node* next = nullptr;
                for (auto& [regex, child] : current->regexes) {
                    if (regex.text() == seg.text()) {
                        next = child.get();
                        break;
                    }
                }
                current = next;
                break;
            }
            case segment::kind::capture:
                current = current->capture.get();
                break;
            case segment::kind::wildcard:
                current = current->wildcard.get();
                break;
        }
        if (!current) return nullptr;
    }
    return current;
}

route_tree::node& route_tree::get_or_create(const pattern& route) {
    node* current = root_.get();
    for (const auto& seg : route.segments()) {
        std::unique_ptr<node>* child = nullptr;
        switch (seg.get_kind()) {
            case segment::kind::literal:
                child = &current->literals[literal_key(seg.text())];
                break;
            case segment::kind::capture_regex:
                for (auto& [regex, next] : current->regexes) {
                    if (regex.text() == seg.text()) {
                        child = &next;
                        break;
                    }
                }
                if (!child) {
                    if (!current->regexes.empty()) {
                        LOG_WARNING("regex capture {} shares a position with {} other regex(es) in {}, "
                                    "overlapping matches are ranked by regex source",
                                    seg.str(), current->regexes.size(), route.str());
                    }
                    // kept sorted by regex source so lookup order never depends on registration order
                    auto pos = std::find_if(current->regexes.begin(), current->regexes.end(),
                                            [&](const auto& sibling) { return seg.text() < sibling.first.text(); });
                    pos = current->regexes.emplace(pos, seg, nullptr);
                    child = &pos->second;
                }
                break;
            case segment::kind::capture:
                child = &current->capture;
                break;
            case segment::kind::wildcard:
                child = &current->wildcard;
                break;
        }
        if (!*child) *child = std::make_unique<node>();
        current = child->get();
    }
    if (!current->end) {
        current->end = std::make_unique<node::terminal>(node::terminal{route, {}});
    }
    return *current;
}

bool route_tree::contains(std::optional<method> http_method, const pattern& route) const {
    const node* found = find_node(route);
    if (!found || !found->end) return false;
    return http_method ? found->end->methods.contains(*http_method) : found->end->methods.contains_any();
}

bool route_tree::insert(std::optional<method> http_method, route_target_ptr target) {
    if (!target || (http_method && *http_method == method::UNKNOWN)) return false;
    if (contains(http_method, target->route)) return false;

    auto& terminal = *get_or_create(target->route).end;
    bool inserted = http_method ? terminal.methods.insert(*http_method, target)
                                : terminal.methods.insert_any(target);
    if (inserted) entries_.emplace_back(http_method, std::move(target));
    return inserted;
}

namespace {

    template<typename Node>
    void collect(const Node& current, size_t pos, const lookup_state& state) {
        if (pos == state.decoded.size()) {
            if (current.end) state.out.push_back({&current.end->shape, &current.end->methods});
            // a wildcard may capture an empty remainder
            if (current.wildcard && current.wildcard->end) {
                state.out.push_back({&current.wildcard->end->shape, &current.wildcard->end->methods});
            }
            return;
        }

        auto literal = current.literals.find(state.keys[pos]);
        if (literal != current.literals.end()) {
            collect(*literal->second, pos + 1, state);
        }

        for (const auto& [regex, child] : current.regexes) {
            if (regex.matches(state.decoded[pos])) collect(*child, pos + 1, state);
        }

        if (current.capture && !state.decoded[pos].empty()) {
            collect(*current.capture, pos + 1, state);
        }

        if (current.wildcard && current.wildcard->end) {
            state.out.push_back({&current.wildcard->end->shape, &current.wildcard->end->methods});
        }
    }

}

std::vector<route_tree::candidate> route_tree::lookup(const std::vector<std::string_view>& path_segments) const {
    std::vector<std::string> decoded;
    std::vector<std::string> keys;
    decoded.reserve(path_segments.size());
    keys.reserve(path_segments.size());
    for (auto raw : path_segments) {
        decoded.push_back(decode_segment(raw));
        keys.push_back(literal_key(decoded.back()));
    }

    std::vector<candidate> result;
    collect(*root_, 0, lookup_state{decoded, keys, result});
    return result;
}

}
