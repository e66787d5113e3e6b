#include "normalize_path.hpp"

namespace routekit::http::middlewares {

normalize_path::normalize_path(trailing_slash style) : style_(style) {}

std::string normalize_path::normalize(std::string_view path) const {
    if (path.empty()) return std::string(path);

    std::string result;
    result.reserve(path.size() + 1);
    for (auto c : path) {
        if (c == '/' && !result.empty() && result.back() == '/') continue;
        result += c;
    }

    switch (style_) {
        case trailing_slash::trim:
            while (!result.empty() && result.back() == '/') result.pop_back();
            break;
        case trailing_slash::always:
            if (result.back() != '/') result += '/';
            break;
        case trailing_slash::merge_only:
            break;
    }

    return result.empty() ? "/" : result;
}

endpoint_ptr normalize_path::transform(endpoint_ptr inner) const {
    return inner->before([normalizer = *this](request& req) {
        auto path = normalizer.normalize(req.path());
        if (path != req.path()) req.set_path(std::move(path));
    });
}

}
