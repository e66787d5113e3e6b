#include "request_id.hpp"
#include "../../../util/logger.hpp"

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace routekit::http::middlewares {

namespace {

    std::string generate_id() {
        // random_generator is not thread safe, keep one per thread
        thread_local boost::uuids::random_generator generator;
        return boost::uuids::to_string(generator());
    }

}

request_id::request_id(std::string header_name) : header_name_(std::move(header_name)) {}

request_id& request_id::reuse_incoming(bool reuse) {
    reuse_incoming_ = reuse;
    return *this;
}

endpoint_ptr request_id::transform(endpoint_ptr inner) const {
    return inner->around([header_name = header_name_, reuse = reuse_incoming_](std::shared_ptr<request> req, endpoint_ptr next)
                             -> awaitable<response_ptr> {
        std::string id;
        if (reuse) id = req->header(header_name);
        if (id.empty()) id = generate_id();

        LOG_DEBUG("request {} {} tagged as {}", get_method(req->get_method()), req->original_path(), id);
        req->set_data(request_id_value{id});

        auto res = co_await next->call(std::move(req));
        if (res) {
            res->remove_header(header_name);
            res->add_header(header_name, id);
        }
        co_return res;
    });
}

}
