#ifndef ROUTEKIT_HTTP_RESPONSE_HPP
#define ROUTEKIT_HTTP_RESPONSE_HPP

#include <memory>
#include <string>
#include <cstdint>
#include "headers.hpp"

namespace routekit::http {

class http_response : public headers {

public:

    // the status of the http_response.
    enum class status {
        switching_protocols = 101,
        ok = 200,
        created = 201,
        accepted = 202,
        no_content = 204,
        multiple_choices = 300,
        moved_permanently = 301,
        moved_temporarily = 302,
        not_modified = 304,
        temporary_redirect = 307,
        permanent_redirect = 308,
        bad_request = 400,
        unauthorized = 401,
        forbidden = 403,
        not_found = 404,
        not_allowed = 405,
        timed_out = 408,
        conflict = 409,
        length_required = 411,
        payload_too_large = 413,
        upgrade_required = 426,
        too_many_requests = 429,
        internal_server_error = 500,
        not_implemented = 501,
        bad_gateway = 502,
        service_unavailable = 503
    };

    http_response();
    explicit http_response(status status_code);
    ~http_response() override = default;

    // some setters
    void set_content(std::string content);
    void set_content(std::string content, std::string content_type);
    void set_content_type(std::string content_type);
    void clear_content();

    void set_status(uint16_t status_code);
    void set_status(status status_code);

    // some getters
    const std::string& get_content() const;
    std::string& get_content();
    size_t get_content_size() const;
    status get_status() const;
    int get_status_code() const;
    const std::string& get_reason_phrase() const;
    bool is_ok() const;
    bool is_redirect_response() const;

    // log
    void log(const char* scope) const override;

    // factory methods
    static std::shared_ptr<http_response> stock_http_reply(http_response::status status_code);

private:
    std::string content_;
    status status_ = status::ok;
};

}

#endif
