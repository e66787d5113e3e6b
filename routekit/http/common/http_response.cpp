#include "http_response.hpp"
#include "../../util/logger.hpp"

namespace routekit::http{

    namespace reason_phrases{

        const std::string switching_protocols = "Switching Protocols";
        const std::string ok = "OK";
        const std::string created = "Created";
        const std::string accepted = "Accepted";
        const std::string no_content = "No Content";
        const std::string multiple_choices = "Multiple Choices";
        const std::string moved_permanently = "Moved Permanently";
        const std::string moved_temporarily = "Moved Temporarily";
        const std::string not_modified = "Not Modified";
        const std::string temporary_redirect = "Temporary Redirect";
        const std::string permanent_redirect = "Permanent Redirect";
        const std::string bad_request = "Bad Request";
        const std::string unauthorized = "Unauthorized";
        const std::string forbidden = "Forbidden";
        const std::string not_found = "Not Found";
        const std::string not_allowed = "Method Not Allowed";
        const std::string timed_out = "Request Timeout";
        const std::string conflict = "Conflict";
        const std::string length_required = "Length Required";
        const std::string payload_too_large = "Payload Too Large";
        const std::string upgrade_required = "Upgrade Required";
        const std::string too_many_requests = "Too Many Requests";
        const std::string internal_server_error = "Internal Server Error";
        const std::string not_implemented = "Not Implemented";
        const std::string bad_gateway = "Bad Gateway";
        const std::string service_unavailable = "Service Unavailable";
        const std::string unknown = "Unknown Status";

        const std::string& get_reason_phrase(http_response::status status){
            switch(status){
                case http_response::status::switching_protocols:
                    return switching_protocols;
                case http_response::status::ok:
                    return ok;
                case http_response::status::created:
                    return created;
                case http_response::status::accepted:
                    return accepted;
                case http_response::status::no_content:
                    return no_content;
                case http_response::status::multiple_choices:
                    return multiple_choices;
                case http_response::status::moved_permanently:
                    return moved_permanently;
                case http_response::status::moved_temporarily:
                    return moved_temporarily;
                case http_response::status::not_modified:
                    return not_modified;
                case http_response::status::temporary_redirect:
                    return temporary_redirect;
                case http_response::status::permanent_redirect:
                    return permanent_redirect;
                case http_response::status::bad_request:
                    return bad_request;
                case http_response::status::unauthorized:
                    return unauthorized;
                case http_response::status::forbidden:
                    return forbidden;
                case http_response::status::not_found:
                    return not_found;
                case http_response::status::not_allowed:
                    return not_allowed;
                case http_response::status::timed_out:
                    return timed_out;
                case http_response::status::conflict:
                    return conflict;
                case http_response::status::length_required:
                    return length_required;
                case http_response::status::payload_too_large:
                    return payload_too_large;
                case http_response::status::upgrade_required:
                    return upgrade_required;
                case http_response::status::too_many_requests:
                    return too_many_requests;
                case http_response::status::internal_server_error:
                    return internal_server_error;
                case http_response::status::not_implemented:
                    return not_implemented;
                case http_response::status::bad_gateway:
                    return bad_gateway;
                case http_response::status::service_unavailable:
                    return service_unavailable;
                default:
                    return unknown;
            }
        }
    }

    std::shared_ptr<http_response> http_response::stock_http_reply(http_response::status status_code){
        auto response = std::make_shared<http_response>(status_code);
        // 1xx, 204 and 304 carry no body
        if(status_code == status::switching_protocols || status_code == status::no_content ||
           status_code == status::not_modified){
            return response;
        }
        const auto code = std::to_string(static_cast<int>(status_code));
        const auto& reason = reason_phrases::get_reason_phrase(status_code);
        response->set_content(
            "<html>"
            "<head><title>" + reason + "</title></head>"
            "<body><h1>" + code + " " + reason + "</h1></body>"
            "</html>", "text/html");
        return response;
    }

    http_response::http_response() = default;

    http_response::http_response(status status_code) : status_(status_code){

    }

    bool http_response::is_redirect_response() const{
        return status_ == status::temporary_redirect ||
               status_ == status::moved_temporarily ||
               status_ == status::permanent_redirect ||
               status_ == status::moved_permanently;
    }

    void http_response::set_status(uint16_t status_code){
        status_ = static_cast<status>(status_code);
    }

    void http_response::set_status(http_response::status status_code){
        status_ = status_code;
    }

    http_response::status http_response::get_status() const{
        return status_;
    }

    int http_response::get_status_code() const{
        return static_cast<int>(status_);
    }

    const std::string& http_response::get_reason_phrase() const{
        return reason_phrases::get_reason_phrase(status_);
    }

    bool http_response::is_ok() const{
        return status_>=status::ok && status_<status::multiple_choices;
    }

    const std::string& http_response::get_content() const{
        return content_;
    }

    std::string& http_response::get_content(){
        return content_;
    }

    size_t http_response::get_content_size() const{
        return content_.size();
    }

    void http_response::set_content(std::string content){
        content_ = std::move(content);
        set_header(std::string(header::content_length), std::to_string(content_.size()));
    }

    void http_response::set_content(std::string content, std::string content_type){
        set_content(std::move(content));
        set_content_type(std::move(content_type));
    }

    void http_response::set_content_type(std::string content_type){
        set_header(std::string(header::content_type), std::move(content_type));
    }

    void http_response::clear_content(){
        content_.clear();
    }

    void http_response::log(const char* scope) const{
        LOG_INFO("[{}] {} {}", scope, get_status_code(), get_reason_phrase());

        headers::log(scope);

        // Log body if present (at trace level)
        if(!content_.empty()){
            LOG_TRACE("Body: {} bytes", content_.size());
            if(content_.size() <= 500) {
                LOG_TRACE("  {}", content_);
            } else {
                LOG_TRACE("  {} (truncated)", content_.substr(0, 500));
            }
        }
    }

}
