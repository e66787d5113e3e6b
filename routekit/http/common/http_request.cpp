#include "http_request.hpp"
#include "../util/url.hpp"
#include "../../util/logger.hpp"

namespace routekit::http{

    http_request::http_request(method http_method, std::string uri) : method_(http_method){
        set_uri(std::move(uri));
    }

    void http_request::set_method(method http_method){
        method_ = http_method;
    }

    void http_request::set_method(std::string_view http_method){
        method_ = parse_method(http_method);
    }

    method http_request::get_method() const{
        return method_;
    }

    void http_request::set_uri(std::string uri){
        uri_ = std::move(uri);
        query_params_.clear();

        auto query_start = uri_.find('?');
        if(query_start == std::string::npos){
            path_ = uri_;
            query_.clear();
        }else{
            path_ = uri_.substr(0, query_start);
            query_ = uri_.substr(query_start + 1);
            util::url::parse_url_encoded_data(query_, query_params_);
        }

        if(path_.empty() || path_.front() != '/'){
            path_.insert(path_.begin(), '/');
        }
    }

    const std::string& http_request::get_uri() const{
        return uri_;
    }

    const std::string& http_request::get_path() const{
        return path_;
    }

    const std::string& http_request::get_query() const{
        return query_;
    }

    bool http_request::has_query_parameter(const std::string& key) const{
        return query_params_.contains(key);
    }

    const std::string& http_request::get_query_parameter(const std::string& key) const{
        auto it = query_params_.find(key);
        if(it != query_params_.end()) return it->second;
        static const std::string empty;
        return empty;
    }

    const std::multimap<std::string, std::string>& http_request::get_query_parameters() const{
        return query_params_;
    }

    void http_request::set_content(std::string content){
        content_ = std::move(content);
        set_header(std::string(header::content_length), std::to_string(content_.size()));
    }

    void http_request::set_content(std::string content, std::string content_type){
        set_content(std::move(content));
        set_header(std::string(header::content_type), std::move(content_type));
    }

    const std::string& http_request::get_body() const{
        return content_;
    }

    std::string& http_request::get_body(){
        return content_;
    }

    void http_request::log(const char* scope) const{
        LOG_INFO("[{}] {} {}", scope, http::get_method(method_), uri_);
        headers::log(scope);
        if(!content_.empty()){
            LOG_TRACE("Body: {} bytes", content_.size());
        }
    }

}
