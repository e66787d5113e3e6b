#include "request.hpp"

#include <algorithm>
#include <stdexcept>

namespace routekit::http{

    request::request(std::shared_ptr<http_request> http_request) :
        http_request_(std::move(http_request))
    {
        if(!http_request_){
            throw std::invalid_argument("request requires an http_request");
        }
        path_ = http_request_->get_path();
    }

    const std::string& request::operator[](std::string_view param) const{
        for(const auto& [key, value] : params_){
            if(key == param) return value;
        }
        static const std::string empty;
        return empty;
    }

    std::optional<std::string> request::param(std::string_view name) const{
        for(const auto& [key, value] : params_){
            if(key == name) return value;
        }
        return std::nullopt;
    }

    bool request::has(std::string_view param) const{
        return std::any_of(params_.begin(), params_.end(), [&](const auto& entry){
            return entry.first == param;
        });
    }

    bool request::erase(std::string_view param){
        return std::erase_if(params_, [&](const auto& entry){
            return entry.first == param;
        }) > 0;
    }

    std::string request::debug_parameters() const{
        std::string result;
        for(const auto& [key, value] : params_){
            if(!result.empty()) result += ", ";
            result += key;
            result += '=';
            result += value;
        }
        return result;
    }

    void request::set_uri_parameter(const std::string& param, const std::string& value){
        for(auto& entry : params_){
            if(entry.first == param){
                entry.second = value;
                return;
            }
        }
        params_.emplace_back(param, value);
    }

    void request::add_uri_parameters(const path_params& params){
        for(const auto& [key, value] : params){
            set_uri_parameter(key, value);
        }
    }

    const path_params& request::get_uri_parameters() const{
        return params_;
    }

    std::shared_ptr<http_request> request::get_http_request() const{
        return http_request_;
    }

    method request::get_method() const{
        return http_request_->get_method();
    }

    const std::string& request::path() const{
        return path_;
    }

    const std::string& request::original_path() const{
        return http_request_->get_path();
    }

    void request::set_path(std::string path){
        path_ = std::move(path);
    }

    std::string request::query(const std::string& key) const{
        return http_request_->get_query_parameter(key);
    }

    std::string request::query(const std::string& key, const std::string& default_value) const{
        if(!http_request_->has_query_parameter(key)) return default_value;
        return http_request_->get_query_parameter(key);
    }

    const std::string& request::body() const{
        return http_request_->get_body();
    }

    const std::string& request::header(std::string_view key) const{
        return http_request_->get_header(key);
    }

    void request::set_auth_user(const std::string& auth_user){
        auth_user_ = auth_user;
    }

    const std::string& request::get_auth_user() const{
        return auth_user_;
    }

}
