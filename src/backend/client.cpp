#include "voice_bridge/backend/client.hpp"

#include <utility>

#include "voice_bridge/logging.hpp"
#include "voice_bridge/utils/http.hpp"

namespace voice_bridge {

namespace {

template <typename T>
void set_timeouts(T& client, const ServiceRequestOptions& options) {
    client.set_connection_timeout(options.connect_timeout);
    client.set_read_timeout(options.request_timeout);
    client.set_write_timeout(options.request_timeout);
}

}

ServiceClient::ServiceClient(std::string base_url,
                             std::optional<std::string> bearer_token,
                             ServiceRequestOptions options,
                             std::optional<BasicCredentials> basic_auth)
    : bearer_token_(std::move(bearer_token)),
      basic_auth_(std::move(basic_auth)),
      options_(options) {
    utils::parse_url(base_url, scheme_, host_, port_, base_path_);
    if (base_path_ == "/") {
        base_path_.clear();
    }

    if (scheme_ == "https") {
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
        client_https_ = std::make_unique<httplib::SSLClient>(host_, port_);
#else
        throw ServiceError("HTTPS service requires CPPHTTPLIB_OPENSSL_SUPPORT");
#endif
    } else {
        client_http_ = std::make_unique<httplib::Client>(host_, port_);
    }
    apply_timeouts();
}

nlohmann::json ServiceClient::get_json(const std::string& path) {
    const auto full_path = build_path(path);
    auto headers = make_headers();
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
    if (client_https_) {
        return handle_response(client_https_->Get(full_path, headers), full_path);
    }
#endif
    return handle_response(client_http_->Get(full_path, headers), full_path);
}

nlohmann::json ServiceClient::post_json(const std::string& path, const nlohmann::json& body) {
    const auto full_path = build_path(path);
    auto headers = make_headers();
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
    if (client_https_) {
        return handle_response(
            client_https_->Post(full_path, headers, body.dump(), "application/json"),
            full_path);
    }
#endif
    return handle_response(
        client_http_->Post(full_path, headers, body.dump(), "application/json"), full_path);
}

nlohmann::json ServiceClient::post_form(const std::string& path,
                                        const std::map<std::string, std::string>& fields) {
    const auto full_path = build_path(path);
    const auto body = utils::form_encode(fields);
    auto headers = make_headers();
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
    if (client_https_) {
        return handle_response(
            client_https_->Post(full_path, headers, body, "application/x-www-form-urlencoded"),
            full_path);
    }
#endif
    return handle_response(
        client_http_->Post(full_path, headers, body, "application/x-www-form-urlencoded"),
        full_path);
}

httplib::Headers ServiceClient::make_headers() const {
    httplib::Headers headers{{"Accept", "application/json"}};
    if (bearer_token_) {
        headers.emplace("Authorization", "Bearer " + *bearer_token_);
    } else if (basic_auth_) {
        headers.insert(httplib::make_basic_authentication_header(basic_auth_->username,
                                                                 basic_auth_->password));
    }
    return headers;
}

nlohmann::json ServiceClient::handle_response(const httplib::Result& response,
                                              const std::string& path) const {
    if (!response) {
        logging::error(
            "Service request failed",
            {kv("host", host_),
             kv("path", path),
             kv("error", httplib::to_string(response.error()))});
        throw ServiceError("Service request failed: " + httplib::to_string(response.error()));
    }
    if (response->status == 401 || response->status == 403) {
        throw ServicePermissionError(response->body, response->status);
    }
    if (response->status < 200 || response->status >= 300) {
        logging::warn(
            "Service returned error status",
            {kv("host", host_), kv("path", path), kv("status", response->status)});
        throw ServiceError(response->body, response->status);
    }
    if (response->body.empty()) {
        return nlohmann::json::object();
    }
    return nlohmann::json::parse(response->body);
}

std::string ServiceClient::build_path(const std::string& path) const {
    if (base_path_.empty()) {
        return path;
    }
    if (path.empty()) {
        return base_path_;
    }
    if (base_path_.back() == '/' && path.front() == '/') {
        return base_path_ + path.substr(1);
    }
    if (base_path_.back() != '/' && path.front() != '/') {
        return base_path_ + "/" + path;
    }
    return base_path_ + path;
}

void ServiceClient::apply_timeouts() {
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
    if (client_https_) {
        set_timeouts(*client_https_, options_);
        return;
    }
#endif
    if (client_http_) {
        set_timeouts(*client_http_, options_);
    }
}

}
