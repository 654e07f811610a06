#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include <httplib.h>
#include <nlohmann/json.hpp>

namespace voice_bridge {

class ServiceError : public std::runtime_error {
public:
    ServiceError(const std::string& message, int status = 0)
        : std::runtime_error(message), status_(status) {}

    int status() const { return status_; }

private:
    int status_;
};

class ServicePermissionError : public ServiceError {
public:
    ServicePermissionError(const std::string& message, int status)
        : ServiceError(message, status) {}
};

struct ServiceRequestOptions {
    std::chrono::milliseconds request_timeout{10000};
    std::chrono::milliseconds connect_timeout{5000};
};

struct BasicCredentials {
    std::string username;
    std::string password;
};

// JSON-over-HTTP client for the business API and the carrier's REST API.
class ServiceClient {
public:
    ServiceClient(std::string base_url,
                  std::optional<std::string> bearer_token,
                  ServiceRequestOptions options,
                  std::optional<BasicCredentials> basic_auth = std::nullopt);

    nlohmann::json get_json(const std::string& path);
    nlohmann::json post_json(const std::string& path, const nlohmann::json& body);
    nlohmann::json post_form(const std::string& path,
                             const std::map<std::string, std::string>& fields);

    std::string build_path(const std::string& path) const;

private:
    httplib::Headers make_headers() const;
    nlohmann::json handle_response(const httplib::Result& response,
                                   const std::string& path) const;
    void apply_timeouts();

    std::string scheme_;
    std::string host_;
    int port_ = 0;
    std::string base_path_;
    std::optional<std::string> bearer_token_;
    std::optional<BasicCredentials> basic_auth_;
    ServiceRequestOptions options_;
    std::unique_ptr<httplib::Client> client_http_;
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
    std::unique_ptr<httplib::SSLClient> client_https_;
#endif
};

}
