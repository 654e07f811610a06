#include "voice_bridge/utils/http.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace voice_bridge::utils {

namespace {

bool is_secure_scheme(const std::string& scheme) {
    return scheme == "https" || scheme == "wss";
}

}

void parse_url(const std::string& url, std::string& scheme, std::string& host,
               int& port, std::string& base_path) {
    std::string working = url;
    scheme = "http";
    base_path = "";
    host.clear();
    port = 0;

    const auto scheme_pos = working.find("://");
    if (scheme_pos != std::string::npos) {
        scheme = working.substr(0, scheme_pos);
        std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                       [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
        working = working.substr(scheme_pos + 3);
    }

    const auto path_pos = working.find_first_of("/?");
    if (path_pos != std::string::npos) {
        base_path = working.substr(path_pos);
        if (base_path.front() == '?') {
            base_path = "/" + base_path;
        }
        working = working.substr(0, path_pos);
    } else {
        base_path = "/";
    }

    const auto port_pos = working.find(':');
    if (port_pos != std::string::npos) {
        host = working.substr(0, port_pos);
        port = std::stoi(working.substr(port_pos + 1));
    } else {
        host = working;
        port = is_secure_scheme(scheme) ? 443 : 80;
    }
}

std::string build_url(const std::string& scheme,
                      const std::string& host,
                      int port,
                      const std::string& path) {
    std::ostringstream out;
    out << scheme << "://" << host;
    const bool default_port = (is_secure_scheme(scheme) && port == 443) ||
                              (!is_secure_scheme(scheme) && port == 80);
    if (!default_port && port > 0) {
        out << ":" << port;
    }
    if (!path.empty() && path.front() != '/') {
        out << '/';
    }
    out << path;
    return out.str();
}

std::string url_encode(const std::string& value) {
    std::ostringstream escaped;
    escaped << std::hex << std::uppercase;
    for (unsigned char ch : value) {
        if (std::isalnum(ch) || ch == '-' || ch == '_' || ch == '.' || ch == '~') {
            escaped << ch;
        } else {
            escaped << '%' << std::setw(2) << std::setfill('0')
                    << static_cast<int>(ch);
        }
    }
    return escaped.str();
}

std::string form_encode(const std::map<std::string, std::string>& fields) {
    std::string result;
    for (const auto& [key, value] : fields) {
        if (!result.empty()) {
            result += '&';
        }
        result += url_encode(key);
        result += '=';
        result += url_encode(value);
    }
    return result;
}

std::string append_query(const std::string& url, const std::string& key,
                         const std::string& value) {
    const char separator = url.find('?') == std::string::npos ? '?' : '&';
    return url + separator + url_encode(key) + "=" + url_encode(value);
}

}
