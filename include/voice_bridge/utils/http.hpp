#pragma once

#include <map>
#include <string>

namespace voice_bridge::utils {

void parse_url(const std::string& url, std::string& scheme, std::string& host,
               int& port, std::string& base_path);

std::string build_url(const std::string& scheme,
                      const std::string& host,
                      int port,
                      const std::string& path);

std::string url_encode(const std::string& value);

std::string form_encode(const std::map<std::string, std::string>& fields);

std::string append_query(const std::string& url, const std::string& key,
                         const std::string& value);

}
