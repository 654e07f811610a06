#include <catch2/catch_test_macros.hpp>

#include "voice_bridge/utils/http.hpp"

#include <string>

TEST_CASE("url_encode escapes reserved characters") {
    const std::string input = "hello world!";
    const std::string expected = "hello%20world%21";
    REQUIRE(voice_bridge::utils::url_encode(input) == expected);
}

TEST_CASE("parse_url splits scheme host port and path") {
    std::string scheme;
    std::string host;
    std::string base_path;
    int port = 0;
    voice_bridge::utils::parse_url("https://example.com:8443/path/file",
                                   scheme, host, port, base_path);
    REQUIRE(scheme == "https");
    REQUIRE(host == "example.com");
    REQUIRE(port == 8443);
    REQUIRE(base_path == "/path/file");
}

TEST_CASE("parse_url defaults websocket ports") {
    std::string scheme;
    std::string host;
    std::string base_path;
    int port = 0;
    voice_bridge::utils::parse_url("wss://api.hume.ai/v0/evi/chat?config_id=abc",
                                   scheme, host, port, base_path);
    REQUIRE(scheme == "wss");
    REQUIRE(host == "api.hume.ai");
    REQUIRE(port == 443);
    REQUIRE(base_path == "/v0/evi/chat?config_id=abc");

    voice_bridge::utils::parse_url("ws://localhost", scheme, host, port, base_path);
    REQUIRE(port == 80);
    REQUIRE(base_path == "/");
}

TEST_CASE("build_url omits default ports") {
    REQUIRE(voice_bridge::utils::build_url("https", "api.twilio.com", 443, "/2010-04-01") ==
            "https://api.twilio.com/2010-04-01");
    REQUIRE(voice_bridge::utils::build_url("http", "localhost", 8080, "health") ==
            "http://localhost:8080/health");
}

TEST_CASE("form_encode joins escaped fields") {
    const auto body = voice_bridge::utils::form_encode(
        {{"To", "+447700900123"}, {"Body", "Hi Sam, call us"}});
    REQUIRE(body == "Body=Hi%20Sam%2C%20call%20us&To=%2B447700900123");
}

TEST_CASE("append_query picks the right separator") {
    REQUIRE(voice_bridge::utils::append_query("wss://api.openai.com/v1/realtime", "model",
                                              "gpt-4o-realtime-preview") ==
            "wss://api.openai.com/v1/realtime?model=gpt-4o-realtime-preview");
    REQUIRE(voice_bridge::utils::append_query("wss://host/chat?a=1", "config_id", "x y") ==
            "wss://host/chat?a=1&config_id=x%20y");
}
