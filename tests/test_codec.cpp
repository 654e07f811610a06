#include <catch2/catch_test_macros.hpp>

#include "voice_bridge/audio/codec.hpp"

#include <cstdlib>
#include <string>

using namespace voice_bridge::audio;

TEST_CASE("mu-law reference values") {
    REQUIRE(mulaw_encode(0) == 0xFF);
    REQUIRE(mulaw_decode(0xFF) == 0);
    REQUIRE(mulaw_decode(0x00) == -32124);
    REQUIRE(mulaw_decode(0x80) == 32124);
    REQUIRE(mulaw_encode(32767) == 0x80);
    REQUIRE(mulaw_encode(-32768) == 0x00);
}

TEST_CASE("mu-law decode then encode is stable for every byte") {
    for (int value = 0; value < 256; ++value) {
        const auto byte = static_cast<uint8_t>(value);
        // 0x7F and 0xFF both decode to zero.
        if (byte == 0x7F) {
            continue;
        }
        REQUIRE(mulaw_encode(mulaw_decode(byte)) == byte);
    }
}

TEST_CASE("mu-law quantisation error stays within the segment step") {
    for (int sample : {-20000, -1000, -40, 0, 40, 1000, 20000}) {
        const auto decoded = mulaw_decode(mulaw_encode(static_cast<int16_t>(sample)));
        REQUIRE(std::abs(decoded - sample) <= std::abs(sample) / 16 + 8);
    }
}

TEST_CASE("PCM16 little-endian packing") {
    const PcmBuffer samples{1, -2, 0x1234};
    const auto bytes = pcm_to_le_bytes(samples);
    REQUIRE(bytes == std::string("\x01\x00\xFE\xFF\x34\x12", 6));
    REQUIRE(le_bytes_to_pcm(bytes) == samples);
    REQUIRE_THROWS_AS(le_bytes_to_pcm(std::string("\x01", 1)), CodecError);
}

TEST_CASE("downsample_48k_to_8k keeps every sixth sample") {
    PcmBuffer input;
    for (int i = 0; i < 12; ++i) {
        input.push_back(static_cast<int16_t>(i));
    }
    REQUIRE(downsample_48k_to_8k(input) == PcmBuffer{0, 6});
    REQUIRE(decimate(input, 1) == input);
    REQUIRE_THROWS_AS(decimate(input, 0), CodecError);
}

TEST_CASE("resample_nearest handles non-integer ratios") {
    const PcmBuffer input{1, 2, 3, 4, 5, 6};
    REQUIRE(resample_nearest(input, 12000, 8000) == PcmBuffer{1, 2, 4, 5});
    REQUIRE(resample_nearest(input, 8000, 8000) == input);
    REQUIRE(resample_nearest(PcmBuffer{1, 2, 3, 4}, 16000, 8000) == PcmBuffer{1, 3});
    REQUIRE_THROWS_AS(resample_nearest(input, 0, 8000), CodecError);
}

TEST_CASE("base64 accepts carrier payloads and rejects garbage") {
    const MulawBuffer frame{0xFF, 0x7F, 0x00, 0x80};
    const auto encoded = base64_encode(frame);
    REQUIRE(encoded == "/38AgA==");
    REQUIRE(base64_decode_bytes(encoded) == frame);
    REQUIRE(base64_decode("aGVsbG8=") == "hello");
    REQUIRE(base64_decode("").empty());
    REQUIRE_THROWS_AS(base64_decode("abc"), CodecError);
    REQUIRE_THROWS_AS(base64_decode("ab!d"), CodecError);
    REQUIRE_THROWS_AS(base64_decode("a=bc"), CodecError);
}
