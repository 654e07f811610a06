#include "voice_bridge/audio/codec.hpp"

#include <algorithm>
#include <cctype>

#include <websocketpp/base64/base64.hpp>

namespace voice_bridge::audio {

namespace {

constexpr int kMulawBias = 0x84;
constexpr int kMulawClip = 32635;

bool is_base64_char(unsigned char ch) {
    return std::isalnum(ch) || ch == '+' || ch == '/';
}

void validate_base64(const std::string& encoded) {
    if (encoded.size() % 4 != 0) {
        throw CodecError("base64 length is not a multiple of 4");
    }
    size_t padding = 0;
    for (size_t i = 0; i < encoded.size(); ++i) {
        const auto ch = static_cast<unsigned char>(encoded[i]);
        if (ch == '=') {
            ++padding;
            continue;
        }
        if (padding > 0 || !is_base64_char(ch)) {
            throw CodecError("invalid base64 character at offset " + std::to_string(i));
        }
    }
    if (padding > 2) {
        throw CodecError("invalid base64 padding");
    }
}

}

int16_t mulaw_decode(uint8_t value) {
    const int inverted = static_cast<uint8_t>(~value);
    const int sign = inverted & 0x80;
    const int exponent = (inverted >> 4) & 0x07;
    const int mantissa = inverted & 0x0F;
    const int magnitude = (((mantissa << 3) + kMulawBias) << exponent) - kMulawBias;
    return static_cast<int16_t>(sign ? -magnitude : magnitude);
}

uint8_t mulaw_encode(int16_t sample) {
    int value = sample;
    int sign = 0;
    if (value < 0) {
        sign = 0x80;
        value = -value;
    }
    if (value > kMulawClip) {
        value = kMulawClip;
    }
    value += kMulawBias;

    int exponent = 7;
    for (int mask = 0x4000; (value & mask) == 0 && exponent > 0; --exponent, mask >>= 1) {
    }
    const int mantissa = (value >> (exponent + 3)) & 0x0F;
    return static_cast<uint8_t>(~(sign | (exponent << 4) | mantissa));
}

PcmBuffer mulaw_to_pcm(const MulawBuffer& input) {
    PcmBuffer output;
    output.reserve(input.size());
    for (auto byte : input) {
        output.push_back(mulaw_decode(byte));
    }
    return output;
}

MulawBuffer pcm_to_mulaw(const PcmBuffer& input) {
    MulawBuffer output;
    output.reserve(input.size());
    for (auto sample : input) {
        output.push_back(mulaw_encode(sample));
    }
    return output;
}

std::string pcm_to_le_bytes(const PcmBuffer& input) {
    std::string bytes;
    bytes.resize(input.size() * 2);
    for (size_t i = 0; i < input.size(); ++i) {
        const auto value = static_cast<uint16_t>(input[i]);
        bytes[2 * i] = static_cast<char>(value & 0xFF);
        bytes[2 * i + 1] = static_cast<char>((value >> 8) & 0xFF);
    }
    return bytes;
}

PcmBuffer le_bytes_to_pcm(const std::string& bytes) {
    if (bytes.size() % 2 != 0) {
        throw CodecError("PCM16 buffer has odd length");
    }
    PcmBuffer output(bytes.size() / 2);
    for (size_t i = 0; i < output.size(); ++i) {
        const auto lo = static_cast<uint8_t>(bytes[2 * i]);
        const auto hi = static_cast<uint8_t>(bytes[2 * i + 1]);
        output[i] = static_cast<int16_t>(static_cast<uint16_t>(lo | (hi << 8)));
    }
    return output;
}

PcmBuffer decimate(const PcmBuffer& input, size_t factor) {
    if (factor == 0) {
        throw CodecError("decimation factor must be positive");
    }
    if (factor == 1) {
        return input;
    }
    PcmBuffer output;
    output.reserve(input.size() / factor + 1);
    for (size_t i = 0; i < input.size(); i += factor) {
        output.push_back(input[i]);
    }
    return output;
}

PcmBuffer downsample_48k_to_8k(const PcmBuffer& input) {
    return decimate(input, 6);
}

PcmBuffer resample_nearest(const PcmBuffer& input, int from_rate, int to_rate) {
    if (from_rate <= 0 || to_rate <= 0) {
        throw CodecError("sample rates must be positive");
    }
    if (from_rate == to_rate || input.empty()) {
        return input;
    }
    if (from_rate > to_rate && from_rate % to_rate == 0) {
        return decimate(input, static_cast<size_t>(from_rate / to_rate));
    }
    const double ratio = static_cast<double>(from_rate) / to_rate;
    const auto length = static_cast<size_t>(input.size() / ratio);
    PcmBuffer output;
    output.reserve(length);
    for (size_t i = 0; i < length; ++i) {
        const auto index = std::min(static_cast<size_t>(i * ratio), input.size() - 1);
        output.push_back(input[index]);
    }
    return output;
}

std::string base64_encode(const std::string& bytes) {
    return websocketpp::base64_encode(bytes);
}

std::string base64_encode(const MulawBuffer& bytes) {
    return websocketpp::base64_encode(bytes.data(), bytes.size());
}

std::string base64_decode(const std::string& encoded) {
    validate_base64(encoded);
    return websocketpp::base64_decode(encoded);
}

MulawBuffer base64_decode_bytes(const std::string& encoded) {
    const auto decoded = base64_decode(encoded);
    return MulawBuffer(decoded.begin(), decoded.end());
}

}
