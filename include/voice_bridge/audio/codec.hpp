#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace voice_bridge {
namespace audio {

class CodecError : public std::runtime_error {
public:
    explicit CodecError(const std::string& message) : std::runtime_error(message) {}
};

using MulawBuffer = std::vector<uint8_t>;
using PcmBuffer = std::vector<int16_t>;

constexpr int kCarrierSampleRate = 8000;

// G.711 mu-law expansion of one byte.
int16_t mulaw_decode(uint8_t value);
// G.711 mu-law compression; magnitudes above 32635 are clipped.
uint8_t mulaw_encode(int16_t sample);

PcmBuffer mulaw_to_pcm(const MulawBuffer& input);
MulawBuffer pcm_to_mulaw(const PcmBuffer& input);

std::string pcm_to_le_bytes(const PcmBuffer& input);
PcmBuffer le_bytes_to_pcm(const std::string& bytes);

// Keeps every factor-th sample. No low-pass filter is applied, so content
// above the new Nyquist frequency aliases.
PcmBuffer decimate(const PcmBuffer& input, size_t factor);
PcmBuffer downsample_48k_to_8k(const PcmBuffer& input);
PcmBuffer resample_nearest(const PcmBuffer& input, int from_rate, int to_rate);

std::string base64_encode(const std::string& bytes);
std::string base64_encode(const MulawBuffer& bytes);
// Throws CodecError on characters outside the alphabet or bad padding.
std::string base64_decode(const std::string& encoded);
MulawBuffer base64_decode_bytes(const std::string& encoded);

}
}
