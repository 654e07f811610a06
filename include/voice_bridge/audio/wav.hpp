#pragma once

#include <cstdint>
#include <string>

#include "voice_bridge/audio/codec.hpp"

namespace voice_bridge {
namespace audio {

struct WavAudio {
    uint16_t format = 0;
    uint16_t channels = 0;
    uint32_t sample_rate = 0;
    uint16_t bits_per_sample = 0;
    // First channel only.
    PcmBuffer samples;
};

// Parses a RIFF/WAVE PCM16 container. Throws CodecError otherwise.
WavAudio parse_wav(const std::string& bytes);

std::string encode_wav(const PcmBuffer& samples, uint32_t sample_rate);

// WAV of any PCM16 rate to carrier-rate mu-law.
MulawBuffer wav_to_mulaw_8k(const std::string& bytes);

}
}
