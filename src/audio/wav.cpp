#include "voice_bridge/audio/wav.hpp"

#include <algorithm>

namespace voice_bridge::audio {

namespace {

constexpr uint16_t kWavFormatPcm = 1;
constexpr uint16_t kWavFormatExtensible = 0xFFFE;

uint16_t read_u16(const std::string& bytes, size_t offset) {
    return static_cast<uint16_t>(static_cast<uint8_t>(bytes[offset]) |
                                 (static_cast<uint8_t>(bytes[offset + 1]) << 8));
}

uint32_t read_u32(const std::string& bytes, size_t offset) {
    return static_cast<uint32_t>(read_u16(bytes, offset)) |
           (static_cast<uint32_t>(read_u16(bytes, offset + 2)) << 16);
}

void write_u16(std::string& out, uint16_t value) {
    out.push_back(static_cast<char>(value & 0xFF));
    out.push_back(static_cast<char>((value >> 8) & 0xFF));
}

void write_u32(std::string& out, uint32_t value) {
    write_u16(out, static_cast<uint16_t>(value & 0xFFFF));
    write_u16(out, static_cast<uint16_t>((value >> 16) & 0xFFFF));
}

}

WavAudio parse_wav(const std::string& bytes) {
    if (bytes.size() < 12 || bytes.compare(0, 4, "RIFF") != 0 ||
        bytes.compare(8, 4, "WAVE") != 0) {
        throw CodecError("not a RIFF/WAVE buffer");
    }

    WavAudio wav;
    bool have_format = false;
    size_t data_offset = 0;
    size_t data_size = 0;
    bool have_data = false;

    size_t offset = 12;
    while (offset + 8 <= bytes.size()) {
        const auto chunk_id = bytes.substr(offset, 4);
        const size_t chunk_size = read_u32(bytes, offset + 4);
        const size_t body = offset + 8;
        if (chunk_id == "fmt ") {
            if (chunk_size < 16 || body + 16 > bytes.size()) {
                throw CodecError("truncated fmt chunk");
            }
            wav.format = read_u16(bytes, body);
            wav.channels = read_u16(bytes, body + 2);
            wav.sample_rate = read_u32(bytes, body + 4);
            wav.bits_per_sample = read_u16(bytes, body + 14);
            have_format = true;
        } else if (chunk_id == "data") {
            data_offset = body;
            // Streaming encoders write 0 or 0xFFFFFFFF when the length is unknown.
            data_size = std::min(chunk_size, bytes.size() - body);
            have_data = true;
            break;
        }
        offset = body + chunk_size + (chunk_size & 1);
    }

    if (!have_format) {
        throw CodecError("WAV has no fmt chunk");
    }
    if (!have_data) {
        throw CodecError("WAV has no data chunk");
    }
    if ((wav.format != kWavFormatPcm && wav.format != kWavFormatExtensible) ||
        wav.bits_per_sample != 16) {
        throw CodecError("WAV is not 16-bit PCM");
    }
    if (wav.channels == 0 || wav.sample_rate == 0) {
        throw CodecError("WAV has invalid channel count or sample rate");
    }
    if (data_size == 0 && bytes.size() > data_offset) {
        data_size = bytes.size() - data_offset;
    }

    const size_t frame_bytes = static_cast<size_t>(wav.channels) * 2;
    const size_t frames = data_size / frame_bytes;
    wav.samples.reserve(frames);
    // Multi-channel frames are downmixed to their mean.
    for (size_t i = 0; i < frames; ++i) {
        int32_t sum = 0;
        for (uint16_t ch = 0; ch < wav.channels; ++ch) {
            sum += static_cast<int16_t>(read_u16(bytes, data_offset + i * frame_bytes + ch * 2));
        }
        wav.samples.push_back(static_cast<int16_t>(sum / wav.channels));
    }
    return wav;
}

std::string encode_wav(const PcmBuffer& samples, uint32_t sample_rate) {
    const auto data_size = static_cast<uint32_t>(samples.size() * 2);
    std::string out;
    out.reserve(44 + data_size);
    out.append("RIFF");
    write_u32(out, 36 + data_size);
    out.append("WAVE");
    out.append("fmt ");
    write_u32(out, 16);
    write_u16(out, kWavFormatPcm);
    write_u16(out, 1);
    write_u32(out, sample_rate);
    write_u32(out, sample_rate * 2);
    write_u16(out, 2);
    write_u16(out, 16);
    out.append("data");
    write_u32(out, data_size);
    out.append(pcm_to_le_bytes(samples));
    return out;
}

MulawBuffer wav_to_mulaw_8k(const std::string& bytes) {
    const auto wav = parse_wav(bytes);
    if (wav.sample_rate == 48000) {
        return pcm_to_mulaw(downsample_48k_to_8k(wav.samples));
    }
    return pcm_to_mulaw(resample_nearest(wav.samples, static_cast<int>(wav.sample_rate),
                                         kCarrierSampleRate));
}

}
