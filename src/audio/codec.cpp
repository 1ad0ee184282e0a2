#include "call_relay/audio/codec.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>

namespace call_relay::audio {

namespace {

constexpr int kMulawBias = 0x84;
constexpr int kMulawClip = 32635;

uint16_t read_u16(const std::string& bytes, size_t offset) {
    return static_cast<uint16_t>(static_cast<unsigned char>(bytes[offset]) |
                                 (static_cast<unsigned char>(bytes[offset + 1]) << 8));
}

uint32_t read_u32(const std::string& bytes, size_t offset) {
    return static_cast<uint32_t>(read_u16(bytes, offset)) |
           (static_cast<uint32_t>(read_u16(bytes, offset + 2)) << 16);
}

std::vector<int16_t> pcm16le_to_samples(const std::string& bytes) {
    std::vector<int16_t> samples(bytes.size() / 2);
    for (size_t i = 0; i < samples.size(); ++i) {
        samples[i] = static_cast<int16_t>(read_u16(bytes, i * 2));
    }
    return samples;
}

// Box filter sized to the decimation ratio, applied before downsampling.
std::vector<int16_t> smooth_for_decimation(const std::vector<int16_t>& samples, int width) {
    if (width <= 1 || samples.empty()) {
        return samples;
    }
    std::vector<int16_t> smoothed(samples.size());
    int64_t sum = 0;
    const size_t window = static_cast<size_t>(width);
    for (size_t i = 0; i < samples.size(); ++i) {
        sum += samples[i];
        if (i >= window) {
            sum -= samples[i - window];
        }
        const auto count = static_cast<int64_t>(std::min(i + 1, window));
        smoothed[i] = static_cast<int16_t>(sum / count);
    }
    return smoothed;
}

int parse_pcm_rate(const std::string& source_format) {
    const auto underscore = source_format.find('_');
    if (underscore == std::string::npos) {
        throw AudioFormatError("missing sample rate in audio format: " + source_format);
    }
    try {
        const int rate = std::stoi(source_format.substr(underscore + 1));
        if (rate <= 0) {
            throw AudioFormatError("invalid sample rate in audio format: " + source_format);
        }
        return rate;
    } catch (const std::logic_error&) {
        throw AudioFormatError("invalid sample rate in audio format: " + source_format);
    }
}

std::string samples_to_carrier(const std::vector<int16_t>& samples, int sample_rate) {
    if (sample_rate == kCarrierSampleRate) {
        return encode_mulaw(samples);
    }
    return encode_mulaw(resample_linear(samples, sample_rate, kCarrierSampleRate));
}

}

uint8_t linear_to_mulaw(int16_t sample) {
    int value = sample;
    const int sign = value < 0 ? 0x80 : 0x00;
    if (value < 0) {
        value = -value;
    }
    value = std::min(value, kMulawClip) + kMulawBias;

    int exponent = 7;
    for (int mask = 0x4000; (value & mask) == 0 && exponent > 0; mask >>= 1) {
        --exponent;
    }
    const int mantissa = (value >> (exponent + 3)) & 0x0F;
    return static_cast<uint8_t>(~(sign | (exponent << 4) | mantissa));
}

int16_t mulaw_to_linear(uint8_t value) {
    const int inverted = static_cast<uint8_t>(~value);
    int magnitude = ((inverted & 0x0F) << 3) + kMulawBias;
    magnitude <<= (inverted & 0x70) >> 4;
    return static_cast<int16_t>((inverted & 0x80) ? (kMulawBias - magnitude)
                                                  : (magnitude - kMulawBias));
}

std::string encode_mulaw(const std::vector<int16_t>& samples) {
    std::string encoded;
    encoded.reserve(samples.size());
    for (const auto sample : samples) {
        encoded.push_back(static_cast<char>(linear_to_mulaw(sample)));
    }
    return encoded;
}

std::vector<int16_t> decode_mulaw(const std::string& bytes) {
    std::vector<int16_t> samples;
    samples.reserve(bytes.size());
    for (const auto byte : bytes) {
        samples.push_back(mulaw_to_linear(static_cast<uint8_t>(byte)));
    }
    return samples;
}

std::vector<int16_t> resample_linear(const std::vector<int16_t>& samples,
                                     int source_rate,
                                     int target_rate) {
    if (source_rate <= 0 || target_rate <= 0) {
        throw AudioFormatError("sample rates must be positive");
    }
    if (samples.empty() || source_rate == target_rate) {
        return samples;
    }
    const auto& input = source_rate > target_rate
                            ? smooth_for_decimation(samples, source_rate / target_rate)
                            : samples;
    const auto output_size = static_cast<size_t>(
        (static_cast<uint64_t>(samples.size()) * target_rate) / source_rate);
    std::vector<int16_t> output(output_size);
    const double step = static_cast<double>(source_rate) / target_rate;
    for (size_t i = 0; i < output_size; ++i) {
        const double position = i * step;
        const auto index = static_cast<size_t>(position);
        const double fraction = position - static_cast<double>(index);
        const double current = input[std::min(index, input.size() - 1)];
        const double next = input[std::min(index + 1, input.size() - 1)];
        output[i] = static_cast<int16_t>(std::lround(current + (next - current) * fraction));
    }
    return output;
}

bool is_wav(const std::string& bytes) {
    return bytes.size() >= 12 && bytes.compare(0, 4, "RIFF") == 0 &&
           bytes.compare(8, 4, "WAVE") == 0;
}

WavAudio parse_wav(const std::string& bytes) {
    if (!is_wav(bytes)) {
        throw AudioFormatError("not a RIFF/WAVE buffer");
    }
    uint16_t format = 0;
    uint16_t channels = 0;
    uint32_t sample_rate = 0;
    uint16_t bits_per_sample = 0;
    bool has_format = false;
    size_t offset = 12;
    while (offset + 8 <= bytes.size()) {
        const auto chunk_id = bytes.substr(offset, 4);
        const auto chunk_size = read_u32(bytes, offset + 4);
        const size_t body = offset + 8;
        if (chunk_id == "fmt ") {
            if (chunk_size < 16 || body + 16 > bytes.size()) {
                throw AudioFormatError("truncated WAVE fmt chunk");
            }
            format = read_u16(bytes, body);
            channels = read_u16(bytes, body + 2);
            sample_rate = read_u32(bytes, body + 4);
            bits_per_sample = read_u16(bytes, body + 14);
            has_format = true;
        } else if (chunk_id == "data") {
            if (!has_format || channels == 0 || sample_rate == 0) {
                throw AudioFormatError("WAVE data chunk before a valid fmt chunk");
            }
            const auto available = std::min<size_t>(chunk_size, bytes.size() - body);
            const auto payload = bytes.substr(body, available);
            std::vector<int16_t> interleaved;
            if (format == 1 && bits_per_sample == 16) {
                interleaved = pcm16le_to_samples(payload);
            } else if (format == 7 && bits_per_sample == 8) {
                interleaved = decode_mulaw(payload);
            } else {
                throw AudioFormatError("unsupported WAVE encoding " + std::to_string(format) +
                                       "/" + std::to_string(bits_per_sample));
            }
            WavAudio audio;
            audio.sample_rate = static_cast<int>(sample_rate);
            audio.samples.reserve(interleaved.size() / channels);
            for (size_t i = 0; i + channels <= interleaved.size(); i += channels) {
                int32_t mixed = 0;
                for (uint16_t c = 0; c < channels; ++c) {
                    mixed += interleaved[i + c];
                }
                audio.samples.push_back(static_cast<int16_t>(mixed / channels));
            }
            return audio;
        }
        offset = body + chunk_size + (chunk_size & 1);
    }
    throw AudioFormatError("WAVE buffer has no data chunk");
}

std::string convert_to_carrier(const std::string& bytes, const std::string& source_format) {
    if (is_wav(bytes)) {
        const auto wav = parse_wav(bytes);
        return samples_to_carrier(wav.samples, wav.sample_rate);
    }
    if (source_format == "ulaw_8000" || source_format == "mulaw_8000") {
        return bytes;
    }
    if (source_format.rfind("pcm_", 0) == 0) {
        return samples_to_carrier(pcm16le_to_samples(bytes), parse_pcm_rate(source_format));
    }
    throw AudioFormatError("unsupported audio format: " + source_format);
}

}
