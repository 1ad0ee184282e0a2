#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace call_relay {
namespace audio {

// Carrier media format: G.711 mu-law, 8 kHz, mono.
constexpr int kCarrierSampleRate = 8000;
constexpr unsigned char kMulawSilence = 0xFF;

class AudioFormatError : public std::runtime_error {
public:
    explicit AudioFormatError(const std::string& message) : std::runtime_error(message) {}
};

uint8_t linear_to_mulaw(int16_t sample);
int16_t mulaw_to_linear(uint8_t value);

std::string encode_mulaw(const std::vector<int16_t>& samples);
std::vector<int16_t> decode_mulaw(const std::string& bytes);

std::vector<int16_t> resample_linear(const std::vector<int16_t>& samples,
                                     int source_rate,
                                     int target_rate);

struct WavAudio {
    int sample_rate = 0;
    std::vector<int16_t> samples;
};

// Parses a RIFF/WAVE buffer with PCM16 or mu-law payload, mixing to mono.
WavAudio parse_wav(const std::string& bytes);

bool is_wav(const std::string& bytes);

// Converts synthesized audio to carrier format. source_format is "ulaw_8000",
// "pcm_<rate>" (16-bit little-endian mono) or "wav"; RIFF input is detected
// from its header regardless of source_format.
std::string convert_to_carrier(const std::string& bytes, const std::string& source_format);

}
}
