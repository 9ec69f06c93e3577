#pragma once

#include <cstdint>
#include <string>
#include <vector>

// Sample rate of all PCM handed to a Transcriber (whisper's native rate)
static constexpr int DICTATE_SAMPLE_RATE = 16000;

// Per-call decoding settings; engines ignore what they don't support
// (Moonshine is English-only and never translates)
struct decode_options {
    std::string language  = "en";
    bool        translate = false;
    int32_t     n_threads = 4;
    int32_t     audio_ctx = 0;
};

// Speech-to-text backend
class Transcriber {
public:
    virtual ~Transcriber() = default;

    // Transcribe mono float PCM at DICTATE_SAMPLE_RATE with model_id.
    // May block for seconds. Throws std::runtime_error on failure
    // (model load, inference).
    virtual std::string transcribe(const std::string & model_id, const std::vector<float> & pcmf32) = 0;
};
