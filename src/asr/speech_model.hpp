#pragma once
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace asr {

struct WhisperSegment {
    std::string text;
    int64_t t0_ms;  // start time in milliseconds
    int64_t t1_ms;  // end time in milliseconds
};

// Progress in percent (0-100), called from the inference thread.
using ProgressCallback = std::function<void(int percent)>;

// Pretrained speech-to-text model. load() and transcribe() block and are
// called from a worker thread, never concurrently with each other.
// abort() may be called from any thread.
class ISpeechModel {
public:
    virtual ~ISpeechModel() = default;

    virtual std::string name() const = 0;
    virtual bool is_loaded() const = 0;

    // Returns false with a human-readable reason in error.
    virtual bool load(std::string& error) = 0;

    // pcm_16k: mono float samples in [-1, 1] at 16 kHz.
    virtual bool transcribe(const std::vector<float>& pcm_16k,
                            std::vector<WhisperSegment>& segments,
                            std::string& error,
                            const ProgressCallback& on_progress) = 0;

    // Best effort: ask an in-flight transcribe() to return early. The request
    // stays set until reset_abort(), so it also stops a transcribe() that has
    // not started yet.
    virtual void abort() {}

    // Called once per job before its thread starts.
    virtual void reset_abort() {}
};

}
