#pragma once
#include "asr/speech_model.hpp"
#include <atomic>
#include <string>
#include <vector>

struct whisper_context;
struct whisper_state;

namespace asr {

struct WhisperOptions {
    std::string model = "small";     // model name or path to a .bin/.gguf file
    std::string model_dir = "models";
    std::string language = "ja";
    int n_threads = 0;               // 0 = auto
    bool use_gpu = false;
};

class WhisperBackend : public ISpeechModel {
public:
    explicit WhisperBackend(WhisperOptions opts);
    ~WhisperBackend() override;

    WhisperBackend(const WhisperBackend&) = delete;
    WhisperBackend& operator=(const WhisperBackend&) = delete;

    std::string name() const override { return opts_.model; }
    bool is_loaded() const override { return ctx_ != nullptr; }
    bool load(std::string& error) override;
    bool transcribe(const std::vector<float>& pcm_16k,
                    std::vector<WhisperSegment>& segments,
                    std::string& error,
                    const ProgressCallback& on_progress) override;
    void abort() override { abort_ = true; }
    void reset_abort() override { abort_ = false; }

    // Resolves a model name to a file under model_dir; returns the first
    // existing candidate, or <model_dir>/ggml-<model>.bin if none exists.
    // Names containing .bin or .gguf are returned unchanged.
    static std::string resolve_model_path(const std::string& model, const std::string& model_dir);

private:
    WhisperOptions opts_;
    whisper_context* ctx_ = nullptr;
    whisper_state* state_ = nullptr;
    std::atomic<bool> abort_{false};
};

}
