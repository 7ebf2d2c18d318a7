#pragma once
#include <string>

namespace core {
struct Config {
    std::string whisper_model = "small"; // or "medium", "large", or a .bin/.gguf path
    std::string model_dir = "models";
    int n_threads = 0;                   // 0 = hardware concurrency
    bool use_gpu = false;
    std::string ffmpeg_path = "ffmpeg";  // used to convert mp3 input
    bool verbose = false;
};

// Parse YAML text into cfg. Keys that are missing keep their current value.
// Returns false (and fills error) if the document or a key is malformed;
// well-formed keys are still applied.
bool parse_config(const std::string& yaml_text, Config& cfg, std::string& error);

// Load from a YAML file. A missing file yields defaults.
Config load_config(const std::string& path);

// JA_TRANSCRIBER_MODEL and WHISPER_DEBUG
void apply_env_overrides(Config& cfg);

// $JA_TRANSCRIBER_CONFIG, ./ja_transcriber.yaml, then the XDG config dir.
std::string default_config_path();

const Config& get_config();
}
