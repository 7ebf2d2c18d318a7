#include "core/config.hpp"
#include "core/logging.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <filesystem>

namespace core {

namespace {

template <typename T>
bool read_key(const YAML::Node& root, const char* key, T& out, std::string& error) {
    const YAML::Node node = root[key];
    if (!node) return true;
    try {
        out = node.as<T>();
        return true;
    } catch (const YAML::Exception& e) {
        if (!error.empty()) error += "; ";
        error += std::string("bad value for '") + key + "': " + e.what();
        return false;
    }
}

bool file_exists(const std::string& p) {
    std::error_code ec;
    return !p.empty() && std::filesystem::exists(std::filesystem::u8path(p), ec);
}

bool apply_node(const YAML::Node& root, Config& cfg, std::string& error) {
    if (root.IsNull()) return true; // empty document
    if (!root.IsMap()) {
        error = "config root must be a mapping";
        return false;
    }

    bool ok = true;
    ok &= read_key(root, "whisper_model", cfg.whisper_model, error);
    ok &= read_key(root, "model_dir", cfg.model_dir, error);
    ok &= read_key(root, "n_threads", cfg.n_threads, error);
    ok &= read_key(root, "use_gpu", cfg.use_gpu, error);
    ok &= read_key(root, "ffmpeg_path", cfg.ffmpeg_path, error);
    ok &= read_key(root, "verbose", cfg.verbose, error);

    if (cfg.whisper_model.empty()) {
        cfg.whisper_model = Config{}.whisper_model;
        if (!error.empty()) error += "; ";
        error += "whisper_model must not be empty";
        ok = false;
    }
    if (cfg.n_threads < 0) {
        cfg.n_threads = 0;
        if (!error.empty()) error += "; ";
        error += "n_threads must be >= 0";
        ok = false;
    }
    return ok;
}

} // namespace

bool parse_config(const std::string& yaml_text, Config& cfg, std::string& error) {
    error.clear();
    YAML::Node root;
    try {
        root = YAML::Load(yaml_text);
    } catch (const YAML::Exception& e) {
        error = std::string("YAML parse error: ") + e.what();
        return false;
    }
    return apply_node(root, cfg, error);
}

Config load_config(const std::string& path) {
    Config cfg;
    if (!file_exists(path)) {
        if (!path.empty()) log_debug("config not found, using defaults: " + path);
        return cfg;
    }
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        log_warn("failed to read config " + path + ": " + e.what());
        return cfg;
    }
    std::string error;
    if (!apply_node(root, cfg, error)) {
        log_warn("config " + path + ": " + error);
    }
    log_info("loaded config: " + path);
    return cfg;
}

void apply_env_overrides(Config& cfg) {
    if (const char* model = std::getenv("JA_TRANSCRIBER_MODEL")) {
        if (*model) cfg.whisper_model = model;
    }
    if (std::getenv("WHISPER_DEBUG") != nullptr) {
        cfg.verbose = true;
    }
}

std::string default_config_path() {
    if (const char* p = std::getenv("JA_TRANSCRIBER_CONFIG")) {
        if (*p) return p;
    }
    const std::string local = "ja_transcriber.yaml";
    if (file_exists(local)) return local;

    std::filesystem::path base;
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        base = std::filesystem::u8path(xdg);
    } else if (const char* home = std::getenv("HOME"); home && *home) {
        base = std::filesystem::u8path(home) / ".config";
    } else {
        return local;
    }
    return (base / "ja_transcriber" / "config.yaml").u8string();
}

const Config& get_config() {
    static const Config cfg = [] {
        Config c = load_config(default_config_path());
        apply_env_overrides(c);
        set_verbose(c.verbose);
        return c;
    }();
    return cfg;
}

} // namespace core
