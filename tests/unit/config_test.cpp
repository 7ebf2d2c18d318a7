#include <cassert>
#include <cstdlib>
#include <string>
#include "core/config.hpp"
#include "test_support.hpp"

static void test_defaults() {
    core::Config cfg;
    assert(cfg.whisper_model == "small");
    assert(cfg.model_dir == "models");
    assert(cfg.n_threads == 0);
    assert(!cfg.use_gpu);
    assert(cfg.ffmpeg_path == "ffmpeg");
}

static void test_parse_keys() {
    core::Config cfg;
    std::string err;
    bool ok = core::parse_config(
        "whisper_model: medium\n"
        "model_dir: /opt/whisper\n"
        "n_threads: 4\n"
        "use_gpu: true\n"
        "ffmpeg_path: /usr/bin/ffmpeg\n"
        "verbose: true\n",
        cfg, err);
    assert(ok);
    assert(err.empty());
    assert(cfg.whisper_model == "medium");
    assert(cfg.model_dir == "/opt/whisper");
    assert(cfg.n_threads == 4);
    assert(cfg.use_gpu);
    assert(cfg.ffmpeg_path == "/usr/bin/ffmpeg");
    assert(cfg.verbose);
}

static void test_partial_and_empty() {
    core::Config cfg;
    std::string err;
    assert(core::parse_config("whisper_model: large\n", cfg, err));
    assert(cfg.whisper_model == "large");
    assert(cfg.model_dir == "models");

    core::Config empty;
    assert(core::parse_config("", empty, err));
    assert(empty.whisper_model == "small");
}

static void test_bad_values() {
    core::Config cfg;
    std::string err;
    // bad n_threads type; whisper_model still applied
    assert(!core::parse_config("whisper_model: tiny\nn_threads: lots\n", cfg, err));
    assert(!err.empty());
    assert(cfg.whisper_model == "tiny");
    assert(cfg.n_threads == 0);

    core::Config neg;
    assert(!core::parse_config("n_threads: -2\n", neg, err));
    assert(neg.n_threads == 0);

    core::Config blank;
    assert(!core::parse_config("whisper_model: \"\"\n", blank, err));
    assert(blank.whisper_model == "small");

    core::Config seq;
    assert(!core::parse_config("- a\n- b\n", seq, err));

    core::Config broken;
    assert(!core::parse_config("whisper_model: [unclosed\n", broken, err));
    assert(err.find("YAML") != std::string::npos);
}

static void test_load_file() {
    auto dir = test::temp_dir("config");
    auto path = dir / "config.yaml";
    test::write_text(path, "whisper_model: base\nmodel_dir: m\n");
    core::Config cfg = core::load_config(path.string());
    assert(cfg.whisper_model == "base");
    assert(cfg.model_dir == "m");

    core::Config missing = core::load_config((dir / "nope.yaml").string());
    assert(missing.whisper_model == "small");
}

static void test_env_overrides() {
    setenv("JA_TRANSCRIBER_MODEL", "medium", 1);
    setenv("WHISPER_DEBUG", "1", 1);
    core::Config cfg;
    core::apply_env_overrides(cfg);
    assert(cfg.whisper_model == "medium");
    assert(cfg.verbose);

    setenv("JA_TRANSCRIBER_MODEL", "", 1);
    unsetenv("WHISPER_DEBUG");
    core::Config plain;
    core::apply_env_overrides(plain);
    assert(plain.whisper_model == "small");
    assert(!plain.verbose);
    unsetenv("JA_TRANSCRIBER_MODEL");
}

static void test_default_path() {
    setenv("JA_TRANSCRIBER_CONFIG", "/tmp/custom.yaml", 1);
    assert(core::default_config_path() == "/tmp/custom.yaml");
    unsetenv("JA_TRANSCRIBER_CONFIG");

    setenv("XDG_CONFIG_HOME", "/tmp/xdg", 1);
    std::string p = core::default_config_path();
    // ./ja_transcriber.yaml wins if present in the working directory
    assert(p == "ja_transcriber.yaml" || p == "/tmp/xdg/ja_transcriber/config.yaml");
    unsetenv("XDG_CONFIG_HOME");
}

int main() {
    test_defaults();
    test_parse_keys();
    test_partial_and_empty();
    test_bad_values();
    test_load_file();
    test_env_overrides();
    test_default_path();
    return 0;
}
