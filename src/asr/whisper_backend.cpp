#include "asr/whisper_backend.hpp"
#include "core/logging.hpp"
#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <string>
#include <thread>
#include <utility>
#include "whisper.h"

namespace {

// Filter whisper/ggml logs: keep errors/warnings always; info/debug only if verbose
void log_cb(ggml_log_level level, const char * text, void *) {
	switch (level) {
	case GGML_LOG_LEVEL_ERROR:
	case GGML_LOG_LEVEL_WARN:
		std::fputs(text, stderr);
		break;
	case GGML_LOG_LEVEL_INFO:
	case GGML_LOG_LEVEL_DEBUG:
	default:
		if (core::is_verbose()) std::fputs(text, stderr);
		break;
	}
}

bool abort_cb(void * user_data) {
	return static_cast<std::atomic<bool>*>(user_data)->load();
}

struct ProgressRelay {
	const asr::ProgressCallback* cb;
};

void progress_cb(whisper_context *, whisper_state *, int progress, void * user_data) {
	auto* relay = static_cast<ProgressRelay*>(user_data);
	if (relay && relay->cb && *relay->cb) (*relay->cb)(progress);
}

} // anonymous namespace

namespace asr {

WhisperBackend::WhisperBackend(WhisperOptions opts) : opts_(std::move(opts)) {}

WhisperBackend::~WhisperBackend() {
	if (state_) whisper_free_state(state_);
	if (ctx_) whisper_free(ctx_);
}

std::string WhisperBackend::resolve_model_path(const std::string& model, const std::string& model_dir) {
	auto exists = [](const std::string& p){ return std::filesystem::exists(std::filesystem::u8path(p)); };
	const bool has_ext = (model.find(".gguf") != std::string::npos) || (model.find(".bin") != std::string::npos);
	if (has_ext) return model;

	const std::string dir = model_dir.empty() ? std::string(".") : model_dir;
	const std::string candidates[] = {
		dir + "/" + model + ".gguf",
		dir + "/ggml-" + model + "-q5_1.gguf",
		dir + "/ggml-" + model + ".gguf",
		dir + "/" + model + ".bin",
		dir + "/ggml-" + model + ".bin",
		dir + "/ggml-" + model + "-q5_1.bin",
	};
	for (const auto& c : candidates) {
		if (exists(c)) return c;
	}
	return dir + "/ggml-" + model + ".bin"; // fallback, will fail with a clear path in the message
}

bool WhisperBackend::load(std::string& error) {
	if (ctx_) return true;
	const std::string path = resolve_model_path(opts_.model, opts_.model_dir);
	if (!std::filesystem::exists(std::filesystem::u8path(path))) {
		error = "model file not found: " + path;
		return false;
	}
	// Set logging verbosity before creating context to suppress init spam when not verbose
	whisper_log_set(log_cb, nullptr);

	whisper_context_params cparams = whisper_context_default_params();
	cparams.use_gpu = opts_.use_gpu;
	core::log_info("[whisper] init from: " + path);
	ctx_ = whisper_init_from_file_with_params(path.c_str(), cparams);
	if (!ctx_) {
		error = "whisper could not initialize from " + path + " (file corrupt or incompatible with this whisper.cpp build)";
		return false;
	}
	if (core::is_verbose()) {
		core::log_debug(std::string("[whisper] system: ") + whisper_print_system_info());
	}
	// allocate persistent state for faster repeated calls
	state_ = whisper_init_state(ctx_);
	if (!state_) {
		whisper_free(ctx_);
		ctx_ = nullptr;
		error = "whisper could not allocate inference state (out of memory?)";
		return false;
	}
	if (whisper_lang_id(opts_.language.c_str()) < 0) {
		core::log_warn("[whisper] unknown language '" + opts_.language + "', model will auto-detect");
	}
	core::log_info("[whisper] init OK: " + path);
	return true;
}

bool WhisperBackend::transcribe(const std::vector<float>& pcm_16k,
                                std::vector<WhisperSegment>& segments,
                                std::string& error,
                                const ProgressCallback& on_progress) {
	segments.clear();
	if (!ctx_ || !state_) {
		error = "model not loaded";
		return false;
	}
	if (pcm_16k.empty()) return true;

	const bool verbose = core::is_verbose();
	whisper_full_params wparams = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
	wparams.print_realtime   = false;
	wparams.print_progress   = verbose;
	wparams.print_timestamps = verbose;
	wparams.print_special    = false;
	wparams.translate        = false;
	wparams.language         = opts_.language.c_str();
	wparams.detect_language  = false;
	wparams.n_threads        = (opts_.n_threads <= 0) ? static_cast<int>(std::max(1u, std::thread::hardware_concurrency())) : opts_.n_threads;
	wparams.offset_ms        = 0;
	wparams.duration_ms      = 0; // process all
	wparams.token_timestamps = true;
	wparams.max_len          = 0; // whisper decides sentence boundaries
	wparams.split_on_word    = false;
	wparams.greedy.best_of   = 1;

	ProgressRelay relay{&on_progress};
	wparams.progress_callback = progress_cb;
	wparams.progress_callback_user_data = &relay;
	wparams.abort_callback = abort_cb;
	wparams.abort_callback_user_data = &abort_;

	core::log_debug("[whisper] running on samples=" + std::to_string(pcm_16k.size()) +
	                ", threads=" + std::to_string(wparams.n_threads));
	const int ret = whisper_full_with_state(ctx_, state_, wparams, pcm_16k.data(), static_cast<int>(pcm_16k.size()));
	if (abort_) {
		error = "transcription aborted";
		return false;
	}
	if (ret != 0) {
		error = "whisper_full failed, ret=" + std::to_string(ret);
		return false;
	}

	const int n = whisper_full_n_segments_from_state(state_);
	core::log_debug("[whisper] segments=" + std::to_string(n));
	segments.reserve(static_cast<size_t>(n));
	for (int i = 0; i < n; ++i) {
		const char* txt = whisper_full_get_segment_text_from_state(state_, i);
		if (!txt) continue;
		// t0/t1 are in 10 ms units
		const int64_t t0 = whisper_full_get_segment_t0_from_state(state_, i) * 10;
		const int64_t t1 = whisper_full_get_segment_t1_from_state(state_, i) * 10;
		segments.push_back(WhisperSegment{txt, t0, t1});
	}
	if (verbose) whisper_print_timings(ctx_);
	return true;
}

} // namespace asr
