// Copyright (c) 2025 VAM Japanese Audio Transcriber
// Application API - Transcription Controller Implementation

#include "app/transcription_controller.hpp"

#include "app/playback_controller.hpp"
#include "app/seek_mapper.hpp"
#include "app/status_reporter.hpp"
#include "app/transcription_worker.hpp"
#include "asr/whisper_backend.hpp"
#include "audio/audio_loader.hpp"
#include "core/logging.hpp"

#include <exception>
#include <filesystem>
#include <utility>
#include <vector>

namespace app {

std::unique_ptr<asr::ISpeechModel> make_whisper_model(const core::Config& config) {
    asr::WhisperOptions opts;
    opts.model = config.whisper_model;
    opts.model_dir = config.model_dir;
    opts.language = "ja";
    opts.n_threads = config.n_threads;
    opts.use_gpu = config.use_gpu;
    return std::make_unique<asr::WhisperBackend>(opts);
}

//==============================================================================
// Implementation Class (PIMPL Pattern)
//==============================================================================

class TranscriptionControllerImpl {
public:
    TranscriptionControllerImpl(const core::Config& config,
                                audio::IAudioOutputDevice& output,
                                Dispatcher dispatcher,
                                ModelFactory model_factory);
    ~TranscriptionControllerImpl();

    // Commands
    bool load_audio(const std::string& path);
    bool transcribe();
    bool play(double offset_s);
    void stop();
    bool select_segment(size_t index);

    // State
    const Transcript& transcript() const { return transcript_; }
    const StatusReporter& status() const { return status_; }
    const AppError& last_error() const { return last_error_; }
    const PlaybackController& playback() const { return playback_; }
    int current_segment_index() const;
    bool is_transcribing() const { return worker_.is_busy(); }
    bool has_audio() const { return audio_ != nullptr; }
    std::string loaded_path() const { return audio_ ? audio_->path : std::string(); }
    const core::Config& config() const { return config_; }

    // Event Subscription
    void subscribe_to_transcript(TranscriptCallback callback);
    void subscribe_to_status(StatusCallback callback);
    void subscribe_to_playback(PlaybackCallback callback);
    void subscribe_to_busy(BusyCallback callback);

private:
    // Internal methods
    bool execute(const SeekCommand& command);
    bool is_current(uint64_t job_id, uint64_t audio_id) const;
    void on_worker_status(uint64_t job_id, uint64_t audio_id, const std::string& message);
    void on_transcription_done(const TranscriptionOutcome& outcome);
    void on_playback_state(const PlaybackState& state);
    void fail(const AppError& error);

    void emit_transcript();
    void emit_playback(const PlaybackState& state);
    void emit_busy(bool busy);

    core::Config config_;
    ModelFactory model_factory_;

    audio::AudioLoader loader_;
    audio::AudioHandle audio_;
    Transcript transcript_;
    AppError last_error_;

    std::unique_ptr<asr::ISpeechModel> model_;    ///< Created on first transcribe()
    uint64_t next_job_id_ = 1;
    uint64_t latest_job_id_ = 0;

    StatusReporter status_;
    PlaybackController playback_;
    bool in_playback_command_ = false;

    // Callbacks
    std::vector<TranscriptCallback> transcript_callbacks_;
    std::vector<PlaybackCallback> playback_callbacks_;
    std::vector<BusyCallback> busy_callbacks_;

    // Declared last: joined before the model and callbacks go away
    TranscriptionWorker worker_;
};

TranscriptionControllerImpl::TranscriptionControllerImpl(const core::Config& config,
                                                         audio::IAudioOutputDevice& output,
                                                         Dispatcher dispatcher,
                                                         ModelFactory model_factory)
    : config_(config)
    , model_factory_(std::move(model_factory))
    , loader_(config.ffmpeg_path)
    , playback_(output)
    , worker_(std::move(dispatcher))
{
    playback_.set_state_callback([this](const PlaybackState& state) { on_playback_state(state); });
    playback_.set_error_callback([this](const AppError& error) { fail(error); });
    status_.report("Ready. Whisper model: " + config_.whisper_model);
}

TranscriptionControllerImpl::~TranscriptionControllerImpl() {
    worker_.cancel();
    worker_.wait();
}

//==============================================================================
// Commands
//==============================================================================

bool TranscriptionControllerImpl::load_audio(const std::string& path) {
    audio::LoadResult result = loader_.load(path);
    if (!result.ok()) {
        AppError error;
        if (result.error == audio::LoadError::FILE_NOT_FOUND) {
            error = AppError{ErrorCode::FILE_NOT_FOUND, "File not found: " + path, result.details};
        } else {
            error = AppError{ErrorCode::INVALID_FORMAT, "Unsupported or unreadable audio: " + result.details,
                             result.details};
        }
        fail(error);
        return false;
    }

    if (worker_.is_busy()) {
        core::log_info("new audio loaded; results of the running transcription will be discarded");
        worker_.cancel();
    }

    audio_ = std::move(result.clip);
    last_error_ = AppError{};
    transcript_.clear();
    emit_transcript();
    playback_.set_audio(audio_);

    const std::string name = std::filesystem::u8path(path).filename().u8string();
    status_.report("Loaded audio: " + name);
    return true;
}

bool TranscriptionControllerImpl::transcribe() {
    if (!audio_) {
        status_.report("No audio loaded", true);
        return false;
    }
    if (worker_.is_busy()) {
        status_.report("Transcription already in progress");
        return false;
    }

    if (!model_) {
        try {
            model_ = model_factory_(config_);
        } catch (const std::exception& e) {
            core::log_error(std::string("model factory threw: ") + e.what());
        } catch (...) {
            core::log_error("model factory threw a non-standard exception");
        }
        if (!model_) {
            fail(AppError{ErrorCode::MODEL_LOAD_FAILURE,
                          "Failed to create Whisper model '" + config_.whisper_model +
                              "'. Reinstall whisper.cpp and try again.",
                          ""});
            return false;
        }
    }

    TranscriptionJob job;
    job.job_id = next_job_id_++;
    job.audio = audio_;
    const uint64_t job_id = job.job_id;
    const uint64_t audio_id = audio_->id;

    const bool started = worker_.start(
        std::move(job), *model_,
        [this, job_id, audio_id](const std::string& message) { on_worker_status(job_id, audio_id, message); },
        [this](const TranscriptionOutcome& outcome) { on_transcription_done(outcome); });
    if (!started) {
        status_.report("Transcription already in progress");
        return false;
    }

    latest_job_id_ = job_id;
    last_error_ = AppError{};
    status_.report("Transcribing...");
    emit_busy(true);
    return true;
}

bool TranscriptionControllerImpl::play(double offset_s) {
    AppError error;
    in_playback_command_ = true;
    const bool ok = playback_.play(offset_s, error);
    in_playback_command_ = false;
    if (!ok) {
        fail(error);
        return false;
    }
    status_.report("Playing from " + format_timestamp(playback_.state().current_offset));
    return true;
}

void TranscriptionControllerImpl::stop() {
    if (!playback_.state().is_playing) {
        return;
    }
    in_playback_command_ = true;
    playback_.stop();
    in_playback_command_ = false;
    status_.report("Stopped");
}

bool TranscriptionControllerImpl::select_segment(size_t index) {
    SeekCommand command;
    if (!map_selection(transcript_, index, command)) {
        core::log_warn("ignoring selection of row " + std::to_string(index) + " (transcript has " +
                       std::to_string(transcript_.size()) + " rows)");
        return false;
    }
    return execute(command);
}

bool TranscriptionControllerImpl::execute(const SeekCommand& command) {
    core::log_debug("seek to segment " + std::to_string(command.segment_index) + " at " +
                    std::to_string(command.offset_s) + "s");
    return play(command.offset_s);
}

int TranscriptionControllerImpl::current_segment_index() const {
    if (playback_.state().state == PlaybackState::State::IDLE) {
        return -1;
    }
    return find_segment_at(transcript_, playback_.position());
}

//==============================================================================
// Worker Events (UI thread)
//==============================================================================

bool TranscriptionControllerImpl::is_current(uint64_t job_id, uint64_t audio_id) const {
    return job_id == latest_job_id_ && audio_ && audio_->id == audio_id;
}

void TranscriptionControllerImpl::on_worker_status(uint64_t job_id, uint64_t audio_id, const std::string& message) {
    if (!is_current(job_id, audio_id)) {
        return;
    }
    status_.report(message);
}

void TranscriptionControllerImpl::on_transcription_done(const TranscriptionOutcome& outcome) {
    emit_busy(worker_.is_busy());

    if (!is_current(outcome.job_id, outcome.audio_id)) {
        core::log_info("discarding stale transcription result (job " + std::to_string(outcome.job_id) + ")");
        return;
    }
    if (!outcome.success) {
        // keep the last good transcript
        fail(outcome.error);
        return;
    }

    transcript_ = outcome.transcript;
    emit_transcript();
    core::log_info("transcription finished in " + std::to_string(outcome.elapsed_s) + "s");
    status_.report("Transcription done! (" + std::to_string(transcript_.size()) + " sentences)");
}

void TranscriptionControllerImpl::on_playback_state(const PlaybackState& state) {
    emit_playback(state);
    if (!in_playback_command_ && state.state == PlaybackState::State::STOPPED) {
        status_.report("Playback finished");
    }
}

void TranscriptionControllerImpl::fail(const AppError& error) {
    last_error_ = error;
    if (!error.details.empty() && error.details != error.message) {
        core::log_debug(std::string(to_string(error.code)) + " details: " + error.details);
    }
    status_.report(error.message, true);
}

//==============================================================================
// Event Subscription Implementation
//==============================================================================

void TranscriptionControllerImpl::subscribe_to_transcript(TranscriptCallback callback) {
    transcript_callbacks_.push_back(std::move(callback));
}

void TranscriptionControllerImpl::subscribe_to_status(StatusCallback callback) {
    status_.subscribe(std::move(callback));
}

void TranscriptionControllerImpl::subscribe_to_playback(PlaybackCallback callback) {
    playback_callbacks_.push_back(std::move(callback));
}

void TranscriptionControllerImpl::subscribe_to_busy(BusyCallback callback) {
    busy_callbacks_.push_back(std::move(callback));
}

void TranscriptionControllerImpl::emit_transcript() {
    for (const auto& callback : transcript_callbacks_) {
        try {
            callback(transcript_);
        } catch (const std::exception& e) {
            core::log_error(std::string("Transcript callback exception: ") + e.what());
        }
    }
}

void TranscriptionControllerImpl::emit_playback(const PlaybackState& state) {
    for (const auto& callback : playback_callbacks_) {
        try {
            callback(state);
        } catch (const std::exception& e) {
            core::log_error(std::string("Playback callback exception: ") + e.what());
        }
    }
}

void TranscriptionControllerImpl::emit_busy(bool busy) {
    for (const auto& callback : busy_callbacks_) {
        try {
            callback(busy);
        } catch (const std::exception& e) {
            core::log_error(std::string("Busy callback exception: ") + e.what());
        }
    }
}

//==============================================================================
// TranscriptionController Public Interface (Forwarding to PIMPL)
//==============================================================================

TranscriptionController::TranscriptionController(const core::Config& config,
                                                 audio::IAudioOutputDevice& output,
                                                 Dispatcher dispatcher,
                                                 ModelFactory model_factory)
    : impl_(std::make_unique<TranscriptionControllerImpl>(config, output, std::move(dispatcher),
                                                          std::move(model_factory))) {
}

TranscriptionController::~TranscriptionController() = default;

bool TranscriptionController::load_audio(const std::string& path) {
    return impl_->load_audio(path);
}

bool TranscriptionController::transcribe() {
    return impl_->transcribe();
}

bool TranscriptionController::play(double offset_s) {
    return impl_->play(offset_s);
}

void TranscriptionController::stop() {
    impl_->stop();
}

bool TranscriptionController::select_segment(size_t index) {
    return impl_->select_segment(index);
}

const Transcript& TranscriptionController::transcript() const {
    return impl_->transcript();
}

std::string TranscriptionController::status() const {
    return impl_->status().current();
}

bool TranscriptionController::status_is_error() const {
    return impl_->status().is_error();
}

AppError TranscriptionController::last_error() const {
    return impl_->last_error();
}

PlaybackState TranscriptionController::playback_state() const {
    return impl_->playback().state();
}

double TranscriptionController::playback_position() const {
    return impl_->playback().position();
}

int TranscriptionController::current_segment_index() const {
    return impl_->current_segment_index();
}

bool TranscriptionController::is_transcribing() const {
    return impl_->is_transcribing();
}

bool TranscriptionController::has_audio() const {
    return impl_->has_audio();
}

std::string TranscriptionController::loaded_path() const {
    return impl_->loaded_path();
}

const core::Config& TranscriptionController::config() const {
    return impl_->config();
}

void TranscriptionController::subscribe_to_transcript(TranscriptCallback callback) {
    impl_->subscribe_to_transcript(std::move(callback));
}

void TranscriptionController::subscribe_to_status(StatusCallback callback) {
    impl_->subscribe_to_status(std::move(callback));
}

void TranscriptionController::subscribe_to_playback(PlaybackCallback callback) {
    impl_->subscribe_to_playback(std::move(callback));
}

void TranscriptionController::subscribe_to_busy(BusyCallback callback) {
    impl_->subscribe_to_busy(std::move(callback));
}

} // namespace app
