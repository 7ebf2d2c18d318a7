// Copyright (c) 2025 VAM Japanese Audio Transcriber
// Application API - Transcription Controller Interface
//
// Owns the loaded audio, the transcript, the speech model and playback, and
// exposes them to a GUI through commands and event subscriptions. Contains
// no GUI toolkit code.

#pragma once

#include "app/transcription_types.hpp"
#include "asr/speech_model.hpp"
#include "audio/audio_output_device.hpp"
#include "core/config.hpp"

#include <functional>
#include <memory>
#include <string>

namespace app {

// Forward declarations
class TranscriptionControllerImpl;

//==============================================================================
// Callback Types
//==============================================================================

using TranscriptCallback = std::function<void(const Transcript&)>;
using StatusCallback = std::function<void(const std::string& message, bool is_error)>;
using PlaybackCallback = std::function<void(const PlaybackState&)>;
using BusyCallback = std::function<void(bool transcribing)>;

/// Creates the speech model on first use
using ModelFactory = std::function<std::unique_ptr<asr::ISpeechModel>(const core::Config&)>;

/// Default factory: whisper.cpp with the Japanese language hint
std::unique_ptr<asr::ISpeechModel> make_whisper_model(const core::Config& config);

//==============================================================================
// Main Controller Class
//==============================================================================

/// Coordinates loading, transcription and sentence-by-sentence playback
///
/// Flow: load_audio() -> transcribe() -> worker thread -> transcript
/// delivered on the UI thread -> select_segment(i) -> playback from the
/// segment's start time.
///
/// Thread Safety:
/// - All public methods must be called from the UI thread
/// - Callbacks are invoked on the UI thread (worker results arrive through
///   the Dispatcher)
///
/// Example:
/// @code
/// TranscriptionController controller(config, output, dispatcher);
///
/// controller.subscribe_to_transcript([](const Transcript& t) {
///     for (const auto& s : t) std::cout << format_row(s) << "\n";
/// });
///
/// controller.load_audio("lesson01.mp3");
/// controller.transcribe();
/// // ... later, on the UI thread ...
/// controller.select_segment(3);
/// @endcode
class TranscriptionController {
public:
    //==========================================================================
    // Lifecycle
    //==========================================================================

    /// @param config Model size, model dir, ffmpeg path
    /// @param output Audio output; must outlive the controller
    /// @param dispatcher Posts worker results onto the UI thread
    /// @param model_factory Creates the model lazily on first transcribe()
    TranscriptionController(const core::Config& config,
                            audio::IAudioOutputDevice& output,
                            Dispatcher dispatcher,
                            ModelFactory model_factory = make_whisper_model);

    /// Aborts any running transcription and waits for the worker
    ~TranscriptionController();

    // Non-copyable, non-movable
    TranscriptionController(const TranscriptionController&) = delete;
    TranscriptionController& operator=(const TranscriptionController&) = delete;
    TranscriptionController(TranscriptionController&&) = delete;
    TranscriptionController& operator=(TranscriptionController&&) = delete;

    //==========================================================================
    // Commands
    //==========================================================================

    /// Load an audio file
    /// @return true on success; clears transcript and playback state.
    ///         On failure nothing changes except the status.
    bool load_audio(const std::string& path);

    /// Start transcribing the loaded audio on the worker thread
    /// @return false if no audio is loaded or a transcription is running
    bool transcribe();

    /// Play from offset_s (seek if already playing)
    bool play(double offset_s = 0.0);

    /// Stop playback; no-op if not playing
    void stop();

    /// Play from the start of segment index
    /// @return false if index is out of range or playback failed
    bool select_segment(size_t index);

    //==========================================================================
    // State Access
    //==========================================================================

    const Transcript& transcript() const;
    std::string status() const;
    bool status_is_error() const;
    AppError last_error() const;
    PlaybackState playback_state() const;
    double playback_position() const;

    /// Segment being played (last one starting at or before the position), or -1
    int current_segment_index() const;

    bool is_transcribing() const;
    bool has_audio() const;
    std::string loaded_path() const;
    const core::Config& config() const;

    //==========================================================================
    // Event Subscription
    //==========================================================================

    /// Called whenever the transcript is replaced or cleared
    void subscribe_to_transcript(TranscriptCallback callback);

    /// Called on every status report
    void subscribe_to_status(StatusCallback callback);

    /// Called on every playback state change
    void subscribe_to_playback(PlaybackCallback callback);

    /// Called when a transcription starts or finishes
    void subscribe_to_busy(BusyCallback callback);

private:
    std::unique_ptr<TranscriptionControllerImpl> impl_;  ///< PIMPL implementation
};

} // namespace app
