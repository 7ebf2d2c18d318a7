// Copyright (c) 2025 VAM Japanese Audio Transcriber
// Transcription Worker - runs model load + inference off the UI thread

#pragma once

#include "app/transcription_types.hpp"
#include "asr/speech_model.hpp"
#include "audio/audio_clip.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace app {

/// One transcription request
struct TranscriptionJob {
    uint64_t job_id = 0;                          ///< Increases with every request
    audio::AudioHandle audio;                     ///< Audio to transcribe
};

/// Result of one job, delivered on the UI thread
struct TranscriptionOutcome {
    uint64_t job_id = 0;
    uint64_t audio_id = 0;                        ///< AudioClip::id the job ran on
    bool success = false;
    Transcript transcript;                        ///< Valid when success
    AppError error;                               ///< Valid when !success
    double elapsed_s = 0.0;                       ///< Wall time of load + inference
};

/// Turn raw model output into a Transcript: trims text, drops empty and
/// bracketed non-speech markers, keeps start times non-decreasing and
/// guarantees start_time < end_time. Overlaps pass through.
Transcript build_transcript(const std::vector<asr::WhisperSegment>& raw);

/// Runs one job at a time on a background thread.
///
/// Thread Safety:
/// - start(), cancel(), wait() and is_busy() are called from the UI thread
/// - Callbacks are posted through the Dispatcher, never invoked directly
///   from the worker thread
class TranscriptionWorker {
public:
    using StatusCallback = std::function<void(const std::string& message)>;
    using DoneCallback = std::function<void(const TranscriptionOutcome&)>;

    explicit TranscriptionWorker(Dispatcher dispatcher);

    /// Joins the worker thread (cancel() first to return sooner)
    ~TranscriptionWorker();

    TranscriptionWorker(const TranscriptionWorker&) = delete;
    TranscriptionWorker& operator=(const TranscriptionWorker&) = delete;

    /// Start a job
    /// @param model Must outlive the job
    /// @return false if a job is already running
    bool start(TranscriptionJob job, asr::ISpeechModel& model,
               StatusCallback on_status, DoneCallback on_done);

    /// Best effort: skip remaining phases and abort the model call
    void cancel();

    /// Block until the current job (if any) has finished
    void wait();

    bool is_busy() const { return busy_.load(); }

private:
    void run(TranscriptionJob job, asr::ISpeechModel& model,
             StatusCallback on_status, DoneCallback on_done);

    Dispatcher dispatcher_;
    std::unique_ptr<std::thread> thread_;
    std::atomic<bool> busy_{false};
    std::atomic<bool> cancelled_{false};
    asr::ISpeechModel* active_model_ = nullptr;   ///< Set while busy
};

} // namespace app
