// Copyright (c) 2025 VAM Japanese Audio Transcriber
// Transcription Worker - Implementation

#include "app/transcription_worker.hpp"
#include "audio/resample.hpp"
#include "core/logging.hpp"

#include <chrono>
#include <exception>
#include <functional>
#include <new>
#include <utility>

namespace app {

namespace {

constexpr double MIN_SEGMENT_S = 0.01;            // one Whisper timestamp tick

void trim(std::string& x) {
    size_t a = x.find_first_not_of(" \t\r\n");
    size_t b = x.find_last_not_of(" \t\r\n");
    if (a == std::string::npos) { x.clear(); return; }
    x = x.substr(a, b - a + 1);
}

// "[BLANK_AUDIO]", "[音楽]", "(拍手)" and similar single-token markers
bool is_non_speech_marker(const std::string& s) {
    if (s.size() < 2) return false;
    const bool square = s.front() == '[' && s.back() == ']';
    const bool round = s.front() == '(' && s.back() == ')';
    if (!square && !round) return false;
    const char close = square ? ']' : ')';
    return s.find(close) == s.size() - 1;
}

std::string model_load_message(const std::string& model, const std::string& reason) {
    return "Failed to load Whisper model '" + model + "': " + reason +
           ". Download ggml-" + model + ".bin into the model directory"
           " (or reinstall whisper.cpp) and try again.";
}

} // namespace

Transcript build_transcript(const std::vector<asr::WhisperSegment>& raw) {
    Transcript out;
    out.reserve(raw.size());
    for (const auto& r : raw) {
        Segment seg;
        seg.text = r.text;
        trim(seg.text);
        if (seg.text.empty() || is_non_speech_marker(seg.text)) {
            continue;
        }
        seg.start_time = static_cast<double>(r.t0_ms) / 1000.0;
        seg.end_time = static_cast<double>(r.t1_ms) / 1000.0;
        if (seg.start_time < 0.0) seg.start_time = 0.0;
        if (!out.empty() && seg.start_time < out.back().start_time) {
            seg.start_time = out.back().start_time;
        }
        if (seg.end_time <= seg.start_time) {
            seg.end_time = seg.start_time + MIN_SEGMENT_S;
        }
        out.push_back(std::move(seg));
    }
    return out;
}

//==============================================================================
// TranscriptionWorker
//==============================================================================

TranscriptionWorker::TranscriptionWorker(Dispatcher dispatcher)
    : dispatcher_(std::move(dispatcher)) {
}

TranscriptionWorker::~TranscriptionWorker() {
    wait();
}

bool TranscriptionWorker::start(TranscriptionJob job, asr::ISpeechModel& model,
                                StatusCallback on_status, DoneCallback on_done) {
    if (busy_) {
        return false;
    }
    wait();  // previous thread has finished its work but may not be joined yet

    cancelled_ = false;
    model.reset_abort();  // clear an abort left over from an earlier job
    busy_ = true;
    active_model_ = &model;
    thread_ = std::make_unique<std::thread>(&TranscriptionWorker::run, this,
                                            std::move(job), std::ref(model),
                                            std::move(on_status), std::move(on_done));
    return true;
}

void TranscriptionWorker::cancel() {
    if (!busy_) return;
    cancelled_ = true;
    if (active_model_) {
        active_model_->abort();
    }
}

void TranscriptionWorker::wait() {
    if (thread_ && thread_->joinable()) {
        thread_->join();
    }
    thread_.reset();
}

void TranscriptionWorker::run(TranscriptionJob job, asr::ISpeechModel& model,
                              StatusCallback on_status, DoneCallback on_done) {
    const auto t_start = std::chrono::steady_clock::now();

    auto post_status = [this, &on_status](const std::string& message) {
        if (!on_status) return;
        StatusCallback cb = on_status;
        dispatcher_([cb, message]() { cb(message); });
    };

    TranscriptionOutcome outcome;
    outcome.job_id = job.job_id;
    outcome.audio_id = job.audio ? job.audio->id : 0;

    bool loading = false;
    try {
        if (!job.audio) {
            outcome.error = AppError{ErrorCode::TRANSCRIPTION_FAILURE, "No audio loaded", ""};
        } else {
            if (!model.is_loaded()) {
                loading = true;
                post_status("Loading Whisper model...");
                std::string reason;
                if (!model.load(reason)) {
                    outcome.error = AppError{ErrorCode::MODEL_LOAD_FAILURE,
                                             model_load_message(model.name(), reason), reason};
                } else {
                    post_status("Whisper model loaded.");
                }
                loading = false;
            }

            if (outcome.error.code == ErrorCode::NONE && cancelled_) {
                outcome.error = AppError{ErrorCode::TRANSCRIPTION_FAILURE, "Transcription cancelled", ""};
            }

            if (outcome.error.code == ErrorCode::NONE) {
                post_status("Transcribing...");
                const std::vector<float> pcm = audio::to_model_input(*job.audio);
                core::log_info("transcribing " + job.audio->path + " (" +
                               std::to_string(pcm.size()) + " samples @16kHz) with model " + model.name());

                int last_step = 0;
                asr::ProgressCallback on_progress = [&](int percent) {
                    const int step = percent / 10;
                    if (step > last_step && step < 10) {
                        last_step = step;
                        post_status("Transcribing... " + std::to_string(step * 10) + "%");
                    }
                };

                std::vector<asr::WhisperSegment> raw;
                std::string reason;
                if (cancelled_) {
                    outcome.error = AppError{ErrorCode::TRANSCRIPTION_FAILURE, "Transcription cancelled", ""};
                } else if (!model.transcribe(pcm, raw, reason, on_progress)) {
                    outcome.error = AppError{ErrorCode::TRANSCRIPTION_FAILURE,
                                             "Transcription failed: " + reason, reason};
                } else {
                    outcome.transcript = build_transcript(raw);
                    outcome.success = true;
                    core::log_info("model returned " + std::to_string(raw.size()) + " segments, kept " +
                                   std::to_string(outcome.transcript.size()));
                }
            }
        }
    } catch (const std::bad_alloc&) {
        outcome.success = false;
        outcome.transcript.clear();
        outcome.error = loading
            ? AppError{ErrorCode::MODEL_LOAD_FAILURE, model_load_message(model.name(), "out of memory"), "std::bad_alloc"}
            : AppError{ErrorCode::TRANSCRIPTION_FAILURE, "Transcription failed: out of memory", "std::bad_alloc"};
    } catch (const std::exception& e) {
        outcome.success = false;
        outcome.transcript.clear();
        outcome.error = loading
            ? AppError{ErrorCode::MODEL_LOAD_FAILURE, model_load_message(model.name(), e.what()), e.what()}
            : AppError{ErrorCode::TRANSCRIPTION_FAILURE, std::string("Transcription failed: ") + e.what(), e.what()};
    } catch (...) {
        outcome.success = false;
        outcome.transcript.clear();
        outcome.error = loading
            ? AppError{ErrorCode::MODEL_LOAD_FAILURE, model_load_message(model.name(), "unknown error"), "non-standard exception"}
            : AppError{ErrorCode::TRANSCRIPTION_FAILURE, "Transcription failed: unknown error", "non-standard exception"};
    }

    outcome.elapsed_s = std::chrono::duration<double>(std::chrono::steady_clock::now() - t_start).count();
    if (!outcome.success) {
        core::log_error(std::string(to_string(outcome.error.code)) + ": " + outcome.error.message +
                        (outcome.error.details.empty() ? "" : " [" + outcome.error.details + "]"));
    }

    busy_ = false;
    if (on_done) {
        dispatcher_([on_done, outcome]() { on_done(outcome); });
    }
}

} // namespace app
