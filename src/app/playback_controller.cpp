// Copyright (c) 2025 VAM Japanese Audio Transcriber
// Playback Controller - Implementation

#include "app/playback_controller.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <cmath>

namespace app {

PlaybackController::PlaybackController(audio::IAudioOutputDevice& device)
    : device_(device)
{
    device_.set_callbacks(
        [this]() { on_stream_finished(); },
        [this](const std::string& message, bool is_fatal) { on_device_error(message, is_fatal); });
}

PlaybackController::~PlaybackController() {
    device_.stop();
    device_.set_callbacks(nullptr, nullptr);
}

void PlaybackController::set_audio(audio::AudioHandle clip) {
    device_.stop();
    clip_ = std::move(clip);
    state_ = PlaybackState{};
    state_.loaded_path = clip_ ? clip_->path : std::string();
    if (on_state_) on_state_(state_);
}

void PlaybackController::clear() {
    set_audio(nullptr);
}

bool PlaybackController::play(double offset_s, AppError& error) {
    if (!clip_) {
        error = AppError{ErrorCode::PLAYBACK_FAILURE, "No audio loaded", ""};
        return false;
    }
    if (offset_s < 0.0) offset_s = 0.0;
    if (offset_s >= clip_->duration_seconds()) {
        error = AppError{ErrorCode::PLAYBACK_FAILURE,
                         "Cannot play past the end of the audio",
                         "offset " + std::to_string(offset_s) + "s >= duration " +
                             std::to_string(clip_->duration_seconds()) + "s"};
        return false;
    }

    const bool was_playing = state_.is_playing;
    device_.stop();

    // an offset within half a sample of the end would round onto frame_count()
    const size_t frame = std::min(static_cast<size_t>(std::llround(offset_s * clip_->sample_rate)),
                                  clip_->frame_count() - 1);
    std::string reason;
    if (!device_.start(clip_, frame, reason)) {
        error = AppError{ErrorCode::PLAYBACK_FAILURE, "Playback failed: " + reason, reason};
        core::log_error("playback start failed at " + std::to_string(offset_s) + "s: " + reason);
        if (was_playing) set_state(PlaybackState::State::STOPPED);
        return false;
    }

    state_.current_offset = offset_s;
    set_state(PlaybackState::State::PLAYING);
    return true;
}

void PlaybackController::stop() {
    if (state_.state != PlaybackState::State::PLAYING) {
        return;
    }
    device_.stop();
    set_state(PlaybackState::State::STOPPED);
}

double PlaybackController::position() const {
    if (state_.state == PlaybackState::State::IDLE) {
        return state_.current_offset;
    }
    return state_.current_offset + device_.elapsed_seconds();
}

void PlaybackController::on_stream_finished() {
    if (state_.state != PlaybackState::State::PLAYING) return;
    core::log_debug("playback reached end of audio");
    set_state(PlaybackState::State::STOPPED);
}

void PlaybackController::on_device_error(const std::string& message, bool is_fatal) {
    core::log_error("audio output: " + message);
    if (is_fatal && state_.state == PlaybackState::State::PLAYING) {
        set_state(PlaybackState::State::STOPPED);
    }
    if (on_error_) {
        on_error_(AppError{ErrorCode::PLAYBACK_FAILURE, "Playback failed: " + message, message});
    }
}

void PlaybackController::set_state(PlaybackState::State s) {
    state_.state = s;
    state_.is_playing = (s == PlaybackState::State::PLAYING);
    if (on_state_) on_state_(state_);
}

} // namespace app
