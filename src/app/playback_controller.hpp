// Copyright (c) 2025 VAM Japanese Audio Transcriber
// Playback Controller - Idle/Playing/Stopped state machine over an output device

#pragma once

#include "app/transcription_types.hpp"
#include "audio/audio_clip.hpp"
#include "audio/audio_output_device.hpp"

#include <functional>
#include <string>
#include <utility>

namespace app {

/// Single writer of PlaybackState. UI thread only.
///
/// Seeking is stop + play at the new offset; the output device has no
/// native seek. At most one stream is active: play() always stops the
/// device first.
class PlaybackController {
public:
    using StateCallback = std::function<void(const PlaybackState&)>;
    using ErrorCallback = std::function<void(const AppError&)>;

    explicit PlaybackController(audio::IAudioOutputDevice& device);
    ~PlaybackController();

    PlaybackController(const PlaybackController&) = delete;
    PlaybackController& operator=(const PlaybackController&) = delete;

    /// Replace the playable audio. Stops any stream and resets to IDLE.
    void set_audio(audio::AudioHandle clip);

    /// Forget the audio. Stops any stream and resets to IDLE.
    void clear();

    /// Start playing at offset_s (negative clamps to 0)
    /// @return false with error.code == PLAYBACK_FAILURE on failure
    bool play(double offset_s, AppError& error);

    /// Stop the stream. No-op unless PLAYING.
    void stop();

    const PlaybackState& state() const { return state_; }

    /// current_offset + time played so far; increases while PLAYING
    double position() const;

    bool has_audio() const { return clip_ != nullptr; }

    void set_state_callback(StateCallback cb) { on_state_ = std::move(cb); }
    void set_error_callback(ErrorCallback cb) { on_error_ = std::move(cb); }

private:
    void on_stream_finished();
    void on_device_error(const std::string& message, bool is_fatal);
    void set_state(PlaybackState::State s);

    audio::IAudioOutputDevice& device_;
    audio::AudioHandle clip_;
    PlaybackState state_;
    StateCallback on_state_;
    ErrorCallback on_error_;
};

} // namespace app
