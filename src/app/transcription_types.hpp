// Copyright (c) 2025 VAM Japanese Audio Transcriber
// Application API - shared data types

#pragma once

#include <functional>
#include <string>
#include <vector>

namespace app {

//==============================================================================
// Transcript
//==============================================================================

/// One transcribed utterance
struct Segment {
    double start_time = 0.0;                      ///< Seconds from start of file
    double end_time = 0.0;                        ///< Seconds from start of file, > start_time
    std::string text;                             ///< Non-empty sentence text
};

/// Ordered by start_time (non-decreasing). Overlaps are passed through.
using Transcript = std::vector<Segment>;

//==============================================================================
// Errors
//==============================================================================

enum class ErrorCode {
    NONE,
    FILE_NOT_FOUND,                               ///< Path does not exist
    INVALID_FORMAT,                               ///< Not a readable .wav/.mp3
    MODEL_LOAD_FAILURE,                           ///< Whisper model missing or broken
    TRANSCRIPTION_FAILURE,                        ///< Inference failed or threw
    PLAYBACK_FAILURE                              ///< Audio output could not play
};

struct AppError {
    ErrorCode code = ErrorCode::NONE;
    std::string message;                          ///< Shown in the status line
    std::string details;                          ///< Technical details for the log
};

const char* to_string(ErrorCode code);

//==============================================================================
// Playback
//==============================================================================

struct PlaybackState {
    enum class State {
        IDLE,                                     ///< Nothing played since load
        PLAYING,                                  ///< One stream active
        STOPPED                                   ///< Stopped by user or end of audio
    };

    State state = State::IDLE;
    std::string loaded_path;                      ///< Path of the audio being played
    bool is_playing = false;                      ///< state == PLAYING
    double current_offset = 0.0;                  ///< Seconds where the last stream started
};

//==============================================================================
// Threading
//==============================================================================

/// Posts a task onto the UI thread's event loop. Tasks must run in the
/// order posted and must be dropped if the owner has been destroyed.
using Dispatcher = std::function<void(std::function<void()>)>;

} // namespace app
