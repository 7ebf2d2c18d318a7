// Copyright (c) 2025 VAM Japanese Audio Transcriber
// Application API - shared data types

#include "app/transcription_types.hpp"

namespace app {

const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE: return "None";
        case ErrorCode::FILE_NOT_FOUND: return "FileNotFound";
        case ErrorCode::INVALID_FORMAT: return "InvalidFormat";
        case ErrorCode::MODEL_LOAD_FAILURE: return "ModelLoadFailure";
        case ErrorCode::TRANSCRIPTION_FAILURE: return "TranscriptionFailure";
        case ErrorCode::PLAYBACK_FAILURE: return "PlaybackFailure";
    }
    return "Unknown";
}

} // namespace app
