// Copyright (c) 2025 VAM Japanese Audio Transcriber
// Sentence Panel / Seek Mapper - maps rows to playback commands

#pragma once

#include "app/transcription_types.hpp"

#include <cstddef>
#include <string>

namespace app {

/// Result of selecting a sentence row
struct SeekCommand {
    size_t segment_index = 0;                     ///< Row that was selected
    double offset_s = 0.0;                        ///< Where playback should start
};

/// Map a selected row to a seek command
/// @return false if row is out of range (no command)
bool map_selection(const Transcript& transcript, size_t row, SeekCommand& command);

/// Index of the last segment starting at or before t, or -1 before the first
int find_segment_at(const Transcript& transcript, double t);

/// "mm:ss.cc", or "h:mm:ss.cc" from one hour
std::string format_timestamp(double seconds);

/// "[mm:ss.cc] text"
std::string format_row(const Segment& segment);

} // namespace app
