// Copyright (c) 2025 VAM Japanese Audio Transcriber
// Sentence Panel / Seek Mapper - Implementation

#include "app/seek_mapper.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iomanip>
#include <iterator>
#include <sstream>

namespace app {

bool map_selection(const Transcript& transcript, size_t row, SeekCommand& command) {
    if (row >= transcript.size()) {
        return false;
    }
    command.segment_index = row;
    command.offset_s = transcript[row].start_time;
    return true;
}

int find_segment_at(const Transcript& transcript, double t) {
    auto it = std::upper_bound(transcript.begin(), transcript.end(), t,
                               [](double value, const Segment& s) { return value < s.start_time; });
    if (it == transcript.begin()) {
        return -1;
    }
    return static_cast<int>(std::distance(transcript.begin(), it)) - 1;
}

std::string format_timestamp(double seconds) {
    if (!(seconds > 0.0)) seconds = 0.0;
    const int64_t total_cs = static_cast<int64_t>(std::llround(seconds * 100.0));
    const int64_t cs = total_cs % 100;
    const int64_t total_s = total_cs / 100;
    const int64_t s = total_s % 60;
    const int64_t m = (total_s / 60) % 60;
    const int64_t h = total_s / 3600;

    std::ostringstream ss;
    ss << std::setfill('0');
    if (h > 0) {
        ss << h << ":";
    }
    ss << std::setw(2) << m << ":" << std::setw(2) << s << "." << std::setw(2) << cs;
    return ss.str();
}

std::string format_row(const Segment& segment) {
    return "[" + format_timestamp(segment.start_time) + "] " + segment.text;
}

} // namespace app
