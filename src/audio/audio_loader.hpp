#pragma once
#include "audio/audio_clip.hpp"
#include <cstdint>
#include <string>

namespace audio {

enum class LoadError {
    NONE,
    FILE_NOT_FOUND,
    INVALID_FORMAT
};

struct LoadResult {
    AudioHandle clip;
    LoadError error = LoadError::NONE;
    std::string details;

    bool ok() const { return error == LoadError::NONE && clip != nullptr; }
};

// Opens .wav files with dr_wav. .mp3 files are first converted to a
// temporary WAV by an ffmpeg process.
class AudioLoader {
public:
    explicit AudioLoader(std::string ffmpeg_path = "ffmpeg");

    static bool is_supported_extension(const std::string& path);

    LoadResult load(const std::string& path);

private:
    bool read_wav(const std::string& path, AudioClip& clip, std::string& details) const;
    bool convert_with_ffmpeg(const std::string& in, const std::string& out, std::string& details) const;

    std::string ffmpeg_path_;
    uint64_t next_id_ = 1;
};

} // namespace audio
