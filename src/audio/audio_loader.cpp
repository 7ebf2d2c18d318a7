#include "audio/audio_loader.hpp"
#include "core/logging.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <new>
#include <utility>

#define DR_WAV_IMPLEMENTATION
#include <dr_wav.h>

namespace audio {

namespace {

constexpr drwav_uint64 READ_CHUNK_FRAMES = 65536;

std::string lower_extension(const std::string& path) {
    std::string ext = std::filesystem::u8path(path).extension().u8string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

std::string shell_quote(const std::string& s) {
#ifdef _WIN32
    return "\"" + s + "\"";
#else
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += "'";
    return out;
#endif
}

} // namespace

AudioLoader::AudioLoader(std::string ffmpeg_path) : ffmpeg_path_(std::move(ffmpeg_path)) {}

bool AudioLoader::is_supported_extension(const std::string& path) {
    const std::string ext = lower_extension(path);
    return ext == ".wav" || ext == ".mp3";
}

LoadResult AudioLoader::load(const std::string& path) {
    LoadResult result;
    std::error_code ec;
    const auto fs_path = std::filesystem::u8path(path);
    if (path.empty() || !std::filesystem::is_regular_file(fs_path, ec)) {
        result.error = LoadError::FILE_NOT_FOUND;
        result.details = "file not found: " + path;
        return result;
    }
    if (!is_supported_extension(path)) {
        result.error = LoadError::INVALID_FORMAT;
        result.details = "unsupported file type '" + lower_extension(path) + "' (expected .wav or .mp3)";
        return result;
    }

    auto clip = std::make_shared<AudioClip>();
    clip->path = path;

    if (lower_extension(path) == ".mp3") {
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        const auto tmp = std::filesystem::temp_directory_path(ec) /
                         ("ja_transcriber_" + std::to_string(next_id_) + "_" + std::to_string(stamp) + ".wav");
        if (ec) {
            result.error = LoadError::INVALID_FORMAT;
            result.details = "no temp directory for mp3 conversion: " + ec.message();
            return result;
        }
        const std::string tmp_path = tmp.u8string();
        bool ok = convert_with_ffmpeg(path, tmp_path, result.details) &&
                  read_wav(tmp_path, *clip, result.details);
        std::filesystem::remove(tmp, ec);
        if (!ok) {
            result.error = LoadError::INVALID_FORMAT;
            return result;
        }
    } else if (!read_wav(path, *clip, result.details)) {
        result.error = LoadError::INVALID_FORMAT;
        return result;
    }

    clip->id = next_id_++;
    core::log_info("loaded " + path + ": " + std::to_string(clip->sample_rate) + " Hz, " +
                   std::to_string(clip->channels) + " ch, " +
                   std::to_string(clip->duration_seconds()) + " s");
    result.clip = std::move(clip);
    return result;
}

bool AudioLoader::read_wav(const std::string& path, AudioClip& clip, std::string& details) const {
    drwav wav;
    if (!drwav_init_file(&wav, path.c_str(), nullptr)) {
        details = "not a readable WAV file: " + path;
        return false;
    }
    const uint64_t n = wav.totalPCMFrameCount;
    if (n == 0 || wav.channels == 0 || wav.sampleRate == 0) {
        drwav_uninit(&wav);
        details = "audio file contains no samples: " + path;
        return false;
    }
    clip.sample_rate = static_cast<int>(wav.sampleRate);
    clip.channels = static_cast<int>(wav.channels);

    // The header's frame count is not trusted: a truncated or crafted file can
    // declare far more data than it holds. Read until the decoder runs dry.
    clip.pcm.clear();
    try {
        std::vector<int16_t> chunk(static_cast<size_t>(READ_CHUNK_FRAMES) * wav.channels);
        for (;;) {
            const uint64_t got = drwav_read_pcm_frames_s16(&wav, READ_CHUNK_FRAMES, chunk.data());
            if (got == 0) break;
            clip.pcm.insert(clip.pcm.end(), chunk.begin(),
                            chunk.begin() + static_cast<std::ptrdiff_t>(got * wav.channels));
        }
    } catch (const std::bad_alloc&) {
        drwav_uninit(&wav);
        clip.pcm.clear();
        clip.pcm.shrink_to_fit();
        details = "audio file too large to decode: " + path;
        return false;
    }
    drwav_uninit(&wav);
    if (clip.pcm.empty()) {
        details = "failed to decode PCM frames: " + path;
        return false;
    }
    return true;
}

bool AudioLoader::convert_with_ffmpeg(const std::string& in, const std::string& out, std::string& details) const {
    // keep native rate and channel layout for playback
    const std::string cmd = shell_quote(ffmpeg_path_) + " -nostdin -y -loglevel error -i " + shell_quote(in) +
                            " -vn -c:a pcm_s16le " + shell_quote(out);
    core::log_debug("running: " + cmd);
    const int ret = std::system(cmd.c_str());
    if (ret != 0) {
        details = "ffmpeg could not decode " + in + " (exit status " + std::to_string(ret) + ")";
        return false;
    }
    return true;
}

} // namespace audio
