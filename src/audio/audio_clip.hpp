#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace audio {

// Decoded audio file, immutable once loaded.
struct AudioClip {
    uint64_t id = 0;             // unique per successful load
    std::string path;
    int sample_rate = 0;
    int channels = 0;
    std::vector<int16_t> pcm;    // interleaved PCM16

    size_t frame_count() const {
        return channels > 0 ? pcm.size() / static_cast<size_t>(channels) : 0;
    }
    double duration_seconds() const {
        return sample_rate > 0 ? static_cast<double>(frame_count()) / sample_rate : 0.0;
    }
};

using AudioHandle = std::shared_ptr<const AudioClip>;

} // namespace audio
