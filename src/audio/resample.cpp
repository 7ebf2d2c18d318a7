#include "audio/resample.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace audio {

std::vector<int16_t> downmix_to_mono(const int16_t* interleaved, size_t frames, int channels) {
    std::vector<int16_t> mono;
    if (!interleaved || channels <= 0) return mono;
    if (channels == 1) {
        mono.assign(interleaved, interleaved + frames);
        return mono;
    }
    mono.resize(frames);
    for (size_t i = 0; i < frames; ++i) {
        int32_t sum = 0;
        for (int c = 0; c < channels; ++c) {
            sum += interleaved[i * channels + c];
        }
        mono[i] = static_cast<int16_t>(sum / channels);
    }
    return mono;
}

namespace {

constexpr int PCM16_MIN = std::numeric_limits<int16_t>::min();
constexpr int PCM16_MAX = std::numeric_limits<int16_t>::max();

int16_t to_pcm16(double v) {
    return static_cast<int16_t>(std::clamp(static_cast<int>(std::lround(v)), PCM16_MIN, PCM16_MAX));
}

} // namespace

void resample_i16_mono(const int16_t* in, size_t in_frames, int in_sr, int out_sr, std::vector<int16_t>& out) {
    out.clear();
    if (!in || in_sr <= 0 || out_sr <= 0 || in_frames == 0) return;
    if (in_sr == out_sr) {
        out.assign(in, in + in_frames);
        return;
    }
    // source position of output sample i is i * step
    const double step = static_cast<double>(in_sr) / static_cast<double>(out_sr);
    const size_t out_len = static_cast<size_t>(std::lround(static_cast<double>(in_frames) / step));
    const size_t last = in_frames - 1;
    out.reserve(out_len);
    for (size_t i = 0; i < out_len; ++i) {
        const double pos = static_cast<double>(i) * step;
        const size_t k = static_cast<size_t>(pos);
        if (k >= last) {
            out.push_back(in[last]);
            continue;
        }
        const double t = pos - static_cast<double>(k);
        out.push_back(to_pcm16(in[k] + t * (in[k + 1] - in[k])));
    }
}

std::vector<float> to_model_input(const AudioClip& clip) {
    const std::vector<int16_t> mono = downmix_to_mono(clip.pcm.data(), clip.frame_count(), clip.channels);
    std::vector<int16_t> mono_16k;
    resample_i16_mono(mono.data(), mono.size(), clip.sample_rate, MODEL_SAMPLE_RATE, mono_16k);

    std::vector<float> pcm_f32;
    pcm_f32.reserve(mono_16k.size());
    constexpr float scale = 1.0f / 32768.0f;
    for (int16_t s : mono_16k) {
        pcm_f32.push_back(static_cast<float>(s) * scale);
    }
    return pcm_f32;
}

} // namespace audio
