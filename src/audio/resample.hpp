#pragma once
#include "audio/audio_clip.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace audio {

constexpr int MODEL_SAMPLE_RATE = 16000;

// Average interleaved channels into one.
std::vector<int16_t> downmix_to_mono(const int16_t* interleaved, size_t frames, int channels);

// Linear-interpolation resampler for mono PCM16.
void resample_i16_mono(const int16_t* in, size_t in_frames, int in_sr, int out_sr, std::vector<int16_t>& out);

// 16 kHz mono float in [-1, 1], the input format Whisper expects.
std::vector<float> to_model_input(const AudioClip& clip);

} // namespace audio
