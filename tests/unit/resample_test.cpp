#include <cassert>
#include <cmath>
#include <vector>
#include "audio/resample.hpp"

static void test_downmix() {
    std::vector<int16_t> stereo{100, 300, -200, 200, 32767, 32767};
    auto mono = audio::downmix_to_mono(stereo.data(), 3, 2);
    assert(mono.size() == 3);
    assert(mono[0] == 200);
    assert(mono[1] == 0);
    assert(mono[2] == 32767);

    std::vector<int16_t> one{1, 2, 3};
    assert(audio::downmix_to_mono(one.data(), 3, 1) == one);
    assert(audio::downmix_to_mono(nullptr, 3, 2).empty());
}

static void test_resample_lengths() {
    std::vector<int16_t> in(48000, 1000);
    std::vector<int16_t> out;
    audio::resample_i16_mono(in.data(), in.size(), 48000, 16000, out);
    assert(out.size() == 16000);
    for (int16_t s : out) assert(s == 1000);

    audio::resample_i16_mono(in.data(), 8000, 8000, 16000, out);
    assert(out.size() == 16000);

    audio::resample_i16_mono(in.data(), 100, 16000, 16000, out);
    assert(out.size() == 100);

    audio::resample_i16_mono(in.data(), 0, 44100, 16000, out);
    assert(out.empty());
}

static void test_interpolation_and_full_scale() {
    // 2x upsampling puts every odd output halfway between two inputs
    std::vector<int16_t> ramp{0, 100, -100, 32767, -32768};
    std::vector<int16_t> out;
    audio::resample_i16_mono(ramp.data(), ramp.size(), 8000, 16000, out);
    assert(out.size() == 10);
    assert(out[0] == 0);
    assert(out[1] == 50);
    assert(out[2] == 100);
    assert(out[3] == 0);
    assert(out[4] == -100);
    assert(out[6] == 32767);
    assert(out[8] == -32768);
    assert(out[9] == -32768);   // past the last input holds the final sample

    // full-scale input stays in range
    std::vector<int16_t> rails{32767, 32767, -32768, -32768, 32767};
    audio::resample_i16_mono(rails.data(), rails.size(), 11025, 16000, out);
    assert(!out.empty());
    assert(out.front() == 32767);
    for (int16_t s : out) assert(s >= -32768 && s <= 32767);
}

static void test_model_input() {
    audio::AudioClip clip;
    clip.sample_rate = 44100;
    clip.channels = 2;
    clip.pcm.assign(44100 * 2 * 2, 16384);   // 2 s stereo
    auto f = audio::to_model_input(clip);
    assert(f.size() == 32000);
    assert(std::fabs(f[100] - 0.5f) < 1e-4f);
    for (float v : f) assert(v >= -1.0f && v <= 1.0f);
}

int main() {
    test_downmix();
    test_resample_lengths();
    test_interpolation_and_full_scale();
    test_model_input();
    return 0;
}
