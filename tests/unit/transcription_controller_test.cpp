#include <cassert>
#include <memory>
#include <string>
#include "app/transcription_controller.hpp"
#include "test_support.hpp"

using app::ErrorCode;
using app::TranscriptionController;
using State = app::PlaybackState::State;

namespace {

struct Fixture {
    test::TaskQueue queue;
    test::FakeAudioOutput output;
    std::shared_ptr<test::MockBehavior> behavior = std::make_shared<test::MockBehavior>();
    int models_created = 0;
    bool busy = false;
    int transcript_updates = 0;
    std::unique_ptr<TranscriptionController> controller;

    Fixture() {
        core::Config cfg;
        cfg.ffmpeg_path = "/nonexistent/bin/ffmpeg";
        auto b = behavior;
        controller = std::make_unique<TranscriptionController>(
            cfg, output, queue.dispatcher(),
            [this, b](const core::Config&) -> std::unique_ptr<asr::ISpeechModel> {
                ++models_created;
                return std::make_unique<test::MockSpeechModel>(b);
            });
        controller->subscribe_to_busy([this](bool value) { busy = value; });
        controller->subscribe_to_transcript([this](const app::Transcript&) { ++transcript_updates; });
    }

    bool finish_job() {
        return queue.pump_until([this] { return !busy; });
    }
};

std::string write_silence(const std::string& dir_name, const std::string& file, double seconds) {
    auto path = test::temp_dir(dir_name) / file;
    test::write_wav(path, 16000, 1, static_cast<size_t>(seconds * 16000));
    return path.string();
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

static void test_initial_state() {
    Fixture f;
    auto& c = *f.controller;
    assert(c.status() == "Ready. Whisper model: small");
    assert(!c.status_is_error());
    assert(!c.has_audio());
    assert(c.transcript().empty());
    assert(c.playback_state().state == State::IDLE);
    assert(c.current_segment_index() == -1);

    assert(!c.transcribe());
    assert(c.status() == "No audio loaded");
    assert(c.status_is_error());
    assert(f.models_created == 0);

    assert(!c.play());
    assert(c.last_error().code == ErrorCode::PLAYBACK_FAILURE);
    assert(!c.select_segment(0));
}

static void test_silence_passthrough() {
    Fixture f;
    auto& c = *f.controller;
    f.behavior->segments = {{"はじめまして。", 0, 1200}, {"よろしくお願いします。", 1200, 4800}};

    assert(c.load_audio(write_silence("ctl_pass", "silence.wav", 5.0)));
    assert(c.status() == "Loaded audio: silence.wav");
    assert(c.has_audio());

    assert(c.transcribe());
    assert(f.busy);
    assert(f.finish_job());

    const auto& t = c.transcript();
    assert(t.size() == 2);
    assert(t[0].text == "はじめまして。" && t[0].start_time == 0.0 && t[0].end_time == 1.2);
    assert(t[1].text == "よろしくお願いします。" && t[1].start_time == 1.2 && t[1].end_time == 4.8);
    assert(c.status() == "Transcription done! (2 sentences)");
    assert(!c.status_is_error());
    assert(f.behavior->last_input_samples == 80000);
    assert(f.models_created == 1);

    // second run reuses the model
    assert(c.transcribe());
    assert(f.finish_job());
    assert(f.models_created == 1);
    assert(f.behavior->load_calls == 1);
}

static void test_select_and_playback() {
    Fixture f;
    auto& c = *f.controller;
    f.behavior->segments = {{"一", 0, 1000}, {"二", 1500, 3000}, {"三", 3200, 4900}};
    assert(c.load_audio(write_silence("ctl_play", "a.wav", 5.0)));
    assert(c.transcribe());
    assert(f.finish_job());

    assert(c.select_segment(1));
    assert(c.playback_state().state == State::PLAYING);
    assert(c.playback_state().current_offset == c.transcript()[1].start_time);
    assert(f.output.last_start_frame == 24000);
    assert(c.current_segment_index() == 1);
    assert(starts_with(c.status(), "Playing from 00:01.50"));

    f.output.elapsed = 2.0;
    assert(c.playback_position() == 3.5);
    assert(c.current_segment_index() == 2);

    // clicking while playing leaves exactly one stream
    assert(c.select_segment(2));
    assert(f.output.active_streams() == 1);
    assert(f.output.overlapping_starts == 0);
    assert(c.playback_state().current_offset == 3.2);

    assert(!c.select_segment(3));
    assert(c.playback_state().current_offset == 3.2);

    c.stop();
    assert(c.status() == "Stopped");
    assert(c.playback_state().state == State::STOPPED);
    assert(f.output.active_streams() == 0);

    // stop when not playing changes nothing
    c.stop();
    assert(c.status() == "Stopped");

    assert(c.play());
    f.output.finish();
    assert(c.playback_state().state == State::STOPPED);
    assert(c.status() == "Playback finished");

    assert(c.play(1.0));
    f.output.fail("device lost");
    assert(c.status_is_error());
    assert(c.last_error().code == ErrorCode::PLAYBACK_FAILURE);

    assert(!c.play(99.0));
    assert(c.status_is_error());
}

static void test_stop_when_idle() {
    Fixture f;
    auto& c = *f.controller;
    assert(c.load_audio(write_silence("ctl_idle", "a.wav", 1.0)));
    const std::string before = c.status();
    const int stops = f.output.stop_calls;
    c.stop();
    assert(c.status() == before);
    assert(f.output.stop_calls == stops);
    assert(c.playback_state().state == State::IDLE);
}

static void test_load_errors_keep_transcript() {
    Fixture f;
    auto& c = *f.controller;
    f.behavior->segments = {{"残る", 0, 1000}};
    const std::string good = write_silence("ctl_err", "good.wav", 2.0);
    assert(c.load_audio(good));
    assert(c.transcribe());
    assert(f.finish_job());
    assert(c.transcript().size() == 1);
    const int updates = f.transcript_updates;

    assert(!c.load_audio(good + ".missing.wav"));
    assert(c.last_error().code == ErrorCode::FILE_NOT_FOUND);
    assert(c.status_is_error());
    assert(c.transcript().size() == 1);
    assert(c.loaded_path() == good);
    assert(f.transcript_updates == updates);

    auto txt = test::temp_dir("ctl_err_fmt") / "notes.txt";
    test::write_text(txt, "not audio");
    assert(!c.load_audio(txt.string()));
    assert(c.last_error().code == ErrorCode::INVALID_FORMAT);
    assert(c.transcript().size() == 1);
}

static void test_reload_clears_state() {
    Fixture f;
    auto& c = *f.controller;
    f.behavior->segments = {{"一", 0, 1000}};
    assert(c.load_audio(write_silence("ctl_reload", "a.wav", 3.0)));
    assert(c.transcribe());
    assert(f.finish_job());
    assert(c.play(1.0));

    assert(c.load_audio(write_silence("ctl_reload2", "b.wav", 2.0)));
    assert(c.transcript().empty());
    assert(c.playback_state().state == State::IDLE);
    assert(!c.playback_state().is_playing);
    assert(c.playback_state().current_offset == 0.0);
    assert(f.output.active_streams() == 0);
    assert(c.status() == "Loaded audio: b.wav");
}

static void test_model_throws_keeps_transcript() {
    Fixture f;
    auto& c = *f.controller;
    f.behavior->segments = {{"前回", 0, 1000}};
    assert(c.load_audio(write_silence("ctl_throw", "a.wav", 2.0)));
    assert(c.transcribe());
    assert(f.finish_job());

    f.behavior->throw_on_transcribe = true;
    assert(c.transcribe());
    assert(f.finish_job());
    assert(c.status_is_error());
    assert(c.status().find("inference crashed") != std::string::npos);
    assert(c.last_error().code == ErrorCode::TRANSCRIPTION_FAILURE);
    assert(c.transcript().size() == 1);
    assert(c.transcript()[0].text == "前回");
}

static void test_busy_rejected() {
    Fixture f;
    auto& c = *f.controller;
    f.behavior->block = true;
    assert(c.load_audio(write_silence("ctl_busy", "a.wav", 1.0)));
    assert(c.transcribe());
    assert(!c.transcribe());
    assert(c.status() == "Transcription already in progress");
    f.behavior->release();
    assert(f.finish_job());
    assert(!c.is_transcribing());
    assert(c.transcribe());
    assert(f.finish_job());
}

static void test_stale_result_discarded() {
    Fixture f;
    auto& c = *f.controller;
    f.behavior->block = true;
    f.behavior->ignore_abort = true;
    f.behavior->segments = {{"古い", 0, 1000}};
    assert(c.load_audio(write_silence("ctl_stale", "old.wav", 2.0)));
    assert(c.transcribe());

    assert(c.load_audio(write_silence("ctl_stale2", "new.wav", 2.0)));
    f.behavior->release();
    assert(f.finish_job());

    assert(c.transcript().empty());
    assert(c.status() == "Loaded audio: new.wav");
    assert(c.last_error().code == ErrorCode::NONE);
}

static void test_model_load_failure_and_retry() {
    Fixture f;
    auto& c = *f.controller;
    f.behavior->fail_load = true;
    f.behavior->segments = {{"成功", 0, 1000}};
    assert(c.load_audio(write_silence("ctl_load", "a.wav", 1.0)));
    assert(c.transcribe());
    assert(f.finish_job());
    assert(c.status_is_error());
    assert(c.last_error().code == ErrorCode::MODEL_LOAD_FAILURE);
    assert(c.status().find("ggml-mock.bin") != std::string::npos);
    assert(c.transcript().empty());

    f.behavior->fail_load = false;
    assert(c.transcribe());
    assert(f.finish_job());
    assert(!c.status_is_error());
    assert(c.transcript().size() == 1);
    assert(f.behavior->load_calls == 2);
}

static void test_factory_failure() {
    test::TaskQueue queue;
    test::FakeAudioOutput output;
    core::Config cfg;
    TranscriptionController c(cfg, output, queue.dispatcher(),
                              [](const core::Config&) { return std::unique_ptr<asr::ISpeechModel>(); });
    assert(c.load_audio(write_silence("ctl_factory", "a.wav", 1.0)));
    assert(!c.transcribe());
    assert(c.last_error().code == ErrorCode::MODEL_LOAD_FAILURE);
    assert(c.status_is_error());
    assert(!c.is_transcribing());
}

static void test_factory_throws_non_std() {
    test::TaskQueue queue;
    test::FakeAudioOutput output;
    core::Config cfg;
    int attempts = 0;
    TranscriptionController c(cfg, output, queue.dispatcher(),
                              [&attempts](const core::Config&) -> std::unique_ptr<asr::ISpeechModel> {
                                  ++attempts;
                                  throw 13;
                              });
    assert(c.load_audio(write_silence("ctl_factory_int", "a.wav", 1.0)));
    assert(!c.transcribe());
    assert(c.last_error().code == ErrorCode::MODEL_LOAD_FAILURE);
    assert(starts_with(c.status(), "Failed to create Whisper model"));
    assert(!c.is_transcribing());

    // nothing was cached, so the next attempt asks the factory again
    assert(!c.transcribe());
    assert(attempts == 2);
}

static void test_destroy_while_running() {
    Fixture f;
    f.behavior->block = true;
    assert(f.controller->load_audio(write_silence("ctl_destroy", "a.wav", 1.0)));
    assert(f.controller->transcribe());
    f.controller.reset();   // aborts the mock and joins the worker
    assert(f.busy);   // the outcome was never delivered
}

int main() {
    test_initial_state();
    test_silence_passthrough();
    test_select_and_playback();
    test_stop_when_idle();
    test_load_errors_keep_transcript();
    test_reload_clears_state();
    test_model_throws_keeps_transcript();
    test_busy_rejected();
    test_stale_result_discarded();
    test_model_load_failure_and_retry();
    test_factory_failure();
    test_factory_throws_non_std();
    test_destroy_while_running();
    return 0;
}
