#pragma once

#include "audio/audio_output_device.hpp"
#include <QAudio>
#include <QByteArray>
#include <memory>

class QAudioSink;
class QBuffer;

namespace audio {

/**
 * @brief Plays PCM16 clips through the default output with QAudioSink
 *
 * Must be created and used on a thread with a running Qt event loop.
 * Seeking is done by the caller (stop + start at a new frame).
 */
class QtAudioOutput : public IAudioOutputDevice {
public:
    QtAudioOutput();
    ~QtAudioOutput() override;

    void set_callbacks(FinishedCallback on_finished, OutputErrorCallback on_error) override;
    bool start(AudioHandle clip, size_t start_frame, std::string& error) override;
    void stop() override;
    bool is_playing() const override { return playing_; }
    double elapsed_seconds() const override;

private:
    void on_state_changed(QAudio::State state);
    void release_sink(bool immediate);

    FinishedCallback on_finished_;
    OutputErrorCallback on_error_;

    std::unique_ptr<QAudioSink> sink_;
    std::unique_ptr<QBuffer> buffer_;
    QByteArray bytes_;           // raw view into clip_->pcm
    AudioHandle clip_;
    bool playing_ = false;
    bool stopping_ = false;
    double last_elapsed_s_ = 0.0;
};

} // namespace audio
