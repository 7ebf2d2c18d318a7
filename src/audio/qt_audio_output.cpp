#include "audio/qt_audio_output.hpp"
#include <QAudioDevice>
#include <QAudioFormat>
#include <QAudioSink>
#include <QBuffer>
#include <QDebug>
#include <QMediaDevices>
#include <utility>

namespace audio {

QtAudioOutput::QtAudioOutput() = default;

QtAudioOutput::~QtAudioOutput() {
    release_sink(true);
}

void QtAudioOutput::set_callbacks(FinishedCallback on_finished, OutputErrorCallback on_error) {
    on_finished_ = std::move(on_finished);
    on_error_ = std::move(on_error);
}

bool QtAudioOutput::start(AudioHandle clip, size_t start_frame, std::string& error) {
    stop();
    if (!clip || clip->channels <= 0 || clip->sample_rate <= 0) {
        error = "no audio to play";
        return false;
    }
    if (start_frame >= clip->frame_count()) {
        error = "start position is past the end of the audio";
        return false;
    }

    QAudioFormat format;
    format.setSampleRate(clip->sample_rate);
    format.setChannelCount(clip->channels);
    format.setSampleFormat(QAudioFormat::Int16);

    const QAudioDevice device = QMediaDevices::defaultAudioOutput();
    if (device.isNull()) {
        error = "no audio output device available";
        return false;
    }
    if (!device.isFormatSupported(format)) {
        error = "output device does not support " + std::to_string(clip->sample_rate) + " Hz / " +
                std::to_string(clip->channels) + " ch PCM16";
        return false;
    }

    const size_t offset = start_frame * static_cast<size_t>(clip->channels);
    const char* data = reinterpret_cast<const char*>(clip->pcm.data() + offset);
    const qsizetype size = static_cast<qsizetype>((clip->pcm.size() - offset) * sizeof(int16_t));
    bytes_ = QByteArray::fromRawData(data, size);
    clip_ = std::move(clip);

    buffer_ = std::make_unique<QBuffer>();
    buffer_->setBuffer(&bytes_);
    if (!buffer_->open(QIODevice::ReadOnly)) {
        error = "could not open playback buffer";
        buffer_.reset();
        clip_.reset();
        return false;
    }

    sink_ = std::make_unique<QAudioSink>(device, format);
    QObject::connect(sink_.get(), &QAudioSink::stateChanged, sink_.get(),
                     [this](QAudio::State state) { on_state_changed(state); });
    last_elapsed_s_ = 0.0;
    sink_->start(buffer_.get());
    if (sink_->error() != QAudio::NoError) {
        error = "audio sink failed to start (error " + std::to_string(static_cast<int>(sink_->error())) + ")";
        release_sink(false);
        return false;
    }
    playing_ = true;
    qDebug() << "Playback started at frame" << start_frame << "on" << device.description();
    return true;
}

void QtAudioOutput::stop() {
    if (!sink_) return;
    last_elapsed_s_ = elapsed_seconds();
    release_sink(false);
}

double QtAudioOutput::elapsed_seconds() const {
    if (!sink_ || !playing_) return last_elapsed_s_;
    return static_cast<double>(sink_->processedUSecs()) / 1e6;
}

void QtAudioOutput::on_state_changed(QAudio::State state) {
    if (stopping_ || !playing_ || !sink_) return;

    if (state == QAudio::IdleState) {
        // QBuffer drained: natural end of the clip
        last_elapsed_s_ = elapsed_seconds();
        playing_ = false;
        stopping_ = true;
        sink_->stop();
        stopping_ = false;
        if (on_finished_) on_finished_();
    } else if (state == QAudio::StoppedState && sink_->error() != QAudio::NoError) {
        const int code = static_cast<int>(sink_->error());
        qWarning() << "Audio sink stopped with error" << code;
        last_elapsed_s_ = elapsed_seconds();
        playing_ = false;
        if (on_error_) on_error_("audio output error " + std::to_string(code), true);
    }
}

void QtAudioOutput::release_sink(bool immediate) {
    playing_ = false;
    if (sink_) {
        stopping_ = true;
        sink_->stop();
        stopping_ = false;
        sink_->disconnect();
        if (immediate) {
            sink_.reset();
        } else {
            // may be inside one of the sink's own signals
            sink_.release()->deleteLater();
        }
    }
    buffer_.reset();
    bytes_.clear();
    clip_.reset();
}

} // namespace audio
