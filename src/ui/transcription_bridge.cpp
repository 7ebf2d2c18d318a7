// Copyright (c) 2025 VAM Japanese Audio Transcriber
// TranscriptionBridge - Implementation

#include "ui/transcription_bridge.hpp"
#include "app/transcription_controller.hpp"
#include "audio/qt_audio_output.hpp"
#include "core/config.hpp"

#include <QDebug>
#include <QFileInfo>
#include <QMetaObject>

using namespace app;

namespace {
constexpr int POSITION_POLL_MS = 100;
}

TranscriptionBridge::TranscriptionBridge(QObject* parent)
    : QObject(parent)
    , output_(std::make_unique<audio::QtAudioOutput>())
    , sentences_(new SentenceListModel(this))
{
    // Worker results are marshaled to the Qt main thread; queued events
    // addressed to this object are dropped when it is destroyed.
    Dispatcher dispatcher = [this](std::function<void()> task) {
        QMetaObject::invokeMethod(this, std::move(task), Qt::QueuedConnection);
    };
    controller_ = std::make_unique<TranscriptionController>(core::get_config(), *output_, std::move(dispatcher));

    // Subscribe to controller events (all delivered on the UI thread)
    controller_->subscribe_to_status([this](const std::string& message, bool is_error) {
        onStatus(message, is_error);
    });
    controller_->subscribe_to_transcript([this](const Transcript& transcript) {
        sentences_->setTranscript(transcript);
        updateCurrentIndex();
    });
    controller_->subscribe_to_playback([this](const PlaybackState& state) {
        onPlayback(state);
    });
    controller_->subscribe_to_busy([this](bool busy) {
        onBusy(busy);
    });

    status_ = QString::fromStdString(controller_->status());
    status_is_error_ = controller_->status_is_error();

    position_timer_.setInterval(POSITION_POLL_MS);
    connect(&position_timer_, &QTimer::timeout, this, &TranscriptionBridge::updateCurrentIndex);
}

TranscriptionBridge::~TranscriptionBridge() {
    position_timer_.stop();
    controller_.reset();
}

QString TranscriptionBridge::whisperModel() const {
    return QString::fromStdString(controller_->config().whisper_model);
}

//==============================================================================
// Commands
//==============================================================================

void TranscriptionBridge::loadAudio(const QUrl& url) {
    const QString path = url.isLocalFile() ? url.toLocalFile() : url.toString();
    if (path.isEmpty()) {
        return;
    }
    if (controller_->load_audio(path.toStdString())) {
        loaded_file_ = QFileInfo(path).fileName();
        emit loadedFileChanged();
    }
}

void TranscriptionBridge::transcribe() {
    controller_->transcribe();
}

void TranscriptionBridge::play() {
    controller_->play(0.0);
}

void TranscriptionBridge::stop() {
    controller_->stop();
}

void TranscriptionBridge::selectSentence(int row) {
    if (row < 0) {
        qWarning() << "Ignoring selection of row" << row;
        return;
    }
    controller_->select_segment(static_cast<size_t>(row));
}

//==============================================================================
// Event Handlers (Convert C++ -> Qt Signals)
//==============================================================================

void TranscriptionBridge::onStatus(const std::string& message, bool is_error) {
    status_ = QString::fromStdString(message);
    status_is_error_ = is_error;
    emit statusChanged();
}

void TranscriptionBridge::onPlayback(const PlaybackState& state) {
    if (is_playing_ != state.is_playing) {
        is_playing_ = state.is_playing;
        emit isPlayingChanged();
    }
    if (is_playing_) {
        position_timer_.start();
    } else {
        position_timer_.stop();
    }
    updateCurrentIndex();
}

void TranscriptionBridge::onBusy(bool busy) {
    if (is_transcribing_ != busy) {
        is_transcribing_ = busy;
        emit isTranscribingChanged();
    }
}

void TranscriptionBridge::updateCurrentIndex() {
    const int index = controller_ ? controller_->current_segment_index() : -1;
    if (index != current_index_) {
        current_index_ = index;
        emit currentIndexChanged();
    }
}
