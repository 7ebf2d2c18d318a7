// Copyright (c) 2025 VAM Japanese Audio Transcriber
// TranscriptionBridge - Qt/QML bridge to TranscriptionController

#pragma once

#include "ui/sentence_list_model.hpp"

#include <QObject>
#include <QString>
#include <QTimer>
#include <QUrl>
#include <memory>
#include <string>

// Forward declarations
namespace app {
    class TranscriptionController;
    struct PlaybackState;
}
namespace audio {
    class QtAudioOutput;
}

class TranscriptionBridge : public QObject {
    Q_OBJECT

    // Properties exposed to QML
    Q_PROPERTY(QString status READ status NOTIFY statusChanged)
    Q_PROPERTY(bool statusIsError READ statusIsError NOTIFY statusChanged)
    Q_PROPERTY(QString loadedFile READ loadedFile NOTIFY loadedFileChanged)
    Q_PROPERTY(bool hasAudio READ hasAudio NOTIFY loadedFileChanged)
    Q_PROPERTY(bool isTranscribing READ isTranscribing NOTIFY isTranscribingChanged)
    Q_PROPERTY(bool isPlaying READ isPlaying NOTIFY isPlayingChanged)
    Q_PROPERTY(int currentIndex READ currentIndex NOTIFY currentIndexChanged)
    Q_PROPERTY(QString whisperModel READ whisperModel CONSTANT)
    Q_PROPERTY(SentenceListModel* sentences READ sentences CONSTANT)

public:
    explicit TranscriptionBridge(QObject* parent = nullptr);
    ~TranscriptionBridge();

    // Property getters
    QString status() const { return status_; }
    bool statusIsError() const { return status_is_error_; }
    QString loadedFile() const { return loaded_file_; }
    bool hasAudio() const { return !loaded_file_.isEmpty(); }
    bool isTranscribing() const { return is_transcribing_; }
    bool isPlaying() const { return is_playing_; }
    int currentIndex() const { return current_index_; }
    QString whisperModel() const;
    SentenceListModel* sentences() const { return sentences_; }

public slots:
    void loadAudio(const QUrl& url);
    void transcribe();
    void play();
    void stop();
    void selectSentence(int row);

signals:
    void statusChanged();
    void loadedFileChanged();
    void isTranscribingChanged();
    void isPlayingChanged();
    void currentIndexChanged();

private:
    // Callback handlers (controller events -> Qt signals)
    void onStatus(const std::string& message, bool is_error);
    void onPlayback(const app::PlaybackState& state);
    void onBusy(bool busy);
    void updateCurrentIndex();

    // Declaration order matters: the controller refers to the output
    std::unique_ptr<audio::QtAudioOutput> output_;
    std::unique_ptr<app::TranscriptionController> controller_;
    SentenceListModel* sentences_ = nullptr;     // child QObject
    QTimer position_timer_;

    QString status_;
    bool status_is_error_ = false;
    QString loaded_file_;
    bool is_transcribing_ = false;
    bool is_playing_ = false;
    int current_index_ = -1;
};
