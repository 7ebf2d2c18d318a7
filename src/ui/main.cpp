// Copyright (c) 2025 VAM Japanese Audio Transcriber
// Main entry point for Qt GUI application

#include <QGuiApplication>
#include <QQmlApplicationEngine>

#include "core/config.hpp"
#include "core/logging.hpp"
#include "sentence_list_model.hpp"
#include "transcription_bridge.hpp"

int main(int argc, char* argv[]) {
    QGuiApplication app(argc, argv);
    QGuiApplication::setApplicationName("Japanese Audio Transcriber");

    const core::Config& cfg = core::get_config();
    core::log_info("whisper model: " + cfg.whisper_model + " (dir: " + cfg.model_dir + ")");

    // Register types for QML
    qmlRegisterType<TranscriptionBridge>("App", 1, 0, "TranscriptionBridge");
    qmlRegisterUncreatableType<SentenceListModel>("App", 1, 0, "SentenceListModel",
                                                  "SentenceListModel is provided by TranscriptionBridge");

    // Create QML engine
    QQmlApplicationEngine engine;

    // Load main QML file
    engine.loadFromModule("App", "Main");

    if (engine.rootObjects().isEmpty()) {
        core::log_error("failed to load the QML window");
        return -1;
    }

    return app.exec();
}
