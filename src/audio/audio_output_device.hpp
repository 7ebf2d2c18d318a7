#pragma once

#include "audio/audio_clip.hpp"
#include <cstddef>
#include <functional>
#include <string>

namespace audio {

/**
 * @brief Called when a stream reaches the end of its data (not after stop())
 */
using FinishedCallback = std::function<void()>;

/**
 * @brief Error callback for device issues during playback
 *
 * @param error_message Human-readable error description
 * @param is_fatal If true, the stream has stopped
 */
using OutputErrorCallback = std::function<void(const std::string& error_message, bool is_fatal)>;

/**
 * @brief Abstract base class for audio output devices
 *
 * Implementations:
 * - QtAudioOutput (Qt Multimedia QAudioSink)
 *
 * Callbacks are delivered on the thread that owns the device (the UI
 * thread). The device plays one stream at a time; start() replaces any
 * active stream.
 */
class IAudioOutputDevice {
public:
    virtual ~IAudioOutputDevice() = default;

    virtual void set_callbacks(FinishedCallback on_finished, OutputErrorCallback on_error) = 0;

    /**
     * @brief Start playing clip from start_frame
     * @param clip Audio to play; kept alive by the device while playing
     * @param start_frame First frame to play
     * @param[out] error Reason on failure
     * @return true if playback started
     */
    virtual bool start(AudioHandle clip, size_t start_frame, std::string& error) = 0;

    /**
     * @brief Stop the active stream; no-op if none
     */
    virtual void stop() = 0;

    virtual bool is_playing() const = 0;

    /**
     * @brief Seconds of audio played since the last start()
     */
    virtual double elapsed_seconds() const = 0;
};

} // namespace audio
