#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <QObject>

#include <qcorotask.h>

#include "AudioBackend.h"
#include "AudioRingBuffer.h"
#include "AudioSink.h"
#include "LevelStream.h"
#include "Transcription.h"
#include "Worker.h"

/*! Owns the microphone for one capture at a time.
 *
 *  The device handle lives on the thread that owns the backend. The captured
 *  samples, the level computation and the live level stream belong to the
 *  engine's worker and are only touched from jobs posted to it.
 *
 *  Signals:
 *  - captureFailed(message): the capture ended on its own, for example because
 *    the device went away and no fallback was possible. The buffer is discarded.
 *  - deviceFallback(description): the device went away and capture continues
 *    on the system default device.
 */
class AudioCaptureEngine : public QObject
{
    Q_OBJECT

public:
    enum class Phase {
        Idle,
        Starting,
        Capturing,
        Stopping
    };

    explicit AudioCaptureEngine(AudioBackend& backend, QObject *parent = nullptr);
    ~AudioCaptureEngine() override;

    std::vector<AudioDevice> listInputDevices() const;

    /*! Selects the device for the next capture. An empty id selects the system default.
     *
     *  Throws DictationError(DeviceUnavailable) if there is no device with that id.
     */
    void setDevice(const std::string& id);

    const std::string& selectedDeviceId() const noexcept {
        return selected_id_;
    }

    /*! Opens the device and starts buffering.
     *
     *  Throws DictationError(NoDeviceAvailable) if there is no input device, or
     *  DictationError(AudioRecordingFailed) if a capture is already running or
     *  the device could not be opened.
     */
    [[nodiscard]] QCoro::Task<std::shared_ptr<LevelStream>> startCapture();

    /*! Ends the capture and returns the samples.
     *
     *  Returns an empty buffer when no capture is running.
     */
    [[nodiscard]] QCoro::Task<AudioBuffer> stopCapture();

    /*! Ends the capture and discards the samples. Idempotent. */
    void cancelCapture();

    Phase phase() const noexcept {
        return phase_;
    }

    bool isCapturing() const noexcept {
        return capturing_.load();
    }

    const AudioDevice& activeDevice() const noexcept {
        return active_device_;
    }

signals:
    void captureFailed(const QString& message);
    void deviceFallback(const QString& description);

private:
    AudioDevice resolveDevice() const;
    void scheduleDrain();
    void consumeChunks(bool emitLevels);
    float computeLevel(std::span<const float> chunk);
    void closeDevice();
    void discardOnWorker();
    void onInputDevicesChanged();
    void onDeviceLost(const QString& reason);

    AudioBackend& backend_;
    std::string selected_id_;
    AudioDevice active_device_;
    Phase phase_{Phase::Idle};
    bool abort_start_{false};
    bool fallback_used_{false};
    std::unique_ptr<AudioSink> sink_;

    std::atomic_bool capturing_{false};
    std::atomic_bool drain_pending_{false};
    AudioRingBuffer ring_;

    // Owned by the worker
    std::vector<float> samples_;
    std::shared_ptr<LevelStream> stream_;
    float level_{};

    Worker worker_{"audio-capture"};
};

std::ostream& operator<<(std::ostream& os, AudioCaptureEngine::Phase phase);
