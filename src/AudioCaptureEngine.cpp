#include <algorithm>
#include <cassert>
#include <array>
#include <cmath>
#include <format>
#include <ostream>

#include <qcorofuture.h>

#include "AudioCaptureEngine.h"
#include "Errors.h"
#include "logging.h"

using namespace std;

namespace {

// ~30 seconds at 16 kHz
constexpr size_t initial_reserve = AudioBuffer::whisper_sample_rate * 30;

} // anon ns

std::ostream& operator<<(std::ostream& os, AudioCaptureEngine::Phase phase)
{
    static constexpr auto names = to_array<string_view>({
        "Idle",
        "Starting",
        "Capturing",
        "Stopping"
    });

    return os << names.at(static_cast<size_t>(phase));
}

AudioCaptureEngine::AudioCaptureEngine(AudioBackend &backend, QObject *parent)
    : QObject(parent)
    , backend_{backend}
{
    connect(&backend_, &AudioBackend::inputDevicesChanged,
            this, &AudioCaptureEngine::onInputDevicesChanged);
    connect(&backend_, &AudioBackend::streamError,
            this, &AudioCaptureEngine::onDeviceLost);
}

AudioCaptureEngine::~AudioCaptureEngine()
{
    if (phase_ == Phase::Capturing) {
        closeDevice();
    }

    worker_.stop();
}

std::vector<AudioDevice> AudioCaptureEngine::listInputDevices() const
{
    return backend_.inputDevices();
}

void AudioCaptureEngine::setDevice(const std::string &id)
{
    if (!id.empty()) {
        const auto devices = backend_.inputDevices();
        if (ranges::find(devices, id, &AudioDevice::id) == devices.end()) {
            throw DictationError{DictationError::Kind::DeviceUnavailable, id};
        }
    }

    LOG_INFO_N << "Audio input device for the next capture: " << (id.empty() ? "system default" : id);
    selected_id_ = id;
}

QCoro::Task<std::shared_ptr<LevelStream>> AudioCaptureEngine::startCapture()
{
    if (phase_ != Phase::Idle) {
        LOG_WARN_N << "startCapture() called in phase " << phase_;
        throw DictationError{DictationError::Kind::AudioRecordingFailed, "a capture is already in progress"};
    }

    const auto device = resolveDevice();
    phase_ = Phase::Starting;
    abort_start_ = false;

    auto stream = make_shared<LevelStream>();
    co_await worker_.post([this, stream] {
        samples_.clear();
        samples_.reserve(initial_reserve);
        level_ = 0.0f;
        stream_ = stream;
    });

    ring_.clear();
    sink_ = make_unique<AudioSink>(ring_, capturing_, [this] { scheduleDrain(); });

    bool opened = false;
    if (!abort_start_ && sink_->open(QIODevice::WriteOnly)) {
        capturing_.store(true, memory_order_release);
        opened = backend_.open(device, *sink_);
    }

    if (!opened || abort_start_) {
        const bool aborted = abort_start_;
        closeDevice();
        discardOnWorker();
        phase_ = Phase::Idle;

        throw DictationError{DictationError::Kind::AudioRecordingFailed,
                             aborted ? string{"the capture was cancelled while starting"}
                                     : format("could not open the audio input device '{}'", device.description)};
    }

    active_device_ = device;
    fallback_used_ = false;
    phase_ = Phase::Capturing;

    LOG_INFO_N << "Capturing audio from " << device.description;
    co_return stream;
}

QCoro::Task<AudioBuffer> AudioCaptureEngine::stopCapture()
{
    switch(phase_) {
    case Phase::Idle:
    case Phase::Stopping:
        LOG_DEBUG_N << "stopCapture() called in phase " << phase_ << ". Nothing to stop.";
        co_return AudioBuffer{};
    case Phase::Starting:
        LOG_DEBUG_N << "stopCapture() called while the device is opening. Aborting the start.";
        abort_start_ = true;
        co_return AudioBuffer{};
    case Phase::Capturing:
        break;
    }

    phase_ = Phase::Stopping;
    closeDevice();

    auto samples = co_await worker_.post([this] {
        consumeChunks(false);
        if (stream_) {
            stream_->close();
            stream_.reset();
        }
        return std::exchange(samples_, {});
    });

    phase_ = Phase::Idle;

    AudioBuffer buffer;
    buffer.samples = std::move(samples);

    LOG_INFO_N << format("Captured {:.2f} seconds of audio ({} chunks dropped)",
                         buffer.durationSeconds(), ring_.droppedChunks());
    co_return buffer;
}

void AudioCaptureEngine::cancelCapture()
{
    switch(phase_) {
    case Phase::Idle:
    case Phase::Stopping:
        LOG_TRACE_N << "cancelCapture() called in phase " << phase_;
        return;
    case Phase::Starting:
        abort_start_ = true;
        return;
    case Phase::Capturing:
        break;
    }

    LOG_INFO_N << "Cancelling audio capture";
    closeDevice();
    discardOnWorker();
    phase_ = Phase::Idle;
}

AudioDevice AudioCaptureEngine::resolveDevice() const
{
    const auto devices = backend_.inputDevices();
    if (devices.empty()) {
        throw DictationError{DictationError::Kind::NoDeviceAvailable};
    }

    if (!selected_id_.empty()) {
        if (auto it = ranges::find(devices, selected_id_, &AudioDevice::id); it != devices.end()) {
            return *it;
        }
        LOG_WARN_N << "The selected audio input device " << selected_id_
                   << " is gone. Using the system default.";
    }

    if (auto def = backend_.defaultInputDevice()) {
        return *def;
    }

    return devices.front();
}

void AudioCaptureEngine::scheduleDrain()
{
    if (drain_pending_.exchange(true)) {
        return;
    }

    worker_.post([this] {
        drain_pending_ = false;
        if (!capturing_.load(memory_order_acquire)) {
            // The capture ended. Whatever is left is collected by the final job.
            return;
        }
        consumeChunks(true);
    });
}

void AudioCaptureEngine::consumeChunks(bool emitLevels)
{
    assert(worker_.isCurrentThread());

    for (const auto& chunk : ring_.drain()) {
        if (emitLevels && stream_) {
            stream_->push(computeLevel(chunk));
        }
        samples_.insert(samples_.end(), chunk.begin(), chunk.end());
    }
}

float AudioCaptureEngine::computeLevel(std::span<const float> chunk)
{
    if (chunk.empty()) {
        return level_;
    }

    double sum = 0.0;
    for (const auto s : chunk) {
        sum += static_cast<double>(s) * s;
    }
    const auto rms = std::sqrt(sum / static_cast<double>(chunk.size()));

    // Speech rarely goes above 0.2 RMS, so scale it up before clamping
    const auto target = std::clamp(rms * 5.0, 0.0, 1.0);

    // Smooth with simple low-pass filter so the meter doesn't flicker
    constexpr double alpha = 0.3;
    level_ = static_cast<float>(std::clamp(alpha * target + (1.0 - alpha) * level_, 0.0, 1.0));
    return level_;
}

void AudioCaptureEngine::closeDevice()
{
    // Late callbacks from the audio thread become no-ops from here on
    capturing_.store(false, memory_order_release);
    backend_.close();

    if (sink_) {
        sink_->flush();
        sink_->close();
        sink_.reset();
    }
}

void AudioCaptureEngine::discardOnWorker()
{
    worker_.post([this] {
        ring_.clear();
        samples_ = {};
        if (stream_) {
            stream_->close();
            stream_.reset();
        }
    });
}

void AudioCaptureEngine::onInputDevicesChanged()
{
    if (phase_ != Phase::Capturing) {
        return;
    }

    const auto devices = backend_.inputDevices();
    if (ranges::find(devices, active_device_.id, &AudioDevice::id) != devices.end()) {
        return;
    }

    onDeviceLost(QStringLiteral("the device was removed"));
}

void AudioCaptureEngine::onDeviceLost(const QString &reason)
{
    if (phase_ != Phase::Capturing) {
        return;
    }

    LOG_WARN_N << "Lost audio input device " << active_device_.description << ": " << reason.toStdString();

    if (!fallback_used_) {
        fallback_used_ = true;

        const auto def = backend_.defaultInputDevice();
        if (def && def->id != active_device_.id) {
            backend_.close();
            sink_->flush();
            if (backend_.open(*def, *sink_)) {
                LOG_INFO_N << "Continuing the capture on " << def->description;
                active_device_ = *def;
                emit deviceFallback(QString::fromStdString(def->description));
                return;
            }
            LOG_WARN_N << "Failed to open the fallback device " << def->description;
        }
    }

    closeDevice();
    discardOnWorker();
    phase_ = Phase::Idle;

    const DictationError err{DictationError::Kind::AudioDeviceDisconnected};
    emit captureFailed(QString::fromUtf8(err.what()));
}
