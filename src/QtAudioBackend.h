#pragma once

#include <memory>

#include <QAudioDevice>
#include <QAudioFormat>
#include <QAudioSource>
#include <QMediaDevices>

#include "AudioBackend.h"

/*! AudioBackend on top of Qt Multimedia. */
class QtAudioBackend : public AudioBackend
{
    Q_OBJECT
public:
    explicit QtAudioBackend(QObject *parent = nullptr);
    ~QtAudioBackend() override;

    std::vector<AudioDevice> inputDevices() const override;
    std::optional<AudioDevice> defaultInputDevice() const override;
    bool open(const AudioDevice& device, AudioSink& sink) override;
    void close() override;

    bool isOpen() const noexcept override {
        return source_ != nullptr;
    }

private:
    static AudioDevice toDevice(const QAudioDevice& device, bool isDefault);
    static QAudioFormat createWhisperFormat(const QAudioDevice &device);
    void onStateChanged(QAudio::State state);
    void printDevices() const;

    QMediaDevices media_devices_;
    std::unique_ptr<QAudioSource> source_;
};
