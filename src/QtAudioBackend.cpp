#include "QtAudioBackend.h"
#include "AudioSink.h"

#include "logging.h"

using namespace std;

QtAudioBackend::QtAudioBackend(QObject *parent)
    : AudioBackend(parent)
{
    LOG_DEBUG_N << "Available audio input devices: ";
    printDevices();

    connect(&media_devices_, &QMediaDevices::audioInputsChanged, this, [this]{
        LOG_INFO_N << "Audio input devices changed. Now " << media_devices_.audioInputs().size() << " devices.";
        printDevices();
        emit inputDevicesChanged();
    });
}

QtAudioBackend::~QtAudioBackend()
{
    close();
}

std::vector<AudioDevice> QtAudioBackend::inputDevices() const
{
    const auto def = QMediaDevices::defaultAudioInput();

    std::vector<AudioDevice> devices;
    for (const auto& dev : media_devices_.audioInputs()) {
        devices.push_back(toDevice(dev, !def.isNull() && dev.id() == def.id()));
    }
    return devices;
}

std::optional<AudioDevice> QtAudioBackend::defaultInputDevice() const
{
    const auto def = QMediaDevices::defaultAudioInput();
    if (def.isNull()) {
        return {};
    }
    return toDevice(def, true);
}

bool QtAudioBackend::open(const AudioDevice &device, AudioSink &sink)
{
    close();

    QAudioDevice qdev;
    for (const auto& dev : media_devices_.audioInputs()) {
        if (dev.id().toStdString() == device.id) {
            qdev = dev;
            break;
        }
    }

    if (qdev.isNull()) {
        LOG_WARN_N << "Audio input device " << device.id << " is not present.";
        return false;
    }

    const auto format = createWhisperFormat(qdev);
    if (!format.isValid()) {
        LOG_WARN_N << "Audio input device " << device.description << " has no usable format.";
        return false;
    }

    sink.setInputFormat(format);
    if (!sink.isOpen() && !sink.open(QIODevice::WriteOnly)) {
        return false;
    }

    source_ = make_unique<QAudioSource>(qdev, format);
    connect(source_.get(), &QAudioSource::stateChanged, this, &QtAudioBackend::onStateChanged);

    LOG_INFO_N << "Starting audio capture from " << device.description;
    source_->start(&sink); // push mode

    if (source_->error() != QAudio::NoError) {
        LOG_WARN_N << "Failed to start audio capture from " << device.description
                   << ": error " << static_cast<int>(source_->error());
        close();
        return false;
    }

    return true;
}

void QtAudioBackend::close()
{
    if (!source_) {
        return;
    }

    LOG_DEBUG_N << "Stopping audio capture";
    source_->disconnect(this);
    source_->stop();
    source_.reset();
}

AudioDevice QtAudioBackend::toDevice(const QAudioDevice &device, bool isDefault)
{
    return {
        .id = device.id().toStdString(),
        .description = device.description().toStdString(),
        .is_default = isDefault
    };
}

QAudioFormat QtAudioBackend::createWhisperFormat(const QAudioDevice &device)
{
    QAudioFormat format;
    format.setSampleRate(AudioSink::output_rate);
    format.setChannelCount(1);
    format.setSampleFormat(QAudioFormat::Float);

    if (!device.isFormatSupported(format)) {
        format.setSampleFormat(QAudioFormat::Int16);
    }

    if (!device.isFormatSupported(format)) {
        LOG_DEBUG_N << "16 kHz mono is not supported by " << device.description().toStdString()
                    << ". Using the preferred format and converting.";
        format = device.preferredFormat();
    }
    return format;
}

void QtAudioBackend::onStateChanged(QAudio::State state)
{
    if (!source_) {
        return;
    }

    LOG_TRACE_N << "Audio source state changed to " << static_cast<int>(state);

    if (state == QAudio::StoppedState && source_->error() != QAudio::NoError) {
        const auto err = source_->error();
        LOG_WARN_N << "Audio input stream failed with error " << static_cast<int>(err);
        emit streamError(err == QAudio::FatalError
                             ? QStringLiteral("the audio input device stopped delivering data")
                             : QStringLiteral("audio input I/O error"));
    }
}

void QtAudioBackend::printDevices() const
{
    const auto def = QMediaDevices::defaultAudioInput();
    auto ix = 0u;
    for (const auto &dev : media_devices_.audioInputs()) {
        const bool is_default = (dev.id() == def.id());
        LOG_DEBUG_N << "  #" << ix << (is_default ? " * " : " : ") << dev.description().toStdString();
        ++ix;
    }
}
