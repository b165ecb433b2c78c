#pragma once

#include <optional>
#include <string>
#include <vector>

#include <QObject>

class AudioSink;

struct AudioDevice {
    std::string id;
    std::string description;
    bool is_default{false};

    bool operator==(const AudioDevice&) const = default;
};

/*! The audio hardware as seen by the capture engine.
 *
 *  Lives on a thread with an event loop. At most one input stream is open at
 *  a time; open() replaces the sink's input format with the format the device
 *  actually delivers.
 */
class AudioBackend : public QObject
{
    Q_OBJECT
public:
    using QObject::QObject;

    virtual std::vector<AudioDevice> inputDevices() const = 0;

    virtual std::optional<AudioDevice> defaultInputDevice() const = 0;

    /*! Opens the device and starts pushing PCM into the sink.
     *
     * @return false if the device could not be opened.
     */
    virtual bool open(const AudioDevice& device, AudioSink& sink) = 0;

    /*! Stops the stream. Safe to call when nothing is open. */
    virtual void close() = 0;

    virtual bool isOpen() const noexcept = 0;

signals:
    void inputDevicesChanged();

    // The open stream failed, for example because the device went away
    void streamError(const QString& reason);
};
