#pragma once

#include <string>

#include <qcorotask.h>

#include "Transcription.h"

/*! Answers whether the capabilities a session needs have been granted.
 *
 *  Read synchronously when a session starts. Prompting is up to the implementation.
 */
class PermissionGate
{
public:
    virtual ~PermissionGate() = default;

    virtual bool microphoneGranted() const = 0;
    virtual bool insertionGranted() const = 0;
};

/*! Settings read at the start of each session. */
class SettingsSource
{
public:
    virtual ~SettingsSource() = default;

    // Empty when no model is configured
    virtual std::string activeModelId() const = 0;
    virtual TranscriptionLanguage languageMode() const = 0;
    // Empty for the system default device
    virtual std::string preferredDeviceId() const = 0;
};

/*! Receives the transcribed text.
 *
 *  Returns false, or throws, if the text could not be delivered.
 */
class TextSink
{
public:
    virtual ~TextSink() = default;

    virtual QCoro::Task<bool> insert(std::string text) = 0;
};

/*! PermissionGate with fixed answers, for platforms without a permission model. */
class StaticPermissionGate : public PermissionGate
{
public:
    explicit StaticPermissionGate(bool microphone = true, bool insertion = true)
        : microphone_{microphone}, insertion_{insertion} {}

    bool microphoneGranted() const override {
        return microphone_;
    }

    bool insertionGranted() const override {
        return insertion_;
    }

private:
    bool microphone_;
    bool insertion_;
};
