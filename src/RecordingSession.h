#pragma once

#include <chrono>
#include <string>

#include <QUuid>

#include "Transcription.h"

/*! One pass from begin-recording to idle or error.
 *
 *  Holds the settings snapshot taken when the session started, and the audio
 *  once capture has ended. Lives in memory only.
 */
struct RecordingSession {
    QUuid id{QUuid::createUuid()};
    std::chrono::system_clock::time_point started{std::chrono::system_clock::now()};
    std::string device_id;
    std::string model_id;
    TranscriptionLanguage language;
    AudioBuffer audio;

    std::string shortId() const;
};
