#pragma once

#include <iosfwd>
#include <stdexcept>
#include <string>
#include <string_view>

/*! Error raised by the dictation pipeline.
 *
 *  what() returns a message that can be shown to the user as is.
 *  The detail is the text that was passed in, without the kind's prefix.
 */
class DictationError : public std::runtime_error
{
public:
    enum class Kind {
        MicrophonePermissionDenied,
        InsertionPermissionDenied,
        NoDeviceAvailable,
        DeviceUnavailable,
        AudioDeviceDisconnected,
        AudioRecordingFailed,
        ModelLoadFailed,
        ModelNotDownloaded,
        ModelDownloadFailed,
        AlreadyDownloading,
        ModelValidationFailed,
        ModelDeletionFailed,
        NoModelsAvailable,
        TranscriptionFailed,
        EmptyTranscription,
        TextInsertionFailed
    };

    explicit DictationError(Kind kind, std::string detail = {});

    Kind kind() const noexcept {
        return kind_;
    }

    const std::string& detail() const noexcept {
        return detail_;
    }

    static std::string describe(Kind kind, std::string_view detail = {});

private:
    Kind kind_;
    std::string detail_;
};

std::ostream& operator<<(std::ostream& os, DictationError::Kind kind);
