#include <array>
#include <format>
#include <ostream>

#include "Errors.h"

using namespace std;

namespace {

constexpr auto kind_names = to_array<string_view>({
    "MicrophonePermissionDenied",
    "InsertionPermissionDenied",
    "NoDeviceAvailable",
    "DeviceUnavailable",
    "AudioDeviceDisconnected",
    "AudioRecordingFailed",
    "ModelLoadFailed",
    "ModelNotDownloaded",
    "ModelDownloadFailed",
    "AlreadyDownloading",
    "ModelValidationFailed",
    "ModelDeletionFailed",
    "NoModelsAvailable",
    "TranscriptionFailed",
    "EmptyTranscription",
    "TextInsertionFailed"
});

} // anon ns

DictationError::DictationError(Kind kind, std::string detail)
    : std::runtime_error{describe(kind, detail)}
    , kind_{kind}
    , detail_{std::move(detail)}
{
}

string DictationError::describe(Kind kind, std::string_view detail)
{
    using enum Kind;

    switch(kind) {
    case MicrophonePermissionDenied:
        return "Microphone permission is required for voice dictation.";
    case InsertionPermissionDenied:
        return "Permission to insert text into other applications is required.";
    case NoDeviceAvailable:
        return "No audio input device is available.";
    case DeviceUnavailable:
        return format("The selected audio input device is not available: {}", detail);
    case AudioDeviceDisconnected:
        return "The audio input device was disconnected.";
    case AudioRecordingFailed:
        return format("Audio recording failed: {}", detail);
    case ModelLoadFailed:
        return format("Failed to load model: {}", detail);
    case ModelNotDownloaded:
        return "No transcription model is loaded.";
    case ModelDownloadFailed:
        return format("Model download failed: {}", detail);
    case AlreadyDownloading:
        return format("The model is already being downloaded: {}", detail);
    case ModelValidationFailed:
        return format("Model validation failed: {}", detail);
    case ModelDeletionFailed:
        return format("Model deletion failed: {}", detail);
    case NoModelsAvailable:
        return "No transcription models are available.";
    case TranscriptionFailed:
        return format("Transcription failed: {}", detail);
    case EmptyTranscription:
        return "No speech was detected in the recording.";
    case TextInsertionFailed:
        return format("Text insertion failed: {}", detail);
    }

    return string{detail};
}

std::ostream& operator<<(std::ostream& os, DictationError::Kind kind)
{
    return os << kind_names.at(static_cast<size_t>(kind));
}
