#include <exception>
#include <cassert>
#include <format>

#include "RecordingOrchestrator.h"
#include "Errors.h"
#include "ScopedTimer.h"
#include "logging.h"

using namespace std;

namespace {

string describe(const std::exception& ex) {
    if (dynamic_cast<const DictationError *>(&ex)) {
        return ex.what();
    }
    return format("Unexpected error: {}", ex.what());
}

} // anon ns

RecordingOrchestrator::RecordingOrchestrator(AudioCaptureEngine &capture,
                                             SpeechModelManager &models,
                                             const PermissionGate &permissions,
                                             const SettingsSource &settings,
                                             TextSink &sink,
                                             QObject *parent,
                                             std::chrono::milliseconds errorWindow)
    : QObject(parent)
    , capture_{capture}
    , models_{models}
    , permissions_{permissions}
    , settings_{settings}
    , sink_{sink}
{
    error_watchdog_.setSingleShot(true);
    error_watchdog_.setInterval(errorWindow);
    connect(&error_watchdog_, &QTimer::timeout, this, [this] {
        if (state_.is(SessionState::Kind::Error)) {
            LOG_DEBUG_N << "Error window expired";
            resetToIdle();
        }
    });

    connect(&capture_, &AudioCaptureEngine::captureFailed, this, &RecordingOrchestrator::onCaptureFailed);
    connect(&capture_, &AudioCaptureEngine::deviceFallback, this, [](const QString& description) {
        LOG_WARN << "Audio input device lost. Continuing on " << description.toStdString();
    });
}

RecordingOrchestrator::~RecordingOrchestrator()
{
    error_watchdog_.stop();
    if (session_) {
        capture_.cancelCapture();
    }
}

QCoro::Task<void> RecordingOrchestrator::beginRecording()
{
    if (!state_.is(SessionState::Kind::Idle) || starting_) {
        LOG_DEBUG_N << "Ignoring begin request in state " << state_;
        co_return;
    }

    if (!permissions_.microphoneGranted()) {
        handleError(DictationError::describe(DictationError::Kind::MicrophonePermissionDenied));
        co_return;
    }

    if (!permissions_.insertionGranted()) {
        handleError(DictationError::describe(DictationError::Kind::InsertionPermissionDenied));
        co_return;
    }

    auto session = make_unique<RecordingSession>();
    session->device_id = settings_.preferredDeviceId();
    session->model_id = settings_.activeModelId();
    session->language = settings_.languageMode();

    try {
        capture_.setDevice(session->device_id);
    } catch (const DictationError& ex) {
        LOG_WARN_N << ex.what() << ". Using the system default device.";
        session->device_id.clear();
        capture_.setDevice({});
    }

    const auto id = session->id;
    session_ = std::move(session);
    LOG_INFO_EX(*session_) << "Starting recording";

    // Recording must be visible before we wait for the device
    setState(SessionState::recording());
    starting_ = true;
    end_requested_ = false;

    shared_ptr<LevelStream> stream;
    string error;
    try {
        stream = co_await capture_.startCapture();
    } catch (const std::exception& ex) {
        error = describe(ex);
    }
    starting_ = false;

    if (!isCurrent(id)) {
        LOG_DEBUG_N << "Session was abandoned while the capture started";
        if (stream) {
            capture_.cancelCapture();
        }
        co_return;
    }

    if (!error.empty()) {
        handleError(error);
        co_return;
    }

    level_stream_ = std::move(stream);
    emit levelStreamChanged();

    if (end_requested_) {
        LOG_DEBUG_N << "Honouring end request made while the capture started";
        end_requested_ = false;
        co_await endRecording();
    }
}

QCoro::Task<void> RecordingOrchestrator::endRecording()
{
    if (!state_.is(SessionState::Kind::Recording) || !session_) {
        LOG_DEBUG_N << "Ignoring end request in state " << state_;
        co_return;
    }

    if (starting_) {
        end_requested_ = true;
        co_return;
    }

    const auto id = session_->id;
    setState(SessionState::processing());

    AudioBuffer audio;
    string error;
    try {
        audio = co_await capture_.stopCapture();
    } catch (const std::exception& ex) {
        error = describe(ex);
    }

    if (!isCurrent(id)) {
        co_return;
    }

    if (!error.empty()) {
        handleError(error);
        co_return;
    }

    if (level_stream_) {
        level_stream_.reset();
        emit levelStreamChanged();
    }

    LOG_INFO_EX(*session_) << "Captured " << audio.samples.size() << " samples ("
                           << format("{:.2f}", audio.durationSeconds()) << " seconds)";
    session_->audio = std::move(audio);

    optional<TranscriptionResult> result;
    bool no_speech = false;
    try {
        // The buffer is handed over to the model manager
        result = co_await transcribeWithRecovery(std::move(session_->audio), session_->language, session_->model_id);
    } catch (const DictationError& ex) {
        if (ex.kind() == DictationError::Kind::EmptyTranscription) {
            no_speech = true;
        } else {
            error = ex.what();
        }
    } catch (const std::exception& ex) {
        error = describe(ex);
    }

    if (!isCurrent(id)) {
        co_return;
    }

    if (no_speech) {
        LOG_INFO_EX(*session_) << "No speech detected";
        resetToIdle();
        co_return;
    }

    if (!error.empty()) {
        handleError(error);
        co_return;
    }

    assert(result);
    LOG_DEBUG_EX(*session_) << "Transcribed " << result->text.size() << " bytes in "
                            << result->duration.count() << " ms";

    bool inserted = false;
    try {
        inserted = co_await sink_.insert(result->text);
        if (!inserted) {
            error = DictationError::describe(DictationError::Kind::TextInsertionFailed,
                                             "the text was not accepted");
        }
    } catch (const DictationError& ex) {
        error = ex.what();
    } catch (const std::exception& ex) {
        error = DictationError::describe(DictationError::Kind::TextInsertionFailed, ex.what());
    }

    if (!isCurrent(id)) {
        co_return;
    }

    if (inserted) {
        emit textInserted(QString::fromStdString(result->text));
    } else {
        // Not fatal. The session still completes.
        LOG_WARN_EX(*session_) << error;
        emit insertionFailed(QString::fromStdString(error));
    }

    resetToIdle();
}

QCoro::Task<void> RecordingOrchestrator::toggleRecording()
{
    if (state_.is(SessionState::Kind::Idle)) {
        co_await beginRecording();
    } else if (state_.is(SessionState::Kind::Recording)) {
        co_await endRecording();
    } else {
        LOG_DEBUG_N << "Ignoring toggle in state " << state_;
    }
}

void RecordingOrchestrator::handleError(const std::string &message)
{
    LOG_ERROR_N << "Session failed: " << message;

    capture_.cancelCapture();
    dropSession();
    setState(SessionState::error(message));

    // A new error restarts the window
    error_watchdog_.start();
}

void RecordingOrchestrator::resetToIdle()
{
    error_watchdog_.stop();
    capture_.cancelCapture();
    dropSession();
    setState(SessionState::idle());
}

void RecordingOrchestrator::setState(SessionState state)
{
    if (state_ != state) {
        LOG_DEBUG_N << "Session state changed from " << state_ << " to " << state;
        state_ = std::move(state);
        emit stateChanged(state_);
    }
}

void RecordingOrchestrator::dropSession()
{
    if (state_.is(SessionState::Kind::Processing)) {
        models_.cancelTranscription();
    }

    session_.reset();
    end_requested_ = false;
    if (level_stream_) {
        level_stream_->close();
        level_stream_.reset();
        emit levelStreamChanged();
    }
}

bool RecordingOrchestrator::isCurrent(const QUuid &id) const
{
    return session_ && session_->id == id;
}

QCoro::Task<TranscriptionResult> RecordingOrchestrator::transcribeWithRecovery(AudioBuffer audio,
                                                                               TranscriptionLanguage language,
                                                                               std::string modelId)
{
    enum class Recovery {
        LoadConfigured,
        ReloadActive
    };

    Recovery recovery{};
    exception_ptr first_error;

    try {
        // Copy. The original is kept for a retry.
        co_return co_await models_.transcribe(audio, language);
    } catch (const DictationError& ex) {
        using enum DictationError::Kind;
        if (ex.kind() == ModelNotDownloaded && !modelId.empty()) {
            recovery = Recovery::LoadConfigured;
        } else if (ex.kind() == TranscriptionFailed && ex.detail() != "cancelled") {
            recovery = Recovery::ReloadActive;
        } else {
            throw;
        }
        first_error = current_exception();
    }

    switch(recovery) {
    case Recovery::LoadConfigured: {
        const auto status = co_await models_.modelStatus(modelId);
        if (!status.isOnDisk()) {
            LOG_WARN_N << "Configured model " << modelId << " is " << status;
            rethrow_exception(first_error);
        }
        LOG_INFO_N << "No active model. Loading the configured model " << modelId;
        co_await models_.loadModel(modelId);
    } break;
    case Recovery::ReloadActive:
        LOG_WARN_N << "Transcription failed. Reloading the active model before retrying.";
        co_await models_.reloadActiveModelWithRetry(1);
        break;
    }

    co_return co_await models_.transcribe(std::move(audio), std::move(language));
}

void RecordingOrchestrator::onCaptureFailed(const QString &message)
{
    if (state_.is(SessionState::Kind::Recording)) {
        handleError(message.toStdString());
    } else {
        LOG_DEBUG_N << "Capture failure in state " << state_ << ": " << message.toStdString();
    }
}
