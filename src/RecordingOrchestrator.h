#pragma once

#include <chrono>
#include <memory>
#include <optional>

#include <QObject>
#include <QTimer>

#include <qcorotask.h>

#include "AudioCaptureEngine.h"
#include "Collaborators.h"
#include "LevelStream.h"
#include "RecordingSession.h"
#include "SessionState.h"
#include "SpeechModelManager.h"

/*! Drives one dictation session at a time.
 *
 *  Idle -> Recording -> Processing -> Idle, with Error reachable from any
 *  step. Error returns to Idle on its own after the error window.
 *
 *  Lives on the main thread. The state is only changed from that thread and
 *  published with stateChanged().
 */
class RecordingOrchestrator : public QObject
{
    Q_OBJECT

public:
    static constexpr std::chrono::milliseconds default_error_window{5000};

    RecordingOrchestrator(AudioCaptureEngine& capture,
                          SpeechModelManager& models,
                          const PermissionGate& permissions,
                          const SettingsSource& settings,
                          TextSink& sink,
                          QObject *parent = nullptr,
                          std::chrono::milliseconds errorWindow = default_error_window);
    ~RecordingOrchestrator() override;

    const SessionState& state() const noexcept {
        return state_;
    }

    // Level stream of the running capture, if any
    std::shared_ptr<LevelStream> levelStream() const {
        return level_stream_;
    }

    const RecordingSession *session() const noexcept {
        return session_.get();
    }

    /*! Starts a session. Does nothing unless the state is Idle.
     *
     *  Completes when the capture runs, or when the session ended in Error.
     */
    QCoro::Task<void> beginRecording();

    /*! Ends the capture, transcribes it and hands the text to the sink.
     *
     *  Does nothing unless the state is Recording. If the capture is still
     *  starting, the request is carried out as soon as the start completed.
     */
    QCoro::Task<void> endRecording();

    /*! Begin if Idle, end if Recording. */
    QCoro::Task<void> toggleRecording();

    /*! Cancels capture, enters Error(message) and arms the error window. */
    void handleError(const std::string& message);

    /*! Drops the session and returns to Idle at once. */
    void resetToIdle();

signals:
    void stateChanged(const SessionState& state);
    void levelStreamChanged();
    void textInserted(const QString& text);
    void insertionFailed(const QString& message);

private:
    void setState(SessionState state);
    void dropSession();
    bool isCurrent(const QUuid& id) const;
    QCoro::Task<TranscriptionResult> transcribeWithRecovery(AudioBuffer audio,
                                                            TranscriptionLanguage language,
                                                            std::string modelId);
    void onCaptureFailed(const QString& message);

    AudioCaptureEngine& capture_;
    SpeechModelManager& models_;
    const PermissionGate& permissions_;
    const SettingsSource& settings_;
    TextSink& sink_;

    SessionState state_;
    std::unique_ptr<RecordingSession> session_;
    std::shared_ptr<LevelStream> level_stream_;
    bool starting_{false};
    bool end_requested_{false};
    QTimer error_watchdog_;
};
