#pragma once

#include <string>
#include <vector>

#include <QObject>
#include <QMetaObject>

#include <qcorotask.h>

#include "Collaborators.h"

class AudioCaptureEngine;
class QSettingsStore;
class RecordingOrchestrator;
class SpeechModelManager;

/*! Writes the dictated text to stdout. */
class StdoutTextSink : public TextSink
{
public:
    QCoro::Task<bool> insert(std::string text) override;
};

/*! Line oriented command interface on stdin.
 *
 *  Commands run one at a time, in the order they were typed. State changes
 *  and the live input level are reported on stderr.
 */
class ConsoleFrontend : public QObject
{
    Q_OBJECT
public:
    ConsoleFrontend(RecordingOrchestrator& orchestrator,
                    SpeechModelManager& models,
                    AudioCaptureEngine& capture,
                    QSettingsStore& settings,
                    QObject *parent = nullptr);

    /*! Loads the configured model if it is on disk. */
    QCoro::Task<void> prepare();

    /*! Reads and executes commands until "quit" or end of input. Returns the exit code. */
    QCoro::Task<int> run();

private:
    QCoro::Task<void> execute(std::string line);
    QCoro::Task<void> listModels();
    QCoro::Task<void> download(std::string id);
    QCoro::Task<void> load(std::string id);
    QCoro::Task<void> remove(std::string id);
    QCoro::Task<void> status();
    void listDevices();
    void selectDevice(const std::string& id);
    void selectLanguage(const std::string& mode);
    void printHelp() const;
    void onLevelStreamChanged();

    RecordingOrchestrator& orchestrator_;
    SpeechModelManager& models_;
    AudioCaptureEngine& capture_;
    QSettingsStore& settings_;
    QMetaObject::Connection level_connection_;
    bool quit_{false};
};
