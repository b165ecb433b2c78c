#include <cstdio>
#include <format>
#include <iostream>

#include <QFile>
#include <QSocketNotifier>

#include <qcoroasyncgenerator.h>
#include <qcorosignal.h>

#include "ConsoleFrontend.h"
#include "AudioCaptureEngine.h"
#include "Errors.h"
#include "QSettingsStore.h"
#include "RecordingOrchestrator.h"
#include "SpeechModelManager.h"
#include "logging.h"

using namespace std;

namespace {

pair<string, string> splitCommand(string_view line) {
    const auto pos = line.find(' ');
    if (pos == string_view::npos) {
        return {string{line}, {}};
    }

    auto arg = line.substr(pos + 1);
    while (!arg.empty() && arg.front() == ' ') {
        arg.remove_prefix(1);
    }
    return {string{line.substr(0, pos)}, string{arg}};
}

string meter(float level) {
    constexpr int width = 40;
    const auto filled = static_cast<int>(level * width + 0.5f);
    return format("[{:<{}}]", string(static_cast<size_t>(filled), '#'), width);
}

} // anon ns

QCoro::Task<bool> StdoutTextSink::insert(std::string text)
{
    cout << text << endl;
    co_return cout.good();
}

ConsoleFrontend::ConsoleFrontend(RecordingOrchestrator &orchestrator,
                                 SpeechModelManager &models,
                                 AudioCaptureEngine &capture,
                                 QSettingsStore &settings,
                                 QObject *parent)
    : QObject(parent)
    , orchestrator_{orchestrator}
    , models_{models}
    , capture_{capture}
    , settings_{settings}
{
    connect(&orchestrator_, &RecordingOrchestrator::stateChanged, this, [](const SessionState& state) {
        cerr << "\n[" << state << "]" << endl;
    });

    connect(&orchestrator_, &RecordingOrchestrator::insertionFailed, this, [](const QString& message) {
        cerr << message.toStdString() << endl;
    });

    connect(&orchestrator_, &RecordingOrchestrator::levelStreamChanged,
            this, &ConsoleFrontend::onLevelStreamChanged);

    connect(&capture_, &AudioCaptureEngine::deviceFallback, this, [](const QString& description) {
        cerr << "\nInput device lost. Now recording from " << description.toStdString() << endl;
    });
}

QCoro::Task<void> ConsoleFrontend::prepare()
{
    const auto id = settings_.activeModelId();
    if (id.empty()) {
        co_return;
    }

    const auto status = co_await models_.modelStatus(id);
    if (!status.isOnDisk()) {
        cerr << "Model '" << id << "' is not downloaded. Use 'download " << id << "'." << endl;
        co_return;
    }

    try {
        co_await models_.loadModel(id);
    } catch (const DictationError& ex) {
        cerr << ex.what() << endl;
    }
}

QCoro::Task<int> ConsoleFrontend::run()
{
    QFile input;
    if (!input.open(fileno(stdin), QIODevice::ReadOnly)) {
        LOG_ERROR_N << "Cannot read from stdin: " << input.errorString().toStdString();
        co_return 1;
    }

    QSocketNotifier notifier{fileno(stdin), QSocketNotifier::Read};
    printHelp();

    while (!quit_) {
        if (!input.canReadLine()) {
            co_await qCoro(&notifier, &QSocketNotifier::activated);
        }

        const auto line = input.readLine();
        if (line.isEmpty()) {
            LOG_DEBUG_N << "End of input";
            break;
        }

        co_await execute(QString::fromUtf8(line).trimmed().toStdString());
    }

    co_return 0;
}

QCoro::Task<void> ConsoleFrontend::execute(std::string line)
{
    const auto [cmd, arg] = splitCommand(line);
    LOG_TRACE_N << "Command: " << cmd << " '" << arg << "'";

    if (cmd.empty()) {
        co_return;
    }

    try {
        if (cmd == "begin") {
            co_await orchestrator_.beginRecording();
        } else if (cmd == "end") {
            co_await orchestrator_.endRecording();
        } else if (cmd == "toggle") {
            co_await orchestrator_.toggleRecording();
        } else if (cmd == "models") {
            co_await listModels();
        } else if (cmd == "download") {
            co_await download(arg);
        } else if (cmd == "load") {
            co_await load(arg);
        } else if (cmd == "delete") {
            co_await remove(arg);
        } else if (cmd == "devices") {
            listDevices();
        } else if (cmd == "device") {
            selectDevice(arg);
        } else if (cmd == "language") {
            selectLanguage(arg);
        } else if (cmd == "status") {
            co_await status();
        } else if (cmd == "quit" || cmd == "exit") {
            quit_ = true;
        } else {
            printHelp();
        }
    } catch (const DictationError& ex) {
        LOG_DEBUG_N << "Command '" << cmd << "' failed: " << ex.kind();
        cerr << ex.what() << endl;
    }
}

QCoro::Task<void> ConsoleFrontend::listModels()
{
    const auto models = co_await models_.availableModels();
    for (const auto& [info, state] : models) {
        cerr << format("{:<8} {:<28} {:>6} MB  ", info.id, info.quality, info.size_mb) << state << endl;
    }
}

QCoro::Task<void> ConsoleFrontend::download(std::string id)
{
    auto progress = models_.downloadModel(id);
    auto it = co_await progress.begin();
    while (it != progress.end()) {
        const auto& p = *it;
        cerr << format("\r{} {:>5.1f}% ", id, p.fraction * 100.0) << p.phase << "   " << flush;
        co_await ++it;
    }
    cerr << endl << "Model " << id << " is ready." << endl;
}

QCoro::Task<void> ConsoleFrontend::load(std::string id)
{
    co_await models_.loadModel(id);
    settings_.setActiveModelId(id);
    cerr << "Using model " << id << endl;
}

QCoro::Task<void> ConsoleFrontend::remove(std::string id)
{
    co_await models_.deleteModel(id);
    if (const auto active = co_await models_.activeModelId()) {
        settings_.setActiveModelId(*active);
    }
    cerr << "Deleted model " << id << endl;
}

QCoro::Task<void> ConsoleFrontend::status()
{
    const auto active = co_await models_.activeModelId();
    cerr << "State:    " << orchestrator_.state() << endl
         << "Model:    " << active.value_or("none") << endl
         << "Language: " << settings_.languageMode() << endl
         << "Device:   " << (capture_.selectedDeviceId().empty() ? "system default" : capture_.selectedDeviceId())
         << endl;
}

void ConsoleFrontend::listDevices()
{
    for (const auto& dev : capture_.listInputDevices()) {
        cerr << (dev.is_default ? "* " : "  ") << dev.id << "  " << dev.description << endl;
    }
}

void ConsoleFrontend::selectDevice(const std::string &id)
{
    const auto target = id == "default" ? string{} : id;
    capture_.setDevice(target);
    settings_.setPreferredDeviceId(target);
}

void ConsoleFrontend::selectLanguage(const std::string &mode)
{
    const auto requested = TranscriptionLanguage::parse(mode);
    if (!requested) {
        cerr << "Unknown language mode '" << mode << "'. Use auto, <code>, specific:<code> or pinned:<code>." << endl;
        return;
    }

    cerr << "Language: " << settings_.setLanguageMode(*requested) << endl;
}

void ConsoleFrontend::printHelp() const
{
    cerr << "Commands:\n"
         << "  begin | end | toggle     start or finish dictation\n"
         << "  models                   list the models\n"
         << "  download <id>            download a model\n"
         << "  load <id>                use a downloaded model\n"
         << "  delete <id>              delete a downloaded model\n"
         << "  devices                  list audio input devices\n"
         << "  device <id>|default      select the input device\n"
         << "  language <mode>          auto, <code>, specific:<code> or pinned:<code>\n"
         << "  status                   show the current state\n"
         << "  quit" << endl;
}

void ConsoleFrontend::onLevelStreamChanged()
{
    disconnect(level_connection_);

    if (auto stream = orchestrator_.levelStream()) {
        level_connection_ = connect(stream.get(), &LevelStream::levelAvailable, this, [](float level) {
            cerr << '\r' << meter(level) << flush;
        }, Qt::QueuedConnection);
    }
}
