#include <memory>
#include <iostream>
#include <optional>

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QSettings>

#include <qcorotask.h>

// Must come before the engine header for qdc::logfwd::toLogfault()
#include "logging.h"
#include "qdc/WhisperEngine.h"

#include "AudioCaptureEngine.h"
#include "ConsoleFrontend.h"
#include "Errors.h"
#include "HttpModelFetcher.h"
#include "QSettingsStore.h"
#include "QtAudioBackend.h"
#include "RecordingOrchestrator.h"
#include "SpeechModelManager.h"

using namespace std;

namespace {
optional<logfault::LogLevel> toLogLevel(string_view name) {
    if (name.empty() || name == "off" || name == "false") {
        return {};
    }

    if (name == "error") {
        return logfault::LogLevel::ERROR;
    }

    if (name == "warn") {
        return logfault::LogLevel::WARN;
    }

    if (name == "debug") {
        return logfault::LogLevel::DEBUGGING;
    }

    if (name == "trace") {
        return logfault::LogLevel::TRACE;
    }

    return logfault::LogLevel::INFO;
}

void initLogging(const QString& consoleLevel)
{
    QSettings settings{};

    if (!settings.contains("logging/applevel")) {
        settings.setValue("logging/applevel", 4); // INFO
    }

    auto app_level = static_cast<logfault::LogLevel>(settings.value("logging/applevel", 4).toInt());
    bool console = app_level != logfault::LogLevel::DISABLED;
    if (!consoleLevel.isEmpty()) {
        const auto level = toLogLevel(consoleLevel.toStdString());
        console = level.has_value();
        if (level) {
            app_level = *level;
        }
    }

    if (console) {
        logfault::LogManager::Instance().AddHandler(
            make_unique<logfault::StreamHandler>(clog, app_level));
        LOG_DEBUG << "Logging to console";
    }

    auto level = settings.value("logging/level", 0).toInt();
    if (level > 0) {
        if (auto path = settings.value("logging/path", "").toString().toStdString(); !path.empty()) {
            const bool prune = settings.value("logging/prune", "").toString() == "true";
            logfault::LogManager::Instance().AddHandler(
                make_unique<logfault::StreamHandler>(path, static_cast<logfault::LogLevel>(level), prune));

            LOG_INFO << "Logging to: " << path;
        }
    }
}

shared_ptr<qdc::WhisperEngine> createWhisperEngine()
{
    auto engine = qdc::WhisperEngine::create({});
    if (!engine) {
        LOG_ERROR_N << "Failed to create Whisper engine instance.";
        throw std::runtime_error{"Failed to create Whisper engine instance."};
    }

    engine->setLogger(qdc::logfwd::toLogfault,
                      qdc::logfwd::fromLogfault(::logfault::LogManager::Instance().GetLoglevel()));

    if (!engine->init()) {
        LOG_ERROR_N << "Failed to initialize the Whisper engine: " << engine->lastError();
        throw std::runtime_error{"Failed to initialize the Whisper engine."};
    }

    return engine;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    QCoreApplication::setOrganizationName("QDictate");
    QCoreApplication::setApplicationName("QDictate");
    QCoreApplication::setApplicationVersion(APP_VERSION);

    QCommandLineParser parser;
    parser.setApplicationDescription("Local voice dictation with whisper.cpp");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addOptions({
        {"log-level", "Console log level: off, error, warn, info, debug or trace.", "level"},
        {"models-path", "Directory for downloaded models.", "path"},
        {"model", "Model to use, for example 'base'.", "id"},
        {"language", "Language mode: auto, <code>, specific:<code> or pinned:<code>.", "mode"},
    });
    parser.process(app);

    initLogging(parser.value("log-level"));

    QSettings settings;
    LOG_INFO << "Starting QDictate " << APP_VERSION;
    LOG_INFO << "Configuration from '" << settings.fileName().toStdString() << "'";

    QSettingsStore store;
    if (parser.isSet("model")) {
        store.setActiveModelId(parser.value("model").toStdString());
    }

    if (parser.isSet("language")) {
        const auto requested = TranscriptionLanguage::parse(parser.value("language").toStdString());
        if (!requested) {
            cerr << "Invalid language mode: " << parser.value("language").toStdString() << endl;
            return 1;
        }
        store.setLanguageMode(*requested);
    }

    SpeechModelManager::Config config;
    if (parser.isSet("models-path")) {
        config.models_dir = parser.value("models-path").toStdString();
    } else {
        config.models_dir = store.modelsPath().value_or(SpeechModelManager::defaultModelsDir());
    }

    try {
        auto fetcher = make_shared<HttpModelFetcher>();
        SpeechModelManager models{std::move(config), createWhisperEngine(), fetcher};

        QtAudioBackend backend;
        AudioCaptureEngine capture{backend};

        StaticPermissionGate permissions;
        StdoutTextSink sink;
        RecordingOrchestrator orchestrator{capture, models, permissions, store, sink};

        ConsoleFrontend frontend{orchestrator, models, capture, store};
        QCoro::waitFor(frontend.prepare());
        return QCoro::waitFor(frontend.run());
    } catch (const std::exception& ex) {
        LOG_ERROR << "Fatal: " << ex.what();
        cerr << ex.what() << endl;
    }

    return 1;
}
