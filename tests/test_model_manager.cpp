#include <algorithm>
#include <filesystem>
#include <fstream>
#include <memory>
#include <vector>

#include <catch2/catch_test_macros.hpp>

#include <QCryptographicHash>
#include <QSignalSpy>
#include <QTemporaryDir>

#include "SpeechModelManager.h"
#include "fakes.h"

using namespace test;
using Kind = DictationError::Kind;
using State = ModelStatus::State;

namespace {

struct Fixture {
    Fixture()
        : models_dir{tmp.path().toStdString()}
        , manager{SpeechModelManager::Config{models_dir, std::chrono::milliseconds{1}, testCatalog()},
                  engine, fetcher}
    {
    }

    State state(std::string id) {
        return QCoro::waitFor(manager.modelStatus(std::move(id))).state;
    }

    std::optional<std::string> active() {
        return QCoro::waitFor(manager.activeModelId());
    }

    void install(std::string_view id) {
        const auto *info = manager.findModel(id);
        REQUIRE(info);
        installModelFile(models_dir, id, info->filename);
    }

    void load(std::string id) {
        QCoro::waitFor(manager.loadModel(std::move(id)));
    }

    // Runs the download to the end. Throws what the download throws.
    std::vector<DownloadProgress> download(std::string id) {
        return QCoro::waitFor([this, id]() -> QCoro::Task<std::vector<DownloadProgress>> {
            std::vector<DownloadProgress> seen;
            auto progress = manager.downloadModel(id);
            auto it = co_await progress.begin();
            while (it != progress.end()) {
                seen.push_back(*it);
                co_await ++it;
            }
            co_return seen;
        }());
    }

    size_t countActive() {
        const auto models = QCoro::waitFor(manager.availableModels());
        return static_cast<size_t>(std::ranges::count_if(models, [](const auto& entry) {
            return entry.second.state == State::Active;
        }));
    }

    QTemporaryDir tmp;
    std::filesystem::path models_dir;
    std::shared_ptr<FakeWhisperEngine> engine = std::make_shared<FakeWhisperEngine>();
    std::shared_ptr<FakeModelFetcher> fetcher = std::make_shared<FakeModelFetcher>();
    SpeechModelManager manager;
};

// Takes the first count progress reports and leaves the download suspended
QCoro::Task<bool> advance(QCoro::AsyncGenerator<DownloadProgress>& progress, int count) {
    auto it = co_await progress.begin();
    for (int i = 1; i < count && it != progress.end(); ++i) {
        co_await ++it;
    }
    co_return it != progress.end();
}

template <typename Fn>
DictationError captureError(Fn&& fn) {
    try {
        fn();
    } catch (const DictationError& ex) {
        return ex;
    }
    FAIL("No DictationError was thrown");
    return DictationError{Kind::ModelLoadFailed};
}

} // anon ns

TEST_CASE("SpeechModelManager catalog", "[models]") {
    Fixture f;

    SECTION("AllModelsInRankOrder") {
        const auto models = QCoro::waitFor(f.manager.availableModels());
        REQUIRE(models.size() == 5);
        for (size_t i = 0; i < models.size(); ++i) {
            REQUIRE(models[i].first.rank == i);
            REQUIRE(models[i].second.state == State::NotPresent);
        }
    }

    SECTION("FileOnDiskIsPresent") {
        f.install("small");
        REQUIRE(f.state("small") == State::Present);
        REQUIRE(f.state("tiny") == State::NotPresent);
    }

    SECTION("UnknownModelIsNotPresent") {
        REQUIRE(f.state("gigantic") == State::NotPresent);
    }

    SECTION("ModelPathIsKeyedById") {
        const auto *info = f.manager.findModel("base");
        REQUIRE(info);
        REQUIRE(f.manager.modelPath(*info) == f.models_dir / "base" / "ggml-base.bin");
    }
}

TEST_CASE("SpeechModelManager download", "[models]") {
    Fixture f;

    SECTION("ProgressIsMonotoneAndEndsAtOne") {
        QSignalSpy status_changes{&f.manager, &SpeechModelManager::modelStatusChanged};

        const auto seen = f.download("small");
        REQUIRE(seen.size() >= 3);
        for (size_t i = 1; i < seen.size(); ++i) {
            REQUIRE(seen[i].fraction >= seen[i - 1].fraction);
        }
        REQUIRE(seen.back().fraction == 1.0);
        REQUIRE(std::ranges::count_if(seen, [](const auto& p) { return p.fraction == 1.0; }) == 1);

        REQUIRE(f.state("small") == State::Present);
        REQUIRE(std::filesystem::exists(f.models_dir / "small" / "ggml-small.bin"));
        REQUIRE_FALSE(std::filesystem::exists(f.models_dir / "small" / "ggml-small.bin.part"));
        REQUIRE(f.fetcher->last_url.toString() == "https://models.invalid/ggml-small.bin");
        REQUIRE(status_changes.count() >= 2);
    }

    SECTION("OutOfOrderFetchProgressIsClamped") {
        f.fetcher->fractions = {0.6, 0.3, 0.9, 0.2};
        const auto seen = f.download("tiny");
        for (size_t i = 1; i < seen.size(); ++i) {
            REQUIRE(seen[i].fraction >= seen[i - 1].fraction);
        }
        REQUIRE(seen.back().fraction == 1.0);
    }

    SECTION("ValidatesBeforeCompleting") {
        const auto seen = f.download("base");
        const auto validating = std::ranges::find(seen, DownloadProgress::Phase::Validating, &DownloadProgress::phase);
        REQUIRE(validating != seen.end());
        REQUIRE(validating->fraction < 1.0);
    }

    SECTION("ValidationFailureRemovesFile") {
        f.fetcher->mode = FakeModelFetcher::Mode::Garbage;
        const auto err = captureError([&] { f.download("small"); });
        REQUIRE(err.kind() == Kind::ModelValidationFailed);
        REQUIRE(f.state("small") == State::NotPresent);
        REQUIRE_FALSE(std::filesystem::exists(f.models_dir / "small" / "ggml-small.bin"));
    }

    SECTION("TransferFailure") {
        f.fetcher->mode = FakeModelFetcher::Mode::Fail;
        const auto err = captureError([&] { f.download("small"); });
        REQUIRE(err.kind() == Kind::ModelDownloadFailed);
        REQUIRE(f.state("small") == State::NotPresent);

        // The slot is free again
        f.fetcher->mode = FakeModelFetcher::Mode::Valid;
        f.download("small");
        REQUIRE(f.state("small") == State::Present);
    }

    SECTION("SecondDownloadOfSameModelIsRejected") {
        auto first = f.manager.downloadModel("small");
        REQUIRE(QCoro::waitFor(advance(first, 1)));
        REQUIRE(f.state("small") == State::Downloading);

        const auto err = captureError([&] { f.download("small"); });
        REQUIRE(err.kind() == Kind::AlreadyDownloading);

        // Other models can still be downloaded in parallel
        f.download("tiny");
        REQUIRE(f.state("tiny") == State::Present);
    }

    SECTION("DroppingTheGeneratorCancels") {
        {
            auto progress = f.manager.downloadModel("medium");
            REQUIRE(QCoro::waitFor(advance(progress, 2)));
            REQUIRE(std::filesystem::exists(f.models_dir / "medium" / "ggml-medium.bin.part"));
        }
        REQUIRE(waitUntil([&] { return f.state("medium") == State::NotPresent; }));
        REQUIRE_FALSE(std::filesystem::exists(f.models_dir / "medium" / "ggml-medium.bin.part"));
        f.download("medium");
        REQUIRE(f.state("medium") == State::Present);
    }

    SECTION("DroppingTheGeneratorBeforeValidationRemovesFile") {
        f.fetcher->mode = FakeModelFetcher::Mode::Garbage;
        {
            auto progress = f.manager.downloadModel("small");
            // Initial, three transfer reports, the completed transfer and Validating
            REQUIRE(QCoro::waitFor(advance(progress, 6)));
            REQUIRE(std::filesystem::exists(f.models_dir / "small" / "ggml-small.bin"));
        }
        REQUIRE(waitUntil([&] { return f.state("small") == State::NotPresent; }));
        REQUIRE_FALSE(std::filesystem::exists(f.models_dir / "small" / "ggml-small.bin"));
        REQUIRE(captureError([&] { f.load("small"); }).kind() == Kind::ModelLoadFailed);
    }

    SECTION("DroppingTheGeneratorAfterTransferRemovesFile") {
        {
            auto progress = f.manager.downloadModel("small");
            REQUIRE(QCoro::waitFor(advance(progress, 5)));
        }
        REQUIRE(waitUntil([&] { return f.state("small") == State::NotPresent; }));
        REQUIRE_FALSE(std::filesystem::exists(f.models_dir / "small" / "ggml-small.bin"));
    }

    SECTION("AlreadyPresentCompletesAtOnce") {
        f.install("large");
        const auto seen = f.download("large");
        REQUIRE(seen.size() == 1);
        REQUIRE(seen.front().fraction == 1.0);
        REQUIRE(f.fetcher->calls == 0);
    }

    SECTION("UnknownModel") {
        REQUIRE(captureError([&] { f.download("gigantic"); }).kind() == Kind::ModelDownloadFailed);
    }
}

TEST_CASE("SpeechModelManager activation", "[models]") {
    Fixture f;

    SECTION("DownloadThenLoad") {
        f.install("base");
        f.load("base");
        REQUIRE(f.state("base") == State::Active);

        f.download("small");
        REQUIRE(f.state("small") == State::Present);

        f.load("small");
        REQUIRE(f.state("small") == State::Active);
        REQUIRE(f.state("base") == State::Present);
        REQUIRE(f.active() == "small");
        REQUIRE(f.countActive() == 1);
    }

    SECTION("LoadMissingModelFails") {
        const auto err = captureError([&] { f.load("small"); });
        REQUIRE(err.kind() == Kind::ModelLoadFailed);
        REQUIRE(f.engine->load_calls == 0);
        REQUIRE_FALSE(f.active());
    }

    SECTION("EngineFailureKeepsPreviousModel") {
        f.install("base");
        f.install("small");
        f.load("base");

        f.engine->fail_loads = true;
        REQUIRE(captureError([&] { f.load("small"); }).kind() == Kind::ModelLoadFailed);
        REQUIRE(f.active() == "base");
        REQUIRE(f.state("small") == State::Present);
    }

    SECTION("ReloadWithoutActiveModelFailsAtOnce") {
        const auto err = captureError([&] {
            QCoro::waitFor(f.manager.reloadActiveModelWithRetry(1));
        });
        REQUIRE(err.kind() == Kind::ModelLoadFailed);
        REQUIRE(err.detail() == "no active model");
        REQUIRE(f.engine->load_calls == 0);
    }

    SECTION("ReloadRetries") {
        f.install("base");
        f.load("base");
        REQUIRE(f.engine->load_calls == 1);

        f.engine->fail_loads = true;
        REQUIRE(captureError([&] {
            QCoro::waitFor(f.manager.reloadActiveModelWithRetry(3));
        }).kind() == Kind::ModelLoadFailed);
        REQUIRE(f.engine->load_calls == 4);

        f.engine->fail_loads = false;
        QCoro::waitFor(f.manager.reloadActiveModelWithRetry(3));
        REQUIRE(f.engine->load_calls == 5);
        REQUIRE(f.active() == "base");
    }

    SECTION("RetryDelayDoublesUpToTheCap") {
        using std::chrono::milliseconds;
        const milliseconds base{100};
        REQUIRE(SpeechModelManager::retryDelay(base, 0) == milliseconds{100});
        REQUIRE(SpeechModelManager::retryDelay(base, 1) == milliseconds{200});
        REQUIRE(SpeechModelManager::retryDelay(base, 3) == milliseconds{800});

        const auto cap = base * (int64_t{1} << SpeechModelManager::max_backoff_shift);
        REQUIRE(SpeechModelManager::retryDelay(base, SpeechModelManager::max_backoff_shift) == cap);
        REQUIRE(SpeechModelManager::retryDelay(base, 31) == cap);
        REQUIRE(SpeechModelManager::retryDelay(base, 1000) == cap);
    }
}

TEST_CASE("SpeechModelManager deletion", "[models]") {
    Fixture f;

    SECTION("ActiveModelFallsBackToNextSmaller") {
        f.install("tiny");
        f.install("base");
        f.install("medium");
        f.load("medium");

        QCoro::waitFor(f.manager.deleteModel("medium"));
        REQUIRE(f.active() == "base");
        REQUIRE(f.state("medium") == State::NotPresent);
        REQUIRE(f.countActive() == 1);
        REQUIRE_FALSE(std::filesystem::exists(f.models_dir / "medium"));
    }

    SECTION("ActiveModelFallsBackToLargerWhenNothingSmaller") {
        f.install("tiny");
        f.install("large");
        f.load("tiny");

        QCoro::waitFor(f.manager.deleteModel("tiny"));
        REQUIRE(f.active() == "large");
        REQUIRE(f.countActive() == 1);
    }

    SECTION("DeletingInactiveModelKeepsActive") {
        f.install("base");
        f.install("small");
        f.load("base");

        QCoro::waitFor(f.manager.deleteModel("small"));
        REQUIRE(f.active() == "base");
        REQUIRE(f.state("small") == State::NotPresent);
    }

    SECTION("DeletingLastModel") {
        f.install("base");
        f.load("base");

        REQUIRE(captureError([&] {
            QCoro::waitFor(f.manager.deleteModel("base"));
        }).kind() == Kind::NoModelsAvailable);
        REQUIRE_FALSE(f.active());
        REQUIRE(f.state("base") == State::NotPresent);
    }

    SECTION("DeletingMissingModelFails") {
        REQUIRE(captureError([&] {
            QCoro::waitFor(f.manager.deleteModel("small"));
        }).kind() == Kind::ModelDeletionFailed);
    }

    SECTION("FailedFallbackKeepsModel") {
        f.install("base");
        f.install("small");
        f.load("small");

        f.engine->fail_loads = true;
        REQUIRE(captureError([&] {
            QCoro::waitFor(f.manager.deleteModel("small"));
        }).kind() == Kind::ModelLoadFailed);
        REQUIRE(f.active() == "small");
        REQUIRE(f.state("small") == State::Active);
    }
}

TEST_CASE("SpeechModelManager transcription", "[models]") {
    Fixture f;
    AudioBuffer audio;
    audio.samples = tone(16000);

    SECTION("EmptyBuffer") {
        f.install("base");
        f.load("base");
        REQUIRE(captureError([&] {
            QCoro::waitFor(f.manager.transcribe({}, TranscriptionLanguage::autoDetect()));
        }).kind() == Kind::EmptyTranscription);
        REQUIRE(f.engine->inference_calls == 0);
    }

    SECTION("NoActiveModel") {
        REQUIRE(captureError([&] {
            QCoro::waitFor(f.manager.transcribe(audio, TranscriptionLanguage::autoDetect()));
        }).kind() == Kind::ModelNotDownloaded);
    }

    SECTION("TranscribesWithActiveModel") {
        f.install("base");
        f.load("base");

        const auto result = QCoro::waitFor(f.manager.transcribe(audio, TranscriptionLanguage::autoDetect()));
        REQUIRE(result.text == "hello world");
        REQUIRE(result.detected_language == "en");
        REQUIRE(f.engine->lastLanguage() == "auto");
        REQUIRE(f.engine->lastSampleCount() == 16000);
    }

    SECTION("PassesLanguageCode") {
        f.install("base");
        f.load("base");

        QCoro::waitFor(f.manager.transcribe(audio, TranscriptionLanguage::pinned("de")));
        REQUIRE(f.engine->lastLanguage() == "de");
    }

    SECTION("SilenceIsEmpty") {
        f.install("base");
        f.load("base");

        f.engine->setText(" [BLANK_AUDIO]");
        REQUIRE(captureError([&] {
            QCoro::waitFor(f.manager.transcribe(audio, TranscriptionLanguage::autoDetect()));
        }).kind() == Kind::EmptyTranscription);

        f.engine->setText("   ");
        REQUIRE(captureError([&] {
            QCoro::waitFor(f.manager.transcribe(audio, TranscriptionLanguage::autoDetect()));
        }).kind() == Kind::EmptyTranscription);
    }

    SECTION("EngineFailure") {
        f.install("base");
        f.load("base");

        f.engine->failing_inferences = 1;
        const auto err = captureError([&] {
            QCoro::waitFor(f.manager.transcribe(audio, TranscriptionLanguage::autoDetect()));
        });
        REQUIRE(err.kind() == Kind::TranscriptionFailed);
        REQUIRE(err.detail() == "simulated inference failure");
    }

    SECTION("Cancel") {
        f.install("base");
        f.load("base");

        f.engine->block_until_aborted = true;
        auto task = f.manager.transcribe(audio, TranscriptionLanguage::autoDetect());
        REQUIRE(waitUntil([&] { return f.engine->running.load(); }));
        f.manager.cancelTranscription();

        const auto err = captureError([&] { QCoro::waitFor(std::move(task)); });
        REQUIRE(err.kind() == Kind::TranscriptionFailed);
        REQUIRE(err.detail() == "cancelled");
    }

    SECTION("CancelOnlyAffectsEarlierRequests") {
        f.install("base");
        f.load("base");

        f.engine->block_until_aborted = true;
        auto first = f.manager.transcribe(audio, TranscriptionLanguage::autoDetect());
        REQUIRE(waitUntil([&] { return f.engine->running.load(); }));
        f.manager.cancelTranscription();
        REQUIRE(captureError([&] { QCoro::waitFor(std::move(first)); }).detail() == "cancelled");

        f.engine->block_until_aborted = false;
        const auto result = QCoro::waitFor(f.manager.transcribe(audio, TranscriptionLanguage::autoDetect()));
        REQUIRE(result.text == "hello world");
    }
}

TEST_CASE("SpeechModelManager validation", "[models]") {
    QTemporaryDir tmp;
    const std::filesystem::path path = tmp.filePath("model.bin").toStdString();

    const std::string content = std::string{"lmgg"} + std::string(2048, 'z');
    {
        std::ofstream out{path, std::ios::binary};
        out << content;
    }

    const auto sha = QCryptographicHash::hash(QByteArray::fromStdString(content), QCryptographicHash::Sha1)
                         .toHex().toStdString();

    ModelInfo info{"test", "Test", "", "model.bin", 1, {}, 0, {}};

    SECTION("MagicWithoutChecksum") {
        REQUIRE(SpeechModelManager::validateFile(info, path));
    }

    SECTION("MatchingChecksum") {
        info.sha = sha;
        REQUIRE(SpeechModelManager::validateFile(info, path));
    }

    SECTION("WrongChecksum") {
        info.sha = "0000000000000000000000000000000000000000";
        REQUIRE_FALSE(SpeechModelManager::validateFile(info, path));
    }

    SECTION("NotGgml") {
        {
            std::ofstream out{path, std::ios::binary | std::ios::trunc};
            out << "<html>Not found</html>";
        }
        REQUIRE_FALSE(SpeechModelManager::validateFile(info, path));
    }

    SECTION("Missing") {
        REQUIRE_FALSE(SpeechModelManager::validateFile(info, path.parent_path() / "nothing.bin"));
    }
}
