#include <cassert>
#include <algorithm>
#include <format>
#include <system_error>

#include <QCryptographicHash>
#include <QFile>
#include <QScopeGuard>
#include <QStandardPaths>
#include <QtConcurrent/QtConcurrentRun>

#include <qcorofuture.h>
#include <qcorotimer.h>

#include "SpeechModelManager.h"
#include "Errors.h"
#include "ScopedTimer.h"
#include "logging.h"

using namespace std;

namespace {

using Kind = DictationError::Kind;

// GGML_FILE_MAGIC (0x67676d6c) as it is stored on disk
constexpr string_view ggml_magic = "lmgg";

string trimmed(string_view text) {
    constexpr string_view ws = " \t\r\n";
    const auto start = text.find_first_not_of(ws);
    if (start == string_view::npos) {
        return {};
    }
    const auto end = text.find_last_not_of(ws);
    return string{text.substr(start, end - start + 1)};
}

// whisper marks silence with a bracketed annotation instead of text
bool isOnlySilence(string_view text) {
    return text == "[BLANK_AUDIO]" || text == "[ Silence ]" || text == "(silence)";
}

QString toQString(string_view text) {
    return QString::fromUtf8(text.data(), static_cast<qsizetype>(text.size()));
}

} // anon ns

SpeechModelManager::SpeechModelManager(Config config,
                                       std::shared_ptr<qdc::WhisperEngine> engine,
                                       std::shared_ptr<ModelFetcher> fetcher,
                                       QObject *parent)
    : QObject(parent)
    , config_{std::move(config)}
    , engine_{std::move(engine)}
    , fetcher_{std::move(fetcher)}
{
    assert(engine_);
    assert(fetcher_);

    LOG_DEBUG_N << "Models are kept in " << config_.models_dir.string();
}

SpeechModelManager::~SpeechModelManager()
{
    cancelTranscription();
    inference_.stop();
    worker_.stop();
}

std::filesystem::path SpeechModelManager::defaultModelsDir()
{
    const auto base = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return std::filesystem::path{base.toStdString()} / "qdictate" / "models";
}

const ModelInfo *SpeechModelManager::findModel(std::string_view id) const noexcept
{
    if (auto it = ranges::find(config_.catalog, id, &ModelInfo::id); it != config_.catalog.end()) {
        return &*it;
    }
    return nullptr;
}

std::filesystem::path SpeechModelManager::modelPath(const ModelInfo &info) const
{
    return config_.models_dir / info.id / info.filename;
}

QCoro::Task<std::vector<SpeechModelManager::model_entry_t>> SpeechModelManager::availableModels()
{
    co_return co_await worker_.post([this] {
        std::vector<model_entry_t> models;
        models.reserve(config_.catalog.size());
        for (const auto& info : config_.catalog) {
            models.emplace_back(info, statusOf(info));
        }
        ranges::sort(models, {}, [](const auto& entry) { return entry.first.rank; });
        return models;
    });
}

QCoro::Task<ModelStatus> SpeechModelManager::modelStatus(std::string id)
{
    const auto *info = findModel(id);
    if (!info) {
        LOG_DEBUG_N << "Status requested for unknown model " << id;
        co_return ModelStatus{};
    }

    co_return co_await worker_.post([this, info] {
        return statusOf(*info);
    });
}

QCoro::Task<std::optional<std::string>> SpeechModelManager::activeModelId()
{
    co_return co_await worker_.post([this]() -> std::optional<std::string> {
        if (active_id_.empty()) {
            return {};
        }
        return active_id_;
    });
}

QCoro::AsyncGenerator<DownloadProgress> SpeechModelManager::downloadModel(std::string id)
{
    const auto *info = findModel(id);
    if (!info) {
        throw DictationError{Kind::ModelDownloadFailed, format("unknown model '{}'", id)};
    }

    const bool already_on_disk = co_await worker_.post([this, info] {
        if (downloads_.contains(info->id)) {
            throw DictationError{Kind::AlreadyDownloading, string{info->id}};
        }
        if (statusOf(*info).isOnDisk()) {
            return true;
        }
        downloads_.emplace(info->id, 0.0);
        return false;
    });

    DownloadProgress progress;
    progress.bytes_total = info->approximateBytes();

    if (already_on_disk) {
        LOG_INFO_N << "Model " << id << " is already downloaded.";
        progress.fraction = 1.0;
        co_yield progress;
        co_return;
    }

    const auto target = modelPath(*info);
    bool validated = false;

    // The download slot is ours until we are done, or until the consumer drops the generator.
    // A file that was not validated must not be left where statusOf() sees it.
    const auto release = qScopeGuard([this, info, target, &validated] {
        worker_.post([this, info, target, keep = validated] {
            if (!keep) {
                std::error_code ec;
                if (std::filesystem::remove(target, ec)) {
                    LOG_DEBUG << "Removed unvalidated model file " << target.string();
                } else if (ec) {
                    LOG_WARN << "Failed to remove " << target.string() << ": " << ec.message();
                }
            }
            if (auto it = downloads_.find(info->id); it != downloads_.end()) {
                downloads_.erase(it);
            }
        });
        notifyStatus(info->id);
    });

    LOG_INFO_N << "Downloading model " << id << " from " << info->url();
    notifyStatus(info->id);
    co_yield progress;

    const auto qid = toQString(info->id);

    try {
        auto transfer = fetcher_->fetch(QUrl{QString::fromStdString(info->url())}, target);
        auto it = co_await transfer.begin();
        while (it != transfer.end()) {
            auto p = *it;
            p.phase = DownloadProgress::Phase::Downloading;

            // 1.0 is reserved for a validated model
            p.fraction = std::clamp(p.fraction, progress.fraction, 0.99);

            if (p.fraction > progress.fraction || p.bytes_received != progress.bytes_received) {
                progress = p;
                co_await worker_.post([this, info, fraction = p.fraction] {
                    if (auto d = downloads_.find(info->id); d != downloads_.end()) {
                        d->second = fraction;
                    }
                });
                emit downloadProgress(qid, p.fraction);
                co_yield p;
            }

            co_await ++it;
        }
    } catch (const DictationError&) {
        throw;
    } catch (const std::exception& ex) {
        throw DictationError{Kind::ModelDownloadFailed, ex.what()};
    }

    progress.phase = DownloadProgress::Phase::Validating;
    co_yield progress;

    const bool valid = co_await QtConcurrent::run([info, target] {
        return validateFile(*info, target);
    });

    if (!valid) {
        // The release guard removes the file
        LOG_WARN_N << "Downloaded model " << id << " failed validation. Removing it.";
        throw DictationError{Kind::ModelValidationFailed,
                             format("{} failed the integrity check", target.filename().string())};
    }

    validated = true;
    co_await worker_.post([this, info] {
        if (auto it = downloads_.find(info->id); it != downloads_.end()) {
            downloads_.erase(it);
        }
    });

    LOG_INFO_N << "Model " << id << " is downloaded and valid.";
    notifyStatus(info->id);

    progress.fraction = 1.0;
    emit downloadProgress(qid, progress.fraction);
    co_yield progress;
}

QCoro::Task<void> SpeechModelManager::loadModel(std::string id)
{
    const auto *info = findModel(id);
    if (!info) {
        throw DictationError{Kind::ModelLoadFailed, format("unknown model '{}'", id)};
    }

    const auto status = co_await worker_.post([this, info] {
        return statusOf(*info);
    });

    if (!status.isOnDisk()) {
        throw DictationError{Kind::ModelLoadFailed, format("model '{}' is not downloaded", id)};
    }

    auto model = co_await inference_.post([this, info] {
        return loadEngineModel(*info);
    });

    const auto previous = co_await worker_.post([this, info, model] {
        active_model_ = model;
        return std::exchange(active_id_, string{info->id});
    });

    LOG_INFO_N << "Model " << id << " is now active: " << model->info();

    if (!previous.empty() && previous != id) {
        notifyStatus(previous);
    }
    notifyStatus(id);
}

QCoro::Task<void> SpeechModelManager::reloadActiveModelWithRetry(int maxAttempts)
{
    const auto id = co_await worker_.post([this] {
        return active_id_;
    });

    if (id.empty()) {
        throw DictationError{Kind::ModelLoadFailed, "no active model"};
    }

    maxAttempts = std::max(maxAttempts, 1);
    string last_error;
    for (int attempt = 0; attempt < maxAttempts; ++attempt) {
        try {
            LOG_DEBUG_N << "Reloading model " << id << ", attempt " << (attempt + 1) << " of " << maxAttempts;
            co_await loadModel(id);
            co_return;
        } catch (const DictationError& ex) {
            LOG_WARN_N << "Reloading model " << id << " failed: " << ex.what();
            last_error = ex.detail();
        }

        if (attempt + 1 < maxAttempts) {
            co_await QCoro::sleepFor(retryDelay(config_.retry_base_delay, attempt));
        }
    }

    throw DictationError{Kind::ModelLoadFailed,
                         format("'{}' could not be reloaded after {} attempt(s): {}", id, maxAttempts, last_error)};
}

std::chrono::milliseconds SpeechModelManager::retryDelay(std::chrono::milliseconds base, int attempt) noexcept
{
    const auto shift = std::clamp(attempt, 0, max_backoff_shift);
    return base * (int64_t{1} << shift);
}

QCoro::Task<void> SpeechModelManager::deleteModel(std::string id)
{
    const auto *info = findModel(id);
    if (!info) {
        throw DictationError{Kind::ModelDeletionFailed, format("unknown model '{}'", id)};
    }

    const auto plan = co_await worker_.post([this, info] {
        return DeletePlan{statusOf(*info), pickFallback(*info)};
    });

    switch(plan.status.state) {
    case ModelStatus::State::NotPresent:
        throw DictationError{Kind::ModelDeletionFailed, format("model '{}' is not on disk", id)};
    case ModelStatus::State::Downloading:
        throw DictationError{Kind::ModelDeletionFailed, format("model '{}' is being downloaded", id)};
    case ModelStatus::State::Present:
    case ModelStatus::State::Active:
        break;
    }

    if (plan.status.state == ModelStatus::State::Active && plan.fallback) {
        LOG_INFO_N << "Model " << id << " is active. Switching to " << plan.fallback->id << " before deleting it.";
        co_await loadModel(string{plan.fallback->id});
    }

    const bool any_left = co_await worker_.post([this, info] {
        if (active_id_ == info->id) {
            active_id_.clear();
            active_model_.reset();
        }

        const auto dir = modelPath(*info).parent_path();
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
        if (ec) {
            throw DictationError{Kind::ModelDeletionFailed, format("cannot remove {}: {}", dir.string(), ec.message())};
        }

        return anyModelOnDisk();
    });

    LOG_INFO_N << "Deleted model " << id;
    notifyStatus(id);

    if (!any_left) {
        throw DictationError{Kind::NoModelsAvailable};
    }
}

QCoro::Task<TranscriptionResult> SpeechModelManager::transcribe(AudioBuffer buffer, TranscriptionLanguage language)
{
    if (buffer.empty()) {
        throw DictationError{Kind::EmptyTranscription};
    }

    auto model = co_await worker_.post([this] {
        return active_model_;
    });

    if (!model) {
        throw DictationError{Kind::ModelNotDownloaded};
    }

    LOG_DEBUG_N << format("Transcribing {:.2f} seconds of audio with {}, language {}",
                          buffer.durationSeconds(), model->modelId(), language.toString());

    const auto ticket = ++next_ticket_;
    co_return co_await inference_.post([this, model, ticket, buffer = std::move(buffer), language = std::move(language)] {
        return runInference(*model, buffer, language, ticket);
    });
}

void SpeechModelManager::cancelTranscription() noexcept
{
    cancelled_ticket_ = next_ticket_.load();
}

bool SpeechModelManager::isCancelled(uint64_t ticket) const noexcept
{
    return ticket <= cancelled_ticket_.load();
}

bool SpeechModelManager::validateFile(const ModelInfo &info, const std::filesystem::path &path)
{
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (ec || size < ggml_magic.size()) {
        LOG_WARN_N << "Model file " << path.string() << " is missing or too small";
        return false;
    }

    QFile file{QString::fromStdString(path.string())};
    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN_N << "Cannot open " << path.string() << ": " << file.errorString().toStdString();
        return false;
    }

    const auto magic = file.read(static_cast<qint64>(ggml_magic.size()));
    if (string_view{magic.constData(), static_cast<size_t>(magic.size())} != ggml_magic) {
        LOG_WARN_N << "Model file " << path.string() << " is not a ggml file";
        return false;
    }

    if (info.sha.empty()) {
        return true;
    }

    ScopedTimer timer;
    file.seek(0);
    QCryptographicHash hash{QCryptographicHash::Sha1};
    if (!hash.addData(&file)) {
        LOG_WARN_N << "Failed to read " << path.string() << " for the checksum";
        return false;
    }

    const auto sha = hash.result().toHex().toStdString();
    LOG_DEBUG_N << "SHA-1 of " << path.filename().string() << " is " << sha
                << " (" << timer.elapsed() << " seconds)";

    if (sha != info.sha) {
        LOG_WARN_N << "Checksum mismatch for " << path.string() << ". Expected " << info.sha;
        return false;
    }

    return true;
}

ModelStatus SpeechModelManager::statusOf(const ModelInfo &info) const
{
    assert(worker_.isCurrentThread());

    if (active_id_ == info.id) {
        return {ModelStatus::State::Active};
    }

    if (auto it = downloads_.find(info.id); it != downloads_.end()) {
        return {ModelStatus::State::Downloading, it->second};
    }

    std::error_code ec;
    if (std::filesystem::is_regular_file(modelPath(info), ec)) {
        return {ModelStatus::State::Present};
    }

    return {};
}

const ModelInfo *SpeechModelManager::pickFallback(const ModelInfo &deleted) const
{
    const ModelInfo *below = nullptr;
    const ModelInfo *above = nullptr;

    for (const auto& info : config_.catalog) {
        if (info.id == deleted.id || statusOf(info).state != ModelStatus::State::Present) {
            continue;
        }
        if (info.rank < deleted.rank) {
            if (!below || info.rank > below->rank) {
                below = &info;
            }
        } else if (!above || info.rank < above->rank) {
            above = &info;
        }
    }

    return below ? below : above;
}

bool SpeechModelManager::anyModelOnDisk() const
{
    return ranges::any_of(config_.catalog, [this](const auto& info) {
        return statusOf(info).isOnDisk();
    });
}

std::shared_ptr<qdc::WhisperModel> SpeechModelManager::loadEngineModel(const ModelInfo &info)
{
    assert(inference_.isCurrentThread());

    ScopedTimer timer;
    const auto path = modelPath(info);
    LOG_DEBUG_N << "Loading model " << info.id << " from " << path.string();

    auto model = engine_->loadModel(string{info.id}, path);
    if (!model) {
        const auto err = engine_->lastError();
        throw DictationError{Kind::ModelLoadFailed,
                             err.empty() ? format("the engine could not load '{}'", info.id) : err};
    }

    LOG_INFO_N << "Loaded model " << info.id << " in " << timer.elapsed() << " seconds";
    return model;
}

TranscriptionResult SpeechModelManager::runInference(qdc::WhisperModel &model, const AudioBuffer &buffer,
                                                     const TranscriptionLanguage &language, uint64_t ticket)
{
    assert(inference_.isCurrentThread());

    if (isCancelled(ticket)) {
        LOG_DEBUG_N << "Transcription was cancelled before it started";
        throw DictationError{Kind::TranscriptionFailed, "cancelled"};
    }

    ScopedTimer timer;
    auto session = model.createSession();
    if (!session) {
        throw DictationError{Kind::TranscriptionFailed, "could not create a whisper session"};
    }

    qdc::WhisperSession::Params params;
    params.language = language.isAutoDetect() ? "auto" : language.code();
    params.no_context = true;
    params.suppress_blank = true;
    params.should_abort = [this, ticket] {
        return isCancelled(ticket);
    };

    qdc::WhisperSession::Transcript transcript;
    if (!session->run(buffer.samples, params, transcript)) {
        if (transcript.aborted) {
            throw DictationError{Kind::TranscriptionFailed, "cancelled"};
        }
        const auto err = engine_->lastError();
        throw DictationError{Kind::TranscriptionFailed, err.empty() ? string{"inference failed"} : err};
    }

    auto text = trimmed(transcript.text);
    LOG_DEBUG_N << "Transcribed " << buffer.durationSeconds() << " seconds of audio in "
                << timer.elapsed() << " seconds";

    if (text.empty() || isOnlySilence(text)) {
        throw DictationError{Kind::EmptyTranscription};
    }

    TranscriptionResult result;
    result.text = std::move(text);
    if (!transcript.language.empty()) {
        result.detected_language = transcript.language;
    }
    result.duration = timer.elapsedMs();
    return result;
}

void SpeechModelManager::notifyStatus(std::string_view id)
{
    emit modelStatusChanged(toQString(id));
}
