#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <QObject>

#include <qcoroasyncgenerator.h>
#include <qcorotask.h>

#include "qdc/WhisperEngine.h"

#include "ModelFetcher.h"
#include "ModelInfo.h"
#include "Transcription.h"
#include "Worker.h"

/*! Speech model manager

 Owns the catalog of installable whisper models, their presence on disk, the
 one model that is loaded (Active), and transcription requests against it.

 Model files live in <models dir>/<model id>/<file name>.

 The catalog status, running downloads and the active model belong to the
 state worker. Loading and inference run on a separate inference worker, so
 status queries are not stuck behind a long transcription.

 Signals:
 - modelStatusChanged(modelId): the status of a model changed.
 - downloadProgress(modelId, fraction): a download made progress.
*/
class SpeechModelManager : public QObject
{
    Q_OBJECT

public:
    struct Config {
        std::filesystem::path models_dir;
        std::chrono::milliseconds retry_base_delay{1000};
        model_list_t catalog{builtinModels()};
    };

    using model_entry_t = std::pair<ModelInfo, ModelStatus>;

    SpeechModelManager(Config config,
                       std::shared_ptr<qdc::WhisperEngine> engine,
                       std::shared_ptr<ModelFetcher> fetcher,
                       QObject *parent = nullptr);
    ~SpeechModelManager() override;

    static std::filesystem::path defaultModelsDir();

    const ModelInfo *findModel(std::string_view id) const noexcept;

    std::filesystem::path modelPath(const ModelInfo& info) const;

    /*! All catalog models with their status, in rank order. */
    [[nodiscard]] QCoro::Task<std::vector<model_entry_t>> availableModels();

    [[nodiscard]] QCoro::Task<ModelStatus> modelStatus(std::string id);

    [[nodiscard]] QCoro::Task<std::optional<std::string>> activeModelId();

    /*! Downloads and validates a model.
     *
     *  Yields progress in non-decreasing order. The last progress of a
     *  successful download has fraction 1.0, and the model is Present by then.
     *  Dropping the generator cancels the download and removes partial data.
     *
     *  Ends with DictationError: AlreadyDownloading, ModelDownloadFailed or
     *  ModelValidationFailed.
     */
    [[nodiscard]] QCoro::AsyncGenerator<DownloadProgress> downloadModel(std::string id);

    /*! Loads a Present model and makes it the Active one.
     *
     *  Throws DictationError(ModelLoadFailed).
     */
    [[nodiscard]] QCoro::Task<void> loadModel(std::string id);

    /*! Reloads the Active model, with exponential back-off between attempts.
     *
     *  Throws DictationError(ModelLoadFailed) when there is no Active model,
     *  or when all attempts failed.
     */
    [[nodiscard]] QCoro::Task<void> reloadActiveModelWithRetry(int maxAttempts);

    /*! Delay before reload attempt `attempt + 1`: base * 2^attempt, with the exponent capped at max_backoff_shift. */
    static std::chrono::milliseconds retryDelay(std::chrono::milliseconds base, int attempt) noexcept;

    static constexpr int max_backoff_shift = 10;

    /*! Removes a model from disk.
     *
     *  If the model is Active, another Present model is activated first.
     *  Throws DictationError: ModelDeletionFailed, ModelLoadFailed (the
     *  fallback failed and nothing was deleted) or NoModelsAvailable (the model
     *  was deleted, and no other model is on disk).
     */
    [[nodiscard]] QCoro::Task<void> deleteModel(std::string id);

    /*! Transcribes the buffer with the Active model.
     *
     *  Throws DictationError: EmptyTranscription, ModelNotDownloaded or
     *  TranscriptionFailed.
     */
    [[nodiscard]] QCoro::Task<TranscriptionResult> transcribe(AudioBuffer buffer, TranscriptionLanguage language);

    /*! Aborts the transcriptions requested so far, running or queued.
     *
     *  Requests made after the call are not affected.
     */
    void cancelTranscription() noexcept;

    /*! Checks the file on disk: size, ggml magic and checksum. */
    static bool validateFile(const ModelInfo& info, const std::filesystem::path& path);

signals:
    void modelStatusChanged(const QString& modelId);
    void downloadProgress(const QString& modelId, double fraction);

private:
    struct DeletePlan {
        ModelStatus status;
        const ModelInfo *fallback{};
    };

    // Called on the state worker
    ModelStatus statusOf(const ModelInfo& info) const;
    const ModelInfo *pickFallback(const ModelInfo& deleted) const;
    bool anyModelOnDisk() const;

    // Called on the inference worker
    std::shared_ptr<qdc::WhisperModel> loadEngineModel(const ModelInfo& info);
    TranscriptionResult runInference(qdc::WhisperModel& model, const AudioBuffer& buffer,
                                     const TranscriptionLanguage& language, uint64_t ticket);
    bool isCancelled(uint64_t ticket) const noexcept;

    void notifyStatus(std::string_view id);

    const Config config_;
    const std::shared_ptr<qdc::WhisperEngine> engine_;
    const std::shared_ptr<ModelFetcher> fetcher_;
    // Each transcription gets a ticket. Tickets up to cancelled_ticket_ are aborted.
    std::atomic_uint64_t next_ticket_{0};
    std::atomic_uint64_t cancelled_ticket_{0};

    // Owned by the state worker
    std::map<std::string, double, std::less<>> downloads_;
    std::string active_id_;
    std::shared_ptr<qdc::WhisperModel> active_model_;

    Worker inference_{"inference"};
    Worker worker_{"model-manager"};
};
