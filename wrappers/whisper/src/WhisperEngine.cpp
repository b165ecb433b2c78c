#include <algorithm>
#include <atomic>
#include <cassert>
#include <format>
#include <memory>
#include <mutex>
#include <thread>

#include "qdc/WhisperEngine.h"
#include "qdc/log_wrapper.h"

#include <whisper.h>

using namespace std;

namespace qdc {

namespace {

class Engine;

void forwardWhisperLog(ggml_log_level level, const char *text, void *) {
    string_view msg{text ? text : ""};
    while (!msg.empty() && (msg.back() == '\n' || msg.back() == ' ')) {
        msg.remove_suffix(1);
    }
    if (msg.empty()) {
        return;
    }

    // whisper.cpp is chatty. Its info output is debug level for us.
    switch(level) {
    case GGML_LOG_LEVEL_ERROR:
        LOG_ERROR << "[whisper] " << msg;
        break;
    case GGML_LOG_LEVEL_WARN:
        LOG_WARN << "[whisper] " << msg;
        break;
    case GGML_LOG_LEVEL_INFO:
        LOG_DEBUG << "[whisper] " << msg;
        break;
    default:
        LOG_TRACE << "[whisper] " << msg;
        break;
    }
}

int threadsFor(const WhisperOptions& options) noexcept {
    if (options.threads > 0) {
        return options.threads;
    }

    // Leave a core for the audio and UI threads. More than 8 rarely helps whisper.
    const auto cores = static_cast<int>(std::thread::hardware_concurrency());
    return std::clamp(cores - 1, 2, 8);
}

string detectedLanguage(whisper_state *state) {
    if (const auto id = whisper_full_lang_id_from_state(state); id >= 0) {
        if (const char *code = whisper_lang_str(id)) {
            return code;
        }
    }
    return {};
}

class Model;

class Session final : public WhisperSession {
public:
    Session(shared_ptr<Model> model, whisper_state *state, int threads)
        : model_{std::move(model)}, state_{state}, threads_{threads}
    {
        assert(model_);
        assert(state_);
    }

    ~Session() override {
        whisper_free_state(state_);
    }

    bool run(std::span<const float> samples, const Params &params, Transcript &out) override;

private:
    void collectSegments(Transcript& out) const;

    const shared_ptr<Model> model_;
    whisper_state *const state_;
    const int threads_;
};

class Model final : public WhisperModel, public enable_shared_from_this<Model> {
public:
    Model(Engine& engine, string modelId, whisper_context *ctx)
        : engine_{engine}, model_id_{std::move(modelId)}, ctx_{ctx}
    {
        assert(ctx_);
    }

    ~Model() override;

    const string &modelId() const noexcept override {
        return model_id_;
    }

    string info() const override;

    shared_ptr<WhisperSession> createSession() override;

    whisper_context *ctx() const noexcept {
        return ctx_;
    }

private:
    Engine& engine_;
    const string model_id_;
    whisper_context *const ctx_;
};

class Engine final : public WhisperEngine {
public:
    explicit Engine(const WhisperOptions& options)
        : options_{options}
    {
        whisper_log_set(forwardWhisperLog, nullptr);
    }

    ~Engine() override {
        LOG_DEBUG << "Whisper engine going away with " << loaded_ << " model(s) still loaded";
    }

    string version() const override {
        const char *v = whisper_version();
        return format("whisper.cpp version {}", v ? v : "unknown");
    }

    bool init() override {
        LOG_INFO << version() << ", " << threadsFor(options_) << " threads, GPU "
                 << (options_.use_gpu ? "enabled" : "disabled");
        if (const char *info = whisper_print_system_info()) {
            LOG_DEBUG << "System info: " << info;
        }
        setError({});
        return true;
    }

    string lastError() const override {
        lock_guard lock{mutex_};
        return error_;
    }

    shared_ptr<WhisperModel> loadModel(const string &modelId, const filesystem::path &path) override {
        auto cparams = whisper_context_default_params();
        cparams.use_gpu = options_.use_gpu;
        cparams.flash_attn = options_.flash_attn;
        cparams.gpu_device = options_.gpu_device;

        LOG_DEBUG << "Loading whisper model " << modelId << " from " << path.string();

        auto *ctx = whisper_init_from_file_with_params_no_state(path.string().c_str(), cparams);
        if (!ctx) {
            LOG_ERROR << "whisper could not load " << path.string();
            setError(format("whisper could not load {}", path.filename().string()));
            return {};
        }

        ++loaded_;
        setError({});
        return make_shared<Model>(*this, modelId, ctx);
    }

    int numLoadedModels() const noexcept override {
        return loaded_.load();
    }

    void setLogger(logfwd::callback_t cb, logfwd::Level level) override {
        logfwd::install(std::move(cb), "[engine]", level);
    }

    const WhisperOptions& options() const noexcept {
        return options_;
    }

    void modelUnloaded() noexcept {
        --loaded_;
    }

private:
    void setError(string message) {
        lock_guard lock{mutex_};
        error_ = std::move(message);
    }

    const WhisperOptions options_;
    mutable mutex mutex_;
    string error_;
    atomic_int loaded_{0};
};

Model::~Model()
{
    LOG_DEBUG << "Unloading whisper model " << model_id_;
    whisper_free(ctx_);
    engine_.modelUnloaded();
}

string Model::info() const
{
    return format("{} ({})", model_id_, engine_.version());
}

shared_ptr<WhisperSession> Model::createSession()
{
    auto *state = whisper_init_state(ctx_);
    if (!state) {
        LOG_ERROR << "whisper could not allocate decoder state for " << model_id_;
        return {};
    }

    return make_shared<Session>(shared_from_this(), state, threadsFor(engine_.options()));
}

bool Session::run(std::span<const float> samples, const Params &params, Transcript &out)
{
    out = {};

    const bool detect = params.language.empty() || params.language == "auto";

    auto wp = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    wp.language = detect ? "auto" : params.language.c_str();
    wp.n_threads = threads_;
    wp.no_context = params.no_context;
    wp.suppress_blank = params.suppress_blank;
    wp.single_segment = params.single_segment;
    wp.print_special = false;
    wp.print_progress = false;
    wp.print_realtime = false;
    wp.print_timestamps = false;

    if (params.should_abort) {
        wp.abort_callback = [](void *userData) -> bool {
            return (*static_cast<const std::function<bool()> *>(userData))();
        };
        wp.abort_callback_user_data = const_cast<std::function<bool()> *>(&params.should_abort);
    }

    LOG_TRACE << "whisper_full: " << samples.size() << " samples, language=" << wp.language
              << ", threads=" << wp.n_threads;

    const auto rc = whisper_full_with_state(model_->ctx(), state_, wp,
                                            samples.data(), static_cast<int>(samples.size()));

    if (params.should_abort && params.should_abort()) {
        LOG_DEBUG << "whisper_full was aborted";
        out.aborted = true;
        return false;
    }

    if (rc != 0) {
        LOG_WARN << "whisper_full failed with code " << rc;
        return false;
    }

    collectSegments(out);
    out.language = detect ? detectedLanguage(state_) : params.language;

    LOG_TRACE << "whisper_full: " << out.segments.size() << " segment(s), language=" << out.language;
    return true;
}

void Session::collectSegments(Transcript &out) const
{
    const int count = whisper_full_n_segments_from_state(state_);
    out.segments.reserve(static_cast<size_t>(std::max(count, 0)));

    for (int i = 0; i < count; ++i) {
        auto& seg = out.segments.emplace_back();

        // whisper counts time in 10 ms ticks
        seg.t0_ms = whisper_full_get_segment_t0_from_state(state_, i) * 10;
        seg.t1_ms = whisper_full_get_segment_t1_from_state(state_, i) * 10;
        seg.no_speech_prob = whisper_full_get_segment_no_speech_prob_from_state(state_, i);

        if (const char *text = whisper_full_get_segment_text_from_state(state_, i)) {
            seg.text = text;
            out.text += seg.text;
        }
    }
}

} // anon ns

std::shared_ptr<WhisperEngine> WhisperEngine::create(const WhisperOptions &options)
{
    return make_shared<Engine>(options);
}

WhisperSession::WhisperSession() = default;
WhisperSession::~WhisperSession() = default;

WhisperModel::WhisperModel() = default;
WhisperModel::~WhisperModel() = default;

WhisperEngine::WhisperEngine() = default;
WhisperEngine::~WhisperEngine() = default;

} // ns
