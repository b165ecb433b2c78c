#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include "log_wrapper.h"

/*! Interface to the speech-to-text engine.
 *
 *  The implementation lives in a separate shared library, so the
 *  application and the tests never see whisper.h.
 */

#if defined(_WIN32)
#if defined(QDC_WHISPER_WRAP_BUILD)
#define QDC_WHISPER_WRAP_API __declspec(dllexport)
#else
#define QDC_WHISPER_WRAP_API __declspec(dllimport)
#endif
#else
#define QDC_WHISPER_WRAP_API __attribute__((visibility("default")))
#endif

namespace qdc {

struct WhisperOptions {
    bool use_gpu{true};
    bool flash_attn{false};
    int gpu_device{0};
    int threads{0};     // 0 picks a value from the number of cores
};

/*! Decoder state for one recording.
 *
 *  Each session owns its own state, so a loaded model can serve sessions
 *  without being reloaded.
 */
class QDC_WHISPER_WRAP_API WhisperSession {
public:
    struct Params {
        std::string language;   // empty or "auto" for detection
        bool no_context{true};
        bool suppress_blank{true};
        bool single_segment{false};

        // Polled by the decoder. Returning true stops the run.
        std::function<bool()> should_abort;
    };

    struct Segment {
        int64_t t0_ms{};
        int64_t t1_ms{};
        std::string text;
        float no_speech_prob{};
    };

    struct Transcript {
        std::vector<Segment> segments;
        std::string text;
        std::string language;   // detected or forced
        bool aborted{false};
    };

    WhisperSession();
    virtual ~WhisperSession();

    /*! Runs the full decoder over 16 kHz mono samples in the range [-1, 1].
     *
     * @return True if the run completed. An aborted run returns false with
     *         out.aborted set.
     */
    virtual bool run(std::span<const float> samples, const Params& params, Transcript& out) = 0;
};

/*! A model in memory.
 *
 *  The model is unloaded when the last reference to it, including the
 *  references held by its sessions, goes away.
 */
class QDC_WHISPER_WRAP_API WhisperModel {
public:
    WhisperModel();
    virtual ~WhisperModel();

    virtual const std::string& modelId() const noexcept = 0;

    // Human readable description for the log
    virtual std::string info() const = 0;

    /*! @return The session, or nullptr if the engine could not allocate the state. */
    virtual std::shared_ptr<WhisperSession> createSession() = 0;
};

class QDC_WHISPER_WRAP_API WhisperEngine {
public:
    WhisperEngine();
    virtual ~WhisperEngine();

    static std::shared_ptr<WhisperEngine> create(const WhisperOptions& options = {});

    /*! Example: "whisper.cpp version 1.7.6" */
    virtual std::string version() const = 0;

    /*! One time initialization. Must be called before a model is loaded. */
    virtual bool init() = 0;

    /*! The error from the last failed operation, or an empty string. */
    virtual std::string lastError() const = 0;

    /*! Loads a ggml model file.
     *
     * @return The model, or nullptr on failure. See lastError().
     */
    virtual std::shared_ptr<WhisperModel> loadModel(const std::string& modelId,
                                                    const std::filesystem::path& path) = 0;

    virtual int numLoadedModels() const noexcept = 0;

    /*! Routes the engine's log output to the application's logger. */
    virtual void setLogger(logfwd::callback_t cb, logfwd::Level level) = 0;
};

} // ns
