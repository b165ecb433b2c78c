#pragma once

#include <chrono>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

/*! Mono float32 PCM, normally at the 16 kHz whisper expects. */
struct AudioBuffer {
    static constexpr int whisper_sample_rate = 16000;

    std::vector<float> samples;
    int sample_rate{whisper_sample_rate};

    bool empty() const noexcept {
        return samples.empty();
    }

    double durationSeconds() const noexcept {
        return sample_rate > 0 ? static_cast<double>(samples.size()) / sample_rate : 0.0;
    }
};

/*! How the language of a recording is decided.
 *
 *  AutoDetect lets the model detect it. Specific and Pinned force a language
 *  code. A pin survives requests for another specific language and is only
 *  cleared by going back to AutoDetect or by pinning another language.
 */
class TranscriptionLanguage
{
public:
    enum class Mode {
        AutoDetect,
        Specific,
        Pinned
    };

    TranscriptionLanguage() = default;

    static TranscriptionLanguage autoDetect() {
        return {};
    }

    static TranscriptionLanguage specific(std::string code) {
        return {Mode::Specific, std::move(code)};
    }

    static TranscriptionLanguage pinned(std::string code) {
        return {Mode::Pinned, std::move(code)};
    }

    /*! Parses "auto", "specific:<code>", "pinned:<code>" or a bare language code.
     *
     *  Returns nullopt for anything else.
     */
    static std::optional<TranscriptionLanguage> parse(std::string_view text);

    /*! Returns the mode that is in effect after `requested` is selected while `current` is. */
    static TranscriptionLanguage transition(const TranscriptionLanguage& current,
                                            const TranscriptionLanguage& requested);

    std::string toString() const;

    Mode mode() const noexcept {
        return mode_;
    }

    bool isAutoDetect() const noexcept {
        return mode_ == Mode::AutoDetect;
    }

    bool isPinned() const noexcept {
        return mode_ == Mode::Pinned;
    }

    // Empty for AutoDetect
    const std::string& code() const noexcept {
        return code_;
    }

    bool operator==(const TranscriptionLanguage&) const = default;

private:
    TranscriptionLanguage(Mode mode, std::string code)
        : mode_{mode}, code_{std::move(code)} {}

    Mode mode_{Mode::AutoDetect};
    std::string code_;
};

struct TranscriptionResult {
    std::string text;
    std::optional<std::string> detected_language;
    std::chrono::milliseconds duration{};
};

std::ostream& operator<<(std::ostream& os, const TranscriptionLanguage& language);
