#include <array>
#include <format>
#include <ostream>

#include "ModelInfo.h"

using namespace std;

namespace {

constexpr string_view whisper_models_url = "https://huggingface.co/ggerganov/whisper.cpp/resolve/main/";

constexpr auto whisper_models = to_array<ModelInfo>({
    {
        .id = "tiny",
        .name = "Tiny",
        .quality = "Fastest, lower accuracy",
        .filename = "ggml-tiny-q5_1.bin",
        .size_mb = 31,
        .sha = "2827a03e495b1ed3048ef28a6a4620537db4ee51",
        .rank = 0,
        .download_url = whisper_models_url
    },
    {
        .id = "base",
        .name = "Base",
        .quality = "Fast, moderate accuracy",
        .filename = "ggml-base-q5_1.bin",
        .size_mb = 57,
        .sha = "a3733eda680ef76256db5fc5dd9de8629e62c5e7",
        .rank = 1,
        .download_url = whisper_models_url
    },
    {
        .id = "small",
        .name = "Small",
        .quality = "Balanced speed and accuracy",
        .filename = "ggml-small-q5_1.bin",
        .size_mb = 181,
        .sha = "6fe57ddcfdd1c6b07cdcc73aaf620810ce5fc771",
        .rank = 2,
        .download_url = whisper_models_url
    },
    {
        .id = "medium",
        .name = "Medium",
        .quality = "Slower, high accuracy",
        .filename = "ggml-medium-q5_0.bin",
        .size_mb = 514,
        .sha = "7718d4c1ec62ca96998f058114db98236937490e",
        .rank = 3,
        .download_url = whisper_models_url
    },
    {
        .id = "large",
        .name = "Large v3",
        .quality = "Slowest, highest accuracy",
        .filename = "ggml-large-v3-q5_0.bin",
        .size_mb = 1100,
        .sha = "e6e2ed78495d403bef4b7cff42ef4aaadcfea8de",
        .rank = 4,
        .download_url = whisper_models_url
    }
});

} // anon ns

string ModelInfo::url() const
{
    if (download_url.ends_with('/')) {
        return format("{}{}", download_url, filename);
    }
    return string{download_url};
}

model_list_t builtinModels() noexcept
{
    return whisper_models;
}

std::ostream& operator<<(std::ostream& os, ModelStatus::State state)
{
    static constexpr auto names = to_array<string_view>({
        "NotPresent",
        "Downloading",
        "Present",
        "Active"
    });

    return os << names.at(static_cast<size_t>(state));
}

std::ostream& operator<<(std::ostream& os, const ModelStatus& status)
{
    os << status.state;
    if (status.state == ModelStatus::State::Downloading) {
        os << format(" {:.0f}%", status.fraction * 100.0);
    }
    return os;
}

std::ostream& operator<<(std::ostream& os, DownloadProgress::Phase phase)
{
    static constexpr auto names = to_array<string_view>({
        "Downloading",
        "Validating"
    });

    return os << names.at(static_cast<size_t>(phase));
}
