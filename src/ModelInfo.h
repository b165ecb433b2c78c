#pragma once

#include <cstdint>
#include <iosfwd>
#include <span>
#include <string>
#include <string_view>

/*! Catalog entry for an installable speech model. */
struct ModelInfo {
    std::string_view id;
    std::string_view name;
    std::string_view quality;
    std::string_view filename;
    size_t size_mb{};           // approximate in megabytes
    std::string_view sha;       // SHA-1 of the file. Empty skips the checksum.
    unsigned rank{};            // 0 is the smallest and fastest
    std::string_view download_url; // If it ends with '/', the file name is appended for download

    std::string url() const;

    uint64_t approximateBytes() const noexcept {
        return static_cast<uint64_t>(size_mb) * 1024 * 1024;
    }
};

using model_list_t = std::span<const ModelInfo>; // NB: Non owning

/*! The whisper.cpp models we know about, in rank order. */
model_list_t builtinModels() noexcept;

/*! Derived per model id. At most one model is Active. */
struct ModelStatus {
    enum class State {
        NotPresent,
        Downloading,
        Present,
        Active
    };

    State state{State::NotPresent};
    double fraction{};  // Only meaningful while Downloading

    bool isOnDisk() const noexcept {
        return state == State::Present || state == State::Active;
    }

    bool operator==(const ModelStatus&) const = default;
};

struct DownloadProgress {
    enum class Phase {
        Downloading,
        Validating
    };

    Phase phase{Phase::Downloading};
    double fraction{};
    uint64_t bytes_received{};
    uint64_t bytes_total{};
};

std::ostream& operator<<(std::ostream& os, ModelStatus::State state);
std::ostream& operator<<(std::ostream& os, const ModelStatus& status);
std::ostream& operator<<(std::ostream& os, DownloadProgress::Phase phase);
