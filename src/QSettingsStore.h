#pragma once

#include <filesystem>
#include <optional>

#include <QString>

#include "Collaborators.h"

/*! SettingsSource backed by QSettings.
 *
 *  Values are read from QSettings on every call, so changes made by another
 *  instance are picked up by the next session.
 */
class QSettingsStore : public SettingsSource
{
public:
    static constexpr auto model_key = "transcribe/model";
    static constexpr auto language_key = "transcribe/language";
    static constexpr auto device_key = "audio/device";
    static constexpr auto models_path_key = "models/path";
    static constexpr auto default_model = "base";

    std::string activeModelId() const override;
    TranscriptionLanguage languageMode() const override;
    std::string preferredDeviceId() const override;

    void setActiveModelId(const std::string& id);

    /*! Applies a language request to the stored mode.
     *
     *  A pinned language is kept when a specific language is requested.
     *  Returns the mode that is now stored.
     */
    TranscriptionLanguage setLanguageMode(const TranscriptionLanguage& requested);

    void setPreferredDeviceId(const std::string& id);

    // Models directory from the settings, if one is configured
    std::optional<std::filesystem::path> modelsPath() const;
};
