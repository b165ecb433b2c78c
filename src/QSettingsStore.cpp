#include <QSettings>

#include "QSettingsStore.h"
#include "logging.h"

using namespace std;

std::string QSettingsStore::activeModelId() const
{
    QSettings settings;
    return settings.value(model_key, default_model).toString().toStdString();
}

TranscriptionLanguage QSettingsStore::languageMode() const
{
    QSettings settings;
    const auto stored = settings.value(language_key, "auto").toString().toStdString();
    if (auto mode = TranscriptionLanguage::parse(stored)) {
        return *mode;
    }

    LOG_WARN_N << "Ignoring invalid language setting '" << stored << "'";
    return TranscriptionLanguage::autoDetect();
}

std::string QSettingsStore::preferredDeviceId() const
{
    QSettings settings;
    return settings.value(device_key, "").toString().toStdString();
}

void QSettingsStore::setActiveModelId(const std::string &id)
{
    QSettings settings;
    settings.setValue(model_key, QString::fromStdString(id));
}

TranscriptionLanguage QSettingsStore::setLanguageMode(const TranscriptionLanguage &requested)
{
    const auto current = languageMode();
    const auto next = TranscriptionLanguage::transition(current, requested);
    if (next != current) {
        LOG_INFO_N << "Language changed from " << current.toString() << " to " << next.toString();
        QSettings settings;
        settings.setValue(language_key, QString::fromStdString(next.toString()));
    } else if (next != requested) {
        LOG_INFO_N << "Keeping pinned language " << current.code();
    }
    return next;
}

void QSettingsStore::setPreferredDeviceId(const std::string &id)
{
    QSettings settings;
    settings.setValue(device_key, QString::fromStdString(id));
}

std::optional<std::filesystem::path> QSettingsStore::modelsPath() const
{
    QSettings settings;
    if (const auto path = settings.value(models_path_key, "").toString(); !path.isEmpty()) {
        return filesystem::path{path.toStdString()};
    }
    return {};
}
