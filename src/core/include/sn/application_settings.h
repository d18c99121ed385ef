#pragma once

#include <QSettings>
#include <QString>

#include "app_state.h"

namespace sn {

// Persistent configuration backed by QSettings. Constructed once by the
// application and passed to whoever needs it.
class ApplicationSettings {
public:
    // Native store for organization "SmartNotes", application "smartnotes".
    ApplicationSettings();
    // Explicit ini file, used by tests and --settings.
    explicit ApplicationSettings(const QString& iniPath);

    ApplicationSettings(const ApplicationSettings&) = delete;
    ApplicationSettings& operator=(const ApplicationSettings&) = delete;

    [[nodiscard]] QString dataFile() const;
    void setDataFile(const QString& path);

    [[nodiscard]] int saveDebounceMs() const;
    void setSaveDebounceMs(int ms);

    [[nodiscard]] bool debugLogging() const;
    void setDebugLogging(bool enabled);

    [[nodiscard]] SettingsState loadSettingsState() const;
    void saveSettingsState(const SettingsState& state);

    void sync();

private:
    mutable QSettings settings_;
};

} // namespace sn
