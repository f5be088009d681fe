#pragma once

#include <QSettings>
#include <QString>

#include "copy_configuration.h"

/**
 * @brief Persists the last used copy configuration between sessions.
 *
 * Keys:
 * "Copy/Source", "Copy/Destination", "Copy/Move", "Copy/Invert",
 * "Copy/IgnoreExisting", "Copy/Compress", "Copy/Delete", "Tool/Path"
 *
 * Stored folders that no longer exist are dropped on load.
 */
class SettingsStore {
public:
    SettingsStore();
    // Backed by an explicit file (INI format); used by tests.
    explicit SettingsStore(const QString& iniPath);

    CopyConfiguration loadConfiguration() const;
    void saveConfiguration(const CopyConfiguration& config);

    QString toolPath() const;
    void setToolPath(const QString& path);

    void sync() { m_settings.sync(); }
    QSettings::Status status() const { return m_settings.status(); }

private:
    mutable QSettings m_settings;
};
