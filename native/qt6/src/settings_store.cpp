#include "settings_store.h"
#include "file_utils.h"

#include <QDebug>

SettingsStore::SettingsStore()
    : m_settings("FastCopy", "FastCopy")
{
}

SettingsStore::SettingsStore(const QString& iniPath)
    : m_settings(iniPath, QSettings::IniFormat)
{
}

CopyConfiguration SettingsStore::loadConfiguration() const
{
    CopyConfiguration c;
    m_settings.beginGroup("Copy");

    const QString src = m_settings.value("Source").toString();
    const QString dst = m_settings.value("Destination").toString();
    if (!src.isEmpty() && FileUtils::dirExists(src)) c.sourcePath = src;
    else if (!src.isEmpty()) qInfo() << "[SettingsStore] Stored source no longer exists:" << src;
    if (!dst.isEmpty() && FileUtils::dirExists(dst)) c.destinationPath = dst;
    else if (!dst.isEmpty()) qInfo() << "[SettingsStore] Stored destination no longer exists:" << dst;

    c.move = m_settings.value("Move", false).toBool();
    c.invert = m_settings.value("Invert", false).toBool();
    c.ignoreExisting = m_settings.value("IgnoreExisting", false).toBool();
    c.compress = m_settings.value("Compress", false).toBool();
    c.deleteExtraneous = m_settings.value("Delete", false).toBool();

    m_settings.endGroup();
    return c;
}

void SettingsStore::saveConfiguration(const CopyConfiguration& config)
{
    m_settings.beginGroup("Copy");
    m_settings.setValue("Source", config.sourcePath);
    m_settings.setValue("Destination", config.destinationPath);
    m_settings.setValue("Move", config.move);
    m_settings.setValue("Invert", config.invert);
    m_settings.setValue("IgnoreExisting", config.ignoreExisting);
    m_settings.setValue("Compress", config.compress);
    m_settings.setValue("Delete", config.deleteExtraneous);
    m_settings.endGroup();
    m_settings.sync();

    qDebug() << "[SettingsStore] Saved configuration to" << m_settings.fileName();
}

QString SettingsStore::toolPath() const
{
    return m_settings.value("Tool/Path").toString();
}

void SettingsStore::setToolPath(const QString& path)
{
    if (path.isEmpty()) m_settings.remove("Tool/Path");
    else m_settings.setValue("Tool/Path", path);
    m_settings.sync();
}
