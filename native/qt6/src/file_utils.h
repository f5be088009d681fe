#pragma once

#include <QDir>
#include <QFileInfo>
#include <QString>

/**
 * FileUtils - small path helpers shared by the pre-flight checks,
 * the command builder and the post-move cleanup.
 */
namespace FileUtils {

inline bool dirExists(const QString& dirPath)
{
    QFileInfo fi(dirPath);
    return fi.exists() && fi.isDir();
}

/**
 * Check for an executable regular file (follows symlinks).
 */
inline bool isExecutableFile(const QString& path)
{
    if (path.isEmpty()) return false;
    QFileInfo fi(path);
    return fi.exists() && fi.isFile() && fi.isExecutable();
}

/**
 * A directory with no entries at all, hidden ones included.
 */
inline bool isEmptyDir(const QString& dirPath)
{
    QDir d(dirPath);
    return d.exists() && d.isEmpty(QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden | QDir::System);
}

/**
 * Append exactly one trailing separator so sync tools treat the path as
 * "the contents of" the directory rather than the directory itself.
 */
inline QString withTrailingSeparator(const QString& path, QChar sep = QLatin1Char('/'))
{
    QString p = path;
    while (p.size() > 1 && (p.endsWith(QLatin1Char('/')) || p.endsWith(QLatin1Char('\\')))) p.chop(1);
    if (p.endsWith(sep)) return p;
    return p + sep;
}

} // namespace FileUtils
