#include "tool_profile.h"
#include "copy_configuration.h"
#include "file_utils.h"

#include <QDir>
#include <QObject>

#ifdef Q_OS_WIN
#include <windows.h>
#endif

std::unique_ptr<ToolProfile> ToolProfile::create(ToolPlatform platform)
{
    switch (platform) {
        case ToolPlatform::PosixSync: return std::make_unique<PosixSyncTool>();
        case ToolPlatform::WindowsCopy: return std::make_unique<WindowsCopyTool>();
    }
    return nullptr;
}

ToolPlatform ToolProfile::hostPlatform()
{
#ifdef Q_OS_WIN
    return ToolPlatform::WindowsCopy;
#else
    return ToolPlatform::PosixSync;
#endif
}

// ---- rsync ----

QStringList PosixSyncTool::fallbackLocations() const
{
    // The rsync shipped with macOS predates --info=progress2; prefer a newer one.
    return { QStringLiteral("/opt/homebrew/bin/rsync"), QStringLiteral("/usr/local/bin/rsync") };
}

QStringList PosixSyncTool::optionFlags(const CopyConfiguration& config, QStringList* warnings) const
{
    Q_UNUSED(warnings);
    QStringList flags;
    flags << "-a" << "-h" << "-v" << "--info=progress2" << "--exclude=.DS_Store";
    if (config.move) flags << "--remove-source-files";
    if (config.ignoreExisting) flags << "--ignore-existing";
    if (config.compress) flags << "-z";
    if (config.deleteExtraneous) flags << "--delete";
    return flags;
}

QString PosixSyncTool::sourceArgument(const QString& source) const
{
    return FileUtils::withTrailingSeparator(QDir::cleanPath(source));
}

QString PosixSyncTool::destinationArgument(const QString& destination) const
{
    return QDir::cleanPath(destination);
}

// ---- robocopy ----

QStringList WindowsCopyTool::optionFlags(const CopyConfiguration& config, QStringList* warnings) const
{
    QStringList flags;
    // /E keeps empty directories. /NJH /NJS /NDL /NP drop the job header, job summary, directory lines
    // and per-file percentages.
    // /XJ skips junctions, /R:1 /W:1 replaces the default of a million retries 30s apart.
    flags << "/E" << "/NJH" << "/NJS" << "/NDL" << "/NP" << "/XJ" << "/R:1" << "/W:1";
    if (config.move) flags << "/MOVE";
    if (config.ignoreExisting) flags << "/XO";
    if (config.deleteExtraneous) {
        flags << "/MIR";
        if (warnings) *warnings << QObject::tr("Warning: mirror mode deletes destination files that are not in the source.");
    }
    if (config.compress && warnings) {
        *warnings << QObject::tr("Warning: compression is not supported by robocopy and will be ignored.");
    }
    return flags;
}

QString WindowsCopyTool::sourceArgument(const QString& source) const
{
    return QDir::toNativeSeparators(QDir::cleanPath(source));
}

QString WindowsCopyTool::destinationArgument(const QString& destination) const
{
    return QDir::toNativeSeparators(QDir::cleanPath(destination));
}

QString WindowsCopyTool::decodeOutput(const QByteArray& raw) const
{
#ifdef Q_OS_WIN
    if (raw.isEmpty()) return QString();
    const int len = MultiByteToWideChar(CP_OEMCP, 0, raw.constData(), int(raw.size()), nullptr, 0);
    if (len <= 0) return QString::fromLocal8Bit(raw);
    QString text(len, Qt::Uninitialized);
    MultiByteToWideChar(CP_OEMCP, 0, raw.constData(), int(raw.size()), reinterpret_cast<wchar_t*>(text.data()), len);
    return text;
#else
    return QString::fromLocal8Bit(raw);
#endif
}
