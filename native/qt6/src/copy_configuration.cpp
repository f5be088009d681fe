#include "copy_configuration.h"
#include "file_utils.h"

#include <QDir>
#include <QFileInfo>
#include <QObject>

bool validateConfiguration(const CopyConfiguration& c, QString* errorOut)
{
    const EffectivePaths p = effectivePaths(c);
    QString err;
    if (p.source.trimmed().isEmpty()) {
        err = QObject::tr("No source folder selected.");
    } else if (p.destination.trimmed().isEmpty()) {
        err = QObject::tr("No destination folder selected.");
    } else if (!QFileInfo::exists(p.source)) {
        err = QObject::tr("Source folder does not exist: %1").arg(QDir::toNativeSeparators(p.source));
    } else if (!FileUtils::dirExists(p.source)) {
        err = QObject::tr("Source is not a folder: %1").arg(QDir::toNativeSeparators(p.source));
    }
    if (err.isEmpty()) return true;
    if (errorOut) *errorOut = err;
    return false;
}
