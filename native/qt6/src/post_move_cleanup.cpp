#include "post_move_cleanup.h"
#include "file_utils.h"

#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QObject>

PostMoveCleanup::Result PostMoveCleanup::run(const QString& sourceRoot)
{
    Result result;
    if (sourceRoot.isEmpty()) return result;

    if (FileUtils::dirExists(sourceRoot)) pruneChildren(sourceRoot, result);

    if (!FileUtils::dirExists(sourceRoot)) {
        if (QDir().mkpath(sourceRoot)) {
            result.rootRecreated = true;
        } else {
            result.warnings << QObject::tr("Could not recreate source folder %1").arg(QDir::toNativeSeparators(sourceRoot));
        }
    }

    qInfo() << "[PostMoveCleanup]" << sourceRoot << "removed" << result.removedDirs << "empty folders,"
            << result.warnings.size() << "warnings" << (result.rootRecreated ? "(root recreated)" : "");
    return result;
}

void PostMoveCleanup::pruneChildren(const QString& dirPath, Result& result)
{
    QDir dir(dirPath);
    // Symlinked folders belong to somebody else; never descend into them.
    const QFileInfoList subdirs = dir.entryInfoList(QDir::Dirs | QDir::NoDotAndDotDot | QDir::Hidden | QDir::System | QDir::NoSymLinks);
    for (const QFileInfo& fi : subdirs) {
        const QString child = fi.absoluteFilePath();
        pruneChildren(child, result);
        if (!FileUtils::isEmptyDir(child)) continue;
        if (dir.rmdir(fi.fileName())) {
            ++result.removedDirs;
        } else {
            result.warnings << QObject::tr("Could not remove empty folder %1").arg(QDir::toNativeSeparators(child));
        }
    }
}
