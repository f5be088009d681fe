#pragma once

#include <QString>
#include <QStringList>

/**
 * Removes the directories a move left empty in the source tree, for tools that
 * move files but not folders (robocopy /MOVE on partially skipped trees, or
 * /MOVE removing the root itself). The source root always exists afterwards.
 */
class PostMoveCleanup {
public:
    struct Result {
        int removedDirs = 0;
        QStringList warnings; // one per directory that could not be removed
        bool rootRecreated = false;
    };

    static Result run(const QString& sourceRoot);

private:
    // Depth-first: children first, then the directory itself if it ended up empty.
    static void pruneChildren(const QString& dirPath, Result& result);
};
