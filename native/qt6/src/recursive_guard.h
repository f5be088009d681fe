#pragma once

#include <QString>

/**
 * RecursiveGuard - refuses copies where one folder lives inside the other.
 *
 * Both paths are resolved (symlinks followed, "." and ".." collapsed) before
 * comparing. A path that cannot be resolved at all is treated as safe and left
 * for the external tool to report. Identical paths are not flagged.
 */
namespace RecursiveGuard {

// True when src is a strict descendant of dst or dst of src.
bool check(const QString& src, const QString& dst);

// Canonical form used by check(); empty when the path cannot be resolved.
QString resolve(const QString& path);

// Strict descendant test on already-resolved paths, bounded by a separator.
bool isStrictDescendant(const QString& candidate, const QString& ancestor);

} // namespace RecursiveGuard
