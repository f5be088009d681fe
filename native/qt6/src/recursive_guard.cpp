#include "recursive_guard.h"

#include <QDir>
#include <QFileInfo>
#include <QStringList>

namespace RecursiveGuard {

static Qt::CaseSensitivity pathCaseSensitivity()
{
#if defined(Q_OS_WIN) || defined(Q_OS_MACOS)
    return Qt::CaseInsensitive;
#else
    return Qt::CaseSensitive;
#endif
}

QString resolve(const QString& path)
{
    if (path.trimmed().isEmpty()) return QString();

    const QString absolute = QDir::cleanPath(QFileInfo(path).absoluteFilePath());

    // Walk up to the deepest existing ancestor, canonicalize it, then re-append
    // the components that do not exist yet (a destination usually doesn't).
    QString existing = absolute;
    QStringList pending;
    while (!QFileInfo::exists(existing)) {
        const QFileInfo fi(existing);
        const QString parent = fi.path();
        if (parent == existing) break; // reached the root without finding anything
        pending.prepend(fi.fileName());
        existing = parent;
    }

    QString canonical = QFileInfo(existing).canonicalFilePath();
    if (canonical.isEmpty()) {
        // Present but not resolvable (permissions): unresolved, so safe.
        if (QFileInfo::exists(existing)) return QString();
        canonical = existing;
    }
    if (pending.isEmpty()) return canonical;
    return QDir::cleanPath(canonical + QLatin1Char('/') + pending.join(QLatin1Char('/')));
}

bool isStrictDescendant(const QString& candidate, const QString& ancestor)
{
    if (candidate.isEmpty() || ancestor.isEmpty()) return false;
    const Qt::CaseSensitivity cs = pathCaseSensitivity();
    if (candidate.compare(ancestor, cs) == 0) return false;

    QString prefix = ancestor;
    if (!prefix.endsWith(QLatin1Char('/'))) prefix += QLatin1Char('/');
    return candidate.startsWith(prefix, cs);
}

bool check(const QString& src, const QString& dst)
{
    const QString s = resolve(src);
    const QString d = resolve(dst);
    if (s.isEmpty() || d.isEmpty()) return false;
    return isStrictDescendant(d, s) || isStrictDescendant(s, d);
}

} // namespace RecursiveGuard
