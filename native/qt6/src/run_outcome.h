#pragma once

#include <QMetaType>
#include <QString>

// Terminal result of a run. Computed once and delivered exactly once.
struct RunOutcome {
    enum class Kind { Success, Canceled, Failed };

    Kind kind = Kind::Failed;
    int exitCode = -1; // meaningful for Failed only

    static RunOutcome success() { return { Kind::Success, 0 }; }
    static RunOutcome canceled() { return { Kind::Canceled, 0 }; }
    static RunOutcome failed(int code) { return { Kind::Failed, code }; }

    bool isSuccess() const { return kind == Kind::Success; }
    bool isCanceled() const { return kind == Kind::Canceled; }
    bool isFailed() const { return kind == Kind::Failed; }

    QString toString() const
    {
        switch (kind) {
            case Kind::Success: return QStringLiteral("Success");
            case Kind::Canceled: return QStringLiteral("Canceled");
            case Kind::Failed: return QStringLiteral("Failed(%1)").arg(exitCode);
        }
        return QString();
    }

    bool operator==(const RunOutcome& o) const { return kind == o.kind && (kind != Kind::Failed || exitCode == o.exitCode); }
    bool operator!=(const RunOutcome& o) const { return !(*this == o); }
};

Q_DECLARE_METATYPE(RunOutcome)
