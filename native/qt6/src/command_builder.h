#pragma once

#include <QString>
#include <QStringList>

#include "copy_configuration.h"

class ToolProfile;

// Fully assembled invocation of the external tool.
struct ToolCommand {
    QString program;     // absolute path; empty when the tool could not be found
    QString toolName;    // "rsync", "robocopy"
    QStringList arguments;
    QStringList warnings; // options that were dropped or are destructive

    bool isResolved() const { return !program.isEmpty(); }
    QString displayString() const;
};

class CommandBuilder {
public:
    explicit CommandBuilder(const ToolProfile& profile);

    // Use this executable instead of searching for the tool.
    void setProgramOverride(const QString& path) { m_programOverride = path; }

    ToolCommand build(const EffectivePaths& paths, const CopyConfiguration& config) const;

    // Fixed locations first, then PATH. Empty when nothing is found.
    QString locateProgram() const;

private:
    const ToolProfile& m_profile;
    QString m_programOverride;
};
