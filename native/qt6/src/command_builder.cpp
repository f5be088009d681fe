#include "command_builder.h"
#include "file_utils.h"
#include "tool_profile.h"

#include <QDebug>
#include <QFileInfo>
#include <QStandardPaths>

static QString quoteIfNeeded(const QString& arg)
{
    if (!arg.contains(QLatin1Char(' ')) && !arg.contains(QLatin1Char('"'))) return arg;
    QString s = arg; s.replace('"', "\\\"");
    return '"' + s + '"';
}

QString ToolCommand::displayString() const
{
    QStringList parts;
    parts << (toolName.isEmpty() ? QFileInfo(program).fileName() : toolName);
    for (const QString& a : arguments) parts << quoteIfNeeded(a);
    return parts.join(' ');
}

CommandBuilder::CommandBuilder(const ToolProfile& profile) : m_profile(profile) {}

QString CommandBuilder::locateProgram() const
{
    if (!m_programOverride.isEmpty()) {
        if (FileUtils::isExecutableFile(m_programOverride)) return QFileInfo(m_programOverride).absoluteFilePath();
        qWarning() << "[CommandBuilder] Tool override is not executable:" << m_programOverride;
        return QString();
    }

    for (const QString& candidate : m_profile.fallbackLocations()) {
        if (FileUtils::isExecutableFile(candidate)) {
            qDebug() << "[CommandBuilder] Using" << candidate;
            return candidate;
        }
    }
    return QStandardPaths::findExecutable(m_profile.programName());
}

ToolCommand CommandBuilder::build(const EffectivePaths& paths, const CopyConfiguration& config) const
{
    ToolCommand cmd;
    cmd.toolName = m_profile.programName();
    cmd.program = locateProgram();

    const QStringList flags = m_profile.optionFlags(config, &cmd.warnings);
    const QString src = m_profile.sourceArgument(paths.source);
    const QString dst = m_profile.destinationArgument(paths.destination);

    if (m_profile.pathsBeforeOptions()) cmd.arguments << src << dst << flags;
    else cmd.arguments << flags << src << dst;
    return cmd;
}
