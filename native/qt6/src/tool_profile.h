#pragma once

#include <QByteArray>
#include <QString>
#include <QStringList>
#include <memory>

struct CopyConfiguration;

enum class ToolPlatform { PosixSync, WindowsCopy };

/**
 * @brief Capabilities of the external copy tool used for a run.
 *
 * A run selects exactly one profile up front; command construction, output
 * classification, exit-code interpretation and post-move cleanup all ask the
 * profile instead of testing the platform themselves.
 */
class ToolProfile {
public:
    virtual ~ToolProfile() = default;

    static std::unique_ptr<ToolProfile> create(ToolPlatform platform);
    static ToolPlatform hostPlatform();

    virtual ToolPlatform platform() const = 0;

    // Executable base name, looked up on PATH.
    virtual QString programName() const = 0;
    // Fixed install locations probed before the PATH lookup.
    virtual QStringList fallbackLocations() const = 0;

    // Tool-specific option flags for the given configuration. Options the tool
    // cannot honour are reported through warnings rather than failing.
    virtual QStringList optionFlags(const CopyConfiguration& config, QStringList* warnings) const = 0;

    // Source argument as the tool expects it.
    virtual QString sourceArgument(const QString& source) const = 0;
    virtual QString destinationArgument(const QString& destination) const = 0;
    // robocopy wants "SRC DST [options]", rsync "[options] SRC DST".
    virtual bool pathsBeforeOptions() const = 0;

    virtual bool isSuccessExitCode(int exitCode) const = 0;

    // One line of the tool's output as text.
    virtual QString decodeOutput(const QByteArray& raw) const = 0;

    // Whether the tool prints an overall completion percentage.
    virtual bool reportsOverallProgress() const = 0;
    // Whether the tool prints banner/separator lines that should not reach the log.
    virtual bool printsBannerLines() const = 0;
    // Whether a successful move leaves emptied directories behind in the source tree.
    virtual bool leavesEmptySourceDirsOnMove() const = 0;
};

class PosixSyncTool : public ToolProfile {
public:
    ToolPlatform platform() const override { return ToolPlatform::PosixSync; }
    QString programName() const override { return QStringLiteral("rsync"); }
    QStringList fallbackLocations() const override;
    QStringList optionFlags(const CopyConfiguration& config, QStringList* warnings) const override;
    QString sourceArgument(const QString& source) const override;
    QString destinationArgument(const QString& destination) const override;
    bool pathsBeforeOptions() const override { return false; }
    bool isSuccessExitCode(int exitCode) const override { return exitCode == 0; }
    QString decodeOutput(const QByteArray& raw) const override { return QString::fromUtf8(raw); }
    bool reportsOverallProgress() const override { return true; }
    bool printsBannerLines() const override { return false; }
    bool leavesEmptySourceDirsOnMove() const override { return false; }
};

class WindowsCopyTool : public ToolProfile {
public:
    ToolPlatform platform() const override { return ToolPlatform::WindowsCopy; }
    QString programName() const override { return QStringLiteral("robocopy"); }
    QStringList fallbackLocations() const override { return {}; }
    QStringList optionFlags(const CopyConfiguration& config, QStringList* warnings) const override;
    QString sourceArgument(const QString& source) const override;
    QString destinationArgument(const QString& destination) const override;
    bool pathsBeforeOptions() const override { return true; }
    // robocopy exit codes are a bitmask; 8 and above signal at least one failure
    bool isSuccessExitCode(int exitCode) const override { return exitCode >= 0 && exitCode <= 7; }
    // robocopy writes to a pipe in the OEM (console) code page, not the ANSI one
    QString decodeOutput(const QByteArray& raw) const override;
    bool reportsOverallProgress() const override { return false; }
    bool printsBannerLines() const override { return true; }
    bool leavesEmptySourceDirsOnMove() const override { return true; }
};
