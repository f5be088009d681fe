#pragma once

#include <QMetaType>
#include <QString>

// Snapshot of the user's choices for one run. Never mutated once a run starts.
struct CopyConfiguration {
    QString sourcePath;
    QString destinationPath;
    bool move = false;           // remove source entries once transferred
    bool invert = false;         // swap source/destination for this run only
    bool ignoreExisting = false; // skip entries already present at the destination
    bool compress = false;       // in-flight compression (POSIX tool only)
    bool deleteExtraneous = false; // remove destination entries absent from the source
};

struct EffectivePaths {
    QString source;
    QString destination;
};

inline EffectivePaths effectivePaths(const CopyConfiguration& c)
{
    if (c.invert) return { c.destinationPath, c.sourcePath };
    return { c.sourcePath, c.destinationPath };
}

// Pre-flight validation. Returns false and fills errorOut on a ConfigurationError.
bool validateConfiguration(const CopyConfiguration& c, QString* errorOut);

Q_DECLARE_METATYPE(CopyConfiguration)
