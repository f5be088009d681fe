#ifndef PROGRESS_MANAGER_H
#define PROGRESS_MANAGER_H

#include <QObject>
#include <QString>

#include "run_outcome.h"

/**
 * Console presentation of a run: a single redrawn progress bar on stderr,
 * log lines on stdout. Connected to CopyRunner's signals by the front end.
 */
class ProgressManager : public QObject {
    Q_OBJECT

public:
    explicit ProgressManager(bool showBar, QObject* parent = nullptr);

    bool isActive() const { return m_isActive; }
    int percentage() const { return m_percent; }

    static QString renderBar(int percent, int width);

public slots:
    void start(const QString& message);
    void update(int percent);
    void log(const QString& line);
    void finish(const RunOutcome& outcome);

private:
    void redraw();
    void clearBar();

    bool m_showBar = true;
    bool m_isActive = false;
    bool m_barVisible = false;
    QString m_message;
    int m_percent = 0;
    static constexpr int BAR_WIDTH = 30;
};

#endif // PROGRESS_MANAGER_H
