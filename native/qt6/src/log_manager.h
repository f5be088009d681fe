#ifndef LOG_MANAGER_H
#define LOG_MANAGER_H

#include <QDateTime>
#include <QObject>
#include <QStringList>
#include <QMutex>
#include <QFile>
#include <QTextStream>
#include <QTimer>

/**
 * Application-wide diagnostic log. Installed as the Qt message handler by
 * the front end; the copy core only ever uses qDebug()/qInfo()/qWarning().
 */
class LogManager : public QObject {
    Q_OBJECT

public:
    enum class Level { Debug, Info, Warn, Error, Fatal };

    static LogManager& instance() {
        static LogManager inst;
        return inst;
    }

    ~LogManager() override;

    // Opens (appending) the persistent log. Returns false if it cannot be opened.
    bool openLogFile(const QString& path);
    QString logFilePath() const { return m_file.fileName(); }

    // Records at or above this level are echoed to stderr.
    void setConsoleLevel(Level level) { m_consoleLevel = level; }

    QStringList logs() const;

    // `when` defaults to now; the message handler passes the time the record was raised.
    void addLog(const QString& message, Level level = Level::Info, const QDateTime& when = QDateTime());
    void clear();

    static QString levelName(Level level);

signals:
    void logAdded(const QString& entry);

private:
    explicit LogManager(QObject* parent = nullptr);
    void flushPending();
    void scheduleFlush(Level level);

    QStringList m_logs;
    mutable QMutex m_mutex;
    QFile m_file;
    QTextStream m_ts;
    QTimer m_flushTimer;
    bool m_pendingFlush = false;
    Level m_consoleLevel = Level::Warn;
    static constexpr int MAX_LOGS = 1000;
    static constexpr int FLUSH_INTERVAL_MS = 250;
};

// Routes qDebug/qInfo/qWarning/qCritical/qFatal into LogManager.
void customMessageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg);

// Default location of the persistent log: <AppLocalDataLocation>/fastcopy.log
QString defaultLogFilePath();

#endif // LOG_MANAGER_H
