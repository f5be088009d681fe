#include "log_manager.h"
#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFileInfo>
#include <QMutexLocker>
#include <QStandardPaths>
#include <QThread>
#include <cstdio>
#include <cstdlib>

LogManager::LogManager(QObject* parent) : QObject(parent) {
    m_flushTimer.setSingleShot(true);
    m_flushTimer.setInterval(FLUSH_INTERVAL_MS);
    connect(&m_flushTimer, &QTimer::timeout, this, &LogManager::flushPending);
}

LogManager::~LogManager() {
    QMutexLocker locker(&m_mutex);
    if (m_ts.device()) {
        m_ts << "--- session end ---\n";
        m_ts.flush();
    }
}

bool LogManager::openLogFile(const QString& path) {
    QMutexLocker locker(&m_mutex);
    if (m_file.isOpen()) {
        m_ts.flush();
        m_ts.setDevice(nullptr);
        m_file.close();
    }
    QDir().mkpath(QFileInfo(path).absolutePath());
    m_file.setFileName(path);
    if (!m_file.open(QIODevice::Append | QIODevice::Text)) {
        return false;
    }
    m_ts.setDevice(&m_file);
    m_ts << "\n--- session start " << QDateTime::currentDateTime().toString(Qt::ISODate) << " ---\n";
    m_ts.flush();
    return true;
}

QStringList LogManager::logs() const {
    QMutexLocker locker(&m_mutex);
    return m_logs;
}

QString LogManager::levelName(Level level) {
    switch (level) {
        case Level::Debug: return QStringLiteral("DEBUG");
        case Level::Info: return QStringLiteral("INFO");
        case Level::Warn: return QStringLiteral("WARN");
        case Level::Error: return QStringLiteral("ERROR");
        case Level::Fatal: return QStringLiteral("FATAL");
    }
    return QString();
}

void LogManager::addLog(const QString& message, Level level, const QDateTime& when) {
    const QString timestamp = (when.isValid() ? when : QDateTime::currentDateTime()).toString("hh:mm:ss.zzz");
    const QString entry = QString("[%1] [%2] %3").arg(timestamp, levelName(level), message);
    {
        QMutexLocker locker(&m_mutex);
        m_logs.append(entry);
        if (m_logs.size() > MAX_LOGS) {
            m_logs.removeFirst();
        }
        if (m_ts.device()) {
            m_ts << entry << '\n';
            m_pendingFlush = true;
        }
    } // unlock before emitting

    if (level >= m_consoleLevel) {
        fprintf(stderr, "%s\n", entry.toLocal8Bit().constData());
        fflush(stderr);
    }

    emit logAdded(entry);
    if (QThread::currentThread() == thread()) {
        scheduleFlush(level);
    } else {
        flushPending();
    }
}

void LogManager::flushPending() {
    QMutexLocker locker(&m_mutex);
    if (m_pendingFlush && m_ts.device()) {
        m_ts.flush();
    }
    m_pendingFlush = false;
}

void LogManager::scheduleFlush(Level level) {
    if (level >= Level::Warn) {
        m_flushTimer.stop();
        flushPending();
        return;
    }
    if (!m_flushTimer.isActive()) {
        m_flushTimer.start(FLUSH_INTERVAL_MS);
    }
}

void LogManager::clear() {
    QMutexLocker locker(&m_mutex);
    m_logs.clear();
}

QString defaultLogFilePath() {
    const QString dir = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    return QDir(dir).filePath("fastcopy.log");
}

void customMessageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg) {
    Q_UNUSED(context);
    LogManager::Level level = LogManager::Level::Info;
    switch (type) {
        case QtDebugMsg: level = LogManager::Level::Debug; break;
        case QtInfoMsg: level = LogManager::Level::Info; break;
        case QtWarningMsg: level = LogManager::Level::Warn; break;
        case QtCriticalMsg: level = LogManager::Level::Error; break;
        case QtFatalMsg: level = LogManager::Level::Fatal; break;
    }

    const QDateTime raised = QDateTime::currentDateTime();
    LogManager& manager = LogManager::instance();
    if (type == QtFatalMsg) {
        manager.addLog(msg, level, raised);
        abort();
    }

    if (QThread::currentThread() == manager.thread()) {
        manager.addLog(msg, level, raised);
        return;
    }
    // Worker threads hop to the manager's thread so the flush timer is only
    // ever touched there.
    QMetaObject::invokeMethod(&manager, [msg, level, raised]() {
        LogManager::instance().addLog(msg, level, raised);
    }, Qt::QueuedConnection);
}
