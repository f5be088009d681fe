#include "progress_manager.h"
#include <QDebug>
#include <algorithm>
#include <cstdio>

ProgressManager::ProgressManager(bool showBar, QObject* parent)
    : QObject(parent)
    , m_showBar(showBar)
{
}

QString ProgressManager::renderBar(int percent, int width) {
    const int pct = std::clamp(percent, 0, 100);
    const int filled = pct * width / 100;
    return QString("[%1%2] %3%")
        .arg(QString(filled, QLatin1Char('#')))
        .arg(QString(width - filled, QLatin1Char('.')))
        .arg(pct, 3);
}

void ProgressManager::start(const QString& message) {
    m_isActive = true;
    m_message = message;
    m_percent = 0;
    qDebug() << "Progress started:" << message;
    redraw();
}

void ProgressManager::update(int percent) {
    if (!m_isActive) return;
    m_percent = std::clamp(percent, 0, 100);
    redraw();
}

void ProgressManager::log(const QString& line) {
    clearBar();
    fprintf(stdout, "%s\n", line.toLocal8Bit().constData());
    fflush(stdout);
    redraw();
}

void ProgressManager::finish(const RunOutcome& outcome) {
    if (outcome.isSuccess()) m_percent = 100;
    redraw();
    if (m_barVisible) {
        fprintf(stderr, "\n");
        fflush(stderr);
        m_barVisible = false;
    }
    qDebug() << "Progress finished:" << m_message << outcome.toString();
    m_isActive = false;
    m_message.clear();
}

void ProgressManager::redraw() {
    if (!m_showBar || !m_isActive) return;
    const QString text = renderBar(m_percent, BAR_WIDTH) + QLatin1Char(' ') + m_message;
    fprintf(stderr, "\r%s", text.toLocal8Bit().constData());
    fflush(stderr);
    m_barVisible = true;
}

void ProgressManager::clearBar() {
    if (!m_barVisible) return;
    // wipe the current line so the log text does not mix with the bar
    fprintf(stderr, "\r%s\r", QString(BAR_WIDTH + 8 + m_message.size(), QLatin1Char(' ')).toLocal8Bit().constData());
    fflush(stderr);
    m_barVisible = false;
}
