#pragma once

#include <QByteArray>
#include <QQueue>
#include <QString>

class ToolProfile;

struct ClassifiedLine {
    enum class Kind { Dropped, Progress, Log };
    Kind kind = Kind::Dropped;
    int percent = 0;  // Progress only, always 0..100
    QString text;     // Log only, trailing whitespace trimmed
};

/**
 * Splits the child's merged byte stream into lines. Both '\n' and '\r' end a
 * line: rsync redraws its progress line with bare carriage returns, robocopy
 * ends lines with "\r\n" (the empty line in between is dropped later as blank).
 * Lines stay raw bytes; the tool profile knows their encoding.
 */
class LineSplitter {
public:
    void append(const QByteArray& data);
    bool hasLine() const { return !m_ready.isEmpty(); }
    QByteArray takeLine() { return m_ready.dequeue(); }
    // End of stream: queue the unterminated remainder, if any.
    void finish();

private:
    QByteArray m_partial;
    QQueue<QByteArray> m_ready;
};

class OutputClassifier {
public:
    explicit OutputClassifier(const ToolProfile& profile);

    // Text of one raw output line, in the tool's output encoding.
    QString decode(const QByteArray& raw) const;
    ClassifiedLine classify(const QString& line) const;

    // rate ("10.00MB/s"), percent ("42%") and duration ("0:00:05") all present
    static bool looksLikeProgress(const QString& line);
    // Integer immediately before '%', rejected when outside 0..100.
    static bool parsePercent(const QString& line, int* percentOut);
    // robocopy separators ("-----", "=====") and its "ROBOCOPY :: ..." banner
    static bool isBannerLine(const QString& line);

private:
    const ToolProfile& m_profile;
};
