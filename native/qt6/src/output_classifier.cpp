#include "output_classifier.h"
#include "tool_profile.h"

#include <QRegularExpression>

void LineSplitter::append(const QByteArray& data)
{
    for (char ch : data) {
        if (ch == '\n' || ch == '\r') {
            m_ready.enqueue(m_partial);
            m_partial.clear();
        } else {
            m_partial.append(ch);
        }
    }
}

void LineSplitter::finish()
{
    if (m_partial.isEmpty()) return;
    m_ready.enqueue(m_partial);
    m_partial.clear();
}

OutputClassifier::OutputClassifier(const ToolProfile& profile) : m_profile(profile) {}

QString OutputClassifier::decode(const QByteArray& raw) const
{
    return m_profile.decodeOutput(raw);
}

static QString trimmedRight(const QString& s)
{
    int end = s.size();
    while (end > 0 && s.at(end - 1).isSpace()) --end;
    return s.left(end);
}

ClassifiedLine OutputClassifier::classify(const QString& line) const
{
    ClassifiedLine out;
    if (line.trimmed().isEmpty()) return out;

    if (m_profile.reportsOverallProgress() && looksLikeProgress(line)) {
        int pct = 0;
        if (parsePercent(line, &pct)) {
            out.kind = ClassifiedLine::Kind::Progress;
            out.percent = pct;
        }
        // progress-shaped but unreadable: never logged
        return out;
    }

    if (m_profile.printsBannerLines() && isBannerLine(line)) return out;

    out.kind = ClassifiedLine::Kind::Log;
    out.text = trimmedRight(line);
    return out;
}

bool OutputClassifier::looksLikeProgress(const QString& line)
{
    static const QRegularExpression rxRate(QStringLiteral("\\d+(?:[.,]\\d+)?\\s?[kKMGTP]?i?B/s"));
    static const QRegularExpression rxDuration(QStringLiteral("\\b\\d+:\\d{2}:\\d{2}\\b"));
    return line.contains(QLatin1Char('%'))
        && rxRate.match(line).hasMatch()
        && rxDuration.match(line).hasMatch();
}

bool OutputClassifier::parsePercent(const QString& line, int* percentOut)
{
    static const QRegularExpression rxPercent(QStringLiteral("(\\d+)%"));
    const QRegularExpressionMatch m = rxPercent.match(line);
    if (!m.hasMatch()) return false;
    bool ok = false;
    const int pct = m.captured(1).toInt(&ok);
    if (!ok || pct < 0 || pct > 100) return false;
    if (percentOut) *percentOut = pct;
    return true;
}

bool OutputClassifier::isBannerLine(const QString& line)
{
    static const QRegularExpression rxSeparator(QStringLiteral("^\\s*(?:-+|=+)\\s*$"));
    static const QRegularExpression rxBanner(QStringLiteral("^\\s*ROBOCOPY\\s+::"), QRegularExpression::CaseInsensitiveOption);
    return rxSeparator.match(line).hasMatch() || rxBanner.match(line).hasMatch();
}
