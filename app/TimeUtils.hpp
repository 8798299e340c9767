// Small time helpers shared by the history store and the CLI.
#pragma once
#include <QDateTime>
#include <QString>
#include <QTime>

namespace sftpshareapp {

// On-disk and display format of history timestamps.
inline QString historyDateFormat() { return QStringLiteral("yyyy-MM-dd HH:mm"); }

// Local date-time with seconds and milliseconds dropped.
inline QDateTime truncatedToMinute(const QDateTime &dt) {
    if (!dt.isValid())
        return dt;
    const QTime t = dt.time();
    return QDateTime(dt.date(), QTime(t.hour(), t.minute()));
}

inline QString historyDate(const QDateTime &dt) {
    if (!dt.isValid())
        return QString();
    return dt.toString(historyDateFormat());
}

// Invalid QDateTime when the string does not match "YYYY-MM-DD HH:MM".
inline QDateTime parseHistoryDate(const QString &s) {
    return QDateTime::fromString(s.trimmed(), historyDateFormat());
}

} // namespace sftpshareapp
