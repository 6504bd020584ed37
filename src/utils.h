#pragma once
#include <QDateTime>
#include <QString>
#include <QUuid>

namespace Utils {

// ISO-8601 UTC with millisecond precision, e.g. "2026-10-19T08:15:00.125Z".
// Fixed width, so lexicographic order matches chronological order.
inline QString toIsoUtc(const QDateTime& dt)
{
    return dt.toUTC().toString(Qt::ISODateWithMs);
}

// Inverse of toIsoUtc; returns an invalid QDateTime for malformed input.
inline QDateTime fromIsoUtc(const QString& text)
{
    QDateTime dt = QDateTime::fromString(text, Qt::ISODateWithMs);
    if (!dt.isValid()) dt = QDateTime::fromString(text, Qt::ISODate);
    return dt.isValid() ? dt.toUTC() : dt;
}

// 32 lowercase hex characters.
inline QString generateVaultId()
{
    return QUuid::createUuid().toString(QUuid::Id128);
}

} // namespace Utils
