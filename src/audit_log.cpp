#include "audit_log.h"
#include "utils.h"
#include <QSqlQuery>
#include <QSqlError>
#include <QVariant>
#include <QDebug>

AuditLog::AuditLog(VaultConnection& conn) : m_conn(conn) {}

bool AuditLog::record(const QString& eventType, const QString& status, const QString& details, StoreError* error)
{
    QSqlDatabase db = m_conn.database(error);
    if (!db.isOpen()) {
        qWarning() << "AuditLog::record: store unavailable, dropped event" << eventType;
        return false;
    }

    QSqlQuery q(db);
    q.prepare(QStringLiteral("INSERT INTO auth_logs(event_type, timestamp, status, details) VALUES(?,?,?,?)"));
    q.addBindValue(eventType);
    q.addBindValue(m_conn.now());
    q.addBindValue(status);
    q.addBindValue(details.isEmpty() ? QVariant(QMetaType::fromType<QString>()) : QVariant(details));
    if (!q.exec()) {
        qWarning() << "AuditLog::record: could not record" << eventType << status << q.lastError();
        return setStoreError(error, StoreError::fromSqlError(q.lastError(), "AuditLog::record"));
    }
    return true;
}

QVector<AuditEventRow> AuditLog::recentEvents(int hours, const QString& eventType, StoreError* error) const
{
    QVector<AuditEventRow> events;
    QSqlDatabase db = m_conn.database(error);
    if (!db.isOpen()) return events;

    // Timestamps are fixed-width UTC strings, so a string comparison is a time comparison.
    const QDateTime nowUtc = Utils::fromIsoUtc(m_conn.now());
    const QString cutoff = Utils::toIsoUtc(nowUtc.addSecs(-qint64(qMax(0, hours)) * 3600));

    QString sql = QStringLiteral("SELECT id, event_type, timestamp, status, COALESCE(details,'') FROM auth_logs "
                                 "WHERE timestamp >= ? ");
    if (!eventType.isEmpty()) sql += QStringLiteral("AND event_type = ? ");
    sql += QStringLiteral("ORDER BY timestamp DESC, id DESC");

    QSqlQuery q(db);
    q.prepare(sql);
    q.addBindValue(cutoff);
    if (!eventType.isEmpty()) q.addBindValue(eventType);
    if (!q.exec()) {
        qWarning() << "AuditLog::recentEvents: SELECT failed:" << q.lastError();
        setStoreError(error, StoreError::fromSqlError(q.lastError(), "AuditLog::recentEvents"));
        return events;
    }
    while (q.next()) {
        AuditEventRow e;
        e.id = q.value(0).toLongLong();
        e.eventType = q.value(1).toString();
        e.timestamp = q.value(2).toString();
        e.status = q.value(3).toString();
        e.details = q.value(4).toString();
        events.append(e);
    }
    return events;
}
