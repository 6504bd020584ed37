#include "tag_store.h"
#include <QSqlQuery>
#include <QSqlError>
#include <QVariant>
#include <QDebug>

TagStore::TagStore(VaultConnection& conn) : m_conn(conn) {}

qint64 TagStore::addTag(qint64 assetId, const QString& name, const QString& kind, StoreError* error)
{
    QSqlDatabase db = m_conn.database(error);
    if (!db.isOpen()) return 0;

    QSqlQuery ins(db);
    ins.prepare(QStringLiteral("INSERT INTO tags(asset_id, name, kind, created_at) VALUES(?,?,?,?)"));
    ins.addBindValue(assetId);
    ins.addBindValue(name);
    ins.addBindValue(kind.isEmpty() ? QVariant(QMetaType::fromType<QString>()) : QVariant(kind));
    ins.addBindValue(m_conn.now());
    if (!ins.exec()) {
        qWarning() << "TagStore::addTag: INSERT failed for asset" << assetId << ins.lastError();
        setStoreError(error, StoreError::fromSqlError(ins.lastError(), "TagStore::addTag"));
        return 0;
    }
    return ins.lastInsertId().toLongLong();
}

QVector<TagRow> TagStore::listTags(qint64 assetId, StoreError* error) const
{
    QVector<TagRow> tags;
    QSqlDatabase db = m_conn.database(error);
    if (!db.isOpen()) return tags;

    QSqlQuery q(db);
    q.prepare(QStringLiteral("SELECT id, asset_id, name, COALESCE(kind,''), created_at FROM tags "
                             "WHERE asset_id=? ORDER BY created_at ASC, id ASC"));
    q.addBindValue(assetId);
    if (!q.exec()) {
        qWarning() << "TagStore::listTags: SELECT failed:" << q.lastError();
        setStoreError(error, StoreError::fromSqlError(q.lastError(), "TagStore::listTags"));
        return tags;
    }
    while (q.next()) {
        TagRow t;
        t.id = q.value(0).toLongLong();
        t.assetId = q.value(1).toLongLong();
        t.name = q.value(2).toString();
        t.kind = q.value(3).toString();
        t.createdAt = q.value(4).toString();
        tags.append(t);
    }
    return tags;
}

qint64 TagStore::addAnnotation(qint64 assetId, const QString& note, StoreError* error)
{
    QSqlDatabase db = m_conn.database(error);
    if (!db.isOpen()) return 0;

    QSqlQuery ins(db);
    ins.prepare(QStringLiteral("INSERT INTO annotations(asset_id, note, created_at) VALUES(?,?,?)"));
    ins.addBindValue(assetId);
    ins.addBindValue(note);
    ins.addBindValue(m_conn.now());
    if (!ins.exec()) {
        qWarning() << "TagStore::addAnnotation: INSERT failed for asset" << assetId << ins.lastError();
        setStoreError(error, StoreError::fromSqlError(ins.lastError(), "TagStore::addAnnotation"));
        return 0;
    }
    return ins.lastInsertId().toLongLong();
}

QVector<AnnotationRow> TagStore::listAnnotations(qint64 assetId, StoreError* error) const
{
    QVector<AnnotationRow> rows;
    QSqlDatabase db = m_conn.database(error);
    if (!db.isOpen()) return rows;

    QSqlQuery q(db);
    q.prepare(QStringLiteral("SELECT id, asset_id, note, created_at FROM annotations "
                             "WHERE asset_id=? ORDER BY created_at ASC, id ASC"));
    q.addBindValue(assetId);
    if (!q.exec()) {
        qWarning() << "TagStore::listAnnotations: SELECT failed:" << q.lastError();
        setStoreError(error, StoreError::fromSqlError(q.lastError(), "TagStore::listAnnotations"));
        return rows;
    }
    while (q.next()) {
        AnnotationRow a;
        a.id = q.value(0).toLongLong();
        a.assetId = q.value(1).toLongLong();
        a.note = q.value(2).toString();
        a.createdAt = q.value(3).toString();
        rows.append(a);
    }
    return rows;
}

QVector<qint64> TagStore::assetsWithTags(const QStringList& names, Match match, StoreError* error) const
{
    QVector<qint64> ids;
    QStringList wanted = names;
    wanted.removeDuplicates();
    wanted.removeAll(QString());
    if (wanted.isEmpty()) return ids;

    QSqlDatabase db = m_conn.database(error);
    if (!db.isOpen()) return ids;

    QString placeholders = QStringLiteral("?");
    for (int i = 1; i < wanted.size(); ++i) placeholders += QStringLiteral(",?");

    // Duplicate tag rows must not count twice towards "all".
    QString sql = QStringLiteral(
        "SELECT i.id FROM images i JOIN tags t ON t.asset_id=i.id "
        "WHERE i.deleted=0 AND t.name IN (%1) "
        "GROUP BY i.id ").arg(placeholders);
    if (match == Match::All) sql += QStringLiteral("HAVING COUNT(DISTINCT t.name)=? ");
    sql += QStringLiteral("ORDER BY i.created_at DESC, i.id DESC");

    QSqlQuery q(db);
    q.prepare(sql);
    for (const QString& n : wanted) q.addBindValue(n);
    if (match == Match::All) q.addBindValue(wanted.size());
    if (!q.exec()) {
        qWarning() << "TagStore::assetsWithTags: SELECT failed:" << q.lastError();
        setStoreError(error, StoreError::fromSqlError(q.lastError(), "TagStore::assetsWithTags"));
        return ids;
    }
    while (q.next()) ids.append(q.value(0).toLongLong());
    return ids;
}
