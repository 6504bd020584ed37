#include "asset_catalog.h"
#include <QSqlQuery>
#include <QSqlError>
#include <QVariant>
#include <QDebug>

namespace {

const char* const kAssetColumns =
    "id, content_hash, encrypted_name, storage_path, created_at, updated_at, size_bytes, deleted";

QString selectSql(const char* tail)
{
    return QStringLiteral("SELECT %1 FROM images %2").arg(QLatin1String(kAssetColumns), QLatin1String(tail));
}

} // namespace

AssetCatalog::AssetCatalog(VaultConnection& conn) : m_conn(conn) {}

AssetRow AssetCatalog::rowFromQuery(const QSqlQuery& q)
{
    AssetRow r;
    r.id = q.value(0).toLongLong();
    r.contentHash = q.value(1).toString();
    r.encryptedName = q.value(2).toString();
    r.storagePath = q.value(3).toString();
    r.createdAt = q.value(4).toString();
    r.updatedAt = q.value(5).toString();
    r.sizeBytes = q.value(6).toLongLong();
    r.deleted = q.value(7).toInt() != 0;
    return r;
}

qint64 AssetCatalog::insert(const QString& contentHash, const QString& encryptedName,
                            const QString& storagePath, qint64 sizeBytes, StoreError* error)
{
    QSqlDatabase db = m_conn.database(error);
    if (!db.isOpen()) return 0;

    const QString now = m_conn.now();
    QSqlQuery ins(db);
    ins.prepare(QStringLiteral("INSERT INTO images(content_hash, encrypted_name, storage_path, created_at, updated_at, size_bytes, deleted) "
                               "VALUES(?,?,?,?,?,?,0)"));
    ins.addBindValue(contentHash);
    ins.addBindValue(encryptedName);
    ins.addBindValue(storagePath);
    ins.addBindValue(now);
    ins.addBindValue(now);
    ins.addBindValue(sizeBytes);
    if (!ins.exec()) {
        StoreError err = StoreError::fromSqlError(ins.lastError(), "AssetCatalog::insert");
        if (err.kind == StoreError::UniqueConstraintViolation) {
            err.message = QStringLiteral("asset already exists: %1").arg(contentHash);
            qInfo() << "AssetCatalog::insert: duplicate content hash" << contentHash;
        } else {
            qWarning() << "AssetCatalog::insert: INSERT failed:" << ins.lastError();
        }
        setStoreError(error, err);
        return 0;
    }
    const qint64 newId = ins.lastInsertId().toLongLong();
    qDebug() << "AssetCatalog::insert: created asset, id=" << newId << "path=" << storagePath;
    return newId;
}

QVector<AssetRow> AssetCatalog::selectActive(const QString& sql, const QVariantList& binds, StoreError* error) const
{
    QVector<AssetRow> rows;
    QSqlDatabase db = m_conn.database(error);
    if (!db.isOpen()) return rows;

    QSqlQuery q(db);
    q.prepare(sql);
    for (const QVariant& v : binds) q.addBindValue(v);
    if (!q.exec()) {
        qWarning() << "AssetCatalog: SELECT failed:" << q.lastError();
        setStoreError(error, StoreError::fromSqlError(q.lastError(), "AssetCatalog"));
        return rows;
    }
    while (q.next()) rows.append(rowFromQuery(q));
    return rows;
}

QVector<AssetRow> AssetCatalog::listActive(StoreError* error) const
{
    // id breaks ties between rows created within the same millisecond.
    return selectActive(selectSql("WHERE deleted=0 ORDER BY created_at DESC, id DESC"), {}, error);
}

QVector<AssetRow> AssetCatalog::listActive(int limit, int offset, StoreError* error) const
{
    return selectActive(selectSql("WHERE deleted=0 ORDER BY created_at DESC, id DESC LIMIT ? OFFSET ?"),
                        { limit < 0 ? -1 : limit, qMax(0, offset) }, error);
}

qint64 AssetCatalog::countActive(StoreError* error) const
{
    QSqlDatabase db = m_conn.database(error);
    if (!db.isOpen()) return 0;
    QSqlQuery q(db);
    if (!q.exec(QStringLiteral("SELECT COUNT(*) FROM images WHERE deleted=0")) || !q.next()) {
        qWarning() << "AssetCatalog::countActive failed:" << q.lastError();
        setStoreError(error, StoreError::fromSqlError(q.lastError(), "AssetCatalog::countActive"));
        return 0;
    }
    return q.value(0).toLongLong();
}

AssetRow AssetCatalog::getById(qint64 id, StoreError* error) const
{
    StoreError local;
    const QVector<AssetRow> rows = selectActive(selectSql("WHERE id=? AND deleted=0"), { id }, &local);
    if (local.isError()) {
        setStoreError(error, local);
        return AssetRow();
    }
    if (rows.isEmpty()) {
        setStoreError(error, StoreError::NotFound, QStringLiteral("no asset with id %1").arg(id));
        return AssetRow();
    }
    return rows.first();
}

AssetRow AssetCatalog::getByHash(const QString& contentHash, StoreError* error) const
{
    StoreError local;
    const QVector<AssetRow> rows = selectActive(selectSql("WHERE content_hash=? AND deleted=0"), { contentHash }, &local);
    if (local.isError()) {
        setStoreError(error, local);
        return AssetRow();
    }
    if (rows.isEmpty()) {
        setStoreError(error, StoreError::NotFound, QStringLiteral("no asset with hash %1").arg(contentHash));
        return AssetRow();
    }
    return rows.first();
}

bool AssetCatalog::softDelete(qint64 id, StoreError* error)
{
    QSqlDatabase db = m_conn.database(error);
    if (!db.isOpen()) return false;

    QSqlQuery q(db);
    q.prepare(QStringLiteral("UPDATE images SET deleted=1, updated_at=? WHERE id=? AND deleted=0"));
    q.addBindValue(m_conn.now());
    q.addBindValue(id);
    if (!q.exec()) {
        qWarning() << "AssetCatalog::softDelete: UPDATE failed:" << q.lastError();
        return setStoreError(error, StoreError::fromSqlError(q.lastError(), "AssetCatalog::softDelete"));
    }
    if (q.numRowsAffected() == 0) {
        qDebug() << "AssetCatalog::softDelete: nothing to delete for id" << id;
    } else {
        qDebug() << "AssetCatalog::softDelete: deleted asset" << id;
    }
    return true;
}
