#include "vault_meta_store.h"
#include "asset_catalog.h"
#include <QSqlQuery>
#include <QSqlError>
#include <QVariant>
#include <QDebug>

VaultMetaStore::VaultMetaStore(VaultConnection& conn) : m_conn(conn) {}

bool VaultMetaStore::set(const QString& key, const QString& value, StoreError* error)
{
    QSqlDatabase db = m_conn.database(error);
    if (!db.isOpen()) return false;

    QSqlQuery q(db);
    q.prepare(QStringLiteral("INSERT INTO vault_meta(key, value, last_updated) VALUES(?,?,?) "
                             "ON CONFLICT(key) DO UPDATE SET value=excluded.value, last_updated=excluded.last_updated"));
    q.addBindValue(key);
    q.addBindValue(value);
    q.addBindValue(m_conn.now());
    if (!q.exec()) {
        qWarning() << "VaultMetaStore::set: upsert failed for key" << key << q.lastError();
        return setStoreError(error, StoreError::fromSqlError(q.lastError(), "VaultMetaStore::set"));
    }
    return true;
}

QString VaultMetaStore::get(const QString& key, StoreError* error) const
{
    QSqlDatabase db = m_conn.database(error);
    if (!db.isOpen()) return QString();

    QSqlQuery q(db);
    q.prepare(QStringLiteral("SELECT value FROM vault_meta WHERE key=?"));
    q.addBindValue(key);
    if (!q.exec()) {
        qWarning() << "VaultMetaStore::get: SELECT failed for key" << key << q.lastError();
        setStoreError(error, StoreError::fromSqlError(q.lastError(), "VaultMetaStore::get"));
        return QString();
    }
    if (!q.next()) {
        setStoreError(error, StoreError::NotFound, QStringLiteral("no vault setting %1").arg(key));
        return QString();
    }
    // Stored empty strings come back as empty, not null.
    const QString value = q.value(0).toString();
    return value.isNull() ? QString(QLatin1String("")) : value;
}

VaultInfo VaultMetaStore::vaultInfo(StoreError* error) const
{
    VaultInfo info;
    StoreError local;
    info.vaultId = vaultId(&local);
    if (!local.isError()) info.createdAt = createdAt(&local);
    if (!local.isError()) info.schemaVersion = schemaVersion(&local);
    if (local.isError()) {
        qWarning() << "VaultMetaStore::vaultInfo:" << local.message;
        setStoreError(error, local);
        return VaultInfo();
    }

    AssetCatalog catalog(m_conn);
    info.totalActiveAssets = catalog.countActive(&local);
    if (local.isError()) {
        setStoreError(error, local);
        return VaultInfo();
    }
    info.status = QStringLiteral("active");
    return info;
}
