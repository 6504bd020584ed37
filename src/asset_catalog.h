#pragma once
#include <QString>
#include <QVariant>
#include <QVector>

#include "store_error.h"
#include "vault_connection.h"
#include "vault_types.h"

class QSqlQuery;

// Catalog of ingested files. Soft-deleted rows stay in the table but are
// invisible to every lookup here.
class AssetCatalog {
public:
    explicit AssetCatalog(VaultConnection& conn);

    // Returns the new id, or 0 on failure. A content hash that is already
    // catalogued (deleted or not) fails with UniqueConstraintViolation.
    qint64 insert(const QString& contentHash, const QString& encryptedName,
                  const QString& storagePath, qint64 sizeBytes, StoreError* error = nullptr);

    // Active assets, most recently created first.
    QVector<AssetRow> listActive(StoreError* error = nullptr) const;
    QVector<AssetRow> listActive(int limit, int offset, StoreError* error = nullptr) const;
    qint64 countActive(StoreError* error = nullptr) const;

    // Invalid row (and NotFound) for unknown or soft-deleted ids.
    AssetRow getById(qint64 id, StoreError* error = nullptr) const;
    AssetRow getByHash(const QString& contentHash, StoreError* error = nullptr) const;

    // Marks the asset deleted and bumps updated_at. Unknown or already deleted ids are not an error.
    bool softDelete(qint64 id, StoreError* error = nullptr);

private:
    QVector<AssetRow> selectActive(const QString& sql, const QVariantList& binds, StoreError* error) const;
    static AssetRow rowFromQuery(const QSqlQuery& q);

    VaultConnection& m_conn;
};
