#pragma once
#include <QString>

#include "store_error.h"
#include "vault_connection.h"
#include "vault_types.h"

// Open string-keyed settings table. Any key may be overwritten here, reserved
// keys included; only SchemaManager refrains from touching them after seeding.
class VaultMetaStore {
public:
    explicit VaultMetaStore(VaultConnection& conn);

    bool set(const QString& key, const QString& value, StoreError* error = nullptr);
    // Null QString when the key is absent.
    QString get(const QString& key, StoreError* error = nullptr) const;

    // Typed access to the reserved keys
    QString vaultId(StoreError* error = nullptr) const { return get(QStringLiteral("vault_id"), error); }
    QString createdAt(StoreError* error = nullptr) const { return get(QStringLiteral("created_at"), error); }
    QString schemaVersion(StoreError* error = nullptr) const { return get(QStringLiteral("schema_version"), error); }

    VaultInfo vaultInfo(StoreError* error = nullptr) const;

private:
    VaultConnection& m_conn;
};
