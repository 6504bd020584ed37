#pragma once
#include <QString>
#include <QStringList>
#include <memory>

#include "store_error.h"
#include "vault_connection.h"

// Creates the vault directory tree and the on-disk schema. Safe to run on every launch.
class SchemaManager {
public:
    static constexpr const char* kSchemaVersion = "1";

    // Ensures the layout, opens the database, applies the schema and seeds the
    // reserved VaultMeta keys on first run. Returns nullptr on failure; the
    // caller must treat that as fatal.
    static std::unique_ptr<VaultConnection> initialize(const QString& vaultRoot, StoreError* error = nullptr);

    // Names of the secondary indexes the schema defines.
    static QStringList expectedIndexes();
    static QStringList tableNames();

private:
    static bool ensureLayout(const QString& vaultRoot, StoreError* error);
    static bool applySchema(VaultConnection& conn, StoreError* error);
    static bool migrate(VaultConnection& conn, StoreError* error);
    static bool seedVaultMeta(VaultConnection& conn, StoreError* error);
};
