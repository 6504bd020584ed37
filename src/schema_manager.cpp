#include "schema_manager.h"
#include "vault_paths.h"
#include "utils.h"
#include <QDir>
#include <QPair>
#include <QDebug>

namespace {

const char* const kTables[] = { "images", "tags", "annotations", "vault_meta", "auth_logs" };

const char* const kIndexes[] = {
    "CREATE INDEX IF NOT EXISTS idx_images_content_hash ON images(content_hash);",
    "CREATE INDEX IF NOT EXISTS idx_images_created_at ON images(created_at);",
    "CREATE INDEX IF NOT EXISTS idx_images_updated_at ON images(updated_at);",
    "CREATE INDEX IF NOT EXISTS idx_images_storage_path ON images(storage_path);",
    "CREATE INDEX IF NOT EXISTS idx_tags_asset_id ON tags(asset_id);",
    "CREATE INDEX IF NOT EXISTS idx_tags_created_at ON tags(created_at);",
    "CREATE INDEX IF NOT EXISTS idx_annotations_asset_id ON annotations(asset_id);",
    "CREATE INDEX IF NOT EXISTS idx_auth_logs_timestamp ON auth_logs(timestamp);",
    "CREATE INDEX IF NOT EXISTS idx_auth_logs_event_type ON auth_logs(event_type);"
};

QString indexNameOf(const char* ddl)
{
    // "CREATE INDEX IF NOT EXISTS <name> ON ..."
    const QStringList parts = QString::fromLatin1(ddl).split(QLatin1Char(' '), Qt::SkipEmptyParts);
    return parts.size() > 5 ? parts.at(5) : QString();
}

} // namespace

QStringList SchemaManager::expectedIndexes()
{
    QStringList names;
    for (const char* ddl : kIndexes) names << indexNameOf(ddl);
    return names;
}

QStringList SchemaManager::tableNames()
{
    QStringList names;
    for (const char* t : kTables) names << QString::fromLatin1(t);
    return names;
}

std::unique_ptr<VaultConnection> SchemaManager::initialize(const QString& vaultRoot, StoreError* error)
{
    const QString root = QDir(vaultRoot).absolutePath();
    if (!ensureLayout(root, error)) return nullptr;

    auto conn = std::make_unique<VaultConnection>(root, VaultPaths::databaseFile(root));
    if (!conn->database(error).isOpen()) return nullptr;
    if (!applySchema(*conn, error)) return nullptr;

    qInfo() << "SchemaManager: vault ready at" << root;
    return conn;
}

bool SchemaManager::ensureLayout(const QString& vaultRoot, StoreError* error)
{
    for (const QString& dir : VaultPaths::layoutDirs(vaultRoot)) {
        if (VaultPaths::dirExists(dir)) continue;
        if (!QDir().mkpath(dir)) {
            qWarning() << "SchemaManager: cannot create directory" << dir;
            return setStoreError(error, StoreError::IOError,
                                 QStringLiteral("cannot create vault directory: %1").arg(dir));
        }
    }
    return true;
}

bool SchemaManager::migrate(VaultConnection& conn, StoreError* error)
{
    const char* ddl[] = {
        // Assets. content_hash stays unique across soft-deleted rows too, so
        // re-ingesting identical content is detected after a delete.
        "CREATE TABLE IF NOT EXISTS images (\n"
        "  id INTEGER PRIMARY KEY AUTOINCREMENT,\n"
        "  content_hash TEXT NOT NULL UNIQUE,\n"
        "  encrypted_name TEXT NOT NULL,\n"
        "  storage_path TEXT NOT NULL,\n"
        "  created_at TEXT NOT NULL,\n"
        "  updated_at TEXT NOT NULL,\n"
        "  size_bytes INTEGER NOT NULL DEFAULT 0,\n"
        "  deleted INTEGER NOT NULL DEFAULT 0\n"
        ");",
        "CREATE TABLE IF NOT EXISTS tags (\n"
        "  id INTEGER PRIMARY KEY AUTOINCREMENT,\n"
        "  asset_id INTEGER NOT NULL REFERENCES images(id) ON DELETE CASCADE,\n"
        "  name TEXT NOT NULL,\n"
        "  kind TEXT NULL,\n"
        "  created_at TEXT NOT NULL\n"
        ");",
        "CREATE TABLE IF NOT EXISTS annotations (\n"
        "  id INTEGER PRIMARY KEY AUTOINCREMENT,\n"
        "  asset_id INTEGER NOT NULL REFERENCES images(id) ON DELETE CASCADE,\n"
        "  note TEXT NOT NULL,\n"
        "  created_at TEXT NOT NULL\n"
        ");",
        "CREATE TABLE IF NOT EXISTS vault_meta (\n"
        "  key TEXT PRIMARY KEY,\n"
        "  value TEXT NOT NULL,\n"
        "  last_updated TEXT NOT NULL\n"
        ");",
        "CREATE TABLE IF NOT EXISTS auth_logs (\n"
        "  id INTEGER PRIMARY KEY AUTOINCREMENT,\n"
        "  event_type TEXT NOT NULL,\n"
        "  timestamp TEXT NOT NULL,\n"
        "  status TEXT NOT NULL,\n"
        "  details TEXT NULL\n"
        ");",
        "CREATE TRIGGER IF NOT EXISTS trg_images_hash_immutable\n"
        "BEFORE UPDATE OF content_hash ON images\n"
        "WHEN NEW.content_hash IS NOT OLD.content_hash\n"
        "BEGIN SELECT RAISE(ABORT, 'content_hash is immutable'); END;",
        "CREATE TRIGGER IF NOT EXISTS trg_auth_logs_no_update\n"
        "BEFORE UPDATE ON auth_logs\n"
        "BEGIN SELECT RAISE(ABORT, 'auth_logs is append-only'); END;",
        "CREATE TRIGGER IF NOT EXISTS trg_auth_logs_no_delete\n"
        "BEFORE DELETE ON auth_logs\n"
        "BEGIN SELECT RAISE(ABORT, 'auth_logs is append-only'); END;"
    };
    for (const char* sql : ddl) {
        if (!conn.exec(QString::fromLatin1(sql), error)) return false;
    }

    // Reads dominate: hash lookups for dedup, recency for listing, foreign keys for joins.
    for (const char* sql : kIndexes) {
        if (!conn.exec(QString::fromLatin1(sql), error)) return false;
    }
    return true;
}

bool SchemaManager::applySchema(VaultConnection& conn, StoreError* error)
{
    QSqlDatabase db = conn.database(error);
    if (!db.isOpen()) return false;

    // DDL and seeding share one IMMEDIATE transaction: the write lock is taken up
    // front, so two launches cannot both see "no schema_version" and seed
    // different vault ids, and a half-applied schema never becomes visible.
    QSqlQuery q(db);
    if (!q.exec(QStringLiteral("BEGIN IMMEDIATE"))) {
        qWarning() << "SchemaManager: BEGIN failed:" << q.lastError();
        return setStoreError(error, StoreError::fromSqlError(q.lastError(), "apply schema"));
    }
    q.finish();

    if (!migrate(conn, error) || !seedVaultMeta(conn, error)) {
        QSqlQuery rb(db);
        if (!rb.exec(QStringLiteral("ROLLBACK"))) qWarning() << "SchemaManager: ROLLBACK failed:" << rb.lastError();
        return false;
    }

    QSqlQuery commit(db);
    if (!commit.exec(QStringLiteral("COMMIT"))) {
        qWarning() << "SchemaManager: COMMIT failed:" << commit.lastError();
        const StoreError se = StoreError::fromSqlError(commit.lastError(), "apply schema");
        QSqlQuery rb(db);
        if (!rb.exec(QStringLiteral("ROLLBACK"))) qWarning() << "SchemaManager: ROLLBACK failed:" << rb.lastError();
        return setStoreError(error, se);
    }
    return true;
}

bool SchemaManager::seedVaultMeta(VaultConnection& conn, StoreError* error)
{
    QSqlDatabase db = conn.database(error);
    if (!db.isOpen()) return false;

    QSqlQuery sel(db);
    if (!sel.exec(QStringLiteral("SELECT COUNT(*) FROM vault_meta WHERE key='schema_version'"))) {
        qWarning() << "SchemaManager: seeding check failed:" << sel.lastError();
        return setStoreError(error, StoreError::fromSqlError(sel.lastError(), "seed vault_meta"));
    }
    const bool seeded = sel.next() && sel.value(0).toInt() > 0;
    sel.finish();
    if (seeded) return true;

    const QString now = conn.now();
    const QString vaultId = Utils::generateVaultId();
    const QPair<QString, QString> items[] = {
        { QStringLiteral("schema_version"), QString::fromLatin1(kSchemaVersion) },
        { QStringLiteral("vault_id"), vaultId },
        { QStringLiteral("created_at"), now }
    };
    QSqlQuery ins(db);
    ins.prepare(QStringLiteral("INSERT OR IGNORE INTO vault_meta(key, value, last_updated) VALUES(?,?,?)"));
    for (const auto& item : items) {
        ins.addBindValue(item.first);
        ins.addBindValue(item.second);
        ins.addBindValue(now);
        if (!ins.exec()) {
            qWarning() << "SchemaManager: seeding failed:" << ins.lastError();
            return setStoreError(error, StoreError::fromSqlError(ins.lastError(), "seed vault_meta"));
        }
    }
    qInfo() << "SchemaManager: seeded new vault" << vaultId;
    return true;
}
