#include "vault_maintenance.h"
#include "audit_log.h"
#include "schema_manager.h"
#include "vault_meta_store.h"
#include "vault_paths.h"
#include <QSqlQuery>
#include <QSqlError>
#include <QFile>
#include <QFileInfo>
#include <QStringList>
#include <QDir>
#include <QDebug>

namespace {

QString severityName(HealthCheckResult::Severity s)
{
    switch (s) {
    case HealthCheckResult::Info: return QStringLiteral("info");
    case HealthCheckResult::Warning: return QStringLiteral("warning");
    case HealthCheckResult::Critical: return QStringLiteral("critical");
    }
    return QString();
}

QString maintenanceKey(const QString& operation)
{
    return QStringLiteral("maintenance.last_%1").arg(operation);
}

} // namespace

QJsonObject HealthCheckResult::toJson() const
{
    QJsonObject o;
    o["category"] = category;
    o["message"] = message;
    o["severity"] = severityName(severity);
    if (!recommendation.isEmpty()) o["recommendation"] = recommendation;
    return o;
}

QJsonObject DatabaseStats::toJson() const
{
    QJsonObject o;
    o["total_size"] = totalSize;
    o["page_size"] = pageSize;
    o["page_count"] = pageCount;
    o["free_page_count"] = freePageCount;
    o["fragmentation_percent"] = fragmentationPercent;
    o["active_assets"] = activeAssets;
    o["deleted_assets"] = deletedAssets;
    o["tags"] = tagCount;
    o["annotations"] = annotationCount;
    o["settings"] = settingCount;
    o["audit_events"] = auditEventCount;
    o["last_vacuum"] = lastVacuum;
    o["last_backup"] = lastBackup;
    o["last_integrity_check"] = lastIntegrityCheck;
    return o;
}

VaultMaintenance::VaultMaintenance(VaultConnection& conn) : m_conn(conn) {}

qint64 VaultMaintenance::scalar(const QString& sql, StoreError* error)
{
    QSqlDatabase db = m_conn.database(error);
    if (!db.isOpen()) return -1;
    QSqlQuery q(db);
    if (!q.exec(sql) || !q.next()) {
        qWarning() << "VaultMaintenance:" << sql << "failed:" << q.lastError().text();
        setStoreError(error, StoreError::fromSqlError(q.lastError(), sql));
        return -1;
    }
    return q.value(0).toLongLong();
}

QVector<HealthCheckResult> VaultMaintenance::integrityCheck(StoreError* error)
{
    QVector<HealthCheckResult> results;
    QSqlDatabase db = m_conn.database(error);
    if (!db.isOpen()) return results;

    QSqlQuery q(db);
    if (!q.exec("PRAGMA integrity_check")) {
        setStoreError(error, StoreError::fromSqlError(q.lastError(), "integrity_check"));
        return results;
    }
    QStringList problems;
    while (q.next()) {
        const QString line = q.value(0).toString();
        if (line != "ok") problems << line;
    }
    if (problems.isEmpty()) {
        results.append(HealthCheckResult("Integrity", "Database integrity check passed", HealthCheckResult::Info));
    } else {
        results.append(HealthCheckResult(
            "Integrity",
            "Database integrity check failed: " + problems.join("; "),
            HealthCheckResult::Critical,
            "Restore the most recent file from backups/"
        ));
    }

    // Rows: table, rowid, parent, fkid
    if (!q.exec("PRAGMA foreign_key_check")) {
        setStoreError(error, StoreError::fromSqlError(q.lastError(), "foreign_key_check"));
        return results;
    }
    int orphans = 0;
    while (q.next()) ++orphans;
    if (orphans > 0) {
        results.append(HealthCheckResult(
            "Foreign Keys",
            QString("Found %1 tag/annotation row(s) referencing missing assets").arg(orphans),
            HealthCheckResult::Critical,
            "Restore the most recent file from backups/"
        ));
    } else {
        results.append(HealthCheckResult("Foreign Keys", "No dangling references found", HealthCheckResult::Info));
    }

    QStringList missing;
    for (const QString& indexName : SchemaManager::expectedIndexes()) {
        QSqlQuery iq(db);
        iq.prepare("SELECT name FROM sqlite_master WHERE type='index' AND name=?");
        iq.addBindValue(indexName);
        if (!iq.exec()) {
            setStoreError(error, StoreError::fromSqlError(iq.lastError(), "index check"));
            return results;
        }
        if (!iq.next()) missing << indexName;
    }
    if (!missing.isEmpty()) {
        results.append(HealthCheckResult(
            "Indexes",
            QString("%1 expected index(es) are missing: %2").arg(missing.size()).arg(missing.join(", ")),
            HealthCheckResult::Warning,
            "Restart the application to recreate missing indexes"
        ));
    } else {
        results.append(HealthCheckResult("Indexes", "All expected indexes are present", HealthCheckResult::Info));
    }

    saveMaintenanceTimestamp("integrity_check");
    return results;
}

bool VaultMaintenance::isHealthy(const QVector<HealthCheckResult>& results)
{
    for (const HealthCheckResult& r : results) {
        if (r.severity == HealthCheckResult::Critical) return false;
    }
    return !results.isEmpty();
}

DatabaseStats VaultMaintenance::databaseStats(StoreError* error)
{
    DatabaseStats stats;
    StoreError local;
    stats.totalSize = QFileInfo(m_conn.databasePath()).size();
    stats.pageSize = scalar("PRAGMA page_size", &local);
    stats.pageCount = scalar("PRAGMA page_count", &local);
    stats.freePageCount = scalar("PRAGMA freelist_count", &local);
    stats.activeAssets = scalar("SELECT COUNT(*) FROM images WHERE deleted=0", &local);
    stats.deletedAssets = scalar("SELECT COUNT(*) FROM images WHERE deleted=1", &local);
    stats.tagCount = scalar("SELECT COUNT(*) FROM tags", &local);
    stats.annotationCount = scalar("SELECT COUNT(*) FROM annotations", &local);
    stats.settingCount = scalar("SELECT COUNT(*) FROM vault_meta", &local);
    stats.auditEventCount = scalar("SELECT COUNT(*) FROM auth_logs", &local);
    if (local.isError()) {
        setStoreError(error, local);
        return DatabaseStats();
    }

    if (stats.pageCount > 0) {
        stats.fragmentationPercent = (stats.freePageCount * 100) / stats.pageCount;
    }

    // Absent keys simply leave the fields empty.
    VaultMetaStore meta(m_conn);
    stats.lastVacuum = meta.get(maintenanceKey("vacuum"));
    stats.lastBackup = meta.get(maintenanceKey("backup"));
    stats.lastIntegrityCheck = meta.get(maintenanceKey("integrity_check"));
    return stats;
}

bool VaultMaintenance::incrementalVacuum(int pages, StoreError* error)
{
    QSqlDatabase db = m_conn.database(error);
    if (!db.isOpen()) return false;

    qDebug() << "VaultMaintenance: Starting incremental vacuum...";
    QSqlQuery q(db);
    const QString sql = pages > 0 ? QString("PRAGMA incremental_vacuum(%1)").arg(pages)
                                  : QString("PRAGMA incremental_vacuum");
    if (!q.exec(sql)) {
        qWarning() << "VaultMaintenance: incremental vacuum failed:" << q.lastError().text();
        return setStoreError(error, StoreError::fromSqlError(q.lastError(), "incremental_vacuum"));
    }
    // Each step frees one page; drain the statement.
    while (q.next()) {}
    q.finish();

    saveMaintenanceTimestamp("vacuum");
    qDebug() << "VaultMaintenance: incremental vacuum completed";
    return true;
}

QString VaultMaintenance::backupDatabase(const QString& targetPath, StoreError* error)
{
    QString target = targetPath;
    if (target.isEmpty()) {
        const QString stamp = QDateTime::currentDateTimeUtc().toString("yyyyMMdd-HHmmss");
        target = QDir(VaultPaths::backupsDir(m_conn.vaultRoot())).filePath(QString("graphivault-%1.db").arg(stamp));
    }
    target = QFileInfo(target).absoluteFilePath();
    if (QFileInfo::exists(target)) {
        setStoreError(error, StoreError::IOError, QString("backup target already exists: %1").arg(target));
        return QString();
    }
    if (!QDir().mkpath(QFileInfo(target).absolutePath())) {
        setStoreError(error, StoreError::IOError, QString("cannot create backup directory for %1").arg(target));
        return QString();
    }

    QSqlDatabase db = m_conn.database(error);
    if (!db.isOpen()) return QString();

    QSqlQuery q(db);
    q.prepare("VACUUM INTO ?");
    q.addBindValue(target);
    if (!q.exec()) {
        qWarning() << "VaultMaintenance: backup failed:" << q.lastError().text();
        StoreError err = StoreError::fromSqlError(q.lastError(), "backup");
        if (err.kind == StoreError::StorageError) err.kind = StoreError::IOError;
        setStoreError(error, err);
        return QString();
    }

    saveMaintenanceTimestamp("backup");
    qInfo() << "VaultMaintenance: database backed up to" << target;
    return target;
}

int VaultMaintenance::purgeDeletedAssets(StoreError* error)
{
    QSqlDatabase db = m_conn.database(error);
    if (!db.isOpen()) return -1;

    QSqlQuery q(db);
    if (!q.exec("DELETE FROM images WHERE deleted=1")) {
        qWarning() << "VaultMaintenance: purge failed:" << q.lastError().text();
        setStoreError(error, StoreError::fromSqlError(q.lastError(), "purge"));
        if (!AuditLog(m_conn).record("assets_purged", "failure", q.lastError().text())) {
            qWarning() << "VaultMaintenance: failed purge was not audited";
        }
        return -1;
    }
    const int purged = q.numRowsAffected();
    qInfo() << "VaultMaintenance: purged" << purged << "soft-deleted asset(s)";

    if (!AuditLog(m_conn).record("assets_purged", "success", QString("%1 asset(s) removed").arg(purged))) {
        qWarning() << "VaultMaintenance: purge completed but was not audited";
    }
    return purged;
}

int VaultMaintenance::cleanupTemp(StoreError* error)
{
    const QString tempDir = VaultPaths::tempDir(m_conn.vaultRoot());
    QDir dir(tempDir);
    if (!dir.exists()) return 0;

    int removed = 0;
    const QFileInfoList entries = dir.entryInfoList(QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden | QDir::System);
    for (const QFileInfo& fi : entries) {
        const bool ok = fi.isDir() && !fi.isSymLink() ? QDir(fi.absoluteFilePath()).removeRecursively()
                                                      : QFile::remove(fi.absoluteFilePath());
        if (!ok) {
            qWarning() << "VaultMaintenance: cannot remove" << fi.absoluteFilePath();
            setStoreError(error, StoreError::IOError, QString("cannot remove %1").arg(fi.absoluteFilePath()));
            return -1;
        }
        ++removed;
    }
    qDebug() << "VaultMaintenance: removed" << removed << "temp entr(ies)";
    return removed;
}

void VaultMaintenance::saveMaintenanceTimestamp(const QString& operation)
{
    StoreError err;
    if (!VaultMetaStore(m_conn).set(maintenanceKey(operation), m_conn.now(), &err)) {
        qWarning() << "VaultMaintenance: could not store timestamp for" << operation << err.message;
    }
}
