#ifndef VAULT_MAINTENANCE_H
#define VAULT_MAINTENANCE_H

#include <QString>
#include <QVector>
#include <QJsonObject>

#include "store_error.h"
#include "vault_connection.h"

// Health check result structure
struct HealthCheckResult {
    enum Severity {
        Info,
        Warning,
        Critical
    };

    QString category;
    QString message;
    Severity severity = Info;
    QString recommendation;

    HealthCheckResult() = default;
    HealthCheckResult(const QString& cat, const QString& msg, Severity sev, const QString& rec = QString())
        : category(cat), message(msg), severity(sev), recommendation(rec) {}

    QJsonObject toJson() const;
};

// Database statistics structure
struct DatabaseStats {
    qint64 totalSize = 0;            // Database file size in bytes (main file, not the WAL)
    qint64 pageSize = 0;
    qint64 pageCount = 0;
    qint64 freePageCount = 0;
    qint64 fragmentationPercent = 0;
    qint64 activeAssets = 0;
    qint64 deletedAssets = 0;
    qint64 tagCount = 0;
    qint64 annotationCount = 0;
    qint64 settingCount = 0;
    qint64 auditEventCount = 0;
    QString lastVacuum;              // ISO-8601 UTC, empty if never
    QString lastBackup;
    QString lastIntegrityCheck;

    QJsonObject toJson() const;
};

// Explicit maintenance operations on one vault. None of these run as part of
// the routine catalog API; purgeDeletedAssets is the only physical delete.
class VaultMaintenance {
public:
    explicit VaultMaintenance(VaultConnection& conn);

    // integrity_check, foreign_key_check and the expected index set.
    QVector<HealthCheckResult> integrityCheck(StoreError* error = nullptr);
    static bool isHealthy(const QVector<HealthCheckResult>& results);

    DatabaseStats databaseStats(StoreError* error = nullptr);

    // Returns free pages to the filesystem; 0 reclaims all of them.
    bool incrementalVacuum(int pages = 0, StoreError* error = nullptr);

    // Consistent copy of the database. An empty target writes
    // backups/graphivault-<yyyyMMdd-HHmmss>.db. Returns the written path.
    QString backupDatabase(const QString& targetPath = QString(), StoreError* error = nullptr);

    // Physically removes soft-deleted assets (tags and annotations cascade).
    // Returns the number of assets removed, -1 on failure.
    int purgeDeletedAssets(StoreError* error = nullptr);

    // Empties temp/. Returns the number of entries removed, -1 on failure.
    int cleanupTemp(StoreError* error = nullptr);

private:
    void saveMaintenanceTimestamp(const QString& operation);
    qint64 scalar(const QString& sql, StoreError* error);

    VaultConnection& m_conn;
};

#endif // VAULT_MAINTENANCE_H
