#include <QtTest>
#include <QTemporaryDir>
#include <QFile>
#include <QDir>
#include <QSqlDatabase>
#include <QSqlQuery>
#include "asset_catalog.h"
#include "audit_log.h"
#include "schema_manager.h"
#include "tag_store.h"
#include "vault_maintenance.h"
#include "vault_meta_store.h"
#include "vault_paths.h"

class TestVaultMaintenance : public QObject {
    Q_OBJECT

private:
    QTemporaryDir tempDir;
    QString root;
    std::unique_ptr<VaultConnection> conn;

    int scalar(const QString& sql) {
        QSqlQuery q(conn->database());
        if (!q.exec(sql) || !q.next()) return -1;
        return q.value(0).toInt();
    }

private slots:
    void init() {
        static int n = 0;
        root = tempDir.path() + QString("/vault%1").arg(++n);
        conn = SchemaManager::initialize(root);
        QVERIFY(conn);
    }

    void cleanup() {
        conn.reset();
    }

    void testIntegrityCheckOnHealthyVault() {
        VaultMaintenance maintenance(*conn);
        StoreError err;
        const QVector<HealthCheckResult> results = maintenance.integrityCheck(&err);
        QVERIFY(!err.isError());
        QCOMPARE(results.size(), 3);
        QVERIFY(VaultMaintenance::isHealthy(results));
        for (const HealthCheckResult& r : results) {
            QCOMPARE(r.severity, HealthCheckResult::Info);
        }
        QVERIFY(!VaultMetaStore(*conn).get("maintenance.last_integrity_check").isEmpty());
    }

    void testIntegrityCheckReportsMissingIndex() {
        QVERIFY(conn->exec("DROP INDEX idx_tags_created_at"));
        const QVector<HealthCheckResult> results = VaultMaintenance(*conn).integrityCheck();
        bool flagged = false;
        for (const HealthCheckResult& r : results) {
            if (r.category == "Indexes") {
                QCOMPARE(r.severity, HealthCheckResult::Warning);
                QVERIFY(r.message.contains("idx_tags_created_at"));
                flagged = true;
            }
        }
        QVERIFY(flagged);
        // Missing indexes slow queries down but do not make the vault unhealthy
        QVERIFY(VaultMaintenance::isHealthy(results));
    }

    void testIntegrityCheckReportsDanglingReferences() {
        const qint64 asset = AssetCatalog(*conn).insert("h", "h.bin", "encrypted/h.bin", 1);
        QVERIFY(TagStore(*conn).addTag(asset, "t") > 0);
        // Bypass enforcement to simulate a damaged file
        QVERIFY(conn->exec("PRAGMA foreign_keys=OFF"));
        QVERIFY(conn->exec(QString("DELETE FROM images WHERE id=%1").arg(asset)));
        QVERIFY(conn->exec("PRAGMA foreign_keys=ON"));

        const QVector<HealthCheckResult> results = VaultMaintenance(*conn).integrityCheck();
        QVERIFY(!VaultMaintenance::isHealthy(results));
    }

    void testDatabaseStats() {
        AssetCatalog catalog(*conn);
        const qint64 a = catalog.insert("s1", "1.bin", "encrypted/1.bin", 1);
        QVERIFY(catalog.insert("s2", "2.bin", "encrypted/2.bin", 1) > 0);
        QVERIFY(catalog.softDelete(a));
        QVERIFY(TagStore(*conn).addTag(a, "t") > 0);
        QVERIFY(AuditLog(*conn).record("image_deleted", "success"));

        StoreError err;
        const DatabaseStats stats = VaultMaintenance(*conn).databaseStats(&err);
        QVERIFY(!err.isError());
        QCOMPARE(stats.pageSize, qint64(4096));
        QVERIFY(stats.pageCount > 0);
        QCOMPARE(stats.activeAssets, qint64(1));
        QCOMPARE(stats.deletedAssets, qint64(1));
        QCOMPARE(stats.tagCount, qint64(1));
        QCOMPARE(stats.annotationCount, qint64(0));
        QCOMPARE(stats.settingCount, qint64(3));
        QCOMPARE(stats.auditEventCount, qint64(1));
        QVERIFY(stats.lastBackup.isEmpty());
        QCOMPARE(stats.toJson().value("active_assets").toInt(), 1);
    }

    void testIncrementalVacuum() {
        VaultMaintenance maintenance(*conn);
        StoreError err;
        QVERIFY(maintenance.incrementalVacuum(0, &err));
        QVERIFY(!err.isError());
        QVERIFY(!maintenance.databaseStats().lastVacuum.isEmpty());
    }

    void testBackupDatabase() {
        QVERIFY(AssetCatalog(*conn).insert("b1", "b.bin", "encrypted/b.bin", 7) > 0);
        VaultMaintenance maintenance(*conn);
        StoreError err;
        const QString path = maintenance.backupDatabase(QString(), &err);
        QVERIFY2(!path.isEmpty(), qPrintable(err.message));
        QVERIFY(QFile::exists(path));
        QVERIFY(path.startsWith(QDir(VaultPaths::backupsDir(root)).absolutePath()));

        // The copy is a complete database
        {
            QSqlDatabase copy = QSqlDatabase::addDatabase("QSQLITE", "backup-check");
            copy.setDatabaseName(path);
            QVERIFY(copy.open());
            QSqlQuery q(copy);
            QVERIFY(q.exec("SELECT content_hash FROM images") && q.next());
            QCOMPARE(q.value(0).toString(), QString("b1"));
        }
        QSqlDatabase::removeDatabase("backup-check");

        // Never overwrites an existing file
        err.clear();
        QVERIFY(maintenance.backupDatabase(path, &err).isEmpty());
        QCOMPARE(err.kind, StoreError::IOError);
    }

    void testPurgeDeletedAssetsCascades() {
        AssetCatalog catalog(*conn);
        TagStore tags(*conn);
        const qint64 gone = catalog.insert("p1", "1.bin", "encrypted/1.bin", 1);
        const qint64 kept = catalog.insert("p2", "2.bin", "encrypted/2.bin", 1);
        QVERIFY(tags.addTag(gone, "t") > 0);
        QVERIFY(tags.addAnnotation(gone, "n") > 0);
        QVERIFY(tags.addTag(kept, "t") > 0);
        QVERIFY(catalog.softDelete(gone));

        StoreError err;
        QCOMPARE(VaultMaintenance(*conn).purgeDeletedAssets(&err), 1);
        QVERIFY(!err.isError());
        QCOMPARE(scalar("SELECT COUNT(*) FROM images"), 1);
        QCOMPARE(scalar(QString("SELECT COUNT(*) FROM tags WHERE asset_id=%1").arg(gone)), 0);
        QCOMPARE(scalar(QString("SELECT COUNT(*) FROM annotations WHERE asset_id=%1").arg(gone)), 0);
        QCOMPARE(tags.listTags(kept).size(), 1);

        // The hash is free again once the row is physically gone
        QVERIFY(catalog.insert("p1", "again.bin", "encrypted/again.bin", 1) > 0);

        const QVector<AuditEventRow> events = AuditLog(*conn).recentEvents(24, "assets_purged");
        QCOMPARE(events.size(), 1);
        QCOMPARE(events.first().status, QString("success"));
    }

    void testCleanupTemp() {
        const QString temp = VaultPaths::tempDir(root);
        QFile f(temp + "/scratch.bin");
        QVERIFY(f.open(QIODevice::WriteOnly));
        f.write("x");
        f.close();
        QVERIFY(QDir().mkpath(temp + "/nested/deeper"));

        StoreError err;
        QCOMPARE(VaultMaintenance(*conn).cleanupTemp(&err), 2);
        QVERIFY(!err.isError());
        QVERIFY(QDir(temp).exists());
        QVERIFY(QDir(temp).isEmpty());
    }
};

#include "test_vault_maintenance.moc"
QTEST_MAIN(TestVaultMaintenance)
