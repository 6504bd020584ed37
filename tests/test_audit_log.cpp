#include <QtTest>
#include <QTemporaryDir>
#include <QTimeZone>
#include <QSqlQuery>
#include "audit_log.h"
#include "schema_manager.h"

class TestAuditLog : public QObject {
    Q_OBJECT

private:
    QTemporaryDir tempDir;
    std::unique_ptr<VaultConnection> conn;
    QDateTime clockTime;

private slots:
    void init() {
        static int n = 0;
        conn = SchemaManager::initialize(tempDir.path() + QString("/vault%1").arg(++n));
        QVERIFY(conn);
        clockTime = QDateTime(QDate(2026, 7, 1), QTime(0, 0), QTimeZone::utc());
        conn->setClock([this]() { return clockTime; });
    }

    void cleanup() {
        conn.reset();
    }

    void testRecordAppends() {
        AuditLog log(*conn);
        StoreError err;
        QVERIFY(log.record("image_added", "success", "asset 1", &err));
        QVERIFY(log.record("image_deleted", "success", QString(), &err));
        QVERIFY(!err.isError());

        const QVector<AuditEventRow> events = log.recentEvents(24);
        QCOMPARE(events.size(), 2);
        QCOMPARE(events.at(1).eventType, QString("image_added"));
        QCOMPARE(events.at(1).details, QString("asset 1"));
        QCOMPARE(events.at(1).timestamp, QString("2026-07-01T00:00:00.000Z"));
        QVERIFY(events.at(0).details.isEmpty());
    }

    void testRecentEventsNewestFirstAndWindowed() {
        AuditLog log(*conn);
        QVERIFY(log.record("vault_unlocked", "success"));
        clockTime = clockTime.addSecs(3600 * 5);
        QVERIFY(log.record("image_added", "success"));
        clockTime = clockTime.addSecs(60);
        QVERIFY(log.record("image_added", "failure", "asset already exists: abc"));

        const QVector<AuditEventRow> lastDay = log.recentEvents(24);
        QCOMPARE(lastDay.size(), 3);
        QCOMPARE(lastDay.at(0).status, QString("failure"));
        QCOMPARE(lastDay.at(2).eventType, QString("vault_unlocked"));

        // Two hours back from the last event excludes the unlock
        QCOMPARE(log.recentEvents(2).size(), 2);

        const QVector<AuditEventRow> unlocks = log.recentEvents(24, "vault_unlocked");
        QCOMPARE(unlocks.size(), 1);
        QCOMPARE(unlocks.first().eventType, QString("vault_unlocked"));
    }

    void testLedgerRejectsEdits() {
        AuditLog log(*conn);
        QVERIFY(log.record("vault_locked", "success"));
        StoreError err;
        QVERIFY(!conn->exec("UPDATE auth_logs SET status='failure'", &err));
        QVERIFY(!conn->exec("DELETE FROM auth_logs", &err));
        QCOMPARE(log.recentEvents(24).first().status, QString("success"));
    }

    void testFailureIsReportedNotThrown() {
        QVERIFY(conn->exec("CREATE TRIGGER block_audit BEFORE INSERT ON auth_logs "
                           "BEGIN SELECT RAISE(ABORT, 'audit disabled'); END;"));
        AuditLog log(*conn);
        StoreError err;
        QVERIFY(!log.record("image_added", "success", QString(), &err));
        QVERIFY(err.isError());
        QVERIFY(err.message.contains("audit disabled"));
        QVERIFY(log.recentEvents(24).isEmpty());
    }
};

#include "test_audit_log.moc"
QTEST_MAIN(TestAuditLog)
