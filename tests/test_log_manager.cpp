#include <QtTest>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <QRegularExpression>
#include <QFile>
#include "log_manager.h"

class TestLogManager : public QObject {
    Q_OBJECT

private slots:
    void init() {
        LogManager& lm = LogManager::instance();
        QVERIFY(lm.setLogFile(QString()));
        lm.setMinimumLevel("INFO");
        lm.clear();
    }

    void testEntryFormat() {
        LogManager::instance().addLog("catalog opened", "INFO");
        const QStringList logs = LogManager::instance().logs();
        QCOMPARE(logs.size(), 1);
        static const QRegularExpression pattern(R"(^\[\d{2}:\d{2}:\d{2}\.\d{3}\] \[INFO\] catalog opened$)");
        QVERIFY2(pattern.match(logs.first()).hasMatch(), qPrintable(logs.first()));
    }

    void testLevelFiltering() {
        LogManager& lm = LogManager::instance();
        lm.addLog("hidden", "DEBUG");
        QVERIFY(lm.logs().isEmpty());

        lm.setMinimumLevel("debug");
        QCOMPARE(lm.minimumLevel(), QString("DEBUG"));
        lm.addLog("shown", "DEBUG");
        QCOMPARE(lm.logs().size(), 1);

        lm.setMinimumLevel("ERROR");
        QVERIFY(!lm.accepts("WARN"));
        QVERIFY(lm.accepts("FATAL"));

        lm.setMinimumLevel("loud");
        QCOMPARE(lm.minimumLevel(), QString("INFO"));
    }

    void testLevelRank() {
        QVERIFY(LogManager::levelRank("DEBUG") < LogManager::levelRank("INFO"));
        QCOMPARE(LogManager::levelRank("warning"), LogManager::levelRank("WARN"));
        QCOMPARE(LogManager::levelRank("verbose"), -1);
    }

    void testRingKeepsNewestEntries() {
        LogManager& lm = LogManager::instance();
        for (int i = 0; i < 1005; ++i) lm.addLog(QString("entry %1").arg(i));
        const QStringList logs = lm.logs();
        QCOMPARE(logs.size(), 1000);
        QVERIFY(logs.first().endsWith("entry 5"));
        QVERIFY(logs.last().endsWith("entry 1004"));
    }

    void testWarningsReachTheFileImmediately() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString path = dir.path() + "/logs/vaultstore.log";
        LogManager& lm = LogManager::instance();
        QVERIFY(lm.setLogFile(path));
        QCOMPARE(lm.logFile(), path);

        lm.addLog("disk nearly full", "WARN");

        QFile f(path);
        QVERIFY(f.open(QIODevice::ReadOnly | QIODevice::Text));
        const QString text = QString::fromUtf8(f.readAll());
        QVERIFY(text.contains("--- session start ---"));
        QVERIFY(text.contains("[WARN] disk nearly full"));

        QVERIFY(lm.setLogFile(QString()));
        QVERIFY(lm.logFile().isEmpty());
    }

    void testUnwritableLogFile() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        QFile blocker(dir.path() + "/file");
        QVERIFY(blocker.open(QIODevice::WriteOnly));
        blocker.close();
        QVERIFY(!LogManager::instance().setLogFile(dir.path() + "/file/vaultstore.log"));
        QVERIFY(LogManager::instance().logFile().isEmpty());
    }

    void testSignalCarriesEntry() {
        QSignalSpy spy(&LogManager::instance(), &LogManager::logAdded);
        LogManager::instance().addLog("asset stored", "INFO");
        QCOMPARE(spy.count(), 1);
        QVERIFY(spy.takeFirst().at(0).toString().endsWith("[INFO] asset stored"));
    }

    void testMessageHandlerRoutesQtMessages() {
        QtMessageHandler previous = qInstallMessageHandler(customMessageHandler);
        qWarning() << "routed warning";
        qDebug() << "filtered debug";
        qInstallMessageHandler(previous);

        const QStringList logs = LogManager::instance().logs();
        QCOMPARE(logs.size(), 1);
        QVERIFY(logs.first().contains("[WARN] routed warning"));
    }

    void testClear() {
        LogManager::instance().addLog("one");
        LogManager::instance().clear();
        QVERIFY(LogManager::instance().logs().isEmpty());
    }
};

#include "test_log_manager.moc"
QTEST_MAIN(TestLogManager)
