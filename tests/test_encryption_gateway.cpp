#include <QtTest>
#include <QTemporaryDir>
#include <QFile>
#include <QJsonDocument>
#include "encryption_gateway.h"

namespace {

// Replays a canned ProcessOutput and remembers what it was asked to run.
class FakeProcessRunner : public ProcessRunner {
public:
    ProcessOutput run(const ProcessRequest& request) override {
        requests.append(request);
        return next;
    }

    ProcessOutput next;
    QVector<ProcessRequest> requests;
};

ProcessOutput finished(int exitCode, const QByteArray& out, const QByteArray& err = QByteArray())
{
    ProcessOutput o;
    o.started = true;
    o.exitCode = exitCode;
    o.stdoutData = out;
    o.stderrData = err;
    return o;
}

} // namespace

class TestEncryptionGateway : public QObject {
    Q_OBJECT

private:
    QTemporaryDir tempDir;

private slots:
    void testRequestShape() {
        auto runner = std::make_unique<FakeProcessRunner>();
        FakeProcessRunner* fake = runner.get();
        fake->next = finished(0, R"({"success": true, "encrypted_path": "encrypted/a.enc"})");

        EncryptionGatewayClient client("python3", "/opt/gv/main.py", "/vaults/v1", std::move(runner));
        client.setTimeoutMs(1500);
        const GatewayResult r = client.encryptFile("/home/u/a.jpg", "s3cret");
        QVERIFY(r.isSuccess());

        QCOMPARE(fake->requests.size(), 1);
        const ProcessRequest& req = fake->requests.first();
        QCOMPARE(req.program, QString("python3"));
        QCOMPARE(req.arguments, QStringList({ "/opt/gv/main.py", "encrypt_file", "--vault-path", "/vaults/v1" }));
        QCOMPARE(req.timeoutMs, 1500);

        // The password travels on stdin, never on the command line
        QVERIFY(!req.arguments.join(' ').contains("s3cret"));
        const QJsonObject payload = QJsonDocument::fromJson(req.stdinData).object();
        QCOMPARE(payload.value("password").toString(), QString("s3cret"));
        QCOMPARE(payload.value("file_path").toString(), QString("/home/u/a.jpg"));
    }

    void testNoScriptInvokesProgramDirectly() {
        auto runner = std::make_unique<FakeProcessRunner>();
        FakeProcessRunner* fake = runner.get();
        fake->next = finished(0, R"({"success": true})");

        EncryptionGatewayClient client("/usr/bin/gv-crypto", QString(), "/v", std::move(runner));
        QVERIFY(client.lockVault().isSuccess());
        QCOMPARE(fake->requests.first().arguments, QStringList({ "lock", "--vault-path", "/v" }));
        QCOMPARE(client.timeoutMs(), -1);
        QCOMPARE(fake->requests.first().timeoutMs, -1);
    }

    void testInterpretSuccessPaths() {
        GatewayResult r = EncryptionGatewayClient::interpret(
            finished(0, R"({"success": true, "data_or_path": "encrypted/x.enc"})"), true);
        QCOMPARE(r.outcome, GatewayResult::Success);
        QCOMPARE(r.outputRef, QString("encrypted/x.enc"));

        r = EncryptionGatewayClient::interpret(
            finished(0, R"({"success": true, "data": {"encrypted_path": "encrypted/y.enc"}})"), true);
        QCOMPARE(r.outputRef, QString("encrypted/y.enc"));

        // Diagnostics printed around the envelope are tolerated
        r = EncryptionGatewayClient::interpret(
            finished(0, "loading keys...\n{\"success\": true, \"path\": \"encrypted/z.enc\"}\n"), true);
        QCOMPARE(r.outcome, GatewayResult::Success);
        QCOMPARE(r.outputRef, QString("encrypted/z.enc"));
    }

    void testInterpretFailures() {
        // Wrong password: surfaced verbatim
        GatewayResult r = EncryptionGatewayClient::interpret(
            finished(0, R"({"success": false, "error": "Invalid password"})"), true);
        QCOMPARE(r.outcome, GatewayResult::Failure);
        QCOMPARE(r.reason, QString("Invalid password"));

        // Non-zero exit with an envelope on stdout
        r = EncryptionGatewayClient::interpret(
            finished(1, R"({"success": false, "error": "Vault not initialized"})", "trace"), true);
        QCOMPARE(r.outcome, GatewayResult::Failure);
        QCOMPARE(r.reason, QString("Vault not initialized"));

        // Non-zero exit, stderr only
        r = EncryptionGatewayClient::interpret(finished(2, QByteArray(), "permission denied\n"), true);
        QCOMPARE(r.outcome, GatewayResult::Failure);
        QCOMPARE(r.reason, QString("permission denied"));

        r = EncryptionGatewayClient::interpret(finished(4, QByteArray()), false);
        QCOMPARE(r.outcome, GatewayResult::Failure);
        QVERIFY(r.reason.contains("4"));
    }

    void testInterpretTransportErrors() {
        ProcessOutput notStarted;
        notStarted.errorString = "No such file or directory";
        GatewayResult r = EncryptionGatewayClient::interpret(notStarted, true);
        QCOMPARE(r.outcome, GatewayResult::TransportError);
        QVERIFY(r.reason.contains("No such file"));

        ProcessOutput crashed = finished(0, QByteArray());
        crashed.crashed = true;
        QCOMPARE(EncryptionGatewayClient::interpret(crashed, false).outcome, GatewayResult::TransportError);

        ProcessOutput timedOut = finished(0, QByteArray());
        timedOut.timedOut = true;
        QCOMPARE(EncryptionGatewayClient::interpret(timedOut, false).outcome, GatewayResult::TransportError);

        // Ambiguous success
        QCOMPARE(EncryptionGatewayClient::interpret(finished(0, "  \n"), false).outcome, GatewayResult::TransportError);
        QCOMPARE(EncryptionGatewayClient::interpret(finished(0, "not json"), false).outcome, GatewayResult::TransportError);
        QCOMPARE(EncryptionGatewayClient::interpret(finished(0, R"({"success": true})"), true).outcome,
                 GatewayResult::TransportError);
    }

    void testDecryptFallsBackToRequestedOutput() {
        auto runner = std::make_unique<FakeProcessRunner>();
        FakeProcessRunner* fake = runner.get();
        fake->next = finished(0, R"({"success": true})");

        EncryptionGatewayClient client("python3", "main.py", "/v", std::move(runner));
        const GatewayResult r = client.decryptFile("encrypted/a.enc", "pw", "/tmp/out.jpg");
        QVERIFY(r.isSuccess());
        QCOMPARE(r.outputRef, QString("/tmp/out.jpg"));
        const QJsonObject payload = QJsonDocument::fromJson(fake->requests.first().stdinData).object();
        QCOMPARE(payload.value("output_path").toString(), QString("/tmp/out.jpg"));
        QCOMPARE(fake->requests.first().arguments.at(1), QString("decrypt_file"));
    }

    void testVaultStatusCarriesEnvelope() {
        auto runner = std::make_unique<FakeProcessRunner>();
        FakeProcessRunner* fake = runner.get();
        fake->next = finished(0, R"({"success": true, "vault_exists": true, "is_locked": true, "vault_path": "/v", "message": "Vault locked"})");

        EncryptionGatewayClient client("python3", "main.py", "/v", std::move(runner));
        const GatewayResult r = client.vaultStatus();
        QVERIFY(r.isSuccess());
        QVERIFY(r.outputRef.isEmpty());
        QVERIFY(r.envelope.value("is_locked").toBool());
        QCOMPARE(r.envelope.value("message").toString(), QString("Vault locked"));

        const ProcessRequest& req = fake->requests.first();
        QCOMPARE(req.arguments, QStringList({ "main.py", "get_vault_status", "--vault-path", "/v" }));
        QVERIFY(!QJsonDocument::fromJson(req.stdinData).object().contains("password"));
    }

    void testNeverRetries() {
        auto runner = std::make_unique<FakeProcessRunner>();
        FakeProcessRunner* fake = runner.get();
        ProcessOutput failed;
        failed.errorString = "boom";
        fake->next = failed;

        EncryptionGatewayClient client("python3", "main.py", "/v", std::move(runner));
        QCOMPARE(client.unlockVault("pw").outcome, GatewayResult::TransportError);
        QCOMPARE(fake->requests.size(), 1);
    }

    void testResultJson() {
        const QJsonObject ok = GatewayResult::success("encrypted/a.enc").toJson();
        QCOMPARE(ok.value("outcome").toString(), QString("success"));
        QCOMPARE(ok.value("path").toString(), QString("encrypted/a.enc"));
        const QJsonObject bad = GatewayResult::failure("Invalid password").toJson();
        QCOMPARE(bad.value("success").toBool(), false);
        QCOMPARE(bad.value("error").toString(), QString("Invalid password"));
    }

    void testQProcessRunnerRoundTrip() {
        QProcessRunner runner;
        ProcessRequest req;
        req.program = "/bin/sh";
        req.arguments = QStringList({ "-c", "cat; echo oops >&2; exit 3" });
        req.stdinData = "hello from stdin";
        const ProcessOutput out = runner.run(req);
        QVERIFY(out.started);
        QVERIFY(!out.crashed);
        QVERIFY(!out.timedOut);
        QCOMPARE(out.exitCode, 3);
        QCOMPARE(out.stdoutData, QByteArray("hello from stdin"));
        QCOMPARE(out.stderrData.trimmed(), QByteArray("oops"));
    }

    void testQProcessRunnerMissingProgram() {
        QProcessRunner runner;
        ProcessRequest req;
        req.program = tempDir.path() + "/does-not-exist";
        const ProcessOutput out = runner.run(req);
        QVERIFY(!out.started);
        QVERIFY(!out.errorString.isEmpty());
    }

    void testQProcessRunnerTimeout() {
        QProcessRunner runner;
        ProcessRequest req;
        req.program = "/bin/sh";
        req.arguments = QStringList({ "-c", "sleep 10" });
        req.timeoutMs = 200;
        const ProcessOutput out = runner.run(req);
        QVERIFY(out.started);
        QVERIFY(out.timedOut);
        QCOMPARE(EncryptionGatewayClient::interpret(out, false).outcome, GatewayResult::TransportError);
    }

    void testScriptCollaboratorEndToEnd() {
        const QString script = tempDir.path() + "/collaborator.sh";
        QFile f(script);
        QVERIFY(f.open(QIODevice::WriteOnly | QIODevice::Text));
        f.write("payload=$(cat)\n"
                "case \"$payload\" in\n"
                "  *'\"password\":\"good\"'*) echo '{\"success\": true, \"encrypted_path\": \"encrypted/'\"$1\"'.enc\"}' ;;\n"
                "  *) echo '{\"success\": false, \"error\": \"Invalid password\"}'; exit 1 ;;\n"
                "esac\n");
        f.close();

        EncryptionGatewayClient client("/bin/sh", script, tempDir.path());
        const GatewayResult ok = client.encryptFile("/tmp/a.jpg", "good");
        QCOMPARE(ok.outcome, GatewayResult::Success);
        QCOMPARE(ok.outputRef, QString("encrypted/encrypt_file.enc"));

        const GatewayResult bad = client.encryptFile("/tmp/a.jpg", "wrong");
        QCOMPARE(bad.outcome, GatewayResult::Failure);
        QCOMPARE(bad.reason, QString("Invalid password"));
    }
};

#include "test_encryption_gateway.moc"
QTEST_MAIN(TestEncryptionGateway)
