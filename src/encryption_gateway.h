#pragma once
#include <QByteArray>
#include <QJsonObject>
#include <QString>
#include <QStringList>
#include <memory>

// One invocation of an external program.
struct ProcessRequest {
    QString program;
    QStringList arguments;
    QByteArray stdinData;     // written then closed; may carry secrets, never log it
    int timeoutMs = -1;       // -1 waits forever
};

struct ProcessOutput {
    bool started = false;
    bool crashed = false;
    bool timedOut = false;
    int exitCode = -1;
    QByteArray stdoutData;
    QByteArray stderrData;
    QString errorString;      // QProcess error text when the run did not complete
};

// Seam between the gateway client and the OS so tests never need the real collaborator.
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;
    virtual ProcessOutput run(const ProcessRequest& request) = 0;
};

// Blocking QProcess runner. Call it from a worker thread only.
class QProcessRunner : public ProcessRunner {
public:
    ProcessOutput run(const ProcessRequest& request) override;
};

// Normalised outcome of one collaborator call.
struct GatewayResult {
    enum Outcome { Success, Failure, TransportError };

    Outcome outcome = TransportError;
    QString outputRef;        // path produced by the collaborator, when any
    QString reason;           // collaborator error text, verbatim
    QJsonObject envelope;     // parsed response, when parseable

    bool isSuccess() const { return outcome == Success; }
    static QString outcomeName(Outcome outcome);
    QJsonObject toJson() const;

    static GatewayResult success(const QString& ref, const QJsonObject& envelope = QJsonObject());
    static GatewayResult failure(const QString& reason, const QJsonObject& envelope = QJsonObject());
    static GatewayResult transportError(const QString& reason);
};

/**
 * EncryptionGatewayClient - adapter for the external encryption collaborator.
 *
 * Invocation: <program> [script] <command> --vault-path <root>, with a JSON
 * payload on stdin ({"password", "file_path", "output_path"}). The collaborator
 * prints a {success, data_or_path, error} envelope on stdout.
 *
 * Calls are never retried: a repeated invocation would resend the password.
 */
class EncryptionGatewayClient {
public:
    EncryptionGatewayClient(const QString& program, const QString& script, const QString& vaultRoot,
                            std::unique_ptr<ProcessRunner> runner = nullptr);

    // Caller-imposed bound; expiry is reported as TransportError. -1 disables it.
    void setTimeoutMs(int timeoutMs) { m_timeoutMs = timeoutMs; }
    int timeoutMs() const { return m_timeoutMs; }

    GatewayResult encryptFile(const QString& sourcePath, const QString& password);
    GatewayResult decryptFile(const QString& encryptedPath, const QString& password, const QString& outputPath);

    GatewayResult initializeVault(const QString& password);
    GatewayResult unlockVault(const QString& password);
    GatewayResult lockVault();
    // Read-only probe; the envelope carries vault_exists, is_locked and message.
    GatewayResult vaultStatus();

    // Maps a finished run onto the three outcomes. Public for tests.
    static GatewayResult interpret(const ProcessOutput& out, bool requirePath, const QString& fallbackPath = QString());

private:
    GatewayResult call(const QString& command, const QJsonObject& payload,
                       bool requirePath, const QString& fallbackPath = QString());

    QString m_program;
    QString m_script;
    QString m_vaultRoot;
    int m_timeoutMs = -1;
    std::unique_ptr<ProcessRunner> m_runner;
};
