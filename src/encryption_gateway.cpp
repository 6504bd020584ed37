#include "encryption_gateway.h"
#include <QProcess>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>
#include <QDebug>

namespace {

const char* const kPathKeys[] = { "data_or_path", "encrypted_path", "decrypted_path", "output_path", "path" };

QString pathFromObject(const QJsonObject& obj)
{
    for (const char* key : kPathKeys) {
        const QJsonValue v = obj.value(QLatin1String(key));
        if (v.isString() && !v.toString().isEmpty()) return v.toString();
    }
    const QJsonValue data = obj.value(QLatin1String("data"));
    if (data.isString()) return data.toString();
    if (data.isObject()) {
        const QJsonObject inner = data.toObject();
        for (const char* key : kPathKeys) {
            const QJsonValue v = inner.value(QLatin1String(key));
            if (v.isString() && !v.toString().isEmpty()) return v.toString();
        }
    }
    return QString();
}

// The collaborator may print diagnostics around the envelope; take the outermost object.
bool parseEnvelope(const QByteArray& raw, QJsonObject& envelope)
{
    QJsonParseError perr;
    QJsonDocument doc = QJsonDocument::fromJson(raw, &perr);
    if (perr.error != QJsonParseError::NoError || !doc.isObject()) {
        const int start = raw.indexOf('{');
        const int end = raw.lastIndexOf('}');
        if (start < 0 || end <= start) return false;
        doc = QJsonDocument::fromJson(raw.mid(start, end - start + 1), &perr);
        if (perr.error != QJsonParseError::NoError || !doc.isObject()) return false;
    }
    envelope = doc.object();
    return true;
}

} // namespace

ProcessOutput QProcessRunner::run(const ProcessRequest& request)
{
    ProcessOutput out;
    QProcess p;
    p.start(request.program, request.arguments);
    if (!p.waitForStarted()) {
        out.errorString = p.errorString();
        qWarning() << "QProcessRunner: failed to start" << request.program << out.errorString;
        return out;
    }
    out.started = true;

    if (!request.stdinData.isEmpty()) p.write(request.stdinData);
    p.closeWriteChannel();

    if (!p.waitForFinished(request.timeoutMs) && p.state() != QProcess::NotRunning) {
        qWarning() << "QProcessRunner:" << request.program << "did not finish within" << request.timeoutMs << "ms";
        out.timedOut = true;
        p.kill();
        if (!p.waitForFinished(5000)) qWarning() << "QProcessRunner: process did not exit after kill";
    }

    out.stdoutData = p.readAllStandardOutput();
    out.stderrData = p.readAllStandardError();
    out.crashed = !out.timedOut && p.exitStatus() == QProcess::CrashExit;
    out.exitCode = p.exitCode();
    if (out.crashed || out.timedOut) out.errorString = p.errorString();
    return out;
}

QString GatewayResult::outcomeName(Outcome outcome)
{
    switch (outcome) {
    case Success: return QStringLiteral("success");
    case Failure: return QStringLiteral("failure");
    case TransportError: return QStringLiteral("transport_error");
    }
    return QString();
}

QJsonObject GatewayResult::toJson() const
{
    QJsonObject o;
    o["outcome"] = outcomeName(outcome);
    o["success"] = isSuccess();
    if (!outputRef.isEmpty()) o["path"] = outputRef;
    if (!reason.isEmpty()) o["error"] = reason;
    return o;
}

GatewayResult GatewayResult::success(const QString& ref, const QJsonObject& envelope)
{
    GatewayResult r;
    r.outcome = Success;
    r.outputRef = ref;
    r.envelope = envelope;
    return r;
}

GatewayResult GatewayResult::failure(const QString& reason, const QJsonObject& envelope)
{
    GatewayResult r;
    r.outcome = Failure;
    r.reason = reason;
    r.envelope = envelope;
    return r;
}

GatewayResult GatewayResult::transportError(const QString& reason)
{
    GatewayResult r;
    r.outcome = TransportError;
    r.reason = reason;
    return r;
}

EncryptionGatewayClient::EncryptionGatewayClient(const QString& program, const QString& script,
                                                 const QString& vaultRoot, std::unique_ptr<ProcessRunner> runner)
    : m_program(program)
    , m_script(script)
    , m_vaultRoot(vaultRoot)
    , m_runner(std::move(runner))
{
    if (!m_runner) m_runner = std::make_unique<QProcessRunner>();
}

GatewayResult EncryptionGatewayClient::interpret(const ProcessOutput& out, bool requirePath, const QString& fallbackPath)
{
    if (!out.started) {
        return GatewayResult::transportError(QStringLiteral("could not start encryption collaborator: %1").arg(out.errorString));
    }
    if (out.timedOut) {
        return GatewayResult::transportError(QStringLiteral("encryption collaborator timed out"));
    }
    const QString stderrText = QString::fromUtf8(out.stderrData).trimmed();
    if (out.crashed) {
        return GatewayResult::transportError(QStringLiteral("encryption collaborator crashed: %1")
                                             .arg(stderrText.isEmpty() ? out.errorString : stderrText));
    }

    const QByteArray raw = out.stdoutData.trimmed();
    QJsonObject envelope;
    const bool parsed = !raw.isEmpty() && parseEnvelope(raw, envelope);

    if (out.exitCode != 0) {
        const QString envError = parsed ? envelope.value(QLatin1String("error")).toString() : QString();
        if (!envError.isEmpty()) return GatewayResult::failure(envError, envelope);
        if (!stderrText.isEmpty()) return GatewayResult::failure(stderrText, envelope);
        return GatewayResult::failure(QStringLiteral("encryption collaborator exited with code %1").arg(out.exitCode), envelope);
    }
    if (raw.isEmpty()) {
        QString reason = QStringLiteral("encryption collaborator returned an empty response");
        if (!stderrText.isEmpty()) reason += QStringLiteral(": ") + stderrText;
        return GatewayResult::transportError(reason);
    }
    if (!parsed) {
        return GatewayResult::transportError(QStringLiteral("unparseable response from encryption collaborator"));
    }
    if (!envelope.value(QLatin1String("success")).toBool(false)) {
        const QString envError = envelope.value(QLatin1String("error")).toString();
        return GatewayResult::failure(envError.isEmpty() ? QStringLiteral("encryption collaborator reported failure") : envError,
                                      envelope);
    }

    QString path = pathFromObject(envelope);
    if (path.isEmpty()) path = fallbackPath;
    if (path.isEmpty() && requirePath) {
        return GatewayResult::transportError(QStringLiteral("encryption collaborator reported success without an output path"));
    }
    return GatewayResult::success(path, envelope);
}

GatewayResult EncryptionGatewayClient::call(const QString& command, const QJsonObject& payload,
                                            bool requirePath, const QString& fallbackPath)
{
    ProcessRequest req;
    req.program = m_program;
    if (!m_script.isEmpty()) req.arguments << m_script;
    req.arguments << command << QStringLiteral("--vault-path") << m_vaultRoot;
    req.stdinData = QJsonDocument(payload).toJson(QJsonDocument::Compact);
    req.timeoutMs = m_timeoutMs;

    qInfo() << "EncryptionGatewayClient:" << command << "started";
    const GatewayResult result = interpret(m_runner->run(req), requirePath, fallbackPath);
    if (result.isSuccess()) {
        qInfo() << "EncryptionGatewayClient:" << command << "succeeded" << result.outputRef;
    } else {
        qWarning() << "EncryptionGatewayClient:" << command << GatewayResult::outcomeName(result.outcome) << result.reason;
    }
    return result;
}

GatewayResult EncryptionGatewayClient::encryptFile(const QString& sourcePath, const QString& password)
{
    QJsonObject payload;
    payload["password"] = password;
    payload["file_path"] = sourcePath;
    return call(QStringLiteral("encrypt_file"), payload, true);
}

GatewayResult EncryptionGatewayClient::decryptFile(const QString& encryptedPath, const QString& password, const QString& outputPath)
{
    QJsonObject payload;
    payload["password"] = password;
    payload["file_path"] = encryptedPath;
    payload["output_path"] = outputPath;
    return call(QStringLiteral("decrypt_file"), payload, true, outputPath);
}

GatewayResult EncryptionGatewayClient::initializeVault(const QString& password)
{
    QJsonObject payload;
    payload["password"] = password;
    return call(QStringLiteral("initialize"), payload, false);
}

GatewayResult EncryptionGatewayClient::unlockVault(const QString& password)
{
    QJsonObject payload;
    payload["password"] = password;
    return call(QStringLiteral("unlock"), payload, false);
}

GatewayResult EncryptionGatewayClient::lockVault()
{
    return call(QStringLiteral("lock"), QJsonObject(), false);
}

GatewayResult EncryptionGatewayClient::vaultStatus()
{
    return call(QStringLiteral("get_vault_status"), QJsonObject(), false);
}
