#include <QCoreApplication>
#include <QCommandLineParser>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTextStream>
#include <QDebug>
#include <cstdio>

#include "log_manager.h"
#include "vault_config.h"
#include "vault_service.h"

namespace {

enum ExitCode { ExitOk = 0, ExitFailed = 1, ExitUsage = 2, ExitFatal = 3 };

void printJson(const QJsonValue& value)
{
    QTextStream out(stdout);
    if (value.isObject()) out << QJsonDocument(value.toObject()).toJson(QJsonDocument::Indented);
    else if (value.isArray()) out << QJsonDocument(value.toArray()).toJson(QJsonDocument::Indented);
    else if (value.isNull()) out << "null\n";
    else out << QJsonDocument(QJsonArray{ value }).toJson(QJsonDocument::Compact).mid(1).chopped(1) << "\n";
    out.flush();
}

int printError(const StoreError& err)
{
    printJson(QJsonObject{ {"error", StoreError::kindName(err.kind)}, {"message", err.message} });
    return ExitFailed;
}

template <typename T, typename ToJson>
int report(const StoreResult<T>& r, ToJson toJson)
{
    if (!r.ok()) {
        if (r.error.kind == StoreError::NotFound) {
            printJson(QJsonValue::Null);
            return ExitFailed;
        }
        return printError(r.error);
    }
    printJson(toJson(r.value));
    return ExitOk;
}

int reportGateway(const GatewayResult& r)
{
    printJson(r.toJson());
    return r.isSuccess() ? ExitOk : ExitFailed;
}

QString readPassword()
{
    const QByteArray env = qgetenv("GRAPHIVAULT_PASSWORD");
    if (!env.isEmpty()) return QString::fromUtf8(env);
    QTextStream in(stdin);
    return in.readLine();
}

QJsonArray idsToJson(const QVector<qint64>& ids)
{
    QJsonArray arr;
    for (qint64 id : ids) arr.append(id);
    return arr;
}

bool toId(const QString& text, qint64& id)
{
    bool ok = false;
    id = text.toLongLong(&ok);
    return ok && id > 0;
}

const char* const kCommandHelp =
    "Commands:\n"
    "  init                                  create or open the vault store\n"
    "  info                                  vault identity and asset count\n"
    "  add <hash> <enc-name> <path> <size>   catalog an encrypted file\n"
    "  list [--limit N] [--offset N]         active assets, newest first\n"
    "  get <id> | get-by-hash <hash>         one active asset\n"
    "  delete <id>                           soft-delete an asset\n"
    "  tag <asset-id> <name> [kind]          attach a tag\n"
    "  tags <asset-id>                       tags of an asset\n"
    "  annotate <asset-id> <note>            attach a note\n"
    "  annotations <asset-id>                notes of an asset\n"
    "  find-tags <name>... [--any]           assets carrying the tags\n"
    "  get-setting <key> | set-setting <key> <value>\n"
    "  audit [--hours N] [--type T]          recent audit events\n"
    "  check | stats | vacuum | purge | cleanup-temp | backup [file]\n"
    "  encrypt <file> | decrypt <file> <output>\n"
    "  vault-init | unlock | lock | status   delegated to the encryption collaborator\n"
    "Passwords are read from GRAPHIVAULT_PASSWORD, or from the first line of stdin.\n";

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    // Identify app for QSettings / QStandardPaths
    QCoreApplication::setOrganizationName("GraphiVault");
    QCoreApplication::setOrganizationDomain("graphivault.local");
    QCoreApplication::setApplicationName("VaultStore");
    QCoreApplication::setApplicationVersion("1.0");

    LogManager::install();

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("GraphiVault metadata store\n\n") + QLatin1String(kCommandHelp));
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption configOpt("config", "Settings file (INI).", "file");
    QCommandLineOption vaultOpt("vault", "Vault root directory.", "dir");
    QCommandLineOption levelOpt("log-level", "DEBUG, INFO, WARN or ERROR.", "level");
    QCommandLineOption limitOpt("limit", "Page size for list.", "n", "-1");
    QCommandLineOption offsetOpt("offset", "Page offset for list.", "n", "0");
    QCommandLineOption hoursOpt("hours", "Audit window in hours.", "n", "24");
    QCommandLineOption typeOpt("type", "Audit event type filter.", "type");
    QCommandLineOption anyOpt("any", "find-tags: match any tag instead of all.");
    parser.addOptions({ configOpt, vaultOpt, levelOpt, limitOpt, offsetOpt, hoursOpt, typeOpt, anyOpt });
    parser.addPositionalArgument("command", "Command to run (see above).");
    parser.process(app);

    VaultConfig config = VaultConfig::load(parser.value(configOpt));
    if (parser.isSet(vaultOpt)) {
        const bool defaultLog = config.logFile == VaultConfig::defaultLogFile(config.vaultRoot);
        config.vaultRoot = parser.value(vaultOpt);
        if (defaultLog) config.logFile = VaultConfig::defaultLogFile(config.vaultRoot);
    }
    if (parser.isSet(levelOpt)) config.logLevel = parser.value(levelOpt).toUpper();

    LogManager::instance().setMinimumLevel(config.logLevel);

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        fprintf(stderr, "%s", qPrintable(parser.helpText()));
        return ExitUsage;
    }
    const QString command = args.first();
    const QStringList rest = args.mid(1);

    VaultService service(config);
    const StoreResult<VaultInfo> init = service.initialize().result();
    if (!init.ok()) {
        fprintf(stderr, "vaultstore: cannot open vault at %s: %s\n",
                qPrintable(service.vaultRoot()), qPrintable(init.error.message));
        return ExitFatal;
    }
    // The data directory exists only after initialization.
    if (!config.logFile.isEmpty()) {
        if (!LogManager::instance().setLogFile(config.logFile)) {
            qWarning() << "vaultstore: continuing without a log file";
        }
    }
    qInfo() << "vaultstore:" << command << "on" << service.vaultRoot();

    auto usage = [&parser]() {
        fprintf(stderr, "%s", qPrintable(parser.helpText()));
        return int(ExitUsage);
    };
    auto needs = [&rest](int n) { return rest.size() >= n; };

    qint64 id = 0;
    int rc = ExitOk;
    if (command == "init" || command == "info") {
        rc = report(command == "init" ? init : service.vaultInfo().result(),
                    [](const VaultInfo& v) { return v.toJson(); });
    } else if (command == "add") {
        bool sizeOk = false;
        const qint64 size = needs(4) ? rest.at(3).toLongLong(&sizeOk) : 0;
        if (!sizeOk || size < 0) return usage();
        rc = report(service.addAsset(rest.at(0), rest.at(1), rest.at(2), size).result(),
                    [](qint64 newId) { return QJsonObject{ {"id", newId} }; });
    } else if (command == "list") {
        rc = report(service.listAssets(parser.value(limitOpt).toInt(), parser.value(offsetOpt).toInt()).result(),
                    [](const QVector<AssetRow>& rows) { return rowsToJson(rows); });
    } else if (command == "get") {
        if (!needs(1) || !toId(rest.at(0), id)) return usage();
        rc = report(service.getAsset(id).result(), [](const AssetRow& r) { return r.toJson(); });
    } else if (command == "get-by-hash") {
        if (!needs(1)) return usage();
        rc = report(service.getAssetByHash(rest.at(0)).result(), [](const AssetRow& r) { return r.toJson(); });
    } else if (command == "delete") {
        if (!needs(1) || !toId(rest.at(0), id)) return usage();
        rc = report(service.deleteAsset(id).result(), [](bool deleted) { return QJsonObject{ {"deleted", deleted} }; });
    } else if (command == "tag") {
        if (!needs(2) || !toId(rest.at(0), id)) return usage();
        rc = report(service.addTag(id, rest.at(1), rest.value(2)).result(),
                    [](qint64 tagId) { return QJsonObject{ {"id", tagId} }; });
    } else if (command == "tags") {
        if (!needs(1) || !toId(rest.at(0), id)) return usage();
        rc = report(service.listTags(id).result(), [](const QVector<TagRow>& rows) { return rowsToJson(rows); });
    } else if (command == "annotate") {
        if (!needs(2) || !toId(rest.at(0), id)) return usage();
        rc = report(service.addAnnotation(id, rest.mid(1).join(' ')).result(),
                    [](qint64 noteId) { return QJsonObject{ {"id", noteId} }; });
    } else if (command == "annotations") {
        if (!needs(1) || !toId(rest.at(0), id)) return usage();
        rc = report(service.listAnnotations(id).result(),
                    [](const QVector<AnnotationRow>& rows) { return rowsToJson(rows); });
    } else if (command == "find-tags") {
        if (!needs(1)) return usage();
        const TagStore::Match match = parser.isSet(anyOpt) ? TagStore::Match::Any : TagStore::Match::All;
        rc = report(service.findAssetsByTags(rest, match).result(), idsToJson);
    } else if (command == "get-setting") {
        if (!needs(1)) return usage();
        rc = report(service.getSetting(rest.at(0)).result(), [](const QString& v) { return QJsonValue(v); });
    } else if (command == "set-setting") {
        if (!needs(2)) return usage();
        rc = report(service.setSetting(rest.at(0), rest.at(1)).result(),
                    [](bool ok) { return QJsonObject{ {"updated", ok} }; });
    } else if (command == "audit") {
        rc = report(service.recentAuditEvents(parser.value(hoursOpt).toInt(), parser.value(typeOpt)).result(),
                    [](const QVector<AuditEventRow>& rows) { return rowsToJson(rows); });
    } else if (command == "check") {
        const StoreResult<QVector<HealthCheckResult>> r = service.integrityCheck().result();
        rc = report(r, [](const QVector<HealthCheckResult>& rows) {
            return QJsonObject{ {"healthy", VaultMaintenance::isHealthy(rows)}, {"results", rowsToJson(rows)} };
        });
        if (rc == ExitOk && !VaultMaintenance::isHealthy(r.value)) rc = ExitFailed;
    } else if (command == "stats") {
        rc = report(service.databaseStats().result(), [](const DatabaseStats& s) { return s.toJson(); });
    } else if (command == "vacuum") {
        rc = report(service.incrementalVacuum().result(), [](bool ok) { return QJsonObject{ {"vacuumed", ok} }; });
    } else if (command == "backup") {
        rc = report(service.backupDatabase(rest.value(0)).result(),
                    [](const QString& path) { return QJsonObject{ {"path", path} }; });
    } else if (command == "purge") {
        rc = report(service.purgeDeletedAssets().result(), [](int n) { return QJsonObject{ {"purged", n} }; });
    } else if (command == "cleanup-temp") {
        rc = report(service.cleanupTemp().result(), [](int n) { return QJsonObject{ {"removed", n} }; });
    } else if (command == "encrypt") {
        if (!needs(1)) return usage();
        rc = reportGateway(service.encryptFile(rest.at(0), readPassword()).result());
    } else if (command == "decrypt") {
        if (!needs(2)) return usage();
        rc = reportGateway(service.decryptFile(rest.at(0), readPassword(), rest.at(1)).result());
    } else if (command == "vault-init") {
        rc = reportGateway(service.initializeVault(readPassword()).result());
    } else if (command == "unlock") {
        rc = reportGateway(service.unlockVault(readPassword()).result());
    } else if (command == "lock") {
        rc = reportGateway(service.lockVault().result());
    } else if (command == "status") {
        const GatewayResult r = service.vaultStatus().result();
        QJsonObject out = r.toJson();
        for (const char* key : { "vault_exists", "is_locked", "message" }) {
            if (r.envelope.contains(QLatin1String(key))) out[QLatin1String(key)] = r.envelope.value(QLatin1String(key));
        }
        printJson(out);
        rc = r.isSuccess() ? ExitOk : ExitFailed;
    } else {
        fprintf(stderr, "vaultstore: unknown command '%s'\n", qPrintable(command));
        return usage();
    }

    service.shutdown();
    LogManager::instance().flush();
    return rc;
}
