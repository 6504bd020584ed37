#include "vault_config.h"
#include "vault_paths.h"
#include <QSettings>
#include <QStandardPaths>
#include <QDir>
#include <QDebug>

QString VaultConfig::defaultVaultRoot()
{
    QString base = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (base.isEmpty()) base = QDir::homePath() + QStringLiteral("/.graphivault");
    return QDir(base).filePath(QStringLiteral("vault"));
}

QString VaultConfig::defaultLogFile(const QString& vaultRoot)
{
    return QDir(VaultPaths::dataDir(vaultRoot)).filePath(QStringLiteral("vaultstore.log"));
}

VaultConfig VaultConfig::load(const QString& iniPath)
{
    if (!iniPath.isEmpty()) {
        QSettings settings(iniPath, QSettings::IniFormat);
        if (settings.status() != QSettings::NoError) {
            qWarning() << "VaultConfig: cannot read" << iniPath << "- using defaults";
        }
        return fromSettings(settings);
    }
    QSettings settings(QSettings::IniFormat, QSettings::UserScope, "GraphiVault", "VaultStore");
    return fromSettings(settings);
}

VaultConfig VaultConfig::fromSettings(QSettings& settings)
{
    VaultConfig cfg;
    cfg.vaultRoot = settings.value("vault/root", defaultVaultRoot()).toString();
    cfg.gatewayProgram = settings.value("gateway/program", cfg.gatewayProgram).toString();
    cfg.gatewayScript = settings.value("gateway/script", QString()).toString();

    bool ok = false;
    const int timeout = settings.value("gateway/timeoutMs", -1).toInt(&ok);
    cfg.gatewayTimeoutMs = (ok && timeout > 0) ? timeout : -1;

    // Absent key means the default file; an explicitly empty value disables it.
    cfg.logFile = settings.contains("log/file") ? settings.value("log/file").toString()
                                                : defaultLogFile(cfg.vaultRoot);
    cfg.logLevel = settings.value("log/level", cfg.logLevel).toString().toUpper();
    return cfg;
}

void VaultConfig::save(QSettings& settings) const
{
    settings.setValue("vault/root", vaultRoot);
    settings.setValue("gateway/program", gatewayProgram);
    settings.setValue("gateway/script", gatewayScript);
    settings.setValue("gateway/timeoutMs", gatewayTimeoutMs);
    settings.setValue("log/file", logFile);
    settings.setValue("log/level", logLevel);
    settings.sync();
}
