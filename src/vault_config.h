#pragma once
#include <QString>

class QSettings;

// Process-level settings (where the vault lives, how to reach the encryption
// collaborator, where to log). Vault-owned settings live in VaultMetaStore.
struct VaultConfig {
    QString vaultRoot;
    QString gatewayProgram = QStringLiteral("python3");
    QString gatewayScript;
    int gatewayTimeoutMs = -1;
    QString logFile;          // empty disables the file sink
    QString logLevel = QStringLiteral("INFO");

    // Reads the INI file at `iniPath`, or the per-user GraphiVault/VaultStore
    // settings when it is empty. Missing keys take their defaults.
    static VaultConfig load(const QString& iniPath = QString());
    static VaultConfig fromSettings(QSettings& settings);
    void save(QSettings& settings) const;

    static QString defaultVaultRoot();
    // <vault root>/data/vaultstore.log
    static QString defaultLogFile(const QString& vaultRoot);
};
