#pragma once
#include <QFuture>
#include <QThreadPool>
#include <QString>
#include <QStringList>
#include <QVector>
#include <memory>

#include "encryption_gateway.h"
#include "store_error.h"
#include "tag_store.h"
#include "vault_config.h"
#include "vault_connection.h"
#include "vault_maintenance.h"
#include "vault_types.h"

// Value plus the typed failure that produced it, carried through a QFuture.
template <typename T>
struct StoreResult {
    T value{};
    StoreError error;

    bool ok() const { return !error.isError(); }
};

/**
 * VaultService - application-facing command surface.
 *
 * Every store command runs on one dedicated worker thread, so writes are
 * serialised and each read sees the latest committed state. Collaborator calls
 * run on a separate pool and never hold up catalog commands.
 *
 * Audit records follow the primary write as a separate statement; a failed
 * record is logged and the command still reports its own outcome.
 */
class VaultService {
public:
    explicit VaultService(const VaultConfig& config, std::unique_ptr<ProcessRunner> runner = nullptr);
    ~VaultService();

    VaultService(const VaultService&) = delete;
    VaultService& operator=(const VaultService&) = delete;

    // Clock for every stored timestamp. Call before initialize().
    void setClock(VaultConnection::Clock clock) { m_clock = std::move(clock); }
    QString vaultRoot() const { return m_vaultRoot; }

    QFuture<StoreResult<VaultInfo>> initialize();

    // Assets
    QFuture<StoreResult<qint64>> addAsset(const QString& contentHash, const QString& encryptedName,
                                          const QString& storagePath, qint64 sizeBytes);
    QFuture<StoreResult<QVector<AssetRow>>> listAssets(int limit = -1, int offset = 0);
    QFuture<StoreResult<AssetRow>> getAsset(qint64 id);
    QFuture<StoreResult<AssetRow>> getAssetByHash(const QString& contentHash);
    // Value is false when there was no active asset to delete.
    QFuture<StoreResult<bool>> deleteAsset(qint64 id);

    // Tags and annotations
    QFuture<StoreResult<qint64>> addTag(qint64 assetId, const QString& name, const QString& kind = QString());
    QFuture<StoreResult<QVector<TagRow>>> listTags(qint64 assetId);
    QFuture<StoreResult<qint64>> addAnnotation(qint64 assetId, const QString& note);
    QFuture<StoreResult<QVector<AnnotationRow>>> listAnnotations(qint64 assetId);
    QFuture<StoreResult<QVector<qint64>>> findAssetsByTags(const QStringList& names, TagStore::Match match);

    // Vault settings
    QFuture<StoreResult<QString>> getSetting(const QString& key);
    QFuture<StoreResult<bool>> setSetting(const QString& key, const QString& value);
    QFuture<StoreResult<VaultInfo>> vaultInfo();
    QFuture<StoreResult<QVector<AuditEventRow>>> recentAuditEvents(int hours = 24, const QString& eventType = QString());

    // Maintenance
    QFuture<StoreResult<QVector<HealthCheckResult>>> integrityCheck();
    QFuture<StoreResult<DatabaseStats>> databaseStats();
    QFuture<StoreResult<bool>> incrementalVacuum();
    QFuture<StoreResult<QString>> backupDatabase(const QString& targetPath = QString());
    QFuture<StoreResult<int>> purgeDeletedAssets();
    QFuture<StoreResult<int>> cleanupTemp();

    // Delegated to the encryption collaborator
    QFuture<GatewayResult> encryptFile(const QString& sourcePath, const QString& password);
    QFuture<GatewayResult> decryptFile(const QString& encryptedPath, const QString& password, const QString& outputPath);
    QFuture<GatewayResult> initializeVault(const QString& password);
    QFuture<GatewayResult> unlockVault(const QString& password);
    QFuture<GatewayResult> lockVault();
    QFuture<GatewayResult> vaultStatus();

    // Drains both pools and releases every database connection. Idempotent.
    void shutdown();

private:
    template <typename T, typename Fn>
    QFuture<StoreResult<T>> onStore(Fn fn);

    void auditGatewayOutcome(const QString& eventType, const GatewayResult& result);

    QString m_vaultRoot;
    VaultConnection::Clock m_clock;
    std::unique_ptr<VaultConnection> m_conn;   // touched on the store thread only
    std::unique_ptr<EncryptionGatewayClient> m_gateway;
    QThreadPool m_storePool;
    QThreadPool m_gatewayPool;
    bool m_shutdown = false;
};
