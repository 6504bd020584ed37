#include "vault_service.h"
#include "asset_catalog.h"
#include "audit_log.h"
#include "schema_manager.h"
#include "vault_meta_store.h"
#include "vault_paths.h"
#include <QtConcurrent>
#include <QDir>
#include <QDebug>

namespace {

// Audit is best-effort: a failed record never changes the command's outcome.
void audit(VaultConnection& conn, const QString& eventType, const QString& status, const QString& details)
{
    StoreError err;
    if (!AuditLog(conn).record(eventType, status, details, &err)) {
        qWarning() << "VaultService: audit record" << eventType << "was not written:" << err.message;
    }
}

} // namespace

VaultService::VaultService(const VaultConfig& config, std::unique_ptr<ProcessRunner> runner)
    : m_vaultRoot(QDir(config.vaultRoot).absolutePath())
{
    m_gateway = std::make_unique<EncryptionGatewayClient>(config.gatewayProgram, config.gatewayScript,
                                                          m_vaultRoot, std::move(runner));
    m_gateway->setTimeoutMs(config.gatewayTimeoutMs);

    // One long-lived writer thread: its connection stays valid for the
    // service's lifetime and is closed on that same thread in shutdown().
    m_storePool.setMaxThreadCount(1);
    m_storePool.setExpiryTimeout(-1);
    m_gatewayPool.setMaxThreadCount(2);
}

VaultService::~VaultService()
{
    shutdown();
}

template <typename T, typename Fn>
QFuture<StoreResult<T>> VaultService::onStore(Fn fn)
{
    return QtConcurrent::run(&m_storePool, [this, fn]() {
        StoreResult<T> result;
        if (!m_conn) {
            setStoreError(&result.error, StoreError::IOError, QStringLiteral("vault store is not initialized"));
            return result;
        }
        result.value = fn(*m_conn, &result.error);
        return result;
    });
}

QFuture<StoreResult<VaultInfo>> VaultService::initialize()
{
    return QtConcurrent::run(&m_storePool, [this]() {
        StoreResult<VaultInfo> result;
        if (m_conn) {
            m_conn->closeThreadConnection();
            m_conn.reset();
        }
        m_conn = SchemaManager::initialize(m_vaultRoot, &result.error);
        if (!m_conn) {
            qCritical() << "VaultService: store initialization failed:" << result.error.message;
            return result;
        }
        if (m_clock) m_conn->setClock(m_clock);
        result.value = VaultMetaStore(*m_conn).vaultInfo(&result.error);
        return result;
    });
}

QFuture<StoreResult<qint64>> VaultService::addAsset(const QString& contentHash, const QString& encryptedName,
                                                    const QString& storagePath, qint64 sizeBytes)
{
    // Catalog paths are relative to the vault root.
    const QString relativePath = VaultPaths::relativeToRoot(m_vaultRoot, storagePath);
    return onStore<qint64>([=](VaultConnection& conn, StoreError* error) {
        const qint64 id = AssetCatalog(conn).insert(contentHash, encryptedName, relativePath, sizeBytes, error);
        if (id > 0) {
            audit(conn, "image_added", "success", QString("asset %1 stored at %2").arg(id).arg(relativePath));
        } else {
            audit(conn, "image_added", "failure", error->message);
        }
        return id;
    });
}

QFuture<StoreResult<QVector<AssetRow>>> VaultService::listAssets(int limit, int offset)
{
    return onStore<QVector<AssetRow>>([=](VaultConnection& conn, StoreError* error) {
        AssetCatalog catalog(conn);
        if (limit < 0 && offset <= 0) return catalog.listActive(error);
        return catalog.listActive(limit, offset, error);
    });
}

QFuture<StoreResult<AssetRow>> VaultService::getAsset(qint64 id)
{
    return onStore<AssetRow>([=](VaultConnection& conn, StoreError* error) {
        return AssetCatalog(conn).getById(id, error);
    });
}

QFuture<StoreResult<AssetRow>> VaultService::getAssetByHash(const QString& contentHash)
{
    return onStore<AssetRow>([=](VaultConnection& conn, StoreError* error) {
        return AssetCatalog(conn).getByHash(contentHash, error);
    });
}

QFuture<StoreResult<bool>> VaultService::deleteAsset(qint64 id)
{
    return onStore<bool>([=](VaultConnection& conn, StoreError* error) {
        AssetCatalog catalog(conn);
        StoreError lookup;
        const AssetRow row = catalog.getById(id, &lookup);
        if (!row.isValid()) {
            if (lookup.kind != StoreError::NotFound) setStoreError(error, lookup);
            return false;
        }
        if (!catalog.softDelete(id, error)) return false;
        audit(conn, "image_deleted", "success", QString("asset %1").arg(id));
        return true;
    });
}

QFuture<StoreResult<qint64>> VaultService::addTag(qint64 assetId, const QString& name, const QString& kind)
{
    return onStore<qint64>([=](VaultConnection& conn, StoreError* error) {
        return TagStore(conn).addTag(assetId, name, kind, error);
    });
}

QFuture<StoreResult<QVector<TagRow>>> VaultService::listTags(qint64 assetId)
{
    return onStore<QVector<TagRow>>([=](VaultConnection& conn, StoreError* error) {
        return TagStore(conn).listTags(assetId, error);
    });
}

QFuture<StoreResult<qint64>> VaultService::addAnnotation(qint64 assetId, const QString& note)
{
    return onStore<qint64>([=](VaultConnection& conn, StoreError* error) {
        return TagStore(conn).addAnnotation(assetId, note, error);
    });
}

QFuture<StoreResult<QVector<AnnotationRow>>> VaultService::listAnnotations(qint64 assetId)
{
    return onStore<QVector<AnnotationRow>>([=](VaultConnection& conn, StoreError* error) {
        return TagStore(conn).listAnnotations(assetId, error);
    });
}

QFuture<StoreResult<QVector<qint64>>> VaultService::findAssetsByTags(const QStringList& names, TagStore::Match match)
{
    return onStore<QVector<qint64>>([=](VaultConnection& conn, StoreError* error) {
        return TagStore(conn).assetsWithTags(names, match, error);
    });
}

QFuture<StoreResult<QString>> VaultService::getSetting(const QString& key)
{
    return onStore<QString>([=](VaultConnection& conn, StoreError* error) {
        return VaultMetaStore(conn).get(key, error);
    });
}

QFuture<StoreResult<bool>> VaultService::setSetting(const QString& key, const QString& value)
{
    return onStore<bool>([=](VaultConnection& conn, StoreError* error) {
        return VaultMetaStore(conn).set(key, value, error);
    });
}

QFuture<StoreResult<VaultInfo>> VaultService::vaultInfo()
{
    return onStore<VaultInfo>([](VaultConnection& conn, StoreError* error) {
        return VaultMetaStore(conn).vaultInfo(error);
    });
}

QFuture<StoreResult<QVector<AuditEventRow>>> VaultService::recentAuditEvents(int hours, const QString& eventType)
{
    return onStore<QVector<AuditEventRow>>([=](VaultConnection& conn, StoreError* error) {
        return AuditLog(conn).recentEvents(hours, eventType, error);
    });
}

QFuture<StoreResult<QVector<HealthCheckResult>>> VaultService::integrityCheck()
{
    return onStore<QVector<HealthCheckResult>>([](VaultConnection& conn, StoreError* error) {
        return VaultMaintenance(conn).integrityCheck(error);
    });
}

QFuture<StoreResult<DatabaseStats>> VaultService::databaseStats()
{
    return onStore<DatabaseStats>([](VaultConnection& conn, StoreError* error) {
        return VaultMaintenance(conn).databaseStats(error);
    });
}

QFuture<StoreResult<bool>> VaultService::incrementalVacuum()
{
    return onStore<bool>([](VaultConnection& conn, StoreError* error) {
        return VaultMaintenance(conn).incrementalVacuum(0, error);
    });
}

QFuture<StoreResult<QString>> VaultService::backupDatabase(const QString& targetPath)
{
    return onStore<QString>([=](VaultConnection& conn, StoreError* error) {
        return VaultMaintenance(conn).backupDatabase(targetPath, error);
    });
}

QFuture<StoreResult<int>> VaultService::purgeDeletedAssets()
{
    return onStore<int>([](VaultConnection& conn, StoreError* error) {
        return VaultMaintenance(conn).purgeDeletedAssets(error);
    });
}

QFuture<StoreResult<int>> VaultService::cleanupTemp()
{
    return onStore<int>([](VaultConnection& conn, StoreError* error) {
        return VaultMaintenance(conn).cleanupTemp(error);
    });
}

void VaultService::auditGatewayOutcome(const QString& eventType, const GatewayResult& result)
{
    const QString status = result.isSuccess() ? QStringLiteral("success") : QStringLiteral("failure");
    const QString details = result.isSuccess()
        ? QString()
        : GatewayResult::outcomeName(result.outcome) + QStringLiteral(": ") + result.reason;
    const StoreResult<bool> written = onStore<bool>([=](VaultConnection& conn, StoreError* error) {
        return AuditLog(conn).record(eventType, status, details, error);
    }).result();
    if (!written.value) {
        qWarning() << "VaultService: audit record" << eventType << "was not written:" << written.error.message;
    }
}

QFuture<GatewayResult> VaultService::encryptFile(const QString& sourcePath, const QString& password)
{
    return QtConcurrent::run(&m_gatewayPool, [this, sourcePath, password]() {
        GatewayResult result = m_gateway->encryptFile(sourcePath, password);
        // The reference is what callers record as the asset's storage path.
        if (result.isSuccess()) result.outputRef = VaultPaths::relativeToRoot(m_vaultRoot, result.outputRef);
        return result;
    });
}

QFuture<GatewayResult> VaultService::decryptFile(const QString& encryptedPath, const QString& password, const QString& outputPath)
{
    return QtConcurrent::run(&m_gatewayPool, [this, encryptedPath, password, outputPath]() {
        return m_gateway->decryptFile(encryptedPath, password, outputPath);
    });
}

QFuture<GatewayResult> VaultService::initializeVault(const QString& password)
{
    return QtConcurrent::run(&m_gatewayPool, [this, password]() {
        const GatewayResult result = m_gateway->initializeVault(password);
        auditGatewayOutcome("vault_initialized", result);
        return result;
    });
}

QFuture<GatewayResult> VaultService::unlockVault(const QString& password)
{
    return QtConcurrent::run(&m_gatewayPool, [this, password]() {
        const GatewayResult result = m_gateway->unlockVault(password);
        auditGatewayOutcome("vault_unlocked", result);
        return result;
    });
}

QFuture<GatewayResult> VaultService::lockVault()
{
    return QtConcurrent::run(&m_gatewayPool, [this]() {
        const GatewayResult result = m_gateway->lockVault();
        auditGatewayOutcome("vault_locked", result);
        return result;
    });
}

QFuture<GatewayResult> VaultService::vaultStatus()
{
    return QtConcurrent::run(&m_gatewayPool, [this]() {
        return m_gateway->vaultStatus();
    });
}

void VaultService::shutdown()
{
    if (m_shutdown) return;
    m_shutdown = true;

    // Gateway tasks may still post audit records to the store thread.
    m_gatewayPool.waitForDone();

    QFuture<void> closed = QtConcurrent::run(&m_storePool, [this]() {
        if (m_conn) m_conn->closeThreadConnection();
    });
    closed.waitForFinished();
    m_storePool.waitForDone();

    if (m_conn) {
        m_conn->close();
        m_conn.reset();
    }
    qDebug() << "VaultService: shut down" << m_vaultRoot;
}
