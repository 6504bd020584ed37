#include "vault_types.h"

QJsonObject AssetRow::toJson() const
{
    return QJsonObject{
        {"id", id},
        {"content_hash", contentHash},
        {"encrypted_name", encryptedName},
        {"storage_path", storagePath},
        {"created_at", createdAt},
        {"updated_at", updatedAt},
        {"size_bytes", sizeBytes},
        {"deleted", deleted}
    };
}

QJsonObject TagRow::toJson() const
{
    QJsonObject o{
        {"id", id},
        {"asset_id", assetId},
        {"name", name},
        {"created_at", createdAt}
    };
    if (!kind.isEmpty()) o.insert("kind", kind);
    return o;
}

QJsonObject AnnotationRow::toJson() const
{
    return QJsonObject{
        {"id", id},
        {"asset_id", assetId},
        {"note", note},
        {"created_at", createdAt}
    };
}

QJsonObject AuditEventRow::toJson() const
{
    QJsonObject o{
        {"id", id},
        {"event_type", eventType},
        {"timestamp", timestamp},
        {"status", status}
    };
    if (!details.isEmpty()) o.insert("details", details);
    return o;
}

QJsonObject VaultInfo::toJson() const
{
    return QJsonObject{
        {"vault_id", vaultId},
        {"created_at", createdAt},
        {"schema_version", schemaVersion},
        {"total_active_assets", totalActiveAssets},
        {"status", status}
    };
}
