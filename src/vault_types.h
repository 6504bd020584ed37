#pragma once
#include <QString>
#include <QVector>
#include <QJsonObject>
#include <QJsonArray>

// One ingested file. Timestamps are ISO-8601 UTC strings.
struct AssetRow {
    qint64 id = 0;
    QString contentHash;
    QString encryptedName;   // opaque; the clear filename is never stored
    QString storagePath;     // relative to the vault root
    QString createdAt;
    QString updatedAt;
    qint64 sizeBytes = 0;
    bool deleted = false;

    bool isValid() const { return id > 0; }
    QJsonObject toJson() const;
};

struct TagRow {
    qint64 id = 0;
    qint64 assetId = 0;
    QString name;
    QString kind;            // optional classifier, empty when unset
    QString createdAt;

    bool isValid() const { return id > 0; }
    QJsonObject toJson() const;
};

struct AnnotationRow {
    qint64 id = 0;
    qint64 assetId = 0;
    QString note;
    QString createdAt;

    bool isValid() const { return id > 0; }
    QJsonObject toJson() const;
};

struct AuditEventRow {
    qint64 id = 0;
    QString eventType;
    QString timestamp;
    QString status;
    QString details;

    bool isValid() const { return id > 0; }
    QJsonObject toJson() const;
};

// Read-only composite view over the reserved VaultMeta keys plus the live asset count.
struct VaultInfo {
    QString vaultId;
    QString createdAt;
    QString schemaVersion;
    qint64 totalActiveAssets = 0;
    QString status;

    QJsonObject toJson() const;
};

template <typename Row>
QJsonArray rowsToJson(const QVector<Row>& rows)
{
    QJsonArray arr;
    for (const Row& r : rows) arr.append(r.toJson());
    return arr;
}
