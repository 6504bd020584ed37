#pragma once
#include <QString>
#include <QStringList>
#include <QVector>

#include "store_error.h"
#include "vault_connection.h"
#include "vault_types.h"

// Tags and annotations hang off a physical asset row and go away with it
// (ON DELETE CASCADE). Soft-deleting the asset leaves them in place.
class TagStore {
public:
    enum class Match { All, Any };

    explicit TagStore(VaultConnection& conn);

    // Tags ops. Duplicate names on one asset are allowed.
    qint64 addTag(qint64 assetId, const QString& name, const QString& kind = QString(), StoreError* error = nullptr);
    QVector<TagRow> listTags(qint64 assetId, StoreError* error = nullptr) const;

    // Annotation ops
    qint64 addAnnotation(qint64 assetId, const QString& note, StoreError* error = nullptr);
    QVector<AnnotationRow> listAnnotations(qint64 assetId, StoreError* error = nullptr) const;

    // Ids of active assets carrying all (or any) of the given tag names, most recent first.
    QVector<qint64> assetsWithTags(const QStringList& names, Match match, StoreError* error = nullptr) const;

private:
    VaultConnection& m_conn;
};
