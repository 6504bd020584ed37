#pragma once
#include <QString>
#include <QVector>

#include "store_error.h"
#include "vault_connection.h"
#include "vault_types.h"

// Append-only ledger of security-relevant events. The table rejects UPDATE and
// DELETE, so rows written here are final.
//
// Writes are best-effort relative to the operation they describe: callers log a
// failed record() and carry on, they never undo their own write because of it.
class AuditLog {
public:
    explicit AuditLog(VaultConnection& conn);

    bool record(const QString& eventType, const QString& status,
                const QString& details = QString(), StoreError* error = nullptr);

    // Events newer than `hours` ago, newest first. Empty eventType matches all.
    QVector<AuditEventRow> recentEvents(int hours = 24, const QString& eventType = QString(),
                                        StoreError* error = nullptr) const;

private:
    VaultConnection& m_conn;
};
