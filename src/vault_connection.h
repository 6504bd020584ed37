#pragma once
#include <QSqlDatabase>
#include <QSqlQuery>
#include <QSqlError>
#include <QDateTime>
#include <QMutex>
#include <QSet>
#include <QString>
#include <functional>
#include <memory>

#include "store_error.h"

// Connection handle for one vault database. Produced by SchemaManager::initialize
// and passed by reference to every store; never held in global state.
//
// Qt SQL connections may only be used from the thread that created them, so the
// handle opens one QSqlDatabase per calling thread and configures it once. A
// QThread's connection is released when that thread finishes.
class VaultConnection {
public:
    using Clock = std::function<QDateTime()>;

    VaultConnection(const QString& vaultRoot, const QString& dbFilePath);
    ~VaultConnection();

    VaultConnection(const VaultConnection&) = delete;
    VaultConnection& operator=(const VaultConnection&) = delete;

    QString vaultRoot() const { return m_vaultRoot; }
    QString databasePath() const { return m_dbFilePath; }

    // Connection for the calling thread; opened and configured on first use.
    // Returns an invalid/closed database on failure and fills *error.
    QSqlDatabase database(StoreError* error = nullptr);

    // Runs one statement on the calling thread's connection.
    bool exec(const QString& sql, StoreError* error = nullptr);

    // Current time from the injected clock, formatted for storage.
    QString now() const;
    void setClock(Clock clock);

    // Closes the calling thread's connection (used by worker threads before they go away).
    void closeThreadConnection();
    // Closes and unregisters every connection this handle opened.
    void close();

    // Connections currently registered, one per thread that used the handle.
    int openConnectionCount() const;

private:
    // Shared with the thread-exit hooks, which may run after the handle is gone.
    struct OpenConnections {
        QMutex mutex;
        QSet<QString> names;
    };

    QString connectionNameForCurrentThread() const;
    bool configure(QSqlDatabase& db, StoreError* error);
    void releaseOnThreadExit(const QString& name);
    static void release(OpenConnections& open, const QString& name);

    QString m_vaultRoot;
    QString m_dbFilePath;
    QString m_baseName;

    std::shared_ptr<OpenConnections> m_open;
    mutable QMutex m_clockMutex;
    Clock m_clock;
};
