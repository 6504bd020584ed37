#include "vault_connection.h"
#include "utils.h"
#include <QAtomicInt>
#include <QCoreApplication>
#include <QMutexLocker>
#include <QThread>
#include <QDebug>

namespace {

QAtomicInt s_handleCounter;
QAtomicInt s_threadCounter;

// Per-connection configuration, applied once when a thread's connection opens and
// before any statement runs on it. page_size and auto_vacuum only take effect on a
// fresh file, so they go before the journal mode switch creates one.
const char* const kConnectionPragmas[] = {
    "PRAGMA page_size=4096;",
    "PRAGMA auto_vacuum=INCREMENTAL;",
    "PRAGMA foreign_keys=ON;",
    "PRAGMA journal_mode=WAL;",
    "PRAGMA synchronous=NORMAL;",
    "PRAGMA secure_delete=ON;",
    "PRAGMA temp_store=MEMORY;",
    "PRAGMA cache_size=-64000;"   // 64MB
};

const char* const kBusyTimeoutOption = "QSQLITE_BUSY_TIMEOUT=5000";

} // namespace

VaultConnection::VaultConnection(const QString& vaultRoot, const QString& dbFilePath)
    : m_vaultRoot(vaultRoot)
    , m_dbFilePath(dbFilePath)
    , m_baseName(QStringLiteral("vault-%1").arg(s_handleCounter.fetchAndAddRelaxed(1)))
    , m_open(std::make_shared<OpenConnections>())
{
}

VaultConnection::~VaultConnection()
{
    close();
}

QString VaultConnection::connectionNameForCurrentThread() const
{
    // Thread addresses get reused once a thread is gone; this id never is.
    thread_local const int threadId = s_threadCounter.fetchAndAddRelaxed(1);
    return m_baseName + QStringLiteral("@t") + QString::number(threadId);
}

QSqlDatabase VaultConnection::database(StoreError* error)
{
    const QString name = connectionNameForCurrentThread();
    if (QSqlDatabase::contains(name)) {
        QSqlDatabase existing = QSqlDatabase::database(name, false);
        if (existing.isOpen()) return existing;
    }

    const bool registered = QSqlDatabase::contains(name);
    QSqlDatabase db = registered
        ? QSqlDatabase::database(name, false)
        : QSqlDatabase::addDatabase(QStringLiteral("QSQLITE"), name);
    db.setDatabaseName(m_dbFilePath);
    db.setConnectOptions(QString::fromLatin1(kBusyTimeoutOption));
    {
        QMutexLocker locker(&m_open->mutex);
        m_open->names.insert(name);
    }
    if (!registered) releaseOnThreadExit(name);

    if (!db.open()) {
        StoreError err = StoreError::fromSqlError(db.lastError(), "VaultConnection: open " + m_dbFilePath);
        err.kind = StoreError::IOError;
        qWarning() << "VaultConnection: DB open failed:" << m_dbFilePath << db.lastError();
        setStoreError(error, err);
        return db;
    }
    if (!configure(db, error)) {
        db.close();
        return db;
    }

    qDebug() << "VaultConnection: opened" << name << "on" << m_dbFilePath;
    return db;
}

void VaultConnection::releaseOnThreadExit(const QString& name)
{
    QThread* thread = QThread::currentThread();
    const QCoreApplication* app = QCoreApplication::instance();
    if (!thread || (app && thread == app->thread())) return;

    // finished() is emitted on the exiting thread itself, the only thread allowed to close this connection.
    std::shared_ptr<OpenConnections> open = m_open;
    QObject::connect(thread, &QThread::finished, thread, [open, name]() {
        release(*open, name);
    }, Qt::DirectConnection);
}

void VaultConnection::release(OpenConnections& open, const QString& name)
{
    {
        QMutexLocker locker(&open.mutex);
        if (!open.names.remove(name)) return;
    }
    {
        QSqlDatabase db = QSqlDatabase::database(name, false);
        db.close();
    }
    QSqlDatabase::removeDatabase(name);
}

bool VaultConnection::configure(QSqlDatabase& db, StoreError* error)
{
    for (const char* pragma : kConnectionPragmas) {
        QSqlQuery q(db);
        if (!q.exec(QString::fromLatin1(pragma))) {
            qWarning() << "VaultConnection: pragma failed:" << pragma << q.lastError();
            return setStoreError(error, StoreError::fromSqlError(q.lastError(), QString::fromLatin1(pragma)));
        }
    }
    return true;
}

bool VaultConnection::exec(const QString& sql, StoreError* error)
{
    QSqlDatabase db = database(error);
    if (!db.isOpen()) return false;
    QSqlQuery q(db);
    if (!q.exec(sql)) {
        qWarning() << "SQL failed:" << sql << q.lastError();
        return setStoreError(error, StoreError::fromSqlError(q.lastError(), sql.simplified()));
    }
    return true;
}

QString VaultConnection::now() const
{
    Clock clock;
    {
        QMutexLocker locker(&m_clockMutex);
        clock = m_clock;
    }
    return Utils::toIsoUtc(clock ? clock() : QDateTime::currentDateTimeUtc());
}

void VaultConnection::setClock(Clock clock)
{
    QMutexLocker locker(&m_clockMutex);
    m_clock = std::move(clock);
}

void VaultConnection::closeThreadConnection()
{
    release(*m_open, connectionNameForCurrentThread());
}

void VaultConnection::close()
{
    closeThreadConnection();

    QSet<QString> names;
    {
        QMutexLocker locker(&m_open->mutex);
        names.swap(m_open->names);
    }
    // Connections owned by threads that are still alive; the driver closes on removal.
    for (const QString& name : names) {
        QSqlDatabase::removeDatabase(name);
    }
}

int VaultConnection::openConnectionCount() const
{
    QMutexLocker locker(&m_open->mutex);
    return m_open->names.size();
}
