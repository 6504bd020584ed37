#include "store_error.h"

namespace {

// Primary SQLite result codes; the driver may report extended codes, whose low byte is the primary one.
constexpr int kSqliteReadOnly = 8;
constexpr int kSqliteIoErr = 10;
constexpr int kSqliteCorrupt = 11;
constexpr int kSqliteFull = 13;
constexpr int kSqliteCantOpen = 14;
constexpr int kSqliteNotADb = 26;

bool isIoCode(int code)
{
    switch (code & 0xff) {
    case kSqliteReadOnly:
    case kSqliteIoErr:
    case kSqliteCorrupt:
    case kSqliteFull:
    case kSqliteCantOpen:
    case kSqliteNotADb:
        return true;
    default:
        return false;
    }
}

} // namespace

QString StoreError::kindName(Kind kind)
{
    switch (kind) {
    case None: return QStringLiteral("None");
    case NotFound: return QStringLiteral("NotFound");
    case UniqueConstraintViolation: return QStringLiteral("UniqueConstraintViolation");
    case ForeignKeyViolation: return QStringLiteral("ForeignKeyViolation");
    case IOError: return QStringLiteral("IOError");
    case StorageError: return QStringLiteral("StorageError");
    }
    return QStringLiteral("Unknown");
}

StoreError StoreError::fromSqlError(const QSqlError& err, const QString& context)
{
    StoreError out;
    out.message = context + ": " + err.text();

    const QString dbText = err.databaseText();
    bool codeOk = false;
    const int code = err.nativeErrorCode().toInt(&codeOk);

    if (dbText.contains(QLatin1String("FOREIGN KEY constraint failed"), Qt::CaseInsensitive)) {
        out.kind = ForeignKeyViolation;
    } else if (dbText.contains(QLatin1String("UNIQUE constraint failed"), Qt::CaseInsensitive)
               || dbText.contains(QLatin1String("PRIMARY KEY"), Qt::CaseInsensitive)) {
        out.kind = UniqueConstraintViolation;
    } else if (err.type() == QSqlError::ConnectionError || (codeOk && isIoCode(code))) {
        out.kind = IOError;
    } else {
        out.kind = StorageError;
    }
    return out;
}

bool setStoreError(StoreError* out, StoreError::Kind kind, const QString& message)
{
    if (out) {
        out->kind = kind;
        out->message = message;
    }
    return false;
}

bool setStoreError(StoreError* out, const StoreError& err)
{
    if (out) *out = err;
    return false;
}
