#pragma once
#include <QString>
#include <QSqlError>

// Typed failure reported by the store components through an optional out-parameter.
struct StoreError {
    enum Kind {
        None,
        NotFound,
        UniqueConstraintViolation,
        ForeignKeyViolation,
        IOError,
        StorageError
    };

    Kind kind = None;
    QString message;

    bool isError() const { return kind != None; }
    void clear() { kind = None; message.clear(); }

    static QString kindName(Kind kind);
    static StoreError fromSqlError(const QSqlError& err, const QString& context);
};

// Fills *out when the caller asked for error details. Always returns false so a
// failing bool operation can end with `return setStoreError(error, ...);`.
bool setStoreError(StoreError* out, StoreError::Kind kind, const QString& message);
bool setStoreError(StoreError* out, const StoreError& err);
