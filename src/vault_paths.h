#pragma once

#include <QString>
#include <QStringList>
#include <QFileInfo>
#include <QDir>

/**
 * VaultPaths - on-disk layout of a vault root.
 *
 *   <root>/data/        embedded database file (and the default log file)
 *   <root>/encrypted/   encrypted artifact bytes
 *   <root>/thumbnails/  derived preview artifacts
 *   <root>/temp/        scratch space
 *   <root>/backups/     export/backup artifacts
 */
namespace VaultPaths {

inline constexpr const char* kDataDir = "data";
inline constexpr const char* kEncryptedDir = "encrypted";
inline constexpr const char* kThumbnailsDir = "thumbnails";
inline constexpr const char* kTempDir = "temp";
inline constexpr const char* kBackupsDir = "backups";
inline constexpr const char* kDatabaseFileName = "graphivault.db";

inline QString subdir(const QString& root, const char* name)
{
    return QDir(root).filePath(QString::fromLatin1(name));
}

inline QString dataDir(const QString& root) { return subdir(root, kDataDir); }
inline QString encryptedDir(const QString& root) { return subdir(root, kEncryptedDir); }
inline QString thumbnailsDir(const QString& root) { return subdir(root, kThumbnailsDir); }
inline QString tempDir(const QString& root) { return subdir(root, kTempDir); }
inline QString backupsDir(const QString& root) { return subdir(root, kBackupsDir); }

inline QString databaseFile(const QString& root)
{
    return QDir(dataDir(root)).filePath(QString::fromLatin1(kDatabaseFileName));
}

// Every directory the schema manager creates, in creation order.
inline QStringList layoutDirs(const QString& root)
{
    return { dataDir(root), encryptedDir(root), thumbnailsDir(root), tempDir(root), backupsDir(root) };
}

/**
 * Check if a directory exists at the given path.
 */
inline bool dirExists(const QString& dirPath)
{
    QFileInfo fi(dirPath);
    return fi.exists() && fi.isDir();
}

/**
 * Path of `absPath` relative to the vault root, as stored in the catalog.
 * Paths outside the root are returned unchanged.
 */
inline QString relativeToRoot(const QString& root, const QString& absPath)
{
    const QString rel = QDir(root).relativeFilePath(absPath);
    if (rel.startsWith(QLatin1String(".."))) return absPath;
    return rel;
}

} // namespace VaultPaths
