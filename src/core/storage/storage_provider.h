#pragma once

#include <QByteArray>
#include <QIODevice>
#include <QMetaType>
#include <QString>
#include <QVector>

#include <memory>

enum class StorageStatus {
    Ok,
    NotFound,
    PermissionDenied,
    IoError
};

QString storageStatusToString(StorageStatus status);

struct StorageError
{
    StorageStatus status = StorageStatus::Ok;
    QString message;

    bool ok() const { return status == StorageStatus::Ok; }

    static StorageError success() { return {}; }
    static StorageError make(StorageStatus status, const QString& message) { return { status, message }; }
};

struct StorageEntry
{
    QString name;
    QString ref;            // Opaque reference understood by the provider
    bool isDirectory = false;
};

/**
 * Access to the folder a session is bound to.
 * References are opaque strings produced by the provider itself (childRef, listChildren).
 * Implementations must be safe to call from worker threads.
 */
class StorageProvider
{
public:
    virtual ~StorageProvider() = default;

    virtual StorageError listChildren(const QString& dirRef, QVector<StorageEntry>& children) const = 0;

    virtual std::unique_ptr<QIODevice> openForRead(const QString& fileRef, StorageError& error) const = 0;

    virtual StorageError readAll(const QString& fileRef, QByteArray& data) const = 0;

    /**
     * Replace (or create) dirRef/name with data.
     * Readers observe either the old or the new content, never a mix.
     * Any write handle is released on every exit path.
     */
    virtual StorageError replaceFile(const QString& dirRef, const QString& name, const QByteArray& data) = 0;

    // Reference of a named child of dirRef (no I/O)
    virtual QString childRef(const QString& dirRef, const QString& name) const = 0;

    // Filesystem path for fileRef, or empty when the file is not addressable by path
    virtual QString localPath(const QString& fileRef) const = 0;
};

Q_DECLARE_METATYPE(StorageStatus)
