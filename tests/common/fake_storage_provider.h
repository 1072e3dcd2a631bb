#pragma once

#include "../../src/core/storage/storage_provider.h"
#include "../../src/core/storage/permission_gate.h"

#include <QBuffer>
#include <QHash>
#include <QMap>
#include <QMutex>
#include <QMutexLocker>
#include <QSet>

/**
 * In-memory folder tree for tests.
 * References are "root/sub/file" strings; files are not addressable by path
 * unless setLocalPath() maps them.
 */
class FakeStorageProvider : public StorageProvider
{
public:
    explicit FakeStorageProvider(const QString& rootRef = QStringLiteral("mem:"))
        : m_rootRef(rootRef)
    {
        m_directories.insert(m_rootRef);
    }

    QString rootRef() const { return m_rootRef; }

    // relativePath uses forward slashes; parent directories are created as needed
    void addFile(const QString& relativePath, const QByteArray& data = QByteArray("media"))
    {
        QMutexLocker lock(&m_mutex);
        const QStringList parts = relativePath.split('/');
        QString dir = m_rootRef;
        for (int i = 0; i < parts.size() - 1; ++i) {
            dir = join(dir, parts[i]);
            m_directories.insert(dir);
        }
        m_files.insert(join(dir, parts.last()), data);
    }

    void addDirectory(const QString& relativePath)
    {
        QMutexLocker lock(&m_mutex);
        QString dir = m_rootRef;
        for (const QString& part : relativePath.split('/')) {
            dir = join(dir, part);
            m_directories.insert(dir);
        }
    }

    void removeFile(const QString& relativePath)
    {
        QMutexLocker lock(&m_mutex);
        m_files.remove(join(m_rootRef, relativePath));
    }

    // listChildren() of this directory fails with status
    void failListing(const QString& relativeDir, StorageStatus status = StorageStatus::PermissionDenied)
    {
        QMutexLocker lock(&m_mutex);
        m_listFailures.insert(relativeDir.isEmpty() ? m_rootRef : join(m_rootRef, relativeDir), status);
    }

    // Every later replaceFile() fails with status (Ok restores writes)
    void failWrites(StorageStatus status)
    {
        QMutexLocker lock(&m_mutex);
        m_writeFailure = status;
    }

    // readAll()/openForRead() of any file fails with status (Ok restores reads)
    void failReads(StorageStatus status)
    {
        QMutexLocker lock(&m_mutex);
        m_readFailure = status;
    }

    void setLocalPath(const QString& relativePath, const QString& path)
    {
        QMutexLocker lock(&m_mutex);
        m_localPaths.insert(join(m_rootRef, relativePath), path);
    }

    QByteArray fileData(const QString& relativePath) const
    {
        QMutexLocker lock(&m_mutex);
        return m_files.value(join(m_rootRef, relativePath));
    }

    bool hasFile(const QString& relativePath) const
    {
        QMutexLocker lock(&m_mutex);
        return m_files.contains(join(m_rootRef, relativePath));
    }

    int writeCount() const
    {
        QMutexLocker lock(&m_mutex);
        return m_writeCount;
    }

    QVector<QByteArray> writeHistory() const
    {
        QMutexLocker lock(&m_mutex);
        return m_writeHistory;
    }

    // StorageProvider

    StorageError listChildren(const QString& dirRef, QVector<StorageEntry>& children) const override
    {
        QMutexLocker lock(&m_mutex);
        children.clear();
        if (m_listFailures.contains(dirRef)) {
            return StorageError::make(m_listFailures.value(dirRef), "listing refused: " + dirRef);
        }
        if (!m_directories.contains(dirRef)) {
            return StorageError::make(StorageStatus::NotFound, "no such directory: " + dirRef);
        }

        const QString prefix = dirRef + QLatin1Char('/');
        for (const QString& dir : m_directories) {
            if (dir.startsWith(prefix) && !dir.mid(prefix.size()).contains('/')) {
                children.append(StorageEntry{ dir.mid(prefix.size()), dir, true });
            }
        }
        for (auto it = m_files.cbegin(); it != m_files.cend(); ++it) {
            if (it.key().startsWith(prefix) && !it.key().mid(prefix.size()).contains('/')) {
                children.append(StorageEntry{ it.key().mid(prefix.size()), it.key(), false });
            }
        }
        return StorageError::success();
    }

    std::unique_ptr<QIODevice> openForRead(const QString& fileRef, StorageError& error) const override
    {
        QByteArray data;
        error = readAll(fileRef, data);
        if (!error.ok()) {
            return nullptr;
        }
        auto buffer = std::make_unique<QBuffer>();
        buffer->setData(data);
        buffer->open(QIODevice::ReadOnly);
        return buffer;
    }

    StorageError readAll(const QString& fileRef, QByteArray& data) const override
    {
        QMutexLocker lock(&m_mutex);
        if (m_readFailure != StorageStatus::Ok) {
            return StorageError::make(m_readFailure, "read refused: " + fileRef);
        }
        auto it = m_files.constFind(fileRef);
        if (it == m_files.cend()) {
            return StorageError::make(StorageStatus::NotFound, "no such file: " + fileRef);
        }
        data = it.value();
        return StorageError::success();
    }

    StorageError replaceFile(const QString& dirRef, const QString& name, const QByteArray& data) override
    {
        QMutexLocker lock(&m_mutex);
        if (m_writeFailure != StorageStatus::Ok) {
            return StorageError::make(m_writeFailure, "write refused: " + join(dirRef, name));
        }
        if (!m_directories.contains(dirRef)) {
            return StorageError::make(StorageStatus::NotFound, "no such directory: " + dirRef);
        }
        m_files.insert(join(dirRef, name), data);
        m_writeHistory.append(data);
        ++m_writeCount;
        return StorageError::success();
    }

    QString childRef(const QString& dirRef, const QString& name) const override
    {
        return join(dirRef, name);
    }

    QString localPath(const QString& fileRef) const override
    {
        QMutexLocker lock(&m_mutex);
        return m_localPaths.value(fileRef);
    }

private:
    static QString join(const QString& dir, const QString& name) { return dir + QLatin1Char('/') + name; }

    const QString m_rootRef;
    mutable QMutex m_mutex;
    QSet<QString> m_directories;
    QMap<QString, QByteArray> m_files;
    QHash<QString, StorageStatus> m_listFailures;
    QHash<QString, QString> m_localPaths;
    StorageStatus m_writeFailure = StorageStatus::Ok;
    StorageStatus m_readFailure = StorageStatus::Ok;
    QVector<QByteArray> m_writeHistory;
    int m_writeCount = 0;
};

/**
 * Permission gate with per-mode answers set by the test
 */
class FakePermissionGate : public PermissionGate
{
public:
    AccessState queryAccess(const QString& rootRef, AccessMode mode) const override
    {
        Q_UNUSED(rootRef)
        return mode == AccessMode::Read ? m_read : m_readWrite;
    }

    void setRead(AccessState state) { m_read = state; }
    void setReadWrite(AccessState state) { m_readWrite = state; }

private:
    AccessState m_read = AccessState::Granted;
    AccessState m_readWrite = AccessState::Granted;
};
