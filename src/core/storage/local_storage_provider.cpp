#include "local_storage_provider.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(folderplayStorage, "folderplay.storage")

QString storageStatusToString(StorageStatus status)
{
    switch (status) {
    case StorageStatus::Ok:               return QStringLiteral("Ok");
    case StorageStatus::NotFound:         return QStringLiteral("NotFound");
    case StorageStatus::PermissionDenied: return QStringLiteral("PermissionDenied");
    case StorageStatus::IoError:          return QStringLiteral("IoError");
    }
    return QStringLiteral("IoError");
}

QString LocalStorageProvider::refForPath(const QString& path)
{
    return QDir::cleanPath(QFileInfo(path).absoluteFilePath());
}

StorageError LocalStorageProvider::errorFromFile(const QFileDevice& file, const QString& action)
{
    const QString message = QString("%1 %2: %3").arg(action, file.fileName(), file.errorString());
    switch (file.error()) {
    case QFileDevice::PermissionsError:
        return StorageError::make(StorageStatus::PermissionDenied, message);
    case QFileDevice::OpenError:
        if (!QFileInfo::exists(file.fileName())) {
            return StorageError::make(StorageStatus::NotFound, message);
        }
        return StorageError::make(StorageStatus::IoError, message);
    default:
        return StorageError::make(StorageStatus::IoError, message);
    }
}

StorageError LocalStorageProvider::listChildren(const QString& dirRef, QVector<StorageEntry>& children) const
{
    children.clear();

    QFileInfo dirInfo(dirRef);
    if (!dirInfo.exists() || !dirInfo.isDir()) {
        return StorageError::make(StorageStatus::NotFound, QString("Not a directory: %1").arg(dirRef));
    }
    // entryInfoList silently returns nothing for unreadable directories
    if (!dirInfo.isReadable() || !dirInfo.isExecutable()) {
        return StorageError::make(StorageStatus::PermissionDenied, QString("Cannot read directory: %1").arg(dirRef));
    }

    QDir dir(dirRef);
    const QFileInfoList entries = dir.entryInfoList(
        QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden | QDir::System, QDir::NoSort);

    children.reserve(entries.size());
    for (const QFileInfo& entry : entries) {
        // Symlinked directories could form cycles
        if (entry.isSymLink() && entry.isDir()) {
            qCDebug(folderplayStorage, "Skipping symlinked directory %s", qPrintable(entry.filePath()));
            continue;
        }
        StorageEntry child;
        child.name = entry.fileName();
        child.ref = QDir::cleanPath(entry.absoluteFilePath());
        child.isDirectory = entry.isDir();
        children.append(child);
    }
    return StorageError::success();
}

std::unique_ptr<QIODevice> LocalStorageProvider::openForRead(const QString& fileRef, StorageError& error) const
{
    auto file = std::make_unique<QFile>(fileRef);
    if (!file->open(QIODevice::ReadOnly)) {
        error = errorFromFile(*file, QStringLiteral("open"));
        return nullptr;
    }
    error = StorageError::success();
    return file;
}

StorageError LocalStorageProvider::readAll(const QString& fileRef, QByteArray& data) const
{
    StorageError error;
    std::unique_ptr<QIODevice> device = openForRead(fileRef, error);
    if (!device) {
        return error;
    }
    data = device->readAll();
    return StorageError::success();
}

StorageError LocalStorageProvider::replaceFile(const QString& dirRef, const QString& name, const QByteArray& data)
{
    // Algorithm: Write temp sibling → Commit (atomic rename); QSaveFile discards the temp on any early return
    QSaveFile file(childRef(dirRef, name));
    if (!file.open(QIODevice::WriteOnly)) {
        return errorFromFile(file, QStringLiteral("open for write"));
    }

    if (file.write(data) != data.size()) {
        StorageError error = errorFromFile(file, QStringLiteral("write"));
        file.cancelWriting();
        return error;
    }

    if (!file.commit()) {
        return errorFromFile(file, QStringLiteral("commit"));
    }
    return StorageError::success();
}

QString LocalStorageProvider::childRef(const QString& dirRef, const QString& name) const
{
    return QDir::cleanPath(dirRef + QLatin1Char('/') + name);
}

QString LocalStorageProvider::localPath(const QString& fileRef) const
{
    return fileRef;
}
