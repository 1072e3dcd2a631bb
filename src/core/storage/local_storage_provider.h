#pragma once

#include "storage_provider.h"

#include <QFileDevice>

/**
 * StorageProvider over the local filesystem.
 * References are absolute, cleaned paths.
 */
class LocalStorageProvider : public StorageProvider
{
public:
    LocalStorageProvider() = default;

    StorageError listChildren(const QString& dirRef, QVector<StorageEntry>& children) const override;
    std::unique_ptr<QIODevice> openForRead(const QString& fileRef, StorageError& error) const override;
    StorageError readAll(const QString& fileRef, QByteArray& data) const override;
    StorageError replaceFile(const QString& dirRef, const QString& name, const QByteArray& data) override;
    QString childRef(const QString& dirRef, const QString& name) const override;
    QString localPath(const QString& fileRef) const override;

    static QString refForPath(const QString& path);

private:
    static StorageError errorFromFile(const QFileDevice& file, const QString& action);
};
