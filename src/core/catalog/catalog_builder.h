#pragma once

#include "file_type_preferences.h"
#include "../models/media_item.h"
#include "../storage/storage_provider.h"

#include <QStringList>

#include <atomic>

/**
 * Outcome of one folder scan.
 * degraded is set when at least one subtree could not be read; its files are missing
 * from items but everything else is present.
 */
struct ScanResult
{
    QString rootRef;
    Catalog items;
    bool degraded = false;
    QStringList failedDirectories;   // Relative paths ("" = root)
    bool cancelled = false;
};

/**
 * Builds the ordered media catalog of a folder tree.
 * Stateless apart from its collaborators; build() may run on a worker thread.
 */
class CatalogBuilder
{
public:
    CatalogBuilder(const StorageProvider& storage, const FileTypePreferences& preferences);

    /**
     * Scan rootRef recursively.
     * Algorithm: Walk tree depth-first → Classify files → Pair subtitles → Sort by path
     */
    ScanResult build(const QString& rootRef, const std::atomic<bool>* cancel = nullptr) const;

    // Case-sensitive byte order of the UTF-8 relative paths
    static void sortCatalog(Catalog& catalog);

private:
    struct FoundFile {
        QString name;
        QString relativePath;
        QString directory;
        QString baseName;
        QString ref;
        FileTypePreferences::FileClass fileClass;
    };

    void walk(const QString& dirRef, const QString& relativeDir, QVector<FoundFile>& found,
              ScanResult& result, const std::atomic<bool>* cancel) const;

    const StorageProvider& m_storage;
    FileTypePreferences m_preferences;
};
