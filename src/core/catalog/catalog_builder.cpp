#include "catalog_builder.h"

#include <QHash>
#include <QLoggingCategory>

#include <algorithm>

Q_LOGGING_CATEGORY(folderplayCatalog, "folderplay.catalog")

namespace {
QString pairingKey(const QString& directory, const QString& baseName)
{
    return directory + QLatin1Char('/') + baseName;
}
} // namespace

CatalogBuilder::CatalogBuilder(const StorageProvider& storage, const FileTypePreferences& preferences)
    : m_storage(storage)
    , m_preferences(preferences.normalized())
{
}

ScanResult CatalogBuilder::build(const QString& rootRef, const std::atomic<bool>* cancel) const
{
    ScanResult result;
    result.rootRef = rootRef;

    QVector<FoundFile> found;
    walk(rootRef, QString(), found, result, cancel);

    if (cancel && cancel->load()) {
        result.cancelled = true;
        result.items.clear();
        qCDebug(folderplayCatalog, "Scan of %s cancelled", qPrintable(rootRef));
        return result;
    }

    // Subtitles grouped by directory + base name, in discovery order
    QHash<QString, QVector<SubtitleRef>> subtitlesByKey;
    for (const FoundFile& file : found) {
        if (file.fileClass == FileTypePreferences::Subtitle) {
            subtitlesByKey[pairingKey(file.directory, file.baseName)].append(
                SubtitleRef{ file.name, file.relativePath, file.ref });
        }
    }

    for (const FoundFile& file : found) {
        if (file.fileClass != FileTypePreferences::Video && file.fileClass != FileTypePreferences::Audio) {
            continue;
        }
        QVector<SubtitleRef> subtitles = subtitlesByKey.value(pairingKey(file.directory, file.baseName));
        // Stable within one scan regardless of directory listing order
        std::sort(subtitles.begin(), subtitles.end(), [](const SubtitleRef& a, const SubtitleRef& b) {
            return a.relativePath.toUtf8() < b.relativePath.toUtf8();
        });
        const MediaItem::Kind kind = file.fileClass == FileTypePreferences::Video ? MediaItem::Video
                                                                                   : MediaItem::Audio;
        result.items.append(MediaItem(file.name, file.relativePath, file.ref, kind, subtitles));
    }

    sortCatalog(result.items);

    if (result.degraded) {
        qCWarning(folderplayCatalog, "Scan of %s degraded: %d unreadable director%s",
                  qPrintable(rootRef), int(result.failedDirectories.size()),
                  result.failedDirectories.size() == 1 ? "y" : "ies");
    }
    qCDebug(folderplayCatalog, "Scanned %s: %d media items", qPrintable(rootRef), int(result.items.size()));
    return result;
}

void CatalogBuilder::walk(const QString& dirRef, const QString& relativeDir, QVector<FoundFile>& found,
                          ScanResult& result, const std::atomic<bool>* cancel) const
{
    if (cancel && cancel->load()) {
        return;
    }

    QVector<StorageEntry> children;
    StorageError error = m_storage.listChildren(dirRef, children);
    if (!error.ok()) {
        // The subtree is skipped, the rest of the scan continues
        qCWarning(folderplayCatalog, "Cannot list %s: %s", qPrintable(dirRef), qPrintable(error.message));
        result.degraded = true;
        result.failedDirectories.append(relativeDir);
        return;
    }

    for (const StorageEntry& child : children) {
        const QString relativePath = relativeDir.isEmpty() ? child.name
                                                           : relativeDir + QLatin1Char('/') + child.name;
        if (child.isDirectory) {
            walk(child.ref, relativePath, found, result, cancel);
            continue;
        }

        FileTypePreferences::FileClass fileClass = m_preferences.classify(child.name);
        if (fileClass == FileTypePreferences::Ignored) {
            continue;
        }

        FoundFile file;
        file.name = child.name;
        file.relativePath = relativePath;
        file.directory = relativeDir;
        file.baseName = m_preferences.baseName(child.name);
        file.ref = child.ref;
        file.fileClass = fileClass;
        found.append(file);
    }
}

void CatalogBuilder::sortCatalog(Catalog& catalog)
{
    std::sort(catalog.begin(), catalog.end(), [](const MediaItem& a, const MediaItem& b) {
        return a.relativePath().toUtf8() < b.relativePath().toUtf8();
    });
}
