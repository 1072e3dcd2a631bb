#pragma once

#include <QString>
#include <QStringList>
#include <QVector>
#include <QMetaType>

/**
 * Subtitle file paired with a media item
 */
struct SubtitleRef
{
    QString name;           // File name, e.g. "movie.en.srt"
    QString relativePath;   // Forward-slash path relative to the session root
    QString sourceRef;      // Storage reference used to open the bytes

    bool operator==(const SubtitleRef& other) const {
        return relativePath == other.relativePath && sourceRef == other.sourceRef;
    }
};

/**
 * One playable file of a catalog.
 * Immutable once constructed; a re-scan builds new items instead of patching these.
 */
class MediaItem
{
public:
    enum Kind {
        Video,
        Audio
    };

    MediaItem() = default;
    MediaItem(const QString& name, const QString& relativePath, const QString& sourceRef,
              Kind kind, const QVector<SubtitleRef>& subtitles = {});

    QString name() const { return m_name; }
    QString relativePath() const { return m_relativePath; }
    QString sourceRef() const { return m_sourceRef; }
    Kind kind() const { return m_kind; }
    const QVector<SubtitleRef>& subtitles() const { return m_subtitles; }

    bool isValid() const { return !m_relativePath.isEmpty(); }

    static QString kindToString(Kind kind);

private:
    QString m_name;
    QString m_relativePath;   // Identity key, unique within a catalog
    QString m_sourceRef;
    Kind m_kind = Video;
    QVector<SubtitleRef> m_subtitles;
};

// Ordered by relative path, byte order ascending
using Catalog = QVector<MediaItem>;

Q_DECLARE_METATYPE(MediaItem)
