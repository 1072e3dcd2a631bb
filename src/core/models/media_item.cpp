#include "media_item.h"

MediaItem::MediaItem(const QString& name, const QString& relativePath, const QString& sourceRef,
                     Kind kind, const QVector<SubtitleRef>& subtitles)
    : m_name(name)
    , m_relativePath(relativePath)
    , m_sourceRef(sourceRef)
    , m_kind(kind)
    , m_subtitles(subtitles)
{
}

QString MediaItem::kindToString(Kind kind)
{
    switch (kind) {
    case Video: return QStringLiteral("video");
    case Audio: return QStringLiteral("audio");
    }
    return QStringLiteral("video");
}
