#include "file_type_preferences.h"

#include <QJsonArray>

namespace {
QStringList normalizeList(const QStringList& extensions)
{
    QStringList result;
    for (const QString& ext : extensions) {
        QString normalized = FileTypePreferences::normalizeExtension(ext);
        if (!normalized.isEmpty() && !result.contains(normalized)) {
            result.append(normalized);
        }
    }
    return result;
}

QStringList listFromJson(const QJsonValue& value, const QStringList& fallback)
{
    if (!value.isArray()) {
        return fallback;
    }
    QStringList result;
    for (const QJsonValue& item : value.toArray()) {
        if (item.isString()) {
            result.append(item.toString());
        }
    }
    return normalizeList(result);
}
} // namespace

FileTypePreferences FileTypePreferences::defaults()
{
    FileTypePreferences prefs;
    prefs.video = { ".mp4", ".mkv", ".webm", ".avi", ".mov", ".m4v" };
    prefs.audio = { ".mp3", ".flac", ".ogg", ".wav", ".aac", ".m4a" };
    prefs.subtitles = { ".srt", ".vtt", ".sub" };
    return prefs;
}

QString FileTypePreferences::normalizeExtension(const QString& extension)
{
    QString ext = extension.trimmed().toLower();
    if (ext.isEmpty() || ext == QLatin1String(".")) {
        return QString();
    }
    if (!ext.startsWith(QLatin1Char('.'))) {
        ext.prepend(QLatin1Char('.'));
    }
    return ext;
}

FileTypePreferences FileTypePreferences::normalized() const
{
    FileTypePreferences prefs;
    prefs.video = normalizeList(video);
    prefs.audio = normalizeList(audio);
    prefs.subtitles = normalizeList(subtitles);
    return prefs;
}

QString FileTypePreferences::matchedExtension(const QString& fileName, FileClass* fileClass) const
{
    const QString lowered = fileName.toLower();
    QString best;
    FileClass bestClass = Ignored;

    auto consider = [&](const QStringList& extensions, FileClass candidate) {
        for (const QString& ext : extensions) {
            // A bare ".mkv" file has no base name and is not media
            if (lowered.size() > ext.size() && lowered.endsWith(ext) && ext.size() > best.size()) {
                best = ext;
                bestClass = candidate;
            }
        }
    };
    consider(video, Video);
    consider(audio, Audio);
    consider(subtitles, Subtitle);

    if (fileClass) *fileClass = bestClass;
    return best;
}

FileTypePreferences::FileClass FileTypePreferences::classify(const QString& fileName) const
{
    FileClass fileClass = Ignored;
    matchedExtension(fileName, &fileClass);
    return fileClass;
}

QString FileTypePreferences::baseName(const QString& fileName) const
{
    const QString ext = matchedExtension(fileName, nullptr);
    if (!ext.isEmpty()) {
        return fileName.left(fileName.size() - ext.size());
    }
    const int dot = fileName.lastIndexOf(QLatin1Char('.'));
    return dot > 0 ? fileName.left(dot) : fileName;
}

QJsonObject FileTypePreferences::toJson() const
{
    QJsonObject json;
    json["video"] = QJsonArray::fromStringList(video);
    json["audio"] = QJsonArray::fromStringList(audio);
    json["subtitles"] = QJsonArray::fromStringList(subtitles);
    return json;
}

FileTypePreferences FileTypePreferences::fromJson(const QJsonObject& json)
{
    const FileTypePreferences fallback = defaults();
    FileTypePreferences prefs;
    prefs.video = listFromJson(json["video"], fallback.video);
    prefs.audio = listFromJson(json["audio"], fallback.audio);
    prefs.subtitles = listFromJson(json["subtitles"], fallback.subtitles);
    return prefs;
}
