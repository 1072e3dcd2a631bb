#pragma once

#include <QJsonObject>
#include <QStringList>

/**
 * Extension sets recognized by the catalog builder.
 * Extensions are stored lowercase with a leading dot and matched as a
 * case-insensitive suffix of the file name.
 */
struct FileTypePreferences
{
    enum FileClass {
        Ignored,
        Video,
        Audio,
        Subtitle
    };

    QStringList video;
    QStringList audio;
    QStringList subtitles;

    static FileTypePreferences defaults();

    // "MKV", ".Mkv", " mkv " -> ".mkv"; empty input stays empty
    static QString normalizeExtension(const QString& extension);
    FileTypePreferences normalized() const;

    // Longest matching extension wins; video before audio before subtitle on ties
    FileClass classify(const QString& fileName) const;
    // File name with the matched extension removed, or the name up to its last dot
    QString baseName(const QString& fileName) const;

    QJsonObject toJson() const;
    static FileTypePreferences fromJson(const QJsonObject& json);

    bool operator==(const FileTypePreferences& other) const {
        return video == other.video && audio == other.audio && subtitles == other.subtitles;
    }

private:
    QString matchedExtension(const QString& fileName, FileClass* fileClass) const;
};
