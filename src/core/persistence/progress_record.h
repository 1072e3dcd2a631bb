#pragma once

#include "../models/playback_settings.h"

#include <QByteArray>
#include <QString>

#include <optional>

/**
 * Durable per-folder progress: last item, last position and a settings snapshot.
 * Each write fully replaces the previous record.
 */
struct ProgressRecord
{
    QString lastFile;           // Relative path, forward slashes
    double lastPosition = 0.0;  // Seconds, >= 0
    PlaybackSettings settings;

    QByteArray toJson() const;

    /**
     * Parse the state file.
     * Returns nullopt for anything that is not a JSON object; missing or
     * mistyped fields inside the object take their defaults.
     */
    static std::optional<ProgressRecord> fromJson(const QByteArray& data);

    bool operator==(const ProgressRecord& other) const {
        return lastFile == other.lastFile && lastPosition == other.lastPosition && settings == other.settings;
    }
};
