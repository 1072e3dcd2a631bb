#pragma once

#include <QJsonObject>
#include <QString>
#include <QVector>

/**
 * How the video frame is fitted into the render surface
 */
enum class AspectRatioMode {
    Auto,
    Contain,
    Cover,
    Fill,
    Wide16x9,
    Standard4x3
};

QString aspectRatioToString(AspectRatioMode mode);
AspectRatioMode aspectRatioFromString(const QString& text, bool* ok = nullptr);
AspectRatioMode nextAspectRatio(AspectRatioMode mode);

/**
 * Per-session playback preferences.
 * Persisted inside the progress record and carried over verbatim on resume.
 */
struct PlaybackSettings
{
    static constexpr double DEFAULT_VOLUME = 1.0;
    static constexpr double DEFAULT_RATE = 1.0;
    static constexpr int DEFAULT_FONT_SIZE = 18;
    static constexpr int MIN_FONT_SIZE = 8;
    static constexpr int MAX_FONT_SIZE = 72;

    double volume = DEFAULT_VOLUME;          // 0.0 .. 1.0
    double playbackRate = DEFAULT_RATE;      // one of allowedRates()
    bool shuffle = false;
    bool loop = false;
    bool subtitlesEnabled = true;
    int subtitleFontSize = DEFAULT_FONT_SIZE;
    AspectRatioMode aspectRatio = AspectRatioMode::Auto;

    static const QVector<double>& allowedRates();
    static bool isAllowedRate(double rate);
    // Next entry of allowedRates(), wrapping; unknown rates cycle to the first entry
    static double nextRate(double rate);

    static double clampVolume(double volume);
    static int clampFontSize(int px);

    /**
     * JSON shape of the "settings" object of the state file.
     * fromJson never fails: missing or invalid fields take their defaults.
     */
    QJsonObject toJson() const;
    static PlaybackSettings fromJson(const QJsonObject& json);

    bool operator==(const PlaybackSettings& other) const;
    bool operator!=(const PlaybackSettings& other) const { return !(*this == other); }
};
