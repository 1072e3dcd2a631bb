#include "playback_settings.h"

#include <QJsonValue>
#include <QLoggingCategory>

#include <algorithm>
#include <cmath>

Q_LOGGING_CATEGORY(folderplaySettings, "folderplay.models.settings")

namespace {
const struct {
    AspectRatioMode mode;
    const char* name;
} kAspectRatioNames[] = {
    { AspectRatioMode::Auto, "auto" },
    { AspectRatioMode::Contain, "contain" },
    { AspectRatioMode::Cover, "cover" },
    { AspectRatioMode::Fill, "fill" },
    { AspectRatioMode::Wide16x9, "16/9" },
    { AspectRatioMode::Standard4x3, "4/3" },
};

constexpr double RATE_EPSILON = 1e-6;
} // namespace

QString aspectRatioToString(AspectRatioMode mode)
{
    for (const auto& entry : kAspectRatioNames) {
        if (entry.mode == mode) {
            return QString::fromLatin1(entry.name);
        }
    }
    return QStringLiteral("auto");
}

AspectRatioMode aspectRatioFromString(const QString& text, bool* ok)
{
    for (const auto& entry : kAspectRatioNames) {
        if (text == QLatin1String(entry.name)) {
            if (ok) *ok = true;
            return entry.mode;
        }
    }
    if (ok) *ok = false;
    return AspectRatioMode::Auto;
}

AspectRatioMode nextAspectRatio(AspectRatioMode mode)
{
    const int count = int(sizeof(kAspectRatioNames) / sizeof(kAspectRatioNames[0]));
    for (int i = 0; i < count; ++i) {
        if (kAspectRatioNames[i].mode == mode) {
            return kAspectRatioNames[(i + 1) % count].mode;
        }
    }
    return AspectRatioMode::Auto;
}

const QVector<double>& PlaybackSettings::allowedRates()
{
    static const QVector<double> rates = { 0.5, 0.75, 1.0, 1.25, 1.5, 1.75, 2.0 };
    return rates;
}

bool PlaybackSettings::isAllowedRate(double rate)
{
    const auto& rates = allowedRates();
    return std::any_of(rates.begin(), rates.end(),
                       [rate](double r) { return std::abs(r - rate) < RATE_EPSILON; });
}

double PlaybackSettings::nextRate(double rate)
{
    const auto& rates = allowedRates();
    for (int i = 0; i < rates.size(); ++i) {
        if (std::abs(rates[i] - rate) < RATE_EPSILON) {
            return rates[(i + 1) % rates.size()];
        }
    }
    return rates.first();
}

double PlaybackSettings::clampVolume(double volume)
{
    if (std::isnan(volume)) {
        return 0.0;
    }
    return std::clamp(volume, 0.0, 1.0);
}

int PlaybackSettings::clampFontSize(int px)
{
    return std::clamp(px, MIN_FONT_SIZE, MAX_FONT_SIZE);
}

QJsonObject PlaybackSettings::toJson() const
{
    QJsonObject subtitles;
    subtitles["enabled"] = subtitlesEnabled;
    subtitles["fontSize"] = subtitleFontSize;

    QJsonObject json;
    json["volume"] = volume;
    json["playbackRate"] = playbackRate;
    json["shuffle"] = shuffle;
    json["loop"] = loop;
    json["subtitles"] = subtitles;
    json["aspectRatio"] = aspectRatioToString(aspectRatio);
    return json;
}

PlaybackSettings PlaybackSettings::fromJson(const QJsonObject& json)
{
    PlaybackSettings settings;

    if (json["volume"].isDouble()) {
        settings.volume = clampVolume(json["volume"].toDouble());
    }
    if (json["playbackRate"].isDouble()) {
        double rate = json["playbackRate"].toDouble();
        if (isAllowedRate(rate)) {
            settings.playbackRate = rate;
        } else {
            qCDebug(folderplaySettings, "Ignoring unsupported playback rate %f", rate);
        }
    }
    if (json["shuffle"].isBool()) {
        settings.shuffle = json["shuffle"].toBool();
    }
    if (json["loop"].isBool()) {
        settings.loop = json["loop"].toBool();
    }

    const QJsonObject subtitles = json["subtitles"].toObject();
    if (subtitles["enabled"].isBool()) {
        settings.subtitlesEnabled = subtitles["enabled"].toBool();
    }
    if (subtitles["fontSize"].isDouble()) {
        settings.subtitleFontSize = clampFontSize(subtitles["fontSize"].toInt(DEFAULT_FONT_SIZE));
    }

    if (json["aspectRatio"].isString()) {
        settings.aspectRatio = aspectRatioFromString(json["aspectRatio"].toString());
    }
    return settings;
}

bool PlaybackSettings::operator==(const PlaybackSettings& other) const
{
    return volume == other.volume
        && playbackRate == other.playbackRate
        && shuffle == other.shuffle
        && loop == other.loop
        && subtitlesEnabled == other.subtitlesEnabled
        && subtitleFontSize == other.subtitleFontSize
        && aspectRatio == other.aspectRatio;
}
