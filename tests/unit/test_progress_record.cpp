// Tests for the persisted progress record and the settings it carries

#include <QtTest>
#include <QJsonDocument>
#include <QJsonObject>

#include "../../src/core/models/playback_settings.h"
#include "../../src/core/persistence/progress_record.h"

#include <cmath>
#include <limits>

class TestProgressRecord : public QObject
{
    Q_OBJECT

private:
    static QJsonObject parse(const QByteArray& data) {
        return QJsonDocument::fromJson(data).object();
    }

private slots:
    // ========================================================================
    // SETTINGS
    // ========================================================================

    void test_settings_defaults() {
        PlaybackSettings settings;
        QCOMPARE(settings.volume, 1.0);
        QCOMPARE(settings.playbackRate, 1.0);
        QVERIFY(!settings.shuffle);
        QVERIFY(!settings.loop);
        QVERIFY(settings.subtitlesEnabled);
        QCOMPARE(settings.subtitleFontSize, PlaybackSettings::DEFAULT_FONT_SIZE);
        QCOMPARE(settings.aspectRatio, AspectRatioMode::Auto);
    }

    void test_volume_clamps() {
        QCOMPARE(PlaybackSettings::clampVolume(-0.5), 0.0);
        QCOMPARE(PlaybackSettings::clampVolume(1.5), 1.0);
        QCOMPARE(PlaybackSettings::clampVolume(0.3), 0.3);
        QCOMPARE(PlaybackSettings::clampVolume(std::numeric_limits<double>::quiet_NaN()), 0.0);
    }

    void test_rate_set_and_cycle() {
        QVERIFY(PlaybackSettings::isAllowedRate(1.25));
        QVERIFY(!PlaybackSettings::isAllowedRate(3.0));
        QCOMPARE(PlaybackSettings::nextRate(1.0), 1.25);
        QCOMPARE(PlaybackSettings::nextRate(2.0), 0.5);
        QCOMPARE(PlaybackSettings::nextRate(3.0), 0.5);
    }

    void test_aspect_ratio_names_and_cycle() {
        QCOMPARE(aspectRatioToString(AspectRatioMode::Wide16x9), QString("16/9"));
        QCOMPARE(aspectRatioToString(AspectRatioMode::Standard4x3), QString("4/3"));

        bool ok = false;
        QCOMPARE(aspectRatioFromString("cover", &ok), AspectRatioMode::Cover);
        QVERIFY(ok);
        QCOMPARE(aspectRatioFromString("stretch", &ok), AspectRatioMode::Auto);
        QVERIFY(!ok);

        AspectRatioMode mode = AspectRatioMode::Auto;
        for (int i = 0; i < 6; ++i) {
            mode = nextAspectRatio(mode);
        }
        QCOMPARE(mode, AspectRatioMode::Auto);
        QCOMPARE(nextAspectRatio(AspectRatioMode::Standard4x3), AspectRatioMode::Auto);
    }

    void test_settings_json_shape() {
        PlaybackSettings settings;
        settings.subtitleFontSize = 24;
        settings.subtitlesEnabled = false;
        const QJsonObject json = settings.toJson();

        QCOMPARE(json["volume"].toDouble(), 1.0);
        QCOMPARE(json["playbackRate"].toDouble(), 1.0);
        QVERIFY(json["shuffle"].isBool());
        QVERIFY(json["loop"].isBool());
        QCOMPARE(json["subtitles"].toObject()["enabled"].toBool(), false);
        QCOMPARE(json["subtitles"].toObject()["fontSize"].toInt(), 24);
        QCOMPARE(json["aspectRatio"].toString(), QString("auto"));
    }

    void test_settings_invalid_fields_take_defaults() {
        QJsonObject json;
        json["volume"] = "loud";
        json["playbackRate"] = 7.0;
        json["shuffle"] = 1;
        json["subtitles"] = QJsonObject{{"enabled", "yes"}, {"fontSize", 500}};
        json["aspectRatio"] = "stretch";

        PlaybackSettings settings = PlaybackSettings::fromJson(json);
        QCOMPARE(settings.volume, 1.0);
        QCOMPARE(settings.playbackRate, 1.0);
        QVERIFY(!settings.shuffle);
        QVERIFY(settings.subtitlesEnabled);
        QCOMPARE(settings.subtitleFontSize, PlaybackSettings::MAX_FONT_SIZE);
        QCOMPARE(settings.aspectRatio, AspectRatioMode::Auto);
    }

    // ========================================================================
    // RECORD ROUND TRIP
    // ========================================================================

    void test_round_trip_data() {
        QTest::addColumn<double>("volume");
        QTest::addColumn<double>("rate");
        QTest::addColumn<int>("aspect");

        QTest::newRow("silent") << 0.0 << 0.5 << int(AspectRatioMode::Fill);
        QTest::newRow("full volume") << 1.0 << 2.0 << int(AspectRatioMode::Wide16x9);
        QTest::newRow("fractional") << 0.37 << 1.75 << int(AspectRatioMode::Standard4x3);
    }

    void test_round_trip() {
        QFETCH(double, volume);
        QFETCH(double, rate);
        QFETCH(int, aspect);

        ProgressRecord record;
        record.lastFile = "season 1/ep01.mkv";
        record.lastPosition = 1234.567;
        record.settings.volume = volume;
        record.settings.playbackRate = rate;
        record.settings.shuffle = true;
        record.settings.loop = true;
        record.settings.subtitlesEnabled = false;
        record.settings.subtitleFontSize = 30;
        record.settings.aspectRatio = static_cast<AspectRatioMode>(aspect);

        auto parsed = ProgressRecord::fromJson(record.toJson());
        QVERIFY(parsed.has_value());
        QCOMPARE(parsed->lastFile, record.lastFile);
        QCOMPARE(parsed->lastPosition, record.lastPosition);
        QVERIFY(parsed->settings == record.settings);
        QVERIFY(*parsed == record);
    }

    void test_record_json_uses_forward_slash_path() {
        ProgressRecord record;
        record.lastFile = "a/b/c.mp4";
        const QJsonObject json = parse(record.toJson());
        QCOMPARE(json["lastFile"].toString(), QString("a/b/c.mp4"));
        QVERIFY(json["settings"].isObject());
    }

    // ========================================================================
    // INVALID INPUT
    // ========================================================================

    void test_unparsable_is_nullopt() {
        QVERIFY(!ProgressRecord::fromJson("").has_value());
        QVERIFY(!ProgressRecord::fromJson("{ not json").has_value());
        QVERIFY(!ProgressRecord::fromJson("[1, 2, 3]").has_value());
        QVERIFY(!ProgressRecord::fromJson("\"string\"").has_value());
    }

    void test_missing_fields_take_defaults() {
        auto parsed = ProgressRecord::fromJson("{}");
        QVERIFY(parsed.has_value());
        QVERIFY(parsed->lastFile.isEmpty());
        QCOMPARE(parsed->lastPosition, 0.0);
        QVERIFY(parsed->settings == PlaybackSettings());
    }

    void test_negative_position_becomes_zero() {
        auto parsed = ProgressRecord::fromJson("{\"lastFile\":\"a.mp4\",\"lastPosition\":-12.5}");
        QVERIFY(parsed.has_value());
        QCOMPARE(parsed->lastPosition, 0.0);

        auto mistyped = ProgressRecord::fromJson("{\"lastFile\":\"a.mp4\",\"lastPosition\":\"soon\"}");
        QVERIFY(mistyped.has_value());
        QCOMPARE(mistyped->lastPosition, 0.0);
    }
};

QTEST_MAIN(TestProgressRecord)
#include "test_progress_record.moc"
