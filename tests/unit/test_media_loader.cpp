#include "../common/test_base.h"
#include "../common/fake_storage_provider.h"
#include "../common/fake_transcode_engine.h"
#include "../../src/core/session/media_loader.h"

#include <QFile>
#include <QSignalSpy>
#include <QTest>

#include <memory>

/**
 * PipelineMediaLoader: runs the compatibility pipeline off the caller's thread
 * and reports back through generation-tagged signals.
 */
class TestMediaLoader : public TestBase
{
    Q_OBJECT

private slots:
    void init() override;
    void cleanup() override;

    void testPassThroughResolvesSubtitles();
    void testIncompatibleVideoIsTranscoded();
    void testEngineFailureFallsBackToOriginal();
    void testNewLoadCancelsOlderOne();
    void testUnreadableFileFails();

private:
    MediaItem addItem(const QString& relativePath, const QVector<SubtitleRef>& subtitles = {});
    std::unique_ptr<PipelineMediaLoader> makeLoader(mcp::EngineFactory factory);
    static LoadRequest requestFor(quint64 generation, const MediaItem& item);

    std::unique_ptr<FakeStorageProvider> m_storage;
    std::shared_ptr<FakeTranscodeEngine> m_engine;
    std::unique_ptr<mcp::EngineCache> m_cache;
    std::unique_ptr<mcp::CompatibilityPipeline> m_pipeline;
};

void TestMediaLoader::init()
{
    TestBase::init();
    m_storage = std::make_unique<FakeStorageProvider>();
    m_engine = std::make_shared<FakeTranscodeEngine>();
}

void TestMediaLoader::cleanup()
{
    m_pipeline.reset();
    m_cache.reset();
    m_engine.reset();
    m_storage.reset();
    TestBase::cleanup();
}

MediaItem TestMediaLoader::addItem(const QString& relativePath, const QVector<SubtitleRef>& subtitles)
{
    m_storage->addFile(relativePath);
    m_storage->setLocalPath(relativePath, createFile("media/" + relativePath));
    const QString name = relativePath.section('/', -1);
    return MediaItem(name, relativePath, m_storage->rootRef() + "/" + relativePath, MediaItem::Video, subtitles);
}

std::unique_ptr<PipelineMediaLoader> TestMediaLoader::makeLoader(mcp::EngineFactory factory)
{
    mcp::PipelineConfig config;
    config.work_directory = createDirectory("work").toStdString();
    m_cache = std::make_unique<mcp::EngineCache>(std::move(factory));
    m_pipeline = std::make_unique<mcp::CompatibilityPipeline>(config, *m_cache);
    return std::make_unique<PipelineMediaLoader>(*m_storage, *m_pipeline);
}

LoadRequest TestMediaLoader::requestFor(quint64 generation, const MediaItem& item)
{
    LoadRequest request;
    request.generation = generation;
    request.item = item;
    request.cancel = mcp::CancellationToken::Create();
    return request;
}

void TestMediaLoader::testPassThroughResolvesSubtitles()
{
    SubtitleRef subtitle;
    subtitle.name = "song.srt";
    subtitle.relativePath = "song.srt";
    subtitle.sourceRef = m_storage->rootRef() + "/song.srt";
    m_storage->addFile("song.srt");
    m_storage->setLocalPath("song.srt", createFile("media/song.srt"));

    const MediaItem item = addItem("song.mp3", {subtitle});
    auto engine = m_engine;
    auto loader = makeLoader([engine]() -> mcp::Result<std::shared_ptr<mcp::TranscodeEngine>> {
        return std::shared_ptr<mcp::TranscodeEngine>(engine);
    });
    QSignalSpy finished(loader.get(), &MediaLoader::loadFinished);

    loader->startLoad(requestFor(1, item));
    QVERIFY(finished.wait(5000));

    QCOMPARE(finished.first().at(0).toULongLong(), quint64(1));
    const LoadedMedia media = finished.first().at(1).value<LoadedMedia>();
    QVERIFY(!media.wasTranscoded);
    QCOMPARE(media.outcome, QString("PassThroughExtension"));
    QCOMPARE(media.playablePath, m_storage->localPath(item.sourceRef()));
    QCOMPARE(media.sourceRef, item.sourceRef());
    QCOMPARE(int(media.subtitles.size()), 1);
    QCOMPARE(media.subtitles.first().sourceRef, m_testDataDir->filePath("media/song.srt"));
    // .mp3 never reaches the engine
    QVERIFY(m_engine->probed.empty());
}

void TestMediaLoader::testIncompatibleVideoIsTranscoded()
{
    m_engine->probe_report.container = "matroska,webm";
    m_engine->probe_report.streams = {FakeTranscodeEngine::video(0, "hevc"), FakeTranscodeEngine::audio(1, "aac")};

    const MediaItem item = addItem("sub/movie.mkv");
    auto engine = m_engine;
    auto loader = makeLoader([engine]() -> mcp::Result<std::shared_ptr<mcp::TranscodeEngine>> {
        return std::shared_ptr<mcp::TranscodeEngine>(engine);
    });
    QSignalSpy finished(loader.get(), &MediaLoader::loadFinished);
    QSignalSpy progress(loader.get(), &MediaLoader::loadProgress);

    loader->startLoad(requestFor(7, item));
    QVERIFY(finished.wait(5000));

    const LoadedMedia media = finished.first().at(1).value<LoadedMedia>();
    QVERIFY(media.wasTranscoded);
    QCOMPARE(media.outcome, QString("Transcoded"));
    QVERIFY(media.playablePath.endsWith(".mp4"));
    QVERIFY(QFile::exists(media.playablePath));
    QVERIFY(media.artifact != nullptr);
    QVERIFY(m_engine->last_plan.reencodes_video());
    QVERIFY(!m_engine->last_plan.reencodes_audio());

    QVERIFY(progress.count() > 0);
    QCOMPARE(progress.last().at(0).toULongLong(), quint64(7));
}

void TestMediaLoader::testEngineFailureFallsBackToOriginal()
{
    const MediaItem item = addItem("movie.mkv");
    auto loader = makeLoader([]() -> mcp::Result<std::shared_ptr<mcp::TranscodeEngine>> {
        return mcp::Error::engine_unavailable("no encoder");
    });
    QSignalSpy finished(loader.get(), &MediaLoader::loadFinished);
    QSignalSpy failed(loader.get(), &MediaLoader::loadFailed);

    loader->startLoad(requestFor(2, item));
    QVERIFY(finished.wait(5000));

    const LoadedMedia media = finished.first().at(1).value<LoadedMedia>();
    QVERIFY(!media.wasTranscoded);
    QCOMPARE(media.outcome, QString("FallbackEngineUnavailable"));
    QCOMPARE(media.playablePath, m_storage->localPath(item.sourceRef()));
    QVERIFY(media.detail.contains("no encoder"));
    QCOMPARE(failed.count(), 0);
}

void TestMediaLoader::testNewLoadCancelsOlderOne()
{
    const MediaItem first = addItem("a.mp3");
    const MediaItem second = addItem("b.mp3");
    auto engine = m_engine;
    auto loader = makeLoader([engine]() -> mcp::Result<std::shared_ptr<mcp::TranscodeEngine>> {
        return std::shared_ptr<mcp::TranscodeEngine>(engine);
    });
    QSignalSpy finished(loader.get(), &MediaLoader::loadFinished);

    const LoadRequest older = requestFor(1, first);
    const LoadRequest newer = requestFor(2, second);
    loader->startLoad(older);
    loader->startLoad(newer);

    QVERIFY(older.cancel.is_cancelled());
    QVERIFY(!newer.cancel.is_cancelled());

    // The newer generation is always delivered; the older one may or may not be
    auto deliveredNewer = [&finished]() {
        for (const QList<QVariant>& args : finished) {
            if (args.at(0).toULongLong() == 2) {
                return true;
            }
        }
        return false;
    };
    QTRY_VERIFY_WITH_TIMEOUT(deliveredNewer(), 5000);
    loader->shutdown();
}

void TestMediaLoader::testUnreadableFileFails()
{
    m_storage->addFile("gone.mp4");
    m_storage->setLocalPath("gone.mp4", m_testDataDir->filePath("media/does-not-exist.mp4"));
    const MediaItem item("gone.mp4", "gone.mp4", m_storage->rootRef() + "/gone.mp4", MediaItem::Video);

    auto engine = m_engine;
    auto loader = makeLoader([engine]() -> mcp::Result<std::shared_ptr<mcp::TranscodeEngine>> {
        return std::shared_ptr<mcp::TranscodeEngine>(engine);
    });
    QSignalSpy failed(loader.get(), &MediaLoader::loadFailed);
    QSignalSpy finished(loader.get(), &MediaLoader::loadFinished);

    loader->startLoad(requestFor(3, item));
    QVERIFY(failed.wait(5000));
    QCOMPARE(failed.first().at(0).toULongLong(), quint64(3));
    QVERIFY(failed.first().at(1).toString().contains("gone.mp4"));
    QCOMPARE(finished.count(), 0);
}

QTEST_MAIN(TestMediaLoader)
#include "test_media_loader.moc"
