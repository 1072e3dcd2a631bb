#include "../common/test_base.h"
#include "../common/fake_storage_provider.h"
#include "../../src/core/session/folder_session.h"
#include "../../src/core/persistence/preferences_store.h"

#include <QSignalSpy>
#include <QTest>

#include <memory>

/**
 * Contract Test: Folder Session
 *
 * One folder bound to one playback session, end to end:
 * - Scan on open, catalog applied once complete
 * - Resume offered only for an item still in the folder
 * - Persisted settings applied before the resume decision
 * - Settings changes persisted without waiting for the throttle window
 * - Teardown flush wins over pending throttled writes
 * - Storage and permission failures surface as session issues
 */
class TestFolderSession : public TestBase
{
    Q_OBJECT

private slots:
    void init() override;
    void cleanup() override;

    void testOpenScansFolder();
    void testOpenWithoutReadAccess();
    void testStaleResumeDiscarded();
    void testInvalidStateStartsFresh();
    void testResumeAppliesSettingsAndPosition();
    void testCountdownAutoResumes();
    void testDismissKeepsSettings();
    void testUserSelectCancelsCountdown();
    void testUserSettingsChangeCancelsCountdown();
    void testStartOverForgetsFolder();
    void testSettingsChangesPersistWithinThrottleWindow();
    void testCloseFlushesLatestPosition();
    void testWriteFailureRaisesIssue();
    void testStateReadDeniedRaisesIssue();
    void testDegradedScanRaisesIssue();
    void testReopenReplacesCatalog();

private:
    bool openAndWait();
    std::optional<ProgressRecord> storedRecord() const;
    void writeState(const QString& lastFile, double position, const PlaybackSettings& settings = PlaybackSettings());

    SessionConfig m_config;
    std::unique_ptr<FakeStorageProvider> m_storage;
    std::unique_ptr<FakePermissionGate> m_permissions;
    std::unique_ptr<FolderSession> m_session;
};

void TestFolderSession::init()
{
    TestBase::init();

    m_config = SessionConfig();
    m_config.throttleWindowMs = 5000;
    m_config.resumeCountdownMs = 60000;

    m_storage = std::make_unique<FakeStorageProvider>();
    m_storage->addFile("a.mp4");
    m_storage->addFile("sub/b.mkv");
    m_storage->addFile("sub/b.srt");
    m_permissions = std::make_unique<FakePermissionGate>();
}

void TestFolderSession::cleanup()
{
    m_session.reset();
    m_permissions.reset();
    m_storage.reset();
    TestBase::cleanup();
}

bool TestFolderSession::openAndWait()
{
    if (!m_session) {
        m_session = std::make_unique<FolderSession>(m_config, *m_storage, *m_permissions);
    }
    QSignalSpy ready(m_session.get(), &FolderSession::catalogReady);
    if (!m_session->open(m_storage->rootRef())) {
        return false;
    }
    return ready.count() > 0 || ready.wait(5000);
}

std::optional<ProgressRecord> TestFolderSession::storedRecord() const
{
    if (m_session && m_session->progressStore()) {
        m_session->progressStore()->waitForIdle();
    }
    return ProgressRecord::fromJson(m_storage->fileData(m_config.stateFileName));
}

void TestFolderSession::writeState(const QString& lastFile, double position, const PlaybackSettings& settings)
{
    ProgressRecord record;
    record.lastFile = lastFile;
    record.lastPosition = position;
    record.settings = settings;
    m_storage->addFile(m_config.stateFileName, record.toJson());
}

void TestFolderSession::testOpenScansFolder()
{
    m_session = std::make_unique<FolderSession>(m_config, *m_storage, *m_permissions);
    QSignalSpy ready(m_session.get(), &FolderSession::catalogReady);

    QVERIFY(openAndWait());
    QVERIFY(m_session->isOpen());
    QCOMPARE(ready.count(), 1);
    QCOMPARE(ready.first().at(0).toInt(), 2);
    QCOMPARE(ready.first().at(1).toBool(), false);

    const Catalog& catalog = m_session->playback().catalog();
    QCOMPARE(catalog[0].relativePath(), QString("a.mp4"));
    QCOMPARE(catalog[1].relativePath(), QString("sub/b.mkv"));
    QCOMPARE(int(catalog[1].subtitles().size()), 1);

    QCOMPARE(m_session->playback().phase(), TransportPhase::Idle);
    QVERIFY(!m_session->resume().isPending());
}

void TestFolderSession::testOpenWithoutReadAccess()
{
    m_permissions->setRead(AccessState::Denied);
    m_session = std::make_unique<FolderSession>(m_config, *m_storage, *m_permissions);
    QSignalSpy issues(m_session.get(), &FolderSession::issueRaised);

    QVERIFY(!m_session->open(m_storage->rootRef()));
    QVERIFY(!m_session->isOpen());
    QCOMPARE(issues.count(), 1);
    QCOMPARE(issues.first().at(0).value<SessionIssue>(), SessionIssue::PermissionRevoked);
}

void TestFolderSession::testStaleResumeDiscarded()
{
    PlaybackSettings settings;
    settings.volume = 0.2;
    writeState("deleted.mp4", 120.0, settings);

    QVERIFY(openAndWait());
    QVERIFY(!m_session->resume().isPending());
    QCOMPARE(m_session->playback().phase(), TransportPhase::Idle);
    QCOMPARE(m_session->playback().settings().volume, PlaybackSettings::DEFAULT_VOLUME);
}

void TestFolderSession::testInvalidStateStartsFresh()
{
    m_storage->addFile(m_config.stateFileName, "{{{ definitely not json");
    m_session = std::make_unique<FolderSession>(m_config, *m_storage, *m_permissions);
    QSignalSpy issues(m_session.get(), &FolderSession::issueRaised);

    QVERIFY(openAndWait());
    QVERIFY(!m_session->resume().isPending());
    QCOMPARE(issues.count(), 0);
    QCOMPARE(m_session->playback().phase(), TransportPhase::Idle);
}

void TestFolderSession::testResumeAppliesSettingsAndPosition()
{
    PlaybackSettings settings;
    settings.volume = 0.3;
    settings.playbackRate = 1.5;
    settings.aspectRatio = AspectRatioMode::Cover;
    writeState("sub/b.mkv", 42.0, settings);

    QVERIFY(openAndWait());
    QVERIFY(m_session->resume().isPending());
    QCOMPARE(m_session->resume().currentOffer().lastFile, QString("sub/b.mkv"));
    QCOMPARE(m_session->resume().currentOffer().index, 1);

    // Applied before any decision
    QCOMPARE(m_session->playback().settings().volume, 0.3);
    QCOMPARE(m_session->playback().settings().playbackRate, 1.5);
    QCOMPARE(m_session->playback().phase(), TransportPhase::Idle);

    QVERIFY(m_session->resume().resolve(ResumeChoice::Resume));
    QCOMPARE(m_session->playback().state().currentIndex, 1);
    QCOMPARE(m_session->playback().state().position, 42.0);
    QCOMPARE(m_session->playback().phase(), TransportPhase::Playing);
    QCOMPARE(m_session->playback().settings().aspectRatio, AspectRatioMode::Cover);
}

void TestFolderSession::testCountdownAutoResumes()
{
    m_config.resumeCountdownMs = 100;
    writeState("a.mp4", 7.0);

    QVERIFY(openAndWait());
    QSignalSpy resolved(&m_session->resume(), &ResumeNegotiator::resolved);
    QVERIFY(m_session->resume().isPending());
    QVERIFY(resolved.wait(3000));

    QCOMPARE(resolved.first().at(2).toBool(), true);
    QCOMPARE(m_session->playback().state().currentIndex, 0);
    QCOMPARE(m_session->playback().state().position, 7.0);
}

void TestFolderSession::testDismissKeepsSettings()
{
    PlaybackSettings settings;
    settings.loop = true;
    writeState("a.mp4", 7.0, settings);

    QVERIFY(openAndWait());
    QVERIFY(m_session->resume().resolve(ResumeChoice::Dismiss));
    QCOMPARE(m_session->playback().phase(), TransportPhase::Idle);
    QVERIFY(m_session->playback().settings().loop);
    QVERIFY(m_session->isOpen());
}

void TestFolderSession::testUserSelectCancelsCountdown()
{
    m_config.resumeCountdownMs = 100;
    writeState("a.mp4", 7.0);

    QVERIFY(openAndWait());
    QVERIFY(m_session->resume().isPending());
    QSignalSpy resolved(&m_session->resume(), &ResumeNegotiator::resolved);

    QVERIFY(m_session->playback().select(1));
    QVERIFY(!m_session->resume().isPending());
    QTest::qWait(300);

    QCOMPARE(m_session->playback().state().currentIndex, 1);
    QCOMPARE(m_session->playback().phase(), TransportPhase::Playing);
    QCOMPARE(resolved.count(), 1);
    QCOMPARE(resolved.first().at(0).value<ResumeChoice>(), ResumeChoice::Dismiss);
    QCOMPARE(resolved.first().at(2).toBool(), false);
}

void TestFolderSession::testUserSettingsChangeCancelsCountdown()
{
    m_config.resumeCountdownMs = 100;
    writeState("sub/b.mkv", 12.0);

    QVERIFY(openAndWait());
    QSignalSpy resolved(&m_session->resume(), &ResumeNegotiator::resolved);

    m_session->playback().setVolume(0.4);
    QTest::qWait(300);

    QCOMPARE(resolved.count(), 1);
    QCOMPARE(resolved.first().at(0).value<ResumeChoice>(), ResumeChoice::Dismiss);
    QCOMPARE(m_session->playback().phase(), TransportPhase::Idle);
    QCOMPARE(m_session->playback().settings().volume, 0.4);
}

void TestFolderSession::testStartOverForgetsFolder()
{
    PreferencesStore preferences(m_testDataDir->filePath("startover.sqlite"));
    writeState("a.mp4", 7.0);

    m_session = std::make_unique<FolderSession>(m_config, *m_storage, *m_permissions);
    m_session->setPreferencesStore(&preferences);
    QSignalSpy startedOver(m_session.get(), &FolderSession::startedOver);

    QVERIFY(openAndWait());
    QCOMPARE(preferences.rememberedFolder(), m_storage->rootRef());

    QVERIFY(m_session->resume().resolve(ResumeChoice::StartOver));
    QCOMPARE(startedOver.count(), 1);
    QVERIFY(!m_session->isOpen());
    QVERIFY(m_session->playback().catalog().isEmpty());
    QVERIFY(m_session->playback().settings() == PlaybackSettings());
    QVERIFY(preferences.rememberedFolder().isEmpty());
    QVERIFY(!m_session->openRemembered());

    // The session must not outlive the preferences store it points at
    m_session.reset();
}

void TestFolderSession::testSettingsChangesPersistWithinThrottleWindow()
{
    QVERIFY(openAndWait());
    PlaybackSession& playback = m_session->playback();

    QVERIFY(playback.select(0));
    QCOMPARE(playback.phase(), TransportPhase::Playing);
    playback.reportPosition(10.0);
    QVERIFY(m_session->autosaver()->hasPendingThrottledWrite());

    playback.setVolume(0.5);
    playback.toggleLoop();

    // Both changes are on disk well before the 5 s window closes
    auto record = storedRecord();
    QVERIFY(record.has_value());
    QCOMPARE(record->lastFile, QString("a.mp4"));
    QCOMPARE(record->settings.volume, 0.5);
    QVERIFY(record->settings.loop);
    QCOMPARE(record->lastPosition, 10.0);
}

void TestFolderSession::testCloseFlushesLatestPosition()
{
    QVERIFY(openAndWait());
    PlaybackSession& playback = m_session->playback();

    QVERIFY(playback.select(1));
    playback.reportPosition(5.0);
    playback.reportPosition(20.0);
    QVERIFY(m_session->autosaver()->hasPendingThrottledWrite());

    QSignalSpy closed(m_session.get(), &FolderSession::closed);
    m_session->close();
    QCOMPARE(closed.count(), 1);

    auto record = ProgressRecord::fromJson(m_storage->fileData(m_config.stateFileName));
    QVERIFY(record.has_value());
    QCOMPARE(record->lastFile, QString("sub/b.mkv"));
    QCOMPARE(record->lastPosition, 20.0);

    // The flush is the newest write
    QCOMPARE(m_storage->writeHistory().last(), m_storage->fileData(m_config.stateFileName));
}

void TestFolderSession::testWriteFailureRaisesIssue()
{
    QVERIFY(openAndWait());
    QSignalSpy issues(m_session.get(), &FolderSession::issueRaised);
    m_storage->failWrites(StorageStatus::IoError);

    QVERIFY(m_session->playback().select(0));
    QTRY_VERIFY_WITH_TIMEOUT(issues.count() > 0, 3000);
    QCOMPARE(issues.first().at(0).value<SessionIssue>(), SessionIssue::PersistenceWriteFailed);

    // Playback is unaffected by persistence failures
    QCOMPARE(m_session->playback().phase(), TransportPhase::Playing);
}

void TestFolderSession::testStateReadDeniedRaisesIssue()
{
    writeState("a.mp4", 3.0);
    m_storage->failReads(StorageStatus::PermissionDenied);
    m_session = std::make_unique<FolderSession>(m_config, *m_storage, *m_permissions);
    QSignalSpy issues(m_session.get(), &FolderSession::issueRaised);

    QVERIFY(openAndWait());
    QVERIFY(!m_session->resume().isPending());
    QCOMPARE(issues.count(), 1);
    QCOMPARE(issues.first().at(0).value<SessionIssue>(), SessionIssue::PermissionRevoked);
}

void TestFolderSession::testDegradedScanRaisesIssue()
{
    m_storage->addFile("private/c.mp4");
    m_storage->failListing("private");
    m_session = std::make_unique<FolderSession>(m_config, *m_storage, *m_permissions);
    QSignalSpy issues(m_session.get(), &FolderSession::issueRaised);
    QSignalSpy ready(m_session.get(), &FolderSession::catalogReady);

    QVERIFY(openAndWait());
    QCOMPARE(ready.first().at(1).toBool(), true);
    QCOMPARE(int(m_session->playback().catalog().size()), 2);
    QCOMPARE(issues.count(), 1);
    QCOMPARE(issues.first().at(0).value<SessionIssue>(), SessionIssue::ScanDegraded);
    QVERIFY(m_session->lastScan().degraded);
}

void TestFolderSession::testReopenReplacesCatalog()
{
    QVERIFY(openAndWait());
    QVERIFY(m_session->playback().select(0));

    m_storage->addFile("z.flac");
    QVERIFY(openAndWait());
    QCOMPARE(int(m_session->playback().catalog().size()), 3);
    QCOMPARE(m_session->playback().phase(), TransportPhase::Idle);

    // The first session's position was flushed on the implicit close
    auto record = storedRecord();
    QVERIFY(record.has_value());
    QCOMPARE(record->lastFile, QString("a.mp4"));
}

QTEST_MAIN(TestFolderSession)
#include "test_folder_session.moc"
