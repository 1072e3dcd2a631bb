#include "folder_session.h"

#include <QLoggingCategory>

Q_LOGGING_CATEGORY(folderplayFolder, "folderplay.session.folder")

FolderSession::FolderSession(const SessionConfig& config, StorageProvider& storage, PermissionGate& permissions,
                             QObject* parent)
    : QObject(parent)
    , m_config(config)
    , m_storage(storage)
    , m_permissions(permissions)
    , m_fileTypes(FileTypePreferences::defaults())
    , m_playback(config)
    , m_resume(config.resumeCountdownMs)
{
    qRegisterMetaType<SessionIssue>("SessionIssue");
    qRegisterMetaType<StorageStatus>("StorageStatus");

    connect(&m_resume, &ResumeNegotiator::resolved, this, &FolderSession::onResumeResolved);

    // A user command while the offer is up dismisses it; settingsApplied is not a user command
    auto dismissPendingOffer = [this]() {
        if (m_resume.isPending()) {
            qCDebug(folderplayFolder, "User command while resume offer pending, dismissing it");
            m_resume.resolve(ResumeChoice::Dismiss);
        }
    };
    connect(&m_playback, &PlaybackSession::currentItemChanged, this, dismissPendingOffer);
    connect(&m_playback, &PlaybackSession::settingsChanged, this, dismissPendingOffer);
    connect(&m_playback, &PlaybackSession::mediaUnplayable, this, [this](int index, const QString& message) {
        const MediaItem* item = m_playback.currentItem();
        emit issueRaised(SessionIssue::MediaUnplayable,
                         QString("%1: %2").arg(item ? item->relativePath() : QString::number(index), message));
    });
}

FolderSession::~FolderSession()
{
    close();
}

void FolderSession::setPreferencesStore(PreferencesStore* preferences)
{
    m_preferences = preferences;
    if (m_preferences) {
        m_fileTypes = m_preferences->loadPreferences();
    }
}

bool FolderSession::open(const QString& rootRef)
{
    // Algorithm: Check access → Bind store + autosaver → Scan (async) → Read state → Offer resume
    if (m_open) {
        close();
    }

    if (m_permissions.queryAccess(rootRef, AccessMode::Read) == AccessState::Denied) {
        qCWarning(folderplayFolder, "No read access to %s", qPrintable(rootRef));
        emit issueRaised(SessionIssue::PermissionRevoked, rootRef);
        return false;
    }
    if (m_permissions.queryAccess(rootRef, AccessMode::ReadWrite) == AccessState::Denied) {
        qCWarning(folderplayFolder, "%s is read-only, progress will not be saved", qPrintable(rootRef));
    }

    m_open = true;
    m_rootRef = rootRef;
    m_lastScan = ScanResult();

    m_store = std::make_unique<ProgressStore>(m_storage, rootRef, m_config.stateFileName);
    connect(m_store.get(), &ProgressStore::writeFailed, this, &FolderSession::onWriteFailed);

    m_autosaver = std::make_unique<ProgressAutosaver>(
        *m_store, [this]() { return m_playback.progressSnapshot(); }, m_config);
    connectAutosaver();

    if (m_preferences) {
        m_preferences->rememberFolder(rootRef);
    }

    m_playback.setCatalog(Catalog());
    startScan();
    return true;
}

bool FolderSession::openRemembered()
{
    if (!m_preferences) {
        return false;
    }
    const QString remembered = m_preferences->rememberedFolder();
    if (remembered.isEmpty()) {
        return false;
    }
    return open(remembered);
}

void FolderSession::connectAutosaver()
{
    ProgressAutosaver* saver = m_autosaver.get();
    connect(&m_playback, &PlaybackSession::positionChanged, saver, &ProgressAutosaver::onPositionChanged);
    connect(&m_playback, &PlaybackSession::currentItemChanged, saver, &ProgressAutosaver::onItemChanged);
    connect(&m_playback, &PlaybackSession::settingsChanged, saver, &ProgressAutosaver::onSettingsChanged);
    connect(&m_playback, &PlaybackSession::phaseChanged, saver, [saver](TransportPhase phase) {
        if (phase == TransportPhase::Paused) {
            saver->onPaused();
        }
    });
}

void FolderSession::startScan()
{
    stopScan();

    const quint64 token = ++m_scanToken;
    auto cancel = std::make_shared<std::atomic<bool>>(false);
    auto result = std::make_shared<ScanResult>();
    const CatalogBuilder builder(m_storage, m_fileTypes);
    const QString rootRef = m_rootRef;

    m_scanCancel = cancel;
    m_scanThread.reset(QThread::create([builder, rootRef, cancel, result]() {
        *result = builder.build(rootRef, cancel.get());
    }));
    // Queued to this thread; a token mismatch means the scan was superseded
    connect(m_scanThread.get(), &QThread::finished, this, [this, token, result]() {
        if (token != m_scanToken || result->cancelled) {
            return;
        }
        applyScan(*result);
    }, Qt::QueuedConnection);

    emit scanStarted(rootRef);
    m_scanThread->start();
}

void FolderSession::stopScan()
{
    ++m_scanToken;
    if (m_scanCancel) {
        m_scanCancel->store(true);
    }
    if (m_scanThread) {
        m_scanThread->wait();
        m_scanThread.reset();
    }
    m_scanCancel.reset();
}

void FolderSession::applyScan(const ScanResult& result)
{
    if (!m_open) {
        return;
    }

    m_lastScan = result;
    m_playback.setCatalog(result.items);

    if (result.degraded) {
        emit issueRaised(SessionIssue::ScanDegraded,
                         QString("Unreadable: %1").arg(result.failedDirectories.join(QStringLiteral(", "))));
    }
    emit catalogReady(int(result.items.size()), result.degraded);

    offerResume();
}

void FolderSession::offerResume()
{
    ProgressReadResult read = m_store->read();
    switch (read.outcome) {
    case ProgressReadOutcome::Found:
        break;
    case ProgressReadOutcome::Absent:
    case ProgressReadOutcome::Invalid:
        qCDebug(folderplayFolder, "No usable progress in %s, starting fresh", qPrintable(m_rootRef));
        return;
    case ProgressReadOutcome::PermissionDenied:
        emit issueRaised(SessionIssue::PermissionRevoked, read.message);
        return;
    case ProgressReadOutcome::IoError:
        qCWarning(folderplayFolder, "Cannot read progress: %s", qPrintable(read.message));
        return;
    }

    const ProgressRecord& record = *read.record;
    const int index = m_playback.indexOf(record.lastFile);
    if (index < 0) {
        qCDebug(folderplayFolder, "Saved item %s is no longer in the folder, not offering resume",
                qPrintable(record.lastFile));
        return;
    }

    // Settings apply whether or not the user resumes
    m_playback.applySettings(record.settings);

    ResumeOffer offer;
    offer.lastFile = record.lastFile;
    offer.index = index;
    offer.position = record.lastPosition;
    offer.settings = record.settings;
    m_resume.offer(offer);
}

void FolderSession::onResumeResolved(ResumeChoice choice, const ResumeOffer& offer, bool automatic)
{
    Q_UNUSED(automatic)

    switch (choice) {
    case ResumeChoice::Resume: {
        // The catalog may have been replaced since the offer was made
        const int index = m_playback.indexOf(offer.lastFile);
        if (index < 0) {
            qCDebug(folderplayFolder, "Resume target %s vanished", qPrintable(offer.lastFile));
            return;
        }
        m_playback.playAt(index, offer.position);
        break;
    }
    case ResumeChoice::Dismiss:
        break;
    case ResumeChoice::StartOver:
        startOver();
        break;
    }
}

void FolderSession::onWriteFailed(StorageStatus status, const QString& message)
{
    if (status == StorageStatus::PermissionDenied) {
        emit issueRaised(SessionIssue::PermissionRevoked, message);
    } else {
        emit issueRaised(SessionIssue::PersistenceWriteFailed, message);
    }
}

void FolderSession::close()
{
    if (!m_open) {
        return;
    }

    m_resume.withdraw();
    stopScan();

    if (m_autosaver) {
        // Failures surface through ProgressStore::writeFailed
        m_autosaver->flushNow();
        m_autosaver->stop();
    }
    m_autosaver.reset();
    // Drains nothing newer than the flush; queued older writes are dropped
    m_store.reset();

    m_playback.setCatalog(Catalog());
    m_open = false;
    qCDebug(folderplayFolder, "Closed %s", qPrintable(m_rootRef));
    emit closed();
}

void FolderSession::startOver()
{
    close();
    if (m_preferences) {
        m_preferences->clearRememberedFolder();
    }
    m_playback.reset();
    m_rootRef.clear();
    m_lastScan = ScanResult();
    emit startedOver();
}
