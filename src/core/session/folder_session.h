#pragma once

#include "playback_session.h"
#include "resume_negotiator.h"
#include "session_issue.h"
#include "../catalog/catalog_builder.h"
#include "../config/session_config.h"
#include "../persistence/preferences_store.h"
#include "../persistence/progress_autosaver.h"
#include "../persistence/progress_store.h"
#include "../storage/permission_gate.h"
#include "../storage/storage_provider.h"

#include <QObject>
#include <QThread>

#include <atomic>
#include <memory>

/**
 * One folder bound to one PlaybackSession.
 *
 * open() checks access, scans the folder on a worker thread and applies the
 * catalog on the owning thread, then reads the state file and starts the resume
 * decision. close() (also run on destruction) flushes progress synchronously.
 */
class FolderSession : public QObject
{
    Q_OBJECT

public:
    FolderSession(const SessionConfig& config, StorageProvider& storage, PermissionGate& permissions,
                  QObject* parent = nullptr);
    ~FolderSession() override;

    void setMediaLoader(MediaLoader* loader) { m_playback.setMediaLoader(loader); }
    void setRenderSurface(RenderSurface* surface) { m_playback.setRenderSurface(surface); }
    // Optional; remembers the folder and supplies file-type preferences
    void setPreferencesStore(PreferencesStore* preferences);
    void setFileTypePreferences(const FileTypePreferences& fileTypes) { m_fileTypes = fileTypes; }

    /**
     * Bind to rootRef and start scanning.
     * Returns false (and raises PermissionRevoked) when the folder cannot be read.
     */
    bool open(const QString& rootRef);

    // Open the folder remembered in the preferences store, if any
    bool openRemembered();

    void close();

    // Flush, forget the remembered folder and return to the pre-folder state
    void startOver();

    bool isOpen() const { return m_open; }
    bool isScanning() const { return m_scanThread && m_scanThread->isRunning(); }
    QString rootRef() const { return m_rootRef; }
    const ScanResult& lastScan() const { return m_lastScan; }
    const SessionConfig& config() const { return m_config; }

    PlaybackSession& playback() { return m_playback; }
    ResumeNegotiator& resume() { return m_resume; }
    ProgressStore* progressStore() { return m_store.get(); }
    ProgressAutosaver* autosaver() { return m_autosaver.get(); }

signals:
    void scanStarted(const QString& rootRef);
    void catalogReady(int itemCount, bool degraded);
    void issueRaised(SessionIssue issue, const QString& detail);
    void closed();
    void startedOver();

private slots:
    void onResumeResolved(ResumeChoice choice, const ResumeOffer& offer, bool automatic);
    void onWriteFailed(StorageStatus status, const QString& message);

private:
    void startScan();
    void stopScan();
    void applyScan(const ScanResult& result);
    void offerResume();
    void connectAutosaver();

    const SessionConfig m_config;
    StorageProvider& m_storage;
    PermissionGate& m_permissions;
    PreferencesStore* m_preferences = nullptr;
    FileTypePreferences m_fileTypes;

    PlaybackSession m_playback;
    ResumeNegotiator m_resume;

    bool m_open = false;
    QString m_rootRef;
    ScanResult m_lastScan;

    std::unique_ptr<ProgressStore> m_store;
    std::unique_ptr<ProgressAutosaver> m_autosaver;

    std::unique_ptr<QThread> m_scanThread;
    std::shared_ptr<std::atomic<bool>> m_scanCancel;
    quint64 m_scanToken = 0;
};
