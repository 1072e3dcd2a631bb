#pragma once

#include "progress_store.h"
#include "../config/session_config.h"

#include <QElapsedTimer>
#include <QObject>
#include <QTimer>

#include <functional>
#include <optional>

/**
 * Decides when session state reaches the ProgressStore.
 *
 * - position / item changes: at most one write per throttle window, with a trailing
 *   write at the end of the window so the latest position is not lost
 * - pause: one write after the settle delay
 * - settings changes: written immediately
 * - flushNow(): synchronous, independent of the throttle window
 *
 * The snapshot function returns nullopt when there is nothing worth saving
 * (no item selected); such triggers are ignored.
 */
class ProgressAutosaver : public QObject
{
    Q_OBJECT

public:
    using SnapshotFn = std::function<std::optional<ProgressRecord>()>;

    ProgressAutosaver(ProgressStore& store, SnapshotFn snapshot, const SessionConfig& config,
                      QObject* parent = nullptr);
    ~ProgressAutosaver() override;

    int requestedWrites() const { return m_requestedWrites; }
    bool hasPendingThrottledWrite() const { return m_trailingTimer.isActive(); }

public slots:
    void onPositionChanged();
    void onItemChanged();
    void onPaused();
    void onSettingsChanged();

    // Teardown: write the latest state now, on this thread
    StorageError flushNow();

    // Stop timers; later triggers are ignored
    void stop();

private:
    void throttledWrite();
    void writeAsync();

    ProgressStore& m_store;
    SnapshotFn m_snapshot;
    const int m_throttleWindowMs;

    QElapsedTimer m_sinceLastWrite;
    QTimer m_trailingTimer;
    QTimer m_settleTimer;
    int m_requestedWrites = 0;
    bool m_stopped = false;
};
