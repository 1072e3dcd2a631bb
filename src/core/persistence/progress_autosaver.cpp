#include "progress_autosaver.h"

#include <QLoggingCategory>

Q_LOGGING_CATEGORY(folderplayAutosave, "folderplay.persistence.autosave")

ProgressAutosaver::ProgressAutosaver(ProgressStore& store, SnapshotFn snapshot, const SessionConfig& config,
                                     QObject* parent)
    : QObject(parent)
    , m_store(store)
    , m_snapshot(std::move(snapshot))
    , m_throttleWindowMs(config.throttleWindowMs)
{
    m_trailingTimer.setSingleShot(true);
    connect(&m_trailingTimer, &QTimer::timeout, this, &ProgressAutosaver::writeAsync);

    m_settleTimer.setSingleShot(true);
    m_settleTimer.setInterval(config.pauseSettleDelayMs);
    connect(&m_settleTimer, &QTimer::timeout, this, &ProgressAutosaver::writeAsync);
}

ProgressAutosaver::~ProgressAutosaver()
{
    stop();
}

void ProgressAutosaver::onPositionChanged()
{
    throttledWrite();
}

void ProgressAutosaver::onItemChanged()
{
    throttledWrite();
}

void ProgressAutosaver::onPaused()
{
    if (m_stopped) return;
    // Let the final position report of the paused item land first
    m_settleTimer.start();
}

void ProgressAutosaver::onSettingsChanged()
{
    if (m_stopped) return;
    writeAsync();
}

void ProgressAutosaver::throttledWrite()
{
    if (m_stopped) return;

    if (!m_sinceLastWrite.isValid() || m_sinceLastWrite.elapsed() >= m_throttleWindowMs) {
        writeAsync();
        return;
    }
    if (!m_trailingTimer.isActive()) {
        m_trailingTimer.start(int(m_throttleWindowMs - m_sinceLastWrite.elapsed()));
    }
}

void ProgressAutosaver::writeAsync()
{
    if (m_stopped) return;

    std::optional<ProgressRecord> record = m_snapshot();
    if (!record) {
        return;
    }

    m_trailingTimer.stop();
    m_sinceLastWrite.start();
    ++m_requestedWrites;
    m_store.enqueue(*record);
}

StorageError ProgressAutosaver::flushNow()
{
    m_trailingTimer.stop();
    m_settleTimer.stop();

    std::optional<ProgressRecord> record = m_snapshot();
    if (!record) {
        qCDebug(folderplayAutosave, "Nothing to flush");
        return StorageError::success();
    }

    ++m_requestedWrites;
    m_sinceLastWrite.start();
    return m_store.writeNow(*record);
}

void ProgressAutosaver::stop()
{
    m_stopped = true;
    m_trailingTimer.stop();
    m_settleTimer.stop();
}
