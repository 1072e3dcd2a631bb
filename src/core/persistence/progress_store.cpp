#include "progress_store.h"

#include <QLoggingCategory>

Q_LOGGING_CATEGORY(folderplayPersistence, "folderplay.persistence")

ProgressStore::ProgressStore(StorageProvider& storage, const QString& rootRef, const QString& fileName,
                             QObject* parent)
    : QObject(parent)
    , m_storage(storage)
    , m_rootRef(rootRef)
    , m_fileName(fileName)
{
    qRegisterMetaType<StorageStatus>("StorageStatus");
    m_worker = std::thread(&ProgressStore::run, this);
}

ProgressStore::~ProgressStore()
{
    {
        std::lock_guard<std::mutex> lock(m_queueMutex);
        m_stopping = true;
    }
    m_queueCv.notify_all();
    // The worker drains the pending write before exiting
    if (m_worker.joinable()) {
        m_worker.join();
    }
}

ProgressReadResult ProgressStore::read() const
{
    ProgressReadResult result;

    QByteArray data;
    StorageError error = m_storage.readAll(m_storage.childRef(m_rootRef, m_fileName), data);
    if (!error.ok()) {
        result.message = error.message;
        switch (error.status) {
        case StorageStatus::NotFound:
            result.outcome = ProgressReadOutcome::Absent;
            break;
        case StorageStatus::PermissionDenied:
            result.outcome = ProgressReadOutcome::PermissionDenied;
            break;
        default:
            result.outcome = ProgressReadOutcome::IoError;
            break;
        }
        qCDebug(folderplayPersistence, "No progress read from %s: %s",
                qPrintable(m_rootRef), qPrintable(error.message));
        return result;
    }

    result.record = ProgressRecord::fromJson(data);
    result.outcome = result.record ? ProgressReadOutcome::Found : ProgressReadOutcome::Invalid;
    return result;
}

quint64 ProgressStore::enqueue(const ProgressRecord& record)
{
    quint64 sequence = 0;
    {
        std::lock_guard<std::mutex> lock(m_queueMutex);
        sequence = ++m_nextSequence;
        m_pending = std::make_pair(sequence, record);
    }
    m_queueCv.notify_one();
    return sequence;
}

StorageError ProgressStore::writeNow(const ProgressRecord& record)
{
    quint64 sequence = 0;
    {
        std::lock_guard<std::mutex> lock(m_queueMutex);
        sequence = ++m_nextSequence;
        // Anything still queued is older and would be skipped anyway
        m_pending.reset();
    }
    m_idleCv.notify_all();
    return commit(sequence, record);
}

void ProgressStore::waitForIdle()
{
    std::unique_lock<std::mutex> lock(m_queueMutex);
    m_idleCv.wait(lock, [this] { return !m_pending && !m_busy; });
}

quint64 ProgressStore::lastAttemptedSequence() const
{
    std::lock_guard<std::mutex> lock(m_ioMutex);
    return m_lastAttempted;
}

int ProgressStore::completedWrites() const
{
    std::lock_guard<std::mutex> lock(m_ioMutex);
    return m_completedWrites;
}

void ProgressStore::run()
{
    while (true) {
        std::pair<quint64, ProgressRecord> job;
        {
            std::unique_lock<std::mutex> lock(m_queueMutex);
            m_queueCv.wait(lock, [this] { return m_pending.has_value() || m_stopping; });
            if (!m_pending) {
                // Stopping with nothing left to write
                break;
            }
            job = std::move(*m_pending);
            m_pending.reset();
            m_busy = true;
        }

        commit(job.first, job.second);

        {
            std::lock_guard<std::mutex> lock(m_queueMutex);
            m_busy = false;
        }
        m_idleCv.notify_all();
    }
}

StorageError ProgressStore::commit(quint64 sequence, const ProgressRecord& record)
{
    std::unique_lock<std::mutex> lock(m_ioMutex);
    if (sequence <= m_lastAttempted) {
        qCDebug(folderplayPersistence, "Dropping superseded write #%llu", static_cast<unsigned long long>(sequence));
        return StorageError::success();
    }
    m_lastAttempted = sequence;

    StorageError error = m_storage.replaceFile(m_rootRef, m_fileName, record.toJson());
    if (error.ok()) {
        ++m_completedWrites;
    }
    lock.unlock();

    if (!error.ok()) {
        // Best effort: the next trigger retries with fresh state
        qCWarning(folderplayPersistence, "Failed to save progress to %s: %s",
                  qPrintable(m_rootRef), qPrintable(error.message));
        emit writeFailed(error.status, error.message);
    } else {
        qCDebug(folderplayPersistence, "Saved progress #%llu (%s @ %.1fs)",
                static_cast<unsigned long long>(sequence), qPrintable(record.lastFile), record.lastPosition);
        emit written(sequence);
    }
    return error;
}
