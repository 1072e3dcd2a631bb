#pragma once

#include "progress_record.h"
#include "../storage/storage_provider.h"

#include <QObject>

#include <condition_variable>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>

enum class ProgressReadOutcome {
    Found,
    Absent,            // No state file
    Invalid,           // Present but not a usable record
    PermissionDenied,
    IoError
};

struct ProgressReadResult
{
    ProgressReadOutcome outcome = ProgressReadOutcome::Absent;
    std::optional<ProgressRecord> record;
    QString message;
};

/**
 * Reads and writes the state file of one session root.
 *
 * Writes carry a monotonically increasing sequence number. Asynchronous writes go
 * through a single-slot queue (a newer request replaces an older one that has not
 * started), and no write ever lands after a write with a higher sequence number.
 * writeNow() takes the next sequence and runs on the caller's thread, so a teardown
 * flush always wins over queued work.
 */
class ProgressStore : public QObject
{
    Q_OBJECT

public:
    ProgressStore(StorageProvider& storage, const QString& rootRef, const QString& fileName,
                  QObject* parent = nullptr);
    ~ProgressStore() override;

    ProgressStore(const ProgressStore&) = delete;
    ProgressStore& operator=(const ProgressStore&) = delete;

    ProgressReadResult read() const;

    // Queue a write on the writer thread; returns its sequence number
    quint64 enqueue(const ProgressRecord& record);

    // Synchronous write that supersedes anything queued
    StorageError writeNow(const ProgressRecord& record);

    // Block until the queue is empty and no write is running
    void waitForIdle();

    quint64 lastAttemptedSequence() const;
    int completedWrites() const;

    QString rootRef() const { return m_rootRef; }
    QString fileName() const { return m_fileName; }

signals:
    void writeFailed(StorageStatus status, const QString& message);
    void written(quint64 sequence);

private:
    void run();
    StorageError commit(quint64 sequence, const ProgressRecord& record);

    StorageProvider& m_storage;
    const QString m_rootRef;
    const QString m_fileName;

    // Queue state
    std::mutex m_queueMutex;
    std::condition_variable m_queueCv;
    std::condition_variable m_idleCv;
    std::optional<std::pair<quint64, ProgressRecord>> m_pending;
    bool m_busy = false;
    bool m_stopping = false;
    quint64 m_nextSequence = 0;

    // Serializes storage writes and guards the ordering check
    mutable std::mutex m_ioMutex;
    quint64 m_lastAttempted = 0;
    int m_completedWrites = 0;

    std::thread m_worker;
};
