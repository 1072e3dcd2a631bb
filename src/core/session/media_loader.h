#pragma once

#include "loaded_media.h"
#include "../storage/storage_provider.h"

#include <media_compat_platform/mcp_compat_pipeline.h>

#include <QObject>
#include <QThreadPool>

#include <map>
#include <mutex>

/**
 * Turns a selected MediaItem into LoadedMedia, possibly asynchronously.
 * Results are delivered on the loader's thread through the signals, tagged with
 * the request's generation; the receiver discards stale generations.
 */
class MediaLoader : public QObject
{
    Q_OBJECT

public:
    using QObject::QObject;
    ~MediaLoader() override = default;

    virtual void startLoad(const LoadRequest& request) = 0;

signals:
    void loadProgress(quint64 generation, int percent);
    void loadFinished(quint64 generation, const LoadedMedia& media);
    void loadFailed(quint64 generation, const QString& message);
};

/**
 * MediaLoader that runs the codec compatibility pipeline on a worker thread
 */
class PipelineMediaLoader : public MediaLoader
{
    Q_OBJECT

public:
    PipelineMediaLoader(const StorageProvider& storage, mcp::CompatibilityPipeline& pipeline,
                        QObject* parent = nullptr);
    ~PipelineMediaLoader() override;

    void startLoad(const LoadRequest& request) override;

    // Cancel every in-flight load and wait for the workers to return
    void shutdown();

private:
    void runLoad(const LoadRequest& request);

    const StorageProvider& m_storage;
    mcp::CompatibilityPipeline& m_pipeline;
    QThreadPool m_pool;

    std::mutex m_tokensMutex;
    std::map<quint64, mcp::CancellationToken> m_active;   // generation -> token
};
