#include "media_loader.h"

#include <QFileInfo>
#include <QLoggingCategory>
#include <QMetaObject>

Q_LOGGING_CATEGORY(folderplayLoader, "folderplay.session.loader")

PipelineMediaLoader::PipelineMediaLoader(const StorageProvider& storage, mcp::CompatibilityPipeline& pipeline,
                                         QObject* parent)
    : MediaLoader(parent)
    , m_storage(storage)
    , m_pipeline(pipeline)
{
    qRegisterMetaType<LoadedMedia>("LoadedMedia");
    // Engine use is serialized anyway; two workers let a cancelled job drain while the next one queues
    m_pool.setMaxThreadCount(2);
}

PipelineMediaLoader::~PipelineMediaLoader()
{
    shutdown();
}

void PipelineMediaLoader::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(m_tokensMutex);
        for (auto& entry : m_active) {
            entry.second.cancel();
        }
    }
    m_pool.waitForDone();
}

void PipelineMediaLoader::startLoad(const LoadRequest& request)
{
    {
        std::lock_guard<std::mutex> lock(m_tokensMutex);
        // Only the newest selection matters
        for (auto& entry : m_active) {
            entry.second.cancel();
        }
        m_active[request.generation] = request.cancel;
    }
    m_pool.start([this, request]() { runLoad(request); });
}

void PipelineMediaLoader::runLoad(const LoadRequest& request)
{
    const quint64 generation = request.generation;
    const MediaItem& item = request.item;

    LoadedMedia media;
    media.sourceRef = item.sourceRef();

    const QString localPath = m_storage.localPath(item.sourceRef());
    if (!localPath.isEmpty() && !QFileInfo(localPath).isReadable()) {
        const QString message = QString("Cannot read %1").arg(item.relativePath());
        QMetaObject::invokeMethod(this, [this, generation, message]() {
            emit loadFailed(generation, message);
        }, Qt::QueuedConnection);
        std::lock_guard<std::mutex> lock(m_tokensMutex);
        m_active.erase(generation);
        return;
    }

    mcp::MediaSource source;
    source.path = localPath.toStdString();
    source.name = item.name().toStdString();

    auto progress = [this, generation](int percent) {
        QMetaObject::invokeMethod(this, [this, generation, percent]() {
            emit loadProgress(generation, percent);
        }, Qt::QueuedConnection);
    };

    mcp::PlayableMedia playable = m_pipeline.EnsurePlayable(source, progress, request.cancel);

    media.playablePath = QString::fromStdString(playable.path);
    media.wasTranscoded = playable.was_transcoded;
    media.outcome = QString::fromLatin1(mcp::pipeline_outcome_to_string(playable.outcome));
    media.detail = QString::fromStdString(playable.detail);
    media.artifact = playable.artifact;
    for (const SubtitleRef& subtitle : item.subtitles()) {
        SubtitleRef resolved = subtitle;
        const QString subtitlePath = m_storage.localPath(subtitle.sourceRef);
        if (!subtitlePath.isEmpty()) {
            resolved.sourceRef = subtitlePath;
        }
        media.subtitles.append(resolved);
    }

    switch (playable.outcome) {
    case mcp::PipelineOutcome::FallbackEngineUnavailable:
    case mcp::PipelineOutcome::FallbackProbeFailed:
    case mcp::PipelineOutcome::FallbackTranscodeFailed:
        qCWarning(folderplayLoader, "%s: %s, playing original (%s)", qPrintable(item.relativePath()),
                  qPrintable(media.outcome), qPrintable(media.detail));
        break;
    default:
        qCDebug(folderplayLoader, "%s: %s", qPrintable(item.relativePath()), qPrintable(media.outcome));
        break;
    }

    {
        std::lock_guard<std::mutex> lock(m_tokensMutex);
        m_active.erase(generation);
    }

    if (playable.outcome == mcp::PipelineOutcome::Cancelled) {
        // A newer selection replaced this one; nobody wants the result
        return;
    }

    QMetaObject::invokeMethod(this, [this, generation, media]() {
        emit loadFinished(generation, media);
    }, Qt::QueuedConnection);
}
