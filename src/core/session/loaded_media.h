#pragma once

#include "../models/media_item.h"

#include <media_compat_platform/mcp_compat_pipeline.h>
#include <media_compat_platform/mcp_transcode_engine.h>

#include <QMetaType>
#include <QString>
#include <QVector>

#include <memory>

/**
 * A selected item whose bytes are ready for the render surface.
 * Holding it keeps a transcoded artifact alive.
 */
struct LoadedMedia
{
    QString sourceRef;           // Original storage reference
    QString playablePath;        // Original or transcoded file; empty if not addressable
    bool wasTranscoded = false;
    QString outcome;             // Pipeline outcome name, for diagnostics
    QString detail;
    QVector<SubtitleRef> subtitles;
    std::shared_ptr<const mcp::TranscodedArtifact> artifact;
};

/**
 * One load operation, tagged with the generation of the selection that started it
 */
struct LoadRequest
{
    quint64 generation = 0;
    MediaItem item;
    mcp::CancellationToken cancel;
};

Q_DECLARE_METATYPE(LoadedMedia)
