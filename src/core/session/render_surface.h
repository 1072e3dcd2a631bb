#pragma once

#include "loaded_media.h"
#include "../models/playback_settings.h"

/**
 * The native decode/render path, driven by PlaybackSession.
 * Implementations report back through PlaybackSession::reportReady(),
 * reportPosition(), reportDuration(), reportEnded() and reportError().
 */
class RenderSurface
{
public:
    virtual ~RenderSurface() = default;

    // Replace whatever is loaded; playback starts only on play()
    virtual void load(const LoadedMedia& media, double startPosition) = 0;
    virtual void play() = 0;
    virtual void pause() = 0;
    virtual void seek(double seconds) = 0;
    virtual void applySettings(const PlaybackSettings& settings) = 0;
    // Unload, show nothing
    virtual void clear() = 0;
};
