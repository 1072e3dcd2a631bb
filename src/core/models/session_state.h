#pragma once

#include "playback_settings.h"

#include <QString>

/**
 * Transport phase of the playback session.
 * Transcoding is a sub-state of Loading, exposed separately for progress display.
 */
enum class TransportPhase {
    Idle,
    Loading,
    Transcoding,
    Playing,
    Paused,
    Ended,
    Error
};

QString transportPhaseToString(TransportPhase phase);

struct SessionState
{
    int currentIndex = -1;                       // -1 = nothing selected
    TransportPhase phase = TransportPhase::Idle;
    double position = 0.0;                       // seconds
    double duration = 0.0;                       // seconds, 0 until known
    PlaybackSettings settings;

    bool hasSelection() const { return currentIndex >= 0; }
};
