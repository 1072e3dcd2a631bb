#include "session_state.h"

QString transportPhaseToString(TransportPhase phase)
{
    switch (phase) {
    case TransportPhase::Idle:        return QStringLiteral("idle");
    case TransportPhase::Loading:     return QStringLiteral("loading");
    case TransportPhase::Transcoding: return QStringLiteral("transcoding");
    case TransportPhase::Playing:     return QStringLiteral("playing");
    case TransportPhase::Paused:      return QStringLiteral("paused");
    case TransportPhase::Ended:       return QStringLiteral("ended");
    case TransportPhase::Error:       return QStringLiteral("error");
    }
    return QStringLiteral("idle");
}
