#pragma once

#include "loaded_media.h"
#include "media_loader.h"
#include "render_surface.h"
#include "../config/session_config.h"
#include "../models/media_item.h"
#include "../models/session_state.h"
#include "../persistence/progress_record.h"

#include <QObject>
#include <QPointer>

#include <functional>
#include <optional>

/**
 * Transport state machine of one session.
 *
 * Owns SessionState and mutates it only through the command API below. Every
 * selection bumps a generation counter; load results carrying an older
 * generation are discarded, so a superseded load never touches the current item.
 * All methods must be called from the owning thread.
 */
class PlaybackSession : public QObject
{
    Q_OBJECT

public:
    // Uniform integer in [0, bound)
    using RandomIndexFn = std::function<int(int bound)>;

    explicit PlaybackSession(const SessionConfig& config, QObject* parent = nullptr);
    ~PlaybackSession() override;

    void setRenderSurface(RenderSurface* surface);
    void setMediaLoader(MediaLoader* loader);
    void setRandomSource(RandomIndexFn random);
    void setShufflePolicy(ShufflePolicy policy) { m_shufflePolicy = policy; }

    // Replace the catalog wholesale; the session returns to Idle
    void setCatalog(const Catalog& catalog);
    // Empty catalog, Idle, default settings
    void reset();

    const Catalog& catalog() const { return m_catalog; }
    const SessionState& state() const { return m_state; }
    TransportPhase phase() const { return m_state.phase; }
    const PlaybackSettings& settings() const { return m_state.settings; }
    const MediaItem* currentItem() const;
    const LoadedMedia* currentMedia() const;
    int indexOf(const QString& relativePath) const;
    quint64 generation() const { return m_generation; }
    int transcodeProgress() const { return m_transcodePercent; }

    // Record for the progress store; nullopt while nothing is selected
    std::optional<ProgressRecord> progressSnapshot() const;

    // --- Transport commands ---
    bool select(int index, bool autoplay = true);
    // Select and start at position (resume path)
    bool playAt(int index, double position);
    void pause();
    void resume();
    void togglePlayPause();
    void seek(double seconds);
    void seekRelative(double deltaSeconds);
    void next();
    void prev();
    // Deselect and return to Idle, keeping the catalog
    void stop();

    // --- Settings commands (each is persisted immediately) ---
    void setVolume(double volume);
    void adjustVolume(double delta);
    bool setSpeed(double rate);
    void cycleSpeed();
    void toggleShuffle();
    void toggleLoop();
    void setAspectRatio(AspectRatioMode mode);
    void cycleAspectRatio();
    void toggleSubtitles();
    void setSubtitleFontSize(int px);

    // Restore persisted settings; not a user change, so settingsChanged is not emitted
    void applySettings(const PlaybackSettings& settings);

    // --- Render surface reports ---
    void reportReady();
    void reportPosition(double seconds);
    void reportDuration(double seconds);
    void reportEnded();
    void reportError(const QString& message);

signals:
    void phaseChanged(TransportPhase phase);
    void currentItemChanged(int index);
    void positionChanged(double seconds);
    void durationChanged(double seconds);
    void settingsChanged(const PlaybackSettings& settings);
    void settingsApplied(const PlaybackSettings& settings);
    void catalogChanged(int itemCount);
    void transcodeProgressChanged(int percent);
    void mediaUnplayable(int index, const QString& message);

private slots:
    void onLoadProgress(quint64 generation, int percent);
    void onLoadFinished(quint64 generation, const LoadedMedia& media);
    void onLoadFailed(quint64 generation, const QString& message);

private:
    void beginLoad(int index, double startPosition, bool autoplay);
    void goIdle();
    void cancelInFlight();
    void setPhase(TransportPhase phase);
    void commitSettings();
    int pickShuffleIndex() const;
    bool isLoading() const;

    const double m_restartThreshold;
    const double m_seekStep;
    const double m_volumeStep;
    ShufflePolicy m_shufflePolicy;

    Catalog m_catalog;
    SessionState m_state;

    quint64 m_generation = 0;
    mcp::CancellationToken m_cancel;
    bool m_autoplay = true;
    int m_transcodePercent = -1;
    std::optional<LoadedMedia> m_currentMedia;

    RenderSurface* m_surface = nullptr;
    QPointer<MediaLoader> m_loader;
    RandomIndexFn m_random;
};
