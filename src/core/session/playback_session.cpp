#include "playback_session.h"

#include <QLoggingCategory>
#include <QRandomGenerator>

#include <algorithm>
#include <cmath>

Q_LOGGING_CATEGORY(folderplaySession, "folderplay.session")

PlaybackSession::PlaybackSession(const SessionConfig& config, QObject* parent)
    : QObject(parent)
    , m_restartThreshold(config.restartThresholdSeconds)
    , m_seekStep(config.seekStepSeconds)
    , m_volumeStep(config.volumeStep)
    , m_shufflePolicy(config.shufflePolicy)
{
    m_random = [](int bound) { return int(QRandomGenerator::global()->bounded(bound)); };
}

PlaybackSession::~PlaybackSession()
{
    cancelInFlight();
}

void PlaybackSession::setRenderSurface(RenderSurface* surface)
{
    m_surface = surface;
    if (m_surface) {
        m_surface->applySettings(m_state.settings);
    }
}

void PlaybackSession::setMediaLoader(MediaLoader* loader)
{
    if (m_loader) {
        disconnect(m_loader, nullptr, this, nullptr);
    }
    m_loader = loader;
    if (!loader) {
        return;
    }
    connect(loader, &MediaLoader::loadProgress, this, &PlaybackSession::onLoadProgress);
    connect(loader, &MediaLoader::loadFinished, this, &PlaybackSession::onLoadFinished);
    connect(loader, &MediaLoader::loadFailed, this, &PlaybackSession::onLoadFailed);
}

void PlaybackSession::setRandomSource(RandomIndexFn random)
{
    m_random = std::move(random);
}

void PlaybackSession::setCatalog(const Catalog& catalog)
{
    goIdle();
    m_catalog = catalog;
    emit catalogChanged(int(m_catalog.size()));
}

void PlaybackSession::reset()
{
    setCatalog(Catalog());
    applySettings(PlaybackSettings());
}

const MediaItem* PlaybackSession::currentItem() const
{
    if (m_state.currentIndex < 0 || m_state.currentIndex >= m_catalog.size()) {
        return nullptr;
    }
    return &m_catalog[m_state.currentIndex];
}

const LoadedMedia* PlaybackSession::currentMedia() const
{
    return m_currentMedia ? &*m_currentMedia : nullptr;
}

int PlaybackSession::indexOf(const QString& relativePath) const
{
    for (int i = 0; i < m_catalog.size(); ++i) {
        if (m_catalog[i].relativePath() == relativePath) {
            return i;
        }
    }
    return -1;
}

std::optional<ProgressRecord> PlaybackSession::progressSnapshot() const
{
    const MediaItem* item = currentItem();
    if (!item) {
        return std::nullopt;
    }
    ProgressRecord record;
    record.lastFile = item->relativePath();
    record.lastPosition = m_state.position;
    record.settings = m_state.settings;
    return record;
}

bool PlaybackSession::isLoading() const
{
    return m_state.phase == TransportPhase::Loading || m_state.phase == TransportPhase::Transcoding;
}

void PlaybackSession::setPhase(TransportPhase phase)
{
    if (m_state.phase == phase) {
        return;
    }
    qCDebug(folderplaySession, "Phase %s -> %s", qPrintable(transportPhaseToString(m_state.phase)),
            qPrintable(transportPhaseToString(phase)));
    m_state.phase = phase;
    emit phaseChanged(phase);
}

void PlaybackSession::cancelInFlight()
{
    m_cancel.cancel();
    m_cancel = mcp::CancellationToken();
}

// ============================================================================
// Transport
// ============================================================================

bool PlaybackSession::select(int index, bool autoplay)
{
    if (index < 0 || index >= m_catalog.size()) {
        qCWarning(folderplaySession, "select(%d) out of range (catalog has %d items)", index, int(m_catalog.size()));
        return false;
    }
    beginLoad(index, 0.0, autoplay);
    return true;
}

bool PlaybackSession::playAt(int index, double position)
{
    if (index < 0 || index >= m_catalog.size()) {
        qCWarning(folderplaySession, "playAt(%d) out of range", index);
        return false;
    }
    const double start = std::isfinite(position) ? std::max(0.0, position) : 0.0;
    beginLoad(index, start, true);
    return true;
}

void PlaybackSession::beginLoad(int index, double startPosition, bool autoplay)
{
    // Algorithm: Cancel previous load → New generation → Reset item state → Start load
    cancelInFlight();
    ++m_generation;
    m_cancel = mcp::CancellationToken::Create();

    m_state.currentIndex = index;
    m_state.position = startPosition;
    m_state.duration = 0.0;
    m_autoplay = autoplay;
    m_transcodePercent = -1;
    m_currentMedia.reset();

    if (m_surface) {
        m_surface->clear();
    }

    setPhase(TransportPhase::Loading);
    emit currentItemChanged(index);
    emit durationChanged(0.0);

    const MediaItem& item = m_catalog[index];
    qCDebug(folderplaySession, "Loading #%llu %s", static_cast<unsigned long long>(m_generation),
            qPrintable(item.relativePath()));

    if (m_loader) {
        LoadRequest request;
        request.generation = m_generation;
        request.item = item;
        request.cancel = m_cancel;
        m_loader->startLoad(request);
    } else {
        // No loader: the source reference is handed to the surface as is
        LoadedMedia media;
        media.sourceRef = item.sourceRef();
        media.playablePath = item.sourceRef();
        media.subtitles = item.subtitles();
        onLoadFinished(m_generation, media);
    }
}

void PlaybackSession::onLoadProgress(quint64 generation, int percent)
{
    if (generation != m_generation || !isLoading()) {
        return;
    }
    m_transcodePercent = std::clamp(percent, 0, 100);
    setPhase(TransportPhase::Transcoding);
    emit transcodeProgressChanged(m_transcodePercent);
}

void PlaybackSession::onLoadFinished(quint64 generation, const LoadedMedia& media)
{
    if (generation != m_generation || !isLoading()) {
        qCDebug(folderplaySession, "Discarding stale load #%llu", static_cast<unsigned long long>(generation));
        return;
    }

    m_currentMedia = media;
    setPhase(TransportPhase::Loading);

    if (m_surface) {
        m_surface->applySettings(m_state.settings);
        m_surface->load(media, m_state.position);
    } else {
        reportReady();
    }
}

void PlaybackSession::onLoadFailed(quint64 generation, const QString& message)
{
    if (generation != m_generation || !isLoading()) {
        return;
    }
    qCWarning(folderplaySession, "Load failed: %s", qPrintable(message));
    setPhase(TransportPhase::Error);
    emit mediaUnplayable(m_state.currentIndex, message);
}

void PlaybackSession::pause()
{
    if (m_state.phase != TransportPhase::Playing) {
        return;
    }
    if (m_surface) {
        m_surface->pause();
    }
    setPhase(TransportPhase::Paused);
}

void PlaybackSession::resume()
{
    if (m_state.phase != TransportPhase::Paused) {
        return;
    }
    if (m_surface) {
        m_surface->play();
    }
    setPhase(TransportPhase::Playing);
}

void PlaybackSession::togglePlayPause()
{
    if (m_state.phase == TransportPhase::Playing) {
        pause();
    } else {
        resume();
    }
}

void PlaybackSession::seek(double seconds)
{
    if (!m_state.hasSelection() || !std::isfinite(seconds)) {
        return;
    }

    double target = std::max(0.0, seconds);
    if (m_state.duration > 0.0) {
        target = std::min(target, m_state.duration);
    }
    m_state.position = target;

    // While loading, the position becomes the start position of the load
    if (m_surface && (m_state.phase == TransportPhase::Playing || m_state.phase == TransportPhase::Paused)) {
        m_surface->seek(target);
    }
    emit positionChanged(target);
}

void PlaybackSession::seekRelative(double deltaSeconds)
{
    seek(m_state.position + deltaSeconds);
}

int PlaybackSession::pickShuffleIndex() const
{
    const int count = int(m_catalog.size());
    if (m_shufflePolicy == ShufflePolicy::AvoidRepeat && count > 1 && m_state.currentIndex >= 0) {
        // Draw from the other count-1 items
        int pick = m_random(count - 1);
        return pick >= m_state.currentIndex ? pick + 1 : pick;
    }
    return m_random(count);
}

void PlaybackSession::next()
{
    const int count = int(m_catalog.size());
    if (count == 0) {
        return;
    }

    if (m_state.settings.shuffle) {
        beginLoad(std::clamp(pickShuffleIndex(), 0, count - 1), 0.0, true);
        return;
    }

    int nextIndex = m_state.currentIndex + 1;
    if (nextIndex >= count) {
        if (!m_state.settings.loop) {
            // End of catalog: stop rather than wrap
            qCDebug(folderplaySession, "End of catalog reached");
            goIdle();
            return;
        }
        nextIndex = 0;
    }
    beginLoad(nextIndex, 0.0, true);
}

void PlaybackSession::prev()
{
    const int count = int(m_catalog.size());
    if (count == 0) {
        return;
    }

    if (m_state.hasSelection() && m_state.position > m_restartThreshold) {
        if (m_state.phase == TransportPhase::Playing || m_state.phase == TransportPhase::Paused) {
            seek(0.0);
        } else {
            beginLoad(m_state.currentIndex, 0.0, true);
        }
        return;
    }

    int prevIndex = m_state.currentIndex - 1;
    if (prevIndex < 0) {
        prevIndex = count - 1;
    }
    beginLoad(prevIndex, 0.0, true);
}

void PlaybackSession::stop()
{
    goIdle();
}

void PlaybackSession::goIdle()
{
    cancelInFlight();
    ++m_generation;

    const bool hadSelection = m_state.hasSelection();
    m_state.currentIndex = -1;
    m_state.position = 0.0;
    m_state.duration = 0.0;
    m_transcodePercent = -1;
    m_currentMedia.reset();

    if (m_surface) {
        m_surface->clear();
    }
    setPhase(TransportPhase::Idle);
    if (hadSelection) {
        emit currentItemChanged(-1);
    }
}

// ============================================================================
// Settings
// ============================================================================

void PlaybackSession::commitSettings()
{
    if (m_surface) {
        m_surface->applySettings(m_state.settings);
    }
    emit settingsChanged(m_state.settings);
}

void PlaybackSession::setVolume(double volume)
{
    m_state.settings.volume = PlaybackSettings::clampVolume(volume);
    commitSettings();
}

void PlaybackSession::adjustVolume(double delta)
{
    // Round to the step grid so repeated steps do not drift
    const double raw = m_state.settings.volume + delta;
    setVolume(std::round(raw * 100.0) / 100.0);
}

bool PlaybackSession::setSpeed(double rate)
{
    if (!PlaybackSettings::isAllowedRate(rate)) {
        qCWarning(folderplaySession, "Unsupported playback rate %f", rate);
        return false;
    }
    m_state.settings.playbackRate = rate;
    commitSettings();
    return true;
}

void PlaybackSession::cycleSpeed()
{
    m_state.settings.playbackRate = PlaybackSettings::nextRate(m_state.settings.playbackRate);
    commitSettings();
}

void PlaybackSession::toggleShuffle()
{
    m_state.settings.shuffle = !m_state.settings.shuffle;
    commitSettings();
}

void PlaybackSession::toggleLoop()
{
    m_state.settings.loop = !m_state.settings.loop;
    commitSettings();
}

void PlaybackSession::setAspectRatio(AspectRatioMode mode)
{
    m_state.settings.aspectRatio = mode;
    commitSettings();
}

void PlaybackSession::cycleAspectRatio()
{
    setAspectRatio(nextAspectRatio(m_state.settings.aspectRatio));
}

void PlaybackSession::toggleSubtitles()
{
    m_state.settings.subtitlesEnabled = !m_state.settings.subtitlesEnabled;
    commitSettings();
}

void PlaybackSession::setSubtitleFontSize(int px)
{
    m_state.settings.subtitleFontSize = PlaybackSettings::clampFontSize(px);
    commitSettings();
}

void PlaybackSession::applySettings(const PlaybackSettings& settings)
{
    m_state.settings = settings;
    m_state.settings.volume = PlaybackSettings::clampVolume(settings.volume);
    m_state.settings.subtitleFontSize = PlaybackSettings::clampFontSize(settings.subtitleFontSize);
    if (!PlaybackSettings::isAllowedRate(settings.playbackRate)) {
        m_state.settings.playbackRate = PlaybackSettings::DEFAULT_RATE;
    }
    if (m_surface) {
        m_surface->applySettings(m_state.settings);
    }
    emit settingsApplied(m_state.settings);
}

// ============================================================================
// Render surface reports
// ============================================================================

void PlaybackSession::reportReady()
{
    if (!isLoading() || !m_currentMedia) {
        return;
    }
    if (m_autoplay) {
        if (m_surface) {
            m_surface->play();
        }
        setPhase(TransportPhase::Playing);
    } else {
        setPhase(TransportPhase::Paused);
    }
}

void PlaybackSession::reportPosition(double seconds)
{
    if (m_state.phase != TransportPhase::Playing && m_state.phase != TransportPhase::Paused) {
        return;
    }
    // Monotonic within one item; backwards moves only come through seek()
    if (!std::isfinite(seconds) || seconds < m_state.position) {
        return;
    }
    m_state.position = seconds;
    emit positionChanged(seconds);
}

void PlaybackSession::reportDuration(double seconds)
{
    if (!m_state.hasSelection() || !std::isfinite(seconds) || seconds <= 0.0) {
        return;
    }
    m_state.duration = seconds;
    emit durationChanged(seconds);
}

void PlaybackSession::reportEnded()
{
    if (m_state.phase != TransportPhase::Playing && m_state.phase != TransportPhase::Paused) {
        return;
    }
    setPhase(TransportPhase::Ended);

    if (m_state.settings.loop) {
        // Loop repeats the finished item in place; next() wrapping is for the explicit command
        m_state.position = 0.0;
        if (m_surface) {
            m_surface->seek(0.0);
            m_surface->play();
        }
        emit positionChanged(0.0);
        setPhase(TransportPhase::Playing);
        return;
    }
    next();
}

void PlaybackSession::reportError(const QString& message)
{
    if (!m_state.hasSelection()) {
        return;
    }
    qCWarning(folderplaySession, "Render error on %s: %s",
              qPrintable(m_catalog[m_state.currentIndex].relativePath()), qPrintable(message));
    setPhase(TransportPhase::Error);
    emit mediaUnplayable(m_state.currentIndex, message);
}
