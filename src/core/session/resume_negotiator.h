#pragma once

#include "../models/playback_settings.h"

#include <QElapsedTimer>
#include <QMetaType>
#include <QObject>
#include <QString>
#include <QTimer>

#include <optional>

enum class ResumeChoice {
    Resume,
    Dismiss,
    StartOver
};

QString resumeChoiceToString(ResumeChoice choice);

struct ResumeOffer
{
    QString lastFile;
    int index = -1;
    double position = 0.0;
    PlaybackSettings settings;
};

/**
 * One-shot resume decision racing a countdown.
 *
 * The user (resolve()) and the countdown (auto Resume) both try to resolve the
 * same pending offer; the first one wins and stops the countdown. Later
 * resolutions are no-ops returning false.
 */
class ResumeNegotiator : public QObject
{
    Q_OBJECT

public:
    explicit ResumeNegotiator(int countdownMs, QObject* parent = nullptr);

    // Start a decision; false if one is already pending
    bool offer(const ResumeOffer& offer);

    // Resolve the pending decision; false if none is pending
    bool resolve(ResumeChoice choice);

    // Withdraw a pending offer without a decision (session closing)
    void withdraw();

    bool isPending() const { return m_pending; }
    const ResumeOffer& currentOffer() const { return m_offer; }
    std::optional<ResumeChoice> lastChoice() const { return m_lastChoice; }
    int countdownMs() const { return m_countdownMs; }
    int remainingSeconds() const;

signals:
    void offered(const ResumeOffer& offer, int countdownSeconds);
    void countdownTick(int secondsLeft);
    void resolved(ResumeChoice choice, const ResumeOffer& offer, bool automatic);
    void withdrawn();

private:
    bool finish(ResumeChoice choice, bool automatic);

    const int m_countdownMs;
    QTimer m_deadline;
    QTimer m_ticker;
    QElapsedTimer m_elapsed;

    bool m_pending = false;
    ResumeOffer m_offer;
    std::optional<ResumeChoice> m_lastChoice;
};

Q_DECLARE_METATYPE(ResumeOffer)
Q_DECLARE_METATYPE(ResumeChoice)
