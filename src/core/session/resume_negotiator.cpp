#include "resume_negotiator.h"

#include <QLoggingCategory>

#include <algorithm>

Q_LOGGING_CATEGORY(folderplayResume, "folderplay.resume")

QString resumeChoiceToString(ResumeChoice choice)
{
    switch (choice) {
    case ResumeChoice::Resume:    return QStringLiteral("resume");
    case ResumeChoice::Dismiss:   return QStringLiteral("dismiss");
    case ResumeChoice::StartOver: return QStringLiteral("start-over");
    }
    return QStringLiteral("dismiss");
}

ResumeNegotiator::ResumeNegotiator(int countdownMs, QObject* parent)
    : QObject(parent)
    , m_countdownMs(std::max(0, countdownMs))
{
    m_deadline.setSingleShot(true);
    connect(&m_deadline, &QTimer::timeout, this, [this]() {
        qCDebug(folderplayResume, "Countdown elapsed, resuming");
        finish(ResumeChoice::Resume, true);
    });

    m_ticker.setInterval(1000);
    connect(&m_ticker, &QTimer::timeout, this, [this]() {
        if (m_pending) {
            emit countdownTick(remainingSeconds());
        }
    });
}

bool ResumeNegotiator::offer(const ResumeOffer& offer)
{
    if (m_pending) {
        qCWarning(folderplayResume, "Resume offer for %s ignored, another decision is pending",
                  qPrintable(offer.lastFile));
        return false;
    }

    m_offer = offer;
    m_pending = true;
    m_lastChoice.reset();
    m_elapsed.start();
    m_deadline.start(m_countdownMs);
    m_ticker.start();

    qCDebug(folderplayResume, "Offering resume of %s at %.1fs", qPrintable(offer.lastFile), offer.position);
    emit offered(m_offer, remainingSeconds());
    return true;
}

bool ResumeNegotiator::resolve(ResumeChoice choice)
{
    return finish(choice, false);
}

bool ResumeNegotiator::finish(ResumeChoice choice, bool automatic)
{
    if (!m_pending) {
        return false;
    }
    // Resolved before anything observable happens, so nothing can resolve twice
    m_pending = false;
    m_deadline.stop();
    m_ticker.stop();
    m_lastChoice = choice;

    qCInfo(folderplayResume, "Resume decision: %s%s", qPrintable(resumeChoiceToString(choice)),
           automatic ? " (countdown)" : "");
    emit resolved(choice, m_offer, automatic);
    return true;
}

void ResumeNegotiator::withdraw()
{
    if (!m_pending) {
        return;
    }
    m_pending = false;
    m_deadline.stop();
    m_ticker.stop();
    emit withdrawn();
}

int ResumeNegotiator::remainingSeconds() const
{
    if (!m_pending) {
        return 0;
    }
    const qint64 remainingMs = std::max<qint64>(0, m_countdownMs - m_elapsed.elapsed());
    return int((remainingMs + 999) / 1000);
}
