#pragma once

#include <QString>

enum class ShufflePolicy {
    WithReplacement,   // Uniform over the whole catalog, may repeat the current item
    AvoidRepeat        // Uniform over every item except the current one
};

QString shufflePolicyToString(ShufflePolicy policy);
ShufflePolicy shufflePolicyFromString(const QString& text, bool* ok = nullptr);

/**
 * Tunables of a folder session.
 * Defaults match interactive desktop use; fromEnvironment() applies FOLDERPLAY_* overrides.
 */
struct SessionConfig
{
    int throttleWindowMs = 5000;           // Min spacing of position-driven writes
    int pauseSettleDelayMs = 100;          // Delay before the write that follows a pause
    int resumeCountdownMs = 15000;         // Auto-resume after this long without a decision
    double restartThresholdSeconds = 3.0;  // prev() restarts the item past this position
    double seekStepSeconds = 10.0;
    double volumeStep = 0.05;
    QString stateFileName = QStringLiteral(".player-state.json");
    bool transcodingEnabled = true;
    QString workDirectory;                 // Empty = system temp dir + "/folderplay"
    ShufflePolicy shufflePolicy = ShufflePolicy::WithReplacement;

    /**
     * Defaults overridden by FOLDERPLAY_THROTTLE_MS, FOLDERPLAY_RESUME_COUNTDOWN_MS,
     * FOLDERPLAY_TRANSCODE, FOLDERPLAY_WORK_DIR and FOLDERPLAY_SHUFFLE_POLICY.
     * Malformed values are ignored with a warning.
     */
    static SessionConfig fromEnvironment();
};
