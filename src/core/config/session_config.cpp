#include "session_config.h"

#include <QLoggingCategory>
#include <QtGlobal>

Q_LOGGING_CATEGORY(folderplayConfig, "folderplay.config")

QString shufflePolicyToString(ShufflePolicy policy)
{
    switch (policy) {
    case ShufflePolicy::WithReplacement: return QStringLiteral("with-replacement");
    case ShufflePolicy::AvoidRepeat:     return QStringLiteral("avoid-repeat");
    }
    return QStringLiteral("with-replacement");
}

ShufflePolicy shufflePolicyFromString(const QString& text, bool* ok)
{
    const QString value = text.trimmed().toLower();
    if (ok) *ok = true;
    if (value == QLatin1String("with-replacement")) {
        return ShufflePolicy::WithReplacement;
    }
    if (value == QLatin1String("avoid-repeat")) {
        return ShufflePolicy::AvoidRepeat;
    }
    if (ok) *ok = false;
    return ShufflePolicy::WithReplacement;
}

namespace {
void overrideInt(const char* name, int& target, int minimum)
{
    if (!qEnvironmentVariableIsSet(name)) {
        return;
    }
    bool ok = false;
    const int value = qEnvironmentVariableIntValue(name, &ok);
    if (!ok || value < minimum) {
        qCWarning(folderplayConfig, "Ignoring invalid %s=%s", name, qPrintable(qEnvironmentVariable(name)));
        return;
    }
    target = value;
}
} // namespace

SessionConfig SessionConfig::fromEnvironment()
{
    SessionConfig config;

    overrideInt("FOLDERPLAY_THROTTLE_MS", config.throttleWindowMs, 0);
    overrideInt("FOLDERPLAY_RESUME_COUNTDOWN_MS", config.resumeCountdownMs, 0);

    if (qEnvironmentVariableIsSet("FOLDERPLAY_TRANSCODE")) {
        const QString value = qEnvironmentVariable("FOLDERPLAY_TRANSCODE").trimmed();
        if (value == QLatin1String("0") || value == QLatin1String("1")) {
            config.transcodingEnabled = value == QLatin1String("1");
        } else {
            qCWarning(folderplayConfig, "Ignoring invalid FOLDERPLAY_TRANSCODE=%s", qPrintable(value));
        }
    }

    if (qEnvironmentVariableIsSet("FOLDERPLAY_WORK_DIR")) {
        config.workDirectory = qEnvironmentVariable("FOLDERPLAY_WORK_DIR");
    }

    if (qEnvironmentVariableIsSet("FOLDERPLAY_SHUFFLE_POLICY")) {
        bool ok = false;
        const QString value = qEnvironmentVariable("FOLDERPLAY_SHUFFLE_POLICY");
        ShufflePolicy policy = shufflePolicyFromString(value, &ok);
        if (ok) {
            config.shufflePolicy = policy;
        } else {
            qCWarning(folderplayConfig, "Ignoring invalid FOLDERPLAY_SHUFFLE_POLICY=%s", qPrintable(value));
        }
    }

    qCDebug(folderplayConfig, "throttle=%dms countdown=%dms transcode=%d shuffle=%s",
            config.throttleWindowMs, config.resumeCountdownMs, int(config.transcodingEnabled),
            qPrintable(shufflePolicyToString(config.shufflePolicy)));
    return config;
}
