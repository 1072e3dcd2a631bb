#include "progress_record.h"

#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QLoggingCategory>

#include <cmath>

Q_LOGGING_CATEGORY(folderplayRecord, "folderplay.persistence.record")

QByteArray ProgressRecord::toJson() const
{
    QJsonObject json;
    json["lastFile"] = lastFile;
    json["lastPosition"] = lastPosition;
    json["settings"] = settings.toJson();
    return QJsonDocument(json).toJson(QJsonDocument::Indented);
}

std::optional<ProgressRecord> ProgressRecord::fromJson(const QByteArray& data)
{
    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(data, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        qCDebug(folderplayRecord, "Unparsable state file: %s", qPrintable(parseError.errorString()));
        return std::nullopt;
    }
    if (!doc.isObject()) {
        qCDebug(folderplayRecord, "State file is not a JSON object");
        return std::nullopt;
    }

    const QJsonObject json = doc.object();
    ProgressRecord record;
    record.lastFile = json["lastFile"].toString();

    const double position = json["lastPosition"].toDouble(0.0);
    record.lastPosition = std::isfinite(position) && position > 0.0 ? position : 0.0;

    record.settings = PlaybackSettings::fromJson(json["settings"].toObject());
    return record;
}
