#include "preferences_store.h"

#include <QDir>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QLoggingCategory>
#include <QSqlDatabase>
#include <QSqlError>
#include <QSqlQuery>
#include <QStandardPaths>
#include <QUuid>

Q_LOGGING_CATEGORY(folderplayPreferences, "folderplay.preferences")

namespace {
const QString KEY_FILE_TYPES = QStringLiteral("fileTypes");
const QString KEY_FOLDER = QStringLiteral("folder");
} // namespace

PreferencesStore::PreferencesStore(const QString& databasePath)
    : m_path(databasePath.isEmpty() ? defaultDatabasePath() : databasePath)
    , m_connectionName(QString("folderplay_prefs_%1").arg(QUuid::createUuid().toString(QUuid::WithoutBraces)))
{
    m_open = open() && ensureSchema();
    if (!m_open) {
        qCWarning(folderplayPreferences, "Preferences unavailable at %s, using defaults", qPrintable(m_path));
    }
}

PreferencesStore::~PreferencesStore()
{
    {
        QSqlDatabase database = QSqlDatabase::database(m_connectionName, false);
        if (database.isOpen()) {
            database.close();
        }
    }
    QSqlDatabase::removeDatabase(m_connectionName);
}

QString PreferencesStore::defaultDatabasePath()
{
    QString dir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (dir.isEmpty()) {
        dir = QDir::homePath() + QStringLiteral("/.folderplay");
    }
    return QDir(dir).filePath(QStringLiteral("preferences.sqlite"));
}

bool PreferencesStore::open()
{
    // Algorithm: Ensure directory → Add connection → Open
    QDir dir = QFileInfo(m_path).absoluteDir();
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        qCWarning(folderplayPreferences, "Cannot create %s", qPrintable(dir.absolutePath()));
        return false;
    }

    QSqlDatabase database = QSqlDatabase::addDatabase(QStringLiteral("QSQLITE"), m_connectionName);
    database.setDatabaseName(m_path);
    if (!database.open()) {
        qCWarning(folderplayPreferences, "Failed to open preferences database: %s",
                  qPrintable(database.lastError().text()));
        return false;
    }
    return true;
}

bool PreferencesStore::ensureSchema()
{
    QSqlQuery query(QSqlDatabase::database(m_connectionName, false));
    if (!query.exec(QStringLiteral(
            "CREATE TABLE IF NOT EXISTS preferences (key TEXT PRIMARY KEY, value TEXT)"))) {
        qCWarning(folderplayPreferences, "Failed to create preferences table: %s",
                  qPrintable(query.lastError().text()));
        return false;
    }
    return true;
}

QString PreferencesStore::readValue(const QString& key) const
{
    if (!m_open) {
        return QString();
    }

    QSqlQuery query(QSqlDatabase::database(m_connectionName, false));
    query.prepare(QStringLiteral("SELECT value FROM preferences WHERE key = ?"));
    query.addBindValue(key);
    if (!query.exec()) {
        qCWarning(folderplayPreferences, "Failed to read %s: %s", qPrintable(key), qPrintable(query.lastError().text()));
        return QString();
    }
    return query.next() ? query.value(0).toString() : QString();
}

bool PreferencesStore::writeValue(const QString& key, const QString& value)
{
    if (!m_open) {
        return false;
    }

    QSqlQuery query(QSqlDatabase::database(m_connectionName, false));
    query.prepare(QStringLiteral("INSERT OR REPLACE INTO preferences (key, value) VALUES (?, ?)"));
    query.addBindValue(key);
    query.addBindValue(value);
    if (!query.exec()) {
        qCWarning(folderplayPreferences, "Failed to write %s: %s", qPrintable(key), qPrintable(query.lastError().text()));
        return false;
    }
    return true;
}

bool PreferencesStore::removeValue(const QString& key)
{
    if (!m_open) {
        return false;
    }

    QSqlQuery query(QSqlDatabase::database(m_connectionName, false));
    query.prepare(QStringLiteral("DELETE FROM preferences WHERE key = ?"));
    query.addBindValue(key);
    if (!query.exec()) {
        qCWarning(folderplayPreferences, "Failed to delete %s: %s", qPrintable(key), qPrintable(query.lastError().text()));
        return false;
    }
    return true;
}

FileTypePreferences PreferencesStore::loadPreferences() const
{
    const QString stored = readValue(KEY_FILE_TYPES);
    if (stored.isEmpty()) {
        return FileTypePreferences::defaults();
    }

    QJsonDocument doc = QJsonDocument::fromJson(stored.toUtf8());
    if (!doc.isObject()) {
        qCWarning(folderplayPreferences, "Stored file types are not valid JSON, using defaults");
        return FileTypePreferences::defaults();
    }
    return FileTypePreferences::fromJson(doc.object());
}

bool PreferencesStore::savePreferences(const FileTypePreferences& preferences)
{
    const QJsonDocument doc(preferences.normalized().toJson());
    return writeValue(KEY_FILE_TYPES, QString::fromUtf8(doc.toJson(QJsonDocument::Compact)));
}

bool PreferencesStore::rememberFolder(const QString& rootRef)
{
    QJsonObject json;
    json["ref"] = rootRef;
    return writeValue(KEY_FOLDER, QString::fromUtf8(QJsonDocument(json).toJson(QJsonDocument::Compact)));
}

QString PreferencesStore::rememberedFolder() const
{
    const QString stored = readValue(KEY_FOLDER);
    if (stored.isEmpty()) {
        return QString();
    }
    return QJsonDocument::fromJson(stored.toUtf8()).object()["ref"].toString();
}

bool PreferencesStore::clearRememberedFolder()
{
    return removeValue(KEY_FOLDER);
}
