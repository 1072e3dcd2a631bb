#pragma once

#include "../catalog/file_type_preferences.h"

#include <QString>

/**
 * Application-level preferences kept in a small SQLite database:
 * the file-type extension sets and the remembered folder reference.
 *
 * A missing or unreadable database never fails the caller; reads fall
 * back to defaults and writes report false.
 */
class PreferencesStore
{
public:
    // Empty path = AppDataLocation/preferences.sqlite
    explicit PreferencesStore(const QString& databasePath = QString());
    ~PreferencesStore();

    PreferencesStore(const PreferencesStore&) = delete;
    PreferencesStore& operator=(const PreferencesStore&) = delete;

    bool isOpen() const { return m_open; }
    QString databasePath() const { return m_path; }

    FileTypePreferences loadPreferences() const;
    bool savePreferences(const FileTypePreferences& preferences);

    bool rememberFolder(const QString& rootRef);
    QString rememberedFolder() const;
    bool clearRememberedFolder();

    static QString defaultDatabasePath();

private:
    bool open();
    bool ensureSchema();
    QString readValue(const QString& key) const;
    bool writeValue(const QString& key, const QString& value);
    bool removeValue(const QString& key);

    QString m_path;
    QString m_connectionName;
    bool m_open = false;
};
