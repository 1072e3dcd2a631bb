#pragma once

#include <QMetaType>
#include <QString>

/**
 * Conditions a folder session reports upward through FolderSession::issueRaised.
 * Expected conditions (missing state file, stale resume target, engine/probe/transcode
 * fallbacks) are absorbed and only logged; they never appear here.
 */
enum class SessionIssue {
    ScanDegraded,             // Part of the tree could not be read; the catalog is partial
    PersistenceWriteFailed,   // Progress could not be saved; playback continues
    PermissionRevoked,        // Folder access lost; the user can re-grant it
    MediaUnplayable           // The current item cannot be rendered; the user decides whether to skip
};

inline QString sessionIssueToString(SessionIssue issue)
{
    switch (issue) {
    case SessionIssue::ScanDegraded:           return QStringLiteral("ScanDegraded");
    case SessionIssue::PersistenceWriteFailed: return QStringLiteral("PersistenceWriteFailed");
    case SessionIssue::PermissionRevoked:      return QStringLiteral("PermissionRevoked");
    case SessionIssue::MediaUnplayable:        return QStringLiteral("MediaUnplayable");
    }
    return QStringLiteral("Unknown");
}

Q_DECLARE_METATYPE(SessionIssue)
