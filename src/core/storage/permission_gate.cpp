#include "permission_gate.h"

#include <QFileInfo>

AccessState LocalPermissionGate::queryAccess(const QString& rootRef, AccessMode mode) const
{
    QFileInfo info(rootRef);
    if (!info.exists() || !info.isDir() || !info.isReadable() || !info.isExecutable()) {
        return AccessState::Denied;
    }
    if (mode == AccessMode::ReadWrite && !info.isWritable()) {
        return AccessState::Denied;
    }
    return AccessState::Granted;
}
