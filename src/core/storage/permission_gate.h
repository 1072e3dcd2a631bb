#pragma once

#include <QString>

enum class AccessMode {
    Read,
    ReadWrite
};

enum class AccessState {
    Granted,
    Denied
};

/**
 * Answers whether access to a previously remembered folder is still granted
 */
class PermissionGate
{
public:
    virtual ~PermissionGate() = default;

    virtual AccessState queryAccess(const QString& rootRef, AccessMode mode) const = 0;
};

/**
 * Filesystem permission bits of the folder itself
 */
class LocalPermissionGate : public PermissionGate
{
public:
    AccessState queryAccess(const QString& rootRef, AccessMode mode) const override;
};
