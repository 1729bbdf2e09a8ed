#ifndef _REVUSB_ERRORS_
#define _REVUSB_ERRORS_

#include "pchheader.hpp"

/**
 * Result codes returned across every core component boundary.
 * An operation returns exactly one code. Any produced value is written through an out parameter.
 */
namespace errors
{
    enum code
    {
        OK = 0,

        // DeviceError
        DEVICE_NOT_FOUND,
        ALREADY_MOUNTED,
        NOT_MOUNTED,
        BUSY,
        UNSUPPORTED_FILESYSTEM,
        MOUNT_PERMISSION_DENIED, // Mount helper or mount root refused. Same wire name as PERMISSION_DENIED.

        // PathError
        PERMISSION_DENIED,
        INVALID_PATH,
        PATH_NOT_FOUND,
        CONFLICT,

        // UploadError
        INVALID_NAME,
        INVALID_TYPE,
        TOO_LARGE,
        IO_ERROR,
        CANCELLED,

        // SystemError
        DEVICE_LOST
    };

    const char *to_string(const code c);

    const char *category(const code c);

    bool is_device_loss_errno(const int err);

    code from_errno(const int err, const code fallback = code::IO_ERROR);

} // namespace errors

#endif
