#include "errors.hpp"

namespace errors
{
    /**
     * Returns the stable wire name of the code. Consumers render messages from this.
     */
    const char *to_string(const code c)
    {
        switch (c)
        {
        case code::OK:
            return "ok";
        case code::DEVICE_NOT_FOUND:
            return "device_not_found";
        case code::ALREADY_MOUNTED:
            return "already_mounted";
        case code::NOT_MOUNTED:
            return "not_mounted";
        case code::BUSY:
            return "busy";
        case code::UNSUPPORTED_FILESYSTEM:
            return "unsupported_filesystem";
        case code::MOUNT_PERMISSION_DENIED:
        case code::PERMISSION_DENIED:
            return "permission_denied";
        case code::INVALID_PATH:
            return "invalid_path";
        case code::PATH_NOT_FOUND:
            return "not_found";
        case code::CONFLICT:
            return "conflict";
        case code::INVALID_NAME:
            return "invalid_name";
        case code::INVALID_TYPE:
            return "invalid_type";
        case code::TOO_LARGE:
            return "too_large";
        case code::IO_ERROR:
            return "io_error";
        case code::CANCELLED:
            return "cancelled";
        case code::DEVICE_LOST:
            return "device_lost";
        default:
            return "unknown";
        }
    }

    const char *category(const code c)
    {
        switch (c)
        {
        case code::OK:
            return "";
        case code::DEVICE_NOT_FOUND:
        case code::ALREADY_MOUNTED:
        case code::NOT_MOUNTED:
        case code::BUSY:
        case code::UNSUPPORTED_FILESYSTEM:
        case code::MOUNT_PERMISSION_DENIED:
            return "DeviceError";
        case code::PERMISSION_DENIED:
        case code::INVALID_PATH:
        case code::PATH_NOT_FOUND:
        case code::CONFLICT:
            return "PathError";
        case code::INVALID_NAME:
        case code::INVALID_TYPE:
        case code::TOO_LARGE:
        case code::IO_ERROR:
        case code::CANCELLED:
            return "UploadError";
        default:
            return "SystemError";
        }
    }

    /**
     * Whether the errno value indicates the backing medium has gone away.
     */
    bool is_device_loss_errno(const int err)
    {
        return err == EIO || err == ENODEV || err == ENXIO || err == ENOTCONN || err == ESTALE || err == EREMOTEIO;
    }

    /**
     * Maps a failed syscall errno to a result code.
     * @param err errno value captured right after the failing call.
     * @param fallback Code to use when errno has no specific mapping.
     */
    code from_errno(const int err, const code fallback)
    {
        if (is_device_loss_errno(err))
            return code::DEVICE_LOST;

        switch (err)
        {
        case ENOENT:
        case ENOTDIR:
            return code::PATH_NOT_FOUND;
        case EEXIST:
        case ENOTEMPTY:
            return code::CONFLICT;
        case EACCES:
        case EPERM:
        case EROFS:
            return code::PERMISSION_DENIED;
        case ENAMETOOLONG:
        case EILSEQ:
            return code::INVALID_NAME;
        case EBUSY:
            return code::BUSY;
        case EFBIG:
            return code::TOO_LARGE;
        default:
            return fallback;
        }
    }

} // namespace errors
