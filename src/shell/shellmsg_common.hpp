#ifndef _REVUSB_SHELL_SHELLMSG_COMMON_
#define _REVUSB_SHELL_SHELLMSG_COMMON_

#include "../pchheader.hpp"

namespace shell
{
    // Message field names.
    constexpr const char *FLD_SUCCESS = "success";
    constexpr const char *FLD_ERROR = "error";
    constexpr const char *FLD_KIND = "kind";
    constexpr const char *FLD_MESSAGE = "message";
    constexpr const char *FLD_VERSION = "version";
    constexpr const char *FLD_DEVICES = "devices";
    constexpr const char *FLD_DEVICE = "device";
    constexpr const char *FLD_NAME = "name";
    constexpr const char *FLD_TYPE = "type";
    constexpr const char *FLD_PATH = "path";
    constexpr const char *FLD_SIZE = "size";
    constexpr const char *FLD_HUMAN_SIZE = "human_size";
    constexpr const char *FLD_LABEL = "label";
    constexpr const char *FLD_FSTYPE = "fstype";
    constexpr const char *FLD_MOUNTPOINT = "mountpoint";
    constexpr const char *FLD_REMOVABLE = "removable";
    constexpr const char *FLD_STATE = "state";
    constexpr const char *FLD_MOUNTED = "mounted";
    constexpr const char *FLD_MOUNT_ROOT = "mount_root";
    constexpr const char *FLD_TOTAL = "total";
    constexpr const char *FLD_USED = "used";
    constexpr const char *FLD_FREE = "free";
    constexpr const char *FLD_USAGE_PERCENT = "usage_percent";
    constexpr const char *FLD_BAND = "band";
    constexpr const char *FLD_FILES = "files";
    constexpr const char *FLD_FILE = "file";
    constexpr const char *FLD_IS_DIR = "is_dir";
    constexpr const char *FLD_MODIFIED = "modified";
    constexpr const char *FLD_MODIFIED_ISO = "modified_iso";
    constexpr const char *FLD_CATEGORY = "category";
    constexpr const char *FLD_BYTES = "bytes";
    constexpr const char *FLD_COMMANDS = "commands";

    // Commands.
    constexpr const char *CMD_DEVICES = "devices";
    constexpr const char *CMD_MOUNT = "mount";
    constexpr const char *CMD_UNMOUNT = "unmount";
    constexpr const char *CMD_STATUS = "status";
    constexpr const char *CMD_LS = "ls";
    constexpr const char *CMD_UPLOAD = "upload";
    constexpr const char *CMD_DOWNLOAD = "download";
    constexpr const char *CMD_RM = "rm";
    constexpr const char *CMD_MV = "mv";
    constexpr const char *CMD_MKDIR = "mkdir";
    constexpr const char *CMD_HELP = "help";
    constexpr const char *CMD_QUIT = "quit";

    // Errors raised by the shell itself rather than the core.
    constexpr const char *KIND_PROTOCOL_ERROR = "ProtocolError";
    constexpr const char *ERR_INVALID_COMMAND = "invalid_command";
    constexpr const char *ERR_INVALID_ARGS = "invalid_arguments";
    constexpr const char *ERR_LOCAL_FILE = "local_file_error";

} // namespace shell

#endif
