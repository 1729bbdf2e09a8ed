#ifndef _REVUSB_FS_FS_COMMON_
#define _REVUSB_FS_FS_COMMON_

#include "../pchheader.hpp"
#include "file_category.hpp"

namespace fs
{
    // In-flight uploads are written to hidden files with this prefix inside the target directory.
    constexpr const char *UPLOAD_TEMP_PREFIX = ".revusb-upload-";
    constexpr const char *UPLOAD_TEMP_SUFFIX = ".part";
    constexpr const char *DIR_HUMAN_SIZE = "--";

    struct file_entry
    {
        std::string name;
        std::string path;          // Relative to the mount root.
        std::string absolute_path; // Resolved path within the mount root.
        bool is_dir = false;
        uint64_t size = 0;
        std::string human_size;    // '--' for directories.
        time_t modified = 0;       // Epoch seconds.
        std::string modified_iso;  // Local time rendering of 'modified'.
        FILE_CATEGORY category = FILE_CATEGORY::FILE;
    };

    struct upload_request
    {
        std::string target_dir;                          // Relative directory to place the file in.
        std::string filename;                            // Client supplied file name.
        int source_fd = -1;                              // Readable descriptor the bytes are streamed from.
        uint64_t declared_size = 0;                      // Size announced by the client. 0 when unknown.
        const std::atomic<bool> *cancelled = NULL;       // Optional flag another thread may raise to abort.
    };

} // namespace fs

#endif
