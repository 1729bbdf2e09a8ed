#ifndef _REVUSB_FS_FILE_CATEGORY_
#define _REVUSB_FS_FILE_CATEGORY_

#include "../pchheader.hpp"

namespace fs
{
    // Icon categories shown for catalog entries. FILE is the fallback.
    enum FILE_CATEGORY
    {
        FOLDER,
        IMAGE,
        PDF,
        WORD,
        EXCEL,
        POWERPOINT,
        VIDEO,
        AUDIO,
        ARCHIVE,
        CODE,
        TEXT,
        FILE
    };

    FILE_CATEGORY get_file_category(std::string_view name, const bool is_dir);

    const char *category_name(const FILE_CATEGORY category);

} // namespace fs

#endif
