#ifndef _REVUSB_FS_FILE_CATALOG_
#define _REVUSB_FS_FILE_CATALOG_

#include "../pchheader.hpp"
#include "../errors.hpp"
#include "fs_common.hpp"
#include "path_resolver.hpp"

namespace fs
{
    class file_catalog
    {
    private:
        const path_resolver &resolver;

    public:
        explicit file_catalog(const path_resolver &resolver);

        errors::code list(std::vector<file_entry> &entries, std::string_view relative_path) const;
        errors::code describe(file_entry &entry, const std::string &absolute_path) const;
    };

    bool compare_entries(const file_entry &a, const file_entry &b);

} // namespace fs

#endif
