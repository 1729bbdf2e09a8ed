#include "../pchheader.hpp"
#include "../rulog.hpp"
#include "../util/util.hpp"
#include "file_catalog.hpp"

namespace fs
{
    file_catalog::file_catalog(const path_resolver &resolver) : resolver(resolver)
    {
    }

    /**
     * Lists the entries of a directory within the mount root.
     * @param entries Populated with the directory entries, directories first then by name.
     * @param relative_path Directory relative to the mount root. "" is the root.
     * @return OK on success. PATH_NOT_FOUND if the directory is missing or not a directory.
     */
    errors::code file_catalog::list(std::vector<file_entry> &entries, std::string_view relative_path) const
    {
        std::string dir;
        errors::code res = resolver.resolve(dir, relative_path);
        if (res != errors::OK)
            return res;

        struct stat st;
        if (stat(dir.c_str(), &st) == -1)
        {
            const int err = errno;
            LOG_DEBUG << err << ": Cannot list " << dir;
            return errors::from_errno(err, errors::IO_ERROR);
        }

        if (!S_ISDIR(st.st_mode))
            return errors::PATH_NOT_FOUND;

        std::list<std::string> names;
        if (util::fetch_dir_entries(names, dir) == -1)
        {
            const int err = errno;
            LOG_ERROR << err << ": Error reading directory " << dir;
            return errors::from_errno(err, errors::IO_ERROR);
        }

        const std::string dir_relative = resolver.relative(dir);
        for (const std::string &name : names)
        {
            if (name.rfind(UPLOAD_TEMP_PREFIX, 0) == 0)
                continue;

            std::string child;
            res = resolver.resolve(child, dir_relative.empty() ? name : dir_relative + "/" + name);
            if (res == errors::DEVICE_LOST)
                return res;
            else if (res != errors::OK)
            {
                LOG_DEBUG << "Skipped entry resolving outside mount root: " << name;
                continue;
            }

            file_entry entry;
            res = describe(entry, child);
            if (res == errors::DEVICE_LOST)
                return res;
            else if (res != errors::OK)
            {
                LOG_WARNING << "Skipped inaccessible entry " << child << " (" << errors::to_string(res) << ")";
                continue;
            }

            entries.push_back(std::move(entry));
        }

        std::sort(entries.begin(), entries.end(), compare_entries);
        return errors::OK;
    }

    /**
     * Builds the catalog entry of a single path. Symlinks are described by their target.
     */
    errors::code file_catalog::describe(file_entry &entry, const std::string &absolute_path) const
    {
        struct stat st;
        if (stat(absolute_path.c_str(), &st) == -1)
            return errors::from_errno(errno, errors::IO_ERROR);

        entry.name = util::get_name(absolute_path);
        entry.path = resolver.relative(absolute_path);
        entry.absolute_path = absolute_path;
        entry.is_dir = S_ISDIR(st.st_mode);
        entry.size = entry.is_dir ? 0 : st.st_size;
        entry.human_size = entry.is_dir ? DIR_HUMAN_SIZE : util::to_human_size(entry.size);
        entry.modified = st.st_mtime;
        entry.modified_iso = util::to_iso_time(st.st_mtime);
        entry.category = get_file_category(entry.name, entry.is_dir);
        return errors::OK;
    }

    /**
     * Listing order. Directories first, then case-insensitive name, then byte-wise name.
     */
    bool compare_entries(const file_entry &a, const file_entry &b)
    {
        if (a.is_dir != b.is_dir)
            return a.is_dir;

        const std::string a_lower = util::to_lower(a.name);
        const std::string b_lower = util::to_lower(b.name);
        if (a_lower != b_lower)
            return a_lower < b_lower;

        return a.name < b.name;
    }

} // namespace fs
