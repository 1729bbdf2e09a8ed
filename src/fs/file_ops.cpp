#include "../pchheader.hpp"
#include "../crypto.hpp"
#include "../rulog.hpp"
#include "../util/util.hpp"
#include "file_ops.hpp"

namespace fs
{
    constexpr size_t TEMP_TOKEN_BYTES = 8;

    namespace
    {
        /**
         * Owns an upload temp file. Closes and unlinks it on destruction unless committed.
         */
        class temp_file
        {
        private:
            const std::string path;
            int fd = -1;
            bool committed = false;

        public:
            temp_file(const std::string &path, const int fd) : path(path), fd(fd)
            {
            }

            ~temp_file()
            {
                if (fd != -1)
                    close(fd);

                if (!committed && unlink(path.c_str()) == -1 && errno != ENOENT)
                    LOG_WARNING << errno << ": Error removing upload temp file " << path;
            }

            int get_fd() const
            {
                return fd;
            }

            // Flushes the file to the device and closes it.
            int finalize()
            {
                if (fsync(fd) == -1)
                    return -1;

                const int res = close(fd);
                fd = -1;
                return res;
            }

            void commit()
            {
                committed = true;
            }
        };
    } // namespace

    file_ops::file_ops(const path_resolver &resolver, const file_catalog &catalog, const conf::upload_config &cfg)
        : resolver(resolver), catalog(catalog), cfg(cfg)
    {
    }

    /**
     * Resolves a relative path which must name an existing directory.
     */
    errors::code file_ops::resolve_directory(std::string &dir, std::string_view relative_path) const
    {
        const errors::code res = resolver.resolve(dir, relative_path);
        if (res != errors::OK)
            return res;

        struct stat st;
        if (stat(dir.c_str(), &st) == -1)
            return errors::from_errno(errno, errors::IO_ERROR);

        if (!S_ISDIR(st.st_mode))
            return errors::PATH_NOT_FOUND;

        return errors::OK;
    }

    /**
     * Streams an upload into the target directory. Bytes are staged in a hidden temp file which is only
     * renamed into place once fully written and flushed. An existing file is never replaced.
     * @param entry Catalog entry of the stored file on success.
     * @return OK on success. PATH_NOT_FOUND, INVALID_NAME, INVALID_TYPE, TOO_LARGE, CONFLICT, CANCELLED
     *         or IO_ERROR on failure. The temp file never survives a failure.
     */
    errors::code file_ops::upload(file_entry &entry, const upload_request &req) const
    {
        std::string dir;
        errors::code res = resolve_directory(dir, req.target_dir);
        if (res != errors::OK)
            return res;

        res = validate_name(req.filename);
        if (res != errors::OK)
            return res;

        const std::string extension = util::to_lower(util::fetch_file_extension(req.filename));
        if (extension.empty() || cfg.allowed_extensions.count(extension) == 0)
        {
            LOG_INFO << "Rejected upload of disallowed file type: " << req.filename;
            return errors::INVALID_TYPE;
        }

        if (req.declared_size > cfg.max_bytes)
        {
            LOG_INFO << "Rejected upload of " << req.declared_size << " bytes. Limit: " << cfg.max_bytes;
            return errors::TOO_LARGE;
        }

        std::string target;
        res = resolver.resolve_child(target, req.target_dir, req.filename);
        if (res != errors::OK)
            return res;

        struct stat st;
        if (lstat(target.c_str(), &st) == 0)
            return errors::CONFLICT;
        else if (errno != ENOENT)
            return errors::from_errno(errno, errors::IO_ERROR);

        const std::string temp_path = dir + "/" + UPLOAD_TEMP_PREFIX + crypto::random_token(TEMP_TOKEN_BYTES) + UPLOAD_TEMP_SUFFIX;
        const int fd = open(temp_path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, FILE_PERMS);
        if (fd == -1)
        {
            const int err = errno;
            LOG_ERROR << err << ": Error creating upload temp file " << temp_path;
            return errors::from_errno(err, errors::IO_ERROR);
        }
        temp_file temp(temp_path, fd);

        std::vector<char> buf(TRANSFER_CHUNK_SIZE);
        uint64_t received = 0;
        while (true)
        {
            if (req.cancelled && req.cancelled->load())
            {
                LOG_INFO << "Upload of " << req.filename << " cancelled after " << received << " bytes.";
                return errors::CANCELLED;
            }

            const ssize_t read_bytes = read(req.source_fd, buf.data(), buf.size());
            if (read_bytes == -1)
            {
                if (errno == EINTR)
                    continue;

                LOG_WARNING << errno << ": Upload stream of " << req.filename << " aborted after " << received << " bytes.";
                return errors::CANCELLED;
            }
            else if (read_bytes == 0)
            {
                break;
            }

            received += read_bytes;
            if (received > cfg.max_bytes)
            {
                LOG_INFO << "Upload of " << req.filename << " exceeded the size limit of " << cfg.max_bytes << " bytes.";
                return errors::TOO_LARGE;
            }

            if (util::write_all(temp.get_fd(), buf.data(), read_bytes) == -1)
            {
                const int err = errno;
                LOG_ERROR << err << ": Error writing upload temp file " << temp_path;
                return errors::from_errno(err, errors::IO_ERROR);
            }
        }

        if (received < req.declared_size)
        {
            LOG_WARNING << "Upload stream of " << req.filename << " ended at " << received << " of " << req.declared_size << " bytes.";
            return errors::CANCELLED;
        }

        if (temp.finalize() == -1)
        {
            const int err = errno;
            LOG_ERROR << err << ": Error flushing upload temp file " << temp_path;
            return errors::from_errno(err, errors::IO_ERROR);
        }

        if (util::rename_noreplace(temp_path, target) == -1)
        {
            const int err = errno;
            if (err != EEXIST)
                LOG_ERROR << err << ": Error committing upload to " << target;
            return errors::from_errno(err, errors::IO_ERROR);
        }
        temp.commit();

        LOG_INFO << "Uploaded " << resolver.relative(target) << " (" << received << " bytes)";
        return catalog.describe(entry, target);
    }

    /**
     * Streams a regular file to the given descriptor.
     * @param bytes_sent Number of bytes written to the descriptor.
     * @return OK on success. PATH_NOT_FOUND if the path is not a regular file. CANCELLED if the sink went away.
     */
    errors::code file_ops::download(uint64_t &bytes_sent, std::string_view relative_path, const int out_fd) const
    {
        bytes_sent = 0;

        std::string path;
        const errors::code res = resolver.resolve(path, relative_path);
        if (res != errors::OK)
            return res;

        struct stat st;
        if (stat(path.c_str(), &st) == -1)
            return errors::from_errno(errno, errors::IO_ERROR);

        if (!S_ISREG(st.st_mode))
            return errors::PATH_NOT_FOUND;

        const int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd == -1)
        {
            const int err = errno;
            LOG_ERROR << err << ": Error opening " << path << " for download.";
            return errors::from_errno(err, errors::IO_ERROR);
        }

        std::vector<char> buf(TRANSFER_CHUNK_SIZE);
        while (true)
        {
            const ssize_t read_bytes = read(fd, buf.data(), buf.size());
            if (read_bytes == -1)
            {
                if (errno == EINTR)
                    continue;

                const int err = errno;
                LOG_ERROR << err << ": Error reading " << path << " for download.";
                close(fd);
                return errors::from_errno(err, errors::IO_ERROR);
            }
            else if (read_bytes == 0)
            {
                break;
            }

            if (util::write_all(out_fd, buf.data(), read_bytes) == -1)
            {
                LOG_WARNING << errno << ": Download sink of " << path << " closed after " << bytes_sent << " bytes.";
                close(fd);
                return errors::CANCELLED;
            }
            bytes_sent += read_bytes;
        }

        close(fd);
        return errors::OK;
    }

    /**
     * Deletes a file, or a directory with all its contents. Symlinks are removed, not followed.
     * @return OK on success. INVALID_PATH for the mount root. PATH_NOT_FOUND if missing.
     */
    errors::code file_ops::remove(std::string_view relative_path) const
    {
        std::string path;
        const errors::code res = resolver.resolve(path, relative_path);
        if (res != errors::OK)
            return res;

        if (path == resolver.get_root())
        {
            LOG_WARNING << "Rejected deletion of the mount root.";
            return errors::INVALID_PATH;
        }

        struct stat st;
        if (lstat(path.c_str(), &st) == -1)
            return errors::from_errno(errno, errors::IO_ERROR);

        const int ret = S_ISDIR(st.st_mode) ? util::remove_directory_recursively(path) : unlink(path.c_str());
        if (ret == -1)
        {
            const int err = errno;
            LOG_ERROR << err << ": Error deleting " << path;
            return errors::from_errno(err, errors::IO_ERROR);
        }

        LOG_INFO << "Deleted " << resolver.relative(path);
        return errors::OK;
    }

    /**
     * Renames an entry within its directory. An existing sibling is never replaced.
     * @param entry Catalog entry of the renamed item on success.
     * @return OK on success. INVALID_NAME, PATH_NOT_FOUND or CONFLICT on failure.
     */
    errors::code file_ops::rename(file_entry &entry, std::string_view relative_path, std::string_view new_name) const
    {
        std::string source;
        errors::code res = resolver.resolve(source, relative_path);
        if (res != errors::OK)
            return res;

        if (source == resolver.get_root())
            return errors::INVALID_PATH;

        res = validate_name(new_name);
        if (res != errors::OK)
            return res;

        struct stat st;
        if (lstat(source.c_str(), &st) == -1)
            return errors::from_errno(errno, errors::IO_ERROR);

        const std::string source_relative = resolver.relative(source);
        const size_t pos = source_relative.rfind('/');
        const std::string parent_relative = pos == std::string::npos ? "" : source_relative.substr(0, pos);

        std::string target;
        res = resolver.resolve_child(target, parent_relative, new_name);
        if (res != errors::OK)
            return res;

        if (lstat(target.c_str(), &st) == 0)
            return errors::CONFLICT;
        else if (errno != ENOENT)
            return errors::from_errno(errno, errors::IO_ERROR);

        if (util::rename_noreplace(source, target) == -1)
        {
            const int err = errno;
            if (err != EEXIST)
                LOG_ERROR << err << ": Error renaming " << source << " to " << target;
            return errors::from_errno(err, errors::IO_ERROR);
        }

        LOG_INFO << "Renamed " << source_relative << " to " << resolver.relative(target);
        return catalog.describe(entry, target);
    }

    /**
     * Creates a folder under an existing parent directory.
     * @param entry Catalog entry of the new folder on success.
     * @return OK on success. PATH_NOT_FOUND if the parent is missing. CONFLICT if the name is taken.
     */
    errors::code file_ops::create_folder(file_entry &entry, std::string_view parent_relative_path, std::string_view folder_name) const
    {
        std::string parent;
        errors::code res = resolve_directory(parent, parent_relative_path);
        if (res != errors::OK)
            return res;

        std::string target;
        res = resolver.resolve_child(target, parent_relative_path, folder_name);
        if (res != errors::OK)
            return res;

        if (mkdir(target.c_str(), DIR_PERMS) == -1)
        {
            const int err = errno;
            if (err != EEXIST)
                LOG_ERROR << err << ": Error creating folder " << target;
            return errors::from_errno(err, errors::IO_ERROR);
        }

        LOG_INFO << "Created folder " << resolver.relative(target);
        return catalog.describe(entry, target);
    }

} // namespace fs
