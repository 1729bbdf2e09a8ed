#include "../pchheader.hpp"
#include "../rulog.hpp"
#include "../util/util.hpp"
#include "path_resolver.hpp"

namespace fs
{
    constexpr uint16_t MAX_SYMLINK_HOPS = 40;

    path_resolver::path_resolver(std::string_view root) : root(root)
    {
    }

    /**
     * Resolves a path relative to the mount root. Empty, '.' and repeated separators are ignored and '..' segments
     * are applied lexically. The result is then checked against symlinks pointing out of the root.
     * @param absolute Resolved absolute path. The leaf need not exist.
     * @param relative_path Client supplied path. Leading separators are ignored.
     * @return OK on success. INVALID_PATH if the path escapes the root or contains a NUL byte.
     *         DEVICE_LOST if the root filesystem is no longer readable.
     */
    errors::code path_resolver::resolve(std::string &absolute, std::string_view relative_path) const
    {
        if (relative_path.find('\0') != std::string_view::npos)
        {
            LOG_WARNING << "Rejected path with embedded NUL.";
            return errors::INVALID_PATH;
        }

        std::vector<std::string_view> segments;
        size_t start = 0;
        while (start <= relative_path.size())
        {
            size_t end = relative_path.find('/', start);
            if (end == std::string_view::npos)
                end = relative_path.size();

            const std::string_view segment = relative_path.substr(start, end - start);
            if (segment == "..")
            {
                if (segments.empty())
                {
                    LOG_WARNING << "Rejected path climbing above mount root: " << relative_path;
                    return errors::INVALID_PATH;
                }
                segments.pop_back();
            }
            else if (!segment.empty() && segment != ".")
            {
                segments.push_back(segment);
            }

            start = end + 1;
        }

        std::string path = root;
        for (const std::string_view segment : segments)
            path.append("/").append(segment);

        const errors::code res = check_containment(path);
        if (res != errors::OK)
            return res;

        absolute = std::move(path);
        return errors::OK;
    }

    /**
     * Canonicalizes the longest existing prefix of the path and makes sure it stays within the root.
     * A dangling symlink on the way is judged by its target, since creating through it lands there.
     */
    errors::code path_resolver::check_containment(std::string_view path) const
    {
        const std::string real_root = util::realpath(root);
        if (real_root.empty())
        {
            const int err = errno;
            LOG_ERROR << err << ": Mount root " << root << " is not accessible.";
            return err == ENOENT ? errors::DEVICE_LOST : errors::from_errno(err, errors::DEVICE_LOST);
        }

        std::string cursor(path);
        uint16_t hops = 0;
        while (true)
        {
            const std::string real = util::realpath(cursor);
            if (!real.empty())
            {
                const bool contained = real == real_root || (real.size() > real_root.size() && real.compare(0, real_root.size(), real_root) == 0 && real[real_root.size()] == '/');
                if (!contained)
                {
                    LOG_WARNING << "Rejected path resolving outside mount root: " << path;
                    return errors::INVALID_PATH;
                }
                return errors::OK;
            }

            const int err = errno;
            if (err == ELOOP)
                return errors::INVALID_PATH;
            else if (err != ENOENT && err != ENOTDIR)
                return errors::from_errno(err, errors::IO_ERROR);

            struct stat st;
            if (lstat(cursor.c_str(), &st) == 0 && S_ISLNK(st.st_mode))
            {
                if (++hops > MAX_SYMLINK_HOPS)
                {
                    LOG_WARNING << "Rejected path with too many dangling links: " << path;
                    return errors::INVALID_PATH;
                }

                char buf[PATH_MAX];
                const ssize_t len = readlink(cursor.c_str(), buf, sizeof(buf));
                if (len == -1)
                {
                    const int link_err = errno;
                    LOG_ERROR << link_err << ": Error reading link " << cursor;
                    return errors::from_errno(link_err, errors::IO_ERROR);
                }

                const std::string target(buf, len);
                if (target.empty() || target.front() != '/')
                    cursor = cursor.substr(0, cursor.rfind('/') + 1).append(target);
                else
                    cursor = target;
                continue;
            }

            // Walk up to the parent. The root and "/" always resolve so this terminates.
            const size_t pos = cursor.rfind('/');
            if (hops == 0 && (cursor.size() <= root.size() || pos < root.size()))
                return errors::DEVICE_LOST;
            if (pos == std::string::npos || cursor == "/")
                return errors::INVALID_PATH;
            cursor.erase(pos == 0 ? 1 : pos);
        }
    }

    /**
     * Resolves a client supplied name under a parent directory. The name is validated first.
     */
    errors::code path_resolver::resolve_child(std::string &absolute, std::string_view parent_relative_path, std::string_view name) const
    {
        const errors::code res = validate_name(name);
        if (res != errors::OK)
            return res;

        std::string child(parent_relative_path);
        child.append("/").append(name);
        return resolve(absolute, child);
    }

    /**
     * Returns the root relative form of an absolute path produced by this resolver. The root itself is "".
     */
    const std::string path_resolver::relative(std::string_view absolute) const
    {
        if (absolute.size() <= root.size())
            return "";

        return std::string(absolute.substr(root.size() + 1));
    }

    const std::string &path_resolver::get_root() const
    {
        return root;
    }

    /**
     * Checks a client supplied file or folder name.
     * @return OK if acceptable. INVALID_NAME if empty, '.', '..', too long or containing separators or NUL.
     */
    errors::code validate_name(std::string_view name)
    {
        if (name.empty() || name == "." || name == ".." || name.size() > NAME_MAX ||
            name.find_first_of(std::string_view("/\\\0", 3)) != std::string_view::npos)
        {
            LOG_DEBUG << "Rejected name: " << name;
            return errors::INVALID_NAME;
        }

        return errors::OK;
    }

} // namespace fs
