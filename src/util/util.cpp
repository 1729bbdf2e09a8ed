#include "../pchheader.hpp"
#include "../rulog.hpp"
#include "util.hpp"

namespace util
{
    constexpr mode_t DIR_PERMS = 0755;

    // Units used for human readable sizes (base 1024).
    constexpr const char *SIZE_UNITS[] = {"B", "KB", "MB", "GB", "TB"};
    constexpr size_t SIZE_UNIT_COUNT = 5;

    const std::string to_hex(const std::string_view bin)
    {
        // Allocate the target string.
        std::string encoded_string;
        encoded_string.resize(bin.size() * 2);

        // Get encoded string.
        sodium_bin2hex(
            encoded_string.data(),
            encoded_string.length() + 1, // + 1 because sodium writes ending '\0' character as well.
            reinterpret_cast<const unsigned char *>(bin.data()),
            bin.size());
        return encoded_string;
    }

    /**
    * Returns current time in UNIX epoch milliseconds.
    */
    uint64_t get_epoch_milliseconds()
    {
        return std::chrono::duration_cast<std::chrono::duration<std::uint64_t, std::milli>>(
                   std::chrono::system_clock::now().time_since_epoch())
            .count();
    }

    /**
     * Sleeps the current thread for specified no. of milliseconds.
     */
    void sleep(const uint64_t milliseconds)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(milliseconds));
    }

    // Provide a safe std::string overload for realpath. Returns empty string on failure (errno is preserved).
    const std::string realpath(const std::string &path)
    {
        std::array<char, PATH_MAX> buffer;
        if (!::realpath(path.c_str(), buffer.data()))
            return {};

        buffer[PATH_MAX - 1] = '\0';
        return buffer.data();
    }

    /**
     * Clears signal mask and signal handlers from the caller.
     * Called by helper processes forked from revusb so they get detatched from
     * the revusb signal setup.
     */
    void fork_detach()
    {
        // Restore signal handlers to defaults.
        signal(SIGINT, SIG_DFL);
        signal(SIGTERM, SIG_DFL);
        signal(SIGSEGV, SIG_DFL);
        signal(SIGABRT, SIG_DFL);

        // Remove any signal masks applied by revusb.
        sigset_t mask;
        sigemptyset(&mask);
        pthread_sigmask(SIG_SETMASK, &mask, NULL);

        // Set process group id (so the terminal doesn't send kill signals to forked children).
        setpgrp();
    }

    // Kill a process with a signal and if specified, wait until it stops running.
    int kill_process(const pid_t pid, const bool wait, const int signal)
    {
        if (kill(pid, signal) == -1)
        {
            LOG_ERROR << errno << ": Error issuing signal to pid " << pid;
            return -1;
        }

        const int wait_options = wait ? 0 : WNOHANG;
        if (waitpid(pid, NULL, wait_options) == -1)
        {
            LOG_ERROR << errno << ": waitpid after kill (pid:" << pid << ") failed.";
            return -1;
        }

        return 0;
    }

    /**
     * Check whether given directory exists.
     * @param path Directory path.
     * @return Returns true if given directory exists otherwise false.
     */
    bool is_dir_exists(std::string_view path)
    {
        struct stat st;
        return (stat(path.data(), &st) == 0 && S_ISDIR(st.st_mode));
    }

    /**
     * Check whether given file exists.
     * @param path File path.
     * @return Returns true if give file exists otherwise false.
     */
    bool is_file_exists(std::string_view path)
    {
        struct stat st;
        return (stat(path.data(), &st) == 0 && S_ISREG(st.st_mode));
    }

    /**
     * Check whether the given directory is the root of a mounted filesystem. A directory is a mount point
     * if it lives on a different device than its parent, or if it is the same inode as its parent (/).
     */
    bool is_mount_point(std::string_view path)
    {
        struct stat st, parent_st;
        if (lstat(path.data(), &st) == -1 || !S_ISDIR(st.st_mode))
            return false;

        const std::string parent = std::string(path) + "/..";
        if (lstat(parent.c_str(), &parent_st) == -1)
            return false;

        return st.st_dev != parent_st.st_dev || st.st_ino == parent_st.st_ino;
    }

    /**
     * Recursively creates directories and sub-directories if not exist.
     * @param path Directory path.
     * @return Returns 0 operations succeeded otherwise -1.
     */
    int create_dir_tree_recursive(std::string_view path)
    {
        if (strcmp(path.data(), "/") == 0) // No need of checking if we are at root.
            return 0;

        // Check whether this dir exists or not.
        struct stat st;
        if (stat(path.data(), &st) != 0 || !S_ISDIR(st.st_mode))
        {
            // Check and create parent dir tree first.
            char *path2 = strdup(path.data());
            char *parent_dir_path = dirname(path2);
            bool error_thrown = false;

            if (create_dir_tree_recursive(parent_dir_path) == -1)
                error_thrown = true;

            free(path2);

            // Create this dir.
            if (!error_thrown && mkdir(path.data(), DIR_PERMS) == -1)
            {
                LOG_ERROR << errno << ": Error in recursive dir creation. " << path;
                error_thrown = true;
            }

            if (error_thrown)
                return -1;
        }

        return 0;
    }

    /**
     * Fetch all the files and directories inside the given directory.
     * @param entries List to populate with entry names (excluding '.' and '..').
     * @param path Directory path.
     * @return 0 on success. -1 on failure with errno set by opendir/readdir.
     */
    int fetch_dir_entries(std::list<std::string> &entries, std::string_view path)
    {
        DIR *dr = opendir(path.data());
        if (!dr)
            return -1;

        // readdir() only signals errors through errno, so it must be cleared beforehand.
        errno = 0;
        struct dirent *en;
        while ((en = readdir(dr)))
        {
            if (std::strcmp(en->d_name, ".") != 0 && std::strcmp(en->d_name, "..") != 0)
                entries.push_back(en->d_name);
        }

        const int read_errno = errno;
        closedir(dr);

        if (read_errno != 0)
        {
            errno = read_errno;
            return -1;
        }

        return 0;
    }

    /**
     * Fetch file extension from the file path.
     * @param path File path.
     * @return Returns the file extension (including the '.') as a string_view. Empty if none.
     */
    std::string_view fetch_file_extension(std::string_view path)
    {
        // Get the position of right most "." in the file path.
        const std::size_t pos = path.rfind('.');

        // A leading dot marks a hidden file, not an extension.
        if (pos != std::string::npos && pos != 0)
        {
            // Take the sub string after the ".".
            return path.substr(pos);
        }

        return "";
    }

    /**
     * Remove a directory recursively with it's content. FTW_DEPTH is provided so all of the files and subdirectories within
     * The path will be processed. FTW_PHYS is provided so symbolic links won't be followed.
     * @return 0 on success. -1 on failure with errno of the failed removal.
     */
    int remove_directory_recursively(std::string_view dir_path)
    {
        return nftw(
            dir_path.data(), [](const char *fpath, const struct stat *sb, int typeflag, struct FTW *ftwbuf)
            { return remove(fpath); },
            16, FTW_DEPTH | FTW_PHYS);
    }

    // Returns the file/dir name of the given path.
    const std::string get_name(std::string_view path)
    {
        char *path2 = strdup(std::string(path).c_str());
        const std::string name = basename(path2);
        free(path2);
        return name;
    }

    const std::string to_lower(std::string_view str)
    {
        std::string lower(str);
        std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c)
                       { return std::tolower(c); });
        return lower;
    }

    /**
     * Formats a byte count in base 1024 units with one decimal place. eg. 1536 -> "1.5 KB".
     */
    const std::string to_human_size(const uint64_t bytes)
    {
        if (bytes == 0)
            return "0 B";

        double size = (double)bytes;
        size_t unit = 0;
        while (size >= 1024 && unit < SIZE_UNIT_COUNT - 1)
        {
            size /= 1024.0;
            unit++;
        }

        std::ostringstream os;
        os << std::fixed << std::setprecision(1) << size << " " << SIZE_UNITS[unit];
        return os.str();
    }

    /**
     * Formats epoch seconds as local ISO-8601 time. eg. 2024-01-31T08:15:00
     */
    const std::string to_iso_time(const time_t seconds)
    {
        tm t;
        localtime_r(&seconds, &t);

        char buf[32];
        strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &t);
        return buf;
    }

    /**
     * Reads the entire file from given file discriptor.
     * @param fd File descriptor to be read.
     * @param buf String buffer to be populated.
     * @param offset Begin offset of the file to read.
     * @return Returns number of bytes read in a successful read and -1 on error.
    */
    int read_from_fd(const int fd, std::string &buf, const off_t offset)
    {
        struct stat st;
        if (fstat(fd, &st) == -1)
        {
            LOG_ERROR << errno << ": Error in stat for reading entire file.";
            return -1;
        }

        buf.resize(st.st_size - offset);

        return pread(fd, buf.data(), buf.size(), offset);
    }

    /**
     * Writes the whole buffer to the file descriptor, retrying on partial writes and interrupts.
     * @return 0 on success. -1 on failure with errno set by write().
     */
    int write_all(const int fd, const char *buf, const size_t len)
    {
        size_t written = 0;
        while (written < len)
        {
            const ssize_t res = write(fd, buf + written, len - written);
            if (res == -1)
            {
                if (errno == EINTR)
                    continue;
                return -1;
            }
            written += res;
        }
        return 0;
    }

    /**
     * Renames a path without ever replacing an existing target.
     * @return 0 on success. -1 on failure with errno set (EEXIST when the target exists).
     */
    int rename_noreplace(const std::string &from, const std::string &to)
    {
        if (renameat2(AT_FDCWD, from.c_str(), AT_FDCWD, to.c_str(), RENAME_NOREPLACE) == 0)
            return 0;

        if (errno != EINVAL && errno != ENOSYS)
            return -1;

        // Filesystem does not support the flag (eg. older vfat drivers). Check and rename instead.
        struct stat st;
        if (lstat(to.c_str(), &st) == 0)
        {
            errno = EEXIST;
            return -1;
        }
        else if (errno != ENOENT)
        {
            return -1;
        }

        return ::rename(from.c_str(), to.c_str());
    }

    /**
     * Create a record lock for the file descriptor. Lock is associated with the process (Not for forked child processes).
     * @param fd File descriptor to be locked.
     * @param lock File lock.
     * @param is_rwlock Whether the record lock is a write lock.
     * @param start Starting offset for the lock.
     * @param len Number of bytes to lock.
     * @return Returns 0 if lock is successfully acquired, -1 on error.
    */
    int set_lock(const int fd, struct flock &lock, const bool is_rwlock, const off_t start, const off_t len)
    {
        lock.l_type = is_rwlock ? F_WRLCK : F_RDLCK;
        lock.l_whence = SEEK_SET;
        lock.l_start = start,
        lock.l_len = len;
        return fcntl(fd, F_SETLK, &lock);
    }

    /**
     * Releases the lock on file descriptor.
     * @param fd File descriptor to be released.
     * @param lock File lock.
     * @return Returns 0 if lock is successfully released, -1 on error.
    */
    int release_lock(const int fd, struct flock &lock)
    {
        lock.l_type = F_UNLCK;
        return fcntl(fd, F_SETLKW, &lock);
    }

} // namespace util
