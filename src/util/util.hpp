#ifndef _REVUSB_UTIL_UTIL_
#define _REVUSB_UTIL_UTIL_

#include "../pchheader.hpp"

/**
 * Contains helper functions used by multiple other subsystems.
 */
namespace util
{
    const std::string to_hex(const std::string_view bin);

    uint64_t get_epoch_milliseconds();

    void sleep(const uint64_t milliseconds);

    const std::string realpath(const std::string &path);

    void fork_detach();

    int kill_process(const pid_t pid, const bool wait, const int signal = SIGINT);

    bool is_dir_exists(std::string_view path);

    bool is_file_exists(std::string_view path);

    bool is_mount_point(std::string_view path);

    int create_dir_tree_recursive(std::string_view path);

    int fetch_dir_entries(std::list<std::string> &entries, std::string_view path);

    std::string_view fetch_file_extension(std::string_view path);

    int remove_directory_recursively(std::string_view dir_path);

    const std::string get_name(std::string_view path);

    const std::string to_lower(std::string_view str);

    const std::string to_human_size(const uint64_t bytes);

    const std::string to_iso_time(const time_t seconds);

    int read_from_fd(const int fd, std::string &buf, const off_t offset = 0);

    int write_all(const int fd, const char *buf, const size_t len);

    int rename_noreplace(const std::string &from, const std::string &to);

    int set_lock(const int fd, struct flock &lock, const bool is_rwlock, const off_t start, const off_t len);

    int release_lock(const int fd, struct flock &lock);

} // namespace util

#endif
