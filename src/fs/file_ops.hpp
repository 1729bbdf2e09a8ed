#ifndef _REVUSB_FS_FILE_OPS_
#define _REVUSB_FS_FILE_OPS_

#include "../pchheader.hpp"
#include "../conf.hpp"
#include "../errors.hpp"
#include "file_catalog.hpp"
#include "fs_common.hpp"
#include "path_resolver.hpp"

namespace fs
{
    constexpr size_t TRANSFER_CHUNK_SIZE = 64 * 1024;
    constexpr mode_t FILE_PERMS = 0644;
    constexpr mode_t DIR_PERMS = 0755;

    /**
     * Mutating and streaming operations on the mounted filesystem. Every path goes through the resolver.
     */
    class file_ops
    {
    private:
        const path_resolver &resolver;
        const file_catalog &catalog;
        const conf::upload_config &cfg;

        errors::code resolve_directory(std::string &dir, std::string_view relative_path) const;

    public:
        file_ops(const path_resolver &resolver, const file_catalog &catalog, const conf::upload_config &cfg);

        errors::code upload(file_entry &entry, const upload_request &req) const;
        errors::code download(uint64_t &bytes_sent, std::string_view relative_path, const int out_fd) const;
        errors::code remove(std::string_view relative_path) const;
        errors::code rename(file_entry &entry, std::string_view relative_path, std::string_view new_name) const;
        errors::code create_folder(file_entry &entry, std::string_view parent_relative_path, std::string_view folder_name) const;
    };

} // namespace fs

#endif
