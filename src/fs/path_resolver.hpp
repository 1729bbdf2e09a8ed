#ifndef _REVUSB_FS_PATH_RESOLVER_
#define _REVUSB_FS_PATH_RESOLVER_

#include "../pchheader.hpp"
#include "../errors.hpp"

namespace fs
{
    /**
     * Turns client supplied relative paths into absolute paths confined to the mount root.
     * This is the only place user input becomes a filesystem path.
     */
    class path_resolver
    {
    private:
        const std::string root; // Canonical mount root.
        errors::code check_containment(std::string_view path) const;

    public:
        explicit path_resolver(std::string_view root);

        errors::code resolve(std::string &absolute, std::string_view relative_path) const;
        errors::code resolve_child(std::string &absolute, std::string_view parent_relative_path, std::string_view name) const;
        const std::string relative(std::string_view absolute) const;
        const std::string &get_root() const;
    };

    errors::code validate_name(std::string_view name);

} // namespace fs

#endif
