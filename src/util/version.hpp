#ifndef _REVUSB_UTIL_VERSION_
#define _REVUSB_UTIL_VERSION_

#include "../pchheader.hpp"

namespace version
{
    // revusb version. Written to new configs and reported by the 'version' command.
    constexpr const char *REVUSB_VERSION = "1.0.0";

    // Minimum compatible config version (this will be used to validate configs).
    constexpr const char *MIN_CONFIG_VERSION = "1.0.0";

    int version_compare(const std::string &x, const std::string &y);

}

#endif
