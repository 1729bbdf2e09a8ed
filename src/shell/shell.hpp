#ifndef _REVUSB_SHELL_SHELL_
#define _REVUSB_SHELL_SHELL_

#include "../pchheader.hpp"
#include "../core/usb_core.hpp"

/**
 * Line based command interface over the core. Reads one command per line and writes one json reply per line.
 */
namespace shell
{
    int tokenize(std::vector<std::string> &args, std::string_view line);

    int handle_command(std::string &reply, core::usb_core &core, const std::vector<std::string> &args);

    int run(core::usb_core &core, std::istream &in, std::ostream &out);

} // namespace shell

#endif
