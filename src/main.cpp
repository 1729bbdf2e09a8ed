/**
    Entry point for revusb
**/

#include "pchheader.hpp"
#include "util/version.hpp"
#include "util/util.hpp"
#include "conf.hpp"
#include "crypto.hpp"
#include "rulog.hpp"
#include "core/usb_core.hpp"
#include "shell/shell.hpp"
#include "usb/lsblk_mounter.hpp"

// Active core instance. Used by the exit handler to release the mounted device.
core::usb_core *active_core = NULL;

/**
 * Parses CLI args and extracts the revusb command and parameters given.
 * revusb command line accepts command and the instance directory(optional)
 */
int parse_cmd(int argc, char **argv)
{
    if (argc > 1) //We get working dir as an arg anyway. So we need to check for >1 args.
    {
        // We populate the global ctx with the detected command.
        conf::ctx.command = argv[1];

        // For run/new, instance directory argument must be specified.
        if (conf::ctx.command == "run" || conf::ctx.command == "new")
        {
            if (argc != 3)
            {
                std::cerr << "Instance directory not specified.\n";
            }
            else
            {
                conf::set_dir_paths(argv[0], argv[2]);
                return 0;
            }
        }
        else if (conf::ctx.command == "version")
        {
            if (argc == 2)
                return 0;
        }
    }

    // If all extractions fail display help message.

    std::cerr << "Arguments mismatch.\n";
    std::cout << "Usage:\n";
    std::cout << "revusb version\n";
    std::cout << "revusb <command> <instance dir> (command = run | new)\n";
    std::cout << "Example: revusb run ~/revusb\n";

    return -1;
}

/**
 * Performs any cleanup on graceful application termination.
 * A mounted device is unmounted so it can be removed safely.
 */
void deinit()
{
    if (active_core && active_core->get_state() == usb::MOUNT_STATE::MOUNTED)
    {
        const errors::code res = active_core->unmount();
        if (res != errors::OK)
            LOG_ERROR << "Device could not be unmounted at exit: " << errors::to_string(res);
    }
    active_core = NULL;

    conf::deinit();
}

void sig_exit_handler(int signum)
{
    LOG_WARNING << "Interrupt signal (" << signum << ") received.";
    deinit();
    LOG_WARNING << "revusb exited due to signal.";
    exit(signum);
}

void segfault_handler(int signum)
{
    std::cerr << boost::stacktrace::stacktrace() << "\n";
    exit(SIGABRT);
}

/**
 * Global exception handler for std exceptions.
 */
void std_terminate() noexcept
{
    std::exception_ptr exptr = std::current_exception();
    if (exptr != 0)
    {
        try
        {
            std::rethrow_exception(exptr);
        }
        catch (std::exception &ex)
        {
            LOG_ERROR << "std error: " << ex.what();
        }
        catch (...)
        {
            LOG_ERROR << "std error: Terminated due to unknown exception";
        }
    }
    else
    {
        LOG_ERROR << "std error: Terminated due to unknown reason";
    }

    LOG_ERROR << boost::stacktrace::stacktrace();

    exit(1);
}

int main(int argc, char **argv)
{
    // Register exception and segfault handlers.
    std::set_terminate(&std_terminate);
    signal(SIGSEGV, &segfault_handler);
    signal(SIGABRT, &segfault_handler);

    // Disable SIGPIPE to avoid crashing when a download sink goes away.
    {
        sigset_t mask;
        sigemptyset(&mask);
        sigaddset(&mask, SIGPIPE);
        pthread_sigmask(SIG_BLOCK, &mask, NULL);
    }

    // Extract the CLI args
    // This call will populate conf::ctx
    if (parse_cmd(argc, argv) != 0)
        return -1;

    if (conf::ctx.command == "version")
    {
        std::cout << "revusb " << version::REVUSB_VERSION << std::endl;
        return 0;
    }

    // Upload temp file names are generated with the crypto subsystem.
    if (crypto::init() != 0)
        return -1;

    if (conf::ctx.command == "new")
    {
        // This will create a new instance directory with the default config.
        if (conf::create_instance() != 0)
            return -1;
    }
    else if (conf::ctx.command == "run")
    {
        if (conf::init() != 0)
            return -1;

        rulog::init();

        LOG_INFO << "revusb " << version::REVUSB_VERSION;
        LOG_INFO << "Mount root: " << conf::cfg.mount.mount_root << (conf::cfg.mount.use_sudo ? " (sudo)" : "");

        usb::lsblk_mounter mounter(conf::cfg.mount);
        core::usb_core core(mounter, conf::cfg.mount, conf::cfg.upload);
        active_core = &core;

        // After initializing the core, register the exit handler.
        signal(SIGINT, &sig_exit_handler);
        signal(SIGTERM, &sig_exit_handler);

        // Serve shell commands until stdin closes or 'quit' is received.
        shell::run(core, std::cin, std::cout);

        deinit();
    }

    std::cerr << "revusb exited normally.\n";
    return 0;
}
