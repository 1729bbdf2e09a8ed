#include "../pchheader.hpp"
#include "../rulog.hpp"
#include "../util/util.hpp"
#include "lsblk_mounter.hpp"

namespace usb
{
    constexpr const char *SUDO_EXE_PATH = "/usr/bin/sudo";
    constexpr const char *LSBLK_COLUMNS = "NAME,PKNAME,TYPE,SIZE,RM,HOTPLUG,TRAN,LABEL,FSTYPE,MOUNTPOINT";
    constexpr uint16_t READ_BUF_SIZE = 4096;
    constexpr int EXEC_FAILURE_EXIT_CODE = 127;

    // Filesystems without unix ownership. These get mounted as the current user.
    const std::unordered_set<std::string> OWNERLESS_FSTYPES = {"vfat", "exfat", "ntfs", "ntfs3", "msdos"};

    namespace
    {
        /**
         * lsblk versions differ in how they encode columns. Older ones emit every value as a string
         * while newer ones use numbers, booleans and null.
         */
        std::optional<std::string> get_optional_string(const jsoncons::ojson &node, const char *key)
        {
            if (!node.contains(key) || node.at(key).is_null())
                return std::nullopt;

            const std::string value = node.at(key).as<std::string>();
            if (value.empty())
                return std::nullopt;

            return value;
        }

        const std::string get_string(const jsoncons::ojson &node, const char *key)
        {
            return get_optional_string(node, key).value_or("");
        }

        bool get_flag(const jsoncons::ojson &node, const char *key)
        {
            if (!node.contains(key))
                return false;

            const jsoncons::ojson &value = node.at(key);
            if (value.is_bool())
                return value.as<bool>();
            else if (value.is_number())
                return value.as<int64_t>() != 0;
            else if (value.is_string())
                return value.as<std::string>() == "1" || value.as<std::string>() == "true";

            return false;
        }

        int get_size(uint64_t &size, const jsoncons::ojson &node, const char *key)
        {
            size = 0;
            if (!node.contains(key) || node.at(key).is_null())
                return 0;

            const jsoncons::ojson &value = node.at(key);
            if (value.is_number())
            {
                size = value.as<uint64_t>();
                return 0;
            }

            const std::string str = value.as<std::string>();
            if (str.empty())
                return 0;

            char *end = NULL;
            errno = 0;
            size = strtoull(str.c_str(), &end, 10);
            if (errno != 0 || *end != '\0')
                return -1;

            return 0;
        }
    } // namespace

    lsblk_mounter::lsblk_mounter(const conf::mount_config &cfg) : cfg(cfg)
    {
    }

    /**
     * Runs a helper process and captures its stdout and stderr. The process is killed if it does not
     * complete within the configured command timeout.
     * @param args Program path followed by its arguments.
     * @param privileged Whether the command needs to be elevated with sudo (when enabled).
     * @return 0 when the process ran to completion (regardless of its exit code). -1 on failure.
     */
    int lsblk_mounter::execute(const std::vector<std::string> &args, const bool privileged, command_result &result)
    {
        std::vector<std::string> cmd;
        if (privileged && cfg.use_sudo)
        {
            cmd.push_back(SUDO_EXE_PATH);
            cmd.push_back("-n"); // Never prompt for a password.
        }
        cmd.insert(cmd.end(), args.begin(), args.end());

        // Argument and environment vectors are prepared before forking.
        std::vector<char *> execv_args;
        for (std::string &arg : cmd)
            execv_args.push_back(arg.data());
        execv_args.push_back(NULL);

        // Helper messages are classified by text so we force the untranslated locale.
        char env_locale[] = "LC_ALL=C";
        char env_path[] = "PATH=/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin";
        char *execv_env[] = {env_locale, env_path, NULL};

        int out_pipe[2];
        int err_pipe[2];
        if (pipe2(out_pipe, O_CLOEXEC) == -1)
        {
            LOG_ERROR << errno << ": Failed to create output pipe for " << cmd[0];
            return -1;
        }
        if (pipe2(err_pipe, O_CLOEXEC) == -1)
        {
            LOG_ERROR << errno << ": Failed to create error pipe for " << cmd[0];
            close(out_pipe[0]);
            close(out_pipe[1]);
            return -1;
        }

        const pid_t pid = fork();
        if (pid == -1)
        {
            LOG_ERROR << errno << ": fork() failed when starting " << cmd[0];
            close(out_pipe[0]);
            close(out_pipe[1]);
            close(err_pipe[0]);
            close(err_pipe[1]);
            return -1;
        }
        else if (pid == 0)
        {
            // Helper process.
            util::fork_detach();

            // dup2 clears the close-on-exec flag on the target descriptors.
            dup2(out_pipe[1], STDOUT_FILENO);
            dup2(err_pipe[1], STDERR_FILENO);

            execve(execv_args[0], execv_args.data(), execv_env);
            _exit(EXEC_FAILURE_EXIT_CODE);
        }

        // revusb process.
        close(out_pipe[1]);
        close(err_pipe[1]);

        struct pollfd fds[2] = {{out_pipe[0], POLLIN, 0}, {err_pipe[0], POLLIN, 0}};
        std::string *outputs[2] = {&result.out, &result.err};
        int open_fds = 2;
        bool timed_out = false;
        char buf[READ_BUF_SIZE];
        const uint64_t deadline = util::get_epoch_milliseconds() + cfg.command_timeout;

        while (open_fds > 0)
        {
            const uint64_t now = util::get_epoch_milliseconds();
            if (now >= deadline)
            {
                timed_out = true;
                break;
            }

            if (poll(fds, 2, deadline - now) == -1)
            {
                if (errno == EINTR)
                    continue;

                LOG_ERROR << errno << ": Error when polling output of " << cmd[0];
                timed_out = true;
                break;
            }

            for (int i = 0; i < 2; i++)
            {
                if (fds[i].fd == -1 || !(fds[i].revents & (POLLIN | POLLHUP | POLLERR)))
                    continue;

                const ssize_t res = read(fds[i].fd, buf, sizeof(buf));
                if (res > 0)
                {
                    outputs[i]->append(buf, res);
                }
                else if (res == 0 || errno != EINTR)
                {
                    close(fds[i].fd);
                    fds[i].fd = -1; // poll ignores negative fds.
                    open_fds--;
                }
            }
        }

        for (const pollfd &pfd : fds)
        {
            if (pfd.fd != -1)
                close(pfd.fd);
        }

        if (timed_out)
        {
            LOG_ERROR << cmd[0] << " did not complete within " << cfg.command_timeout << "ms. Killing pid:" << pid;

            // The helper leads its own process group. sudo and the mount(8) it spawned must go down with it.
            if (kill(-pid, SIGKILL) == -1 && errno != ESRCH)
                LOG_ERROR << errno << ": Error killing process group of pid:" << pid;
            util::kill_process(pid, true, SIGKILL);
            return -1;
        }

        int status = 0;
        while (waitpid(pid, &status, 0) == -1)
        {
            if (errno != EINTR)
            {
                LOG_ERROR << errno << ": Error waiting for " << cmd[0] << " pid:" << pid;
                return -1;
            }
        }

        result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
        if (result.exit_code == EXEC_FAILURE_EXIT_CODE)
        {
            LOG_ERROR << "Could not execute " << cmd[0];
            return -1;
        }

        return 0;
    }

    errors::code lsblk_mounter::list(std::vector<block_device> &devices)
    {
        command_result result;
        if (execute({cfg.lsblk_bin, "-J", "-b", "-l", "-o", LSBLK_COLUMNS}, false, result) == -1)
            return errors::IO_ERROR;

        if (result.exit_code != 0)
        {
            LOG_ERROR << "lsblk failed with code " << result.exit_code << ": " << result.err;
            return errors::IO_ERROR;
        }

        return parse_lsblk_json(devices, result.out);
    }

    /**
     * Parses the output of 'lsblk -J -b -l' into block devices. Entries keep the kernel order.
     */
    errors::code lsblk_mounter::parse_lsblk_json(std::vector<block_device> &devices, std::string_view json)
    {
        try
        {
            const jsoncons::ojson d = jsoncons::ojson::parse(json);

            if (!d.contains("blockdevices") || !d["blockdevices"].is_array())
            {
                LOG_ERROR << "Invalid lsblk output. 'blockdevices' list missing.";
                return errors::IO_ERROR;
            }

            for (const auto &node : d["blockdevices"].array_range())
            {
                block_device dev;
                dev.name = get_string(node, "name");
                if (dev.name.empty())
                    continue;

                dev.type = get_string(node, "type");
                dev.parent = get_string(node, "pkname");
                if (get_size(dev.size, node, "size") == -1)
                {
                    LOG_WARNING << "Invalid size reported for " << dev.name;
                    dev.size = 0;
                }
                dev.human_size = util::to_human_size(dev.size);
                dev.label = get_optional_string(node, "label");
                dev.fstype = get_string(node, "fstype");
                dev.mountpoint = get_optional_string(node, "mountpoint");
                dev.removable = get_flag(node, "rm") || get_flag(node, "hotplug") || get_string(node, "tran") == "usb";

                devices.push_back(std::move(dev));
            }
        }
        catch (const std::exception &e)
        {
            LOG_ERROR << "Invalid lsblk output. " << e.what();
            return errors::IO_ERROR;
        }

        return errors::OK;
    }

    errors::code lsblk_mounter::mount(const block_device &device, std::string_view mount_root)
    {
        std::vector<std::string> args = {cfg.mount_bin};
        if (!device.fstype.empty())
        {
            args.push_back("-t");
            args.push_back(device.fstype);
        }

        std::string options = "nosuid,nodev";
        if (OWNERLESS_FSTYPES.count(device.fstype))
            options.append(",uid=").append(std::to_string(getuid())).append(",gid=").append(std::to_string(getgid()));
        args.push_back("-o");
        args.push_back(options);

        args.push_back(std::string("/dev/").append(device.name));
        args.push_back(std::string(mount_root));

        command_result result;
        if (execute(args, true, result) == -1)
            return errors::IO_ERROR;

        if (result.exit_code != 0)
        {
            LOG_ERROR << "Mounting " << device.name << " at " << mount_root << " failed with code " << result.exit_code << ": " << result.err;
            return classify_error(result.err);
        }

        // Make sure the kernel actually attached a filesystem at the mount root.
        if (!is_mounted(mount_root))
        {
            LOG_ERROR << "Mount of " << device.name << " reported success but " << mount_root << " is not a mount point.";
            return errors::IO_ERROR;
        }

        return errors::OK;
    }

    errors::code lsblk_mounter::unmount(std::string_view mount_root, const bool detach)
    {
        std::vector<std::string> args = {cfg.umount_bin};
        if (detach)
            args.push_back("-l");
        args.push_back(std::string(mount_root));

        command_result result;
        if (execute(args, true, result) == -1)
            return errors::IO_ERROR;

        if (result.exit_code != 0)
        {
            const errors::code res = classify_error(result.err);
            if (res == errors::BUSY)
                LOG_DEBUG << "Unmount of " << mount_root << " reported busy.";
            else
                LOG_ERROR << "Unmounting " << mount_root << " failed with code " << result.exit_code << ": " << result.err;
            return res;
        }

        return errors::OK;
    }

    bool lsblk_mounter::is_mounted(std::string_view mount_root)
    {
        return util::is_mount_point(mount_root);
    }

    /**
     * Maps the diagnostic text of mount(8)/umount(8) to an error code.
     */
    errors::code lsblk_mounter::classify_error(std::string_view message)
    {
        const std::string msg = util::to_lower(message);
        const auto has = [&](const char *text) { return msg.find(text) != std::string::npos; };

        if (has("unknown filesystem type") || has("wrong fs type"))
            return errors::UNSUPPORTED_FILESYSTEM;
        else if (has("target is busy") || has("device is busy") || has("resource busy"))
            return errors::BUSY;
        else if (has("not mounted") || has("no mount point specified"))
            return errors::NOT_MOUNTED;
        else if (has("already mounted"))
            return errors::ALREADY_MOUNTED;
        else if (has("must be superuser") || has("only root") || has("permission denied") ||
                 has("operation not permitted") || has("password is required") || has("not in the sudoers"))
            return errors::MOUNT_PERMISSION_DENIED;
        else if (has("special device") || has("does not exist") || has("no such device") || has("no medium found"))
            return errors::DEVICE_NOT_FOUND;

        return errors::IO_ERROR;
    }

} // namespace usb
