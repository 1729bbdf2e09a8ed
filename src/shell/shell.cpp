#include "../pchheader.hpp"
#include "../rulog.hpp"
#include "../util/util.hpp"
#include "shell.hpp"
#include "shellmsg_common.hpp"
#include "shellmsg_json.hpp"

namespace shell
{
    constexpr int LOCAL_FILE_PERMS = 0644;

    struct command_spec
    {
        const char *name;
        size_t min_args;
        size_t max_args;
        const char *usage;
    };

    const std::vector<command_spec> COMMANDS = {
        {CMD_DEVICES, 0, 0, "devices"},
        {CMD_MOUNT, 1, 1, "mount <device>"},
        {CMD_UNMOUNT, 0, 0, "unmount"},
        {CMD_STATUS, 0, 0, "status"},
        {CMD_LS, 0, 1, "ls [path]"},
        {CMD_UPLOAD, 1, 3, "upload <local-file> [dir] [name]"},
        {CMD_DOWNLOAD, 2, 2, "download <path> <local-file>"},
        {CMD_RM, 1, 1, "rm <path>"},
        {CMD_MV, 2, 2, "mv <path> <new-name>"},
        {CMD_MKDIR, 1, 2, "mkdir <name> [parent]"},
        {CMD_HELP, 0, 0, "help"},
        {CMD_QUIT, 0, 0, "quit"}};

    /**
     * Splits a command line into arguments. Arguments are separated by whitespace and double quotes group
     * text including whitespace. Within quotes a backslash escapes the next character. "" is an empty argument.
     * @return 0 on success. -1 if a quote is left open.
     */
    int tokenize(std::vector<std::string> &args, std::string_view line)
    {
        std::string current;
        bool in_token = false;
        bool in_quotes = false;

        for (size_t i = 0; i < line.size(); i++)
        {
            const char c = line[i];
            if (in_quotes)
            {
                if (c == '\\' && i + 1 < line.size())
                    current.push_back(line[++i]);
                else if (c == '"')
                    in_quotes = false;
                else
                    current.push_back(c);
            }
            else if (c == '"')
            {
                in_quotes = true;
                in_token = true;
            }
            else if (isspace((unsigned char)c))
            {
                if (in_token)
                {
                    args.push_back(std::move(current));
                    current.clear();
                    in_token = false;
                }
            }
            else
            {
                current.push_back(c);
                in_token = true;
            }
        }

        if (in_quotes)
            return -1;

        if (in_token)
            args.push_back(std::move(current));

        return 0;
    }

    void upload_local_file(std::string &reply, core::usb_core &core, const std::vector<std::string> &args)
    {
        const std::string &local_path = args[1];
        const int fd = open(local_path.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd == -1)
        {
            json::create_protocol_error(reply, ERR_LOCAL_FILE, std::string("Cannot open ") + local_path + ": " + strerror(errno));
            return;
        }

        struct stat st;
        if (fstat(fd, &st) == -1 || !S_ISREG(st.st_mode))
        {
            json::create_protocol_error(reply, ERR_LOCAL_FILE, local_path + " is not a regular file.");
            close(fd);
            return;
        }

        fs::upload_request req;
        req.source_fd = fd;
        req.declared_size = st.st_size;
        req.target_dir = args.size() > 2 ? args[2] : "";
        req.filename = args.size() > 3 ? args[3] : util::get_name(local_path);

        fs::file_entry entry;
        const errors::code res = core.upload(entry, req);
        close(fd);

        if (res == errors::OK)
            json::create_file_response(reply, entry);
        else
            json::create_error(reply, res);
    }

    void download_to_local_file(std::string &reply, core::usb_core &core, const std::vector<std::string> &args)
    {
        const std::string &local_path = args[2];

        // Never overwrite local files.
        const int fd = open(local_path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, LOCAL_FILE_PERMS);
        if (fd == -1)
        {
            json::create_protocol_error(reply, ERR_LOCAL_FILE, std::string("Cannot create ") + local_path + ": " + strerror(errno));
            return;
        }

        uint64_t bytes_sent = 0;
        errors::code res = core.download(bytes_sent, args[1], fd);
        if (close(fd) == -1 && res == errors::OK)
        {
            LOG_ERROR << errno << ": Error closing download target " << local_path;
            res = errors::IO_ERROR;
        }

        if (res == errors::OK)
        {
            json::create_download_response(reply, bytes_sent);
            return;
        }

        if (unlink(local_path.c_str()) == -1)
            LOG_WARNING << errno << ": Error removing incomplete download " << local_path;
        json::create_error(reply, res);
    }

    /**
     * Executes a tokenized command against the core and builds its reply.
     * @return 1 if the shell should exit. 0 otherwise.
     */
    int handle_command(std::string &reply, core::usb_core &core, const std::vector<std::string> &args)
    {
        const std::string &cmd = args[0];
        const auto spec = std::find_if(COMMANDS.begin(), COMMANDS.end(), [&](const command_spec &c) { return cmd == c.name; });
        if (spec == COMMANDS.end())
        {
            json::create_protocol_error(reply, ERR_INVALID_COMMAND, "Unknown command '" + cmd + "'. Type 'help' for the command list.");
            return 0;
        }

        const size_t arg_count = args.size() - 1;
        if (arg_count < spec->min_args || arg_count > spec->max_args)
        {
            json::create_protocol_error(reply, ERR_INVALID_ARGS, std::string("Usage: ") + spec->usage);
            return 0;
        }

        LOG_DEBUG << "Shell command: " << cmd;

        errors::code res = errors::OK;
        fs::file_entry entry;

        if (cmd == CMD_DEVICES)
        {
            json::create_device_list(reply, core.list_devices());
        }
        else if (cmd == CMD_MOUNT)
        {
            res = core.mount(args[1]);
            if (res == errors::OK)
            {
                usb::usage_status status;
                core.status(status);
                json::create_mount_response(reply, status);
            }
        }
        else if (cmd == CMD_UNMOUNT)
        {
            res = core.unmount();
            if (res == errors::OK)
                json::create_success(reply);
        }
        else if (cmd == CMD_STATUS)
        {
            usb::usage_status status;
            core.status(status);
            json::create_status(reply, status);
        }
        else if (cmd == CMD_LS)
        {
            const std::string path = arg_count > 0 ? args[1] : "";
            std::vector<fs::file_entry> entries;
            res = core.list_files(entries, path);
            if (res == errors::OK)
                json::create_file_list(reply, path, entries);
        }
        else if (cmd == CMD_UPLOAD)
        {
            upload_local_file(reply, core, args);
        }
        else if (cmd == CMD_DOWNLOAD)
        {
            download_to_local_file(reply, core, args);
        }
        else if (cmd == CMD_RM)
        {
            res = core.remove(args[1]);
            if (res == errors::OK)
                json::create_success(reply);
        }
        else if (cmd == CMD_MV)
        {
            res = core.rename(entry, args[1], args[2]);
            if (res == errors::OK)
                json::create_file_response(reply, entry);
        }
        else if (cmd == CMD_MKDIR)
        {
            res = core.create_folder(entry, arg_count > 1 ? args[2] : "", args[1]);
            if (res == errors::OK)
                json::create_file_response(reply, entry);
        }
        else if (cmd == CMD_HELP)
        {
            std::vector<std::string> usages;
            for (const command_spec &c : COMMANDS)
                usages.push_back(c.usage);
            json::create_help(reply, usages);
        }
        else if (cmd == CMD_QUIT)
        {
            json::create_success(reply);
            return 1;
        }

        if (res != errors::OK)
            json::create_error(reply, res);

        return 0;
    }

    /**
     * Serves commands from the input stream until it ends or 'quit' is received.
     */
    int run(core::usb_core &core, std::istream &in, std::ostream &out)
    {
        std::string line;
        while (std::getline(in, line))
        {
            std::vector<std::string> args;
            std::string reply;

            if (tokenize(args, line) == -1)
            {
                json::create_protocol_error(reply, ERR_INVALID_ARGS, "Unterminated quote.");
            }
            else if (args.empty())
            {
                continue;
            }
            else if (handle_command(reply, core, args) == 1)
            {
                out << reply << std::endl;
                break;
            }

            out << reply << std::endl;
        }

        return 0;
    }

} // namespace shell
