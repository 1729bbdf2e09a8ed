#ifndef _REVUSB_TEST_TEST_COMMON_
#define _REVUSB_TEST_TEST_COMMON_

#include <gtest/gtest.h>
#include <deque>
#include "../src/pchheader.hpp"
#include "../src/conf.hpp"
#include "../src/usb/mounter.hpp"
#include "../src/util/util.hpp"

namespace revusb_test
{
    /**
     * Creates a unique directory under /tmp and removes it with all contents on destruction.
     */
    class temp_dir
    {
    private:
        std::string path;

    public:
        temp_dir()
        {
            char tmpl[] = "/tmp/revusb-test-XXXXXX";
            const char *created = mkdtemp(tmpl);
            if (created == NULL)
                throw std::runtime_error("mkdtemp failed");

            // Canonical so paths compare equal to resolved ones.
            path = util::realpath(created);
        }

        ~temp_dir()
        {
            util::remove_directory_recursively(path);
        }

        const std::string &get() const
        {
            return path;
        }

        const std::string sub(std::string_view relative) const
        {
            return path + "/" + std::string(relative);
        }
    };

    inline void write_file(const std::string &path, std::string_view content)
    {
        const int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
        if (fd == -1)
            throw std::runtime_error("Cannot create " + path);

        const int res = util::write_all(fd, content.data(), content.size());
        close(fd);
        if (res == -1)
            throw std::runtime_error("Cannot write " + path);
    }

    inline const std::string read_file(const std::string &path)
    {
        const int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd == -1)
            throw std::runtime_error("Cannot open " + path);

        std::string content;
        const int res = util::read_from_fd(fd, content);
        close(fd);
        if (res == -1)
            throw std::runtime_error("Cannot read " + path);
        return content;
    }

    /**
     * Holds both ends of a pipe. Used to stream upload bytes in tests.
     */
    class test_pipe
    {
    public:
        int fds[2] = {-1, -1};

        test_pipe()
        {
            if (pipe2(fds, O_CLOEXEC) == -1)
                throw std::runtime_error("pipe2 failed");
        }

        ~test_pipe()
        {
            close_write();
            if (fds[0] != -1)
                close(fds[0]);
        }

        int read_fd() const
        {
            return fds[0];
        }

        void write(std::string_view data)
        {
            if (util::write_all(fds[1], data.data(), data.size()) == -1)
                throw std::runtime_error("pipe write failed");
        }

        void close_write()
        {
            if (fds[1] != -1)
            {
                close(fds[1]);
                fds[1] = -1;
            }
        }
    };

    inline usb::block_device make_device(const std::string &name, const std::string &type, const std::string &parent,
                                         const uint64_t size, const bool removable, const std::string &fstype = "",
                                         const std::optional<std::string> &label = std::nullopt,
                                         const std::optional<std::string> &mountpoint = std::nullopt)
    {
        usb::block_device dev;
        dev.name = name;
        dev.type = type;
        dev.parent = parent;
        dev.size = size;
        dev.human_size = util::to_human_size(size);
        dev.fstype = fstype;
        dev.label = label;
        dev.mountpoint = mountpoint;
        dev.removable = removable;
        return dev;
    }

    /**
     * Mounter double. Mounting only records state, the mount root stays an ordinary directory.
     */
    class fake_mounter : public usb::mounter
    {
    public:
        std::vector<usb::block_device> devices;
        errors::code list_result = errors::OK;
        errors::code mount_result = errors::OK;
        std::deque<errors::code> unmount_results; // Consumed in order. OK once exhausted.

        std::atomic<int> list_calls{0};
        std::atomic<int> mount_calls{0};
        std::atomic<int> unmount_calls{0};
        std::atomic<bool> mounted{false};
        std::atomic<bool> last_detach{false};
        std::atomic<bool> attach_on_failure{false}; // A failing mount still leaves the filesystem attached.
        uint32_t mount_delay = 0;                     // Milliseconds the mount call takes.

        errors::code list(std::vector<usb::block_device> &out) override
        {
            list_calls++;
            if (list_result != errors::OK)
                return list_result;

            out = devices;
            return errors::OK;
        }

        errors::code mount(const usb::block_device &device, std::string_view mount_root) override
        {
            mount_calls++;
            if (mount_delay > 0)
                util::sleep(mount_delay);
            if (mount_result == errors::OK || attach_on_failure)
                mounted = true;
            return mount_result;
        }

        errors::code unmount(std::string_view mount_root, const bool detach) override
        {
            unmount_calls++;
            last_detach = detach;

            errors::code res = errors::OK;
            if (!unmount_results.empty())
            {
                res = unmount_results.front();
                unmount_results.pop_front();
            }

            if (res == errors::OK || res == errors::NOT_MOUNTED)
                mounted = false;
            return res;
        }

        bool is_mounted(std::string_view mount_root) override
        {
            return mounted;
        }
    };

    inline conf::mount_config make_mount_config(const std::string &mount_root)
    {
        conf::mount_config cfg;
        cfg.mount_root = mount_root;
        cfg.use_sudo = false;
        cfg.mount_bin = "/bin/mount";
        cfg.umount_bin = "/bin/umount";
        cfg.lsblk_bin = "/bin/lsblk";
        cfg.command_timeout = 5000;
        cfg.unmount_retries = 2;
        cfg.unmount_retry_interval = 10;
        return cfg;
    }

    inline conf::upload_config make_upload_config(const uint64_t max_bytes = 1024 * 1024)
    {
        conf::upload_config cfg;
        cfg.max_bytes = max_bytes;
        cfg.allowed_extensions = {".txt", ".pdf", ".jpg", ".md", ".csv"};
        return cfg;
    }

} // namespace revusb_test

#endif
