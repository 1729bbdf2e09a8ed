#include "test_common.hpp"

using namespace revusb_test;

namespace
{
    const std::string VALID_CONFIG = R"({
        "version": "1.0.0",
        "mount": {
            "mount_root": "/media/usb/revusb",
            "use_sudo": true,
            "mount_bin": "/bin/mount",
            "umount_bin": "/bin/umount",
            "lsblk_bin": "/bin/lsblk",
            "command_timeout": 15000,
            "unmount_retries": 4,
            "unmount_retry_interval": 250
        },
        "upload": {
            "max_bytes": 1048576,
            "allowed_extensions": [".TXT", ".pdf"]
        },
        "log": {
            "log_level": "dbg",
            "max_mbytes_per_file": 5,
            "max_file_count": 10,
            "loggers": ["console"]
        }
    })";
}

TEST(conf_test, parses_valid_config)
{
    conf::revusb_config cfg;
    ASSERT_EQ(0, conf::parse_config(cfg, VALID_CONFIG));

    EXPECT_EQ("1.0.0", cfg.version);
    EXPECT_EQ("/media/usb/revusb", cfg.mount.mount_root);
    EXPECT_TRUE(cfg.mount.use_sudo);
    EXPECT_EQ("/bin/lsblk", cfg.mount.lsblk_bin);
    EXPECT_EQ(15000u, cfg.mount.command_timeout);
    EXPECT_EQ(4u, cfg.mount.unmount_retries);
    EXPECT_EQ(250u, cfg.mount.unmount_retry_interval);
    EXPECT_EQ(1048576u, cfg.upload.max_bytes);
    EXPECT_EQ((std::unordered_set<std::string>{".txt", ".pdf"}), cfg.upload.allowed_extensions);
    EXPECT_EQ(conf::LOG_SEVERITY::DEBUG, cfg.log.log_level_type);
    EXPECT_EQ(1u, cfg.log.loggers.count("console"));

    EXPECT_EQ(0, conf::validate_config(cfg));
}

TEST(conf_test, rejects_malformed_or_incomplete_config)
{
    conf::revusb_config cfg;
    EXPECT_EQ(-1, conf::parse_config(cfg, "{ not json"));

    std::string missing = VALID_CONFIG;
    missing.replace(missing.find("\"lsblk_bin\""), strlen("\"lsblk_bin\""), "\"lsblk\"");
    EXPECT_EQ(-1, conf::parse_config(cfg, missing));

    std::string old_version = VALID_CONFIG;
    old_version.replace(old_version.find("1.0.0"), 5, "0.9.0");
    EXPECT_EQ(-1, conf::parse_config(cfg, old_version));
}

TEST(conf_test, defaults_are_valid)
{
    conf::revusb_config cfg;
    conf::populate_defaults(cfg);
    EXPECT_EQ(0, conf::validate_config(cfg));
    EXPECT_EQ(1u, cfg.upload.allowed_extensions.count(".pdf"));
    EXPECT_EQ(0u, cfg.upload.allowed_extensions.count(".sh"));
}

TEST(conf_test, validation_rejects_bad_values)
{
    conf::revusb_config cfg;
    conf::populate_defaults(cfg);
    cfg.mount.mount_root = "/";
    EXPECT_EQ(-1, conf::validate_config(cfg));

    conf::populate_defaults(cfg);
    cfg.mount.mount_root = "relative/dir";
    EXPECT_EQ(-1, conf::validate_config(cfg));

    conf::populate_defaults(cfg);
    cfg.upload.allowed_extensions = {"txt"};
    EXPECT_EQ(-1, conf::validate_config(cfg));

    conf::populate_defaults(cfg);
    cfg.upload.max_bytes = 0;
    EXPECT_EQ(-1, conf::validate_config(cfg));

    conf::populate_defaults(cfg);
    cfg.log.log_level = "verbose";
    EXPECT_EQ(-1, conf::validate_config(cfg));

    conf::populate_defaults(cfg);
    cfg.log.loggers = {"syslog"};
    EXPECT_EQ(-1, conf::validate_config(cfg));
}

TEST(conf_test, new_instance_round_trips_through_disk)
{
    temp_dir tmp;
    conf::set_dir_paths("/usr/bin/revusb", tmp.sub("instance"));
    ASSERT_EQ(0, conf::create_instance());
    EXPECT_TRUE(util::is_file_exists(conf::ctx.config_file));
    EXPECT_TRUE(util::is_dir_exists(conf::ctx.log_dir));

    ASSERT_EQ(0, conf::init());
    EXPECT_EQ("/media/usb/revusb", conf::cfg.mount.mount_root);

    // An existing instance directory is never overwritten.
    EXPECT_EQ(-1, conf::create_instance());
    conf::deinit();
}
