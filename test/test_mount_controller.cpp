#include "test_common.hpp"
#include "../src/usb/mount_controller.hpp"

using namespace revusb_test;

class mount_controller_test : public ::testing::Test
{
protected:
    temp_dir tmp;
    fake_mounter mounter;
    std::unique_ptr<usb::device_enumerator> enumerator;
    std::unique_ptr<usb::mount_controller> controller;

    void SetUp() override
    {
        mounter.devices = {
            make_device("sdb", "disk", "", 16ULL << 30, true),
            make_device("sdb1", "part", "sdb", 16ULL << 30, true, "vfat", std::string("KEY")),
            make_device("sdc", "disk", "", 8ULL << 30, true),
            make_device("sdc1", "part", "sdc", 8ULL << 30, true, "exfat", std::nullopt, std::string("/media/other")),
        };
        enumerator = std::make_unique<usb::device_enumerator>(mounter);
        controller = std::make_unique<usb::mount_controller>(mounter, *enumerator, make_mount_config(tmp.sub("media/usb")));
    }
};

TEST_F(mount_controller_test, mount_creates_root_and_session)
{
    EXPECT_EQ(usb::MOUNT_STATE::UNMOUNTED, controller->get_state());

    ASSERT_EQ(errors::OK, controller->mount("sdb1"));
    EXPECT_EQ(usb::MOUNT_STATE::MOUNTED, controller->get_state());
    EXPECT_TRUE(util::is_dir_exists(tmp.sub("media/usb")));

    usb::mount_session session;
    ASSERT_EQ(errors::OK, controller->get_session(session));
    EXPECT_EQ("sdb1", session.device_name);
    EXPECT_EQ(tmp.sub("media/usb"), session.mount_root);
    EXPECT_EQ(1u, session.id);
    EXPECT_GT(session.mounted_at, 0u);
    EXPECT_TRUE(controller->is_live(session));
}

TEST_F(mount_controller_test, accepts_dev_prefixed_names)
{
    ASSERT_EQ(errors::OK, controller->mount("/dev/sdb1"));

    usb::mount_session session;
    ASSERT_EQ(errors::OK, controller->get_session(session));
    EXPECT_EQ("sdb1", session.device_name);
}

TEST_F(mount_controller_test, second_mount_is_rejected_without_side_effects)
{
    ASSERT_EQ(errors::OK, controller->mount("sdb1"));
    EXPECT_EQ(errors::ALREADY_MOUNTED, controller->mount("sdb1"));
    EXPECT_EQ(1, mounter.mount_calls.load());

    usb::mount_session session;
    ASSERT_EQ(errors::OK, controller->get_session(session));
    EXPECT_EQ(1u, session.id);
}

TEST_F(mount_controller_test, unknown_or_busy_devices_are_rejected)
{
    EXPECT_EQ(errors::DEVICE_NOT_FOUND, controller->mount("sdz1"));
    EXPECT_EQ(errors::DEVICE_NOT_FOUND, controller->mount("sdb")); // Partitioned disk is not offered.
    EXPECT_EQ(errors::ALREADY_MOUNTED, controller->mount("sdc1")); // Mounted elsewhere.
    EXPECT_EQ(0, mounter.mount_calls.load());
    EXPECT_EQ(usb::MOUNT_STATE::UNMOUNTED, controller->get_state());
}

TEST_F(mount_controller_test, failed_mount_rolls_back)
{
    mounter.mount_result = errors::UNSUPPORTED_FILESYSTEM;
    EXPECT_EQ(errors::UNSUPPORTED_FILESYSTEM, controller->mount("sdb1"));
    EXPECT_EQ(usb::MOUNT_STATE::UNMOUNTED, controller->get_state());

    usb::mount_session session;
    EXPECT_EQ(errors::NOT_MOUNTED, controller->get_session(session));

    mounter.mount_result = errors::OK;
    EXPECT_EQ(errors::OK, controller->mount("sdb1"));
}

TEST_F(mount_controller_test, failed_mount_that_attached_is_rolled_back)
{
    mounter.mount_result = errors::IO_ERROR;
    mounter.attach_on_failure = true;
    EXPECT_EQ(errors::IO_ERROR, controller->mount("sdb1"));
    EXPECT_EQ(usb::MOUNT_STATE::UNMOUNTED, controller->get_state());

    // The stray mount got detached so the root is usable again.
    EXPECT_EQ(1, mounter.unmount_calls.load());
    EXPECT_FALSE(mounter.last_detach.load());
    EXPECT_FALSE(mounter.mounted.load());

    mounter.mount_result = errors::OK;
    mounter.attach_on_failure = false;
    EXPECT_EQ(errors::OK, controller->mount("sdb1"));
    EXPECT_EQ(usb::MOUNT_STATE::MOUNTED, controller->get_state());
}

TEST_F(mount_controller_test, stuck_rollback_falls_back_to_lazy_detach)
{
    mounter.mount_result = errors::IO_ERROR;
    mounter.attach_on_failure = true;
    mounter.unmount_results = {errors::BUSY};
    EXPECT_EQ(errors::IO_ERROR, controller->mount("sdb1"));
    EXPECT_EQ(usb::MOUNT_STATE::UNMOUNTED, controller->get_state());
    EXPECT_EQ(2, mounter.unmount_calls.load());
    EXPECT_TRUE(mounter.last_detach.load());
    EXPECT_FALSE(mounter.mounted.load());
}

TEST_F(mount_controller_test, occupied_mount_root_is_rejected)
{
    mounter.mounted = true;
    EXPECT_EQ(errors::ALREADY_MOUNTED, controller->mount("sdb1"));
    EXPECT_EQ(0, mounter.mount_calls.load());
}

TEST_F(mount_controller_test, unmount_requires_mount)
{
    EXPECT_EQ(errors::NOT_MOUNTED, controller->unmount());
    EXPECT_EQ(0, mounter.unmount_calls.load());
}

TEST_F(mount_controller_test, unmount_clears_session)
{
    ASSERT_EQ(errors::OK, controller->mount("sdb1"));
    ASSERT_EQ(errors::OK, controller->unmount());
    EXPECT_EQ(usb::MOUNT_STATE::UNMOUNTED, controller->get_state());
    EXPECT_FALSE(mounter.last_detach.load());

    usb::mount_session session;
    EXPECT_EQ(errors::NOT_MOUNTED, controller->get_session(session));

    // Session ids keep increasing across mounts.
    ASSERT_EQ(errors::OK, controller->mount("sdb1"));
    ASSERT_EQ(errors::OK, controller->get_session(session));
    EXPECT_EQ(2u, session.id);
}

TEST_F(mount_controller_test, busy_unmount_retries_then_succeeds)
{
    ASSERT_EQ(errors::OK, controller->mount("sdb1"));
    mounter.unmount_results = {errors::BUSY, errors::BUSY, errors::OK};

    EXPECT_EQ(errors::OK, controller->unmount());
    EXPECT_EQ(3, mounter.unmount_calls.load());
    EXPECT_EQ(usb::MOUNT_STATE::UNMOUNTED, controller->get_state());
}

TEST_F(mount_controller_test, persistent_busy_keeps_mount)
{
    ASSERT_EQ(errors::OK, controller->mount("sdb1"));
    mounter.unmount_results = {errors::BUSY, errors::BUSY, errors::BUSY, errors::BUSY};

    EXPECT_EQ(errors::BUSY, controller->unmount());
    EXPECT_EQ(3, mounter.unmount_calls.load()); // First attempt plus two retries.
    EXPECT_EQ(usb::MOUNT_STATE::MOUNTED, controller->get_state());
    EXPECT_FALSE(mounter.last_detach.load());

    usb::mount_session session;
    EXPECT_EQ(errors::OK, controller->get_session(session));
}

TEST_F(mount_controller_test, vanished_mount_unmounts_cleanly)
{
    ASSERT_EQ(errors::OK, controller->mount("sdb1"));
    mounter.unmount_results = {errors::NOT_MOUNTED};

    EXPECT_EQ(errors::OK, controller->unmount());
    EXPECT_EQ(usb::MOUNT_STATE::UNMOUNTED, controller->get_state());
}

TEST_F(mount_controller_test, invalidate_only_drops_matching_session)
{
    ASSERT_EQ(errors::OK, controller->mount("sdb1"));
    usb::mount_session session;
    ASSERT_EQ(errors::OK, controller->get_session(session));

    EXPECT_FALSE(controller->invalidate(session.id + 1));
    EXPECT_EQ(usb::MOUNT_STATE::MOUNTED, controller->get_state());

    EXPECT_TRUE(controller->invalidate(session.id));
    EXPECT_EQ(usb::MOUNT_STATE::UNMOUNTED, controller->get_state());
    EXPECT_TRUE(mounter.last_detach.load());

    EXPECT_FALSE(controller->invalidate(session.id));
}

TEST_F(mount_controller_test, concurrent_mounts_admit_one)
{
    mounter.mount_delay = 50;

    std::atomic<int> succeeded{0};
    std::atomic<int> rejected{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 4; i++)
    {
        threads.emplace_back([&]() {
            const errors::code res = controller->mount("sdb1");
            if (res == errors::OK)
                succeeded++;
            else if (res == errors::ALREADY_MOUNTED)
                rejected++;
        });
    }
    for (std::thread &t : threads)
        t.join();

    EXPECT_EQ(1, succeeded.load());
    EXPECT_EQ(3, rejected.load());
    EXPECT_EQ(1, mounter.mount_calls.load());
}

TEST(mount_state_test, names)
{
    EXPECT_STREQ("unmounted", usb::state_name(usb::MOUNT_STATE::UNMOUNTED));
    EXPECT_STREQ("mounting", usb::state_name(usb::MOUNT_STATE::MOUNTING));
    EXPECT_STREQ("mounted", usb::state_name(usb::MOUNT_STATE::MOUNTED));
    EXPECT_STREQ("unmounting", usb::state_name(usb::MOUNT_STATE::UNMOUNTING));
}
