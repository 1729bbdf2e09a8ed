#include <random>
#include "test_common.hpp"
#include "../src/fs/path_resolver.hpp"

using namespace revusb_test;

class path_resolver_test : public ::testing::Test
{
protected:
    temp_dir tmp;
    std::string root;

    void SetUp() override
    {
        root = tmp.sub("mnt");
        ASSERT_EQ(0, mkdir(root.c_str(), 0755));
        ASSERT_EQ(0, mkdir((root + "/docs").c_str(), 0755));
        write_file(root + "/docs/a.txt", "a");
        ASSERT_EQ(0, mkdir(tmp.sub("outside").c_str(), 0755));
    }
};

TEST_F(path_resolver_test, empty_path_is_root)
{
    const fs::path_resolver resolver(root);
    std::string abs;
    ASSERT_EQ(errors::OK, resolver.resolve(abs, ""));
    EXPECT_EQ(root, abs);
    EXPECT_EQ("", resolver.relative(abs));
}

TEST_F(path_resolver_test, normalizes_separators_and_dots)
{
    const fs::path_resolver resolver(root);
    std::string abs;
    ASSERT_EQ(errors::OK, resolver.resolve(abs, "/docs//./a.txt"));
    EXPECT_EQ(root + "/docs/a.txt", abs);
    EXPECT_EQ("docs/a.txt", resolver.relative(abs));

    ASSERT_EQ(errors::OK, resolver.resolve(abs, "docs/../docs/a.txt"));
    EXPECT_EQ(root + "/docs/a.txt", abs);

    ASSERT_EQ(errors::OK, resolver.resolve(abs, "docs/.."));
    EXPECT_EQ(root, abs);
}

TEST_F(path_resolver_test, missing_leaf_resolves_within_root)
{
    const fs::path_resolver resolver(root);
    std::string abs;
    ASSERT_EQ(errors::OK, resolver.resolve(abs, "docs/new/deeper.txt"));
    EXPECT_EQ(root + "/docs/new/deeper.txt", abs);
}

TEST_F(path_resolver_test, rejects_climbing_above_root)
{
    const fs::path_resolver resolver(root);
    std::string abs = "untouched";
    EXPECT_EQ(errors::INVALID_PATH, resolver.resolve(abs, ".."));
    EXPECT_EQ(errors::INVALID_PATH, resolver.resolve(abs, "../outside"));
    EXPECT_EQ(errors::INVALID_PATH, resolver.resolve(abs, "docs/../../outside"));
    EXPECT_EQ(errors::INVALID_PATH, resolver.resolve(abs, "/../../../etc/passwd"));
    EXPECT_EQ("untouched", abs);
}

TEST_F(path_resolver_test, rejects_embedded_nul)
{
    const fs::path_resolver resolver(root);
    std::string abs;
    const std::string path("docs\0/../../x", 13);
    EXPECT_EQ(errors::INVALID_PATH, resolver.resolve(abs, path));
}

TEST_F(path_resolver_test, rejects_symlink_escaping_root)
{
    ASSERT_EQ(0, symlink(tmp.sub("outside").c_str(), (root + "/escape").c_str()));
    ASSERT_EQ(0, symlink("/etc", (root + "/etc").c_str()));

    const fs::path_resolver resolver(root);
    std::string abs;
    EXPECT_EQ(errors::INVALID_PATH, resolver.resolve(abs, "escape"));
    EXPECT_EQ(errors::INVALID_PATH, resolver.resolve(abs, "escape/newfile.txt"));
    EXPECT_EQ(errors::INVALID_PATH, resolver.resolve(abs, "etc/passwd"));

    // Dangling links are judged by their target. Creating through them would land outside.
    ASSERT_EQ(0, symlink(tmp.sub("outside/missing.txt").c_str(), (root + "/dangling_out").c_str()));
    ASSERT_EQ(0, symlink("../outside/gone.txt", (root + "/relative_out").c_str()));
    ASSERT_EQ(0, symlink((root + "/dangling_out").c_str(), (root + "/chained_out").c_str()));
    ASSERT_EQ(0, symlink(tmp.sub("outside/none/deeper.txt").c_str(), (root + "/deep_out").c_str()));
    EXPECT_EQ(errors::INVALID_PATH, resolver.resolve(abs, "dangling_out"));
    EXPECT_EQ(errors::INVALID_PATH, resolver.resolve(abs, "relative_out"));
    EXPECT_EQ(errors::INVALID_PATH, resolver.resolve(abs, "chained_out"));
    EXPECT_EQ(errors::INVALID_PATH, resolver.resolve(abs, "deep_out"));

    ASSERT_EQ(0, symlink("self_loop", (root + "/self_loop").c_str()));
    EXPECT_EQ(errors::INVALID_PATH, resolver.resolve(abs, "self_loop"));
}

TEST_F(path_resolver_test, allows_symlink_within_root)
{
    ASSERT_EQ(0, symlink((root + "/docs").c_str(), (root + "/shortcut").c_str()));

    const fs::path_resolver resolver(root);
    std::string abs;
    ASSERT_EQ(errors::OK, resolver.resolve(abs, "shortcut/a.txt"));
    EXPECT_EQ(root + "/shortcut/a.txt", abs);

    ASSERT_EQ(0, symlink((root + "/docs/later.txt").c_str(), (root + "/dangling_in").c_str()));
    ASSERT_EQ(0, symlink("docs/new/deeper.txt", (root + "/relative_in").c_str()));
    ASSERT_EQ(errors::OK, resolver.resolve(abs, "dangling_in"));
    EXPECT_EQ(root + "/dangling_in", abs);
    EXPECT_EQ(errors::OK, resolver.resolve(abs, "relative_in"));
}

TEST_F(path_resolver_test, random_paths_never_write_outside_root)
{
    ASSERT_EQ(0, symlink(tmp.sub("outside").c_str(), (root + "/escape").c_str()));
    ASSERT_EQ(0, symlink((root + "/docs").c_str(), (root + "/shortcut").c_str()));
    ASSERT_EQ(0, symlink(tmp.sub("outside/missing.txt").c_str(), (root + "/dangling_out").c_str()));
    ASSERT_EQ(0, symlink("../outside/gone.txt", (root + "/relative_out").c_str()));
    ASSERT_EQ(0, symlink((root + "/docs/later.txt").c_str(), (root + "/dangling_in").c_str()));

    const std::vector<std::string> segments = {"..", ".", "", "/", "docs", "a.txt", "new", "escape",
                                               "shortcut", "dangling_out", "relative_out", "dangling_in"};

    const fs::path_resolver resolver(root);
    std::mt19937 rng(20261019);
    std::uniform_int_distribution<size_t> pick(0, segments.size() - 1);
    std::uniform_int_distribution<int> length(1, 6);

    int accepted = 0;
    int rejected = 0;
    for (int i = 0; i < 3000; i++)
    {
        std::string path = (rng() % 2) ? "/" : "";
        const int count = length(rng);
        for (int j = 0; j < count; j++)
        {
            if (j > 0)
                path.append("/");
            path.append(segments[pick(rng)]);
        }

        std::string abs;
        const errors::code res = resolver.resolve(abs, path);
        ASSERT_TRUE(res == errors::OK || res == errors::INVALID_PATH) << path << " -> " << errors::to_string(res);
        if (res != errors::OK)
        {
            rejected++;
            continue;
        }

        accepted++;
        ASSERT_TRUE(abs == root || abs.rfind(root + "/", 0) == 0) << path << " -> " << abs;

        // Writing to an accepted path must never land outside the root.
        const int fd = open(abs.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0644);
        if (fd != -1)
            close(fd);
    }

    EXPECT_GT(accepted, 0);
    EXPECT_GT(rejected, 0);

    std::list<std::string> leaked;
    ASSERT_EQ(0, util::fetch_dir_entries(leaked, tmp.sub("outside")));
    EXPECT_TRUE(leaked.empty());
}

TEST_F(path_resolver_test, resolve_child_validates_name)
{
    const fs::path_resolver resolver(root);
    std::string abs;
    ASSERT_EQ(errors::OK, resolver.resolve_child(abs, "docs", "b.txt"));
    EXPECT_EQ(root + "/docs/b.txt", abs);

    EXPECT_EQ(errors::INVALID_NAME, resolver.resolve_child(abs, "docs", "../b.txt"));
    EXPECT_EQ(errors::INVALID_NAME, resolver.resolve_child(abs, "docs", ".."));
    EXPECT_EQ(errors::INVALID_NAME, resolver.resolve_child(abs, "", ""));
}

TEST_F(path_resolver_test, vanished_root_is_device_loss)
{
    const fs::path_resolver resolver(tmp.sub("gone"));
    std::string abs;
    EXPECT_EQ(errors::DEVICE_LOST, resolver.resolve(abs, "docs"));
}

TEST(validate_name_test, accepts_ordinary_names)
{
    EXPECT_EQ(errors::OK, fs::validate_name("report.pdf"));
    EXPECT_EQ(errors::OK, fs::validate_name(".hidden"));
    EXPECT_EQ(errors::OK, fs::validate_name("name with spaces.txt"));
    EXPECT_EQ(errors::OK, fs::validate_name("..dots"));
    EXPECT_EQ(errors::OK, fs::validate_name(std::string(255, 'a')));
}

TEST(validate_name_test, rejects_unsafe_names)
{
    EXPECT_EQ(errors::INVALID_NAME, fs::validate_name(""));
    EXPECT_EQ(errors::INVALID_NAME, fs::validate_name("."));
    EXPECT_EQ(errors::INVALID_NAME, fs::validate_name(".."));
    EXPECT_EQ(errors::INVALID_NAME, fs::validate_name("a/b.txt"));
    EXPECT_EQ(errors::INVALID_NAME, fs::validate_name("a\\b.txt"));
    EXPECT_EQ(errors::INVALID_NAME, fs::validate_name(std::string("a\0b.txt", 7)));
    EXPECT_EQ(errors::INVALID_NAME, fs::validate_name(std::string(256, 'a')));
}
