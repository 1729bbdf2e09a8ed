#include "test_common.hpp"
#include "../src/fs/file_catalog.hpp"

using namespace revusb_test;

class file_catalog_test : public ::testing::Test
{
protected:
    temp_dir tmp;
    std::string root;

    void SetUp() override
    {
        root = tmp.sub("mnt");
        ASSERT_EQ(0, mkdir(root.c_str(), 0755));
    }

    std::vector<std::string> names(const std::vector<fs::file_entry> &entries)
    {
        std::vector<std::string> result;
        for (const fs::file_entry &e : entries)
            result.push_back(e.name);
        return result;
    }
};

TEST_F(file_catalog_test, lists_directories_first_then_by_name)
{
    write_file(root + "/b.txt", "bb");
    write_file(root + "/A.txt", "a");
    write_file(root + "/a.txt", "a");
    ASSERT_EQ(0, mkdir((root + "/zeta").c_str(), 0755));
    ASSERT_EQ(0, mkdir((root + "/Alpha").c_str(), 0755));

    const fs::path_resolver resolver(root);
    const fs::file_catalog catalog(resolver);
    std::vector<fs::file_entry> entries;
    ASSERT_EQ(errors::OK, catalog.list(entries, ""));

    EXPECT_EQ((std::vector<std::string>{"Alpha", "zeta", "A.txt", "a.txt", "b.txt"}), names(entries));
}

TEST_F(file_catalog_test, describes_entries)
{
    ASSERT_EQ(0, mkdir((root + "/docs").c_str(), 0755));
    write_file(root + "/docs/notes.TXT", std::string(1536, 'x'));
    ASSERT_EQ(0, mkdir((root + "/docs/pics").c_str(), 0755));

    const fs::path_resolver resolver(root);
    const fs::file_catalog catalog(resolver);
    std::vector<fs::file_entry> entries;
    ASSERT_EQ(errors::OK, catalog.list(entries, "docs"));
    ASSERT_EQ(2u, entries.size());

    const fs::file_entry &dir = entries[0];
    EXPECT_EQ("pics", dir.name);
    EXPECT_EQ("docs/pics", dir.path);
    EXPECT_TRUE(dir.is_dir);
    EXPECT_EQ("--", dir.human_size);
    EXPECT_EQ(fs::FOLDER, dir.category);

    const fs::file_entry &file = entries[1];
    EXPECT_EQ("notes.TXT", file.name);
    EXPECT_EQ("docs/notes.TXT", file.path);
    EXPECT_EQ(root + "/docs/notes.TXT", file.absolute_path);
    EXPECT_FALSE(file.is_dir);
    EXPECT_EQ(1536u, file.size);
    EXPECT_EQ("1.5 KB", file.human_size);
    EXPECT_EQ(fs::TEXT, file.category);
    EXPECT_GT(file.modified, 0);
    EXPECT_EQ(util::to_iso_time(file.modified), file.modified_iso);
}

TEST_F(file_catalog_test, empty_directory_lists_nothing)
{
    const fs::path_resolver resolver(root);
    const fs::file_catalog catalog(resolver);
    std::vector<fs::file_entry> entries;
    ASSERT_EQ(errors::OK, catalog.list(entries, "/"));
    EXPECT_TRUE(entries.empty());
}

TEST_F(file_catalog_test, missing_or_file_path_is_not_found)
{
    write_file(root + "/a.txt", "a");

    const fs::path_resolver resolver(root);
    const fs::file_catalog catalog(resolver);
    std::vector<fs::file_entry> entries;
    EXPECT_EQ(errors::PATH_NOT_FOUND, catalog.list(entries, "missing"));
    EXPECT_EQ(errors::PATH_NOT_FOUND, catalog.list(entries, "a.txt"));
    EXPECT_EQ(errors::INVALID_PATH, catalog.list(entries, "../"));
}

TEST_F(file_catalog_test, skips_escaping_links_and_upload_temp_files)
{
    write_file(root + "/keep.txt", "k");
    write_file(root + "/.revusb-upload-0011223344556677.part", "partial");
    ASSERT_EQ(0, symlink("/etc", (root + "/etc").c_str()));
    ASSERT_EQ(0, symlink((root + "/nowhere").c_str(), (root + "/dangling").c_str()));

    const fs::path_resolver resolver(root);
    const fs::file_catalog catalog(resolver);
    std::vector<fs::file_entry> entries;
    ASSERT_EQ(errors::OK, catalog.list(entries, ""));
    EXPECT_EQ((std::vector<std::string>{"keep.txt"}), names(entries));
}

TEST(file_category_test, maps_extensions_case_insensitively)
{
    EXPECT_EQ(fs::FOLDER, fs::get_file_category("photos.jpg", true));
    EXPECT_EQ(fs::IMAGE, fs::get_file_category("photo.JPG", false));
    EXPECT_EQ(fs::PDF, fs::get_file_category("a.pdf", false));
    EXPECT_EQ(fs::WORD, fs::get_file_category("a.docx", false));
    EXPECT_EQ(fs::EXCEL, fs::get_file_category("a.csv", false));
    EXPECT_EQ(fs::POWERPOINT, fs::get_file_category("a.pptx", false));
    EXPECT_EQ(fs::VIDEO, fs::get_file_category("a.mkv", false));
    EXPECT_EQ(fs::AUDIO, fs::get_file_category("a.flac", false));
    EXPECT_EQ(fs::ARCHIVE, fs::get_file_category("a.tar.gz", false));
    EXPECT_EQ(fs::CODE, fs::get_file_category("main.cpp", false));
    EXPECT_EQ(fs::TEXT, fs::get_file_category("readme.md", false));
    EXPECT_EQ(fs::FILE, fs::get_file_category("data.bin", false));
    EXPECT_EQ(fs::FILE, fs::get_file_category("Makefile", false));
    EXPECT_EQ(fs::FILE, fs::get_file_category(".txt", false));

    EXPECT_STREQ("folder", fs::category_name(fs::FOLDER));
    EXPECT_STREQ("powerpoint", fs::category_name(fs::POWERPOINT));
    EXPECT_STREQ("file", fs::category_name(fs::FILE));
}
