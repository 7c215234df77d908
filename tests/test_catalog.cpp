#include <gtest/gtest.h>
#include <opencm_loaders/catalog.hpp>
#include <opencm_loaders/errors.hpp>
#include <opencm_loaders/json_writer.hpp>
#include <opencm_loaders/sample_model.hpp>
#include "test_support.hpp"

using namespace opencm_loaders;
using opencm_test::minimal_document;
using opencm_test::TempDir;

TEST(CatalogTest, ListsModelFilesInNameOrder) {
    TempDir dir;
    save_model_file(generate_sample_model(), dir.file("b_porter.opencm.json"));
    dir.write("a_minimal.opencm.json", minimal_document().dump());

    auto bad = minimal_document();
    bad["edges"][0]["target"] = "Ghost";
    dir.write("c_bad.opencm.json", bad.dump());
    dir.write("d_broken.opencm.json", "{");
    dir.write("notes.json", minimal_document().dump());
    std::filesystem::create_directories(dir.path() / "e_dir.opencm.json");

    auto entries = scan_model_directory(dir.path().string());
    ASSERT_EQ(entries.size(), 4u);

    EXPECT_TRUE(entries[0].valid);
    EXPECT_EQ(entries[0].model_id, "m1");
    EXPECT_EQ(entries[0].variable_count, 2u);
    EXPECT_EQ(entries[0].warning_count, 1u);

    EXPECT_TRUE(entries[1].valid);
    EXPECT_EQ(entries[1].model_id, "porter_five_forces");
    EXPECT_EQ(entries[1].domain, "strategy");
    EXPECT_EQ(entries[1].edge_count, 9u);
    EXPECT_EQ(entries[1].error_count, 0u);

    EXPECT_FALSE(entries[2].valid);
    EXPECT_EQ(entries[2].error_count, 1u);
    EXPECT_NE(entries[2].first_error.find("Ghost"), std::string::npos);

    EXPECT_FALSE(entries[3].valid);
    EXPECT_NE(entries[3].first_error.find("not valid JSON"), std::string::npos);
}

TEST(CatalogTest, EmptyDirectoryGivesEmptyCatalog) {
    TempDir dir;
    EXPECT_TRUE(scan_model_directory(dir.path().string()).empty());
}

TEST(CatalogTest, MissingDirectoryIsNotFound) {
    TempDir dir;
    EXPECT_THROW(scan_model_directory(dir.file("nope")), FileNotFoundError);
}

TEST(CatalogTest, UnreadableDirectoryIsIoError) {
    TempDir dir;
    const std::filesystem::path locked = dir.path() / "locked";
    std::filesystem::create_directories(locked);
    std::filesystem::permissions(locked, std::filesystem::perms::none);

    std::error_code ec;
    std::filesystem::directory_iterator listing(locked, ec);
    if (!ec) {
        std::filesystem::permissions(locked, std::filesystem::perms::owner_all);
        GTEST_SKIP() << "permissions are not enforced for this user";
    }

    bool io_error = false;
    try {
        scan_model_directory(locked.string());
    } catch (const IoError&) {
        io_error = true;
    }
    std::filesystem::permissions(locked, std::filesystem::perms::owner_all);
    EXPECT_TRUE(io_error);
}
