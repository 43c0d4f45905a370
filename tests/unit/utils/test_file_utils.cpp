#include <gtest/gtest.h>
#include "hqa/utils/file_utils.hpp"

#include <fstream>

using namespace hqa;
using namespace hqa::file_utils;

class FileUtilsTest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_dir = fs::temp_directory_path() / "hqa_file_utils_test";
        fs::create_directories(temp_dir);
    }

    void TearDown() override {
        if (fs::exists(temp_dir)) {
            fs::remove_all(temp_dir);
        }
    }

    void create_file(const fs::path& relative, const std::string& content) const {
        const auto path = temp_dir / relative;
        fs::create_directories(path.parent_path());
        std::ofstream file(path);
        file << content;
    }

    static bool is_script(const fs::path& path) {
        const auto ext = path.extension();
        return ext == ".js" || ext == ".ts";
    }

    fs::path temp_dir;
};

TEST_F(FileUtilsTest, ReadFileBounded) {
    create_file("a.js", "const a = 1;\n");

    const auto full = read_file_bounded(temp_dir / "a.js", 1000);
    const auto cut = read_file_bounded(temp_dir / "a.js", 5);

    ASSERT_TRUE(full.is_ok());
    EXPECT_EQ(full.value(), "const a = 1;\n");
    ASSERT_TRUE(cut.is_ok());
    EXPECT_EQ(cut.value(), "const");
}

TEST_F(FileUtilsTest, ReadFileBounded_Missing) {
    const auto result = read_file_bounded(temp_dir / "missing.js", 100);

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code(), ErrorCode::IoError);
    EXPECT_EQ(result.error().context().value(), "missing.js");
}

TEST_F(FileUtilsTest, WriteFileCreatesParents) {
    const auto path = temp_dir / "reports" / "nested" / "out.json";

    ASSERT_TRUE(write_file(path, "{}").is_ok());

    const auto read_back = read_file_bounded(path, 100);
    ASSERT_TRUE(read_back.is_ok());
    EXPECT_EQ(read_back.value(), "{}");
}

TEST_F(FileUtilsTest, ListSourceFiles_SortedAndFiltered) {
    create_file("src/b.ts", "");
    create_file("src/a.js", "");
    create_file("README.md", "");
    create_file("node_modules/dep/index.js", "");
    create_file("lib/node_modules.js", "");

    const auto result = list_source_files(temp_dir, {"node_modules"}, 100, is_script);

    ASSERT_TRUE(result.is_ok());
    const auto& files = result.value();
    ASSERT_EQ(files.size(), 3u);
    EXPECT_EQ(files[0], temp_dir / "lib" / "node_modules.js");
    EXPECT_EQ(files[1], temp_dir / "src" / "a.js");
    EXPECT_EQ(files[2], temp_dir / "src" / "b.ts");
}

TEST_F(FileUtilsTest, ListSourceFiles_MaxFiles) {
    create_file("a.js", "");
    create_file("b.js", "");
    create_file("c.js", "");

    const auto result = list_source_files(temp_dir, {}, 2, is_script);

    ASSERT_TRUE(result.is_ok());
    ASSERT_EQ(result.value().size(), 2u);
    EXPECT_EQ(result.value()[1].filename(), "b.js");
}

TEST_F(FileUtilsTest, ListSourceFiles_Errors) {
    create_file("a.js", "");

    const auto missing = list_source_files(temp_dir / "absent", {}, 10, is_script);
    const auto not_dir = list_source_files(temp_dir / "a.js", {}, 10, is_script);

    ASSERT_TRUE(missing.is_err());
    EXPECT_EQ(missing.error().code(), ErrorCode::NotFound);
    ASSERT_TRUE(not_dir.is_err());
    EXPECT_EQ(not_dir.error().code(), ErrorCode::InvalidArgument);
}
