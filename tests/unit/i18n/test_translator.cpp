#include <gtest/gtest.h>
#include "hqa/i18n/translator.hpp"

#include <filesystem>
#include <fstream>

using namespace hqa;
using namespace hqa::i18n;
namespace fs = std::filesystem;

class TranslatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_dir = fs::temp_directory_path() / "hqa_translator_test";
        fs::create_directories(temp_dir);
    }

    void TearDown() override {
        if (fs::exists(temp_dir)) {
            fs::remove_all(temp_dir);
        }
    }

    [[nodiscard]] fs::path create_file(const std::string& name, const std::string& content) const {
        const auto path = temp_dir / name;
        std::ofstream file(path);
        file << content;
        file.close();
        return path;
    }

    fs::path temp_dir;
};

TEST_F(TranslatorTest, UninitializedReturnsKey) {
    const Translator translator;

    EXPECT_FALSE(translator.is_initialized());
    EXPECT_EQ(translator.translate("findings.no_var.message"), "findings.no_var.message");
}

TEST_F(TranslatorTest, BuiltInCatalog) {
    Translator translator;
    translator.initialize();

    EXPECT_TRUE(translator.is_initialized());
    EXPECT_GT(translator.size(), 0u);
    EXPECT_EQ(translator.translate("findings.no_var.message"), "Unexpected 'var' declaration");
}

TEST_F(TranslatorTest, Interpolation) {
    Translator translator;
    translator.initialize();

    const auto text = translator.translate("findings.eqeqeq.message", {{"strict", "==="}, {"operator", "=="}});

    EXPECT_EQ(text, "Expected '===' and instead saw '=='");
}

TEST_F(TranslatorTest, RepeatedPlaceholder) {
    Translator translator;
    ASSERT_TRUE(translator.load_catalog_string(R"({"greeting": "{{who}} and {{who}}"})").is_ok());

    EXPECT_EQ(translator.translate("greeting", {{"who", "a"}}), "a and a");
}

TEST_F(TranslatorTest, UnknownPlaceholderLeftAlone) {
    Translator translator;
    translator.initialize();

    EXPECT_EQ(translator.translate("findings.no_console.message"), "Unexpected console.{{method}} statement");
}

TEST_F(TranslatorTest, MissingKeyReturnsKey) {
    Translator translator;
    translator.initialize();

    EXPECT_EQ(translator.translate("no.such.key"), "no.such.key");
}

TEST_F(TranslatorTest, LoadCatalog_FlattensNestedObjects) {
    Translator translator;
    const auto path = create_file("catalog.json",
        R"({"findings": {"no_var": {"message": "Avoid var"}}, "extra": {"count": 3}})");

    const auto result = translator.load_catalog(path);

    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(translator.is_initialized());
    EXPECT_EQ(translator.translate("findings.no_var.message"), "Avoid var");
    EXPECT_EQ(translator.translate("extra.count"), "extra.count");
}

TEST_F(TranslatorTest, LoadedEntriesTakePrecedenceOverBuiltIns) {
    Translator translator;
    ASSERT_TRUE(translator.load_catalog_string(R"({"findings": {"no_var": {"message": "Avoid var"}}})").is_ok());
    translator.initialize();

    EXPECT_EQ(translator.translate("findings.no_var.message"), "Avoid var");
    EXPECT_EQ(translator.translate("findings.no_magic_numbers.message", {{"value", "42"}}),
              "Unnamed numeric constant 42");
}

TEST_F(TranslatorTest, LoadCatalog_MissingFile) {
    Translator translator;

    const auto result = translator.load_catalog(temp_dir / "absent.json");

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code(), ErrorCode::NotFound);
    EXPECT_FALSE(translator.is_initialized());
}

TEST_F(TranslatorTest, LoadCatalog_InvalidJson) {
    Translator translator;
    const auto path = create_file("broken.json", "{ not json");

    const auto result = translator.load_catalog(path);

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code(), ErrorCode::ParseError);
}

TEST_F(TranslatorTest, LoadCatalog_RootMustBeObject) {
    Translator translator;
    const auto path = create_file("array.json", R"(["a", "b"])");

    const auto result = translator.load_catalog(path);

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code(), ErrorCode::ParseError);
}

TEST_F(TranslatorTest, LoadCatalogString_Invalid) {
    Translator translator;

    EXPECT_TRUE(translator.load_catalog_string("[1, 2]").is_err());
    EXPECT_TRUE(translator.load_catalog_string("{").is_err());
    EXPECT_FALSE(translator.is_initialized());
}
